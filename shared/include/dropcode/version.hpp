#pragma once

#include <string_view>

namespace dropcode
{

    std::string_view version() noexcept;

} // namespace dropcode
