#include "dropcode/version.hpp"

#ifndef DROPCODE_VERSION
#define DROPCODE_VERSION "0.0.0"
#endif

namespace dropcode
{

    std::string_view version() noexcept
    {
        return DROPCODE_VERSION;
    }

} // namespace dropcode
