#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace dropcode::client
{

    /**
     * Transfer history for one client run. Lines are appended to `--log <file>` so
     * an interrupted send and its resumption end up in the same file; without a
     * path every call is a no-op.
     */
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path);

        // `phase` names the step of the transfer, e.g. "upload" or "download".
        template <typename... Args>
        void log(std::string_view phase, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            logger_->info("{:<8} {}", phase, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
        }

        template <typename... Args>
        void failure(std::string_view phase, spdlog::format_string_t<Args...> format, Args &&...args)
        {
            if (!logger_)
            {
                return;
            }
            logger_->warn("{:<8} {}", phase, spdlog::fmt_lib::format(format, std::forward<Args>(args)...));
        }

        bool enabled() const noexcept { return logger_ != nullptr; }

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace dropcode::client
