#include "dropcode/client/logger.hpp"

#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>

namespace dropcode::client
{

    namespace
    {
        constexpr auto kLoggerName = "dropcode-transfer";
        // ISO time with milliseconds, level, then `<phase> <message>`.
        constexpr auto kPattern = "%Y-%m-%dT%H:%M:%S.%e %-5l %v";
    } // namespace

    Logger::Logger(const std::optional<std::filesystem::path> &path)
    {
        if (!path)
        {
            return;
        }
        try
        {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false);
            logger_ = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
            logger_->set_pattern(kPattern);
            logger_->set_level(spdlog::level::info);
            // A killed transfer must still leave its last chunk in the log.
            logger_->flush_on(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Transfer log disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace dropcode::client
