#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dropcode::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{3000};
        std::filesystem::path root{"storage"};
        std::size_t worker_threads{0};
        std::uint64_t max_chunk_size{64ULL * 1024 * 1024};
        std::chrono::seconds request_timeout{std::chrono::seconds{120}};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

    // Request bodies may carry one chunk plus some slack for JSON requests.
    inline std::uint64_t request_body_limit(const ServerConfig &config)
    {
        return config.max_chunk_size + 64 * 1024;
    }

} // namespace dropcode::server
