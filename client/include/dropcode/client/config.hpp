#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dropcode::client
{

    enum class ClientCommand
    {
        Send,
        Info,
        Receive
    };

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        ClientCommand command{ClientCommand::Info};
        // File to send, or the code to look up / receive.
        std::string subject;
        std::optional<std::filesystem::path> output;
        std::uint64_t chunk_size{5ULL * 1024 * 1024};
        std::uint64_t max_downloads{1};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> state_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace dropcode::client
