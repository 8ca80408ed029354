#include "dropcode/client/config.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace dropcode::client
{

    std::string usage()
    {
        return "Usage: dropcode-client <server>:<port> <command> [options]\n"
               "Commands:\n"
               "  send <file> [--max-downloads N] [--chunk-size BYTES]\n"
               "  info <code>\n"
               "  receive <code> [output]\n"
               "Options: --log <file>, --state <file>";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 4)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));

        const std::string command = argv[index++];
        if (command == "send")
        {
            config.command = ClientCommand::Send;
        }
        else if (command == "info")
        {
            config.command = ClientCommand::Info;
        }
        else if (command == "receive")
        {
            config.command = ClientCommand::Receive;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command);
        }
        config.subject = argv[index++];

        std::vector<std::string> positional;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log" || arg == "--state" || arg == "--max-downloads" || arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires a value");
                }
                const std::string value = argv[index++];
                if (arg == "--log")
                {
                    config.log_path = std::filesystem::path(value);
                }
                else if (arg == "--state")
                {
                    config.state_path = std::filesystem::path(value);
                }
                else if (arg == "--max-downloads")
                {
                    config.max_downloads = std::stoull(value);
                }
                else
                {
                    config.chunk_size = std::stoull(value);
                }
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (config.command == ClientCommand::Receive && positional.size() == 1)
        {
            config.output = std::filesystem::path(positional.front());
        }
        else if (!positional.empty())
        {
            throw std::runtime_error("Unexpected argument: " + positional.front());
        }
        if (config.chunk_size == 0)
        {
            throw std::runtime_error("--chunk-size must be positive");
        }
        if (config.max_downloads == 0)
        {
            config.max_downloads = 1;
        }
        return config;
    }

} // namespace dropcode::client
