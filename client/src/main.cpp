#include <exception>
#include <iostream>
#include <string_view>
#include <utility>

#include "dropcode/client/config.hpp"
#include "dropcode/client/logger.hpp"
#include "dropcode/client/transfer_client.hpp"
#include "dropcode/crypto.hpp"
#include "dropcode/version.hpp"

int main(int argc, char *argv[])
{
    if (argc == 2 && (std::string_view(argv[1]) == "--help" || std::string_view(argv[1]) == "-h"))
    {
        std::cout << "dropcode-client " << dropcode::version() << "\n" << dropcode::client::usage() << std::endl;
        return 0;
    }
    try
    {
        dropcode::crypto::ensure_sodium_init();
        auto config = dropcode::client::parse_arguments(argc, argv);
        dropcode::client::Logger logger(config.log_path);
        dropcode::client::TransferClient client(std::move(config), std::move(logger));
        return client.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
