#pragma once

#include <filesystem>
#include <string>

#include "dropcode/client/config.hpp"
#include "dropcode/client/http_client.hpp"
#include "dropcode/client/logger.hpp"
#include "dropcode/client/upload_state_store.hpp"

namespace dropcode::client
{

    // `<name>_<size>_<mtime millis>`; identifies a local file across runs.
    std::string fingerprint_of(const std::filesystem::path &path);

    std::string guess_mime_type(const std::filesystem::path &path);

    // Strips directory components and characters unsafe in a local file name.
    std::filesystem::path safe_file_name(const std::string &name);

    class TransferClient
    {
    public:
        TransferClient(ClientConfig config, Logger logger);

        // Executes the configured command; returns the process exit code.
        int run();

    private:
        int send(const std::filesystem::path &local_path);
        int info(const std::string &code);
        int receive(const std::string &code);

        void print_error(const HttpResult &result) const;

        ClientConfig config_;
        Logger logger_;
        HttpClient http_;
        UploadStateStore state_store_;
    };

} // namespace dropcode::client
