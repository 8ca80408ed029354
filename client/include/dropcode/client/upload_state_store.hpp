#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dropcode::client
{

    /**
     * Remembers which upload session belongs to a local file so an interrupted
     * send can pick up where it stopped. Entries are keyed by server endpoint and
     * file fingerprint and persisted as JSON after every change.
     */
    class UploadStateStore
    {
    public:
        struct Entry
        {
            std::string server;
            std::string fingerprint;
            std::string upload_id;
            std::filesystem::path local_path;
        };

        UploadStateStore();
        explicit UploadStateStore(std::filesystem::path state_path);

        std::optional<std::string> find(const std::string &server, const std::string &fingerprint) const;

        void remember(const std::string &server, const std::string &fingerprint, const std::string &upload_id,
                      const std::filesystem::path &local_path);

        void forget(const std::string &server, const std::string &fingerprint);

        std::vector<Entry> entries() const;

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::string &server, const std::string &fingerprint);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace dropcode::client
