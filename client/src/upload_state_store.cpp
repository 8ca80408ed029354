#include "dropcode/client/upload_state_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace dropcode::client
{

    UploadStateStore::UploadStateStore()
        : UploadStateStore(default_state_path())
    {
    }

    UploadStateStore::UploadStateStore(std::filesystem::path state_path)
        : state_path_(std::move(state_path))
    {
        load();
    }

    std::optional<std::string> UploadStateStore::find(const std::string &server, const std::string &fingerprint) const
    {
        const auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                                     { return entry.server == server && entry.fingerprint == fingerprint; });
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->upload_id;
    }

    void UploadStateStore::remember(const std::string &server, const std::string &fingerprint,
                                    const std::string &upload_id, const std::filesystem::path &local_path)
    {
        auto it = find_entry(server, fingerprint);
        if (it == entries_.end())
        {
            entries_.push_back(Entry{server, fingerprint, upload_id, local_path});
        }
        else
        {
            it->upload_id = upload_id;
            it->local_path = local_path;
        }
        save();
    }

    void UploadStateStore::forget(const std::string &server, const std::string &fingerprint)
    {
        auto it = find_entry(server, fingerprint);
        if (it != entries_.end())
        {
            entries_.erase(it);
            save();
        }
    }

    std::vector<UploadStateStore::Entry> UploadStateStore::entries() const
    {
        return entries_;
    }

    std::filesystem::path UploadStateStore::default_state_path()
    {
        if (const char *home = std::getenv("HOME"))
        {
            return std::filesystem::path(home) / ".dropcode" / "uploads.json";
        }
        return std::filesystem::path(".dropcode") / "uploads.json";
    }

    void UploadStateStore::load()
    {
        entries_.clear();
        if (!std::filesystem::exists(state_path_))
        {
            return;
        }
        std::ifstream in(state_path_);
        if (!in.is_open())
        {
            return;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (!json.is_array())
        {
            // Unreadable state only costs a fresh upload session.
            return;
        }
        for (const auto &item : json)
        {
            Entry entry;
            entry.server = item.value("server", std::string{});
            entry.fingerprint = item.value("fingerprint", std::string{});
            entry.upload_id = item.value("uploadId", std::string{});
            entry.local_path = std::filesystem::path(item.value("local", std::string{}));
            if (!entry.server.empty() && !entry.fingerprint.empty() && !entry.upload_id.empty())
            {
                entries_.push_back(std::move(entry));
            }
        }
    }

    void UploadStateStore::save() const
    {
        const auto dir = state_path_.parent_path();
        if (!dir.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
        nlohmann::json json = nlohmann::json::array();
        for (const auto &entry : entries_)
        {
            json.push_back({{"server", entry.server},
                            {"fingerprint", entry.fingerprint},
                            {"uploadId", entry.upload_id},
                            {"local", entry.local_path.generic_string()}});
        }
        std::ofstream out(state_path_, std::ios::trunc);
        if (!out.is_open())
        {
            throw std::runtime_error("Failed to write upload state to " + state_path_.string());
        }
        out << json.dump(2);
    }

    std::vector<UploadStateStore::Entry>::iterator UploadStateStore::find_entry(const std::string &server,
                                                                                const std::string &fingerprint)
    {
        return std::find_if(entries_.begin(), entries_.end(), [&](const Entry &entry)
                            { return entry.server == server && entry.fingerprint == fingerprint; });
    }

} // namespace dropcode::client
