#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace dropcode::server
{

    class CodeGenerator;

    struct UploadSession
    {
        std::string session_id;
        std::string code;
        std::string fingerprint;
        std::string file_name;
        std::uint64_t file_size{};
        std::string mime_type;
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t max_downloads{1};
        std::set<std::uint64_t> uploaded_chunks;
        bool complete{};
        std::optional<std::filesystem::path> artifact_path;
        std::uint64_t artifact_size{};
        std::string checksum;
        std::chrono::system_clock::time_point created_at{};
        std::optional<std::chrono::system_clock::time_point> completed_at;
    };

    /**
     * Durable record of upload sessions and the code -> session index.
     *
     * The in-memory maps are authoritative; every mutation runs load/apply/persist
     * inside one critical section and is written through to `<root>/index.json`
     * by replacing the whole file. A failed write rolls the change back.
     */
    class SessionStore
    {
    public:
        // Returns true when the mutation changed the session and must be persisted.
        using Mutation = std::function<bool(UploadSession &)>;

        explicit SessionStore(std::filesystem::path root);

        std::optional<UploadSession> get(const std::string &session_id) const;

        std::optional<UploadSession> get_by_code(const std::string &code) const;

        // Assigns a code unique within the index and persists the new session.
        UploadSession insert(UploadSession session, const CodeGenerator &codes);

        UploadSession update(const std::string &session_id, const Mutation &mutation);

        std::size_t size() const;

        std::filesystem::path index_path() const;

    private:
        void load();
        void persist_locked() const;

        std::filesystem::path index_path_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, UploadSession> sessions_;
        std::unordered_map<std::string, std::string> codes_;
    };

} // namespace dropcode::server
