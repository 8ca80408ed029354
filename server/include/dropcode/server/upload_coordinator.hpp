#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>

#include "dropcode/protocol.hpp"
#include "dropcode/server/code_generator.hpp"
#include "dropcode/server/merger.hpp"
#include "dropcode/server/session_store.hpp"
#include "dropcode/server/staging_area.hpp"

namespace dropcode::server
{

    struct ResumeInfo
    {
        UploadSession session;
        bool resumed{};
    };

    struct CoordinatorServices
    {
        SessionStore &store;
        StagingArea &staging;
        const Merger &merger;
        const CodeGenerator &codes;
    };

    /**
     * Drives a session from init through chunk acceptance to completion.
     *
     * Chunk writes for one session share a per-session lock so they run in
     * parallel; completion takes it exclusively, which makes the merge
     * at-most-once and keeps late chunks away from a staging area being merged.
     */
    class UploadCoordinator
    {
    public:
        UploadCoordinator(CoordinatorServices services, std::filesystem::path artifact_dir,
                          std::uint64_t max_chunk_size);

        ResumeInfo init(const protocol::UploadInitRequest &request);

        void accept_chunk(const std::string &session_id, std::uint64_t index, std::span<const std::byte> data);

        UploadSession complete(const std::string &session_id);

        UploadSession status(const std::string &session_id) const;

        std::filesystem::path artifact_path_for(const std::string &code) const;

    private:
        std::shared_ptr<std::shared_mutex> session_lock(const std::string &session_id);
        void release_session_lock(const std::string &session_id);
        void validate(const protocol::UploadInitRequest &request) const;

        CoordinatorServices services_;
        std::filesystem::path artifact_dir_;
        std::uint64_t max_chunk_size_;

        std::mutex locks_mutex_;
        std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;
    };

} // namespace dropcode::server
