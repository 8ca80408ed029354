#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "dropcode/server/staging_area.hpp"

namespace dropcode::server
{

    struct MergeResult
    {
        std::filesystem::path artifact_path;
        std::uint64_t size{};
        std::string checksum;
    };

    class Merger
    {
    public:
        explicit Merger(const StagingArea &staging);

        /**
         * Concatenates staged chunks 0..total_chunks-1 in ascending order into
         * `artifact_path`. Output goes to `<artifact_path>.partial` first and is
         * renamed into place only once every chunk has landed; on failure the
         * partial output is removed and the staged chunks are left untouched.
         *
         * Throws ServiceError(MissingChunk) naming the first absent index, or
         * ServiceError(IoError).
         */
        MergeResult merge(const std::string &session_id, std::uint64_t total_chunks,
                          const std::filesystem::path &artifact_path) const;

    private:
        const StagingArea &staging_;
    };

} // namespace dropcode::server
