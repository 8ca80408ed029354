#include "dropcode/server/merger.hpp"

#include <fstream>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr std::size_t kCopyBufferSize = 64 * 1024;

        // Removes the partial artifact on every exit path that did not publish it.
        class PartialOutput
        {
        public:
            explicit PartialOutput(std::filesystem::path path) : path_(std::move(path)) {}

            ~PartialOutput()
            {
                if (!published_)
                {
                    std::error_code ec;
                    std::filesystem::remove(path_, ec);
                }
            }

            PartialOutput(const PartialOutput &) = delete;
            PartialOutput &operator=(const PartialOutput &) = delete;

            const std::filesystem::path &path() const { return path_; }

            void publish(const std::filesystem::path &target)
            {
                std::error_code ec;
                std::filesystem::rename(path_, target, ec);
                if (ec)
                {
                    throw ServiceError(ErrorCode::IoError, "Failed to publish artifact: " + ec.message());
                }
                published_ = true;
            }

        private:
            std::filesystem::path path_;
            bool published_{false};
        };

    } // namespace

    Merger::Merger(const StagingArea &staging)
        : staging_(staging)
    {
    }

    MergeResult Merger::merge(const std::string &session_id, std::uint64_t total_chunks,
                              const std::filesystem::path &artifact_path) const
    {
        std::error_code ec;
        std::filesystem::create_directories(artifact_path.parent_path(), ec);
        if (ec)
        {
            throw ServiceError(ErrorCode::IoError, "Failed to create artifact directory: " + ec.message());
        }

        auto partial_path = artifact_path;
        partial_path += ".partial";
        PartialOutput partial(partial_path);

        std::ofstream out(partial.path(), std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw ServiceError(ErrorCode::IoError, "Failed to open artifact for writing");
        }

        crypto::StreamingHash hash;
        std::vector<std::byte> buffer(kCopyBufferSize);
        std::uint64_t written = 0;
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            auto chunk = staging_.open_chunk(session_id, index);
            if (!chunk.is_open())
            {
                spdlog::error("Merge of {} stopped: chunk {} is not staged", session_id, index);
                throw ServiceError(ErrorCode::MissingChunk, "Missing chunk " + std::to_string(index));
            }
            while (chunk)
            {
                chunk.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<std::size_t>(chunk.gcount());
                if (read_count == 0)
                {
                    break;
                }
                out.write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(read_count));
                if (!out)
                {
                    throw ServiceError(ErrorCode::IoError, "Failed to append chunk " + std::to_string(index));
                }
                hash.update(std::span<const std::byte>(buffer.data(), read_count));
                written += read_count;
            }
            if (chunk.bad())
            {
                throw ServiceError(ErrorCode::IoError, "Failed to read chunk " + std::to_string(index));
            }
        }

        out.flush();
        out.close();
        if (!out)
        {
            throw ServiceError(ErrorCode::IoError, "Failed to flush artifact");
        }
        partial.publish(artifact_path);

        spdlog::info("Merged {} chunks ({} bytes) for {} into {}", total_chunks, written, session_id,
                     artifact_path.string());
        return MergeResult{
            .artifact_path = artifact_path,
            .size = written,
            .checksum = hash.finish(),
        };
    }

} // namespace dropcode::server
