#include "dropcode/server/staging_area.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr auto kStagingDir = "tmp";
        constexpr auto kChunkSuffix = ".part";
    } // namespace

    StagingArea::StagingArea(std::filesystem::path root)
        : base_(std::move(root) / kStagingDir)
    {
        std::filesystem::create_directories(base_);
    }

    std::filesystem::path StagingArea::session_dir(const std::string &session_id) const
    {
        return base_ / session_id;
    }

    std::filesystem::path StagingArea::chunk_path(const std::string &session_id, std::uint64_t index) const
    {
        return session_dir(session_id) / (std::to_string(index) + kChunkSuffix);
    }

    void StagingArea::provision(const std::string &session_id)
    {
        std::error_code ec;
        std::filesystem::create_directories(session_dir(session_id), ec);
        if (ec)
        {
            throw ServiceError(ErrorCode::IoError, "Failed to create staging area: " + ec.message());
        }
    }

    void StagingArea::write_chunk(const std::string &session_id, std::uint64_t index,
                                  std::span<const std::byte> data)
    {
        provision(session_id);
        const auto target = chunk_path(session_id, index);
        auto temp = target;
        temp += "." + crypto::random_hex(12) + ".tmp";

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw ServiceError(ErrorCode::IoError, "Failed to open staging file for chunk " +
                                                           std::to_string(index));
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out)
            {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(temp, ignored);
                throw ServiceError(ErrorCode::IoError, "Failed to write chunk " + std::to_string(index));
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(temp, ec);
            throw ServiceError(ErrorCode::IoError, "Failed to commit chunk " + std::to_string(index) + ": " + reason);
        }
    }

    bool StagingArea::has_chunk(const std::string &session_id, std::uint64_t index) const
    {
        std::error_code ec;
        return std::filesystem::is_regular_file(chunk_path(session_id, index), ec);
    }

    std::ifstream StagingArea::open_chunk(const std::string &session_id, std::uint64_t index) const
    {
        return std::ifstream(chunk_path(session_id, index), std::ios::binary);
    }

    bool StagingArea::exists(const std::string &session_id) const
    {
        std::error_code ec;
        return std::filesystem::is_directory(session_dir(session_id), ec);
    }

    void StagingArea::discard(const std::string &session_id)
    {
        std::error_code ec;
        std::filesystem::remove_all(session_dir(session_id), ec);
        if (ec)
        {
            throw ServiceError(ErrorCode::IoError, "Failed to remove staging area: " + ec.message());
        }
        spdlog::debug("Discarded staging area for {}", session_id);
    }

} // namespace dropcode::server
