#include "dropcode/server/download_server.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace dropcode::server
{

    RangeError::RangeError(std::uint64_t total_size)
        : ServiceError(ErrorCode::RangeNotSatisfiable, "Requested range not satisfiable"), total_size_(total_size)
    {
    }

    DownloadServer::DownloadServer(const SessionStore &store)
        : store_(store)
    {
    }

    protocol::DownloadMeta DownloadServer::meta(const std::string &code) const
    {
        const auto session = resolve(code);
        return protocol::DownloadMeta{
            .code = session.code,
            .file_name = session.file_name,
            .file_size = session.file_size,
            .mime_type = session.mime_type,
            .remaining_downloads = session.max_downloads,
            .checksum = session.checksum,
        };
    }

    DownloadPlan DownloadServer::plan(const std::string &code, const std::optional<std::string> &range_header) const
    {
        const auto session = resolve(code);

        std::error_code ec;
        const auto actual_size = std::filesystem::file_size(*session.artifact_path, ec);
        if (ec)
        {
            spdlog::error("Artifact for code {} is unreadable: {}", session.code, ec.message());
            throw ServiceError(ErrorCode::IoError, "Stored file is unavailable");
        }

        DownloadPlan plan{
            .path = *session.artifact_path,
            .file_name = session.file_name,
            .mime_type = session.mime_type,
            .checksum = session.checksum,
            .total_size = actual_size,
            .range = std::nullopt,
        };
        if (range_header)
        {
            plan.range = http_fields::parse_range(*range_header, actual_size);
            if (!plan.range)
            {
                throw RangeError(actual_size);
            }
        }
        return plan;
    }

    UploadSession DownloadServer::resolve(const std::string &code) const
    {
        auto session = store_.get_by_code(protocol::normalize_code(code));
        if (!session || !session->complete || !session->artifact_path)
        {
            throw ServiceError(ErrorCode::CodeNotFound, "No completed upload for this code");
        }
        return std::move(*session);
    }

} // namespace dropcode::server
