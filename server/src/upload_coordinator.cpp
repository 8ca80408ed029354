#include "dropcode/server/upload_coordinator.hpp"

#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>

#include "dropcode/crypto.hpp"
#include "dropcode/error_codes.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr std::size_t kSessionIdLength = 20;
        constexpr auto kArtifactSuffix = ".bin";

        std::uint64_t expected_chunk_length(const UploadSession &session, std::uint64_t index)
        {
            if (index + 1 < session.total_chunks)
            {
                return session.chunk_size;
            }
            return session.file_size - (session.total_chunks - 1) * session.chunk_size;
        }

    } // namespace

    UploadCoordinator::UploadCoordinator(CoordinatorServices services, std::filesystem::path artifact_dir,
                                         std::uint64_t max_chunk_size)
        : services_(services), artifact_dir_(std::move(artifact_dir)), max_chunk_size_(max_chunk_size)
    {
        std::filesystem::create_directories(artifact_dir_);
    }

    ResumeInfo UploadCoordinator::init(const protocol::UploadInitRequest &request)
    {
        if (request.upload_id)
        {
            auto existing = services_.store.get(*request.upload_id);
            if (existing && !existing->complete)
            {
                spdlog::info("Resuming upload {} ({} of {} chunks present)", existing->session_id,
                             existing->uploaded_chunks.size(), existing->total_chunks);
                return {.session = std::move(*existing), .resumed = true};
            }
        }

        validate(request);

        UploadSession session{};
        session.fingerprint = request.fingerprint;
        session.file_name = request.file_name;
        session.file_size = request.file_size;
        session.mime_type = request.mime_type.empty() ? protocol::kDefaultMimeType : request.mime_type;
        session.chunk_size = request.chunk_size;
        session.total_chunks = request.total_chunks;
        session.max_downloads = request.max_downloads.value_or(1);
        session.created_at = std::chrono::system_clock::now();
        do
        {
            session.session_id = crypto::random_hex(kSessionIdLength);
        } while (services_.store.get(session.session_id));

        const auto session_id = session.session_id;
        services_.staging.provision(session_id);
        try
        {
            session = services_.store.insert(std::move(session), services_.codes);
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove_all(services_.staging.session_dir(session_id), ec);
            throw;
        }

        spdlog::info("Created upload {} with code {} for '{}' ({} bytes, {} chunks)", session.session_id,
                     session.code, session.file_name, session.file_size, session.total_chunks);
        return {.session = std::move(session), .resumed = false};
    }

    void UploadCoordinator::accept_chunk(const std::string &session_id, std::uint64_t index,
                                         std::span<const std::byte> data)
    {
        // Unknown ids fail before a lock entry is created for them.
        (void)status(session_id);
        const auto lock = session_lock(session_id);
        std::shared_lock guard(*lock);

        const auto session = status(session_id);
        if (index >= session.total_chunks)
        {
            throw ServiceError(ErrorCode::IndexOutOfRange, "Chunk index " + std::to_string(index) +
                                                               " outside [0, " +
                                                               std::to_string(session.total_chunks) + ")");
        }
        if (session.complete)
        {
            spdlog::debug("Ignoring chunk {} for completed upload {}", index, session_id);
            return;
        }
        const auto expected = expected_chunk_length(session, index);
        if (data.size() != expected)
        {
            throw ServiceError(ErrorCode::InvalidRequest, "Chunk " + std::to_string(index) + " must be " +
                                                              std::to_string(expected) + " bytes, got " +
                                                              std::to_string(data.size()));
        }

        services_.staging.write_chunk(session_id, index, data);
        services_.store.update(session_id, [index](UploadSession &current)
                               { return current.uploaded_chunks.insert(index).second; });
        spdlog::debug("Accepted chunk {} ({} bytes) for {}", index, data.size(), session_id);
    }

    UploadSession UploadCoordinator::complete(const std::string &session_id)
    {
        (void)status(session_id);
        const auto lock = session_lock(session_id);
        std::unique_lock guard(*lock);

        const auto session = status(session_id);
        if (session.complete)
        {
            return session;
        }
        if (session.uploaded_chunks.size() < session.total_chunks)
        {
            throw ServiceError(ErrorCode::IncompleteUpload,
                               "Only " + std::to_string(session.uploaded_chunks.size()) + " of " +
                                   std::to_string(session.total_chunks) + " chunks uploaded");
        }

        const auto target = artifact_path_for(session.code);
        const auto merged = services_.merger.merge(session_id, session.total_chunks, target);

        UploadSession completed;
        try
        {
            completed = services_.store.update(session_id, [&merged](UploadSession &current)
                                               {
                current.complete = true;
                current.artifact_path = merged.artifact_path;
                current.artifact_size = merged.size;
                current.checksum = merged.checksum;
                current.completed_at = std::chrono::system_clock::now();
                return true; });
        }
        catch (...)
        {
            std::error_code ec;
            std::filesystem::remove(target, ec);
            throw;
        }

        try
        {
            services_.staging.discard(session_id);
        }
        catch (const ServiceError &ex)
        {
            spdlog::warn("Upload {} completed but staging cleanup failed: {}", session_id, ex.what());
        }

        guard.unlock();
        release_session_lock(session_id);
        spdlog::info("Upload {} complete, code {} ready ({} bytes)", session_id, completed.code,
                     completed.artifact_size);
        return completed;
    }

    UploadSession UploadCoordinator::status(const std::string &session_id) const
    {
        auto session = services_.store.get(session_id);
        if (!session)
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session not found");
        }
        return std::move(*session);
    }

    std::filesystem::path UploadCoordinator::artifact_path_for(const std::string &code) const
    {
        return artifact_dir_ / (code + kArtifactSuffix);
    }

    std::shared_ptr<std::shared_mutex> UploadCoordinator::session_lock(const std::string &session_id)
    {
        std::lock_guard lock(locks_mutex_);
        auto &entry = locks_[session_id];
        if (!entry)
        {
            entry = std::make_shared<std::shared_mutex>();
        }
        return entry;
    }

    // Once a session is complete every later call is a read-only no-op, so the
    // lock entry can go even if another caller still holds the old mutex.
    void UploadCoordinator::release_session_lock(const std::string &session_id)
    {
        std::lock_guard lock(locks_mutex_);
        locks_.erase(session_id);
    }

    void UploadCoordinator::validate(const protocol::UploadInitRequest &request) const
    {
        if (request.file_name.empty() || request.file_size == 0 || request.total_chunks == 0 ||
            request.chunk_size == 0)
        {
            throw ServiceError(ErrorCode::InvalidRequest,
                               "fileName, fileSize, totalChunks and chunkSize are required and must be positive");
        }
        if (request.chunk_size > max_chunk_size_)
        {
            throw ServiceError(ErrorCode::InvalidRequest,
                               "chunkSize exceeds the limit of " + std::to_string(max_chunk_size_) + " bytes");
        }
        const auto expected_chunks = (request.file_size + request.chunk_size - 1) / request.chunk_size;
        if (request.total_chunks != expected_chunks)
        {
            throw ServiceError(ErrorCode::InvalidRequest, "totalChunks must be " + std::to_string(expected_chunks) +
                                                              " for the given fileSize and chunkSize");
        }
        if (request.max_downloads && *request.max_downloads == 0)
        {
            throw ServiceError(ErrorCode::InvalidRequest, "maxDownloads must be at least 1");
        }
    }

} // namespace dropcode::server
