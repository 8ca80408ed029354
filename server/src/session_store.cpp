#include "dropcode/server/session_store.hpp"

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "dropcode/error_codes.hpp"
#include "dropcode/server/code_generator.hpp"

namespace dropcode::server
{

    namespace
    {
        constexpr auto kIndexFile = "index.json";

        std::string format_timestamp(std::chrono::system_clock::time_point time)
        {
            const auto millis =
                std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
            const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
            std::tm tm{};
            gmtime_r(&seconds, &tm);
            std::ostringstream oss;
            oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
                << (millis % 1000) << 'Z';
            return oss.str();
        }

        std::chrono::system_clock::time_point parse_timestamp(const std::string &text)
        {
            std::istringstream in(text);
            std::tm tm{};
            in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
            if (in.fail())
            {
                throw std::invalid_argument("Invalid timestamp: " + text);
            }
            long long millis = 0;
            if (in.peek() == '.')
            {
                in.get();
                in >> millis;
            }
            const auto seconds = timegm(&tm);
            return std::chrono::system_clock::time_point{std::chrono::seconds{seconds}} +
                   std::chrono::milliseconds{millis};
        }

        nlohmann::json session_to_json(const UploadSession &session)
        {
            nlohmann::json json = {
                {"uploadId", session.session_id},
                {"code", session.code},
                {"fingerprint", session.fingerprint},
                {"fileName", session.file_name},
                {"fileSize", session.file_size},
                {"mimeType", session.mime_type},
                {"totalChunks", session.total_chunks},
                {"chunkSize", session.chunk_size},
                {"maxDownloads", session.max_downloads},
                {"uploadedChunks", session.uploaded_chunks},
                {"complete", session.complete},
                {"createdAt", format_timestamp(session.created_at)},
            };
            if (session.artifact_path)
            {
                json["filePath"] = session.artifact_path->generic_string();
                json["artifactSize"] = session.artifact_size;
                json["checksum"] = session.checksum;
            }
            if (session.completed_at)
            {
                json["completedAt"] = format_timestamp(*session.completed_at);
            }
            return json;
        }

        UploadSession session_from_json(const nlohmann::json &json)
        {
            UploadSession session{};
            session.session_id = json.at("uploadId").get<std::string>();
            session.code = json.at("code").get<std::string>();
            session.fingerprint = json.value("fingerprint", std::string{});
            session.file_name = json.at("fileName").get<std::string>();
            session.file_size = json.at("fileSize").get<std::uint64_t>();
            session.mime_type = json.value("mimeType", std::string{"application/octet-stream"});
            session.total_chunks = json.at("totalChunks").get<std::uint64_t>();
            session.chunk_size = json.at("chunkSize").get<std::uint64_t>();
            session.max_downloads = json.value("maxDownloads", 1ULL);
            session.uploaded_chunks = json.value("uploadedChunks", std::set<std::uint64_t>{});
            session.complete = json.value("complete", false);
            if (json.contains("filePath"))
            {
                session.artifact_path = std::filesystem::path(json.at("filePath").get<std::string>());
                session.artifact_size = json.value("artifactSize", session.file_size);
                session.checksum = json.value("checksum", std::string{});
            }
            session.created_at = parse_timestamp(json.at("createdAt").get<std::string>());
            if (json.contains("completedAt"))
            {
                session.completed_at = parse_timestamp(json.at("completedAt").get<std::string>());
            }
            return session;
        }

    } // namespace

    SessionStore::SessionStore(std::filesystem::path root)
        : index_path_(std::move(root) / kIndexFile)
    {
        std::filesystem::create_directories(index_path_.parent_path());
        load();
    }

    std::optional<UploadSession> SessionStore::get(const std::string &session_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<UploadSession> SessionStore::get_by_code(const std::string &code) const
    {
        std::lock_guard lock(mutex_);
        auto code_it = codes_.find(code);
        if (code_it == codes_.end())
        {
            return std::nullopt;
        }
        auto it = sessions_.find(code_it->second);
        if (it != sessions_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    UploadSession SessionStore::insert(UploadSession session, const CodeGenerator &codes)
    {
        std::lock_guard lock(mutex_);
        if (sessions_.contains(session.session_id))
        {
            throw ServiceError(ErrorCode::InternalError, "Session id already in use");
        }
        session.code = codes.generate([this](const std::string &candidate)
                                      { return codes_.contains(candidate); });

        const auto session_id = session.session_id;
        const auto code = session.code;
        sessions_.emplace(session_id, std::move(session));
        codes_.emplace(code, session_id);
        try
        {
            persist_locked();
        }
        catch (...)
        {
            sessions_.erase(session_id);
            codes_.erase(code);
            throw;
        }
        return sessions_.at(session_id);
    }

    UploadSession SessionStore::update(const std::string &session_id, const Mutation &mutation)
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
        {
            throw ServiceError(ErrorCode::SessionNotFound, "Upload session not found");
        }

        auto next = it->second;
        if (!mutation(next))
        {
            return it->second;
        }
        if (next.session_id != session_id || next.code != it->second.code)
        {
            throw ServiceError(ErrorCode::InternalError, "Session identity is immutable");
        }

        auto previous = std::exchange(it->second, std::move(next));
        try
        {
            persist_locked();
        }
        catch (...)
        {
            it->second = std::move(previous);
            throw;
        }
        return it->second;
    }

    std::size_t SessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::filesystem::path SessionStore::index_path() const
    {
        return index_path_;
    }

    void SessionStore::load()
    {
        std::lock_guard lock(mutex_);
        sessions_.clear();
        codes_.clear();
        if (!std::filesystem::exists(index_path_))
        {
            persist_locked();
            return;
        }

        std::ifstream in(index_path_);
        if (!in.is_open())
        {
            throw ServiceError(ErrorCode::IoError, "Failed to open session index " + index_path_.string());
        }
        try
        {
            nlohmann::json json;
            in >> json;
            if (!json.is_object() || !json.contains("uploads") || !json.at("uploads").is_object())
            {
                throw std::invalid_argument("missing 'uploads' object");
            }
            for (const auto &[key, value] : json.at("uploads").items())
            {
                auto session = session_from_json(value);
                if (session.session_id != key)
                {
                    throw std::invalid_argument("session key mismatch for " + key);
                }
                if (!codes_.emplace(session.code, session.session_id).second)
                {
                    throw std::invalid_argument("duplicate code " + session.code);
                }
                sessions_.emplace(key, std::move(session));
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ServiceError(ErrorCode::StoreCorrupt, std::string("Session index is corrupt: ") + ex.what());
        }
        catch (const std::invalid_argument &ex)
        {
            throw ServiceError(ErrorCode::StoreCorrupt, std::string("Session index is corrupt: ") + ex.what());
        }
        spdlog::info("Loaded {} upload sessions from {}", sessions_.size(), index_path_.string());
    }

    void SessionStore::persist_locked() const
    {
        nlohmann::json uploads = nlohmann::json::object();
        nlohmann::json codes = nlohmann::json::object();
        for (const auto &[id, session] : sessions_)
        {
            uploads[id] = session_to_json(session);
        }
        for (const auto &[code, id] : codes_)
        {
            codes[code] = id;
        }
        const nlohmann::json document = {
            {"uploads", std::move(uploads)},
            {"codes", std::move(codes)},
        };

        auto temp_path = index_path_;
        temp_path += ".tmp";
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw ServiceError(ErrorCode::IoError, "Failed to open " + temp_path.string());
            }
            out << document.dump(2);
            out.flush();
            if (!out)
            {
                throw ServiceError(ErrorCode::IoError, "Failed to write " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, index_path_, ec);
        if (ec)
        {
            const auto reason = ec.message();
            std::filesystem::remove(temp_path, ec);
            throw ServiceError(ErrorCode::IoError, "Failed to replace session index: " + reason);
        }
    }

} // namespace dropcode::server
