#include "dropcode/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace dropcode::protocol
{

    namespace
    {

        // Sizes and counts arrive from browsers as plain JSON numbers. Absent, null,
        // negative or fractional values collapse to zero so validation rejects them
        // as non-positive; anything that is not a number is a type error.
        std::uint64_t count_field(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return 0;
            }
            if (it->is_number_unsigned())
            {
                return it->get<std::uint64_t>();
            }
            if (it->is_number_integer())
            {
                const auto value = it->get<std::int64_t>();
                return value < 0 ? 0 : static_cast<std::uint64_t>(value);
            }
            if (it->is_number_float())
            {
                const auto value = it->get<double>();
                if (value <= 0 || std::floor(value) != value)
                {
                    return 0;
                }
                // 2^64; larger values have no uint64 representation.
                if (value >= 18446744073709551616.0)
                {
                    throw std::invalid_argument(std::string("Field '") + key + "' is out of range");
                }
                return static_cast<std::uint64_t>(value);
            }
            throw std::invalid_argument(std::string("Field '") + key + "' must be a number");
        }

        std::string string_field(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (!it->is_string())
            {
                throw std::invalid_argument(std::string("Field '") + key + "' must be a string");
            }
            return it->get<std::string>();
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"fileName", request.file_name},
            {"fileSize", request.file_size},
            {"mimeType", request.mime_type},
            {"totalChunks", request.total_chunks},
            {"chunkSize", request.chunk_size},
            {"fingerprint", request.fingerprint},
        };
        if (request.max_downloads)
        {
            json["maxDownloads"] = *request.max_downloads;
        }
        if (request.upload_id)
        {
            json["uploadId"] = *request.upload_id;
        }
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        if (!json.is_object())
        {
            throw std::invalid_argument("Request body must be a JSON object");
        }
        request.file_name = string_field(json, "fileName");
        request.file_size = count_field(json, "fileSize");
        request.mime_type = string_field(json, "mimeType");
        request.total_chunks = count_field(json, "totalChunks");
        request.chunk_size = count_field(json, "chunkSize");
        request.fingerprint = string_field(json, "fingerprint");
        if (json.contains("maxDownloads") && !json.at("maxDownloads").is_null())
        {
            request.max_downloads = count_field(json, "maxDownloads");
        }
        else
        {
            request.max_downloads.reset();
        }
        auto upload_id = string_field(json, "uploadId");
        if (upload_id.empty())
        {
            request.upload_id.reset();
        }
        else
        {
            request.upload_id = std::move(upload_id);
        }
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"code", response.code},
            {"uploadedChunks", response.uploaded_chunks},
            {"chunkSize", response.chunk_size},
            {"totalChunks", response.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.code = json.at("code").get<std::string>();
        response.uploaded_chunks = json.value("uploadedChunks", std::vector<std::uint64_t>{});
        response.chunk_size = json.value("chunkSize", std::uint64_t{0});
        response.total_chunks = json.value("totalChunks", std::uint64_t{0});
    }

    void to_json(nlohmann::json &json, const UploadStatusResponse &response)
    {
        json = {
            {"uploadId", response.upload_id},
            {"code", response.code},
            {"complete", response.complete},
            {"uploadedChunks", response.uploaded_chunks},
            {"totalChunks", response.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, UploadStatusResponse &response)
    {
        response.upload_id = json.at("uploadId").get<std::string>();
        response.code = json.at("code").get<std::string>();
        response.complete = json.value("complete", false);
        response.uploaded_chunks = json.value("uploadedChunks", std::vector<std::uint64_t>{});
        response.total_chunks = json.value("totalChunks", 0ULL);
    }

    void to_json(nlohmann::json &json, const CompleteResponse &response)
    {
        json = {
            {"ok", response.ok},
            {"code", response.code},
        };
    }

    void from_json(const nlohmann::json &json, CompleteResponse &response)
    {
        response.ok = json.value("ok", false);
        response.code = json.value("code", std::string{});
    }

    void to_json(nlohmann::json &json, const DownloadMeta &meta)
    {
        json = {
            {"code", meta.code},
            {"fileName", meta.file_name},
            {"fileSize", meta.file_size},
            {"mimeType", meta.mime_type},
            {"remainingDownloads", meta.remaining_downloads},
            {"checksum", meta.checksum},
        };
    }

    void from_json(const nlohmann::json &json, DownloadMeta &meta)
    {
        meta.code = json.at("code").get<std::string>();
        meta.file_name = json.at("fileName").get<std::string>();
        meta.file_size = json.at("fileSize").get<std::uint64_t>();
        meta.mime_type = json.value("mimeType", std::string{kDefaultMimeType});
        meta.remaining_downloads = json.value("remainingDownloads", 0ULL);
        meta.checksum = json.value("checksum", std::string{});
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = {
            {"error", body.message},
            {"code", to_string(body.code)},
        };
    }

    void from_json(const nlohmann::json &json, ErrorBody &body)
    {
        body.message = json.value("error", std::string{});
        const auto label = json.value("code", std::string{});
        body.code = error_code_from_string(label).value_or(ErrorCode::InternalError);
    }

    std::string normalize_code(std::string code)
    {
        std::transform(code.begin(), code.end(), code.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::toupper(ch)); });
        return code;
    }

} // namespace dropcode::protocol
