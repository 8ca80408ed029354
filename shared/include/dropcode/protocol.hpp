/**
 * DropCode - JSON schema of the upload and download API and its serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "dropcode/error_codes.hpp"

namespace dropcode::protocol
{

    inline constexpr auto kDefaultMimeType = "application/octet-stream";

    struct UploadInitRequest
    {
        std::string file_name;
        std::uint64_t file_size{};
        std::string mime_type;
        std::uint64_t total_chunks{};
        std::uint64_t chunk_size{};
        std::string fingerprint;
        std::optional<std::uint64_t> max_downloads{};
        std::optional<std::string> upload_id{};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string upload_id;
        std::string code;
        std::vector<std::uint64_t> uploaded_chunks;
        // Geometry of the session as stored; a resumed session keeps its original slicing.
        std::uint64_t chunk_size{0};
        std::uint64_t total_chunks{0};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadStatusResponse
    {
        std::string upload_id;
        std::string code;
        bool complete{};
        std::vector<std::uint64_t> uploaded_chunks;
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const UploadStatusResponse &response);
    void from_json(const nlohmann::json &json, UploadStatusResponse &response);

    struct CompleteResponse
    {
        bool ok{true};
        std::string code;
    };

    void to_json(nlohmann::json &json, const CompleteResponse &response);
    void from_json(const nlohmann::json &json, CompleteResponse &response);

    struct DownloadMeta
    {
        std::string code;
        std::string file_name;
        std::uint64_t file_size{};
        std::string mime_type;
        std::uint64_t remaining_downloads{};
        std::string checksum;
    };

    void to_json(nlohmann::json &json, const DownloadMeta &meta);
    void from_json(const nlohmann::json &json, DownloadMeta &meta);

    struct ErrorBody
    {
        ErrorCode code{ErrorCode::InternalError};
        std::string message;
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);
    void from_json(const nlohmann::json &json, ErrorBody &body);

    // Codes are typed by humans; lookups ignore case.
    std::string normalize_code(std::string code);

} // namespace dropcode::protocol
