#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "dropcode/error_codes.hpp"
#include "dropcode/http_fields.hpp"
#include "dropcode/protocol.hpp"
#include "dropcode/server/session_store.hpp"

namespace dropcode::server
{

    // What to stream for one download request.
    struct DownloadPlan
    {
        std::filesystem::path path;
        std::string file_name;
        std::string mime_type;
        std::string checksum;
        std::uint64_t total_size{};
        std::optional<http_fields::ByteRange> range;

        std::uint64_t content_length() const noexcept { return range ? range->length() : total_size; }
    };

    class RangeError : public ServiceError
    {
    public:
        explicit RangeError(std::uint64_t total_size);

        std::uint64_t total_size() const noexcept { return total_size_; }

    private:
        std::uint64_t total_size_;
    };

    /**
     * Resolves codes to completed artifacts. The download count is reported from
     * the session's maxDownloads and never decremented here.
     */
    class DownloadServer
    {
    public:
        explicit DownloadServer(const SessionStore &store);

        protocol::DownloadMeta meta(const std::string &code) const;

        // Throws RangeError when a range header is present but cannot be satisfied.
        DownloadPlan plan(const std::string &code, const std::optional<std::string> &range_header) const;

    private:
        UploadSession resolve(const std::string &code) const;

        const SessionStore &store_;
    };

} // namespace dropcode::server
