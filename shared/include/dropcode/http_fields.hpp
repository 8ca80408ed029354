/**
 * DropCode - Helpers for the HTTP header fields used by downloads.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dropcode::http_fields
{

    // Inclusive byte range within a resource.
    struct ByteRange
    {
        std::uint64_t start{};
        std::uint64_t end{};

        std::uint64_t length() const noexcept { return end - start + 1; }
    };

    /**
     * Parses a single `bytes=` range (`start-end`, `start-` or `-suffix`) against a
     * resource of `size` bytes. An end beyond the resource is clamped. Returns
     * nullopt for malformed, multi-range or unsatisfiable requests.
     */
    std::optional<ByteRange> parse_range(std::string_view header, std::uint64_t size);

    // `bytes start-end/total`
    std::string content_range(const ByteRange &range, std::uint64_t total);

    // `bytes */total`, sent with 416 responses.
    std::string unsatisfied_range(std::uint64_t total);

    // Request header asking for everything from `offset` onward.
    std::string range_from(std::uint64_t offset);

    // RFC 5987 percent-encoding of a UTF-8 string.
    std::string percent_encode(std::string_view value);

    // `attachment; filename*=UTF-8''<encoded>`
    std::string content_disposition(std::string_view file_name);

} // namespace dropcode::http_fields
