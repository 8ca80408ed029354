#include "dropcode/http_fields.hpp"

#include <charconv>

namespace dropcode::http_fields
{

    namespace
    {
        constexpr std::string_view kBytesPrefix = "bytes=";

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t'))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::optional<std::uint64_t> parse_number(std::string_view text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end)
            {
                return std::nullopt;
            }
            return value;
        }

        bool is_unreserved(unsigned char ch)
        {
            return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') || ch == '-' ||
                   ch == '.' || ch == '_' || ch == '~' || ch == '!' || ch == '*' || ch == '\'' || ch == '(' ||
                   ch == ')';
        }
    } // namespace

    std::optional<ByteRange> parse_range(std::string_view header, std::uint64_t size)
    {
        header = trim(header);
        if (header.substr(0, kBytesPrefix.size()) != kBytesPrefix || size == 0)
        {
            return std::nullopt;
        }
        const auto ranges = trim(header.substr(kBytesPrefix.size()));
        if (ranges.find(',') != std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto dash = ranges.find('-');
        if (dash == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto start_text = trim(ranges.substr(0, dash));
        const auto end_text = trim(ranges.substr(dash + 1));

        if (start_text.empty())
        {
            const auto suffix = parse_number(end_text);
            if (!suffix || *suffix == 0)
            {
                return std::nullopt;
            }
            const auto start = *suffix >= size ? 0 : size - *suffix;
            return ByteRange{start, size - 1};
        }

        const auto start = parse_number(start_text);
        if (!start || *start >= size)
        {
            return std::nullopt;
        }
        auto end = size - 1;
        if (!end_text.empty())
        {
            const auto requested_end = parse_number(end_text);
            if (!requested_end || *requested_end < *start)
            {
                return std::nullopt;
            }
            if (*requested_end < end)
            {
                end = *requested_end;
            }
        }
        return ByteRange{*start, end};
    }

    std::string content_range(const ByteRange &range, std::uint64_t total)
    {
        return "bytes " + std::to_string(range.start) + "-" + std::to_string(range.end) + "/" + std::to_string(total);
    }

    std::string unsatisfied_range(std::uint64_t total)
    {
        return "bytes */" + std::to_string(total);
    }

    std::string range_from(std::uint64_t offset)
    {
        return "bytes=" + std::to_string(offset) + "-";
    }

    std::string percent_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(value.size() * 3);
        for (const char raw : value)
        {
            const auto ch = static_cast<unsigned char>(raw);
            if (is_unreserved(ch))
            {
                encoded.push_back(static_cast<char>(ch));
                continue;
            }
            encoded.push_back('%');
            encoded.push_back(kHexDigits[(ch >> 4) & 0x0F]);
            encoded.push_back(kHexDigits[ch & 0x0F]);
        }
        return encoded;
    }

    std::string content_disposition(std::string_view file_name)
    {
        return "attachment; filename*=UTF-8''" + percent_encode(file_name);
    }

} // namespace dropcode::http_fields
