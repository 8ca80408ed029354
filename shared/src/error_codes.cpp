#include "dropcode/error_codes.hpp"

#include <array>
#include <utility>

namespace dropcode
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            unsigned status;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidRequest, "invalid_request", 400},
            {ErrorCode::SessionNotFound, "session_not_found", 404},
            {ErrorCode::CodeNotFound, "code_not_found", 404},
            {ErrorCode::IndexOutOfRange, "index_out_of_range", 400},
            {ErrorCode::IncompleteUpload, "incomplete_upload", 400},
            {ErrorCode::MissingChunk, "missing_chunk", 500},
            {ErrorCode::IoError, "io_error", 500},
            {ErrorCode::StoreCorrupt, "store_corrupt", 500},
            {ErrorCode::RangeNotSatisfiable, "range_not_satisfiable", 416},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

    unsigned http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

    ServiceError::ServiceError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code)
    {
    }

} // namespace dropcode
