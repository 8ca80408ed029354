/**
 * DropCode - Error codes shared by the server engine, its HTTP surface and the client.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace dropcode
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidRequest = 1,
        SessionNotFound = 2,
        CodeNotFound = 3,
        IndexOutOfRange = 4,
        IncompleteUpload = 5,
        MissingChunk = 6,
        IoError = 7,
        StoreCorrupt = 8,
        RangeNotSatisfiable = 9,
        NotFound = 10,
        MethodNotAllowed = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // HTTP status a failure is reported with.
    unsigned http_status(ErrorCode code) noexcept;

    class ServiceError : public std::runtime_error
    {
    public:
        ServiceError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace dropcode
