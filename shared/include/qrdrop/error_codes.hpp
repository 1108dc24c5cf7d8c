/**
 * QRDrop - Shared error codes and the exception type that carries them.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace qrdrop
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidRequest = 1,
        MissingParameter = 2,
        NotFound = 3,
        MethodNotAllowed = 4,
        LengthRequired = 5,
        PayloadTooLarge = 6,
        Conflict = 7,
        AlreadyExists = 8,
        IoError = 9,
        BindFailed = 10,
        NotRunning = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status a handler answers with when it fails with `code`.
    std::uint16_t http_status(ErrorCode code) noexcept;

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace qrdrop
