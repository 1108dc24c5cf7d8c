#include "qrdrop/error_codes.hpp"

#include <array>

namespace qrdrop
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            std::uint16_t status;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::InvalidRequest, "invalid_request", 400},
            {ErrorCode::MissingParameter, "missing_parameter", 400},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::LengthRequired, "length_required", 411},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::Conflict, "conflict", 409},
            {ErrorCode::AlreadyExists, "already_exists", 409},
            {ErrorCode::IoError, "io_error", 500},
            {ErrorCode::BindFailed, "bind_failed", 500},
            {ErrorCode::NotRunning, "not_running", 503},
            {ErrorCode::InternalError, "internal_error", 500},
        }};
    } // namespace

    TransferError::TransferError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

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

    std::uint16_t http_status(ErrorCode code) noexcept
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

} // namespace qrdrop
