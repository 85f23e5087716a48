#include "bucketsync/error_codes.hpp"

#include <array>

namespace bucketsync
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 13> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidKey, "invalid_key"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::AuthenticationFailed, "authentication_failed"},
            {ErrorCode::Network, "network"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::CorruptState, "corrupt_state"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::RemoteError, "remote_error"},
            {ErrorCode::InternalError, "internal_error"},
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

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    ConfigError::ConfigError(const std::string &message)
        : Error(ErrorCode::InvalidConfig, message) {}

} // namespace bucketsync
