/**
 * BucketSync - Error codes shared by the blob stores, ledgers and the daemon.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bucketsync
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidKey = 1,
        PermissionDenied = 2,
        NotFound = 3,
        AlreadyExists = 4,
        AuthenticationFailed = 5,
        Network = 6,
        Timeout = 7,
        FileIo = 8,
        CorruptState = 9,
        InvalidConfig = 10,
        RemoteError = 11,
        InternalError = 12
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    // Raised by blob stores when a single put/get/list fails.
    class TransferError : public Error
    {
    public:
        using Error::Error;
    };

    class LedgerError : public Error
    {
    public:
        using Error::Error;
    };

    class ConfigError : public Error
    {
    public:
        explicit ConfigError(const std::string &message);
    };

} // namespace bucketsync
