/**
 * @file Error.hpp
 * @brief Structured error type with source location tracking.
 *
 * Defines the error codes raised by the ingestion pipeline and a
 * lightweight Error value type carrying the code, a human-readable
 * message, and the source location where the error was raised.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_ERROR_HPP
    #define SEIS_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace seis::core {

/**
 * @brief Pipeline-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kInvalidArgument,
    kInvalidState,
    kNotSupported,
    kTimeout,
    kIoError,

    kDeviceNotFound,
    kDeviceOpenFailed,
    kDeviceConfigFailed,
    kDeviceReadFailed,
    kDeviceWriteFailed,
    kDeviceClosed,
    kReaderLocked,

    kNetworkConnectFailed,
    kNetworkSendFailed,
    kNetworkReceiveFailed,
    kNetworkDisconnected,

    kMalformedEnvelope,
    kOrphanChannelMarker,
    kLineTooLong,

    kInternalError
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                 return "None";
        case ErrorCode::kInvalidArgument:      return "InvalidArgument";
        case ErrorCode::kInvalidState:         return "InvalidState";
        case ErrorCode::kNotSupported:         return "NotSupported";
        case ErrorCode::kTimeout:              return "Timeout";
        case ErrorCode::kIoError:              return "IoError";
        case ErrorCode::kDeviceNotFound:       return "DeviceNotFound";
        case ErrorCode::kDeviceOpenFailed:     return "DeviceOpenFailed";
        case ErrorCode::kDeviceConfigFailed:   return "DeviceConfigFailed";
        case ErrorCode::kDeviceReadFailed:     return "DeviceReadFailed";
        case ErrorCode::kDeviceWriteFailed:    return "DeviceWriteFailed";
        case ErrorCode::kDeviceClosed:         return "DeviceClosed";
        case ErrorCode::kReaderLocked:         return "ReaderLocked";
        case ErrorCode::kNetworkConnectFailed: return "NetworkConnectFailed";
        case ErrorCode::kNetworkSendFailed:    return "NetworkSendFailed";
        case ErrorCode::kNetworkReceiveFailed: return "NetworkReceiveFailed";
        case ErrorCode::kNetworkDisconnected:  return "NetworkDisconnected";
        case ErrorCode::kMalformedEnvelope:    return "MalformedEnvelope";
        case ErrorCode::kOrphanChannelMarker:  return "OrphanChannelMarker";
        case ErrorCode::kLineTooLong:          return "LineTooLong";
        case ErrorCode::kInternalError:        return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief Structured error value carrying a code, message, and origin.
 *
 * Error is a lightweight value type intended to be stored inside
 * Expected<T>.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    [[nodiscard]] ErrorCode           code()     const { return _code; }
    [[nodiscard]] const std::string & message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /**
     * @brief Formats the error as "[Code] message (file:line)".
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode            _code;
    std::string          _message;
    std::source_location _location;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline auto makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<Error>(Error{code, std::move(message), loc});
}

} // namespace seis::core

#endif // SEIS_CORE_ERROR_HPP
