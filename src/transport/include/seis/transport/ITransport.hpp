// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract transport layer interface (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/core/Types.hpp>
#include <seis/core/Expected.hpp>

#include <string>
#include <string_view>

namespace seis::transport {

/// @brief Connection lifecycle.
///
/// kFaulted means the connection ended (peer hang-up or I/O failure) while
/// the handle is still held; close() must still be called.
enum class TransportState : core::u8
{
    kClosed = 0,
    kOpen,
    kFaulted
};

[[nodiscard]] constexpr const char* transportStateName(TransportState state) noexcept
{
    switch (state)
    {
        case TransportState::kClosed:  return "closed";
        case TransportState::kOpen:    return "open";
        case TransportState::kFaulted: return "faulted";
    }
    return "unknown";
}

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Strategy interface for inbound sensor transports.
///
/// Concrete implementations:
///   - @c PushTransport    — persistent TCP connection, server-initiated
///                           delivery of newline-delimited messages.
///   - @c SerialTransport  — exclusive POSIX serial line read by a pull loop.
///
/// No operation throws; failures come back as core::Error values.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Opens the connection.
    [[nodiscard]] virtual core::ExpectedVoid open() = 0;

    /// @brief Releases the connection.
    /// @return kInvalidState if nothing is open.
    [[nodiscard]] virtual core::ExpectedVoid close() = 0;

    /// @brief Sends one encoded unit; atomic with respect to other writers.
    [[nodiscard]] virtual core::ExpectedVoid write(std::string_view unit) = 0;

    [[nodiscard]] virtual TransportState state() const noexcept = 0;

    /// @brief Identity recorded in each sample's `source` annotation.
    [[nodiscard]] virtual std::string identity() const = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace seis::transport
