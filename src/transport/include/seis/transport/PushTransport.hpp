// /////////////////////////////////////////////////////////////////////////////
/// @file PushTransport.hpp
/// @brief Persistent TCP connection delivering newline-delimited messages.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/transport/ITransport.hpp>
#include <seis/protocol/Sample.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/NonCopyable.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace seis::transport {

/// @brief Endpoint and timing of a push connection.
struct PushConfig
{
    std::string               host{"localhost"};
    core::u16                 port{core::kDefaultPushPort};
    std::chrono::milliseconds connectTimeout{core::kDefaultConnectTimeout};
    /// Upper bound on how long the event thread waits before re-checking
    /// for a stop request.
    std::chrono::milliseconds pollInterval{core::kDefaultReadTimeout};
    core::usize               maxMessageLength{core::kMaxLineLength};
};

/// @brief Lifecycle and data callbacks.  All run on the event thread except
///        onConnect (caller of open()) and the onDisconnect fired by close().
struct PushCallbacks
{
    std::function<void()>                   onConnect;
    /// Fired at most once per connection.
    std::function<void()>                   onDisconnect;
    /// Transport-level failure; the connection is NOT closed implicitly.
    std::function<void(const core::Error&)> onError;
    std::function<void(std::string_view)>   onMessage;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class PushTransport
/// @brief Event-driven client: the remote end pushes, a background event
///        thread hands each complete message to @c onMessage in order.
///
/// @code
///   PushTransport push({.host = "localhost", .port = 5001});
///   push.setCallbacks({.onMessage = [&](std::string_view m) { ... }});
///   if (auto ok = push.open(); !ok) { ... }
///   push.sendEnvelope(sample);
///   push.close();
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
class PushTransport final : public ITransport,
                            public core::NonCopyable<PushTransport>
{
public:
    explicit PushTransport(PushConfig config);
    ~PushTransport() override;

    /// @brief Installs the callbacks used by the next connection.
    /// @return kInvalidState while a connection is held.
    [[nodiscard]] core::ExpectedVoid setCallbacks(PushCallbacks callbacks);

    /// @brief Resolves and connects, then starts the event thread.
    ///
    /// onError fires before the error is returned when the connection is
    /// refused or times out.
    [[nodiscard]] core::ExpectedVoid open() override;

    /// @brief Stops the event thread and releases the socket.
    /// @return kInvalidState if nothing is open.
    [[nodiscard]] core::ExpectedVoid close() override;

    /// @brief Sends one message followed by the '\n' delimiter.
    /// @return kInvalidArgument if @p unit contains a line break.
    [[nodiscard]] core::ExpectedVoid write(std::string_view unit) override;

    /// @brief Encodes @p sample as an `earthquake-data` envelope and sends it.
    [[nodiscard]] core::ExpectedVoid sendEnvelope(const protocol::Sample& sample);

    [[nodiscard]] TransportState state() const noexcept override;
    [[nodiscard]] std::string identity() const override;
    [[nodiscard]] const char* name() const noexcept override;

    [[nodiscard]] const PushConfig& config() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace seis::transport
