// /////////////////////////////////////////////////////////////////////////////
/// @file Ingestor.hpp
/// @brief Facade binding transports to one shared subscription registry.
///
/// Wires each attached transport to its own StreamDecoder and handles the
/// teardown ordering (stop reading, then close).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/stream/IngestConfig.hpp>
#include <seis/stream/StreamDecoder.hpp>
#include <seis/stream/SubscriptionRegistry.hpp>
#include <seis/transport/IByteStream.hpp>
#include <seis/transport/PushTransport.hpp>
#include <seis/core/NonCopyable.hpp>

#include <memory>
#include <mutex>
#include <vector>

namespace seis::stream {

// /////////////////////////////////////////////////////////////////////////////
/// @class Ingestor
/// @brief Owns the registry and one decoder per attached transport.
///
/// Transports are borrowed: the caller keeps them alive until detach()
/// (or the Ingestor's destruction) returns.
///
/// @code
///   Ingestor ingestor(config);
///   auto id = ingestor.subscribe([](auto batch) { ... });
///   SerialTransport serial(config.serial());
///   if (auto ok = ingestor.attach(serial); !ok) { ... }
///   ...
///   ingestor.detach(serial);
/// @endcode
// /////////////////////////////////////////////////////////////////////////////
class Ingestor final : public core::NonMovable<Ingestor>
{
public:
    explicit Ingestor(IngestConfig config);
    ~Ingestor();

    [[nodiscard]] core::Expected<SubscriptionId> subscribe(Subscriber callback);
    [[nodiscard]] core::ExpectedVoid unsubscribe(SubscriptionId id);

    /// @brief Removes every subscriber; returns how many were removed.
    core::usize unsubscribeAll();

    /// @brief Error handler given to decoders attached from now on.
    void setErrorHandler(ErrorHandler handler);

    /// @brief Routes @p push messages into a decoder and opens the connection.
    ///
    /// @p lifecycle's onConnect/onDisconnect/onError are forwarded; its
    /// onMessage is ignored.
    /// @return kInvalidState if @p push is already attached, or the open error.
    [[nodiscard]] core::ExpectedVoid attach(transport::PushTransport& push,
                                            transport::PushCallbacks lifecycle = {});

    /// @brief Opens @p stream if needed and starts its read loop.
    /// @return kInvalidState if @p stream is already attached.
    [[nodiscard]] core::ExpectedVoid attach(transport::IByteStream& stream);

    /// @brief Stops the decoder bound to @p transport, then closes it.
    ///
    /// May be called from a subscriber.  On a byte stream's own read loop
    /// the loop closes the stream as it exits, and the decoder is released
    /// by the next attach or detach call (or by the destructor); keep the
    /// stream alive until then.
    /// @return kInvalidArgument if @p transport is not attached.
    [[nodiscard]] core::ExpectedVoid detach(transport::ITransport& transport);

    /// @brief Detaches every transport; returns how many were detached.
    core::usize detachAll();

    [[nodiscard]] bool attached(const transport::ITransport& transport) const;

    /// @brief Statistics of the decoder bound to @p transport.
    [[nodiscard]] core::Expected<DecoderStats> stats(const transport::ITransport& transport) const;

    [[nodiscard]] SubscriptionRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const IngestConfig& config() const noexcept { return config_; }

private:
    /// Push callbacks hold the decoder weakly, so a detach issued from
    /// onMessage frees it only once the message has been handled.
    struct Binding
    {
        transport::ITransport*         transport;
        std::shared_ptr<StreamDecoder> decoder;
    };

    [[nodiscard]] std::shared_ptr<StreamDecoder> makeDecoder(bool acceptEnvelopes,
                                                             std::string identity);
    [[nodiscard]] bool isBound(const transport::ITransport& transport) const;
    core::ExpectedVoid teardown(Binding& binding);
    void reapRetired();

    IngestConfig          config_;
    SubscriptionRegistry  registry_;
    ErrorHandler          errorHandler_;

    mutable std::mutex    mutex_;
    std::vector<Binding>  bindings_;
    /// Decoders detached from their own read loop, waiting for it to exit.
    std::vector<std::shared_ptr<StreamDecoder>> retired_;
};

} // namespace seis::stream
