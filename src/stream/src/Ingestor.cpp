// /////////////////////////////////////////////////////////////////////////////
/// @file Ingestor.cpp
/// @brief Ingestor implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/stream/Ingestor.hpp>
#include <seis/core/Log.hpp>

#include <algorithm>
#include <iterator>

namespace seis::stream {

namespace {

constexpr std::string_view kTag = "STREAM";

} // namespace

Ingestor::Ingestor(IngestConfig config)
    : config_{std::move(config)}
{}

Ingestor::~Ingestor()
{
    detachAll();
}

core::Expected<SubscriptionId> Ingestor::subscribe(Subscriber callback)
{
    return registry_.subscribe(std::move(callback));
}

core::ExpectedVoid Ingestor::unsubscribe(SubscriptionId id)
{
    return registry_.unsubscribe(id);
}

core::usize Ingestor::unsubscribeAll()
{
    return registry_.clear();
}

void Ingestor::setErrorHandler(ErrorHandler handler)
{
    std::lock_guard lock{mutex_};
    errorHandler_ = std::move(handler);
}

core::ExpectedVoid Ingestor::attach(transport::PushTransport& push,
                                    transport::PushCallbacks lifecycle)
{
    reapRetired();

    {
        std::lock_guard lock{mutex_};
        if (isBound(push))
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   push.identity() + " is already attached");
        }

        auto decoder = makeDecoder(true, push.identity());
        ErrorHandler handler = errorHandler_;

        transport::PushCallbacks callbacks;
        callbacks.onConnect    = std::move(lifecycle.onConnect);
        callbacks.onDisconnect = std::move(lifecycle.onDisconnect);
        callbacks.onError = [forward = std::move(lifecycle.onError), handler](const core::Error& error) {
            if (forward)
            {
                forward(error);
            }
            if (handler)
            {
                handler(error);
            }
        };
        callbacks.onMessage = [weak = std::weak_ptr<StreamDecoder>{decoder}](std::string_view message) {
            // Expired once detached; the transport may outlive its binding.
            if (auto live = weak.lock())
            {
                live->handleUnit(message);
            }
        };
        SEIS_TRY_VOID(push.setCallbacks(std::move(callbacks)));

        bindings_.push_back(Binding{&push, std::move(decoder)});
    }

    // Opened outside the lock: onConnect runs on this thread.
    if (auto opened = push.open(); !opened)
    {
        std::lock_guard lock{mutex_};
        std::erase_if(bindings_, [&push](const Binding& b) { return b.transport == &push; });
        return opened;
    }

    core::Log::info(kTag, "attached " + push.identity());
    return {};
}

core::ExpectedVoid Ingestor::attach(transport::IByteStream& stream)
{
    reapRetired();

    std::lock_guard lock{mutex_};
    if (isBound(stream))
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               stream.identity() + " is already attached");
    }

    bool openedHere = false;
    switch (stream.state())
    {
        case transport::TransportState::kOpen:
            break;
        case transport::TransportState::kClosed:
            SEIS_TRY_VOID(stream.open());
            openedHere = true;
            break;
        case transport::TransportState::kFaulted:
            return core::makeError(core::ErrorCode::kInvalidState,
                                   stream.identity() + " is faulted; close it first");
    }

    auto decoder = makeDecoder(false, stream.identity());
    if (auto started = decoder->start(stream); !started)
    {
        if (openedHere)
        {
            if (auto closed = stream.close(); !closed)
            {
                core::Log::warn(kTag, "close after failed attach: " + closed.error().format());
            }
        }
        return started;
    }

    bindings_.push_back(Binding{&stream, std::move(decoder)});
    core::Log::info(kTag, "attached " + stream.identity());
    return {};
}

core::ExpectedVoid Ingestor::detach(transport::ITransport& transport)
{
    reapRetired();

    Binding binding{nullptr, nullptr};
    {
        std::lock_guard lock{mutex_};
        auto it = std::find_if(bindings_.begin(), bindings_.end(),
                               [&transport](const Binding& b) { return b.transport == &transport; });
        if (it == bindings_.end())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   transport.identity() + " is not attached");
        }
        binding = std::move(*it);
        bindings_.erase(it);
    }

    SEIS_TRY_VOID(teardown(binding));
    core::Log::info(kTag, "detached " + transport.identity());
    return {};
}

core::usize Ingestor::detachAll()
{
    reapRetired();

    std::vector<Binding> bindings;
    {
        std::lock_guard lock{mutex_};
        bindings.swap(bindings_);
    }

    for (auto& binding : bindings)
    {
        if (auto done = teardown(binding); !done)
        {
            core::Log::warn(kTag, "detach " + binding.transport->identity() + ": " +
                                  done.error().format());
        }
    }
    return bindings.size();
}

bool Ingestor::attached(const transport::ITransport& transport) const
{
    std::lock_guard lock{mutex_};
    return isBound(transport);
}

core::Expected<DecoderStats> Ingestor::stats(const transport::ITransport& transport) const
{
    std::lock_guard lock{mutex_};
    for (const auto& binding : bindings_)
    {
        if (binding.transport == &transport)
        {
            return binding.decoder->stats();
        }
    }
    return core::makeError(core::ErrorCode::kInvalidArgument,
                           transport.identity() + " is not attached");
}

std::shared_ptr<StreamDecoder> Ingestor::makeDecoder(bool acceptEnvelopes, std::string identity)
{
    auto decoder = std::make_shared<StreamDecoder>(
        registry_, config_.decoderConfig(acceptEnvelopes, std::move(identity)));
    decoder->setErrorHandler(errorHandler_);
    return decoder;
}

bool Ingestor::isBound(const transport::ITransport& transport) const
{
    return std::any_of(bindings_.begin(), bindings_.end(),
                       [&transport](const Binding& b) { return b.transport == &transport; });
}

core::ExpectedVoid Ingestor::teardown(Binding& binding)
{
    if (binding.decoder->onLoopThread())
    {
        // A subscriber detaching its own stream: the loop still holds the
        // reader and cannot join itself.
        binding.decoder->closeStreamOnExit();
        binding.decoder->cancel();
        std::lock_guard lock{mutex_};
        retired_.push_back(std::move(binding.decoder));
        return {};
    }

    // The read loop holds the reader; it must let go before close().
    binding.decoder->cancel();
    if (binding.transport->state() != transport::TransportState::kClosed)
    {
        SEIS_TRY_VOID(binding.transport->close());
    }
    binding.decoder.reset();
    return {};
}

void Ingestor::reapRetired()
{
    std::vector<std::shared_ptr<StreamDecoder>> finished;
    {
        std::lock_guard lock{mutex_};
        const auto own = std::stable_partition(retired_.begin(), retired_.end(),
                                               [](const auto& d) { return d->onLoopThread(); });
        finished.assign(std::make_move_iterator(own), std::make_move_iterator(retired_.end()));
        retired_.erase(own, retired_.end());
    }
    // Destroying them joins loops that have exited or are about to.
}

} // namespace seis::stream
