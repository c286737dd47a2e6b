// /////////////////////////////////////////////////////////////////////////////
/// @file SerialTransport.cpp
/// @brief SerialTransport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/transport/SerialTransport.hpp>
#include <seis/transport/TextSanitizer.hpp>
#include <seis/core/Log.hpp>

#include <array>
#include <atomic>
#include <mutex>

namespace seis::transport {

namespace {

constexpr std::string_view kTag = "SERIAL";

} // namespace

struct SerialTransport::Impl
{
    SerialConfig   config;
    SerialPort     port;
    TextSanitizer  sanitizer;

    mutable std::mutex          stateMutex;
    mutable std::mutex          ioMutex;
    std::atomic<TransportState> state{TransportState::kClosed};
    bool                        readerLocked{false};

    explicit Impl(SerialConfig c) : config{std::move(c)} {}
};

SerialTransport::SerialTransport(SerialConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))}
{}

SerialTransport::~SerialTransport()
{
    std::lock_guard lock{impl_->ioMutex};
    impl_->port.close();
}

core::ExpectedVoid SerialTransport::open()
{
    std::lock_guard lock{impl_->stateMutex};
    if (impl_->state.load() != TransportState::kClosed)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "serial port already open: " + impl_->config.portPath);
    }

    {
        std::lock_guard io{impl_->ioMutex};
        SEIS_TRY_VOID(impl_->port.open(impl_->config));
    }
    impl_->sanitizer.reset();
    impl_->state.store(TransportState::kOpen);

    core::Log::info(kTag, "opened " + impl_->config.portPath + " @ " +
                          std::to_string(impl_->config.baudRate) + " baud");
    return {};
}

core::ExpectedVoid SerialTransport::close()
{
    std::lock_guard lock{impl_->stateMutex};
    if (impl_->state.load() == TransportState::kClosed)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "no serial port is open");
    }
    if (impl_->readerLocked)
    {
        return core::makeError(core::ErrorCode::kReaderLocked,
                               "read loop still holds " + impl_->config.portPath +
                               "; cancel it before closing");
    }

    {
        std::lock_guard io{impl_->ioMutex};
        impl_->port.close();
    }
    impl_->state.store(TransportState::kClosed);

    core::Log::info(kTag, "closed " + impl_->config.portPath);
    return {};
}

core::ExpectedVoid SerialTransport::write(std::string_view unit)
{
    std::lock_guard io{impl_->ioMutex};
    if (impl_->state.load() != TransportState::kOpen)
    {
        return core::makeError(core::ErrorCode::kDeviceClosed,
                               "write on closed serial port " + impl_->config.portPath);
    }

    const auto* bytes = reinterpret_cast<const core::u8*>(unit.data());
    auto written = impl_->port.write(std::span<const core::u8>{bytes, unit.size()});
    if (!written)
    {
        return std::unexpected(std::move(written.error()));
    }
    return {};
}

core::Expected<ReadChunk> SerialTransport::read()
{
    if (impl_->state.load() == TransportState::kClosed)
    {
        return core::makeError(core::ErrorCode::kDeviceClosed,
                               "read on closed serial port " + impl_->config.portPath);
    }
    {
        std::lock_guard lock{impl_->stateMutex};
        if (!impl_->readerLocked)
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "read without holding the reader lease");
        }
    }

    std::array<core::u8, core::kReadChunkSize> buffer{};
    const auto result = SEIS_TRY(impl_->port.read(buffer, impl_->config.readTimeout));

    ReadChunk chunk;
    chunk.text = impl_->sanitizer.decode(std::span<const core::u8>{buffer.data(), result.bytes});
    if (result.hangup)
    {
        chunk.text += impl_->sanitizer.flush();
        chunk.endOfStream = true;
        impl_->state.store(TransportState::kFaulted);
        core::Log::warn(kTag, impl_->config.portPath + " hung up");
    }
    return chunk;
}

core::ExpectedVoid SerialTransport::setSignals(const SignalRequest& request)
{
    std::lock_guard io{impl_->ioMutex};
    return impl_->port.setSignals(request);
}

core::Expected<SignalState> SerialTransport::getSignals() const
{
    std::lock_guard io{impl_->ioMutex};
    return impl_->port.getSignals();
}

TransportState SerialTransport::state() const noexcept
{
    return impl_->state.load();
}

std::string SerialTransport::identity() const
{
    return "serial:" + impl_->config.portPath;
}

const char* SerialTransport::name() const noexcept
{
    return "SerialTransport";
}

const SerialConfig& SerialTransport::config() const noexcept
{
    return impl_->config;
}

core::ExpectedVoid SerialTransport::lockReader()
{
    std::lock_guard lock{impl_->stateMutex};
    if (impl_->state.load() != TransportState::kOpen)
    {
        return core::makeError(core::ErrorCode::kDeviceClosed,
                               "serial port " + impl_->config.portPath + " is not open");
    }
    if (impl_->readerLocked)
    {
        return core::makeError(core::ErrorCode::kReaderLocked,
                               "serial port " + impl_->config.portPath + " already has a reader");
    }
    impl_->readerLocked = true;
    return {};
}

void SerialTransport::unlockReader() noexcept
{
    std::lock_guard lock{impl_->stateMutex};
    impl_->readerLocked = false;
}

} // namespace seis::transport
