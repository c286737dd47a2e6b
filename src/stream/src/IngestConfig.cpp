// /////////////////////////////////////////////////////////////////////////////
/// @file IngestConfig.cpp
/// @brief IngestConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/stream/IngestConfig.hpp>

namespace seis::stream {

IngestConfig::Builder& IngestConfig::Builder::sampleStep(core::Clock::duration step) noexcept
{
    sampleStep_ = step;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::maxLineLength(core::usize bytes) noexcept
{
    maxLineLength_ = bytes;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::queueCapacity(core::usize batches) noexcept
{
    queueCapacity_ = batches;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::source(std::string identity)
{
    source_ = std::move(identity);
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::acceptEnvelopes(bool accept) noexcept
{
    acceptEnvelopes_ = accept;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::serialPort(std::string path)
{
    serial_.portPath = std::move(path);
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::baudRate(core::u32 baud) noexcept
{
    serial_.baudRate = baud;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::dataBits(core::u8 bits) noexcept
{
    serial_.dataBits = bits;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::stopBits(core::u8 bits) noexcept
{
    serial_.stopBits = bits;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::parity(transport::Parity parity) noexcept
{
    serial_.parity = parity;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::flowControl(transport::FlowControl flow) noexcept
{
    serial_.flowControl = flow;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::lineStates(bool rts, bool dtr) noexcept
{
    serial_.rtsLineState = rts;
    serial_.dtrLineState = dtr;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::readTimeout(std::chrono::milliseconds timeout) noexcept
{
    serial_.readTimeout = timeout;
    push_.pollInterval  = timeout;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::pushHost(std::string host)
{
    push_.host = std::move(host);
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::pushPort(core::u16 port) noexcept
{
    push_.port = port;
    return *this;
}

IngestConfig::Builder& IngestConfig::Builder::connectTimeout(std::chrono::milliseconds timeout) noexcept
{
    push_.connectTimeout = timeout;
    return *this;
}

core::Expected<IngestConfig> IngestConfig::Builder::build() const
{
    if (sampleStep_ <= core::Clock::duration::zero())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "sample step must be positive");
    }
    if (maxLineLength_ == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "max line length must be positive");
    }
    if (queueCapacity_ == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "queue capacity must be positive");
    }

    IngestConfig cfg;
    cfg.sampleStep_    = sampleStep_;
    cfg.maxLineLength_ = maxLineLength_;
    cfg.queueCapacity_ = queueCapacity_;
    cfg.logLevel_      = logLevel_;
    cfg.source_        = source_;
    cfg.acceptEnvelopes_ = acceptEnvelopes_;
    cfg.serial_        = serial_;
    cfg.push_          = push_;
    cfg.push_.maxMessageLength = maxLineLength_;
    return cfg;
}

StreamDecoderConfig IngestConfig::decoderConfig(bool carriesEnvelopes,
                                                std::string transportIdentity) const
{
    StreamDecoderConfig config;
    config.source          = source_.empty() ? std::move(transportIdentity) : source_;
    config.sampleStep      = sampleStep_;
    config.maxLineLength   = maxLineLength_;
    config.acceptEnvelopes = carriesEnvelopes && acceptEnvelopes_;
    return config;
}

} // namespace seis::stream
