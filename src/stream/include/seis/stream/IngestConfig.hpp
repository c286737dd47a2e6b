// /////////////////////////////////////////////////////////////////////////////
/// @file IngestConfig.hpp
/// @brief Ingestion configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the tuneable parameters of the decode pipeline and of both
/// transports.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/stream/StreamDecoder.hpp>
#include <seis/transport/PushTransport.hpp>
#include <seis/transport/SerialPort.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/Log.hpp>
#include <seis/core/Types.hpp>

#include <chrono>
#include <string>

namespace seis::stream {

/// @brief Immutable ingestion configuration.
class IngestConfig
{
public:
    /// @brief Fluent builder for IngestConfig.
    class Builder
    {
    public:
        Builder& sampleStep(core::Clock::duration step) noexcept;
        Builder& maxLineLength(core::usize bytes) noexcept;
        Builder& queueCapacity(core::usize batches) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;
        Builder& source(std::string identity);
        /// @brief Whether push messages may carry JSON envelopes (default true).
        Builder& acceptEnvelopes(bool accept) noexcept;

        Builder& serialPort(std::string path);
        Builder& baudRate(core::u32 baud) noexcept;
        Builder& dataBits(core::u8 bits) noexcept;
        Builder& stopBits(core::u8 bits) noexcept;
        Builder& parity(transport::Parity parity) noexcept;
        Builder& flowControl(transport::FlowControl flow) noexcept;
        Builder& lineStates(bool rts, bool dtr) noexcept;
        Builder& readTimeout(std::chrono::milliseconds timeout) noexcept;

        Builder& pushHost(std::string host);
        Builder& pushPort(core::u16 port) noexcept;
        Builder& connectTimeout(std::chrono::milliseconds timeout) noexcept;

        /// @return kInvalidArgument for a zero step, line length or capacity.
        [[nodiscard]] core::Expected<IngestConfig> build() const;

    private:
        core::Clock::duration    sampleStep_{core::kDefaultSampleStep};
        core::usize              maxLineLength_{core::kMaxLineLength};
        core::usize              queueCapacity_{core::kDefaultQueueCapacity};
        core::LogLevel           logLevel_{core::LogLevel::kInfo};
        std::string              source_;
        bool                     acceptEnvelopes_{true};
        transport::SerialConfig  serial_;
        transport::PushConfig    push_;
    };

    [[nodiscard]] core::Clock::duration sampleStep()    const noexcept { return sampleStep_; }
    [[nodiscard]] core::usize           maxLineLength() const noexcept { return maxLineLength_; }
    [[nodiscard]] core::usize           queueCapacity() const noexcept { return queueCapacity_; }
    [[nodiscard]] core::LogLevel        logLevel()      const noexcept { return logLevel_; }
    [[nodiscard]] const std::string&    source()        const noexcept { return source_; }
    [[nodiscard]] bool                  acceptEnvelopes() const noexcept { return acceptEnvelopes_; }

    [[nodiscard]] const transport::SerialConfig& serial() const noexcept { return serial_; }
    [[nodiscard]] const transport::PushConfig&   push()   const noexcept { return push_; }

    /// @brief Decoder settings for a transport.
    /// @param carriesEnvelopes false for serial lines, which never carry them.
    [[nodiscard]] StreamDecoderConfig decoderConfig(bool carriesEnvelopes,
                                                    std::string transportIdentity) const;

private:
    IngestConfig() = default;

    core::Clock::duration    sampleStep_{core::kDefaultSampleStep};
    core::usize              maxLineLength_{core::kMaxLineLength};
    core::usize              queueCapacity_{core::kDefaultQueueCapacity};
    core::LogLevel           logLevel_{core::LogLevel::kInfo};
    std::string              source_;
    bool                     acceptEnvelopes_{true};
    transport::SerialConfig  serial_;
    transport::PushConfig    push_;
};

} // namespace seis::stream
