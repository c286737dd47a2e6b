// /////////////////////////////////////////////////////////////////////////////
/// @file SerialTransport.hpp
/// @brief Byte-stream transport over a local serial line.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/transport/IByteStream.hpp>
#include <seis/transport/SerialPort.hpp>
#include <seis/core/NonCopyable.hpp>

#include <memory>

namespace seis::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @class SerialTransport
/// @brief Exclusive serial port exposed as sanitized text chunks.
///
/// Inbound bytes go through a TextSanitizer, so read() never returns an
/// invalid UTF-8 sequence or a stray control character.  Outbound units
/// are written verbatim; the device protocol decides on line endings.
///
/// Thread model: one reader (holding the lease) and any number of writers
/// may run concurrently; writes are serialized internally.
// /////////////////////////////////////////////////////////////////////////////
class SerialTransport final : public IByteStream,
                              public core::NonCopyable<SerialTransport>
{
public:
    explicit SerialTransport(SerialConfig config);
    ~SerialTransport() override;

    [[nodiscard]] core::ExpectedVoid open() override;

    /// @return kReaderLocked while a read loop still holds the port.
    [[nodiscard]] core::ExpectedVoid close() override;

    [[nodiscard]] core::ExpectedVoid write(std::string_view unit) override;
    [[nodiscard]] core::Expected<ReadChunk> read() override;

    [[nodiscard]] TransportState state() const noexcept override;
    [[nodiscard]] std::string identity() const override;
    [[nodiscard]] const char* name() const noexcept override;

    /// @brief Drives RTS/DTR on the open port.
    [[nodiscard]] core::ExpectedVoid setSignals(const SignalRequest& request);

    /// @brief Reads the modem line levels of the open port.
    [[nodiscard]] core::Expected<SignalState> getSignals() const;

    [[nodiscard]] const SerialConfig& config() const noexcept;

protected:
    [[nodiscard]] core::ExpectedVoid lockReader() override;
    void unlockReader() noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace seis::transport
