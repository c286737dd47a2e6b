/**
 * @file SerialPort.hpp
 * @brief RAII POSIX serial port handle.
 * @author MasterLaplace
 *
 * Thin termios wrapper: exclusive open, 8N1-style framing parameters,
 * modem-line control and poll()-based reads with a timeout.
 * All operations return Expected<> for structured error handling.
 *
 * @see SerialTransport
 */

#pragma once

#include <seis/core/Constants.hpp>
#include <seis/core/Expected.hpp>
#include <seis/core/Types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <span>
#include <string>

namespace seis::transport {

enum class Parity : core::u8 {
    kNone = 0,
    kEven,
    kOdd
};

enum class FlowControl : core::u8 {
    kNone = 0,
    kHardware
};

/**
 * @brief Configuration parameters for opening a serial port.
 *
 * RTS and DTR are driven to the requested level once after opening;
 * many boards reset when DTR toggles.
 */
struct SerialConfig {
    std::string portPath;
    core::u32 baudRate = core::kDefaultBaudRate;
    core::u8 dataBits = 8;
    core::u8 stopBits = 1;
    Parity parity = Parity::kNone;
    FlowControl flowControl = FlowControl::kNone;
    bool rtsLineState = true;
    bool dtrLineState = true;
    std::chrono::milliseconds readTimeout = core::kDefaultReadTimeout;
};

/**
 * @brief Output modem lines to change; unset fields are left alone.
 */
struct SignalRequest {
    std::optional<bool> rts;
    std::optional<bool> dtr;
};

/**
 * @brief Snapshot of the modem lines.
 */
struct SignalState {
    bool rts = false;
    bool dtr = false;
    bool cts = false;
    bool dsr = false;
    bool dcd = false;
    bool ri = false;
};

/**
 * @brief Result of a single read call.
 */
struct ReadResult {
    core::usize bytes = 0;
    /// The other end hung up (pty master closed, USB device unplugged).
    bool hangup = false;
};

/**
 * @brief RAII serial port handle.
 *
 * The destructor closes the port.  Move-only semantics ensure exclusive
 * ownership of the file descriptor.  Not internally synchronized: one
 * thread may read while another writes, but open() and close() must not
 * race with either.
 *
 * @code
 *   SerialPort port;
 *   auto result = port.open({.portPath = "/dev/ttyUSB0"});
 *   if (result) {
 *       std::array<core::u8, 256> buf;
 *       auto chunk = port.read(buf, std::chrono::milliseconds{100});
 *   }
 * @endcode
 */
class SerialPort {
public:
    SerialPort();
    ~SerialPort();

    SerialPort(const SerialPort &) = delete;
    SerialPort &operator=(const SerialPort &) = delete;
    SerialPort(SerialPort &&other) noexcept;
    SerialPort &operator=(SerialPort &&other) noexcept;

    /**
     * @brief Opens and configures the serial port.
     *
     * @param config Port path, baud rate and framing parameters
     * @return void on success; kNotSupported for a framing option the
     *         line discipline cannot express, kDeviceNotFound,
     *         kDeviceOpenFailed or kDeviceConfigFailed otherwise
     */
    [[nodiscard]] core::ExpectedVoid open(const SerialConfig &config);

    /**
     * @brief Waits up to @p timeout for input, then reads what is available.
     *
     * @param buffer  Destination buffer
     * @param timeout Maximum wait; zero bytes are returned when it elapses
     */
    [[nodiscard]] core::Expected<ReadResult> read(std::span<core::u8> buffer,
                                                  std::chrono::milliseconds timeout);

    /**
     * @brief Writes all of @p data and waits until it has been transmitted.
     *
     * @return Number of bytes written, or an Error
     */
    [[nodiscard]] core::Expected<core::usize> write(std::span<const core::u8> data);

    /**
     * @brief Drives the RTS/DTR output lines.
     */
    [[nodiscard]] core::ExpectedVoid setSignals(const SignalRequest &request);

    /**
     * @brief Reads the current modem line levels.
     */
    [[nodiscard]] core::Expected<SignalState> getSignals() const;

    /**
     * @brief Closes the serial port (idempotent).
     */
    void close() noexcept;

    [[nodiscard]] bool isOpen() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace seis::transport
