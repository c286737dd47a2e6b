/**
 * @file SerialPortPosix.cpp
 * @brief POSIX implementation of the SerialPort abstraction.
 * @author MasterLaplace
 *
 * Uses termios for configuration, O_RDWR | O_NOCTTY for opening,
 * TIOCEXCL for exclusive access and TIOCMGET/TIOCMSET for modem lines.
 */

#include <seis/transport/SerialPort.hpp>
#include <seis/core/Log.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace seis::transport {

namespace {

constexpr std::string_view kTag = "SERIAL";

std::string errnoMessage(const char *what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

/// Modem-line ioctls fail with ENOTTY/EINVAL on lines without them.
core::ErrorCode modemLineError(core::ErrorCode fallback)
{
    return (errno == ENOTTY || errno == EINVAL) ? core::ErrorCode::kNotSupported : fallback;
}

core::Expected<speed_t> toSpeed(core::u32 baudRate)
{
    switch (baudRate) {
        case 1200:   return B1200;
        case 2400:   return B2400;
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
        default:
            return core::makeError(core::ErrorCode::kNotSupported,
                "unsupported baud rate " + std::to_string(baudRate));
    }
}

core::Expected<tcflag_t> toCharSize(core::u8 dataBits)
{
    switch (dataBits) {
        case 5: return CS5;
        case 6: return CS6;
        case 7: return CS7;
        case 8: return CS8;
        default:
            return core::makeError(core::ErrorCode::kNotSupported,
                "unsupported data bits " + std::to_string(dataBits));
    }
}

} // namespace

struct SerialPort::Impl {
    int fd = -1;
    std::string path;
};

SerialPort::SerialPort()
    : _impl(std::make_unique<Impl>())
{
}

SerialPort::~SerialPort()
{
    close();
}

SerialPort::SerialPort(SerialPort &&other) noexcept = default;

SerialPort &SerialPort::operator=(SerialPort &&other) noexcept
{
    if (this == &other) {
        return *this;
    }
    close();
    _impl = std::move(other._impl);
    return *this;
}

core::ExpectedVoid SerialPort::open(const SerialConfig &config)
{
    if (!_impl) {
        _impl = std::make_unique<Impl>();
    }
    if (_impl->fd >= 0) {
        return core::makeError(core::ErrorCode::kInvalidState,
            "serial port already open: " + _impl->path);
    }
    if (config.portPath.empty()) {
        return core::makeError(core::ErrorCode::kInvalidArgument, "empty serial port path");
    }

    const auto speed = SEIS_TRY(toSpeed(config.baudRate));
    const auto charSize = SEIS_TRY(toCharSize(config.dataBits));
    if (config.stopBits != 1 && config.stopBits != 2) {
        return core::makeError(core::ErrorCode::kNotSupported,
            "unsupported stop bits " + std::to_string(config.stopBits));
    }

    const int fd = ::open(config.portPath.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        const auto code = (errno == ENOENT) ? core::ErrorCode::kDeviceNotFound
                                            : core::ErrorCode::kDeviceOpenFailed;
        return core::makeError(code, config.portPath + ": " + std::strerror(errno));
    }

    auto fail = [fd](core::ErrorCode code, std::string message) {
        ::close(fd);
        return core::makeError(code, std::move(message));
    };

    if (::ioctl(fd, TIOCEXCL, nullptr) < 0) {
        return fail(core::ErrorCode::kDeviceOpenFailed,
            "failed to set exclusive access on " + config.portPath);
    }

    struct termios tty{};
    if (::tcgetattr(fd, &tty) != 0) {
        return fail(core::ErrorCode::kDeviceConfigFailed, errnoMessage("tcgetattr"));
    }

    ::cfmakeraw(&tty);

    tty.c_cflag &= ~CSIZE;
    tty.c_cflag |= charSize;

    tty.c_cflag &= ~(PARENB | PARODD);
    if (config.parity == Parity::kEven) {
        tty.c_cflag |= PARENB;
    } else if (config.parity == Parity::kOdd) {
        tty.c_cflag |= PARENB | PARODD;
    }

    if (config.stopBits == 2) {
        tty.c_cflag |= CSTOPB;
    } else {
        tty.c_cflag &= ~CSTOPB;
    }

    if (config.flowControl == FlowControl::kHardware) {
        tty.c_cflag |= CRTSCTS;
    } else {
        tty.c_cflag &= ~CRTSCTS;
        // Keep DTR asserted on close so attached boards do not reset.
        tty.c_cflag &= ~HUPCL;
    }
    tty.c_cflag |= CREAD | CLOCAL;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);

    // Reads are gated by poll(); never block inside read() itself.
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    ::cfsetispeed(&tty, speed);
    ::cfsetospeed(&tty, speed);

    if (::tcsetattr(fd, TCSANOW, &tty) != 0) {
        return fail(core::ErrorCode::kDeviceConfigFailed, errnoMessage("tcsetattr"));
    }
    ::tcflush(fd, TCIFLUSH);

    _impl->fd = fd;
    _impl->path = config.portPath;

    auto lines = setSignals({.rts = config.rtsLineState, .dtr = config.dtrLineState});
    if (!lines) {
        core::Log::warn(kTag, "could not set RTS/DTR on " + config.portPath + ": " +
                              lines.error().message());
    }

    return {};
}

core::Expected<ReadResult> SerialPort::read(std::span<core::u8> buffer,
                                            std::chrono::milliseconds timeout)
{
    if (!isOpen()) {
        return core::makeError(core::ErrorCode::kDeviceClosed, "serial port not open");
    }

    pollfd pfd{};
    pfd.fd = _impl->fd;
    pfd.events = POLLIN;

    const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR) {
            return ReadResult{};
        }
        return core::makeError(core::ErrorCode::kDeviceReadFailed, errnoMessage("poll"));
    }
    if (ready == 0) {
        return ReadResult{};
    }

    if (pfd.revents & POLLIN) {
        const auto n = ::read(_impl->fd, buffer.data(), buffer.size());
        if (n > 0) {
            return ReadResult{static_cast<core::usize>(n), false};
        }
        if (n == 0 || errno == EIO) {
            return ReadResult{0, true};
        }
        if (errno == EAGAIN || errno == EINTR) {
            return ReadResult{};
        }
        return core::makeError(core::ErrorCode::kDeviceReadFailed, errnoMessage("read"));
    }

    if (pfd.revents & (POLLHUP | POLLERR)) {
        return ReadResult{0, true};
    }
    if (pfd.revents & POLLNVAL) {
        return core::makeError(core::ErrorCode::kDeviceClosed, "serial descriptor no longer valid");
    }
    return ReadResult{};
}

core::Expected<core::usize> SerialPort::write(std::span<const core::u8> data)
{
    if (!isOpen()) {
        return core::makeError(core::ErrorCode::kDeviceClosed, "serial port not open");
    }

    core::usize written = 0;
    while (written < data.size()) {
        const auto n = ::write(_impl->fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                pollfd pfd{_impl->fd, POLLOUT, 0};
                if (::poll(&pfd, 1, 10) < 0 && errno != EINTR) {
                    return core::makeError(core::ErrorCode::kDeviceWriteFailed, errnoMessage("poll"));
                }
                continue;
            }
            return core::makeError(core::ErrorCode::kDeviceWriteFailed, errnoMessage("write"));
        }
        written += static_cast<core::usize>(n);
    }

    if (::tcdrain(_impl->fd) != 0 && errno != ENOTTY && errno != EINVAL) {
        return core::makeError(core::ErrorCode::kDeviceWriteFailed, errnoMessage("tcdrain"));
    }

    return written;
}

core::ExpectedVoid SerialPort::setSignals(const SignalRequest &request)
{
    if (!isOpen()) {
        return core::makeError(core::ErrorCode::kDeviceClosed, "serial port not open");
    }

    int status = 0;
    if (::ioctl(_impl->fd, TIOCMGET, &status) < 0) {
        return core::makeError(modemLineError(core::ErrorCode::kDeviceConfigFailed),
            errnoMessage("TIOCMGET"));
    }
    if (request.rts) {
        status = *request.rts ? (status | TIOCM_RTS) : (status & ~TIOCM_RTS);
    }
    if (request.dtr) {
        status = *request.dtr ? (status | TIOCM_DTR) : (status & ~TIOCM_DTR);
    }
    if (::ioctl(_impl->fd, TIOCMSET, &status) < 0) {
        return core::makeError(modemLineError(core::ErrorCode::kDeviceConfigFailed),
            errnoMessage("TIOCMSET"));
    }
    return {};
}

core::Expected<SignalState> SerialPort::getSignals() const
{
    if (!isOpen()) {
        return core::makeError(core::ErrorCode::kDeviceClosed, "serial port not open");
    }

    int status = 0;
    if (::ioctl(_impl->fd, TIOCMGET, &status) < 0) {
        return core::makeError(modemLineError(core::ErrorCode::kDeviceReadFailed),
            errnoMessage("TIOCMGET"));
    }

    SignalState state;
    state.rts = (status & TIOCM_RTS) != 0;
    state.dtr = (status & TIOCM_DTR) != 0;
    state.cts = (status & TIOCM_CTS) != 0;
    state.dsr = (status & TIOCM_DSR) != 0;
    state.dcd = (status & TIOCM_CAR) != 0;
    state.ri = (status & TIOCM_RNG) != 0;
    return state;
}

void SerialPort::close() noexcept
{
    if (_impl && _impl->fd >= 0) {
        ::close(_impl->fd);
        _impl->fd = -1;
    }
}

bool SerialPort::isOpen() const noexcept
{
    return _impl && _impl->fd >= 0;
}

} // namespace seis::transport
