// /////////////////////////////////////////////////////////////////////////////
/// @file PushTransport.cpp
/// @brief POSIX TCP push transport implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/transport/PushTransport.hpp>
#include <seis/protocol/FrameEncoder.hpp>
#include <seis/protocol/LineAssembler.hpp>
#include <seis/core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stop_token>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace seis::transport {

namespace {

constexpr std::string_view kTag = "PUSH";

std::string errnoMessage(const char* what)
{
    return std::string(what) + ": " + std::strerror(errno);
}

/// Connects one resolved address, honouring @p timeout.
core::Expected<int> connectAddress(const addrinfo& ai, std::chrono::milliseconds timeout)
{
    const int fd = ::socket(ai.ai_family, ai.ai_socktype | SOCK_CLOEXEC, ai.ai_protocol);
    if (fd < 0)
    {
        return core::makeError(core::ErrorCode::kIoError, errnoMessage("socket"));
    }

    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        const auto error = errnoMessage("fcntl");
        ::close(fd);
        return core::makeError(core::ErrorCode::kIoError, error);
    }

    if (::connect(fd, ai.ai_addr, ai.ai_addrlen) < 0)
    {
        if (errno != EINPROGRESS)
        {
            const auto error = errnoMessage("connect");
            ::close(fd);
            return core::makeError(core::ErrorCode::kNetworkConnectFailed, error);
        }

        pollfd pfd{fd, POLLOUT, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready <= 0)
        {
            ::close(fd);
            return core::makeError(core::ErrorCode::kTimeout, "connect timed out");
        }

        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
        {
            ::close(fd);
            return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                   std::string("connect: ") + std::strerror(soError));
        }
    }

    const int one = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) < 0)
    {
        core::Log::debug(kTag, errnoMessage("TCP_NODELAY"));
    }
    return fd;
}

core::Expected<int> connectTo(const PushConfig& config)
{
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* results = nullptr;
    const auto service = std::to_string(config.port);
    if (const int rc = ::getaddrinfo(config.host.c_str(), service.c_str(), &hints, &results); rc != 0)
    {
        return core::makeError(core::ErrorCode::kNetworkConnectFailed,
                               config.host + ": " + ::gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard{results, &::freeaddrinfo};

    core::Expected<int> last = core::makeError(core::ErrorCode::kNetworkConnectFailed,
                                               "no address for " + config.host);
    for (const addrinfo* ai = results; ai != nullptr; ai = ai->ai_next)
    {
        last = connectAddress(*ai, config.connectTimeout);
        if (last)
        {
            break;
        }
    }
    return last;
}

} // namespace

struct PushTransport::Impl
{
    PushConfig    config;
    PushCallbacks callbacks;

    mutable std::mutex          stateMutex;
    std::mutex                  writeMutex;
    std::atomic<TransportState> state{TransportState::kClosed};
    std::atomic<bool>           disconnectNotified{false};
    int                         fd{-1};
    std::jthread                worker;

    protocol::LineAssembler assembler;
    protocol::FrameEncoder  encoder;

    explicit Impl(PushConfig c)
        : config{std::move(c)}
        , assembler{config.maxMessageLength}
    {}

    [[nodiscard]] std::string endpoint() const
    {
        return config.host + ":" + std::to_string(config.port);
    }

    void notifyError(const core::Error& error)
    {
        core::Log::error(kTag, error.format());
        if (callbacks.onError)
        {
            callbacks.onError(error);
        }
    }

    void notifyDisconnect()
    {
        if (disconnectNotified.exchange(true))
        {
            return;
        }
        core::Log::info(kTag, "disconnected from " + endpoint());
        if (callbacks.onDisconnect)
        {
            callbacks.onDisconnect();
        }
    }

    void deliver(std::string_view message)
    {
        if (callbacks.onMessage)
        {
            callbacks.onMessage(message);
        }
    }

    void markFaulted()
    {
        auto expected = TransportState::kOpen;
        state.compare_exchange_strong(expected, TransportState::kFaulted);
    }

    void eventLoop(std::stop_token stopToken, int socket)
    {
        std::array<char, 4096> buffer{};
        auto reportedOverflows = assembler.overflowCount();

        while (!stopToken.stop_requested())
        {
            pollfd pfd{socket, POLLIN, 0};
            const int ready = ::poll(&pfd, 1, static_cast<int>(config.pollInterval.count()));
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                markFaulted();
                notifyError(core::Error{core::ErrorCode::kNetworkReceiveFailed, errnoMessage("poll")});
                return;
            }
            if (ready == 0 || stopToken.stop_requested())
            {
                continue;
            }

            const auto n = ::recv(socket, buffer.data(), buffer.size(), 0);
            if (n > 0)
            {
                for (const auto& line : assembler.feed(std::string_view{buffer.data(),
                                                                        static_cast<core::usize>(n)}))
                {
                    deliver(line);
                    if (stopToken.stop_requested())
                    {
                        return;
                    }
                }
                if (assembler.overflowCount() != reportedOverflows)
                {
                    reportedOverflows = assembler.overflowCount();
                    notifyError(core::Error{core::ErrorCode::kLineTooLong,
                                            "message longer than " +
                                            std::to_string(config.maxMessageLength) +
                                            " bytes discarded"});
                }
                continue;
            }

            if (n == 0)
            {
                if (auto rest = assembler.flush())
                {
                    deliver(*rest);
                }
                markFaulted();
                notifyDisconnect();
                return;
            }

            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            {
                continue;
            }
            markFaulted();
            notifyError(core::Error{core::ErrorCode::kNetworkReceiveFailed, errnoMessage("recv")});
            notifyDisconnect();
            return;
        }
    }
};

PushTransport::PushTransport(PushConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))}
{}

PushTransport::~PushTransport()
{
    if (impl_->state.load() != TransportState::kClosed)
    {
        if (auto closed = close(); !closed)
        {
            core::Log::warn(kTag, closed.error().format());
        }
    }
}

core::ExpectedVoid PushTransport::setCallbacks(PushCallbacks callbacks)
{
    std::lock_guard lock{impl_->stateMutex};
    if (impl_->state.load() != TransportState::kClosed)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "callbacks cannot change while connected");
    }
    impl_->callbacks = std::move(callbacks);
    return {};
}

core::ExpectedVoid PushTransport::open()
{
    auto connected = [this]() -> core::Expected<int> {
        std::lock_guard lock{impl_->stateMutex};
        if (impl_->state.load() != TransportState::kClosed)
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "push transport already open to " + impl_->endpoint());
        }
        if (impl_->worker.joinable())
        {
            if (impl_->worker.get_id() == std::this_thread::get_id())
            {
                return core::makeError(core::ErrorCode::kInvalidState,
                                       "cannot reopen from inside a transport callback");
            }
            impl_->worker.join();
        }

        const int fd = SEIS_TRY(connectTo(impl_->config));
        {
            std::lock_guard io{impl_->writeMutex};
            impl_->fd = fd;
        }
        impl_->assembler.reset();
        impl_->disconnectNotified.store(false);
        impl_->state.store(TransportState::kOpen);
        return fd;
    }();

    if (!connected)
    {
        if (connected.error().code() != core::ErrorCode::kInvalidState)
        {
            impl_->notifyError(connected.error());
        }
        return std::unexpected(std::move(connected.error()));
    }

    core::Log::info(kTag, "connected to " + impl_->endpoint());
    if (impl_->callbacks.onConnect)
    {
        impl_->callbacks.onConnect();
    }

    std::lock_guard lock{impl_->stateMutex};
    if (impl_->state.load() == TransportState::kOpen)
    {
        const int socket = *connected;
        impl_->worker = std::jthread([impl = impl_.get(), socket](std::stop_token st) {
            impl->eventLoop(st, socket);
        });
    }
    return {};
}

core::ExpectedVoid PushTransport::close()
{
    std::jthread worker;
    {
        std::lock_guard lock{impl_->stateMutex};
        if (impl_->state.load() == TransportState::kClosed)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "no push connection is open");
        }
        impl_->state.store(TransportState::kClosed);

        if (impl_->worker.joinable() && impl_->worker.get_id() == std::this_thread::get_id())
        {
            // Closing from a callback: the loop exits once the callback returns.
            impl_->worker.request_stop();
        }
        else
        {
            worker = std::move(impl_->worker);
        }
    }

    if (worker.joinable())
    {
        worker.request_stop();
        worker.join();
    }

    {
        std::lock_guard io{impl_->writeMutex};
        if (impl_->fd >= 0)
        {
            ::shutdown(impl_->fd, SHUT_RDWR);
            ::close(impl_->fd);
            impl_->fd = -1;
        }
    }

    impl_->notifyDisconnect();
    return {};
}

core::ExpectedVoid PushTransport::write(std::string_view unit)
{
    if (unit.find_first_of("\r\n") != std::string_view::npos)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "push message must not contain a line break");
    }

    std::lock_guard io{impl_->writeMutex};
    switch (impl_->state.load())
    {
        case TransportState::kClosed:
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "write on closed push transport");
        case TransportState::kFaulted:
            return core::makeError(core::ErrorCode::kNetworkDisconnected,
                                   "push connection to " + impl_->endpoint() + " is down");
        case TransportState::kOpen:
            break;
    }

    std::string framed;
    framed.reserve(unit.size() + 1);
    framed.append(unit);
    framed.push_back('\n');

    core::usize sent = 0;
    while (sent < framed.size())
    {
        const auto n = ::send(impl_->fd, framed.data() + sent, framed.size() - sent, MSG_NOSIGNAL);
        if (n >= 0)
        {
            sent += static_cast<core::usize>(n);
            continue;
        }
        if (errno == EINTR)
        {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK)
        {
            pollfd pfd{impl_->fd, POLLOUT, 0};
            if (::poll(&pfd, 1, static_cast<int>(impl_->config.connectTimeout.count())) > 0)
            {
                continue;
            }
            core::Error error{core::ErrorCode::kTimeout, "send to " + impl_->endpoint() + " stalled"};
            if (sent > 0)
            {
                // A partial unit is on the wire; the next one would be spliced into it.
                impl_->markFaulted();
            }
            impl_->notifyError(error);
            return std::unexpected(std::move(error));
        }

        core::Error error{core::ErrorCode::kNetworkSendFailed, errnoMessage("send")};
        impl_->markFaulted();
        impl_->notifyError(error);
        return std::unexpected(std::move(error));
    }
    return {};
}

core::ExpectedVoid PushTransport::sendEnvelope(const protocol::Sample& sample)
{
    return write(impl_->encoder.encodeEnvelope(sample));
}

TransportState PushTransport::state() const noexcept
{
    return impl_->state.load();
}

std::string PushTransport::identity() const
{
    return "push:" + impl_->endpoint();
}

const char* PushTransport::name() const noexcept
{
    return "PushTransport";
}

const PushConfig& PushTransport::config() const noexcept
{
    return impl_->config;
}

} // namespace seis::transport
