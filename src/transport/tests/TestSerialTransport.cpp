// /////////////////////////////////////////////////////////////////////////////
/// @file TestSerialTransport.cpp
/// @brief SerialPort / SerialTransport tests against a pseudo-terminal.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include <seis/transport/SerialTransport.hpp>

#ifdef __unix__

#include <pty.h>
#include <unistd.h>

#include <array>
#include <chrono>
#include <string>

using namespace seis;
using namespace seis::transport;

namespace {

/// Master/slave pair closed on scope exit.
struct PtyPair
{
    int  master{-1};
    int  slave{-1};
    char name[128]{};

    PtyPair()
    {
        REQUIRE(::openpty(&master, &slave, name, nullptr, nullptr) == 0);
    }

    ~PtyPair()
    {
        closeMaster();
        if (slave >= 0)
            ::close(slave);
    }

    void closeMaster()
    {
        if (master >= 0)
        {
            ::close(master);
            master = -1;
        }
    }

    void send(std::string_view text) const
    {
        REQUIRE(::write(master, text.data(), text.size()) == static_cast<ssize_t>(text.size()));
    }
};

SerialConfig configFor(const PtyPair& pty)
{
    SerialConfig config;
    config.portPath    = pty.name;
    config.readTimeout = std::chrono::milliseconds{50};
    return config;
}

/// Reads until @p expected bytes of text arrived or end of stream.
std::string readText(SerialTransport& transport, std::size_t expected)
{
    std::string text;
    for (int attempt = 0; attempt < 40 && text.size() < expected; ++attempt)
    {
        auto chunk = transport.read();
        REQUIRE(chunk.has_value());
        text += chunk->text;
        if (chunk->endOfStream)
            break;
    }
    return text;
}

} // namespace

TEST_CASE("SerialTransport: open, read, write, close", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};

    REQUIRE(transport.open().has_value());
    CHECK(transport.state() == TransportState::kOpen);
    CHECK(transport.identity() == std::string("serial:") + pty.name);

    {
        auto lease = transport.acquireReader();
        REQUIRE(lease.has_value());

        pty.send("X1.0,2.0\n");
        CHECK(readText(transport, 9) == "X1.0,2.0\n");

        pty.send("T25\xFF\x01H60\n");
        CHECK(readText(transport, 8) == "T25?H60\n");
    }

    REQUIRE(transport.write("PING\n").has_value());
    std::array<char, 16> buffer{};
    const auto n = ::read(pty.master, buffer.data(), buffer.size());
    REQUIRE(n == 5);
    CHECK(std::string(buffer.data(), static_cast<std::size_t>(n)) == "PING\n");

    REQUIRE(transport.close().has_value());
    CHECK(transport.state() == TransportState::kClosed);
}

TEST_CASE("SerialTransport: single reader and close ordering", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};
    REQUIRE(transport.open().has_value());

    auto first = transport.acquireReader();
    REQUIRE(first.has_value());

    auto second = transport.acquireReader();
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code() == core::ErrorCode::kReaderLocked);

    auto refused = transport.close();
    REQUIRE_FALSE(refused.has_value());
    CHECK(refused.error().code() == core::ErrorCode::kReaderLocked);
    CHECK(transport.state() == TransportState::kOpen);

    first->release();
    first->release();
    CHECK_FALSE(first->held());

    REQUIRE(transport.close().has_value());

    auto again = transport.close();
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code() == core::ErrorCode::kInvalidState);
}

TEST_CASE("SerialTransport: read requires a lease", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};
    REQUIRE(transport.open().has_value());

    auto chunk = transport.read();
    REQUIRE_FALSE(chunk.has_value());
    CHECK(chunk.error().code() == core::ErrorCode::kInvalidState);

    REQUIRE(transport.close().has_value());
}

TEST_CASE("SerialTransport: idle read times out with an empty chunk", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};
    REQUIRE(transport.open().has_value());
    auto lease = transport.acquireReader();
    REQUIRE(lease.has_value());

    auto chunk = transport.read();
    REQUIRE(chunk.has_value());
    CHECK(chunk->text.empty());
    CHECK_FALSE(chunk->endOfStream);
}

TEST_CASE("SerialTransport: device hang-up ends the stream", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};
    REQUIRE(transport.open().has_value());
    auto lease = transport.acquireReader();
    REQUIRE(lease.has_value());

    pty.closeMaster();

    bool ended = false;
    for (int attempt = 0; attempt < 40 && !ended; ++attempt)
    {
        auto chunk = transport.read();
        REQUIRE(chunk.has_value());
        ended = chunk->endOfStream;
    }
    CHECK(ended);
    CHECK(transport.state() == TransportState::kFaulted);

    lease->release();
    CHECK(transport.close().has_value());
}

TEST_CASE("SerialTransport: open failures", "[transport][serial]")
{
    SECTION("missing device")
    {
        SerialConfig config;
        config.portPath = "/nonexistent/ttySEIS0";
        SerialTransport transport{config};

        auto result = transport.open();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == core::ErrorCode::kDeviceNotFound);
        CHECK(transport.state() == TransportState::kClosed);
        CHECK_FALSE(transport.write("x").has_value());
    }

    SECTION("unsupported framing")
    {
        PtyPair pty;

        auto baud = configFor(pty);
        baud.baudRate = 12345;
        auto badBaud = SerialTransport{baud}.open();
        REQUIRE_FALSE(badBaud.has_value());
        CHECK(badBaud.error().code() == core::ErrorCode::kNotSupported);

        auto bits = configFor(pty);
        bits.dataBits = 9;
        auto badBits = SerialTransport{bits}.open();
        REQUIRE_FALSE(badBits.has_value());
        CHECK(badBits.error().code() == core::ErrorCode::kNotSupported);

        auto stop = configFor(pty);
        stop.stopBits = 3;
        auto badStop = SerialTransport{stop}.open();
        REQUIRE_FALSE(badStop.has_value());
        CHECK(badStop.error().code() == core::ErrorCode::kNotSupported);
    }

    SECTION("second open on the same transport")
    {
        PtyPair pty;
        SerialTransport transport{configFor(pty)};
        REQUIRE(transport.open().has_value());
        auto again = transport.open();
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code() == core::ErrorCode::kInvalidState);
    }
}

TEST_CASE("SerialTransport: modem lines need an open port", "[transport][serial]")
{
    PtyPair pty;
    SerialTransport transport{configFor(pty)};

    auto closed = transport.getSignals();
    REQUIRE_FALSE(closed.has_value());
    CHECK(closed.error().code() == core::ErrorCode::kDeviceClosed);

    REQUIRE(transport.open().has_value());
    // Pseudo-terminals may not implement modem lines.
    auto lines = transport.getSignals();
    if (!lines)
    {
        CHECK(lines.error().code() == core::ErrorCode::kNotSupported);
    }
    auto request = transport.setSignals({.rts = false, .dtr = std::nullopt});
    if (!request)
    {
        CHECK(request.error().code() == core::ErrorCode::kNotSupported);
    }
}

#endif // __unix__
