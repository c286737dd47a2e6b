// /////////////////////////////////////////////////////////////////////////////
/// @file TestStreamDecoder.cpp
/// @brief Unit tests for StreamDecoder.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>

#include "FakeByteStream.hpp"

#include <seis/stream/StreamDecoder.hpp>

#include <atomic>
#include <mutex>
#include <span>
#include <thread>
#include <vector>

using namespace seis;
using namespace seis::stream;
using namespace std::chrono_literals;

namespace {

const core::Timestamp kArrival{std::chrono::milliseconds{1'700'000'000'000}};

/// Collects every delivered sample.
struct Collector
{
    std::mutex                 mutex;
    std::vector<protocol::Sample> samples;
    std::vector<core::usize>   batchSizes;

    Subscriber subscriber()
    {
        return [this](std::span<const protocol::Sample> batch) {
            std::lock_guard lock{mutex};
            samples.insert(samples.end(), batch.begin(), batch.end());
            batchSizes.push_back(batch.size());
        };
    }

    core::usize count()
    {
        std::lock_guard lock{mutex};
        return samples.size();
    }
};

struct ErrorLog
{
    std::mutex                   mutex;
    std::vector<core::ErrorCode> codes;

    ErrorHandler handler()
    {
        return [this](const core::Error& error) {
            std::lock_guard lock{mutex};
            codes.push_back(error.code());
        };
    }

    std::vector<core::ErrorCode> snapshot()
    {
        std::lock_guard lock{mutex};
        return codes;
    }
};

} // namespace

TEST_CASE("StreamDecoder: one unit becomes one ordered batch", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    StreamDecoder decoder{registry, {.source = "serial:/dev/ttyUSB0", .sampleStep = 10ms}};

    CHECK(decoder.handleUnit("1.5,2.5,3.5", kArrival) == 3);
    REQUIRE(collector.samples.size() == 3);
    CHECK(collector.batchSizes == std::vector<core::usize>{3});
    CHECK(collector.samples[0].timestamp == kArrival - 20ms);
    CHECK(collector.samples[2].timestamp == kArrival);
    CHECK(collector.samples[1].stringMeta(protocol::meta::kSource) == "serial:/dev/ttyUSB0");

    const auto stats = decoder.stats();
    CHECK(stats.units == 1);
    CHECK(stats.samples == 3);
    CHECK(stats.errors == 0);
}

TEST_CASE("StreamDecoder: units without data deliver nothing", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    StreamDecoder decoder{registry};
    CHECK(decoder.handleUnit("hello", kArrival) == 0);
    CHECK(decoder.handleUnit("T20H50V80", kArrival) == 0);
    CHECK(collector.batchSizes.empty());
    CHECK(decoder.stats().empty == 2);
    CHECK(registry.batchesDelivered() == 0);
}

TEST_CASE("StreamDecoder: injected clock stamps handled units", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    StreamDecoder decoder{registry};
    decoder.setClock([] { return kArrival; });

    CHECK(decoder.handleUnit("X1.00,2.00,Y0.50,0.60") == 4);
    REQUIRE(collector.samples.size() == 4);
    for (const auto& sample : collector.samples)
    {
        CHECK(sample.stringMeta(protocol::meta::kSource) == "external");
    }
    CHECK(collector.samples[1].timestamp == kArrival);
    CHECK(collector.samples[1].channel == protocol::Channel::kX);
}

TEST_CASE("StreamDecoder: errors are reported and the stream continues", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    ErrorLog errors;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    StreamDecoder decoder{registry, {.maxLineLength = 16}};
    decoder.setErrorHandler(errors.handler());
    decoder.setClock([] { return kArrival; });

    CHECK(decoder.handleUnit("Y0.5,0.6") == 0);
    CHECK(decoder.handleUnit(R"({"type":"earthquake-data",)") == 0);
    CHECK(decoder.feed("1,2,3,4,5,6,7,8,9,10\n4.5\n") == 1);

    CHECK(errors.snapshot() == std::vector<core::ErrorCode>{
        core::ErrorCode::kOrphanChannelMarker,
        core::ErrorCode::kMalformedEnvelope,
        core::ErrorCode::kLineTooLong});
    CHECK(decoder.stats().errors == 3);
    REQUIRE(collector.samples.size() == 1);
    CHECK(collector.samples[0].amplitude == 4.5);
}

TEST_CASE("StreamDecoder: feed reassembles units across chunks", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    StreamDecoder decoder{registry};
    decoder.setClock([] { return kArrival; });

    CHECK(decoder.feed("X1,2,") == 0);
    CHECK(decoder.feed("3\r\nT21H4") == 3);
    CHECK(decoder.feed("5V88,7") == 0);
    CHECK(decoder.finish() == 1);

    REQUIRE(collector.batchSizes == std::vector<core::usize>{3, 1});
    CHECK(collector.samples[3].intMeta(protocol::meta::kHumidity) == 45);
    CHECK(collector.samples[3].amplitude == 7.0);
}

TEST_CASE("StreamDecoder: read loop delivers and ends on hang-up", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    Collector collector;
    REQUIRE(registry.subscribe(collector.subscriber()).has_value());

    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());
    stream.push("1.0,2.0\n3.");
    stream.push("0\nX4");
    stream.hangUp();

    StreamDecoder decoder{registry, {.acceptEnvelopes = false}};
    REQUIRE(decoder.start(stream).has_value());
    CHECK(decoder.config().source == "fake:stream");

    REQUIRE(test::eventually([&] { return !decoder.running(); }));
    CHECK(collector.count() == 4);
    CHECK(collector.batchSizes == std::vector<core::usize>{2, 1, 1});
    CHECK(collector.samples[3].channel == protocol::Channel::kX);
    CHECK(stream.releases() == 1);
    CHECK_FALSE(stream.locked());

    decoder.cancel();
    CHECK(stream.releases() == 1);
    CHECK(stream.close().has_value());
}

TEST_CASE("StreamDecoder: cancellation releases the reader exactly once", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());

    StreamDecoder decoder{registry};
    REQUIRE(decoder.start(stream).has_value());
    CHECK(decoder.running());
    CHECK(stream.locked());

    SECTION("close is refused while the loop runs")
    {
        auto closed = stream.close();
        REQUIRE_FALSE(closed.has_value());
        CHECK(closed.error().code() == core::ErrorCode::kReaderLocked);
    }

    SECTION("a second start is refused")
    {
        auto again = decoder.start(stream);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code() == core::ErrorCode::kInvalidState);
    }

    decoder.cancel();
    decoder.cancel();
    CHECK_FALSE(decoder.running());
    CHECK(stream.releases() == 1);
    CHECK(stream.close().has_value());
}

TEST_CASE("StreamDecoder: read failures stop the loop and are reported", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    ErrorLog errors;
    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());
    stream.failReads();

    StreamDecoder decoder{registry};
    decoder.setErrorHandler(errors.handler());
    REQUIRE(decoder.start(stream).has_value());

    REQUIRE(test::eventually([&] { return !decoder.running(); }));
    CHECK(errors.snapshot() == std::vector<core::ErrorCode>{core::ErrorCode::kDeviceReadFailed});
    CHECK(stream.releases() == 1);

    SECTION("the loop can be restarted once it has ended")
    {
        REQUIRE(decoder.start(stream).has_value());
        REQUIRE(test::eventually([&] { return !decoder.running(); }));
        CHECK(stream.releases() == 2);
    }
}

TEST_CASE("StreamDecoder: start needs an open stream", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    test::FakeByteStream stream;

    StreamDecoder decoder{registry};
    auto started = decoder.start(stream);
    REQUIRE_FALSE(started.has_value());
    CHECK(started.error().code() == core::ErrorCode::kDeviceClosed);
    CHECK_FALSE(decoder.running());
}

TEST_CASE("StreamDecoder: a subscriber may cancel its own loop", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());

    StreamDecoder decoder{registry};
    std::atomic<int> calls{0};
    REQUIRE(registry.subscribe([&](std::span<const protocol::Sample>) {
        calls.fetch_add(1);
        decoder.cancel();
    }).has_value());

    stream.push("1\n2\n");
    REQUIRE(decoder.start(stream).has_value());
    REQUIRE(test::eventually([&] { return !decoder.running(); }));

    // The chunk already in hand is finished; nothing after it is read.
    CHECK(calls.load() == 2);
    stream.push("3\n");
    std::this_thread::sleep_for(20ms);
    CHECK(calls.load() == 2);
    CHECK(stream.releases() == 1);
}

TEST_CASE("StreamDecoder: cancel from a subscriber while another thread cancels",
          "[stream][decoder]")
{
    SubscriptionRegistry registry;
    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());

    StreamDecoder decoder{registry};
    std::atomic<bool> entered{false};
    REQUIRE(registry.subscribe([&](std::span<const protocol::Sample>) {
        entered.store(true);
        // Long enough for the outside cancel() to be waiting on the loop.
        std::this_thread::sleep_for(100ms);
        decoder.cancel();
    }).has_value());

    stream.push("1\n");
    REQUIRE(decoder.start(stream).has_value());
    REQUIRE(test::eventually([&] { return entered.load(); }));

    decoder.cancel();
    CHECK_FALSE(decoder.running());
    CHECK_FALSE(decoder.onLoopThread());
    CHECK(stream.releases() == 1);
    CHECK(stream.close().has_value());
}

TEST_CASE("StreamDecoder: the loop can close its stream on the way out", "[stream][decoder]")
{
    SubscriptionRegistry registry;
    test::FakeByteStream stream;
    REQUIRE(stream.open().has_value());

    StreamDecoder decoder{registry};
    std::atomic<bool> insideLoop{false};
    REQUIRE(registry.subscribe([&](std::span<const protocol::Sample>) {
        insideLoop.store(decoder.onLoopThread());
        decoder.closeStreamOnExit();
        decoder.cancel();
    }).has_value());

    stream.push("1\n");
    REQUIRE(decoder.start(stream).has_value());
    REQUIRE(test::eventually([&] { return !decoder.running(); }));

    CHECK(insideLoop.load());
    CHECK(stream.releases() == 1);
    CHECK(stream.state() == transport::TransportState::kClosed);
}
