/**
 * @file TestBatchQueue.cpp
 * @brief Unit tests for BatchQueue.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include <seis/stream/BatchQueue.hpp>

#include <thread>

using namespace seis;
using namespace seis::stream;
using namespace std::chrono_literals;

namespace {

protocol::SampleBatch batchOf(core::f64 amplitude)
{
    protocol::Sample sample;
    sample.amplitude = amplitude;
    return {sample};
}

} // namespace

TEST_CASE("BatchQueue: FIFO order and capacity", "[stream][queue]")
{
    BatchQueue queue{2};

    CHECK(queue.push(batchOf(1.0)));
    CHECK(queue.push(batchOf(2.0)));
    CHECK_FALSE(queue.push(batchOf(3.0)));
    CHECK(queue.dropped() == 1);
    CHECK(queue.size() == 2);

    protocol::SampleBatch out;
    REQUIRE(queue.pop(out));
    CHECK(out[0].amplitude == 1.0);
    REQUIRE(queue.pop(out));
    CHECK(out[0].amplitude == 2.0);
    CHECK_FALSE(queue.pop(out));
    CHECK(queue.empty());
}

TEST_CASE("BatchQueue: waitPop wakes on push and on close", "[stream][queue]")
{
    BatchQueue queue;
    protocol::SampleBatch out;

    CHECK_FALSE(queue.waitPop(out, 5ms));

    std::thread producer{[&] {
        std::this_thread::sleep_for(10ms);
        queue.push(batchOf(7.0));
    }};
    REQUIRE(queue.waitPop(out, 2s));
    CHECK(out[0].amplitude == 7.0);
    producer.join();

    std::thread closer{[&] {
        std::this_thread::sleep_for(10ms);
        queue.close();
    }};
    CHECK_FALSE(queue.waitPop(out, 2s));
    closer.join();

    CHECK(queue.closed());
    CHECK_FALSE(queue.push(batchOf(8.0)));
}

TEST_CASE("BatchQueue: drains remaining batches after close", "[stream][queue]")
{
    BatchQueue queue;
    REQUIRE(queue.push(batchOf(1.0)));
    queue.close();

    protocol::SampleBatch out;
    CHECK(queue.waitPop(out, 5ms));
    CHECK_FALSE(queue.waitPop(out, 5ms));
}

TEST_CASE("BatchQueue: subscriber copies delivered batches", "[stream][queue]")
{
    SubscriptionRegistry registry;
    BatchQueue queue;
    REQUIRE(registry.subscribe(queue.subscriber()).has_value());

    {
        const auto batch = protocol::SampleBatch{batchOf(1.5)[0], batchOf(2.5)[0]};
        registry.deliver(batch);
    }

    protocol::SampleBatch out;
    REQUIRE(queue.pop(out));
    REQUIRE(out.size() == 2);
    CHECK(out[1].amplitude == 2.5);
}
