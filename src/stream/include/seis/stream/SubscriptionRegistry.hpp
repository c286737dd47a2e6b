/**
 * @file SubscriptionRegistry.hpp
 * @brief Thread-safe fan-out of sample batches to registered callbacks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SEIS_STREAM_SUBSCRIPTIONREGISTRY_HPP
    #define SEIS_STREAM_SUBSCRIPTIONREGISTRY_HPP

#include <seis/protocol/Sample.hpp>
#include <seis/core/Expected.hpp>
#include <seis/core/NonCopyable.hpp>
#include <seis/core/Types.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace seis::stream {

/** @brief Opaque handle returned by subscribe(); never reused. */
using SubscriptionId = core::u64;

/** @brief Receives one ordered batch of samples per decoded frame. */
using Subscriber = std::function<void(std::span<const protocol::Sample>)>;

/**
 * @struct DeliveryReport
 * @brief Outcome of one deliver() call.
 */
struct DeliveryReport
{
    core::usize delivered{0};
    core::usize failed{0};
};

/**
 * @class SubscriptionRegistry
 * @brief Shared by every transport; delivers each batch to all subscribers.
 *
 * One delivery runs at a time: a batch reaches every subscriber registered
 * when it started before the next batch is handed out.  A subscriber added
 * during a delivery first sees the next batch; one removed during a
 * delivery is skipped if it has not been reached yet.  A subscriber that
 * throws is logged and counted; the others still receive the batch.
 *
 * Subscribers must not call deliver() themselves.
 */
class SubscriptionRegistry final : public core::NonMovable<SubscriptionRegistry>
{
public:
    SubscriptionRegistry() = default;
    ~SubscriptionRegistry() = default;

    /**
     * @brief Registers a callback.
     * @return Its id, or kInvalidArgument for an empty callback.
     */
    [[nodiscard]] core::Expected<SubscriptionId> subscribe(Subscriber callback);

    /**
     * @brief Removes one subscriber.
     * @return kInvalidArgument if @p id is unknown.
     */
    [[nodiscard]] core::ExpectedVoid unsubscribe(SubscriptionId id);

    /** @brief Removes every subscriber; returns how many were removed. */
    core::usize clear();

    /** @brief Hands @p batch to every current subscriber, in registration order. */
    DeliveryReport deliver(std::span<const protocol::Sample> batch);

    /** @brief Returns the number of registered subscribers. */
    [[nodiscard]] core::usize size() const;

    /** @brief Total number of batches delivered so far. */
    [[nodiscard]] core::u64 batchesDelivered() const noexcept { return _batches.load(); }

    /** @brief Total number of subscriber invocations that threw. */
    [[nodiscard]] core::u64 failures() const noexcept { return _failures.load(); }

private:
    struct Entry
    {
        SubscriptionId    id;
        Subscriber        callback;
        std::atomic<bool> active{true};
    };

    mutable std::mutex                  _stateMutex;
    std::mutex                          _deliveryMutex;
    std::vector<std::shared_ptr<Entry>> _entries;
    SubscriptionId                      _nextId{1};
    std::atomic<core::u64>              _batches{0};
    std::atomic<core::u64>              _failures{0};
};

} // namespace seis::stream

#endif // SEIS_STREAM_SUBSCRIPTIONREGISTRY_HPP
