/**
 * @file BatchQueue.hpp
 * @brief Bounded, thread-safe hand-off of sample batches to a pull consumer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef SEIS_STREAM_BATCHQUEUE_HPP
    #define SEIS_STREAM_BATCHQUEUE_HPP

#include <seis/stream/SubscriptionRegistry.hpp>
#include <seis/protocol/Sample.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/NonCopyable.hpp>
#include <seis/core/Types.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace seis::stream {

/**
 * @class BatchQueue
 * @brief FIFO of batches fed by a subscriber and drained by another thread.
 *
 * When the queue is full the incoming batch is rejected and counted, so
 * a stalled consumer never blocks the decoding thread.
 *
 * @code
 *   BatchQueue queue;
 *   auto id = registry.subscribe(queue.subscriber());
 *   protocol::SampleBatch batch;
 *   while (queue.waitPop(batch, 100ms)) { ... }
 * @endcode
 */
class BatchQueue final : public core::NonMovable<BatchQueue>
{
public:
    explicit BatchQueue(core::usize capacity = core::kDefaultQueueCapacity);
    ~BatchQueue() = default;

    /**
     * @brief Enqueues a batch.
     * @return @c false if the queue is full or closed.
     */
    bool push(protocol::SampleBatch batch);

    /**
     * @brief Pops the oldest batch without waiting.
     * @param[out] out Filled with the batch if available.
     * @return @c true if a batch was dequeued.
     */
    bool pop(protocol::SampleBatch& out);

    /**
     * @brief Waits up to @p timeout for a batch.
     * @return @c false on timeout, or once closed and drained.
     */
    bool waitPop(protocol::SampleBatch& out, std::chrono::milliseconds timeout);

    /** @brief Rejects further pushes and wakes every waiting consumer. */
    void close();

    /** @brief Returns a callback that copies each delivered batch in. */
    [[nodiscard]] Subscriber subscriber();

    [[nodiscard]] core::usize size() const;
    [[nodiscard]] bool        empty() const;
    [[nodiscard]] bool        closed() const;
    [[nodiscard]] core::usize capacity() const noexcept { return _capacity; }
    [[nodiscard]] core::u64   dropped() const;

private:
    const core::usize                  _capacity;
    mutable std::mutex                 _mutex;
    std::condition_variable            _cv;
    std::deque<protocol::SampleBatch>  _queue;
    core::u64                          _dropped{0};
    bool                               _closed{false};
};

} // namespace seis::stream

#endif // SEIS_STREAM_BATCHQUEUE_HPP
