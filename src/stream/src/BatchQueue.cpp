/**
 * @file BatchQueue.cpp
 * @brief BatchQueue implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <seis/stream/BatchQueue.hpp>

#include <algorithm>

namespace seis::stream {

BatchQueue::BatchQueue(core::usize capacity)
    : _capacity{std::max<core::usize>(capacity, 1)}
{
}

bool BatchQueue::push(protocol::SampleBatch batch)
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        if (_closed || _queue.size() >= _capacity)
        {
            ++_dropped;
            return false;
        }
        _queue.push_back(std::move(batch));
    }
    _cv.notify_one();
    return true;
}

bool BatchQueue::pop(protocol::SampleBatch& out)
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (_queue.empty())
    {
        return false;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    return true;
}

bool BatchQueue::waitPop(protocol::SampleBatch& out, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock{_mutex};
    if (!_cv.wait_for(lock, timeout, [this] { return !_queue.empty() || _closed; }))
    {
        return false;
    }
    if (_queue.empty())
    {
        return false;
    }
    out = std::move(_queue.front());
    _queue.pop_front();
    return true;
}

void BatchQueue::close()
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _closed = true;
    }
    _cv.notify_all();
}

Subscriber BatchQueue::subscriber()
{
    return [this](std::span<const protocol::Sample> batch) {
        push(protocol::SampleBatch(batch.begin(), batch.end()));
    };
}

core::usize BatchQueue::size() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _queue.size();
}

bool BatchQueue::empty() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _queue.empty();
}

bool BatchQueue::closed() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _closed;
}

core::u64 BatchQueue::dropped() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _dropped;
}

} // namespace seis::stream
