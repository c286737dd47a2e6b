// /////////////////////////////////////////////////////////////////////////////
/// @file FakeByteStream.hpp
/// @brief Scripted in-memory IByteStream for decoder tests.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/transport/IByteStream.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace seis::stream::test {

class FakeByteStream final : public transport::IByteStream
{
public:
    /// @brief Queues text returned by a later read().
    void push(std::string text)
    {
        std::lock_guard lock{mutex_};
        chunks_.push_back(std::move(text));
    }

    /// @brief The next read() after the queued chunks reports end of stream.
    void hangUp()
    {
        std::lock_guard lock{mutex_};
        hungUp_ = true;
    }

    /// @brief The next read() after the queued chunks fails.
    void failReads()
    {
        std::lock_guard lock{mutex_};
        failing_ = true;
    }

    core::ExpectedVoid open() override
    {
        state_.store(transport::TransportState::kOpen);
        return {};
    }

    core::ExpectedVoid close() override
    {
        if (state_.load() == transport::TransportState::kClosed)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "not open");
        }
        if (locked_.load())
        {
            return core::makeError(core::ErrorCode::kReaderLocked, "reader still held");
        }
        state_.store(transport::TransportState::kClosed);
        return {};
    }

    core::ExpectedVoid write(std::string_view unit) override
    {
        std::lock_guard lock{mutex_};
        written_ += unit;
        return {};
    }

    core::Expected<transport::ReadChunk> read() override
    {
        {
            std::lock_guard lock{mutex_};
            if (!chunks_.empty())
            {
                transport::ReadChunk chunk{std::move(chunks_.front()), false};
                chunks_.pop_front();
                return chunk;
            }
            if (hungUp_)
            {
                return transport::ReadChunk{{}, true};
            }
            if (failing_)
            {
                return core::makeError(core::ErrorCode::kDeviceReadFailed, "scripted failure");
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
        return transport::ReadChunk{};
    }

    transport::TransportState state() const noexcept override { return state_.load(); }
    std::string identity() const override { return "fake:stream"; }
    const char* name() const noexcept override { return "FakeByteStream"; }

    [[nodiscard]] int releases() const noexcept { return releases_.load(); }
    [[nodiscard]] bool locked() const noexcept { return locked_.load(); }

protected:
    core::ExpectedVoid lockReader() override
    {
        if (state_.load() != transport::TransportState::kOpen)
        {
            return core::makeError(core::ErrorCode::kDeviceClosed, "not open");
        }
        bool expected = false;
        if (!locked_.compare_exchange_strong(expected, true))
        {
            return core::makeError(core::ErrorCode::kReaderLocked, "reader already held");
        }
        return {};
    }

    void unlockReader() noexcept override
    {
        locked_.store(false);
        releases_.fetch_add(1);
    }

private:
    std::mutex                              mutex_;
    std::deque<std::string>                 chunks_;
    std::string                             written_;
    bool                                    hungUp_{false};
    bool                                    failing_{false};
    std::atomic<transport::TransportState>  state_{transport::TransportState::kClosed};
    std::atomic<bool>                       locked_{false};
    std::atomic<int>                        releases_{0};
};

/// @brief Polls @p predicate until it holds or @p timeout elapses.
template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds{2000})
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    return predicate();
}

} // namespace seis::stream::test
