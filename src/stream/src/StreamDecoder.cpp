// /////////////////////////////////////////////////////////////////////////////
/// @file StreamDecoder.cpp
/// @brief StreamDecoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/stream/StreamDecoder.hpp>
#include <seis/core/Log.hpp>

namespace seis::stream {

namespace {

constexpr std::string_view kTag = "STREAM";

} // namespace

StreamDecoder::StreamDecoder(SubscriptionRegistry& registry, StreamDecoderConfig config)
    : registry_{registry}
    , config_{std::move(config)}
    , decoder_{protocol::DecoderOptions{config_.acceptEnvelopes}}
    , synthesizer_{config_.sampleStep}
    , assembler_{config_.maxLineLength}
    , clock_{[] { return core::Clock::now(); }}
{}

StreamDecoder::~StreamDecoder()
{
    cancel();
}

void StreamDecoder::setErrorHandler(ErrorHandler handler)
{
    std::lock_guard lock{unitMutex_};
    errorHandler_ = std::move(handler);
}

void StreamDecoder::setClock(ArrivalClock clock)
{
    std::lock_guard lock{unitMutex_};
    if (clock)
    {
        clock_ = std::move(clock);
    }
}

core::Expected<protocol::SampleBatch> StreamDecoder::decodeUnit(std::string_view unit,
                                                                core::Timestamp arrival) const
{
    auto frame = decoder_.decode(unit);
    if (!frame)
    {
        return std::unexpected(std::move(frame.error()));
    }
    const std::string_view source = config_.source.empty()
        ? core::kExternalSource
        : std::string_view{config_.source};
    return synthesizer_.stamp(*frame, arrival, source);
}

core::usize StreamDecoder::handleUnit(std::string_view unit)
{
    std::lock_guard lock{unitMutex_};
    return process(unit, clock_());
}

core::usize StreamDecoder::handleUnit(std::string_view unit, core::Timestamp arrival)
{
    std::lock_guard lock{unitMutex_};
    return process(unit, arrival);
}

core::usize StreamDecoder::feed(std::string_view chunk)
{
    std::lock_guard lock{unitMutex_};

    const auto overflowsBefore = assembler_.overflowCount();
    const auto lines = assembler_.feed(chunk);
    if (assembler_.overflowCount() != overflowsBefore)
    {
        report(core::Error{core::ErrorCode::kLineTooLong,
                           "line longer than " + std::to_string(config_.maxLineLength) +
                           " bytes discarded"});
    }

    core::usize delivered = 0;
    for (const auto& line : lines)
    {
        delivered += process(line, clock_());
    }
    return delivered;
}

core::usize StreamDecoder::finish()
{
    std::lock_guard lock{unitMutex_};
    if (auto rest = assembler_.flush())
    {
        return process(*rest, clock_());
    }
    return 0;
}

core::ExpectedVoid StreamDecoder::start(transport::IByteStream& stream)
{
    std::lock_guard lock{loopMutex_};
    if (running_.load())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "read loop already running");
    }
    if (worker_.joinable())
    {
        if (worker_.get_id() == std::this_thread::get_id())
        {
            return core::makeError(core::ErrorCode::kInvalidState,
                                   "cannot restart the read loop from inside it");
        }
        // Previous loop ended on its own (end of stream or read error).
        worker_.join();
    }

    auto lease = SEIS_TRY(stream.acquireReader());

    {
        std::lock_guard unitLock{unitMutex_};
        if (config_.source.empty())
        {
            config_.source = stream.identity();
        }
        assembler_.reset();
    }

    // Set before the thread exists, so the loop may read it without loopMutex_.
    loopStop_ = std::stop_source{};
    closeOnExit_.store(false);
    running_.store(true);
    worker_ = std::jthread([this, &stream, lease = std::move(lease), st = loopStop_.get_token()]() mutable {
        readLoop(st, stream, std::move(lease));
    });
    return {};
}

void StreamDecoder::cancel() noexcept
{
    if (onLoopThread())
    {
        // An outside cancel() may hold loopMutex_ while joining this thread.
        loopStop_.request_stop();
        return;
    }

    std::lock_guard lock{loopMutex_};
    if (!worker_.joinable())
    {
        return;
    }
    loopStop_.request_stop();
    worker_.join();
}

bool StreamDecoder::onLoopThread() const noexcept
{
    return loopThread_.load() == std::this_thread::get_id();
}

DecoderStats StreamDecoder::stats() const noexcept
{
    return DecoderStats{units_.load(), samples_.load(), empty_.load(), errors_.load()};
}

void StreamDecoder::readLoop(std::stop_token stopToken,
                             transport::IByteStream& stream,
                             transport::ReaderLease lease)
{
    loopThread_.store(std::this_thread::get_id());
    core::Log::info(kTag, "read loop started on " + stream.identity());

    while (!stopToken.stop_requested())
    {
        auto chunk = stream.read();
        if (!chunk)
        {
            std::lock_guard lock{unitMutex_};
            report(chunk.error());
            break;
        }
        if (!chunk->text.empty())
        {
            feed(chunk->text);
        }
        if (chunk->endOfStream)
        {
            finish();
            break;
        }
    }

    lease.release();
    if (closeOnExit_.exchange(false))
    {
        if (auto closed = stream.close(); !closed)
        {
            core::Log::warn(kTag, "close on loop exit: " + closed.error().format());
        }
    }
    core::Log::info(kTag, "read loop stopped on " + stream.identity());
    loopThread_.store(std::thread::id{});
    running_.store(false);
}

core::usize StreamDecoder::process(std::string_view unit, core::Timestamp arrival)
{
    units_.fetch_add(1);

    auto batch = decodeUnit(unit, arrival);
    if (!batch)
    {
        report(batch.error());
        return 0;
    }
    if (batch->empty())
    {
        empty_.fetch_add(1);
        return 0;
    }

    const auto delivery = registry_.deliver(*batch);
    if (delivery.failed > 0)
    {
        core::Log::debug(kTag, std::to_string(delivery.failed) + " subscriber(s) failed on a batch of " +
                               std::to_string(batch->size()));
    }
    samples_.fetch_add(batch->size());
    return batch->size();
}

void StreamDecoder::report(const core::Error& error)
{
    errors_.fetch_add(1);
    core::Log::warn(kTag, error.format());
    if (errorHandler_)
    {
        errorHandler_(error);
    }
}

} // namespace seis::stream
