// /////////////////////////////////////////////////////////////////////////////
/// @file StreamDecoder.hpp
/// @brief Per-transport decode pipeline: unit -> frame -> samples -> fan-out.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/stream/SubscriptionRegistry.hpp>
#include <seis/transport/IByteStream.hpp>
#include <seis/protocol/FrameDecoder.hpp>
#include <seis/protocol/LineAssembler.hpp>
#include <seis/protocol/TimestampSynthesizer.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/NonCopyable.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace seis::stream {

/// @brief Receives decode and transport errors; never fatal to the stream.
using ErrorHandler = std::function<void(const core::Error&)>;

/// @brief Source of arrival instants (injectable for tests).
using ArrivalClock = std::function<core::Timestamp()>;

struct StreamDecoderConfig
{
    /// Value of the `source` annotation.  start() fills it from the stream
    /// identity when empty; units handled before that are tagged "external".
    std::string           source;
    core::Clock::duration sampleStep{core::kDefaultSampleStep};
    core::usize           maxLineLength{core::kMaxLineLength};
    bool                  acceptEnvelopes{true};
};

/// @brief Running totals, readable from any thread.
struct DecoderStats
{
    core::u64 units{0};
    core::u64 samples{0};
    core::u64 empty{0};
    core::u64 errors{0};
};

// /////////////////////////////////////////////////////////////////////////////
/// @class StreamDecoder
/// @brief Decodes the units of ONE transport strictly in arrival order.
///
/// Two entry points:
///   - handleUnit(): one complete message (push transports).
///   - start():      background read loop over an IByteStream, reassembling
///                   newline-delimited units from arbitrary chunks.
///
/// Every unit's batch reaches all subscribers before the next unit is
/// decoded.  Errors go to the error handler and the stream continues.
// /////////////////////////////////////////////////////////////////////////////
class StreamDecoder final : public core::NonMovable<StreamDecoder>
{
public:
    StreamDecoder(SubscriptionRegistry& registry, StreamDecoderConfig config = {});
    ~StreamDecoder();

    /// @brief Installs the error handler (before start()).
    void setErrorHandler(ErrorHandler handler);

    /// @brief Replaces the arrival clock (before start()).
    void setClock(ArrivalClock clock);

    /// @brief Decodes and stamps one unit without delivering it.
    [[nodiscard]] core::Expected<protocol::SampleBatch> decodeUnit(std::string_view unit,
                                                                   core::Timestamp arrival) const;

    /// @brief Decodes one unit and delivers its batch.
    /// @return Number of samples delivered (0 on no data or error).
    core::usize handleUnit(std::string_view unit);

    /// @brief Same, with an explicit arrival instant.
    core::usize handleUnit(std::string_view unit, core::Timestamp arrival);

    /// @brief Appends raw text; every completed line is handled in order.
    core::usize feed(std::string_view chunk);

    /// @brief Handles a trailing unterminated line (end of stream).
    core::usize finish();

    /// @brief Claims @p stream's reader and starts the background loop.
    /// @return kInvalidState if a loop already runs, or the lease error.
    [[nodiscard]] core::ExpectedVoid start(transport::IByteStream& stream);

    /// @brief Stops the loop and releases the reader.  Idempotent.
    ///
    /// Blocks until the loop has exited, except when called from the loop
    /// thread itself (from a subscriber), where the loop exits once the
    /// chunk in hand is handled.  Never waits on a concurrent cancel().
    void cancel() noexcept;

    /// @brief Has the running loop close its stream after releasing the reader.
    void closeStreamOnExit() noexcept { closeOnExit_.store(true); }

    /// @brief True when called from this decoder's read loop (from a subscriber).
    [[nodiscard]] bool onLoopThread() const noexcept;

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] DecoderStats stats() const noexcept;
    [[nodiscard]] const StreamDecoderConfig& config() const noexcept { return config_; }

private:
    void readLoop(std::stop_token stopToken,
                  transport::IByteStream& stream,
                  transport::ReaderLease lease);
    core::usize process(std::string_view unit, core::Timestamp arrival);
    void report(const core::Error& error);

    SubscriptionRegistry&           registry_;
    StreamDecoderConfig             config_;
    protocol::FrameDecoder          decoder_;
    protocol::TimestampSynthesizer  synthesizer_;
    protocol::LineAssembler         assembler_;
    ErrorHandler                    errorHandler_;
    ArrivalClock                    clock_;

    std::mutex                      unitMutex_;
    std::mutex                      loopMutex_;
    std::jthread                    worker_;
    std::stop_source                loopStop_;
    std::atomic<std::thread::id>    loopThread_{};
    std::atomic<bool>               running_{false};
    std::atomic<bool>               closeOnExit_{false};

    std::atomic<core::u64>          units_{0};
    std::atomic<core::u64>          samples_{0};
    std::atomic<core::u64>          empty_{0};
    std::atomic<core::u64>          errors_{0};
};

} // namespace seis::stream
