// /////////////////////////////////////////////////////////////////////////////
/// @file TimestampSynthesizer.hpp
/// @brief Turns a decoded Frame into timestamped, channel-tagged samples.
///
/// The wire protocol carries no intra-batch timing.  The arrival instant of
/// a frame is taken as the timestamp of the LAST sample of each channel and
/// earlier samples are backdated by a constant step:
///
/// @code
///   timestamp[i] = arrival - (batchSize - 1 - i) * step
/// @endcode
///
/// This is an approximation of the sensor's sampling clock, not ground
/// truth.  Every channel of a frame uses the same arrival instant, so
/// same-index samples of X/Y/Z line up.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Frame.hpp>
#include <seis/protocol/Sample.hpp>
#include <seis/core/Constants.hpp>
#include <seis/core/Types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace seis::protocol {

class TimestampSynthesizer final
{
public:
    explicit TimestampSynthesizer(core::Clock::duration step = core::kDefaultSampleStep) noexcept;

    /// @brief Timestamp of sample @p index in a batch of @p batchSize.
    [[nodiscard]] core::Timestamp timestampAt(core::usize index,
                                              core::usize batchSize,
                                              core::Timestamp arrival) const noexcept;

    /// @brief Timestamps of a whole batch, oldest first.
    [[nodiscard]] std::vector<core::Timestamp> synthesize(core::usize batchSize,
                                                          core::Timestamp arrival) const;

    /// @brief Expands a frame into samples.
    /// @param frame   Decoded frame (NoData yields an empty batch).
    /// @param arrival Instant the frame was received.
    /// @param source  Transport identity stored in the `source` annotation.
    [[nodiscard]] SampleBatch stamp(const Frame& frame,
                                    core::Timestamp arrival,
                                    std::string_view source) const;

    [[nodiscard]] core::Clock::duration step() const noexcept { return step_; }

private:
    void stampChannel(const ChannelPayload& payload,
                      const Metadata& shared,
                      core::Timestamp arrival,
                      SampleBatch& out) const;

    core::Clock::duration step_;
};

} // namespace seis::protocol
