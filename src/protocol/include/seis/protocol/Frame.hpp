// /////////////////////////////////////////////////////////////////////////////
/// @file Frame.hpp
/// @brief Tagged-variant result of decoding one protocol unit.
///
/// A Frame only lives between FrameDecoder::decode and the timestamp
/// synthesis step; it never holds absolute time.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Sample.hpp>
#include <seis/core/Types.hpp>

#include <chrono>
#include <optional>
#include <variant>
#include <vector>

namespace seis::protocol {

/// @brief Environmental header `T<int>H<int>V<int>`; absent fields are empty.
struct MetadataPrefix
{
    std::optional<core::i64> temperature;
    std::optional<core::i64> humidity;
    std::optional<core::i64> voltage;

    [[nodiscard]] bool operator==(const MetadataPrefix&) const = default;
};

/// @brief Values of one channel, in wire order.
struct ChannelPayload
{
    Channel                channel{Channel::kUnlabeled};
    std::vector<core::f64> values;
};

/// @brief Decoded text that carried no usable sample (or an ignored envelope).
struct NoData
{
};

/// @brief A single bare number.
struct BareValue
{
    core::f64 value{0.0};
};

/// @brief Comma-separated samples on one to three channels.
///
/// Channels are stored X, Y, Z in order (or a single Unlabeled entry).
/// Channels whose tokens were all rejected still appear with no values.
struct MultiChannelFrame
{
    std::optional<MetadataPrefix> prefix;
    std::vector<ChannelPayload>    channels;
    core::usize                    droppedTokens{0};

    /// @brief Total number of valid values across all channels.
    [[nodiscard]] core::usize sampleCount() const noexcept;

    /// @brief Number of labeled (X/Y/Z) channels present.
    [[nodiscard]] core::usize labeledChannelCount() const noexcept;
};

/// @brief Recognized structured-envelope kinds.
enum class EnvelopeKind : core::u8
{
    kEarthquakeData
};

/// @brief `{ "type": ..., "payload": { amplitude, timestamp, metadata } }`.
struct Envelope
{
    EnvelopeKind             kind{EnvelopeKind::kEarthquakeData};
    core::f64                amplitude{0.0};
    std::optional<core::i64> timestampMs;
    Metadata                 metadata;
};

/// @brief Largest envelope timestamp magnitude a core::Timestamp can hold.
inline constexpr core::i64 kMaxEnvelopeTimestampMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(core::Timestamp::duration::max()).count();

using Frame = std::variant<NoData, BareValue, MultiChannelFrame, Envelope>;

} // namespace seis::protocol
