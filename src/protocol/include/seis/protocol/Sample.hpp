// /////////////////////////////////////////////////////////////////////////////
/// @file Sample.hpp
/// @brief Canonical in-memory representation of a decoded reading.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/core/Types.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace seis::protocol {

/// @brief Waveform stream a sample belongs to.
enum class Channel : core::u8
{
    kUnlabeled = 0,
    kX,
    kY,
    kZ
};

/// @brief Marker letter of a channel ("X", "Y", "Z"), empty for unlabeled.
[[nodiscard]] constexpr std::string_view channelMarker(Channel channel) noexcept
{
    switch (channel)
    {
        case Channel::kUnlabeled: return "";
        case Channel::kX:         return "X";
        case Channel::kY:         return "Y";
        case Channel::kZ:         return "Z";
    }
    return "";
}

/// @brief Human-readable channel name for logs.
[[nodiscard]] constexpr std::string_view channelName(Channel channel) noexcept
{
    return channel == Channel::kUnlabeled ? "Unlabeled" : channelMarker(channel);
}

/// @brief A scalar metadata annotation.
using MetadataValue = std::variant<bool, core::i64, core::f64, std::string>;

/// @brief Ordered key/value annotations attached to a sample.
using Metadata = std::map<std::string, MetadataValue, std::less<>>;

namespace meta {

inline constexpr std::string_view kSource       = "source";
inline constexpr std::string_view kRaw          = "raw";
inline constexpr std::string_view kBatchIndex   = "batchIndex";
inline constexpr std::string_view kBatchSize    = "batchSize";
inline constexpr std::string_view kTemperature  = "temperature";
inline constexpr std::string_view kHumidity     = "humidity";
inline constexpr std::string_view kVoltage      = "voltage";
inline constexpr std::string_view kWaveformType = "waveformType";
inline constexpr std::string_view kDataType     = "dataType";

} // namespace meta

// /////////////////////////////////////////////////////////////////////////////
/// @struct Sample
/// @brief One timestamped, channel-tagged reading.
// /////////////////////////////////////////////////////////////////////////////
struct Sample
{
    core::f64       amplitude{0.0};
    core::Timestamp timestamp{};
    Channel         channel{Channel::kUnlabeled};
    Metadata        metadata;

    /// @brief Looks up an integer annotation.
    [[nodiscard]] std::optional<core::i64> intMeta(std::string_view key) const;

    /// @brief Looks up a string annotation.
    [[nodiscard]] std::optional<std::string> stringMeta(std::string_view key) const;

    /// @brief Looks up a boolean annotation.
    [[nodiscard]] std::optional<bool> boolMeta(std::string_view key) const;
};

/// @brief Ordered samples produced from one frame.
using SampleBatch = std::vector<Sample>;

} // namespace seis::protocol
