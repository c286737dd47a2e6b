// /////////////////////////////////////////////////////////////////////////////
/// @file FrameEncoder.hpp
/// @brief Inverse of FrameDecoder: renders values back into wire text.
///
/// Output order is always `T..H..V..,X..,Y..,Z..`.  Outbound units carry no
/// trailing newline; transports add their own delimiter.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Frame.hpp>
#include <seis/protocol/Sample.hpp>
#include <seis/core/Expected.hpp>

#include <optional>
#include <span>
#include <string>

namespace seis::protocol {

struct EncodeOptions
{
    /// Fixed number of fraction digits; shortest round-trip form if empty.
    std::optional<int> fractionDigits;
};

class FrameEncoder final
{
public:
    explicit FrameEncoder(EncodeOptions options = {}) noexcept;

    /// @brief `"3.14"`.
    [[nodiscard]] std::string encodeBare(core::f64 value) const;

    /// @brief `"1,2,3"` (unlabeled).
    [[nodiscard]] std::string encodeValues(std::span<const core::f64> values) const;

    /// @brief `"[T..H..V..,]X..[,Y..][,Z..]"`.
    /// @return kInvalidArgument if @p x is empty.
    [[nodiscard]] core::Expected<std::string> encodeChannels(
        const std::optional<MetadataPrefix>& prefix,
        std::span<const core::f64> x,
        std::span<const core::f64> y = {},
        std::span<const core::f64> z = {}) const;

    /// @brief Renders a decoded multi-channel frame.
    [[nodiscard]] core::Expected<std::string> encodeFrame(const MultiChannelFrame& frame) const;

    /// @brief `{"type":"earthquake-data","payload":{...}}` for one sample.
    [[nodiscard]] std::string encodeEnvelope(const Sample& sample) const;

    /// @brief `"T25H60V90"`; missing fields keep their tag without digits.
    [[nodiscard]] static std::string encodePrefix(const MetadataPrefix& prefix);

private:
    void appendValues(std::string& out, std::span<const core::f64> values) const;

    EncodeOptions options_;
};

} // namespace seis::protocol
