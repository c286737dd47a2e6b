// /////////////////////////////////////////////////////////////////////////////
/// @file FrameEncoder.cpp
/// @brief FrameEncoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/FrameEncoder.hpp>
#include <seis/protocol/Numeric.hpp>
#include <seis/core/Constants.hpp>

#include <nlohmann/json.hpp>

#include <chrono>

namespace seis::protocol {

namespace {

nlohmann::json toJson(const MetadataValue& value)
{
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

} // namespace

FrameEncoder::FrameEncoder(EncodeOptions options) noexcept
    : options_{options}
{}

void FrameEncoder::appendValues(std::string& out, std::span<const core::f64> values) const
{
    bool first = true;
    for (const auto value : values)
    {
        if (!first)
        {
            out.push_back(',');
        }
        out += formatAmplitude(value, options_.fractionDigits);
        first = false;
    }
}

std::string FrameEncoder::encodeBare(core::f64 value) const
{
    return formatAmplitude(value, options_.fractionDigits);
}

std::string FrameEncoder::encodeValues(std::span<const core::f64> values) const
{
    std::string out;
    appendValues(out, values);
    return out;
}

std::string FrameEncoder::encodePrefix(const MetadataPrefix& prefix)
{
    std::string out{"T"};
    if (prefix.temperature)
        out += std::to_string(*prefix.temperature);
    out += 'H';
    if (prefix.humidity)
        out += std::to_string(*prefix.humidity);
    out += 'V';
    if (prefix.voltage)
        out += std::to_string(*prefix.voltage);
    return out;
}

core::Expected<std::string> FrameEncoder::encodeChannels(
    const std::optional<MetadataPrefix>& prefix,
    std::span<const core::f64> x,
    std::span<const core::f64> y,
    std::span<const core::f64> z) const
{
    if (x.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "a labeled frame needs at least one X value");
    }

    std::string out;
    if (prefix)
    {
        out += encodePrefix(*prefix);
        out += ',';
    }
    out += 'X';
    appendValues(out, x);
    if (!y.empty())
    {
        out += ",Y";
        appendValues(out, y);
    }
    if (!z.empty())
    {
        out += ",Z";
        appendValues(out, z);
    }
    return out;
}

core::Expected<std::string> FrameEncoder::encodeFrame(const MultiChannelFrame& frame) const
{
    std::span<const core::f64> x, y, z;
    for (const auto& payload : frame.channels)
    {
        switch (payload.channel)
        {
            case Channel::kX: x = payload.values; break;
            case Channel::kY: y = payload.values; break;
            case Channel::kZ: z = payload.values; break;
            case Channel::kUnlabeled:
            {
                std::string out;
                if (frame.prefix)
                {
                    out += encodePrefix(*frame.prefix);
                    out += ',';
                }
                appendValues(out, payload.values);
                return out;
            }
        }
    }
    return encodeChannels(frame.prefix, x, y, z);
}

std::string FrameEncoder::encodeEnvelope(const Sample& sample) const
{
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : sample.metadata)
    {
        metadata[key] = toJson(value);
    }

    const auto timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        sample.timestamp.time_since_epoch()).count();

    nlohmann::json envelope{
        {"type", std::string(core::kEarthquakeDataType)},
        {"payload", {
            {"amplitude", sample.amplitude},
            {"timestamp", timestampMs},
            {"metadata", std::move(metadata)}
        }}
    };
    return envelope.dump();
}

} // namespace seis::protocol
