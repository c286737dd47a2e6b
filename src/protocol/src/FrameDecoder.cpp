// /////////////////////////////////////////////////////////////////////////////
/// @file FrameDecoder.cpp
/// @brief FrameDecoder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/FrameDecoder.hpp>
#include <seis/protocol/ChannelTokenizer.hpp>
#include <seis/protocol/Numeric.hpp>
#include <seis/core/Constants.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <string>

namespace seis::protocol {

namespace {

void copyScalarMetadata(const nlohmann::json& object, Metadata& out)
{
    for (const auto& [key, value] : object.items())
    {
        if (value.is_boolean())
        {
            out[key] = value.get<bool>();
        }
        else if (value.is_number_integer())
        {
            out[key] = value.get<core::i64>();
        }
        else if (value.is_number_float())
        {
            out[key] = value.get<core::f64>();
        }
        else if (value.is_string())
        {
            out[key] = value.get<std::string>();
        }
    }
}

/// Out-of-range or non-finite values yield nothing; the sample then keeps
/// its arrival instant.
std::optional<core::i64> envelopeTimestamp(const nlohmann::json& value)
{
    if (value.is_number_unsigned())
    {
        const auto ms = value.get<core::u64>();
        if (ms > static_cast<core::u64>(kMaxEnvelopeTimestampMs))
        {
            return std::nullopt;
        }
        return static_cast<core::i64>(ms);
    }
    if (value.is_number_integer())
    {
        const auto ms = value.get<core::i64>();
        if (ms < -kMaxEnvelopeTimestampMs || ms > kMaxEnvelopeTimestampMs)
        {
            return std::nullopt;
        }
        return ms;
    }

    const auto ms = value.get<core::f64>();
    if (!std::isfinite(ms) || std::fabs(ms) > static_cast<core::f64>(kMaxEnvelopeTimestampMs))
    {
        return std::nullopt;
    }
    return static_cast<core::i64>(ms);
}

} // namespace

FrameDecoder::FrameDecoder(DecoderOptions options) noexcept
    : options_{options}
{}

core::Expected<Frame> FrameDecoder::decode(std::string_view unit) const
{
    const auto text = trim(unit);
    if (text.empty())
    {
        return NoData{};
    }

    if (options_.acceptEnvelopes && (text.front() == '{' || text.front() == '['))
    {
        return decodeEnvelope(text);
    }

    if (text.find(',') == std::string_view::npos)
    {
        return decodeBare(text);
    }

    auto frame = ChannelTokenizer::tokenize(text);
    if (!frame)
    {
        return std::unexpected(std::move(frame.error()));
    }
    if (frame->sampleCount() == 0)
    {
        return NoData{};
    }
    return Frame{std::move(*frame)};
}

core::Expected<Frame> FrameDecoder::decodeBare(std::string_view text)
{
    if (isOrphanMarker(text))
    {
        return core::makeError(core::ErrorCode::kOrphanChannelMarker,
                               "bare value carries a Y/Z marker without an X segment");
    }
    if (auto value = parseAmplitude(text))
    {
        return BareValue{*value};
    }
    return NoData{};
}

core::Expected<Frame> FrameDecoder::decodeEnvelope(std::string_view text)
{
    const auto json = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (json.is_discarded())
    {
        return core::makeError(core::ErrorCode::kMalformedEnvelope,
                               "envelope is not valid JSON");
    }
    if (!json.is_object())
    {
        return NoData{};
    }

    const auto type = json.find("type");
    if (type == json.end() || !type->is_string() ||
        type->get_ref<const std::string&>() != core::kEarthquakeDataType)
    {
        return NoData{};
    }

    const auto payload = json.find("payload");
    if (payload == json.end() || !payload->is_object())
    {
        return core::makeError(core::ErrorCode::kMalformedEnvelope,
                               "earthquake-data envelope has no payload object");
    }

    Envelope envelope;
    envelope.kind = EnvelopeKind::kEarthquakeData;

    const auto amplitude = payload->find("amplitude");
    std::optional<core::f64> value;
    if (amplitude != payload->end())
    {
        if (amplitude->is_number())
        {
            value = amplitude->get<core::f64>();
        }
        else if (amplitude->is_string())
        {
            value = parseAmplitude(amplitude->get_ref<const std::string&>());
        }
    }
    if (!value)
    {
        return core::makeError(core::ErrorCode::kMalformedEnvelope,
                               "earthquake-data payload has no numeric amplitude");
    }
    envelope.amplitude = *value;

    const auto timestamp = payload->find("timestamp");
    if (timestamp != payload->end() && timestamp->is_number())
    {
        envelope.timestampMs = envelopeTimestamp(*timestamp);
    }

    const auto metadata = payload->find("metadata");
    if (metadata != payload->end() && metadata->is_object())
    {
        copyScalarMetadata(*metadata, envelope.metadata);
    }

    return envelope;
}

} // namespace seis::protocol
