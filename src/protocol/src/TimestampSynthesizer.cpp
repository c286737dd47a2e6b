// /////////////////////////////////////////////////////////////////////////////
/// @file TimestampSynthesizer.cpp
/// @brief TimestampSynthesizer implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/TimestampSynthesizer.hpp>

#include <type_traits>

namespace seis::protocol {

namespace {

std::string_view dataTypeFor(core::usize labeledChannels) noexcept
{
    switch (labeledChannels)
    {
        case 1:  return "waveform";
        case 2:  return "dual-waveform";
        default: return "triple-waveform";
    }
}

Metadata baseMetadata(std::string_view source)
{
    Metadata metadata;
    metadata.emplace(meta::kSource, std::string(source));
    metadata.emplace(meta::kRaw, true);
    return metadata;
}

} // namespace

TimestampSynthesizer::TimestampSynthesizer(core::Clock::duration step) noexcept
    : step_{step}
{}

core::Timestamp TimestampSynthesizer::timestampAt(core::usize index,
                                                  core::usize batchSize,
                                                  core::Timestamp arrival) const noexcept
{
    if (batchSize == 0 || index >= batchSize)
    {
        return arrival;
    }
    const auto distance = static_cast<core::Clock::rep>(batchSize - 1 - index);
    return arrival - distance * step_;
}

std::vector<core::Timestamp> TimestampSynthesizer::synthesize(core::usize batchSize,
                                                              core::Timestamp arrival) const
{
    std::vector<core::Timestamp> stamps;
    stamps.reserve(batchSize);
    for (core::usize i = 0; i < batchSize; ++i)
    {
        stamps.push_back(timestampAt(i, batchSize, arrival));
    }
    return stamps;
}

void TimestampSynthesizer::stampChannel(const ChannelPayload& payload,
                                        const Metadata& shared,
                                        core::Timestamp arrival,
                                        SampleBatch& out) const
{
    const auto batchSize = payload.values.size();
    for (core::usize i = 0; i < batchSize; ++i)
    {
        Sample sample;
        sample.amplitude = payload.values[i];
        sample.timestamp = timestampAt(i, batchSize, arrival);
        sample.channel   = payload.channel;
        sample.metadata  = shared;
        sample.metadata[std::string(meta::kBatchIndex)] = static_cast<core::i64>(i);
        sample.metadata[std::string(meta::kBatchSize)]  = static_cast<core::i64>(batchSize);
        if (payload.channel != Channel::kUnlabeled)
        {
            sample.metadata[std::string(meta::kWaveformType)] =
                std::string(channelMarker(payload.channel));
        }
        out.push_back(std::move(sample));
    }
}

SampleBatch TimestampSynthesizer::stamp(const Frame& frame,
                                        core::Timestamp arrival,
                                        std::string_view source) const
{
    SampleBatch batch;

    std::visit([&](const auto& decoded) {
        using T = std::decay_t<decltype(decoded)>;

        if constexpr (std::is_same_v<T, NoData>)
        {
            return;
        }
        else if constexpr (std::is_same_v<T, BareValue>)
        {
            stampChannel(ChannelPayload{Channel::kUnlabeled, {decoded.value}},
                         baseMetadata(source), arrival, batch);
        }
        else if constexpr (std::is_same_v<T, MultiChannelFrame>)
        {
            auto shared = baseMetadata(source);
            if (decoded.prefix)
            {
                const auto& prefix = *decoded.prefix;
                if (prefix.temperature)
                    shared[std::string(meta::kTemperature)] = *prefix.temperature;
                if (prefix.humidity)
                    shared[std::string(meta::kHumidity)] = *prefix.humidity;
                if (prefix.voltage)
                    shared[std::string(meta::kVoltage)] = *prefix.voltage;
            }
            if (const auto labeled = decoded.labeledChannelCount(); labeled > 0)
            {
                shared[std::string(meta::kDataType)] = std::string(dataTypeFor(labeled));
            }

            batch.reserve(decoded.sampleCount());
            for (const auto& payload : decoded.channels)
            {
                stampChannel(payload, shared, arrival, batch);
            }
        }
        else if constexpr (std::is_same_v<T, Envelope>)
        {
            Sample sample;
            sample.amplitude = decoded.amplitude;
            const bool representable = decoded.timestampMs &&
                *decoded.timestampMs >= -kMaxEnvelopeTimestampMs &&
                *decoded.timestampMs <= kMaxEnvelopeTimestampMs;
            sample.timestamp = representable
                ? core::Timestamp{std::chrono::milliseconds{*decoded.timestampMs}}
                : arrival;
            sample.channel   = Channel::kUnlabeled;
            sample.metadata  = decoded.metadata;
            for (auto& [key, value] : baseMetadata(source))
            {
                sample.metadata.insert_or_assign(key, std::move(value));
            }
            sample.metadata[std::string(meta::kBatchIndex)] = core::i64{0};
            sample.metadata[std::string(meta::kBatchSize)]  = core::i64{1};
            batch.push_back(std::move(sample));
        }
    }, frame);

    return batch;
}

} // namespace seis::protocol
