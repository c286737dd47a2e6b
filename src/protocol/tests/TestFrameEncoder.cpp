// /////////////////////////////////////////////////////////////////////////////
/// @file TestFrameEncoder.cpp
/// @brief Unit tests for FrameEncoder and TestSignalGenerator.
// /////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <seis/protocol/FrameDecoder.hpp>
#include <seis/protocol/FrameEncoder.hpp>
#include <seis/protocol/TestSignalGenerator.hpp>

#include <nlohmann/json.hpp>

#include <limits>

using namespace seis;
using namespace seis::protocol;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("FrameEncoder: wire layout", "[protocol][encoder]")
{
    FrameEncoder encoder{EncodeOptions{2}};

    const std::vector<core::f64> x{1.0, 2.5};
    const std::vector<core::f64> y{0.5};
    const std::vector<core::f64> z{3.0, 4.0};

    auto text = encoder.encodeChannels(MetadataPrefix{25, 60, 90}, x, y, z);
    REQUIRE(text.has_value());
    CHECK(*text == "T25H60V90,X1.00,2.50,Y0.50,Z3.00,4.00");

    auto noPrefix = encoder.encodeChannels(std::nullopt, x);
    REQUIRE(noPrefix.has_value());
    CHECK(*noPrefix == "X1.00,2.50");

    CHECK(encoder.encodeBare(3.14159) == "3.14");
    CHECK(encoder.encodeValues(x) == "1.00,2.50");
    CHECK(FrameEncoder::encodePrefix(MetadataPrefix{5, std::nullopt, std::nullopt}) == "T5HV");

    auto empty = encoder.encodeChannels(std::nullopt, {}, y);
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("FrameEncoder: shortest form by default", "[protocol][encoder]")
{
    FrameEncoder encoder;
    CHECK(encoder.encodeBare(0.1) == "0.1");
    CHECK(encoder.encodeBare(-2.0) == "-2");
}

TEST_CASE("FrameEncoder: decode(encode(frame)) preserves the frame", "[protocol][encoder]")
{
    FrameDecoder decoder;
    FrameEncoder encoder;

    for (const char* text : {"T25H60V90,X1,2,Y0.5,0.6,Z2.1,2.2",
                             "X1.25,-3.5",
                             "T1H2V3,7,8,9",
                             "X1,Z2"})
    {
        INFO(text);
        auto first = decoder.decode(text);
        REQUIRE(first.has_value());
        const auto& frame = std::get<MultiChannelFrame>(*first);

        auto encoded = encoder.encodeFrame(frame);
        REQUIRE(encoded.has_value());
        auto second = decoder.decode(*encoded);
        REQUIRE(second.has_value());
        const auto& again = std::get<MultiChannelFrame>(*second);

        CHECK(again.prefix == frame.prefix);
        REQUIRE(again.channels.size() == frame.channels.size());
        for (std::size_t i = 0; i < frame.channels.size(); ++i)
        {
            CHECK(again.channels[i].channel == frame.channels[i].channel);
            CHECK(again.channels[i].values == frame.channels[i].values);
        }
    }
}

TEST_CASE("FrameEncoder: every finite amplitude survives the wire", "[protocol][encoder]")
{
    using Limits = std::numeric_limits<core::f64>;
    const auto value = GENERATE(
        take(40, random(-1.0e6, 1.0e6)),
        take(10, random(-1.0e300, 1.0e300)),
        values({0.0, -0.0, 1.0e70, -1.0e70, 1.0e300, -1.0e-300,
                Limits::max(), Limits::lowest(), Limits::min(), Limits::denorm_min()}));
    CAPTURE(value);

    const std::vector<core::f64> x{value, 2.0};
    FrameDecoder decoder;
    auto decodeX = [&decoder](const core::Expected<std::string>& text) {
        REQUIRE(text.has_value());
        auto frame = decoder.decode(*text);
        REQUIRE(frame.has_value());
        const auto& multi = std::get<MultiChannelFrame>(*frame);
        REQUIRE(multi.droppedTokens == 0);
        REQUIRE(multi.channels.size() == 1);
        REQUIRE(multi.channels[0].values.size() == 2);
        CHECK(multi.channels[0].values[1] == 2.0);
        return multi.channels[0].values[0];
    };

    SECTION("shortest form is exact")
    {
        const auto back = decodeX(FrameEncoder{}.encodeChannels(std::nullopt, x));
        CHECK(back == value);
    }

    SECTION("fixed precision rounds only the fraction")
    {
        const FrameEncoder encoder{EncodeOptions{2}};
        CHECK_FALSE(encoder.encodeBare(value).empty());
        const auto back = decodeX(encoder.encodeChannels(std::nullopt, x));
        CHECK_THAT(back, WithinAbs(value, 0.005) || WithinRel(value, 1e-15));
    }
}

TEST_CASE("FrameEncoder: envelope is accepted by the decoder", "[protocol][encoder][envelope]")
{
    Sample sample;
    sample.amplitude = 1.5;
    sample.timestamp = core::Timestamp{std::chrono::milliseconds{1'700'000'000'250}};
    sample.metadata.emplace("station", std::string{"ST01"});
    sample.metadata.emplace("gain", core::i64{4});

    const auto text = FrameEncoder{}.encodeEnvelope(sample);
    const auto json = nlohmann::json::parse(text);
    CHECK(json.at("type") == "earthquake-data");
    CHECK(json.at("payload").at("timestamp") == 1'700'000'000'250);

    auto frame = FrameDecoder{}.decode(text);
    REQUIRE(frame.has_value());
    const auto& envelope = std::get<Envelope>(*frame);
    CHECK_THAT(envelope.amplitude, WithinAbs(1.5, 1e-12));
    CHECK(envelope.timestampMs == 1'700'000'000'250);
    CHECK(std::get<std::string>(envelope.metadata.at("station")) == "ST01");
    CHECK(std::get<core::i64>(envelope.metadata.at("gain")) == 4);
}

TEST_CASE("TestSignalGenerator: output decodes within the profile ranges", "[protocol][generator]")
{
    TestSignalGenerator gen{1234};
    const auto& profile = gen.profile();
    FrameDecoder decoder;

    SECTION("triple waveform")
    {
        auto frame = decoder.decode(gen.tripleWaveform(6, 4, 5));
        REQUIRE(frame.has_value());
        const auto& multi = std::get<MultiChannelFrame>(*frame);

        REQUIRE(multi.prefix.has_value());
        CHECK(*multi.prefix->temperature >= profile.temperatureMin);
        CHECK(*multi.prefix->temperature <= profile.temperatureMax);
        CHECK(*multi.prefix->humidity >= profile.humidityMin);
        CHECK(*multi.prefix->voltage <= profile.voltageMax);

        REQUIRE(multi.channels.size() == 3);
        CHECK(multi.channels[0].values.size() == 6);
        CHECK(multi.channels[1].values.size() == 4);
        CHECK(multi.channels[2].values.size() == 5);
        for (const auto value : multi.channels[0].values)
        {
            CHECK(value >= profile.xMin);
            CHECK(value <= profile.xMax);
        }
        for (const auto value : multi.channels[2].values)
        {
            CHECK(value >= profile.zMin);
            CHECK(value <= profile.zMax);
        }
    }

    SECTION("dual waveform")
    {
        auto frame = decoder.decode(gen.dualWaveform());
        REQUIRE(frame.has_value());
        CHECK(std::get<MultiChannelFrame>(*frame).labeledChannelCount() == 2);
    }

    SECTION("bare and unlabeled values")
    {
        auto single = decoder.decode(gen.single());
        REQUIRE(single.has_value());
        CHECK(std::holds_alternative<BareValue>(*single));

        auto multiple = decoder.decode(gen.multiple(7));
        REQUIRE(multiple.has_value());
        CHECK(std::get<MultiChannelFrame>(*multiple).sampleCount() == 7);
    }
}

TEST_CASE("TestSignalGenerator: same seed, same traffic", "[protocol][generator]")
{
    TestSignalGenerator a{99};
    TestSignalGenerator b{99};
    CHECK(a.tripleWaveform() == b.tripleWaveform());
    CHECK(a.single() == b.single());
}
