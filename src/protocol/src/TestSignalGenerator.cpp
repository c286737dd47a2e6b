// /////////////////////////////////////////////////////////////////////////////
/// @file TestSignalGenerator.cpp
/// @brief TestSignalGenerator implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <seis/protocol/TestSignalGenerator.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace seis::protocol {

TestSignalGenerator::TestSignalGenerator(core::u64 seed, TestSignalProfile profile)
    : profile_{profile}
    , encoder_{EncodeOptions{2}}
{
    if (seed == 0)
        seed = static_cast<core::u64>(std::chrono::steady_clock::now().time_since_epoch().count());
    rng_.seed(seed);
}

std::vector<core::f64> TestSignalGenerator::values(core::usize count, core::f64 min, core::f64 max)
{
    std::uniform_real_distribution<core::f64> dist{min, max};
    std::vector<core::f64> out;
    out.reserve(count);
    for (core::usize i = 0; i < count; ++i)
    {
        // Round now so the decoded value equals the generated one.
        out.push_back(std::round(dist(rng_) * 100.0) / 100.0);
    }
    return out;
}

MetadataPrefix TestSignalGenerator::environment()
{
    std::uniform_int_distribution<core::i64> temperature{profile_.temperatureMin, profile_.temperatureMax};
    std::uniform_int_distribution<core::i64> humidity{profile_.humidityMin, profile_.humidityMax};
    std::uniform_int_distribution<core::i64> voltage{profile_.voltageMin, profile_.voltageMax};

    MetadataPrefix prefix;
    prefix.temperature = temperature(rng_);
    prefix.humidity    = humidity(rng_);
    prefix.voltage     = voltage(rng_);
    return prefix;
}

std::string TestSignalGenerator::single()
{
    return encoder_.encodeBare(values(1, profile_.bareMin, profile_.bareMax).front());
}

std::string TestSignalGenerator::multiple(core::usize count)
{
    return encoder_.encodeValues(values(std::max<core::usize>(count, 1),
                                        profile_.bareMin, profile_.bareMax));
}

std::string TestSignalGenerator::labeled(const std::vector<core::f64>& x,
                                         const std::vector<core::f64>& y,
                                         const std::vector<core::f64>& z)
{
    // x is never empty here, so encoding cannot fail.
    auto text = encoder_.encodeChannels(environment(), x, y, z);
    return text ? std::move(*text) : std::string{};
}

std::string TestSignalGenerator::dualWaveform(core::usize xCount, core::usize yCount)
{
    const auto x = values(std::max<core::usize>(xCount, 1), profile_.xMin, profile_.xMax);
    const auto y = values(yCount, profile_.yMin, profile_.yMax);
    return labeled(x, y, {});
}

std::string TestSignalGenerator::tripleWaveform(core::usize xCount, core::usize yCount, core::usize zCount)
{
    const auto x = values(std::max<core::usize>(xCount, 1), profile_.xMin, profile_.xMax);
    const auto y = values(yCount, profile_.yMin, profile_.yMax);
    const auto z = values(zCount, profile_.zMin, profile_.zMax);
    return labeled(x, y, z);
}

} // namespace seis::protocol
