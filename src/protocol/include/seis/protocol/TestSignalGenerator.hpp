// /////////////////////////////////////////////////////////////////////////////
/// @file TestSignalGenerator.hpp
/// @brief Seeded generator of simulated sensor traffic in wire form.
///
/// Used to exercise a receiving end without hardware: values are rendered
/// with two fraction digits, the way field units print them.
///
/// @code
///   TestSignalGenerator gen(42);
///   transport.write(gen.tripleWaveform());   // "T27H55V81,X3.14,...,Y...,Z..."
/// @endcode
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <seis/protocol/Frame.hpp>
#include <seis/protocol/FrameEncoder.hpp>
#include <seis/core/Types.hpp>

#include <random>
#include <string>
#include <vector>

namespace seis::protocol {

/// @brief Value ranges of the simulated sensor.
struct TestSignalProfile
{
    core::i64 temperatureMin{20};
    core::i64 temperatureMax{34};
    core::i64 humidityMin{40};
    core::i64 humidityMax{79};
    core::i64 voltageMin{75};
    core::i64 voltageMax{94};

    core::f64 bareMin{0.0};
    core::f64 bareMax{10.0};
    core::f64 xMin{1.0};
    core::f64 xMax{6.0};
    core::f64 yMin{0.5};
    core::f64 yMax{3.5};
    core::f64 zMin{2.0};
    core::f64 zMax{6.0};
};

class TestSignalGenerator final
{
public:
    /// @param seed PRNG seed (0 = time-based).
    explicit TestSignalGenerator(core::u64 seed = 0, TestSignalProfile profile = {});

    /// @brief One bare value.
    [[nodiscard]] std::string single();

    /// @brief @p count unlabeled comma-joined values.
    [[nodiscard]] std::string multiple(core::usize count = 5);

    /// @brief `T..H..V..,X..,Y..`.
    [[nodiscard]] std::string dualWaveform(core::usize xCount = 6, core::usize yCount = 4);

    /// @brief `T..H..V..,X..,Y..,Z..`.
    [[nodiscard]] std::string tripleWaveform(core::usize xCount = 6,
                                             core::usize yCount = 4,
                                             core::usize zCount = 5);

    /// @brief Random environment header within the profile ranges.
    [[nodiscard]] MetadataPrefix environment();

    [[nodiscard]] const TestSignalProfile& profile() const noexcept { return profile_; }

private:
    [[nodiscard]] std::vector<core::f64> values(core::usize count, core::f64 min, core::f64 max);
    [[nodiscard]] std::string labeled(const std::vector<core::f64>& x,
                                      const std::vector<core::f64>& y,
                                      const std::vector<core::f64>& z);

    TestSignalProfile profile_;
    FrameEncoder      encoder_;
    std::mt19937_64   rng_;
};

} // namespace seis::protocol
