/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every SeisLink module.
 *
 * Provides fixed-width integer aliases, floating-point aliases and the
 * clock used for sample timestamps.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_TYPES_HPP
    #define SEIS_CORE_TYPES_HPP

    #include <chrono>
    #include <cstddef>
    #include <cstdint>

namespace seis::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8  = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

using byte = std::byte;

/**
 * @brief Wall clock used for every sample timestamp.
 *
 * Timestamps are absolute instants (not steady-clock offsets) because they
 * are compared against data coming from other hosts.
 */
using Clock     = std::chrono::system_clock;
using Timestamp = Clock::time_point;

} // namespace seis::core

#endif // SEIS_CORE_TYPES_HPP
