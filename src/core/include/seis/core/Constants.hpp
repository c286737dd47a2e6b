/**
 * @file Constants.hpp
 * @brief Pipeline-wide compile-time constants.
 *
 * Default timing, buffer and transport parameters.  Every value here can be
 * overridden at runtime through the configuration builders.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_CONSTANTS_HPP
    #define SEIS_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <chrono>
    #include <string_view>

namespace seis::core {

inline constexpr std::chrono::milliseconds kDefaultSampleStep{10};

inline constexpr usize kMaxLineLength        = 4096;
inline constexpr usize kReadChunkSize        = 256;
inline constexpr std::chrono::milliseconds kDefaultReadTimeout{100};
inline constexpr std::chrono::milliseconds kDefaultConnectTimeout{3000};

inline constexpr u32   kDefaultBaudRate      = 115'200;
inline constexpr u16   kDefaultPushPort      = 5001;
inline constexpr usize kDefaultQueueCapacity = 1024;

inline constexpr std::string_view kEarthquakeDataType = "earthquake-data";
inline constexpr std::string_view kExternalSource     = "external";

} // namespace seis::core

#endif // SEIS_CORE_CONSTANTS_HPP
