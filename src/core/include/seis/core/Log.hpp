/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_LOG_HPP
    #define SEIS_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string>
    #include <string_view>

namespace seis::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/**
 * @brief Five-character name of @p level, padded so columns line up.
 */
[[nodiscard]] std::string_view logLevelName(LogLevel level) noexcept;

/**
 * @brief One line as the default sink prints it.
 *
 * `2023-11-14T22:13:20.123Z WARN  [SERIAL] port lost`, newline included.
 * The instant is UTC with millisecond precision, the same epoch clock that
 * stamps samples, so log lines and sample timestamps can be correlated.
 */
[[nodiscard]] std::string formatLogLine(Timestamp when, LogLevel level,
                                        std::string_view tag, std::string_view message);

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "SERIAL", "PUSH", "STREAM").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the pipeline.
 *
 * All methods are thread-safe provided the installed ILogger is thread-safe.
 * Transports log from their own threads.
 */
class Log final {
public:
    Log() = delete;

    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("seis", msg); }
    static void info (std::string_view msg) { info ("seis", msg); }
    static void warn (std::string_view msg) { warn ("seis", msg); }
    static void error(std::string_view msg) { error("seis", msg); }
    static void fatal(std::string_view msg) { fatal("seis", msg); }
};

} // namespace seis::core

#endif // SEIS_CORE_LOG_HPP
