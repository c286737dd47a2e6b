/**
 * @file Log.cpp
 * @brief Log dispatch and the default stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "seis/core/Log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace seis::core {

namespace {

/// Serial, push and stream threads all log; a line is written whole.
class StderrLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const auto line = formatLogLine(Clock::now(), level, tag, message);
        std::lock_guard lock{_mutex};
        std::fwrite(line.data(), 1, line.size(), stderr);
    }

private:
    std::mutex _mutex;
};

StderrLogger           gDefaultLogger;
std::atomic<ILogger *> gActiveLogger{&gDefaultLogger};
std::atomic<LogLevel>  gMinLevel{LogLevel::kInfo};

void dispatch(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (level < gMinLevel.load(std::memory_order_relaxed))
        return;
    gActiveLogger.load()->write(level, tag, msg);
}

} // anonymous namespace

std::string_view logLevelName(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo:  return "INFO ";
        case LogLevel::kWarn:  return "WARN ";
        case LogLevel::kError: return "ERROR";
        case LogLevel::kFatal: return "FATAL";
    }
    return "?????";
}

std::string formatLogLine(Timestamp when, LogLevel level,
                          std::string_view tag, std::string_view message)
{
    const auto sinceEpoch = when.time_since_epoch();
    const auto seconds    = std::chrono::floor<std::chrono::seconds>(sinceEpoch);
    const auto millis     = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch - seconds);

    const auto raw = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    if (::gmtime_r(&raw, &utc) == nullptr)
        utc = std::tm{};

    char stamp[40];
    const auto length = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &utc);
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%03dZ ", static_cast<int>(millis.count()));

    std::string line;
    line.reserve(length + tag.size() + message.size() + 20);
    line.append(stamp, length);
    line += fraction;
    line += logLevelName(level);
    line += " [";
    line += tag;
    line += "] ";
    line += message;
    line += '\n';
    return line;
}

void Log::setLogger(ILogger *logger)  { gActiveLogger.store(logger ? logger : &gDefaultLogger); }
void Log::setMinLevel(LogLevel level) { gMinLevel.store(level); }
LogLevel Log::minLevel()              { return gMinLevel.load(); }

void Log::debug(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kDebug, tag, msg); }
void Log::info (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kInfo,  tag, msg); }
void Log::warn (std::string_view tag, std::string_view msg) { dispatch(LogLevel::kWarn,  tag, msg); }
void Log::error(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kError, tag, msg); }
void Log::fatal(std::string_view tag, std::string_view msg) { dispatch(LogLevel::kFatal, tag, msg); }

} // namespace seis::core
