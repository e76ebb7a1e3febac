/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr. A host application can
 * route the subsystem's messages into its own sink via Log::setLogger().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SKY_CORE_LOG_HPP
    #define SKY_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace sky::core {

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

[[nodiscard]] constexpr std::string_view toString(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::kDebug: return "DEBUG";
    case LogLevel::kInfo:  return "INFO";
    case LogLevel::kWarn:  return "WARN";
    case LogLevel::kError: return "ERROR";
    case LogLevel::kFatal: return "FATAL";
    }
    return "?????";
}

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "physics", "bench").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the library.
 *
 * Thread-safe provided the installed ILogger is thread-safe and the
 * logger / level are not swapped concurrently with logging.
 */
class Log final {
public:
    Log() = delete;

    /** @brief Installs @p logger; nullptr restores the stderr logger. */
    static void setLogger(ILogger *logger);
    [[nodiscard]] static ILogger *logger();
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("sky", msg); }
    static void info (std::string_view msg) { info ("sky", msg); }
    static void warn (std::string_view msg) { warn ("sky", msg); }
    static void error(std::string_view msg) { error("sky", msg); }
    static void fatal(std::string_view msg) { fatal("sky", msg); }
};

/**
 * @brief Routes Log to @p logger for the lifetime of the guard, then puts
 *        back the previous logger and minimum level.
 */
class ScopedLogger final {
public:
    explicit ScopedLogger(ILogger &logger, LogLevel minLevel = LogLevel::kDebug)
        : _previous(Log::logger()), _previousLevel(Log::minLevel())
    {
        Log::setLogger(&logger);
        Log::setMinLevel(minLevel);
    }

    ~ScopedLogger()
    {
        Log::setLogger(_previous);
        Log::setMinLevel(_previousLevel);
    }

    ScopedLogger(const ScopedLogger &)            = delete;
    ScopedLogger &operator=(const ScopedLogger &) = delete;

private:
    ILogger  *_previous;
    LogLevel  _previousLevel;
};

} // namespace sky::core

#endif // SKY_CORE_LOG_HPP
