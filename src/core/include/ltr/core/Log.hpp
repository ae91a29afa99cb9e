/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr, prefixing every line with
 * the time elapsed since the first log call so tick, broadcast and
 * failure-check cadences can be read off a peer's output. A custom logger
 * can be installed via Log::setLogger() before the peer loops start.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-17
 * @copyright MIT License
 */
#pragma once

#ifndef LTR_CORE_LOG_HPP
    #define LTR_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace ltr::core {

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

/** @brief Fixed-width level name ("DEBUG", "INFO ", ...). */
[[nodiscard]] std::string_view toString(LogLevel level) noexcept;

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "NET", "SIM", "NODE").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout LightTrail.
 *
 * Dispatch is serialised internally, so sinks are never entered by two
 * loops at once.
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

    static void debug(std::string_view msg) { debug("ltr", msg); }
    static void info (std::string_view msg) { info ("ltr", msg); }
    static void warn (std::string_view msg) { warn ("ltr", msg); }
    static void error(std::string_view msg) { error("ltr", msg); }
    static void fatal(std::string_view msg) { fatal("ltr", msg); }
};

} // namespace ltr::core

#endif // LTR_CORE_LOG_HPP
