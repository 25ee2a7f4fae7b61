/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at startup (tests install a capturing
 * sink this way).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef CINDER_CORE_LOG_HPP
    #define CINDER_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace cinder::core {

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
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "SaveSync", "Arq", "Persist").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the console runtime.
 *
 * Dispatch is serialised internally, so the persistence writer thread and
 * the main thread may log concurrently.
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

    static void debug(std::string_view msg) { debug("cinder", msg); }
    static void info (std::string_view msg) { info ("cinder", msg); }
    static void warn (std::string_view msg) { warn ("cinder", msg); }
    static void error(std::string_view msg) { error("cinder", msg); }
    static void fatal(std::string_view msg) { fatal("cinder", msg); }
};

} // namespace cinder::core

#endif // CINDER_CORE_LOG_HPP
