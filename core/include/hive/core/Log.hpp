/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr.  A custom logger can be
 * installed via Log::setLogger() at runtime startup.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_LOG_HPP
    #define HIVE_CORE_LOG_HPP

    #include "Types.hpp"

    #include <string_view>

namespace hive::core {

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
 *
 * Systems log from worker threads, so implementations must be
 * thread-safe.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "ECS", "Scheduler", "Host").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the runtime.
 */
class Log final {
public:
    Log() = delete;

    /** @brief Installs @p logger; nullptr restores the stderr sink. */
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);

    /** @brief Tests whether a message of @p level would be emitted. */
    [[nodiscard]] static bool isEnabled(LogLevel level);

    static void debug(std::string_view tag, std::string_view msg);
    static void info (std::string_view tag, std::string_view msg);
    static void warn (std::string_view tag, std::string_view msg);
    static void error(std::string_view tag, std::string_view msg);
    static void fatal(std::string_view tag, std::string_view msg);

    static void debug(std::string_view msg) { debug("hive", msg); }
    static void info (std::string_view msg) { info ("hive", msg); }
    static void warn (std::string_view msg) { warn ("hive", msg); }
    static void error(std::string_view msg) { error("hive", msg); }
    static void fatal(std::string_view msg) { fatal("hive", msg); }
};

} // namespace hive::core

#endif // HIVE_CORE_LOG_HPP
