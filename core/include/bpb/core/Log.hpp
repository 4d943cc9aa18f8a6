/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Provides a static Log class backed by an injectable ILogger interface.
 * The default implementation writes to stderr with the time elapsed since
 * process start. A custom logger can be installed via Log::setLogger(),
 * which is how the tests capture diagnostics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_LOG_HPP
    #define BPB_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace bpb::core {

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

/** @brief Fixed-width label of a level ("DEBUG", "INFO ", ...). */
[[nodiscard]] std::string_view logLevelName(LogLevel level) noexcept;

/** @brief Parses "debug", "info", "warn", "error" or "fatal". */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "BLE", "GAMEPAD", "RELAY").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the bridge.
 *
 * The bridge core is single-threaded; the installed ILogger only needs to
 * be thread-safe when a BLE backend logs from its own delivery queue.
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

    static void debug(std::string_view msg) { debug("bpb", msg); }
    static void info (std::string_view msg) { info ("bpb", msg); }
    static void warn (std::string_view msg) { warn ("bpb", msg); }
    static void error(std::string_view msg) { error("bpb", msg); }
    static void fatal(std::string_view msg) { fatal("bpb", msg); }
};

} // namespace bpb::core

#endif // BPB_CORE_LOG_HPP
