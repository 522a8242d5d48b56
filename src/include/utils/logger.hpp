/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logger passed by reference into components.
 *
 * **Command-Queue Pattern**
 * 1.  **Non-Blocking API**: `SFX_LOG_INFO(logger, ...)` formats the message on the
 *     calling thread and pushes it onto a queue. Configuration calls (changing the
 *     sink, flushing) are queued as commands in the same stream, preserving order.
 * 2.  **Worker Thread**: One background thread per Logger drains the queue in batches
 *     and is the only thread that touches the active sink.
 * 3.  **Sinks**: `ConsoleSink` (stderr, the default) and `FileSink`.
 * 4.  **Back-pressure**: log messages beyond the soft queue limit are dropped and
 *     counted; a summary of dropped messages is written once the queue drains.
 * 5.  **Errors**: sink write failures are reported through the write-error callback,
 *     which runs on a separate dispatcher thread so it may itself block.
 *
 * **Ownership**
 * There is no process-wide instance. The application creates a Logger (usually in
 * `main`) and passes it by reference to the components that log; the Logger must
 * outlive them. The destructor shuts the worker down after draining the queue.
 *
 * **Usage**
 * ```cpp
 * scenefix::utils::Logger logger;
 * logger.set_level(Logger::Level::L_DEBUG);
 * logger.set_logfile("/var/log/scenefix.log");
 * SFX_LOG_INFO(logger, "Repairing {}", path.string());
 * ```
 ******************************************************************************/

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "scenefix_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef SCENEFIX_LOG_FMT_BUFFER_RESERVE
#define SCENEFIX_LOG_FMT_BUFFER_RESERVE (1024u)
#endif

// Messages below this level are compiled out. 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#ifndef SCENEFIX_LOG_COMPILE_LEVEL
#define SCENEFIX_LOG_COMPILE_LEVEL 0
#endif

namespace scenefix::utils
{

class SCENEFIX_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    /** @brief Starts the worker thread with a console (stderr) sink at level INFO. */
    Logger();

    /** @brief Drains the queue and joins the worker (see shutdown()). */
    ~Logger();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    // --- Sinks ---
    // Each call blocks until the worker has installed the new sink, so messages logged
    // afterwards are guaranteed to reach it. Returns false if the sink could not be
    // created; the previous sink stays active and the write-error callback is invoked.

    /** @brief Switch logging to the console (stderr). */
    bool set_console();

    /**
     * @brief Switch logging to a file opened in append mode.
     * @param utf8_path Path to the log file.
     * @param use_flock If true, wrap every write in an advisory `flock` (POSIX).
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock = true);

    /**
     * @brief Gracefully shuts down the logger.
     *
     * Blocks until the worker has written every queued message and exited. Further log
     * calls are discarded. Idempotent.
     */
    void shutdown();

    /**
     * @brief Blocks until every message queued before this call has been written and the
     *        sink flushed.
     */
    void flush();

    // --- Configuration & Diagnostics ---
    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Sets a callback invoked with a description of every sink failure.
     *
     * The callback runs on a dispatcher thread, never on the worker or the caller.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /** @brief Enables or disables the "Switching log sink" records written on sink changes. */
    void set_log_sink_messages_enabled(bool enabled);

    [[nodiscard]] bool should_log(Level lvl) const noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

  private:
    bool enqueue_log(Level lvl, std::string &&body) noexcept;

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * @brief Parses a level name ("trace", "debug", "info", "warning"/"warn", "error",
 *        "system"; case-insensitive).
 */
SCENEFIX_UTILS_EXPORT std::optional<Logger::Level> level_from_string(std::string_view name);

SCENEFIX_UTILS_EXPORT const char *level_to_string(Logger::Level lvl) noexcept;

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= SCENEFIX_LOG_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(SCENEFIX_LOG_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::string(mb.data(), mb.size()));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
        catch (...)
        {
            enqueue_log(lvl, "[UNKNOWN FORMAT ERROR]");
        }
    }
}

} // namespace scenefix::utils

// --- Macro Implementation ---
#define SFX_LOG_TRACE(logger, fmt, ...)                                                            \
    (logger).trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define SFX_LOG_DEBUG(logger, fmt, ...)                                                            \
    (logger).debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define SFX_LOG_INFO(logger, fmt, ...)                                                             \
    (logger).info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define SFX_LOG_WARN(logger, fmt, ...)                                                             \
    (logger).warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define SFX_LOG_ERROR(logger, fmt, ...)                                                            \
    (logger).error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define SFX_LOG_SYSTEM(logger, fmt, ...)                                                           \
    (logger).system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
