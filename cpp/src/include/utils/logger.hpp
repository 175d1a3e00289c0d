/*******************************************************************************
 * @file logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Command-Queue Pattern**
 *
 * 1.  **Non-Blocking API**: Calls from application threads (e.g. `LOGGER_INFO(...)`)
 *     format the message and push a command into a bounded queue.
 * 2.  **Asynchronous Worker Thread**: A single background thread is the sole consumer
 *     of the queue. It performs all I/O and owns the active sink.
 * 3.  **Sink Abstraction**: `Sink` defines write/flush; `ConsoleSink` (stderr) and
 *     `FileSink` are the concrete destinations.
 * 4.  **Back-pressure**: Past the soft limit new log messages are dropped (control
 *     commands still pass); past twice the limit everything is dropped. A warning and
 *     a summary of dropped messages are written when the queue drains.
 *
 * The logger is a lifecycle module. Using it before `Logger::GetLifecycleModule()`
 * has been started by the LifecycleManager is a fatal error; after shutdown, calls
 * are silently ignored.
 *
 * **Usage**
 * ```cpp
 * LOGGER_INFO("Worker: task '{}' done in {:.3f}s", id, secs);
 *
 * auto &logger = Logger::instance();
 * logger.set_logfile("/var/log/zworkers/pool.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 * ```
 ******************************************************************************/
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/module_def.hpp"
#include "zworkers_utils_export.h"

// Default initial reserve for fmt::memory_buffer used by Logger::log_fmt.
#ifndef LOGGER_FMT_BUFFER_RESERVE
#define LOGGER_FMT_BUFFER_RESERVE (1024u)
#endif

namespace zworkers::utils
{

class ZWORKERS_UTILS_EXPORT Logger
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

    static Logger &instance();

    /**
     * @brief The lifecycle module for the logger ("zworkers::utils::Logger").
     * Starting it launches the worker thread; shutting it down drains the queue.
     */
    static ModuleDef GetLifecycleModule();

    /**
     * @brief True once the logger module has been started (and stays true after shutdown).
     */
    static bool lifecycle_initialized() noexcept;

    /**
     * @brief Maps "trace", "debug", "info", "warn"/"warning", "error", "system"
     *        (case-insensitive) to a level.
     */
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks / Configuration ---
    // Sink switches are executed in order by the worker thread. These calls block
    // until the switch has been applied and return whether it succeeded.

    /**
     * @brief Switch logging to the console (stderr).
     */
    bool set_console();

    /**
     * @brief Switch logging to a file, with advisory locking enabled.
     */
    bool set_logfile(const std::string &utf8_path);

    /**
     * @brief Switch logging to a file.
     * @param use_flock If true, each write holds an advisory flock on the file.
     * @return false if the file could not be opened; the previous sink stays active and
     *         the write error callback (if any) receives the reason.
     */
    bool set_logfile(const std::string &utf8_path, bool use_flock);

    /**
     * @brief Blocks until the worker thread has processed every message queued so far.
     */
    void flush();

    /**
     * @brief Drains the queue and stops the worker thread. Normally called by the
     *        lifecycle module's shutdown callback.
     */
    void shutdown();

    void set_level(Level lvl);
    Level level() const;

    void set_max_queue_size(size_t max_size);
    size_t get_max_queue_size() const;
    size_t get_total_dropped_since_sink_switch() const;

    /**
     * @brief Enables or disables the "Switching log sink to" / "Log sink switched from"
     *        lines written around a sink switch. Enabled by default.
     */
    void set_log_sink_messages_enabled(bool enabled);

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

    // --- Runtime Path ---
    template <typename... Args>
    void log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept;

    template <typename... Args> void trace_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_TRACE, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void debug_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_DEBUG, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void info_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_INFO, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void warn_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_WARNING, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void error_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_ERROR, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args> void system_fmt_rt(fmt::string_view fmt_str, Args &&...args) noexcept
    {
        log_fmt_runtime(Level::L_SYSTEM, fmt_str, std::forward<Args>(args)...);
    }

  private:
    Logger();

    struct Impl;
    std::unique_ptr<Impl> pImpl;

    friend void do_logger_startup(const char *arg);
    friend void do_logger_shutdown(const char *arg);

    bool enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept;
    bool enqueue_log(Level lvl, std::string &&body) noexcept;

    bool should_log(Level lvl) const noexcept;
};

// --- Compile-Time Log Level ---
#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

// ----------------- Template implementation (must be in header) -----------------

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            fmt::memory_buffer mb;
            mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
            fmt::format_to(std::back_inserter(mb), fmt_str, std::forward<Args>(args)...);
            enqueue_log(lvl, std::move(mb));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

template <typename... Args>
void Logger::log_fmt_runtime(Level lvl, fmt::string_view fmt_str, Args &&...args) noexcept
{
    if (!should_log(lvl))
        return;

    try
    {
        fmt::memory_buffer mb;
        mb.reserve(LOGGER_FMT_BUFFER_RESERVE);
        fmt::format_to(std::back_inserter(mb), fmt::runtime(fmt_str), std::forward<Args>(args)...);
        enqueue_log(lvl, std::move(mb));
    }
    catch (const std::exception &ex)
    {
        enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
    }
}

} // namespace zworkers::utils

// --- Macro Implementation ---
#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::zworkers::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::zworkers::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::zworkers::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::zworkers::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::zworkers::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::zworkers::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)

#define LOGGER_INFO_RT(fmt, ...)                                                                   \
    ::zworkers::utils::Logger::instance().info_fmt_rt(fmt __VA_OPT__(, ) __VA_ARGS__)
