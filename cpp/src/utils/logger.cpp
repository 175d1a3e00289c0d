/*******************************************************************************
 * @file logger.cpp
 * @brief Implementation of the asynchronous logger.
 ******************************************************************************/

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#include "zw_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"

#include "utils/logger_sinks/console_sink.hpp"
#include "utils/logger_sinks/file_sink.hpp"
#include "utils/logger_sinks/sink.hpp"

#include <sys/types.h>

using zworkers::format_tools::make_buffer;

namespace zworkers::utils
{

// Represents the lifecycle state of the logger.
enum class LoggerState
{
    Uninitialized,
    Initialized,
    ShuttingDown,
    Shutdown
};

static std::atomic<LoggerState> g_logger_state{LoggerState::Uninitialized};

// Using the logger before its module started is a programming error.
static bool logger_is_loggable(const char *function_name)
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state == LoggerState::Uninitialized)
    {
        ZW_PANIC("Logger method '{}' was called before the Logger module was "
                 "initialized via LifecycleManager. Aborting.",
                 function_name);
    }
    return state == LoggerState::Initialized;
}

namespace
{
LogMessage make_system_message(Logger::Level lvl, fmt::memory_buffer &&body)
{
    return LogMessage{.timestamp = std::chrono::system_clock::now(),
                      .process_id = zworkers::platform::get_pid(),
                      .thread_id = zworkers::platform::get_native_thread_id(),
                      .level = static_cast<int>(lvl),
                      .body = std::move(body)};
}
} // namespace

// Command Definitions
struct SetSinkCommand
{
    std::unique_ptr<Sink> new_sink;
    std::shared_ptr<std::promise<bool>> promise;
};
struct SinkCreationErrorCommand
{
    std::string error_message;
    std::shared_ptr<std::promise<bool>> promise;
};
struct FlushCommand
{
    std::shared_ptr<std::promise<bool>> promise;
};
struct SetLogSinkMessagesCommand
{
    bool enabled;
    std::shared_ptr<std::promise<bool>> promise;
};

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetLogSinkMessagesCommand>;

template <typename T> void promise_set_safe(const std::shared_ptr<std::promise<T>> &p, T value)
{
    if (!p)
        return;
    try
    {
        p->set_value(std::move(value));
    }
    catch (const std::future_error &)
    {
        // Already satisfied: a rejected command may be answered twice during shutdown.
    }
}

struct Logger::Impl
{
    Impl();
    ~Impl();
    void start_worker();
    void worker_loop();
    bool enqueue_command(Command &&cmd);
    void reject_command(Command &cmd);
    void report_error(const std::string &msg);
    void switch_sink(SetSinkCommand &cmd);
    void shutdown();

    std::thread worker_thread_;
    std::unique_ptr<Sink> sink_;
    size_t m_max_queue_size{10000};
    std::chrono::system_clock::time_point m_dropping_since;
    std::vector<Command> queue_;
    std::condition_variable cv_;
    std::mutex queue_mutex_;
    std::mutex m_sink_mutex;
    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};
    std::atomic<bool> m_log_sink_messages_enabled_{true};
    std::atomic<bool> m_was_dropping{false};
    std::atomic<size_t> m_messages_dropped{0};                // batch counter for the summary line
    std::atomic<size_t> m_total_dropped_since_sink_switch{0}; // reset on sink switch
};

Logger::Impl::Impl() : sink_(std::make_unique<ConsoleSink>()) {}

Logger::Impl::~Impl()
{
    if (worker_thread_.joinable() && !shutdown_requested_.load())
    {
        ZW_DEBUG("**HIGH ALERT: Logger Impl destructor called without prior shutdown. Check "
                 "lifecycle management.**");
    }
    if (worker_thread_.joinable())
    {
        // Never destroy a joinable std::thread.
        shutdown();
    }
}

void Logger::Impl::start_worker()
{
    if (!worker_thread_.joinable())
    {
        worker_thread_ = std::thread(&Logger::Impl::worker_loop, this);
    }
}

void Logger::Impl::reject_command(Command &cmd)
{
    std::visit(
        [](auto &&arg)
        {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (!std::is_same_v<T, LogMessage>)
            {
                promise_set_safe(arg.promise, false);
            }
        },
        cmd);
}

void Logger::Impl::report_error(const std::string &msg)
{
    // The sink itself is the failing party; only the debug channel is left.
    ZW_DEBUG("Logger error: {}", msg);
    (void)msg;
}

bool Logger::Impl::enqueue_command(Command &&cmd)
{
    if (shutdown_requested_.load(std::memory_order_relaxed))
    {
        reject_command(cmd);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.load(std::memory_order_acquire))
        {
            reject_command(cmd);
            return false;
        }

        const size_t current_queue_size = queue_.size();
        const size_t max_queue_size_soft = m_max_queue_size;
        const size_t max_queue_size_hard = m_max_queue_size * 2;

        // Past the hard limit everything is dropped; past the soft limit only log lines.
        const bool over_hard = current_queue_size >= max_queue_size_hard;
        const bool over_soft =
            current_queue_size >= max_queue_size_soft && std::holds_alternative<LogMessage>(cmd);
        if (over_hard || over_soft)
        {
            m_messages_dropped.fetch_add(1, std::memory_order_relaxed);
            m_total_dropped_since_sink_switch.fetch_add(1, std::memory_order_relaxed);
            if (!m_was_dropping.exchange(true, std::memory_order_relaxed))
            {
                m_dropping_since = std::chrono::system_clock::now();
            }
            reject_command(cmd);
            return false;
        }

        queue_.emplace_back(std::move(cmd));
    }
    cv_.notify_one();
    return true;
}

void Logger::Impl::switch_sink(SetSinkCommand &cmd)
{
    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
    if (m_log_sink_messages_enabled_.load(std::memory_order_relaxed))
    {
        std::string old_desc = sink_ ? sink_->description() : "null";
        std::string new_desc = cmd.new_sink ? cmd.new_sink->description() : "null";
        if (sink_)
        {
            sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Switching log sink to: {}", new_desc)),
                         Sink::ASYNC_WRITE);
            sink_->flush();
        }
        sink_ = std::move(cmd.new_sink);
        if (sink_)
        {
            sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                             make_buffer("Log sink switched from: {}", old_desc)),
                         Sink::ASYNC_WRITE);
        }
    }
    else
    {
        sink_ = std::move(cmd.new_sink);
    }
    m_total_dropped_since_sink_switch.store(0, std::memory_order_relaxed);
    promise_set_safe(cmd.promise, true);
}

void Logger::Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool was_dropping = false;
        size_t dropped_count = 0;
        double dropping_duration_s = 0.0;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            local_queue.swap(queue_);

            if (m_was_dropping.exchange(false, std::memory_order_relaxed))
            {
                was_dropping = true;
                dropped_count = m_messages_dropped.exchange(0, std::memory_order_relaxed);
                if (dropped_count > 0)
                {
                    dropping_duration_s =
                        std::chrono::duration_cast<std::chrono::duration<double>>(
                            std::chrono::system_clock::now() - m_dropping_since)
                            .count();
                }
            }

            if (shutdown_requested_.load())
            {
                g_logger_state.store(LoggerState::ShuttingDown, std::memory_order_release);
            }
        }

        if (was_dropping && dropped_count > 0)
        {
            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(
                        make_system_message(Logger::Level::L_WARNING,
                                            make_buffer("Overflow detected when processing the "
                                                        "queue. Messages may have been dropped "
                                                        "in the following batch.")),
                        Sink::ASYNC_WRITE);
                }
                catch (const std::exception &e)
                {
                    report_error(fmt::format("Logger sink write error: {}", e.what()));
                }
            }
        }

        // Only the last sink switch of a batch is applied; earlier ones are answered false.
        ssize_t last_set_sink_idx = -1;
        for (ssize_t i = static_cast<ssize_t>(local_queue.size()) - 1; i >= 0; --i)
        {
            if (std::holds_alternative<SetSinkCommand>(local_queue[i]))
            {
                last_set_sink_idx = i;
                break;
            }
        }

        for (ssize_t i = 0; i < static_cast<ssize_t>(local_queue.size()); ++i)
        {
            try
            {
                if (auto *msg = std::get_if<LogMessage>(&local_queue[i]))
                {
                    std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                    if (sink_ &&
                        msg->level >= static_cast<int>(level_.load(std::memory_order_relaxed)))
                    {
                        sink_->write(*msg, Sink::ASYNC_WRITE);
                    }
                    continue;
                }

                std::visit(
                    [&, this, i](auto &&arg)
                    {
                        using T = std::decay_t<decltype(arg)>;

                        if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            if (i != last_set_sink_idx)
                            {
                                promise_set_safe(arg.promise, false);
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                            promise_set_safe(arg.promise, false);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                            if (sink_)
                            {
                                sink_->flush();
                            }
                            promise_set_safe(arg.promise, true);
                        }
                        else if constexpr (std::is_same_v<T, SetLogSinkMessagesCommand>)
                        {
                            m_log_sink_messages_enabled_.store(arg.enabled,
                                                               std::memory_order_relaxed);
                            promise_set_safe(arg.promise, true);
                        }
                    },
                    local_queue[i]);
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }

        try
        {
            if (was_dropping && dropped_count > 0)
            {
                std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
                if (sink_)
                {
                    sink_->write(make_system_message(
                                     Logger::Level::L_WARNING,
                                     make_buffer("Summary: At this point in time, the Logger "
                                                 "dropped {} messages over {:.2f}s due to full "
                                                 "queue.",
                                                 dropped_count, dropping_duration_s)),
                                 Sink::ASYNC_WRITE);
                }
            }

            if (last_set_sink_idx != -1)
            {
                if (auto *sink_cmd = std::get_if<SetSinkCommand>(&local_queue[last_set_sink_idx]))
                {
                    switch_sink(*sink_cmd);
                }
            }
        }
        catch (const std::exception &e)
        {
            report_error(fmt::format("Logger worker error: {}", e.what()));
        }

        local_queue.clear();

        if (shutdown_requested_.load() && (g_logger_state.load() == LoggerState::ShuttingDown ||
                                           g_logger_state.load() == LoggerState::Shutdown))
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (!queue_.empty())
            {
                ZW_DEBUG("Logger worker found {} messages in queue during shutdown. "
                         "Reprocessing...",
                         queue_.size());
                lock.unlock();
                continue;
            }

            std::lock_guard<std::mutex> sink_lock(m_sink_mutex);
            if (sink_)
            {
                try
                {
                    sink_->write(make_system_message(Logger::Level::L_SYSTEM,
                                                     make_buffer("Logger is shutting down.")),
                                 Sink::ASYNC_WRITE);
                    sink_->flush();
                }
                catch (const std::exception &e)
                {
                    fmt::print(stderr, "[LOGGER] final write failed: {}\n", e.what());
                }
            }
            g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
            break;
        }
    }
}

void Logger::Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
    {
        return;
    }
    cv_.notify_one();
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}
Logger::~Logger() = default;

Logger &Logger::instance()
{
    static Logger instance;
    return instance;
}

bool Logger::lifecycle_initialized() noexcept
{
    return g_logger_state.load(std::memory_order_acquire) != LoggerState::Uninitialized;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return Level::L_TRACE;
    if (lower == "debug")
        return Level::L_DEBUG;
    if (lower == "info")
        return Level::L_INFO;
    if (lower == "warn" || lower == "warning")
        return Level::L_WARNING;
    if (lower == "error")
        return Level::L_ERROR;
    if (lower == "system")
        return Level::L_SYSTEM;
    return std::nullopt;
}

bool Logger::set_console()
{
    if (!logger_is_loggable("Logger::set_console"))
        return false;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>(), promise});
    return future.get();
}

bool Logger::set_logfile(const std::string &utf8_path)
{
    return set_logfile(utf8_path, true);
}

bool Logger::set_logfile(const std::string &utf8_path, bool use_flock)
{
    if (!logger_is_loggable("Logger::set_logfile"))
        return false;
    try
    {
        auto promise = std::make_shared<std::promise<bool>>();
        auto future = promise->get_future();
        pImpl->enqueue_command(
            SetSinkCommand{std::make_unique<FileSink>(utf8_path, use_flock), promise});
        return future.get();
    }
    catch (const std::exception &e)
    {
        auto promise_err = std::make_shared<std::promise<bool>>();
        auto future_err = promise_err->get_future();
        pImpl->enqueue_command(SinkCreationErrorCommand{
            fmt::format("Failed to create FileSink: {}", e.what()), promise_err});
        (void)future_err.get(); // wait until it is processed; the answer is always false
    }
    return false;
}

void Logger::shutdown()
{
    if (!lifecycle_initialized())
    {
        return;
    }
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!logger_is_loggable("Logger::flush"))
        return;
    // Once shutdown started the command would be rejected; nothing to wait for.
    if (pImpl->shutdown_requested_.load())
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    (void)future.get();
}

void Logger::set_level(Level lvl)
{
    if (!logger_is_loggable("Logger::set_level"))
        return;
    pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    if (!logger_is_loggable("Logger::level"))
        return Level::L_INFO;
    return pImpl->level_.load(std::memory_order_relaxed);
}

void Logger::set_max_queue_size(size_t max_size)
{
    if (!logger_is_loggable("Logger::set_max_queue_size"))
        return;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    pImpl->m_max_queue_size = (max_size > 0) ? max_size : 1;
}

size_t Logger::get_max_queue_size() const
{
    if (!logger_is_loggable("Logger::get_max_queue_size"))
        return 0;
    std::lock_guard<std::mutex> lock(pImpl->queue_mutex_);
    return pImpl->m_max_queue_size;
}

size_t Logger::get_total_dropped_since_sink_switch() const
{
    if (!logger_is_loggable("Logger::get_total_dropped_since_sink_switch"))
        return 0;
    return pImpl->m_total_dropped_since_sink_switch.load(std::memory_order_relaxed);
}

void Logger::set_log_sink_messages_enabled(bool enabled)
{
    if (!logger_is_loggable("Logger::set_log_sink_messages_enabled"))
        return;
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(SetLogSinkMessagesCommand{enabled, promise});
    (void)future.get();
}

bool Logger::should_log(Level lvl) const noexcept
{
    const auto state = g_logger_state.load(std::memory_order_acquire);
    if (state != LoggerState::Initialized)
        return false;

    return pImpl &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

bool Logger::enqueue_log(Level lvl, fmt::memory_buffer &&body) noexcept
{
    if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Initialized || !pImpl)
        return false;
    try
    {
        return pImpl->enqueue_command(make_system_message(lvl, std::move(body)));
    }
    catch (const std::exception &)
    {
        // Allocation failure while queuing; the message is lost.
        return false;
    }
}

bool Logger::enqueue_log(Level lvl, std::string &&body_str) noexcept
{
    try
    {
        return enqueue_log(lvl, make_buffer("{}", body_str));
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// ============================================================================
// Lifecycle callbacks
// ============================================================================

void do_logger_startup(const char *arg)
{
    (void)arg;
    Logger::instance().pImpl->start_worker();
    g_logger_state.store(LoggerState::Initialized, std::memory_order_release);

    // Route lifecycle runtime messages (module start, shutdown timeouts) into the log.
    LifecycleManager::instance().set_lifecycle_log_sink(
        [](LifecycleLogLevel level, const std::string &msg)
        {
            switch (level)
            {
            case LifecycleLogLevel::Debug:
                LOGGER_DEBUG("{}", msg);
                break;
            case LifecycleLogLevel::Warn:
                LOGGER_WARN("{}", msg);
                break;
            case LifecycleLogLevel::Error:
                LOGGER_ERROR("{}", msg);
                break;
            }
        });
}

void do_logger_shutdown(const char *arg)
{
    (void)arg;
    LifecycleManager::instance().clear_lifecycle_log_sink();

    LoggerState expected = LoggerState::Initialized;
    // If it wasn't Initialized, another thread is already shutting it down.
    if (g_logger_state.compare_exchange_strong(expected, LoggerState::ShuttingDown,
                                               std::memory_order_acq_rel))
    {
        Logger::instance().shutdown();

        int count = 0;
        while (count < 50 &&
               g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            count++;
        }
        if (g_logger_state.load(std::memory_order_acquire) != LoggerState::Shutdown)
        {
            ZW_DEBUG("Logger shutdown timed out. Forcing shutdown state.");
        }
        g_logger_state.store(LoggerState::Shutdown, std::memory_order_release);
    }
}

ModuleDef Logger::GetLifecycleModule()
{
    ModuleDef module("zworkers::utils::Logger");
    module.set_startup(&do_logger_startup);
    module.set_shutdown(&do_logger_shutdown, std::chrono::milliseconds(5000));
    return module;
}

} // namespace zworkers::utils
