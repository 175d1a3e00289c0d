#pragma once
/**
 * @file worker.hpp
 * @brief Pulls tasks from the distribution endpoint, runs them, pushes results back.
 *
 * One Worker handles one task at a time; a pool runs several Worker processes for
 * parallelism. Failures raised by a callable are captured into the TaskResult and sent
 * like any other result, so a failing task never ends the worker. A frame that does not
 * decode as a Task is logged and dropped: it carries no usable backurl.
 *
 * stop() only sets a flag and is safe to call from a signal handler. The loop notices
 * it within one poll interval, after the in-flight task has been answered.
 */
#include "zworkers_pool_export.h"

#include "pool/task_registry.hpp"

#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace zworkers::pool
{

class ZWORKERS_POOL_EXPORT Worker
{
  public:
    struct Config
    {
        std::string task_out_url; ///< distribution endpoint to connect a PULL socket to
        std::chrono::milliseconds poll_interval{100};
    };

    /// @p registry must outlive the Worker.
    Worker(const TaskRegistry &registry, Config cfg, zmq::context_t &ctx);

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    /**
     * @brief Serves tasks until stop() or context termination.
     * @throws zmq::error_t if the distribution endpoint cannot be connected.
     */
    void run();

    void stop() noexcept { m_stop.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool stop_requested() const noexcept
    {
        return m_stop.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t tasks_done() const noexcept
    {
        return m_tasks_done.load(std::memory_order_relaxed);
    }

  private:
    void handle_frame(const zmq::message_t &frame);
    void send_result(const std::string &backurl, const TaskResult &result);

    const TaskRegistry &m_registry;
    Config m_cfg;
    zmq::context_t &m_ctx;
    std::atomic<bool> m_stop{false};
    std::atomic<uint64_t> m_tasks_done{0};
};

static_assert(std::atomic<bool>::is_always_lock_free, "Worker::stop must be signal-safe");

/**
 * @brief Worker process entry: sets the process name, installs SIGINT as a graceful
 *        stop, and serves @p task_out_url with @p registry until stopped.
 * @pre The Logger and ZMQContext lifecycle modules are initialized.
 * @return Process exit code.
 */
ZWORKERS_POOL_EXPORT int run_worker_process(const TaskRegistry &registry,
                                            const std::string &task_out_url);

} // namespace zworkers::pool
