#pragma once
/**
 * @file worker_pool.hpp
 * @brief Per-host supervisor: a fixed set of Worker processes plus a REP control endpoint.
 *
 * Control protocol (one request, one reply, raw UTF-8 frames):
 *   "getpid" -> decimal pid of the supervisor; the loop continues
 *   "stop"   -> SIGINT to every worker, reply "WorkerPool <ctrl_url> stopped", loop ends
 *   "kill"   -> SIGTERM to every worker, reply "WorkerPool <ctrl_url> killed", loop ends
 *   other    -> "unknown command '<x>'"; the loop continues
 *
 * The control endpoint is bound before any worker is spawned, so a bind failure leaves
 * nothing behind. The worker count is fixed at start; workers that die on their own are
 * neither noticed nor replaced.
 */
#include "zworkers_pool_export.h"

#include "pool/result.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace zworkers::pool
{

class TaskRegistry;

enum class ControlCommand
{
    Stop,
    Kill,
    GetPid
};

[[nodiscard]] ZWORKERS_POOL_EXPORT std::optional<ControlCommand>
parse_control_command(std::string_view text) noexcept;
ZWORKERS_POOL_EXPORT const char *to_string(ControlCommand cmd) noexcept;

struct WorkerHandle
{
    std::string endpoint; ///< distribution endpoint the worker pulls from
    pid_t pid = 0;
};

enum class WorkerCountError
{
    NotANumber,
    OutOfRange ///< zero, or negative other than -1
};

/**
 * @brief Parses the worker-count argument: a positive integer, or "-1" for the core count.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT Result<int, WorkerCountError>
parse_worker_count(std::string_view text);

/// -1 maps to the number of online processors; positive counts pass through.
[[nodiscard]] ZWORKERS_POOL_EXPORT int resolve_worker_count(int requested) noexcept;

class ZWORKERS_POOL_EXPORT WorkerPool
{
  public:
    struct Config
    {
        std::string ctrl_url;       ///< REP endpoint the master talks to
        std::string task_out_url;   ///< distribution endpoint handed to each worker
        int num_workers = -1;       ///< -1 means the host's core count
        std::string worker_program; ///< empty means this executable
        /// Called with the bound control endpoint after every worker was spawned.
        std::function<void(const std::string &)> on_ready;
    };

    WorkerPool(Config cfg, zmq::context_t &ctx);
    /// Terminates (SIGTERM) and reaps any worker still owned.
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /**
     * @brief Binds the control endpoint, then spawns the workers.
     * @throws zmq::error_t / std::invalid_argument / std::runtime_error on bind failure.
     * @throws std::system_error if a worker cannot be forked; workers already started
     *         are terminated first.
     */
    void start();

    /**
     * @brief Serves control requests until "stop", "kill" or request_stop().
     * @details On exit the control socket is closed and every worker reaped.
     */
    void serve();

    /// start() then serve().
    void run();

    /**
     * @brief Local stop, as if "stop" had been received (no reply is sent).
     * @details Only sets a flag; safe from a signal handler.
     */
    void request_stop() noexcept { m_local_stop.store(true, std::memory_order_relaxed); }

    [[nodiscard]] const std::vector<WorkerHandle> &workers() const noexcept { return m_workers; }
    [[nodiscard]] int num_workers() const noexcept { return m_num_workers; }
    [[nodiscard]] const std::string &bound_ctrl_endpoint() const noexcept { return m_bound_ctrl; }

  private:
    void signal_workers(int signo);
    void reap_workers();
    std::string handle_request(const std::string &request, bool &done);

    Config m_cfg;
    zmq::context_t &m_ctx;
    std::optional<zmq::socket_t> m_ctrl;
    std::string m_bound_ctrl;
    int m_num_workers = 0;
    std::vector<WorkerHandle> m_workers;
    std::atomic<bool> m_local_stop{false};
};

/**
 * @brief Executable entry point shared by the pool supervisor and its workers.
 *
 *   prog <ctrl_url> <task_out_url> <num_workers|-1>   run a WorkerPool
 *   prog --worker <task_out_url>                       run one Worker
 *
 * Owns the lifecycle (Logger, ZMQContext) and applies the logging section of the
 * configuration. Applications embed their own callables by passing their registry.
 * @return Process exit code (2 for usage errors).
 */
ZWORKERS_POOL_EXPORT int workerpool_main(int argc, char **argv, const TaskRegistry &registry);

} // namespace zworkers::pool
