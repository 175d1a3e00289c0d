#pragma once
/**
 * @file worker_master.hpp
 * @brief Control-plane client that starts, stops, kills and checks WorkerPools on a set
 *        of hosts.
 *
 * Per-host state as seen by the master is `not-running` or `running`, decided by a plain
 * TCP connect to the host's control port. start() skips running hosts and stop()/kill()
 * skip stopped ones, so each is idempotent per host. Every operation returns one
 * HostReply per host with a definite message.
 *
 * Pools on 127.0.0.1/localhost are spawned directly; any other host is reached through
 * `<remote_shell> <host> <remote_program> <ctrl_url> <task_out_url> <cores>`. Launched
 * pools are detached and outlive the master.
 */
#include "zworkers_pool_export.h"

#include <zmq.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace zworkers::pool
{

struct HostSpec
{
    std::string host;
    int cores = -1; ///< -1 means the host's core count
};

enum class HostState
{
    NotRunning,
    Running
};

/// "running" / "not-running"
ZWORKERS_POOL_EXPORT const char *to_string(HostState state) noexcept;

struct HostStatus
{
    std::string host;
    HostState state = HostState::NotRunning;
};

struct HostReply
{
    std::string host;
    std::string message;  ///< e.g. "<ctrl_url> started", "<host> not running"
    bool changed = false; ///< false when the host was skipped
};

class ZWORKERS_POOL_EXPORT WorkerMaster
{
  public:
    struct Config
    {
        std::string task_in_url;
        std::string task_out_url; ///< passed to every pool as its distribution endpoint
        int ctrl_port = 1909;
        std::vector<HostSpec> host_cores;
        std::string local_program;  ///< pool executable; empty means the installed default
        std::string remote_program; ///< empty means local_program
        std::string remote_shell = "ssh";
        /// Bound on how long start()/stop()/kill() wait for a pool to come up or go down.
        std::chrono::milliseconds transition_wait{10000};
    };

    WorkerMaster(Config cfg, zmq::context_t &ctx);

    WorkerMaster(const WorkerMaster &) = delete;
    WorkerMaster &operator=(const WorkerMaster &) = delete;

    /// Checks every configured host, or only @p host when given.
    [[nodiscard]] std::vector<HostStatus>
    status(const std::optional<std::string> &host = std::nullopt) const;

    std::vector<HostReply> start();
    std::vector<HostReply> stop();
    std::vector<HostReply> kill();

    /**
     * @brief Asks the pool on @p host for its supervisor pid.
     * @return std::nullopt if the host is not configured or not running.
     * @throws zmq::error_t on transport failure; std::runtime_error on a malformed reply.
     */
    [[nodiscard]] std::optional<pid_t> pool_pid(const std::string &host);

    [[nodiscard]] std::string ctrl_url(const std::string &host) const;
    [[nodiscard]] const Config &config() const noexcept { return m_cfg; }

    /// The command line start() runs for @p spec.
    [[nodiscard]] std::vector<std::string> launch_command(const HostSpec &spec) const;

  private:
    std::vector<HostReply> send_command(const char *command);
    std::string request(const std::string &host, const std::string &command);
    bool wait_for_state(const std::string &host, HostState wanted) const;

    Config m_cfg;
    zmq::context_t &m_ctx;
};

/// True for the host names start() launches without the remote shell.
[[nodiscard]] ZWORKERS_POOL_EXPORT bool is_local_host(const std::string &host) noexcept;

/**
 * @brief One TCP connect attempt to @p host:@p port, closed immediately.
 * @return true if the connection was accepted.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT bool probe_tcp_port(const std::string &host, int port) noexcept;

} // namespace zworkers::pool
