#pragma once
/**
 * @file process_spawn.hpp
 * @brief fork/exec helpers used by WorkerPool (workers) and WorkerMaster (pools).
 */
#include "zworkers_pool_export.h"

#include <string>
#include <vector>

#include <sys/types.h>

namespace zworkers::pool
{

/**
 * @brief Forks and executes @p argv (argv[0] resolved through PATH).
 * @return The child's pid. The child exits with 127 if exec fails.
 * @throws std::invalid_argument if @p argv is empty.
 * @throws std::system_error if fork fails.
 */
ZWORKERS_POOL_EXPORT pid_t spawn_process(const std::vector<std::string> &argv);

/**
 * @brief Starts @p argv fully detached from the caller (double fork + setsid).
 * @details The grandchild is re-parented to init, so it outlives the caller and is
 *          never left as a zombie. stdin is redirected from /dev/null; stdout and
 *          stderr are inherited.
 * @throws std::invalid_argument if @p argv is empty.
 * @throws std::system_error if fork fails.
 */
ZWORKERS_POOL_EXPORT void spawn_detached(const std::vector<std::string> &argv);

/**
 * @brief Waits for child @p pid, retrying on EINTR.
 * @return The exit status, `-signal` if the child was killed by a signal, or -1 if
 *         @p pid is not a child of the caller.
 */
ZWORKERS_POOL_EXPORT int reap_process(pid_t pid) noexcept;

/**
 * @brief Joins @p argv with single spaces, for log lines.
 */
[[nodiscard]] ZWORKERS_POOL_EXPORT std::string join_command_line(const std::vector<std::string> &argv);

} // namespace zworkers::pool
