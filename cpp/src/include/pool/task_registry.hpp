#pragma once
/**
 * @file task_registry.hpp
 * @brief Maps stable callable ids to functions a Worker can invoke.
 *
 * A Task carries only a callable id plus arguments. The worker process owns a
 * TaskRegistry populated at startup and resolves the id against it. The registry is
 * an ordinary object handed to the worker; there is no process-wide instance.
 */
#include "zworkers_pool_export.h"

#include "pool/task.hpp"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace zworkers::pool
{

/**
 * @brief Signature of a registered callable.
 * @details Throwing `nlohmann::json::exception` or `std::invalid_argument` is reported as
 *          TaskFailureKind::InvalidArguments; any other exception as Exception.
 */
using TaskFunction = std::function<nlohmann::json(const nlohmann::json &args, const Monitor &)>;

class ZWORKERS_POOL_EXPORT TaskRegistry
{
  public:
    TaskRegistry() = default;
    TaskRegistry(TaskRegistry &&) noexcept = default;
    TaskRegistry &operator=(TaskRegistry &&) noexcept = default;
    TaskRegistry(const TaskRegistry &) = delete;
    TaskRegistry &operator=(const TaskRegistry &) = delete;

    /**
     * @throws std::invalid_argument if @p id is empty, already registered, or @p fn is empty.
     */
    void add(std::string id, TaskFunction fn);

    [[nodiscard]] bool contains(std::string_view id) const;
    /// @return nullptr if @p id is not registered.
    [[nodiscard]] const TaskFunction *find(std::string_view id) const;
    [[nodiscard]] std::vector<std::string> ids() const;
    [[nodiscard]] size_t size() const noexcept { return m_functions.size(); }

    /**
     * @brief Runs @p task and captures its outcome.
     * @details Never throws. Duration, the calling pid and task_no are filled in.
     */
    [[nodiscard]] TaskResult call(const Task &task) const noexcept;

  private:
    std::map<std::string, TaskFunction, std::less<>> m_functions;
};

/**
 * @brief Registers the diagnostic tasks used by smoke tests and operators.
 *
 *   - `builtin.add`    sum of numeric args (integer if every arg is an integer)
 *   - `builtin.sleep`  [ms, value?] sleeps ms then returns value (or ms)
 *   - `builtin.fail`   [message?] throws std::runtime_error(message)
 *   - `builtin.getpid` returns the worker's pid
 */
ZWORKERS_POOL_EXPORT void register_builtin_tasks(TaskRegistry &registry);

} // namespace zworkers::pool
