#pragma once
/**
 * @file task.hpp
 * @brief Task, Monitor and TaskResult types and their MessagePack wire encoding.
 *
 * Wire layouts (nlohmann::json MessagePack codec):
 *   Task:       [callable_id, [arg0, ..., argN, monitor]]
 *   Monitor:    {"operation": str, "backurl": str, "task_no": int}
 *   TaskResult: {"ok": bool, "value"|"error": ..., "worker_pid": int,
 *                "duration_s": float, "task_no": int}
 *
 * Results carry no request id. A submission correlates results to tasks by count only;
 * task_no is echoed for diagnostics.
 */
#include "zworkers_pool_export.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace zworkers::pool
{

/**
 * @brief Per-task record travelling as the last task argument.
 * @details `backurl` is set by the submission right before the task is sent.
 */
struct Monitor
{
    std::string operation; ///< label for logs, defaults to the callable id
    std::string backurl;   ///< reply endpoint the worker pushes the result to
    int64_t task_no = -1;  ///< dispatch position within its submission run
};

struct Task
{
    std::string callable_id;
    nlohmann::json args = nlohmann::json::array(); ///< positional arguments, monitor excluded
    Monitor monitor;
};

enum class TaskFailureKind
{
    UnknownCallable,  ///< callable_id not in the worker's registry
    InvalidArguments, ///< the callable rejected its arguments (json type/range errors)
    Exception,        ///< the callable threw any other std::exception
    Unknown           ///< the callable threw something that is not a std::exception
};

ZWORKERS_POOL_EXPORT const char *to_string(TaskFailureKind kind) noexcept;

struct TaskFailure
{
    TaskFailureKind kind = TaskFailureKind::Unknown;
    std::string type_name; ///< demangled exception type
    std::string message;
    std::string callable_id;
    std::string operation;
    int64_t task_no = -1;
};

struct TaskResult
{
    std::variant<nlohmann::json, TaskFailure> outcome;
    uint64_t worker_pid = 0;
    double duration_s = 0.0;
    int64_t task_no = -1;

    [[nodiscard]] bool ok() const noexcept
    {
        return std::holds_alternative<nlohmann::json>(outcome);
    }
    /// @throws std::bad_variant_access if the result is a failure.
    [[nodiscard]] const nlohmann::json &value() const { return std::get<nlohmann::json>(outcome); }
    /// @throws std::bad_variant_access if the result is a success.
    [[nodiscard]] const TaskFailure &failure() const { return std::get<TaskFailure>(outcome); }
};

/**
 * @brief Raised when a frame is not a valid Task or TaskResult.
 */
class ZWORKERS_POOL_EXPORT WireError : public std::runtime_error
{
  public:
    explicit WireError(const std::string &what) : std::runtime_error(what) {}
};

[[nodiscard]] ZWORKERS_POOL_EXPORT std::vector<uint8_t> encode_task(const Task &task);
/// @throws WireError
[[nodiscard]] ZWORKERS_POOL_EXPORT Task decode_task(const void *data, size_t size);

[[nodiscard]] ZWORKERS_POOL_EXPORT std::vector<uint8_t> encode_result(const TaskResult &result);
/// @throws WireError
[[nodiscard]] ZWORKERS_POOL_EXPORT TaskResult decode_result(const void *data, size_t size);

} // namespace zworkers::pool
