#include "pool/task.hpp"

#include <fmt/core.h>

namespace zworkers::pool
{

using json = nlohmann::json;

namespace
{

json monitor_to_json(const Monitor &m)
{
    return json{{"operation", m.operation}, {"backurl", m.backurl}, {"task_no", m.task_no}};
}

Monitor monitor_from_json(const json &j)
{
    if (!j.is_object())
    {
        throw WireError("monitor is not an object");
    }
    Monitor m;
    m.operation = j.value("operation", std::string{});
    m.backurl = j.value("backurl", std::string{});
    m.task_no = j.value("task_no", int64_t{-1});
    return m;
}

TaskFailureKind kind_from_string(const std::string &s)
{
    if (s == "UnknownCallable")
        return TaskFailureKind::UnknownCallable;
    if (s == "InvalidArguments")
        return TaskFailureKind::InvalidArguments;
    if (s == "Exception")
        return TaskFailureKind::Exception;
    return TaskFailureKind::Unknown;
}

json parse_msgpack(const void *data, size_t size)
{
    const auto *bytes = static_cast<const uint8_t *>(data);
    try
    {
        return json::from_msgpack(bytes, bytes + size);
    }
    catch (const json::exception &e)
    {
        throw WireError(fmt::format("malformed MessagePack frame ({} bytes): {}", size, e.what()));
    }
}

} // namespace

const char *to_string(TaskFailureKind kind) noexcept
{
    switch (kind)
    {
    case TaskFailureKind::UnknownCallable:
        return "UnknownCallable";
    case TaskFailureKind::InvalidArguments:
        return "InvalidArguments";
    case TaskFailureKind::Exception:
        return "Exception";
    case TaskFailureKind::Unknown:
    default:
        return "Unknown";
    }
}

std::vector<uint8_t> encode_task(const Task &task)
{
    json args = task.args.is_array() ? task.args : json::array({task.args});
    args.push_back(monitor_to_json(task.monitor));
    return json::to_msgpack(json::array({task.callable_id, std::move(args)}));
}

Task decode_task(const void *data, size_t size)
{
    const json j = parse_msgpack(data, size);
    if (!j.is_array() || j.size() != 2 || !j[0].is_string() || !j[1].is_array() || j[1].empty())
    {
        throw WireError("task frame is not [callable_id, [args..., monitor]]");
    }
    Task task;
    task.callable_id = j[0].get<std::string>();
    const json &args = j[1];
    try
    {
        task.monitor = monitor_from_json(args.back());
    }
    catch (const json::exception &e)
    {
        throw WireError(fmt::format("malformed monitor: {}", e.what()));
    }
    task.args = json::array();
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        task.args.push_back(args[i]);
    }
    return task;
}

std::vector<uint8_t> encode_result(const TaskResult &result)
{
    json j{{"ok", result.ok()},
           {"worker_pid", result.worker_pid},
           {"duration_s", result.duration_s},
           {"task_no", result.task_no}};
    if (result.ok())
    {
        j["value"] = result.value();
    }
    else
    {
        const TaskFailure &f = result.failure();
        j["error"] = json{{"kind", to_string(f.kind)},   {"type", f.type_name},
                          {"message", f.message},        {"callable_id", f.callable_id},
                          {"operation", f.operation},    {"task_no", f.task_no}};
    }
    return json::to_msgpack(j);
}

TaskResult decode_result(const void *data, size_t size)
{
    const json j = parse_msgpack(data, size);
    if (!j.is_object() || !j.contains("ok") || !j["ok"].is_boolean())
    {
        throw WireError("result frame has no boolean 'ok' field");
    }
    TaskResult result;
    try
    {
        result.worker_pid = j.value("worker_pid", uint64_t{0});
        result.duration_s = j.value("duration_s", 0.0);
        result.task_no = j.value("task_no", int64_t{-1});
        if (j["ok"].get<bool>())
        {
            result.outcome = j.contains("value") ? j["value"] : json{};
        }
        else
        {
            const json &e = j.at("error");
            TaskFailure f;
            f.kind = kind_from_string(e.value("kind", std::string{}));
            f.type_name = e.value("type", std::string{});
            f.message = e.value("message", std::string{});
            f.callable_id = e.value("callable_id", std::string{});
            f.operation = e.value("operation", std::string{});
            f.task_no = e.value("task_no", int64_t{-1});
            result.outcome = std::move(f);
        }
    }
    catch (const json::exception &e)
    {
        throw WireError(fmt::format("malformed result frame: {}", e.what()));
    }
    return result;
}

} // namespace zworkers::pool
