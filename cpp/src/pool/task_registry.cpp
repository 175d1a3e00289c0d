#include "pool/task_registry.hpp"
#include "zw_base.hpp"

#include <stdexcept>
#include <typeinfo>

namespace zworkers::pool
{

void TaskRegistry::add(std::string id, TaskFunction fn)
{
    if (id.empty())
    {
        throw std::invalid_argument("TaskRegistry::add: empty callable id");
    }
    if (!fn)
    {
        throw std::invalid_argument(fmt::format("TaskRegistry::add: empty function for '{}'", id));
    }
    if (m_functions.find(id) != m_functions.end())
    {
        throw std::invalid_argument(fmt::format("TaskRegistry::add: '{}' already registered", id));
    }
    m_functions.emplace(std::move(id), std::move(fn));
}

bool TaskRegistry::contains(std::string_view id) const
{
    return m_functions.find(id) != m_functions.end();
}

const TaskFunction *TaskRegistry::find(std::string_view id) const
{
    auto it = m_functions.find(id);
    return it == m_functions.end() ? nullptr : &it->second;
}

std::vector<std::string> TaskRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(m_functions.size());
    for (const auto &[id, fn] : m_functions)
    {
        out.push_back(id);
    }
    return out;
}

TaskResult TaskRegistry::call(const Task &task) const noexcept
{
    TaskResult result;
    result.task_no = task.monitor.task_no;
    result.worker_pid = platform::get_pid();
    const uint64_t start_ns = platform::monotonic_time_ns();

    auto fail = [&](TaskFailureKind kind, std::string type_name, std::string message)
    {
        TaskFailure f;
        f.kind = kind;
        f.type_name = std::move(type_name);
        f.message = std::move(message);
        f.callable_id = task.callable_id;
        f.operation = task.monitor.operation;
        f.task_no = task.monitor.task_no;
        result.outcome = std::move(f);
    };

    try
    {
        const TaskFunction *fn = find(task.callable_id);
        if (fn == nullptr)
        {
            fail(TaskFailureKind::UnknownCallable, "",
                 fmt::format("no callable registered as '{}'", task.callable_id));
        }
        else
        {
            result.outcome = (*fn)(task.args, task.monitor);
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        fail(TaskFailureKind::InvalidArguments, debug::demangle(typeid(e).name()), e.what());
    }
    catch (const std::invalid_argument &e)
    {
        fail(TaskFailureKind::InvalidArguments, debug::demangle(typeid(e).name()), e.what());
    }
    catch (const std::exception &e)
    {
        fail(TaskFailureKind::Exception, debug::demangle(typeid(e).name()), e.what());
    }
    catch (...)
    {
        fail(TaskFailureKind::Unknown, "", "non-standard exception");
    }

    result.duration_s = static_cast<double>(platform::elapsed_time_ns(start_ns)) / 1e9;
    return result;
}

} // namespace zworkers::pool
