#include "pool/task_registry.hpp"
#include "zw_base.hpp"

#include <cstdint>
#include <stdexcept>
#include <thread>

namespace zworkers::pool
{

using json = nlohmann::json;

namespace
{

json builtin_add(const json &args, const Monitor & /*monitor*/)
{
    bool all_integers = true;
    bool int_overflow = false;
    int64_t int_sum = 0;
    double sum = 0.0;
    for (const auto &a : args)
    {
        if (!a.is_number())
        {
            throw std::invalid_argument(fmt::format("builtin.add: non-numeric argument {}", a.dump()));
        }
        if (a.is_number_integer())
        {
            if (a.is_number_unsigned() && a.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX))
            {
                int_overflow = true;
            }
            else if (!int_overflow && __builtin_add_overflow(int_sum, a.get<int64_t>(), &int_sum))
            {
                int_overflow = true;
            }
        }
        else
        {
            all_integers = false;
        }
        sum += a.get<double>();
    }
    if (all_integers && int_overflow)
    {
        throw std::invalid_argument("builtin.add: integer sum does not fit in int64");
    }
    return all_integers ? json(int_sum) : json(sum);
}

json builtin_sleep(const json &args, const Monitor & /*monitor*/)
{
    if (args.empty() || !args[0].is_number_integer() || args[0].get<int64_t>() < 0)
    {
        throw std::invalid_argument("builtin.sleep: expects [milliseconds >= 0, value?]");
    }
    const int64_t ms = args[0].get<int64_t>();
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    return args.size() > 1 ? args[1] : json(ms);
}

json builtin_fail(const json &args, const Monitor &monitor)
{
    std::string message = "builtin.fail";
    if (!args.empty() && args[0].is_string())
    {
        message = args[0].get<std::string>();
    }
    throw std::runtime_error(fmt::format("{} (task {})", message, monitor.task_no));
}

json builtin_getpid(const json & /*args*/, const Monitor & /*monitor*/)
{
    return json(platform::get_pid());
}

} // namespace

void register_builtin_tasks(TaskRegistry &registry)
{
    registry.add("builtin.add", &builtin_add);
    registry.add("builtin.sleep", &builtin_sleep);
    registry.add("builtin.fail", &builtin_fail);
    registry.add("builtin.getpid", &builtin_getpid);
}

} // namespace zworkers::pool
