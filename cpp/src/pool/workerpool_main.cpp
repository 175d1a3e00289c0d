/**
 * @file workerpool_main.cpp
 * @brief Entry point shared by the pool supervisor and the worker processes it spawns.
 */
#include "pool/pool_config.hpp"
#include "pool/task_registry.hpp"
#include "pool/worker.hpp"
#include "pool/worker_pool.hpp"
#include "pool/zmq_context.hpp"
#include "zw_service.hpp"

#include <atomic>
#include <csignal>
#include <string_view>

namespace zworkers::pool
{

namespace
{

std::atomic<WorkerPool *> g_signal_pool{nullptr};

void pool_signal_handler(int /*signo*/)
{
    if (WorkerPool *pool = g_signal_pool.load(std::memory_order_relaxed); pool != nullptr)
    {
        pool->request_stop();
    }
}

void print_usage(const char *prog)
{
    fmt::print(stderr,
               "usage:\n"
               "  {0} <ctrl_url> <task_out_url> <num_workers|-1>\n"
               "  {0} --worker <task_out_url>\n",
               prog);
}

int run_supervisor(const std::string &ctrl_url, const std::string &task_out_url, int num_workers)
{
    platform::set_process_name("zw-workerpool");

    int rc = 0;
    try
    {
        WorkerPool pool(WorkerPool::Config{ctrl_url, task_out_url, num_workers, {}, nullptr},
                        get_zmq_context());

        // SIGINT/SIGTERM behave like a "stop" from the master. No SA_RESTART, so the
        // control poll wakes up with EINTR and sees the flag.
        struct sigaction sa = {};
        sa.sa_handler = &pool_signal_handler;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0;
        g_signal_pool.store(&pool, std::memory_order_relaxed);
        ::sigaction(SIGINT, &sa, nullptr);
        ::sigaction(SIGTERM, &sa, nullptr);

        pool.run();

        ::signal(SIGINT, SIG_DFL);
        ::signal(SIGTERM, SIG_DFL);
        g_signal_pool.store(nullptr, std::memory_order_relaxed);
    }
    catch (const std::exception &e)
    {
        g_signal_pool.store(nullptr, std::memory_order_relaxed);
        LOGGER_ERROR("WorkerPool {}: {}", ctrl_url, e.what());
        rc = 1;
    }
    return rc;
}

} // namespace

int workerpool_main(int argc, char **argv, const TaskRegistry &registry)
{
    const char *prog = argc > 0 ? argv[0] : "zworkers-workerpool";
    const bool worker_mode = argc == 3 && std::string_view(argv[1]) == "--worker";
    if (!worker_mode && argc != 4)
    {
        print_usage(prog);
        return 2;
    }

    int num_workers = -1;
    if (!worker_mode)
    {
        auto count = parse_worker_count(argv[3]);
        if (count.is_error())
        {
            fmt::print(stderr, "{}: invalid worker count '{}'\n", prog, argv[3]);
            print_usage(prog);
            return 2;
        }
        num_workers = count.content();
    }

    utils::LifecycleGuard app_lifecycle(
        utils::MakeModDefList(utils::Logger::GetLifecycleModule(), GetZMQContextModule()));

    try
    {
        // Workers share the supervisor's configuration but do not repeat its dump.
        const PoolConfig cfg = PoolConfig::load({}, !worker_mode);
        cfg.apply_logging();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("{}: configuration error: {}", prog, e.what());
        return 1;
    }

    if (worker_mode)
    {
        return run_worker_process(registry, argv[2]);
    }
    return run_supervisor(argv[1], argv[2], num_workers);
}

} // namespace zworkers::pool
