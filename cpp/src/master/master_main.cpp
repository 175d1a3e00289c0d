/**
 * @file master_main.cpp
 * @brief zworkers-master: administrative front end for the worker pools.
 *
 *   zworkers-master [--config <file>] start
 *   zworkers-master [--config <file>] stop | kill
 *   zworkers-master [--config <file>] status [host]
 *   zworkers-master [--config <file>] getpid <host>
 *   zworkers-master [--config <file>] streamer
 *
 * Prints one line per host. `streamer` relays task_in_url -> task_out_url until
 * SIGINT/SIGTERM.
 */
#include "zw_pool.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <unistd.h>

using namespace zworkers;

namespace
{

void print_usage(const char *prog)
{
    fmt::print(stderr,
               "usage: {0} [--config <file>] <command>\n"
               "  start            start a pool on every configured host\n"
               "  stop | kill      stop (graceful) or kill (forceful) every running pool\n"
               "  status [host]    check the control port of each host\n"
               "  getpid <host>    print the supervisor pid of the pool on <host>\n"
               "  streamer         relay task_in_url -> task_out_url until interrupted\n",
               prog);
}

void print_replies(const std::vector<pool::HostReply> &replies)
{
    for (const auto &r : replies)
    {
        fmt::print("{}\n", r.message);
    }
}

int run_streamer(const pool::PoolConfig &cfg, const sigset_t &stop_signals)
{
    pool::Streamer streamer({cfg.task_in_url, cfg.task_out_url, nullptr});
    std::atomic<bool> stopping{false};
    bool bind_failed = false;
    std::thread relay(
        [&]
        {
            try
            {
                streamer.run();
            }
            catch (const std::exception &e)
            {
                LOGGER_ERROR("Streamer: {}", e.what());
                bind_failed = true;
            }
            // The relay ended by itself; wake the main thread out of sigwait.
            if (!stopping.load(std::memory_order_acquire))
            {
                ::kill(::getpid(), SIGTERM);
            }
        });

    int signo = 0;
    ::sigwait(&stop_signals, &signo);
    stopping.store(true, std::memory_order_release);
    LOGGER_INFO("zworkers-master: signal {} received, stopping streamer.", signo);
    streamer.stop();
    relay.join();
    return bind_failed ? 1 : 0;
}

} // namespace

int main(int argc, char **argv)
{
    const std::vector<std::string> words(argc > 1 ? argv + 1 : argv, argc > 1 ? argv + argc : argv);
    const auto args = pool::parse_master_command_line(words);
    if (!args)
    {
        print_usage(argc > 0 ? argv[0] : "zworkers-master");
        return 2;
    }

    // The streamer waits for SIGINT/SIGTERM with sigwait; block them before any thread
    // (the logger's included) is created so every thread inherits the mask.
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    if (args->command == "streamer")
    {
        ::pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);
    }

    utils::LifecycleGuard app_lifecycle(
        utils::MakeModDefList(utils::Logger::GetLifecycleModule(), pool::GetZMQContextModule()));

    try
    {
        const pool::PoolConfig cfg = pool::PoolConfig::load(args->config_file);
        cfg.apply_logging();

        if (args->command == "streamer")
        {
            return run_streamer(cfg, stop_signals);
        }

        pool::WorkerMaster master(cfg.master_config(), pool::get_zmq_context());
        if (args->command == "start")
        {
            print_replies(master.start());
        }
        else if (args->command == "stop")
        {
            print_replies(master.stop());
        }
        else if (args->command == "kill")
        {
            print_replies(master.kill());
        }
        else if (args->command == "status")
        {
            for (const auto &st : master.status(args->host))
            {
                fmt::print("{} {}\n", st.host, pool::to_string(st.state));
            }
        }
        else if (args->command == "getpid")
        {
            const auto pid = master.pool_pid(*args->host);
            if (!pid)
            {
                fmt::print("{} not running\n", *args->host);
                return 1;
            }
            fmt::print("{}\n", *pid);
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("zworkers-master {}: {}", args->command, e.what());
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
    return 0;
}
