/**
 * @file worker_master_workers.cpp
 * @brief Worker scenarios for WorkerMaster driving a real, detached local pool.
 */
#include "worker_master_workers.h"
#include "pool_test_support.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include "zw_pool.hpp"

#include <chrono>
#include <string>

using namespace zworkers::tests::helper;
using namespace zworkers::tests::pool_support;
using namespace zworkers::pool;
using zworkers::utils::Logger;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace zworkers::tests::worker::worker_master
{

namespace
{
HostState state_of(const WorkerMaster &master)
{
    const auto st = master.status("127.0.0.1");
    EXPECT_EQ(st.size(), 1u);
    return st.empty() ? HostState::NotRunning : st.front().state;
}
} // namespace

int start_status_stop_cycle()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            WorkerMaster master(local_master_config(st, 2), get_zmq_context());
            RunningPoolReaper reaper(master);
            const std::string url = master.ctrl_url("127.0.0.1");

            EXPECT_EQ(state_of(master), HostState::NotRunning);
            EXPECT_FALSE(master.pool_pid("127.0.0.1").has_value());

            auto idle_stop = master.stop();
            ASSERT_EQ(idle_stop.size(), 1u);
            EXPECT_EQ(idle_stop[0].message, "127.0.0.1 not running");
            EXPECT_FALSE(idle_stop[0].changed);

            auto started = master.start();
            ASSERT_EQ(started.size(), 1u);
            EXPECT_EQ(started[0].host, "127.0.0.1");
            EXPECT_EQ(started[0].message, url + " started");
            EXPECT_TRUE(started[0].changed);
            EXPECT_EQ(state_of(master), HostState::Running);

            auto again = master.start();
            ASSERT_EQ(again.size(), 1u);
            EXPECT_EQ(again[0].message, "127.0.0.1 already running");
            EXPECT_FALSE(again[0].changed);

            const auto pid = master.pool_pid("127.0.0.1");
            ASSERT_TRUE(pid.has_value());
            EXPECT_EQ(master.pool_pid("127.0.0.1"), pid);
            EXPECT_NE(static_cast<uint64_t>(*pid), zworkers::platform::get_pid());
            EXPECT_TRUE(zworkers::platform::is_process_alive(static_cast<uint64_t>(*pid)));

            // The pool's workers are its children, not the pool itself.
            auto results = submit_tasks("builtin.getpid", std::vector<json>(4, json::array()),
                                        st.submit_options())
                               .collect();
            ASSERT_EQ(results.size(), 4u);
            for (const auto &r : results)
            {
                ASSERT_TRUE(r.ok());
                EXPECT_NE(r.worker_pid, static_cast<uint64_t>(*pid));
            }

            auto stopped = master.stop();
            ASSERT_EQ(stopped.size(), 1u);
            EXPECT_EQ(stopped[0].message, fmt::format("WorkerPool {} stopped", url));
            EXPECT_TRUE(stopped[0].changed);
            EXPECT_EQ(state_of(master), HostState::NotRunning);
            EXPECT_TRUE(wait_for_process_exit(static_cast<uint64_t>(*pid), 10s));
            EXPECT_FALSE(master.pool_pid("127.0.0.1").has_value());

            auto stopped_again = master.stop();
            ASSERT_EQ(stopped_again.size(), 1u);
            EXPECT_EQ(stopped_again[0].message, "127.0.0.1 not running");
        },
        "worker_master::start_status_stop_cycle", Logger::GetLifecycleModule(),
        GetZMQContextModule());
}

int kill_stops_a_running_pool()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            WorkerMaster master(local_master_config(st, 1), get_zmq_context());
            RunningPoolReaper reaper(master);
            const std::string url = master.ctrl_url("127.0.0.1");

            ASSERT_TRUE(master.start().at(0).changed);
            const auto pid = master.pool_pid("127.0.0.1");
            ASSERT_TRUE(pid.has_value());

            auto killed = master.kill();
            ASSERT_EQ(killed.size(), 1u);
            EXPECT_EQ(killed[0].message, fmt::format("WorkerPool {} killed", url));
            EXPECT_EQ(state_of(master), HostState::NotRunning);
            EXPECT_TRUE(wait_for_process_exit(static_cast<uint64_t>(*pid), 10s));
        },
        "worker_master::kill_stops_a_running_pool", Logger::GetLifecycleModule(),
        GetZMQContextModule());
}

int localhost_by_name_starts_and_stops()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            auto cfg = local_master_config(st, 1);
            cfg.host_cores = {HostSpec{"localhost", 1}};
            WorkerMaster master(cfg, get_zmq_context());
            RunningPoolReaper reaper(master);
            const std::string url = master.ctrl_url("localhost");
            ASSERT_EQ(url, fmt::format("tcp://localhost:{}", cfg.ctrl_port));

            auto started = master.start();
            ASSERT_EQ(started.size(), 1u);
            EXPECT_EQ(started[0].message, url + " started");
            ASSERT_EQ(master.status("localhost").at(0).state, HostState::Running);
            const auto pid = master.pool_pid("localhost");
            ASSERT_TRUE(pid.has_value());

            auto results =
                submit_tasks("builtin.add", {json::array({20, 22})}, st.submit_options()).collect();
            ASSERT_EQ(results.size(), 1u);
            ASSERT_TRUE(results[0].ok());
            EXPECT_EQ(results[0].value(), 42);

            auto stopped = master.stop();
            ASSERT_EQ(stopped.size(), 1u);
            EXPECT_EQ(stopped[0].message, fmt::format("WorkerPool {} stopped", url));
            EXPECT_EQ(master.status("localhost").at(0).state, HostState::NotRunning);
            EXPECT_TRUE(wait_for_process_exit(static_cast<uint64_t>(*pid), 10s));
        },
        "worker_master::localhost_by_name_starts_and_stops", Logger::GetLifecycleModule(),
        GetZMQContextModule());
}

} // namespace zworkers::tests::worker::worker_master

namespace
{
struct WorkerMasterWorkerRegistrar
{
    WorkerMasterWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "worker_master")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace zworkers::tests::worker::worker_master;
                if (scenario == "start_status_stop_cycle")
                    return start_status_stop_cycle();
                if (scenario == "kill_stops_a_running_pool")
                    return kill_stops_a_running_pool();
                if (scenario == "localhost_by_name_starts_and_stops")
                    return localhost_by_name_starts_and_stops();
                fmt::print(stderr, "ERROR: Unknown worker_master scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static WorkerMasterWorkerRegistrar g_worker_master_registrar;
} // namespace
