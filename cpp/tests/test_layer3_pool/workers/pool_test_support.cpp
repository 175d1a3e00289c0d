/**
 * @file pool_test_support.cpp
 */
#include "pool_test_support.h"
#include "shared_test_helpers.h"
#include "gtest/gtest.h"

#include <chrono>
#include <stdexcept>

using namespace zworkers::pool;

namespace zworkers::tests::pool_support
{

const std::string &workerpool_exe()
{
    static const std::string exe = ZWORKERS_WORKERPOOL_EXE;
    return exe;
}

std::string free_local_url()
{
    return make_tcp_url("127.0.0.1", helper::find_free_tcp_port());
}

StreamerThread::StreamerThread()
{
    Streamer::Config cfg;
    cfg.task_in_url = "tcp://127.0.0.1:*";
    cfg.task_out_url = "tcp://127.0.0.1:*";
    cfg.on_ready = [this](const std::string &in, const std::string &out)
    {
        m_in_url = in;
        m_out_url = out;
        m_ready_set.store(true);
        m_ready.set_value();
    };
    m_streamer = std::make_unique<Streamer>(std::move(cfg));

    auto ready = m_ready.get_future();
    m_thread = std::thread(
        [this]()
        {
            try
            {
                m_streamer->run();
            }
            catch (const std::exception &)
            {
                if (!m_ready_set.exchange(true))
                    m_ready.set_exception(std::current_exception());
            }
        });

    if (ready.wait_for(std::chrono::seconds(10)) != std::future_status::ready)
    {
        m_streamer->stop();
        m_thread.join();
        throw std::runtime_error("StreamerThread: streamer did not start within 10 s");
    }
    try
    {
        ready.get();
    }
    catch (...)
    {
        m_thread.join();
        throw;
    }
}

StreamerThread::~StreamerThread()
{
    m_streamer->stop();
    if (m_thread.joinable())
        m_thread.join();
}

SubmitOptions StreamerThread::submit_options() const
{
    return SubmitOptions{m_in_url, "tcp://127.0.0.1:*"};
}

WorkerThreads::WorkerThreads(const TaskRegistry &registry, const std::string &task_out_url,
                             int count)
{
    for (int i = 0; i < count; ++i)
    {
        m_workers.push_back(std::make_unique<Worker>(
            registry, Worker::Config{task_out_url, std::chrono::milliseconds(20)},
            get_zmq_context()));
    }
    for (auto &w : m_workers)
    {
        Worker *worker = w.get();
        m_threads.emplace_back([worker]() { worker->run(); });
    }
}

WorkerThreads::~WorkerThreads()
{
    stop_and_join();
}

void WorkerThreads::stop_and_join()
{
    for (auto &w : m_workers)
        w->stop();
    for (auto &t : m_threads)
    {
        if (t.joinable())
            t.join();
    }
}

uint64_t WorkerThreads::tasks_done() const noexcept
{
    uint64_t n = 0;
    for (const auto &w : m_workers)
        n += w->tasks_done();
    return n;
}

WorkerMaster::Config local_master_config(const StreamerThread &st, int cores)
{
    WorkerMaster::Config cfg;
    cfg.task_in_url = st.in_url();
    cfg.task_out_url = st.out_url();
    cfg.ctrl_port = helper::find_free_tcp_port();
    cfg.host_cores = {HostSpec{"127.0.0.1", cores}};
    cfg.local_program = workerpool_exe();
    cfg.transition_wait = std::chrono::milliseconds(10000);
    return cfg;
}

RunningPoolReaper::~RunningPoolReaper()
{
    try
    {
        const auto st = m_master.status();
        if (!st.empty() && st.front().state == HostState::Running)
        {
            for (const auto &reply : m_master.kill())
                fmt::print(stderr, "cleanup: {}\n", reply.message);
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "cleanup of the pool on port {} failed: {}\n", m_master.config().ctrl_port,
                   e.what());
    }
}

namespace
{
// A detached pool is reaped by init, which may be slow (or absent) inside containers, so an
// exited-but-unreaped process counts as gone.
bool is_zombie(uint64_t pid)
{
    std::string stat;
    if (!helper::read_file_contents(fmt::format("/proc/{}/stat", pid), stat))
        return false;
    const auto paren = stat.rfind(')');
    return paren != std::string::npos && paren + 2 < stat.size() && stat[paren + 2] == 'Z';
}
} // namespace

bool wait_for_process_exit(uint64_t pid, std::chrono::milliseconds timeout)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (zworkers::platform::is_process_alive(pid) && !is_zombie(pid))
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

std::vector<nlohmann::json> values_of(const std::vector<TaskResult> &results)
{
    std::vector<nlohmann::json> out;
    for (const auto &r : results)
    {
        EXPECT_TRUE(r.ok()) << "task " << r.task_no << " failed: " << r.failure().message;
        if (r.ok())
            out.push_back(r.value());
    }
    return out;
}

} // namespace zworkers::tests::pool_support
