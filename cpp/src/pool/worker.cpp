#include "pool/worker.hpp"
#include "pool/zmq_context.hpp"
#include "zw_service.hpp"

#include <cerrno>
#include <csignal>
#include <vector>

namespace zworkers::pool
{

namespace
{
// Bounds how long an unreachable submitter can hold up context shutdown.
constexpr int kResultLingerMs = 30000;

std::atomic<Worker *> g_signal_worker{nullptr};

void worker_sigint_handler(int /*signo*/)
{
    if (Worker *w = g_signal_worker.load(std::memory_order_relaxed); w != nullptr)
    {
        w->stop();
    }
}
} // namespace

Worker::Worker(const TaskRegistry &registry, Config cfg, zmq::context_t &ctx)
    : m_registry(registry), m_cfg(std::move(cfg)), m_ctx(ctx)
{
}

void Worker::run()
{
    zmq::socket_t tasks(m_ctx, zmq::socket_type::pull);
    tasks.set(zmq::sockopt::linger, 0);
    tasks.connect(m_cfg.task_out_url);
    LOGGER_INFO("Worker[{}]: pulling tasks from {}", platform::get_pid(), m_cfg.task_out_url);

    while (!stop_requested())
    {
        std::vector<zmq::pollitem_t> items = {{tasks.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::message_t frame;
        try
        {
            zmq::poll(items, m_cfg.poll_interval);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }
            if (!tasks.recv(frame, zmq::recv_flags::dontwait))
            {
                continue;
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() == EINTR)
            {
                continue;
            }
            if (e.num() == ETERM)
            {
                LOGGER_INFO("Worker[{}]: context terminated.", platform::get_pid());
                break;
            }
            throw;
        }
        handle_frame(frame);
    }

    LOGGER_INFO("Worker[{}]: stopped after {} task(s).", platform::get_pid(), tasks_done());
}

void Worker::handle_frame(const zmq::message_t &frame)
{
    Task task;
    try
    {
        task = decode_task(frame.data(), frame.size());
    }
    catch (const WireError &e)
    {
        LOGGER_ERROR("Worker[{}]: dropping undecodable task: {}", platform::get_pid(), e.what());
        return;
    }

    const TaskResult result = m_registry.call(task);
    if (!result.ok())
    {
        const TaskFailure &f = result.failure();
        LOGGER_WARN("Worker[{}]: task {} '{}' failed ({}): {}", platform::get_pid(),
                    task.monitor.task_no, task.monitor.operation, to_string(f.kind), f.message);
    }

    if (task.monitor.backurl.empty())
    {
        LOGGER_ERROR("Worker[{}]: task {} '{}' has no backurl, result discarded.",
                     platform::get_pid(), task.monitor.task_no, task.callable_id);
    }
    else
    {
        send_result(task.monitor.backurl, result);
    }
    m_tasks_done.fetch_add(1, std::memory_order_relaxed);
}

void Worker::send_result(const std::string &backurl, const TaskResult &result)
{
    try
    {
        zmq::socket_t reply(m_ctx, zmq::socket_type::push);
        reply.set(zmq::sockopt::linger, kResultLingerMs);
        reply.connect(backurl);
        const auto frame = encode_result(result);
        if (!reply.send(zmq::buffer(frame), zmq::send_flags::none))
        {
            LOGGER_ERROR("Worker[{}]: result for task {} not queued to {}", platform::get_pid(),
                         result.task_no, backurl);
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_ERROR("Worker[{}]: cannot send result for task {} to {}: {}", platform::get_pid(),
                     result.task_no, backurl, e.what());
    }
}

int run_worker_process(const TaskRegistry &registry, const std::string &task_out_url)
{
    platform::set_process_name("zw-worker");

    Worker worker(registry, Worker::Config{task_out_url}, get_zmq_context());

    // No SA_RESTART: a blocked zmq_poll returns EINTR and the loop re-checks the flag.
    struct sigaction sa = {};
    sa.sa_handler = &worker_sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    g_signal_worker.store(&worker, std::memory_order_relaxed);
    ::sigaction(SIGINT, &sa, nullptr);

    int rc = 0;
    try
    {
        worker.run();
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("Worker[{}]: fatal: {}", platform::get_pid(), e.what());
        rc = 1;
    }

    ::signal(SIGINT, SIG_DFL);
    g_signal_worker.store(nullptr, std::memory_order_relaxed);
    return rc;
}

} // namespace zworkers::pool
