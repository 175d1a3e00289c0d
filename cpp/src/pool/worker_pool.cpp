#include "pool/worker_pool.hpp"
#include "pool/endpoint.hpp"
#include "pool/process_spawn.hpp"
#include "zw_service.hpp"

#include <charconv>
#include <chrono>
#include <stdexcept>

#include <cerrno>
#include <csignal>

namespace zworkers::pool
{

namespace
{
constexpr std::chrono::milliseconds kCtrlPollInterval{100};
// Time allowed for the final stop/kill reply to leave before the socket closes.
constexpr int kCtrlLingerMs = 1000;
} // namespace

std::optional<ControlCommand> parse_control_command(std::string_view text) noexcept
{
    if (text == "stop")
        return ControlCommand::Stop;
    if (text == "kill")
        return ControlCommand::Kill;
    if (text == "getpid")
        return ControlCommand::GetPid;
    return std::nullopt;
}

const char *to_string(ControlCommand cmd) noexcept
{
    switch (cmd)
    {
    case ControlCommand::Stop:
        return "stop";
    case ControlCommand::Kill:
        return "kill";
    case ControlCommand::GetPid:
        return "getpid";
    default:
        return "unknown";
    }
}

Result<int, WorkerCountError> parse_worker_count(std::string_view text)
{
    using R = Result<int, WorkerCountError>;
    const std::string_view trimmed = format_tools::trim_whitespace(text);
    int value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (trimmed.empty() || ec != std::errc{} || ptr != trimmed.data() + trimmed.size())
    {
        return R::error(WorkerCountError::NotANumber);
    }
    if (value == 0 || value < -1)
    {
        return R::error(WorkerCountError::OutOfRange, value);
    }
    return R::ok(value);
}

int resolve_worker_count(int requested) noexcept
{
    return requested > 0 ? requested : platform::get_cpu_count();
}

WorkerPool::WorkerPool(Config cfg, zmq::context_t &ctx) : m_cfg(std::move(cfg)), m_ctx(ctx)
{
    if (m_cfg.worker_program.empty())
    {
        m_cfg.worker_program = platform::get_executable_name(true);
    }
}

WorkerPool::~WorkerPool()
{
    if (!m_workers.empty())
    {
        LOGGER_WARN("WorkerPool {}: terminating {} leftover worker(s).", m_cfg.ctrl_url,
                    m_workers.size());
        signal_workers(SIGTERM);
        reap_workers();
    }
}

void WorkerPool::start()
{
    m_ctrl.emplace(m_ctx, zmq::socket_type::rep);
    m_ctrl->set(zmq::sockopt::linger, kCtrlLingerMs);
    try
    {
        m_bound_ctrl = bind_endpoint(*m_ctrl, m_cfg.ctrl_url);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("WorkerPool {}: cannot bind control endpoint: {}", m_cfg.ctrl_url, e.what());
        m_ctrl.reset();
        throw;
    }

    m_num_workers = resolve_worker_count(m_cfg.num_workers);
    LOGGER_INFO("WorkerPool {}: starting {} worker(s) on {} using {}", m_cfg.ctrl_url,
                m_num_workers, m_cfg.task_out_url, m_cfg.worker_program);

    const std::vector<std::string> argv = {m_cfg.worker_program, "--worker", m_cfg.task_out_url};
    try
    {
        for (int i = 0; i < m_num_workers; ++i)
        {
            const pid_t pid = spawn_process(argv);
            m_workers.push_back(WorkerHandle{m_cfg.task_out_url, pid});
            LOGGER_DEBUG("WorkerPool {}: worker {} has pid {}", m_cfg.ctrl_url, i, pid);
        }
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("WorkerPool {}: spawning workers failed: {}", m_cfg.ctrl_url, e.what());
        signal_workers(SIGTERM);
        reap_workers();
        m_ctrl.reset();
        throw;
    }

    if (m_cfg.on_ready)
    {
        m_cfg.on_ready(m_bound_ctrl);
    }
}

std::string WorkerPool::handle_request(const std::string &request, bool &done)
{
    const auto cmd = parse_control_command(request);
    if (!cmd)
    {
        LOGGER_WARN("WorkerPool {}: unknown command '{}'", m_cfg.ctrl_url, request);
        return fmt::format("unknown command '{}'", request);
    }

    switch (*cmd)
    {
    case ControlCommand::GetPid:
        return std::to_string(platform::get_pid());
    case ControlCommand::Stop:
        signal_workers(SIGINT);
        done = true;
        return fmt::format("WorkerPool {} stopped", m_cfg.ctrl_url);
    case ControlCommand::Kill:
        signal_workers(SIGTERM);
        done = true;
        return fmt::format("WorkerPool {} killed", m_cfg.ctrl_url);
    }
    return {};
}

void WorkerPool::serve()
{
    if (!m_ctrl)
    {
        throw std::logic_error("WorkerPool::serve() called before start()");
    }
    zmq::socket_t &ctrl = *m_ctrl;

    bool done = false;
    while (!done)
    {
        if (m_local_stop.load(std::memory_order_relaxed))
        {
            LOGGER_INFO("WorkerPool {}: stop requested locally.", m_cfg.ctrl_url);
            signal_workers(SIGINT);
            break;
        }

        std::vector<zmq::pollitem_t> items = {{ctrl.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::message_t request;
        try
        {
            zmq::poll(items, kCtrlPollInterval);
            if ((items[0].revents & ZMQ_POLLIN) == 0)
            {
                continue;
            }
            if (!ctrl.recv(request, zmq::recv_flags::dontwait))
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
                signal_workers(SIGTERM);
                break;
            }
            throw;
        }

        const std::string text = request.to_string();
        const std::string reply = handle_request(text, done);
        LOGGER_INFO("WorkerPool {}: '{}' -> '{}'", m_cfg.ctrl_url, text, reply);
        if (!ctrl.send(zmq::buffer(reply), zmq::send_flags::none))
        {
            LOGGER_ERROR("WorkerPool {}: reply to '{}' was not queued.", m_cfg.ctrl_url, text);
        }
    }

    m_ctrl.reset();
    reap_workers();
    LOGGER_INFO("WorkerPool {}: all workers exited.", m_cfg.ctrl_url);
}

void WorkerPool::run()
{
    start();
    serve();
}

void WorkerPool::signal_workers(int signo)
{
    for (const auto &w : m_workers)
    {
        if (::kill(w.pid, signo) != 0 && errno != ESRCH)
        {
            LOGGER_WARN("WorkerPool {}: kill({}, {}) failed: errno {}", m_cfg.ctrl_url, w.pid, signo,
                        errno);
        }
    }
}

void WorkerPool::reap_workers()
{
    for (const auto &w : m_workers)
    {
        const int status = reap_process(w.pid);
        LOGGER_DEBUG("WorkerPool {}: worker {} exited with {}", m_cfg.ctrl_url, w.pid, status);
    }
    m_workers.clear();
}

} // namespace zworkers::pool
