#include "pool/worker_master.hpp"
#include "pool/endpoint.hpp"
#include "pool/process_spawn.hpp"
#include "zw_service.hpp"

#include <charconv>
#include <stdexcept>
#include <thread>

#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

namespace zworkers::pool
{

namespace
{
constexpr std::chrono::milliseconds kStatePollInterval{100};
constexpr const char *kPoolProgramName = "zworkers-workerpool";
} // namespace

const char *to_string(HostState state) noexcept
{
    return state == HostState::Running ? "running" : "not-running";
}

bool is_local_host(const std::string &host) noexcept
{
    return host == "127.0.0.1" || host == "localhost";
}

bool probe_tcp_port(const std::string &host, int port) noexcept
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    if (::getaddrinfo(host.c_str(), service.c_str(), &hints, &res) != 0)
    {
        return false;
    }

    bool connected = false;
    for (addrinfo *ai = res; ai != nullptr && !connected; ai = ai->ai_next)
    {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0)
        {
            continue;
        }
        int rc = 0;
        do
        {
            rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        } while (rc != 0 && errno == EINTR);
        connected = (rc == 0);
        ::close(fd);
    }
    ::freeaddrinfo(res);
    return connected;
}

WorkerMaster::WorkerMaster(Config cfg, zmq::context_t &ctx) : m_cfg(std::move(cfg)), m_ctx(ctx)
{
    if (m_cfg.local_program.empty())
    {
        const std::filesystem::path self(platform::get_executable_name(true));
        m_cfg.local_program = (self.parent_path() / kPoolProgramName).string();
    }
    if (m_cfg.remote_program.empty())
    {
        m_cfg.remote_program = m_cfg.local_program;
    }
}

std::string WorkerMaster::ctrl_url(const std::string &host) const
{
    return make_tcp_url(host, m_cfg.ctrl_port);
}

std::vector<HostStatus> WorkerMaster::status(const std::optional<std::string> &host) const
{
    std::vector<HostStatus> out;
    for (const auto &spec : m_cfg.host_cores)
    {
        if (host && spec.host != *host)
        {
            continue;
        }
        const bool up = probe_tcp_port(spec.host, m_cfg.ctrl_port);
        out.push_back(HostStatus{spec.host, up ? HostState::Running : HostState::NotRunning});
    }
    return out;
}

bool WorkerMaster::wait_for_state(const std::string &host, HostState wanted) const
{
    const auto deadline = std::chrono::steady_clock::now() + m_cfg.transition_wait;
    for (;;)
    {
        if (probe_tcp_port(host, m_cfg.ctrl_port) == (wanted == HostState::Running))
        {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            LOGGER_WARN("WorkerMaster: {} did not become {} within {} ms", host, to_string(wanted),
                        m_cfg.transition_wait.count());
            return false;
        }
        std::this_thread::sleep_for(kStatePollInterval);
    }
}

std::vector<std::string> WorkerMaster::launch_command(const HostSpec &spec) const
{
    std::vector<std::string> argv;
    if (is_local_host(spec.host))
    {
        argv.push_back(m_cfg.local_program);
    }
    else
    {
        argv.push_back(m_cfg.remote_shell);
        argv.push_back(spec.host);
        argv.push_back(m_cfg.remote_program);
    }
    argv.push_back(ctrl_url(spec.host));
    argv.push_back(m_cfg.task_out_url);
    argv.push_back(std::to_string(spec.cores));
    return argv;
}

std::vector<HostReply> WorkerMaster::start()
{
    std::vector<HostReply> out;
    for (const auto &spec : m_cfg.host_cores)
    {
        if (probe_tcp_port(spec.host, m_cfg.ctrl_port))
        {
            out.push_back(HostReply{spec.host, fmt::format("{} already running", spec.host), false});
            continue;
        }

        const auto argv = launch_command(spec);
        LOGGER_INFO("starting {}", join_command_line(argv));
        const std::string url = ctrl_url(spec.host);
        try
        {
            spawn_detached(argv);
        }
        catch (const std::exception &e)
        {
            LOGGER_ERROR("WorkerMaster: launch for {} failed: {}", spec.host, e.what());
            out.push_back(HostReply{spec.host, fmt::format("{} failed to start: {}", url, e.what()),
                                    false});
            continue;
        }

        if (wait_for_state(spec.host, HostState::Running))
        {
            out.push_back(HostReply{spec.host, fmt::format("{} started", url), true});
        }
        else
        {
            out.push_back(
                HostReply{spec.host, fmt::format("{} launched, not answering yet", url), true});
        }
    }
    return out;
}

std::string WorkerMaster::request(const std::string &host, const std::string &command)
{
    zmq::socket_t req(m_ctx, zmq::socket_type::req);
    req.set(zmq::sockopt::linger, 0);
    req.connect(ctrl_url(host));
    if (!req.send(zmq::buffer(command), zmq::send_flags::none))
    {
        throw std::runtime_error(fmt::format("request '{}' to {} was not queued", command, host));
    }

    zmq::message_t reply;
    for (;;)
    {
        try
        {
            if (req.recv(reply, zmq::recv_flags::none))
            {
                break;
            }
        }
        catch (const zmq::error_t &e)
        {
            if (e.num() != EINTR)
            {
                throw;
            }
        }
    }
    return reply.to_string();
}

std::vector<HostReply> WorkerMaster::send_command(const char *command)
{
    std::vector<HostReply> out;
    for (const auto &spec : m_cfg.host_cores)
    {
        if (!probe_tcp_port(spec.host, m_cfg.ctrl_port))
        {
            out.push_back(HostReply{spec.host, fmt::format("{} not running", spec.host), false});
            continue;
        }
        std::string reply = request(spec.host, command);
        LOGGER_INFO("WorkerMaster: {} -> {}", command, reply);
        wait_for_state(spec.host, HostState::NotRunning);
        out.push_back(HostReply{spec.host, std::move(reply), true});
    }
    return out;
}

std::vector<HostReply> WorkerMaster::stop()
{
    return send_command("stop");
}

std::vector<HostReply> WorkerMaster::kill()
{
    return send_command("kill");
}

std::optional<pid_t> WorkerMaster::pool_pid(const std::string &host)
{
    const auto st = status(host);
    if (st.empty() || st.front().state != HostState::Running)
    {
        return std::nullopt;
    }
    const std::string reply = request(host, "getpid");
    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(reply.data(), reply.data() + reply.size(), pid);
    if (ec != std::errc{} || ptr != reply.data() + reply.size())
    {
        throw std::runtime_error(fmt::format("unexpected getpid reply from {}: '{}'", host, reply));
    }
    return pid;
}

} // namespace zworkers::pool
