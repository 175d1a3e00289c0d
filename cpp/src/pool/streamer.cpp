#include "pool/streamer.hpp"
#include "pool/endpoint.hpp"
#include "zw_service.hpp"

#include <cerrno>

namespace zworkers::pool
{

namespace
{
constexpr const char *kTerminate = "TERMINATE";
}

Streamer::Streamer(Config cfg)
    : m_cfg(std::move(cfg)),
      m_control_url(fmt::format("inproc://zworkers-streamer-{}", static_cast<const void *>(this)))
{
}

Streamer::~Streamer()
{
    stop();
}

void Streamer::run()
{
    if (m_stop_requested.load(std::memory_order_acquire))
    {
        return;
    }

    zmq::socket_t frontend(m_ctx, zmq::socket_type::pull);
    zmq::socket_t backend(m_ctx, zmq::socket_type::push);
    zmq::socket_t control(m_ctx, zmq::socket_type::pair);
    frontend.set(zmq::sockopt::linger, 0);
    backend.set(zmq::sockopt::linger, 0);
    control.set(zmq::sockopt::linger, 0);

    const std::string in_bound = bind_endpoint(frontend, m_cfg.task_in_url);
    const std::string out_bound = bind_endpoint(backend, m_cfg.task_out_url);
    control.bind(m_control_url);

    {
        std::lock_guard<std::mutex> lock(m_control_mu);
        if (m_stop_requested.load(std::memory_order_acquire))
        {
            return;
        }
        m_running.store(true, std::memory_order_release);
    }

    LOGGER_INFO("Streamer: relaying {} -> {}", in_bound, out_bound);
    if (m_cfg.on_ready)
    {
        m_cfg.on_ready(in_bound, out_bound);
    }

    try
    {
        relay(frontend, backend, control);
        LOGGER_INFO("Streamer: stopped.");
    }
    catch (const zmq::error_t &e)
    {
        if (e.num() == EINTR || e.num() == ETERM)
        {
            LOGGER_INFO("Streamer: interrupted ({}), shutting down.", e.what());
        }
        else
        {
            LOGGER_ERROR("Streamer: relay failed, shutting down: {}", e.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_control_mu);
    m_running.store(false, std::memory_order_release);
}

void Streamer::relay(zmq::socket_t &frontend, zmq::socket_t &backend, zmq::socket_t &control)
{
    zmq::proxy_steerable(frontend, backend, zmq::socket_ref(), control);
}

void Streamer::stop()
{
    std::lock_guard<std::mutex> lock(m_control_mu);
    m_stop_requested.store(true, std::memory_order_release);
    if (!m_running.load(std::memory_order_acquire))
    {
        return;
    }
    try
    {
        zmq::socket_t ctl(m_ctx, zmq::socket_type::pair);
        ctl.set(zmq::sockopt::linger, 1000);
        ctl.connect(m_control_url);
        if (!ctl.send(zmq::buffer(std::string_view(kTerminate)), zmq::send_flags::none))
        {
            LOGGER_WARN("Streamer: stop request was not queued.");
        }
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("Streamer: could not deliver stop request: {}", e.what());
    }
}

} // namespace zworkers::pool
