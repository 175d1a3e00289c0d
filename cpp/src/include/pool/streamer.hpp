#pragma once
/**
 * @file streamer.hpp
 * @brief Relay from the task inbound endpoint (bound PULL) to the distribution
 *        endpoint (bound PUSH).
 *
 * Submitters connect PUSH sockets to `task_in_url`; workers connect PULL sockets to
 * `task_out_url`. The relay keeps no queue of its own beyond the sockets' high-water
 * marks, so any number of submitters can feed any number of pools.
 *
 * The Streamer owns a private ZeroMQ context. run() blocks until stop() is called
 * (from any thread), the context is interrupted, or the relay hits a transport error;
 * all three are a normal return, the last one logged at ERROR. Bind failures
 * propagate as zmq::error_t / std::runtime_error.
 *
 * @code
 *   Streamer s({"tcp://*:1910", "tcp://*:1911", nullptr});
 *   std::thread t([&] { s.run(); });
 *   ...
 *   s.stop();
 *   t.join();
 * @endcode
 */
#include "zworkers_pool_export.h"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace zworkers::pool
{

class ZWORKERS_POOL_EXPORT Streamer
{
  public:
    struct Config
    {
        std::string task_in_url;  ///< bound PULL, submitters connect here
        std::string task_out_url; ///< bound PUSH, workers connect here
        /// Called with the bound (in, out) endpoints once both are listening.
        std::function<void(const std::string &, const std::string &)> on_ready;
    };

    explicit Streamer(Config cfg);
    virtual ~Streamer();

    Streamer(const Streamer &) = delete;
    Streamer &operator=(const Streamer &) = delete;

    /**
     * @brief Binds both endpoints and relays until stopped.
     * @throws zmq::error_t / std::runtime_error / std::invalid_argument on bind failure;
     *         a failed relay is logged and returns normally.
     */
    void run();

    /**
     * @brief Asks a running relay to return. Safe from any thread; a no-op if run()
     *        has not bound its sockets yet, in which case the next run() returns at once.
     */
    void stop();

    [[nodiscard]] bool running() const noexcept { return m_running.load(std::memory_order_acquire); }

  protected:
    /// Moves frames until @p control receives TERMINATE; throws zmq::error_t when it fails.
    virtual void relay(zmq::socket_t &frontend, zmq::socket_t &backend, zmq::socket_t &control);

  private:
    Config m_cfg;
    zmq::context_t m_ctx{1};
    std::string m_control_url;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stop_requested{false};
    std::mutex m_control_mu;
};

} // namespace zworkers::pool
