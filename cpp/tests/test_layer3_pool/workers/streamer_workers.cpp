/**
 * @file streamer_workers.cpp
 * @brief Worker scenarios for the Streamer relay.
 */
#include "streamer_workers.h"
#include "pool_test_support.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include "zw_pool.hpp"

#include <cerrno>
#include <chrono>
#include <future>
#include <set>
#include <string>
#include <thread>

using namespace zworkers::tests::helper;
using namespace zworkers::tests::pool_support;
using namespace zworkers::pool;
using zworkers::utils::Logger;
using namespace std::chrono_literals;

namespace zworkers::tests::worker::streamer
{

namespace
{
zmq::socket_t make_socket(zmq::context_t &ctx, zmq::socket_type type)
{
    zmq::socket_t s(ctx, type);
    s.set(zmq::sockopt::linger, 0);
    s.set(zmq::sockopt::rcvtimeo, 5000);
    return s;
}

/// Relays one frame, then fails the way a broken transport does.
class OneFrameStreamer : public Streamer
{
  public:
    using Streamer::Streamer;

  protected:
    void relay(zmq::socket_t &frontend, zmq::socket_t &backend, zmq::socket_t & /*control*/) override
    {
        zmq::message_t msg;
        if (frontend.recv(msg, zmq::recv_flags::none))
        {
            (void)backend.send(msg, zmq::send_flags::none);
        }
        errno = EPROTO;
        throw zmq::error_t();
    }
};
} // namespace

int relays_in_order()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            EXPECT_TRUE(st.streamer().running());

            zmq::context_t ctx(1);
            auto push = make_socket(ctx, zmq::socket_type::push);
            auto pull = make_socket(ctx, zmq::socket_type::pull);
            push.connect(st.in_url());
            pull.connect(st.out_url());

            constexpr int kCount = 50;
            for (int i = 0; i < kCount; ++i)
            {
                const std::string body = fmt::format("frame-{}", i);
                ASSERT_TRUE(push.send(zmq::buffer(body), zmq::send_flags::none));
            }
            for (int i = 0; i < kCount; ++i)
            {
                zmq::message_t msg;
                ASSERT_TRUE(pull.recv(msg, zmq::recv_flags::none)) << "timed out at " << i;
                EXPECT_EQ(msg.to_string(), fmt::format("frame-{}", i));
            }
        },
        "streamer::relays_in_order", Logger::GetLifecycleModule());
}

int fans_out_to_every_worker()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            zmq::context_t ctx(1);
            auto push = make_socket(ctx, zmq::socket_type::push);
            auto pull_a = make_socket(ctx, zmq::socket_type::pull);
            auto pull_b = make_socket(ctx, zmq::socket_type::pull);
            pull_a.connect(st.out_url());
            pull_b.connect(st.out_url());
            push.connect(st.in_url());
            // Both pullers must be attached before the first frame is relayed.
            std::this_thread::sleep_for(300ms);

            constexpr int kCount = 20;
            for (int i = 0; i < kCount; ++i)
                ASSERT_TRUE(push.send(zmq::buffer(std::to_string(i)), zmq::send_flags::none));

            std::set<std::string> seen;
            int got_a = 0;
            int got_b = 0;
            std::vector<zmq::pollitem_t> items = {{pull_a.handle(), 0, ZMQ_POLLIN, 0},
                                                  {pull_b.handle(), 0, ZMQ_POLLIN, 0}};
            const auto deadline = std::chrono::steady_clock::now() + 10s;
            while (got_a + got_b < kCount && std::chrono::steady_clock::now() < deadline)
            {
                zmq::poll(items, 200ms);
                zmq::message_t msg;
                if ((items[0].revents & ZMQ_POLLIN) && pull_a.recv(msg, zmq::recv_flags::dontwait))
                {
                    ++got_a;
                    seen.insert(msg.to_string());
                }
                if ((items[1].revents & ZMQ_POLLIN) && pull_b.recv(msg, zmq::recv_flags::dontwait))
                {
                    ++got_b;
                    seen.insert(msg.to_string());
                }
            }
            EXPECT_EQ(got_a + got_b, kCount);
            EXPECT_EQ(seen.size(), static_cast<size_t>(kCount)) << "a frame was delivered twice";
            EXPECT_GT(got_a, 0);
            EXPECT_GT(got_b, 0);
        },
        "streamer::fans_out_to_every_worker", Logger::GetLifecycleModule());
}

int stop_before_run_returns_immediately()
{
    return run_gtest_worker(
        []()
        {
            bool ready_called = false;
            Streamer s(Streamer::Config{"tcp://127.0.0.1:*", "tcp://127.0.0.1:*",
                                        [&](const std::string &, const std::string &)
                                        { ready_called = true; }});
            s.stop();
            const auto t0 = std::chrono::steady_clock::now();
            s.run();
            EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
            EXPECT_FALSE(ready_called);
            EXPECT_FALSE(s.running());
        },
        "streamer::stop_before_run_returns_immediately", Logger::GetLifecycleModule());
}

int stop_is_idempotent()
{
    return run_gtest_worker(
        []()
        {
            StreamerThread st;
            ASSERT_TRUE(st.streamer().running());
            st.streamer().stop();
            st.streamer().stop();

            const auto deadline = std::chrono::steady_clock::now() + 5s;
            while (st.streamer().running() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(10ms);
            EXPECT_FALSE(st.streamer().running());
            st.streamer().stop();
        },
        "streamer::stop_is_idempotent", Logger::GetLifecycleModule());
}

int bind_conflict_throws()
{
    return run_gtest_worker(
        []()
        {
            zmq::context_t ctx(1);
            auto holder = make_socket(ctx, zmq::socket_type::pull);
            const std::string taken = bind_endpoint(holder, "tcp://127.0.0.1:*");

            Streamer s(Streamer::Config{taken, "tcp://127.0.0.1:*", nullptr});
            EXPECT_THROW(s.run(), zmq::error_t);
            EXPECT_FALSE(s.running());
        },
        "streamer::bind_conflict_throws", Logger::GetLifecycleModule());
}

int relay_error_is_a_normal_shutdown()
{
    return run_gtest_worker(
        []()
        {
            std::promise<std::string> in_url;
            std::promise<std::string> out_url;
            OneFrameStreamer s(Streamer::Config{"tcp://127.0.0.1:*", "tcp://127.0.0.1:*",
                                                [&](const std::string &in, const std::string &out)
                                                {
                                                    in_url.set_value(in);
                                                    out_url.set_value(out);
                                                }});
            bool threw = false;
            std::thread relay(
                [&]
                {
                    try
                    {
                        s.run();
                    }
                    catch (const std::exception &)
                    {
                        threw = true;
                    }
                });

            auto in_future = in_url.get_future();
            auto out_future = out_url.get_future();
            ASSERT_EQ(in_future.wait_for(10s), std::future_status::ready);
            ASSERT_EQ(out_future.wait_for(10s), std::future_status::ready);

            zmq::context_t ctx(1);
            auto push = make_socket(ctx, zmq::socket_type::push);
            auto pull = make_socket(ctx, zmq::socket_type::pull);
            pull.connect(out_future.get());
            push.connect(in_future.get());
            ASSERT_TRUE(push.send(zmq::str_buffer("last frame"), zmq::send_flags::none));

            zmq::message_t msg;
            EXPECT_TRUE(pull.recv(msg, zmq::recv_flags::none));
            EXPECT_EQ(msg.to_string(), "last frame");

            relay.join();
            EXPECT_FALSE(threw);
            EXPECT_FALSE(s.running());
        },
        "streamer::relay_error_is_a_normal_shutdown", Logger::GetLifecycleModule());
}

} // namespace zworkers::tests::worker::streamer

namespace
{
struct StreamerWorkerRegistrar
{
    StreamerWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "streamer")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace zworkers::tests::worker::streamer;
                if (scenario == "relays_in_order")
                    return relays_in_order();
                if (scenario == "fans_out_to_every_worker")
                    return fans_out_to_every_worker();
                if (scenario == "stop_before_run_returns_immediately")
                    return stop_before_run_returns_immediately();
                if (scenario == "stop_is_idempotent")
                    return stop_is_idempotent();
                if (scenario == "relay_error_is_a_normal_shutdown")
                    return relay_error_is_a_normal_shutdown();
                if (scenario == "bind_conflict_throws")
                    return bind_conflict_throws();
                fmt::print(stderr, "ERROR: Unknown streamer scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static StreamerWorkerRegistrar g_streamer_registrar;
} // namespace
