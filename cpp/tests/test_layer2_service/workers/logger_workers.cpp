/**
 * @file logger_workers.cpp
 * @brief Worker functions for the Logger tests.
 *
 * Each runs in its own process so that the Logger's lifecycle (start, sink switches,
 * shutdown) is exercised from a clean slate.
 */
#include "logger_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include "zw_service.hpp"

#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace zworkers::tests::helper;
using namespace zworkers::utils;
using namespace std::chrono_literals;

namespace zworkers::tests::worker::logger
{

int test_basic_logging(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO("Hello, world!");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("Hello, world!"), std::string::npos);
            EXPECT_NE(contents.find("[INFO  ]"), std::string::npos);
            EXPECT_NE(contents.find(fmt::format("PID:{:5}", ::getpid())), std::string::npos);
        },
        "logger::test_basic_logging", Logger::GetLifecycleModule());
}

int test_log_level_filtering(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            const auto level = Logger::parse_level("WARNING");
            ASSERT_TRUE(level.has_value());
            Logger::instance().set_level(*level);
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_WARNING);

            LOGGER_DEBUG("debug is filtered.");
            LOGGER_INFO("info is filtered.");
            LOGGER_WARN("warn appears.");
            LOGGER_ERROR("error appears.");
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(contents.find("is filtered."), std::string::npos);
            EXPECT_NE(contents.find("warn appears."), std::string::npos);
            EXPECT_NE(contents.find("error appears."), std::string::npos);
        },
        "logger::test_log_level_filtering", Logger::GetLifecycleModule());
}

int test_bad_format_string(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            LOGGER_INFO_RT("Bad format: {} {}", "one"); // too few args
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("[FORMAT ERROR]"), std::string::npos);
        },
        "logger::test_bad_format_string", Logger::GetLifecycleModule());
}

// Until a file is configured, log lines go to stderr.
int test_console_is_default_sink()
{
    return run_gtest_worker(
        []()
        {
            LOGGER_INFO("console line {}", 42);
            Logger::instance().flush();
        },
        "logger::test_console_is_default_sink", Logger::GetLifecycleModule());
}

int test_multithread_stress(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            const int THREADS = scaled_value(16, 4);
            const int MSGS_PER_THREAD = scaled_value(200, 50);
            Logger::instance().set_max_queue_size(static_cast<size_t>(THREADS * MSGS_PER_THREAD));
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));

            ThreadRacer racer(THREADS);
            ASSERT_TRUE(racer.race(
                [&](int i)
                {
                    for (int j = 0; j < MSGS_PER_THREAD; ++j)
                    {
                        LOGGER_INFO("msg from thread {}-{}", i, j);
                    }
                }));
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(count_lines(contents, "msg from thread"),
                      static_cast<size_t>(THREADS * MSGS_PER_THREAD));
        },
        "logger::test_multithread_stress", Logger::GetLifecycleModule());
}

int test_flush_waits_for_queue(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            ASSERT_TRUE(Logger::instance().set_logfile(log_path));
            for (int i = 0; i < 100; ++i)
                LOGGER_INFO("message {}", i);
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_EQ(count_lines(contents, "message "), 100u);
        },
        "logger::test_flush_waits_for_queue", Logger::GetLifecycleModule());
}

int test_shutdown_idempotency(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &L = Logger::instance();
            ASSERT_TRUE(L.set_logfile(log_path));
            LOGGER_INFO("Message before shutdown.");
            L.flush();

            ThreadRacer racer(8);
            ASSERT_TRUE(racer.race([](int)
                                   { FinalizeApp(std::source_location::current()); }));

            // Dropped quietly once the logger is down.
            LOGGER_INFO("This message should NOT be logged.");
            std::this_thread::sleep_for(100ms);

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("Message before shutdown."), std::string::npos);
            EXPECT_EQ(contents.find("This message should NOT be logged."), std::string::npos);
        },
        "logger::test_shutdown_idempotency", Logger::GetLifecycleModule());
}

int test_inter_process_flock(const std::string &log_path, const std::string &worker_id,
                             int msg_count)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &L = Logger::instance();
            L.set_log_sink_messages_enabled(false);
            L.set_max_queue_size(static_cast<size_t>(msg_count) + 16);
            ASSERT_TRUE(L.set_logfile(log_path, true));

            for (int i = 0; i < msg_count; ++i)
            {
                LOGGER_INFO("WORKER_ID={} MSG_NUM={} PAYLOAD=[ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789]",
                            worker_id, i);
            }
            L.flush();
        },
        "logger::test_inter_process_flock", Logger::GetLifecycleModule());
}

int test_queue_full_and_message_dropping(const std::string &log_path)
{
    return run_gtest_worker(
        [&]()
        {
            Logger &logger = Logger::instance();
            logger.set_max_queue_size(5);
            ASSERT_TRUE(logger.set_logfile(log_path));
            logger.set_log_sink_messages_enabled(false);

            for (int i = 0; i < 5000; ++i)
            {
                LOGGER_INFO("Message {}", i);
            }
            const size_t dropped = logger.get_total_dropped_since_sink_switch();
            // Let the worker drain, so the flush request itself is not rejected.
            std::this_thread::sleep_for(200ms);
            logger.flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            ASSERT_GT(dropped, 0u) << "a 5-entry queue absorbed 5000 messages";
            EXPECT_NE(contents.find("Overflow detected"), std::string::npos);
            EXPECT_EQ(count_lines(contents, "Message "), 5000u - dropped);
        },
        "logger::test_queue_full_and_message_dropping", Logger::GetLifecycleModule());
}

// A log file that cannot be opened leaves the current sink in place.
int test_bad_logfile_path_keeps_sink(const std::string &bad_path)
{
    return run_gtest_worker(
        [&]()
        {
            EXPECT_FALSE(Logger::instance().set_logfile(bad_path));
            LOGGER_WARN("still on the console");
            Logger::instance().flush();
        },
        "logger::test_bad_logfile_path_keeps_sink", Logger::GetLifecycleModule());
}

int use_without_lifecycle_aborts()
{
    // No LifecycleGuard: set_logfile must panic. Returning means it did not.
    bool ok = Logger::instance().set_logfile("/tmp/zworkers_logger_no_lifecycle.log");
    (void)ok;
    return 0;
}

} // namespace zworkers::tests::worker::logger

namespace
{
struct LoggerWorkerRegistrar
{
    LoggerWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "logger")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace zworkers::tests::worker::logger;
                if (scenario == "basic_logging" && argc > 2)
                    return test_basic_logging(argv[2]);
                if (scenario == "log_level_filtering" && argc > 2)
                    return test_log_level_filtering(argv[2]);
                if (scenario == "bad_format_string" && argc > 2)
                    return test_bad_format_string(argv[2]);
                if (scenario == "console_is_default_sink")
                    return test_console_is_default_sink();
                if (scenario == "multithread_stress" && argc > 2)
                    return test_multithread_stress(argv[2]);
                if (scenario == "flush_waits_for_queue" && argc > 2)
                    return test_flush_waits_for_queue(argv[2]);
                if (scenario == "shutdown_idempotency" && argc > 2)
                    return test_shutdown_idempotency(argv[2]);
                if (scenario == "inter_process_flock" && argc > 4)
                    return test_inter_process_flock(argv[2], argv[3], std::stoi(argv[4]));
                if (scenario == "queue_full_and_message_dropping" && argc > 2)
                    return test_queue_full_and_message_dropping(argv[2]);
                if (scenario == "bad_logfile_path_keeps_sink" && argc > 2)
                    return test_bad_logfile_path_keeps_sink(argv[2]);
                if (scenario == "use_without_lifecycle_aborts")
                    return use_without_lifecycle_aborts();
                fmt::print(stderr, "ERROR: Unknown logger scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LoggerWorkerRegistrar g_logger_registrar;
} // namespace
