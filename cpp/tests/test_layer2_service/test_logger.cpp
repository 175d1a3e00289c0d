/**
 * @file test_logger.cpp
 * @brief Logger tests.
 *
 * The logger is a lifecycle module, so the logic lives in worker processes
 * (workers/logger_workers.cpp); this file spawns them and checks their results.
 */
#include "zw_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace zworkers::tests::helper;
using zworkers::utils::Logger;
using ::testing::HasSubstr;

class LoggerTest : public zworkers::tests::IsolatedProcessTest
{
  protected:
    std::vector<fs::path> paths_to_clean_;

    void TearDown() override
    {
        for (const auto &p : paths_to_clean_)
        {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }

    fs::path GetUniqueLogPath(const std::string &test_name)
    {
        auto p = make_temp_path("logger_" + test_name);
        paths_to_clean_.push_back(p);
        return p;
    }
};

class LoggerLevelTest : public zworkers::tests::PureApiTest
{
};

TEST_F(LoggerLevelTest, ParseLevelIsCaseInsensitive)
{
    EXPECT_EQ(Logger::parse_level("trace"), Logger::Level::L_TRACE);
    EXPECT_EQ(Logger::parse_level("DEBUG"), Logger::Level::L_DEBUG);
    EXPECT_EQ(Logger::parse_level("Info"), Logger::Level::L_INFO);
    EXPECT_EQ(Logger::parse_level("warn"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("error"), Logger::Level::L_ERROR);
    EXPECT_EQ(Logger::parse_level("system"), Logger::Level::L_SYSTEM);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
    EXPECT_FALSE(Logger::parse_level("").has_value());
}

TEST_F(LoggerTest, BasicLogging)
{
    auto log_path = GetUniqueLogPath("basic_logging");
    auto proc = SpawnWorker("logger.basic_logging", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, LogLevelFiltering)
{
    auto log_path = GetUniqueLogPath("log_level_filtering");
    auto proc = SpawnWorker("logger.log_level_filtering", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, BadFormatString)
{
    auto log_path = GetUniqueLogPath("bad_format_string");
    auto proc = SpawnWorker("logger.bad_format_string", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ConsoleIsDefaultSink)
{
    auto proc = SpawnWorker("logger.console_is_default_sink");
    ExpectWorkerOk(proc, {"console line 42"});
    EXPECT_THAT(proc.get_stdout(), ::testing::Not(HasSubstr("console line 42")))
        << "log lines must leave stdout to the program";
}

TEST_F(LoggerTest, MultithreadStress)
{
    auto log_path = GetUniqueLogPath("multithread_stress");
    auto proc = SpawnWorker("logger.multithread_stress", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, FlushWaitsForQueue)
{
    auto log_path = GetUniqueLogPath("flush_waits_for_queue");
    auto proc = SpawnWorker("logger.flush_waits_for_queue", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, ShutdownIdempotency)
{
    auto log_path = GetUniqueLogPath("shutdown_idempotency");
    auto proc = SpawnWorker("logger.shutdown_idempotency", {log_path.string()});
    ExpectWorkerOk(proc);
}

// Several processes append to one file; every line must arrive whole.
TEST_F(LoggerTest, InterProcessFlock)
{
    auto log_path = GetUniqueLogPath("inter_process_flock");
    const int procs = scaled_value(4, 2);
    const int msgs = scaled_value(500, 100);

    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < procs; ++i)
    {
        scenarios.push_back({"logger.inter_process_flock",
                             {log_path.string(), std::to_string(i), std::to_string(msgs)}});
    }
    auto workers = SpawnWorkers(scenarios);
    ExpectAllWorkersOk(workers);

    std::string contents;
    ASSERT_TRUE(read_file_contents(log_path.string(), contents));
    EXPECT_EQ(count_lines(contents, "WORKER_ID="), static_cast<size_t>(procs * msgs));
    EXPECT_EQ(count_lines(contents, "PAYLOAD=[ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789]"),
              static_cast<size_t>(procs * msgs));
}

TEST_F(LoggerTest, QueueFullAndMessageDropping)
{
    auto log_path = GetUniqueLogPath("queue_full");
    auto proc = SpawnWorker("logger.queue_full_and_message_dropping", {log_path.string()});
    ExpectWorkerOk(proc);
}

TEST_F(LoggerTest, BadLogfilePathKeepsSink)
{
    // A regular file cannot be a parent directory.
    auto blocker = GetUniqueLogPath("blocker");
    {
        std::ofstream(blocker.string()) << "x";
    }
    auto proc = SpawnWorker("logger.bad_logfile_path_keeps_sink",
                            {(blocker / "sub" / "x.log").string()});
    ExpectWorkerOk(proc, {"still on the console"}, /*allow_expected_logger_errors=*/true);
}

TEST_F(LoggerTest, UseWithoutLifecycleAborts)
{
    auto proc = SpawnWorker("logger.use_without_lifecycle_aborts");
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("before the Logger module was initialized"));
}
