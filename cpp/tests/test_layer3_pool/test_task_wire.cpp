/**
 * @file test_task_wire.cpp
 * @brief MessagePack framing of tasks and results.
 */
#include "zw_pool.hpp"
#include "test_patterns.h"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace zworkers::pool;
using json = nlohmann::json;
using ::testing::HasSubstr;

class TaskWireTest : public zworkers::tests::PureApiTest
{
};

TEST_F(TaskWireTest, TaskKeepsArgumentsAndMonitor)
{
    Task task;
    task.callable_id = "builtin.add";
    task.args = json::array({1, 2.5, "x", json{{"k", true}}});
    task.monitor = Monitor{"sum", "tcp://submitter:1913", 7};

    const auto frame = encode_task(task);
    const Task back = decode_task(frame.data(), frame.size());
    EXPECT_EQ(back.callable_id, "builtin.add");
    EXPECT_EQ(back.args, task.args);
    EXPECT_EQ(back.monitor.operation, "sum");
    EXPECT_EQ(back.monitor.backurl, "tcp://submitter:1913");
    EXPECT_EQ(back.monitor.task_no, 7);
}

/**
 * On the wire the monitor is the last positional argument; the decoded task hands it
 * back separately.
 */
TEST_F(TaskWireTest, MonitorTravelsAsLastArgument)
{
    Task task;
    task.callable_id = "f";
    task.args = json::array({10, 20});
    task.monitor.backurl = "tcp://h:1";

    const auto frame = encode_task(task);
    const json raw = json::from_msgpack(frame);
    ASSERT_TRUE(raw.is_array());
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw[0], "f");
    ASSERT_EQ(raw[1].size(), 3u);
    EXPECT_EQ(raw[1][0], 10);
    EXPECT_EQ(raw[1][2]["backurl"], "tcp://h:1");
}

TEST_F(TaskWireTest, ScalarArgumentsAreWrapped)
{
    Task task;
    task.callable_id = "f";
    task.args = 42;
    const auto frame = encode_task(task);
    const Task back = decode_task(frame.data(), frame.size());
    EXPECT_EQ(back.args, json::array({42}));
}

TEST_F(TaskWireTest, NoArgumentsDecodesToEmptyArray)
{
    Task task;
    task.callable_id = "builtin.getpid";
    const auto frame = encode_task(task);
    const Task back = decode_task(frame.data(), frame.size());
    EXPECT_TRUE(back.args.is_array());
    EXPECT_TRUE(back.args.empty());
    EXPECT_EQ(back.monitor.task_no, -1);
}

TEST_F(TaskWireTest, MalformedTaskFramesAreRejected)
{
    const std::string garbage = "\xc1\xc1\xc1";
    EXPECT_THROW((void)decode_task(garbage.data(), garbage.size()), WireError);

    const auto not_a_pair = json::to_msgpack(json::array({"f"}));
    EXPECT_THROW((void)decode_task(not_a_pair.data(), not_a_pair.size()), WireError);

    const auto no_monitor = json::to_msgpack(json::array({"f", json::array()}));
    EXPECT_THROW((void)decode_task(no_monitor.data(), no_monitor.size()), WireError);

    const auto bad_monitor = json::to_msgpack(json::array({"f", json::array({1, 2})}));
    EXPECT_THROW((void)decode_task(bad_monitor.data(), bad_monitor.size()), WireError);
}

TEST_F(TaskWireTest, SuccessfulResult)
{
    TaskResult r;
    r.outcome = json{{"answer", 42}};
    r.worker_pid = 1234;
    r.duration_s = 0.25;
    r.task_no = 3;

    const auto frame = encode_result(r);
    const TaskResult back = decode_result(frame.data(), frame.size());
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value()["answer"], 42);
    EXPECT_EQ(back.worker_pid, 1234u);
    EXPECT_DOUBLE_EQ(back.duration_s, 0.25);
    EXPECT_EQ(back.task_no, 3);
    EXPECT_THROW((void)back.failure(), std::bad_variant_access);
}

TEST_F(TaskWireTest, FailureResultKeepsDiagnostics)
{
    TaskFailure f;
    f.kind = TaskFailureKind::InvalidArguments;
    f.type_name = "std::invalid_argument";
    f.message = "bad input";
    f.callable_id = "builtin.add";
    f.operation = "sum";
    f.task_no = 9;
    TaskResult r;
    r.outcome = f;
    r.task_no = 9;

    const auto frame = encode_result(r);
    const TaskResult back = decode_result(frame.data(), frame.size());
    ASSERT_FALSE(back.ok());
    const TaskFailure &g = back.failure();
    EXPECT_EQ(g.kind, TaskFailureKind::InvalidArguments);
    EXPECT_EQ(g.type_name, "std::invalid_argument");
    EXPECT_EQ(g.message, "bad input");
    EXPECT_EQ(g.callable_id, "builtin.add");
    EXPECT_EQ(g.operation, "sum");
    EXPECT_EQ(g.task_no, 9);
}

TEST_F(TaskWireTest, UnknownFailureKindDecodesAsUnknown)
{
    const auto frame = json::to_msgpack(
        json{{"ok", false}, {"error", json{{"kind", "Exploded"}, {"message", "?"}}}});
    const TaskResult back = decode_result(frame.data(), frame.size());
    ASSERT_FALSE(back.ok());
    EXPECT_EQ(back.failure().kind, TaskFailureKind::Unknown);
    EXPECT_EQ(back.failure().message, "?");
}

TEST_F(TaskWireTest, MalformedResultFramesAreRejected)
{
    const auto no_ok = json::to_msgpack(json{{"value", 1}});
    EXPECT_THROW((void)decode_result(no_ok.data(), no_ok.size()), WireError);

    const auto failure_without_error = json::to_msgpack(json{{"ok", false}});
    try
    {
        (void)decode_result(failure_without_error.data(), failure_without_error.size());
        FAIL() << "expected WireError";
    }
    catch (const WireError &e)
    {
        EXPECT_THAT(e.what(), HasSubstr("malformed result frame"));
    }

    const std::string garbage = "\xc1";
    EXPECT_THROW((void)decode_result(garbage.data(), garbage.size()), WireError);
}

TEST_F(TaskWireTest, FailureKindNames)
{
    EXPECT_STREQ(to_string(TaskFailureKind::UnknownCallable), "UnknownCallable");
    EXPECT_STREQ(to_string(TaskFailureKind::InvalidArguments), "InvalidArguments");
    EXPECT_STREQ(to_string(TaskFailureKind::Exception), "Exception");
    EXPECT_STREQ(to_string(TaskFailureKind::Unknown), "Unknown");
}
