/**
 * @file test_lifecycle.cpp
 * @brief LifecycleManager: ordering, idempotency, fatal misuse, shutdown timeouts.
 *
 * Everything that touches the global manager runs in a worker process; ModuleDef
 * validation runs in-process.
 */
#include "zw_service.hpp"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>

using namespace zworkers::utils;
using namespace ::testing;

class LifecycleTest : public zworkers::tests::IsolatedProcessTest
{
};

class ModuleDefTest : public zworkers::tests::PureApiTest
{
};

// Only the first guard owns the lifecycle; later guards warn and do nothing.
TEST_F(LifecycleTest, MultipleGuardsWarning)
{
    auto proc = SpawnWorker("lifecycle.multiple_guards_warning");
    ExpectWorkerOk(proc, {"WARNING: LifecycleGuard constructed but an owner already exists."});
}

TEST_F(LifecycleTest, StartsInDependencyOrderAndStopsInReverse)
{
    auto proc = SpawnWorker("lifecycle.module_registration_and_initialization");
    ExpectWorkerOk(proc);
}

TEST_F(LifecycleTest, IsInitializedFlag)
{
    auto proc = SpawnWorker("lifecycle.is_initialized_flag");
    ExpectWorkerOk(proc);
}

TEST_F(LifecycleTest, InitIdempotency)
{
    auto proc = SpawnWorker("lifecycle.init_idempotency");
    ExpectWorkerOk(proc);
}

TEST_F(LifecycleTest, FinalizeIdempotency)
{
    auto proc = SpawnWorker("lifecycle.finalize_idempotency");
    ExpectWorkerOk(proc);
}

TEST_F(LifecycleTest, IsFinalizedFlag)
{
    auto proc = SpawnWorker("lifecycle.is_finalized_flag");
    ExpectWorkerOk(proc);
}

TEST_F(LifecycleTest, RegisterAfterInitAborts)
{
    auto proc = SpawnWorker("lifecycle.register_after_init_aborts");
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("FATAL: register_module called after initialization."));
}

TEST_F(LifecycleTest, FailsWithUnresolvedDependency)
{
    auto proc = SpawnWorker("lifecycle.unresolved_dependency");
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("[ZW_LifeCycle] FATAL: Undefined dependency: Ghost"));
}

TEST_F(LifecycleTest, StaticCircularDependencyAborts)
{
    auto proc = SpawnWorker("lifecycle.static_circular_dependency_aborts");
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("[ZW_LifeCycle] FATAL: Circular dependency detected"));
}

TEST_F(LifecycleTest, StartupExceptionAborts)
{
    auto proc = SpawnWorker("lifecycle.startup_exception_aborts");
    ASSERT_NE(proc.wait_for_exit(), 0);
    EXPECT_THAT(proc.get_stderr(), HasSubstr("startup refused"));
    EXPECT_THAT(proc.get_stderr(), HasSubstr("Module 'Refuser' was point of failure."));
}

// A shutdown callback that overruns its timeout is abandoned and reported once.
TEST_F(LifecycleTest, ShutdownTimeoutIsReported)
{
    auto proc = SpawnWorker("lifecycle.shutdown_timeout_is_reported");
    ExpectWorkerOk(proc, {"LIFECYCLE_SINK:", "did not shut down within 100ms"});
}

TEST_F(LifecycleTest, LogSinkReceivesMessages)
{
    auto proc = SpawnWorker("lifecycle.log_sink_receives_messages");
    ExpectWorkerOk(proc);
}

// ============================================================================
// ModuleDef validation (MAX_MODULE_NAME_LEN = 256)
// ============================================================================

TEST_F(ModuleDefTest, RejectsEmptyName)
{
    EXPECT_THROW(ModuleDef(""), std::invalid_argument);
}

TEST_F(ModuleDefTest, RejectsNameExceedingMaxLength)
{
    std::string long_name(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'x');
    EXPECT_THROW(ModuleDef mod(long_name), std::length_error);
}

TEST_F(ModuleDefTest, AcceptsNameAtMaxLength)
{
    std::string max_name(ModuleDef::MAX_MODULE_NAME_LEN, 'a');
    EXPECT_NO_THROW({ ModuleDef mod(max_name); });
}

TEST_F(ModuleDefTest, AddDependencyIgnoresEmptyAndRejectsOverlong)
{
    ModuleDef mod("ValidModule");
    EXPECT_NO_THROW(mod.add_dependency(""));
    std::string long_dep(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'y');
    EXPECT_THROW(mod.add_dependency(long_dep), std::length_error);
}

TEST_F(ModuleDefTest, RejectsOverlongCallbackArgument)
{
    ModuleDef mod("ValidModule");
    std::string long_arg(ModuleDef::MAX_CALLBACK_PARAM_STRLEN + 1, 'z');
    EXPECT_THROW(mod.set_startup([](const char *) {}, long_arg), std::length_error);
}
