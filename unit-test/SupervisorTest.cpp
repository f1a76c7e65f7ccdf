#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "execution/supervisor.hpp"
#include "gtest/gtest.h"
#include "test/fake_container_runtime.hpp"

using namespace std;
using namespace runner;
using namespace runner::sandbox;
using runner::sandbox::mock::fake_container_runtime;

class SupervisorTest : public ::testing::Test {
protected:
    unique_ptr<sandbox_handle> launch() {
        confinement_profile profile;
        profile.memory_bytes = 64 * 1024 * 1024;
        profile.cpu_quota = 50000;
        profile.cpu_period = 100000;
        profile.workspace_mount = "/workspace";
        profile.scratch_size = 0;
        profile.output_limit = 1024 * 1024;
        return launch_sandbox(runtime, "runner-python", "python main.py", "/tmp/ws", profile,
                              chrono::milliseconds(1000));
    }

    fake_container_runtime runtime;
};

TEST_F(SupervisorTest, CompletionWins) {
    runtime.script.run_time = chrono::milliseconds(20);
    runtime.script.exit_code = 1;
    auto sandbox = launch();
    EXPECT_EQ(supervise(*sandbox, chrono::milliseconds(2000), chrono::milliseconds(500)), 1);
    EXPECT_EQ(runtime.count("kill"), 0u);
}

TEST_F(SupervisorTest, HugeTimeoutStillWaitsForCompletion) {
    runtime.script.run_time = chrono::milliseconds(50);
    runtime.script.exit_code = 2;
    auto sandbox = launch();
    elapsed_time timer;
    EXPECT_EQ(supervise(*sandbox, chrono::milliseconds(10000000000000LL), chrono::milliseconds(500)), 2);
    EXPECT_GE(timer.duration<chrono::milliseconds>().count(), 40);
    EXPECT_EQ(runtime.count("kill"), 0u);
}

TEST_F(SupervisorTest, MaximalTimeoutStillWaitsForCompletion) {
    runtime.script.run_time = chrono::milliseconds(20);
    auto sandbox = launch();
    EXPECT_EQ(supervise(*sandbox, chrono::milliseconds::max(), chrono::milliseconds(500)), 0);
    EXPECT_EQ(runtime.count("kill"), 0u);
}

TEST_F(SupervisorTest, DeadlineKillsContainer) {
    runtime.script.hang = true;
    auto sandbox = launch();
    elapsed_time timer;
    try {
        supervise(*sandbox, chrono::milliseconds(100), chrono::milliseconds(1000));
        FAIL() << "supervise should time out";
    } catch (execution_timeout_error &ex) {
        EXPECT_STREQ(ex.what(), "Execution timeout (100 ms)");
    }
    EXPECT_GE(timer.duration<chrono::milliseconds>().count(), 100);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1000);
    EXPECT_EQ(runtime.count("kill"), 1u);
    EXPECT_EQ(sandbox->completion().get(), 137);
}

TEST_F(SupervisorTest, KillFailureStillTimesOut) {
    runtime.script.hang = true;
    runtime.script.fail_kill = true;
    auto sandbox = launch();
    EXPECT_THROW(supervise(*sandbox, chrono::milliseconds(50), chrono::milliseconds(50)), execution_timeout_error);
    EXPECT_EQ(runtime.count("kill"), 1u);
}

TEST_F(SupervisorTest, UnresponsiveContainerIsAbandoned) {
    runtime.script.hang = true;
    runtime.script.ignore_kill = true;
    auto sandbox = launch();
    elapsed_time timer;
    EXPECT_THROW(supervise(*sandbox, chrono::milliseconds(50), chrono::milliseconds(100)), execution_timeout_error);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 1000);

    auto completion = sandbox->completion();
    ASSERT_EQ(completion.wait_for(chrono::seconds(5)), future_status::ready);
    EXPECT_THROW(completion.get(), daemon_error);
}
