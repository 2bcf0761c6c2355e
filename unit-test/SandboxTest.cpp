#include <unistd.h>
#include "config.hpp"
#include "gtest/gtest.h"
#include "sandbox/runguard_executor.hpp"

using namespace std;
using namespace validator;
namespace fs = std::filesystem;

/**
 * 真正通过 runguard 运行程序的测试
 * 需要 root 权限、cgroup v1 的 memory 和 cpuacct 控制器以及构建好的 runguard，否则跳过
 */
class SandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_user = RUN_USER;
        if (geteuid() != 0) GTEST_SKIP() << "requires root privilege";
        if (!fs::exists(RUNGUARD_PATH)) GTEST_SKIP() << "runguard not found at " << RUNGUARD_PATH;
        if (!fs::is_directory("/sys/fs/cgroup/memory")) GTEST_SKIP() << "cgroup v1 memory controller not mounted";

        fs::path workdir = RUN_DIR / "SandboxTest" / ::testing::UnitTest::GetInstance()->current_test_info()->name();
        art.directory = workdir / "program";
        art.scratch = workdir / "scratch";
        fs::create_directories(art.directory);
        fs::create_directories(art.scratch);
        fs::permissions(art.scratch, fs::perms::all);

        // runguard 拒绝以 root 身份运行选手程序
        if (RUN_USER.empty()) RUN_USER = "nobody";

        limits.cpu_time_ms = 1000;
        limits.wall_time_ms = 2000;
        limits.memory_bytes = 256ll << 20;
        limits.max_output_bytes = 1 << 20;
        limits.nproc = 64;
    }

    void TearDown() override {
        RUN_USER = saved_user;
    }

    execution_outcome run(const vector<string> &command, const string &stdin_data = "") {
        art.command = command;
        return exec.execute(art, stdin_data, limits, token);
    }

    string saved_user;
    runguard_executor exec;
    artifact art;
    resource_limits limits;
    cancellation_token token;
};

TEST_F(SandboxTest, Completed) {
    auto outcome = run({"/bin/cat"}, "3 4\n");
    EXPECT_EQ(outcome.termination, termination_reason::COMPLETED);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.stdout_data, "3 4\n");
}

TEST_F(SandboxTest, NonZeroExit) {
    auto outcome = run({"/bin/sh", "-c", "echo oops >&2; exit 3"});
    EXPECT_EQ(outcome.termination, termination_reason::NON_ZERO_EXIT);
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.stderr_data, "oops\n");
}

TEST_F(SandboxTest, SleepingProgramTimesOut) {
    limits.cpu_time_ms = 500;
    limits.wall_time_ms = 1000;
    auto outcome = run({"/bin/sleep", "10"});
    EXPECT_EQ(outcome.termination, termination_reason::TIMEOUT);
    EXPECT_LT(outcome.wall_time_ms, 1000 + TEARDOWN_GRACE_MS + 1000);
}

TEST_F(SandboxTest, BusyLoopTimesOut) {
    limits.cpu_time_ms = 500;
    limits.wall_time_ms = 1000;
    auto outcome = run({"/bin/sh", "-c", "while true; do :; done"});
    EXPECT_EQ(outcome.termination, termination_reason::TIMEOUT);
}

TEST_F(SandboxTest, OutputIsTruncated) {
    limits.max_output_bytes = 1024;
    auto outcome = run({"/bin/sh", "-c", "yes | head -c 100000"});
    EXPECT_EQ(outcome.termination, termination_reason::OUTPUT_EXCEEDED);
    EXPECT_LE(outcome.stdout_data.size(), 1024u);
    EXPECT_TRUE(outcome.stdout_truncated);
}

TEST_F(SandboxTest, EndlessOutputIsKilled) {
    limits.cpu_time_ms = 5000;
    limits.wall_time_ms = 10000;
    limits.max_output_bytes = 4096;
    auto outcome = run({"/usr/bin/yes"});
    EXPECT_EQ(outcome.termination, termination_reason::OUTPUT_EXCEEDED);
    EXPECT_EQ(to_status(outcome.termination), status::RESOURCE_EXCEEDED);
    EXPECT_TRUE(outcome.stdout_truncated);
    EXPECT_LE(outcome.stdout_data.size(), 4096u);
    EXPECT_LT(outcome.wall_time_ms, 2000);
}

TEST_F(SandboxTest, UnboundedAllocationIsMemoryExceeded) {
    limits.memory_bytes = 64ll << 20;
    limits.cpu_time_ms = 5000;
    limits.wall_time_ms = 10000;
    auto outcome = run({"/bin/sh", "-c", "x=a; while :; do x=$x$x; done"});
    EXPECT_EQ(outcome.termination, termination_reason::MEMORY_EXCEEDED);
    EXPECT_EQ(to_status(outcome.termination), status::RESOURCE_EXCEEDED);
    EXPECT_GT(outcome.peak_memory_bytes, 0);
}

TEST_F(SandboxTest, CancelKillsProgram) {
    token.cancel();
    auto outcome = run({"/bin/sleep", "10"});
    EXPECT_NE(outcome.termination, termination_reason::COMPLETED);
    EXPECT_LT(outcome.wall_time_ms, 2000);
}
