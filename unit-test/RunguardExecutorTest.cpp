#include <algorithm>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/runguard_executor.hpp"

using namespace std;
using namespace validator;
using ::testing::Contains;
using ::testing::ElementsAre;

class RunguardExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_chroot = CHROOT_DIR;
        saved_user = RUN_USER;
        art.directory = "/tmp/run/submissions/1/program";
        art.scratch = "/tmp/run/submissions/1/scratch";
        art.command = {"{dir}/program", "--flag"};
        limits.cpu_time_ms = 1500;
        limits.wall_time_ms = 3000;
        limits.memory_bytes = 1000;
        limits.max_output_bytes = 4096;
    }

    void TearDown() override {
        CHROOT_DIR = saved_chroot;
        RUN_USER = saved_user;
    }

    /**
     * @brief 返回选项 name 后面的值，没有该选项时返回空字符串
     */
    static string option(const vector<string> &args, const string &name) {
        auto it = find(args.begin(), args.end(), name);
        if (it == args.end() || it + 1 == args.end()) return "";
        return *(it + 1);
    }

    static vector<string> command(const vector<string> &args) {
        auto it = find(args.begin(), args.end(), "--");
        if (it == args.end()) return {};
        return vector<string>(it + 1, args.end());
    }

    filesystem::path saved_chroot;
    string saved_user;
    artifact art;
    resource_limits limits;
    runguard_executor exec;
};

TEST_F(RunguardExecutorTest, LimitsAreConverted) {
    auto args = exec.build_command(art, limits, "/tmp/run/runs/1", "/validator/1");
    EXPECT_EQ(args.front(), RUNGUARD_PATH.string());
    EXPECT_EQ(option(args, "--cpu-time"), "1.500");
    EXPECT_EQ(option(args, "--wall-time"), "3.000");
    EXPECT_EQ(option(args, "--memory-limit"), "1");  // 向上取整到 KB
    EXPECT_EQ(option(args, "--stream-size"), "4096");
    EXPECT_EQ(option(args, "--cgroup"), "/validator/1");
    EXPECT_EQ(option(args, "--out-meta"), "/tmp/run/runs/1/meta");
    EXPECT_EQ(option(args, "--standard-input-file"), "/tmp/run/runs/1/stdin");
    EXPECT_THAT(args, Contains("--no-network"));
    EXPECT_EQ(option(args, "--file-limit"), "");
}

TEST_F(RunguardExecutorTest, WithoutChroot) {
    CHROOT_DIR.clear();
    auto args = exec.build_command(art, limits, "/tmp/run/runs/1", "/validator/1");
    EXPECT_EQ(option(args, "--root"), "");
    EXPECT_EQ(option(args, "--work-dir"), "/tmp/run/submissions/1/scratch");
    EXPECT_THAT(command(args), ElementsAre("/tmp/run/submissions/1/program/program", "--flag"));
}

TEST_F(RunguardExecutorTest, WithChroot) {
    CHROOT_DIR = "/chroot";
    RUN_USER = "validator-run";
    auto args = exec.build_command(art, limits, "/tmp/run/runs/1", "/validator/1");
    EXPECT_EQ(option(args, "--root"), "/chroot");
    EXPECT_EQ(option(args, "--user"), "validator-run");
    EXPECT_EQ(option(args, "--work-dir"), "/scratch");
    EXPECT_THAT(args, Contains("/tmp/run/submissions/1/program:/program"));
    EXPECT_THAT(args, Contains("/tmp/run/submissions/1/scratch:/scratch:rw"));
    EXPECT_THAT(command(args), ElementsAre("/program/program", "--flag"));
}

TEST_F(RunguardExecutorTest, WritableProgramDirectory) {
    CHROOT_DIR = "/chroot";
    art.writable = true;
    auto args = exec.build_command(art, limits, "/tmp/run/runs/1", "/validator/1");
    EXPECT_THAT(args, Contains("/tmp/run/submissions/1/program:/program:rw"));
}
