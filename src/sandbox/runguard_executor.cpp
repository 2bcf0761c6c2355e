#include "sandbox/runguard_executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cmath>
#include <fstream>
#include "common/defer.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runguard.hpp"

namespace validator {
using namespace std;
namespace fs = std::filesystem;

static const char *CGROUP_CONTROLLERS[] = {"memory", "cpuacct"};

static string seconds(int64_t ms) {
    return fmt::format("{:.3f}", ms / 1000.0);
}

static string kilobytes(int64_t bytes) {
    return to_string((bytes + 1023) / 1024);
}

vector<string> runguard_executor::build_command(const artifact &art, const resource_limits &limits,
                                                const fs::path &run_dir, const string &cgroup) const {
    vector<string> args = {RUNGUARD_PATH.string()};

    if (!RUN_USER.empty()) args.insert(args.end(), {"--user", RUN_USER});
    if (!RUN_GROUP.empty()) args.insert(args.end(), {"--group", RUN_GROUP});
    args.insert(args.end(), {"--cgroup", cgroup, "--no-core-dumps", "--no-network"});

    if (limits.nproc > 0) args.insert(args.end(), {"--nproc", to_string(limits.nproc)});
    if (limits.cpu_time_ms > 0) args.insert(args.end(), {"--cpu-time", seconds(limits.cpu_time_ms)});
    if (limits.wall_time_ms > 0) args.insert(args.end(), {"--wall-time", seconds(limits.wall_time_ms)});
    if (limits.memory_bytes > 0) args.insert(args.end(), {"--memory-limit", kilobytes(limits.memory_bytes)});
    if (limits.file_size_bytes > 0) args.insert(args.end(), {"--file-limit", kilobytes(limits.file_size_bytes)});
    if (limits.max_output_bytes > 0) args.insert(args.end(), {"--stream-size", to_string(limits.max_output_bytes)});

    args.insert(args.end(), {"--standard-input-file", (run_dir / "stdin").string(),
                             "--standard-output-file", (run_dir / "stdout").string(),
                             "--standard-error-file", (run_dir / "stderr").string(),
                             "--out-meta", (run_dir / "meta").string()});

    string program_dir;
    if (!CHROOT_DIR.empty()) {
        // 只有 scratch 目录是可写的，编译时 program 目录也可写
        args.insert(args.end(), {"--root", CHROOT_DIR.string(),
                                 "--mount", fmt::format("{}:{}{}", art.directory.string(), SANDBOX_PROGRAM_DIR, art.writable ? ":rw" : ""),
                                 "--mount", fmt::format("{}:{}:rw", art.scratch.string(), SANDBOX_SCRATCH_DIR),
                                 "--work-dir", SANDBOX_SCRATCH_DIR});
        program_dir = SANDBOX_PROGRAM_DIR;
    } else {
        args.insert(args.end(), {"--work-dir", art.scratch.string()});
        program_dir = art.directory.string();
    }

    args.push_back("--");
    for (auto &arg : art.command)
        args.push_back(boost::algorithm::replace_all_copy(arg, "{dir}", program_dir));
    return args;
}

/**
 * @brief 杀死 cgroup 中的所有进程并删除 cgroup
 * 只在 runguard 自己没能完成清理时调用
 */
static void kill_cgroup(const string &cgroup) {
    fs::path procs = fs::path("/sys/fs/cgroup/memory" + cgroup) / "cgroup.procs";
    for (int round = 0; round < 10; ++round) {
        ifstream fin(procs);
        if (!fin) break;
        bool found = false;
        pid_t pid;
        while (fin >> pid) {
            found = true;
            if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to kill process " << pid << " in cgroup " << cgroup << ": " << strerror(errno);
        }
        if (!found) break;
        usleep(10 * 1000);
    }

    for (const char *controller : CGROUP_CONTROLLERS) {
        error_code ec;
        fs::path dir = fs::path("/sys/fs/cgroup") / controller / cgroup.substr(1);
        if (fs::exists(dir, ec) && !fs::remove(dir, ec))
            LOG(WARNING) << "unable to remove cgroup " << dir << ": " << ec.message();
    }
}

/**
 * @brief 等待 runguard 退出
 * runguard 自己负责时间限制，这里只在 runguard 超过时钟时间限制加上清理时间仍未退出时强制杀死它
 * @return runguard 是否被强制杀死
 */
static bool wait_runguard(pid_t pid, const resource_limits &limits, const string &cgroup, cancellation_token &token) {
    token.attach(pid);

    elapsed_time timer;
    int64_t deadline = limits.wall_time_ms > 0 ? limits.wall_time_ms + TEARDOWN_GRACE_MS : -1;
    bool killed = false;

    while (true) {
        // 只检查不回收，在 detach 之前 pid 不会被复用
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
            if (errno == EINTR) continue;
            LOG(ERROR) << "unable to wait for runguard " << pid << ": " << strerror(errno);
            break;
        }
        if (info.si_pid == pid) break;

        if (!killed && deadline >= 0 && timer.duration<chrono::milliseconds>().count() > deadline) {
            LOG(WARNING) << "runguard " << pid << " did not exit in time, killing it";
            kill(pid, SIGTERM);
            usleep(100 * 1000);
            kill(pid, SIGKILL);
            kill_cgroup(cgroup);
            killed = true;
        }

        usleep(10 * 1000);  // 10ms
    }

    token.detach();

    int status;
    if (waitpid(pid, &status, 0) < 0)
        LOG(ERROR) << "unable to reap runguard " << pid << ": " << strerror(errno);

    if (killed) kill_cgroup(cgroup);
    return killed;
}

execution_outcome runguard_executor::execute(const artifact &art, const string &stdin_data,
                                             const resource_limits &limits, cancellation_token &token) {
    execution_outcome outcome;

    string id = boost::uuids::to_string(boost::uuids::random_generator()());
    fs::path run_dir = RUN_DIR / "runs" / id;
    string cgroup = "/validator/" + id;

    defer {
        if (DEBUG) return;
        error_code ec;
        fs::remove_all(run_dir, ec);
        if (ec) LOG(WARNING) << "unable to remove run directory " << run_dir << ": " << ec.message();
    };

    pid_t pid;
    try {
        fs::create_directories(run_dir);
        write_file_content(run_dir / "stdin", stdin_data);
        pid = spawn_program(build_command(art, limits, run_dir, cgroup), run_dir / "runguard.log");
    } catch (std::exception &ex) {
        LOG(ERROR) << "unable to start runguard: " << ex.what();
        outcome.internal_error = ex.what();
        return outcome;
    }

    elapsed_time timer;
    bool killed = wait_runguard(pid, limits, cgroup, token);

    fs::path metafile = run_dir / "meta";
    runguard_result result;
    if (fs::exists(metafile)) {
        result = read_runguard_result(metafile);
        outcome.termination = classify_termination(result, limits.memory_bytes);
        outcome.internal_error = result.internal_error;
    } else {
        outcome.internal_error = "runguard exited without writing meta file";
    }

    if (killed && result.internal_error.empty())
        outcome.termination = termination_reason::TIMEOUT;

    if (outcome.termination == termination_reason::SANDBOX_SETUP_FAILED) {
        LOG(ERROR) << "sandbox setup failed: " << outcome.internal_error << endl
                   << read_file_content(run_dir / "runguard.log", "");
        return outcome;
    }

    outcome.exit_code = result.exitcode;
    outcome.signal = result.signal;
    outcome.wall_time_ms = result.wall_time >= 0 ? llround(result.wall_time * 1000) : timer.duration<chrono::milliseconds>().count();
    outcome.cpu_time_ms = result.cpu_time >= 0 ? llround(result.cpu_time * 1000) : 0;
    outcome.peak_memory_bytes = max<int64_t>(result.memory, 0);

    size_t output_limit = limits.max_output_bytes > 0 ? limits.max_output_bytes : MAX_OUTPUT_BYTES;
    bool truncated;
    outcome.stdout_data = read_file_prefix(run_dir / "stdout", output_limit, truncated);
    outcome.stdout_truncated = truncated || result.output_truncated.find("stdout") != string::npos;
    outcome.stderr_data = read_file_prefix(run_dir / "stderr", output_limit, truncated);
    outcome.stderr_truncated = truncated || result.output_truncated.find("stderr") != string::npos;

    return outcome;
}

}  // namespace validator
