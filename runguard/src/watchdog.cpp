#include "watchdog.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/times.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <system_error>
#include <vector>
#include "restrictions.hpp"

using namespace std;

static volatile sig_atomic_t child_exited = 0;
static volatile sig_atomic_t pending_signal = 0;

static const struct timespec KILL_DELAY = {0, 100000000L};  // 0.1s
static const size_t BUFFER_SIZE = 4096;

[[noreturn]] static void fail(const string &what) {
    throw system_error(errno, system_category(), what);
}

static void on_child_exit(int) {
    child_exited = 1;
}

static void on_abort(int sig) {
    pending_signal = sig;
}

static void install_handler(int sig, void (*handler)(int)) {
    struct sigaction act = {};
    act.sa_handler = handler;
    if (sigemptyset(&act.sa_mask) != 0 || sigaction(sig, &act, nullptr) != 0)
        fail(fmt::format("install handler of signal {}", sig));
}

static void write_all(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("write command output");
        }
        data += n;
        size -= n;
    }
}

/**
 * @brief 继承而来的负 oom_score_adj 会让内存超限的程序被判为超时
 */
static void reset_oom_score() {
    const char *path = "/proc/self/oom_score_adj";
    int score = 0;
    ifstream fin(path);
    if (!(fin >> score) || score >= 0) return;

    ofstream fout(path);
    fout << 0 << endl;
    if (!fout) fail(fmt::format("reset {}", path));
    LOG(INFO) << "reset " << path << " from " << score << " to 0";
}

void meta_file::open(const string &path) {
    fout.open(path, ofstream::out | ofstream::trunc);
    if (!fout.is_open()) fail("open meta file " + path);
}

watchdog::watchdog(runguard_options options)
    : opt(move(options)), cg(opt.cgroupname) {}

watchdog::~watchdog() {
    for (auto &s : streams)
        if (s.pipe_fd >= 0) close(s.pipe_fd);
    if (streams[0].file_fd > STDERR_FILENO) close(streams[0].file_fd);
    if (streams[1].file_fd > STDERR_FILENO && streams[1].file_fd != streams[0].file_fd) close(streams[1].file_fd);
}

int watchdog::run() {
    try {
        return supervise();
    } catch (std::exception &ex) {
        LOG(ERROR) << ex.what();
        meta.write("internal-error", ex.what());
        abort_child();
        return EXIT_FAILURE;
    }
}

void watchdog::abort_child() {
    if (child > 0) {
        LOG(INFO) << "killing command " << child;
        if (kill(-child, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill process group " << child << ": " << strerror(errno);
        kill(child, SIGKILL);
        nanosleep(&KILL_DELAY, nullptr);
    }

    if (cgroup_created) {
        try {
            cg.kill_all();
            cg.destroy();
            cgroup_created = false;
        } catch (std::exception &ex) {
            LOG(ERROR) << "unable to clean up cgroup " << cg.name() << ": " << ex.what();
        }
    }
}

int watchdog::supervise() {
    if (!opt.metafile_path.empty()) meta.open(opt.metafile_path);

    int pipes[2][2];
    for (int i = 0; i < 2; ++i) {
        if (pipe(pipes[i]) != 0) fail("create output pipe");
        streams[i].pipe_fd = pipes[i][0];
    }

    // 这些信号只在 pselect 中接收
    sigset_t blocked, original;
    if (sigemptyset(&blocked) != 0 || sigaddset(&blocked, SIGCHLD) != 0 ||
        sigaddset(&blocked, SIGALRM) != 0 || sigaddset(&blocked, SIGTERM) != 0)
        fail("create signal mask");
    if (sigprocmask(SIG_BLOCK, &blocked, &original) != 0) fail("block signals");
    install_handler(SIGCHLD, on_child_exit);
    install_handler(SIGTERM, on_abort);
    install_handler(SIGALRM, on_abort);

    control_group::init();
    cg.create(opt.memory_limit);
    cgroup_created = true;

    if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
        fail("unshare namespaces");

    reset_oom_score();

    child = fork();
    if (child < 0) fail("fork");
    if (child == 0) exec_child(pipes[0][1], pipes[1][1], original);

    for (int i = 0; i < 2; ++i)
        if (close(pipes[i][1]) != 0) fail("close output pipe");

    // 使用单独的用户运行命令时，watchdog 需要保留 root 权限来杀死命令
    if (opt.user_id < 0 && setuid(getuid()) != 0) fail("drop watchdog privileges");

    open_outputs();

    struct timeval start, end;
    struct tms start_ticks, end_ticks;
    if (gettimeofday(&start, nullptr) != 0) fail("get time");
    if (times(&start_ticks) == (clock_t)-1) fail("get start clock ticks");

    arm_timer(true);
    int status = wait_child();
    arm_timer(false);

    if (times(&end_ticks) == (clock_t)-1) fail("get end clock ticks");
    if (gettimeofday(&end, nullptr) != 0) fail("get time");

    // 命令 fork 出的进程可能还持有管道
    if (kill(-child, SIGKILL) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to kill process group " << child << ": " << strerror(errno);
    cg.kill_all();
    drain();

    long ticks = sysconf(_SC_CLK_TCK);
    double wall_time = (end.tv_sec - start.tv_sec) + (end.tv_usec - start.tv_usec) * 1e-6;
    double user_time = (double)(end_ticks.tms_cutime - start_ticks.tms_cutime) / ticks;
    double sys_time = (double)(end_ticks.tms_cstime - start_ticks.tms_cstime) / ticks;
    return report(status, wall_time, user_time, sys_time);
}

void watchdog::exec_child(int stdout_fd, int stderr_fd, const sigset_t &mask) {
    try {
        const char *input = opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.c_str();
        int fd = open(input, O_RDONLY);
        if (fd < 0) fail(fmt::format("open stdin file {}", input));
        if (dup2(fd, STDIN_FILENO) < 0 || close(fd) != 0) fail("redirect stdin");

        restrict_child(opt, cg);

        if (dup2(stdout_fd, STDOUT_FILENO) < 0 || dup2(stderr_fd, STDERR_FILENO) < 0) fail("redirect output");
        for (int pipe_fd : {stdout_fd, stderr_fd, streams[0].pipe_fd, streams[1].pipe_fd})
            if (close(pipe_fd) != 0) fail("close pipe");

        if (sigprocmask(SIG_SETMASK, &mask, nullptr) != 0) fail("restore signal mask");

        vector<char *> args;
        for (auto &arg : opt.command) args.push_back(arg.data());
        args.push_back(nullptr);

        install_seccomp(opt);
        execvp(args[0], args.data());
        fail("execute " + opt.command[0]);
    } catch (std::exception &ex) {
        meta.write("internal-error", ex.what());
    }
    _exit(EXIT_FAILURE);
}

void watchdog::open_outputs() {
    streams[0].file_fd = STDOUT_FILENO;
    streams[1].file_fd = STDERR_FILENO;

    if (!opt.stdout_filename.empty()) {
        streams[0].file_fd = creat(opt.stdout_filename.c_str(), S_IRUSR | S_IWUSR);
        if (streams[0].file_fd < 0) fail("create " + opt.stdout_filename);
    }

    if (!opt.stderr_filename.empty()) {
        if (opt.stderr_filename == opt.stdout_filename) {
            streams[1].file_fd = streams[0].file_fd;
        } else {
            streams[1].file_fd = creat(opt.stderr_filename.c_str(), S_IRUSR | S_IWUSR);
            if (streams[1].file_fd < 0) fail("create " + opt.stderr_filename);
        }
    }
}

void watchdog::arm_timer(bool enable) {
    if (!opt.use_wall_limit) return;

    struct itimerval timer = {};
    if (enable) {
        double whole;
        timer.it_value.tv_sec = (time_t)opt.wall_limit.hard;
        timer.it_value.tv_usec = (suseconds_t)(modf(opt.wall_limit.hard, &whole) * 1e6);
        LOG(INFO) << fmt::format("wall time limit is {:.3f} seconds", opt.wall_limit.hard);
    }
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0) fail("set wall time timer");
}

int watchdog::wait_child() {
    sigset_t unblocked;
    if (sigemptyset(&unblocked) != 0) fail("create signal mask");

    while (true) {
        fd_set fds;
        FD_ZERO(&fds);
        int nfds = -1;
        for (auto &s : streams) {
            if (s.pipe_fd < 0) continue;
            FD_SET(s.pipe_fd, &fds);
            nfds = max(nfds, s.pipe_fd);
        }

        int ready = pselect(nfds + 1, &fds, nullptr, nullptr, nullptr, &unblocked);
        if (ready < 0 && errno != EINTR) fail("wait for command output");

        if (pending_signal) {
            int sig = pending_signal;
            pending_signal = 0;
            handle_signal(sig);
        }

        if (child_exited) {
            child_exited = 0;
            int status;
            pid_t pid = waitpid(child, &status, WNOHANG);
            if (pid < 0) fail("wait for command");
            if (pid == child) return status;
        }

        if (ready > 0)
            for (auto &s : streams)
                if (s.pipe_fd >= 0 && FD_ISSET(s.pipe_fd, &fds)) relay(s);

        // 输出超限的命令立即终止，不再等到时间限制
        if (output_limit_hit && !output_limit_handled) {
            output_limit_handled = true;
            LOG(WARNING) << "output limit of " << opt.stream_size << " bytes exceeded, aborting command";
            kill_command();
        }
    }
}

void watchdog::handle_signal(int sig) {
    if (sig == SIGALRM) {
        // 命令可能恰好在时限处自行退出，只检查不回收
        siginfo_t info;
        info.si_pid = 0;
        if (waitid(P_PID, child, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == child) {
            LOG(INFO) << "command exited before the wall time limit was handled";
            return;
        }
        wall_limit_hit = true;
        LOG(WARNING) << "wall time limit exceeded, aborting command";
    } else {
        LOG(WARNING) << "received signal " << sig << ", aborting command";
    }
    received_signal = sig;
    kill_command();
}

void watchdog::kill_command() {
    if (kill(-child, SIGTERM) != 0 && errno != ESRCH) fail("send SIGTERM to command");
    nanosleep(&KILL_DELAY, nullptr);
    if (kill(-child, SIGKILL) != 0 && errno != ESRCH) fail("send SIGKILL to command");
}

bool watchdog::relay(output_stream &s) {
    char buffer[BUFFER_SIZE];
    ssize_t n = read(s.pipe_fd, buffer, BUFFER_SIZE);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return false;
        fail("read command output");
    }
    if (n == 0) {
        if (close(s.pipe_fd) != 0) fail("close output pipe");
        s.pipe_fd = -1;
        return false;
    }

    size_t keep = n;
    if (opt.stream_size >= 0) keep = min(keep, (size_t)opt.stream_size - min(s.kept, (size_t)opt.stream_size));
    if (keep < (size_t)n) output_limit_hit = true;
    write_all(s.file_fd, buffer, keep);
    s.kept += keep;
    s.read += n;
    return true;
}

void watchdog::drain() {
    for (auto &s : streams) {
        if (s.pipe_fd < 0) continue;
        int flags = fcntl(s.pipe_fd, F_GETFL);
        if (flags == -1 || fcntl(s.pipe_fd, F_SETFL, flags | O_NONBLOCK) == -1)
            fail("make output pipe non-blocking");
    }

    bool progress = true;
    while (progress) {
        progress = false;
        for (auto &s : streams)
            if (s.pipe_fd >= 0 && relay(s)) progress = true;
    }
}

int watchdog::report(int status, double wall_time, double user_time, double sys_time) {
    int exitcode;
    bool cpu_hard_limit = false;
    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        received_signal = WTERMSIG(status);
        exitcode = 128 + received_signal;
        if (received_signal == SIGXCPU) {
            cpu_hard_limit = true;
            LOG(WARNING) << "cpu time limit exceeded";
        } else {
            LOG(WARNING) << "command terminated by signal " << received_signal << " (" << strsignal(received_signal) << ")";
        }
    } else {
        throw runtime_error(fmt::format("unknown wait status {:x}", status));
    }

    cgroup_usage usage = cg.usage();
    LOG(INFO) << "total memory used: " << usage.memory_peak / 1024 << "kB";
    meta.write("memory-bytes", usage.memory_peak);
    meta.write("memory-result", usage.oom_killed ? "oom" : "");
    cg.destroy();
    cgroup_created = false;

    meta.write("exitcode", exitcode);
    if (received_signal > 0) meta.write("signal", received_signal);

    meta.write("wall-time", fmt::format("{:.3f}", wall_time));
    meta.write("user-time", fmt::format("{:.3f}", user_time));
    meta.write("sys-time", fmt::format("{:.3f}", sys_time));
    meta.write("cpu-time", fmt::format("{:.3f}", usage.cpu_time));
    LOG(INFO) << fmt::format("run time: real {:.3f}, user {:.3f}, sys {:.3f}, cpu {:.3f}", wall_time, user_time, sys_time, usage.cpu_time);

    // 时钟时间只由计时器判断，恰好在边界处自行退出的命令不算超时
    bool cpu_soft_limit = opt.use_cpu_limit && usage.cpu_time > opt.cpu_limit.soft;
    if (wall_limit_hit || cpu_hard_limit)
        meta.write("time-result", "hard-timelimit");
    else if (cpu_soft_limit)
        meta.write("time-result", "soft-timelimit");
    else
        meta.write("time-result", "");

    if (opt.stream_size >= 0) {
        vector<string> truncated;
        if (streams[0].truncated()) truncated.push_back("stdout");
        if (streams[1].truncated()) truncated.push_back("stderr");
        meta.write("output-truncated", boost::algorithm::join(truncated, ","));
        meta.write("output-result", output_limit_handled ? "limit" : "");
    }

    struct stat input;
    int64_t stdin_bytes = 0;
    if (!opt.stdin_filename.empty() && stat(opt.stdin_filename.c_str(), &input) == 0) stdin_bytes = input.st_size;
    meta.write("stdin-bytes", stdin_bytes);
    meta.write("stdout-bytes", streams[0].read);
    meta.write("stderr-bytes", streams[1].read);

    return exitcode;
}
