#pragma once

#include <signal.h>
#include <sys/types.h>
#include <fstream>
#include <string>
#include "cgroup.hpp"
#include "runguard_options.hpp"

/**
 * @brief runguard 输出的 meta 文件，每行为 "key: value"
 * 每写一个键立即刷新，fork 出的子进程也可以写入
 */
struct meta_file {
    void open(const std::string &path);

    template <typename T>
    void write(const char *key, const T &value) {
        if (!fout.is_open()) return;
        fout << key << ": " << value << std::endl;
    }

private:
    std::ofstream fout;
};

/**
 * @brief 选手程序的一路输出
 * 从管道读出的数据最多保留 stream_size 字节写入文件，超出的部分读出后直接丢弃
 */
struct output_stream {
    int pipe_fd = -1;
    int file_fd = -1;

    /**
     * @brief 从管道读出的字节数
     */
    size_t read = 0;

    /**
     * @brief 写入文件的字节数
     */
    size_t kept = 0;

    bool truncated() const {
        return kept < read;
    }
};

/**
 * @brief runguard 的父进程，监视选手程序直到其退出
 * 1. 创建 cgroup，分离 FD、FS、IPC、NET、NS、UTS、SYSVSEM 命名空间
 * 2. fork 出子进程，子进程施加所有限制后 exec 选手程序
 * 3. 父进程通过 pselect 转发子进程的 stdout/stderr，同时等待 SIGCHLD、SIGALRM（时钟时间限制）和 SIGTERM（取消）
 *    输出超过 stream_size 时同样杀死进程组
 * 4. 子进程退出后杀死进程组和 cgroup 中残留的进程，再读完管道中剩余的输出
 * 5. 从 cgroup 读取 CPU 时间、峰值内存和 OOM 状态，删除 cgroup，写入 meta 文件
 *
 * 信号和计时器都是进程级别的，一个进程只能有一个 watchdog
 */
struct watchdog {
    explicit watchdog(runguard_options opt);
    ~watchdog();

    watchdog(const watchdog &) = delete;
    watchdog &operator=(const watchdog &) = delete;

    /**
     * @brief 运行命令直到结束
     * 出错时在 meta 文件中写入 internal-error，并杀死子进程、删除 cgroup
     * @return 命令的退出码，被信号终止时为 128 + 信号，出错时为 EXIT_FAILURE
     */
    int run();

private:
    int supervise();

    [[noreturn]] void exec_child(int stdout_fd, int stderr_fd, const sigset_t &mask);

    void open_outputs();

    void arm_timer(bool enable);

    int wait_child();

    void handle_signal(int sig);

    /**
     * @brief 向进程组发送 SIGTERM，0.1 秒后发送 SIGKILL
     */
    void kill_command();

    bool relay(output_stream &s);

    void drain();

    int report(int status, double wall_time, double user_time, double sys_time);

    void abort_child();

    runguard_options opt;
    control_group cg;
    meta_file meta;

    // stdout 和 stderr
    output_stream streams[2];

    pid_t child = -1;
    bool cgroup_created = false;
    bool wall_limit_hit = false;

    /**
     * @brief 有输出流超过了 stream_size，命令被杀死
     */
    bool output_limit_hit = false;
    bool output_limit_handled = false;
    int received_signal = -1;
};
