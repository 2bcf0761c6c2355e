#pragma once

#include <sys/types.h>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace validator {

/**
 * @brief 一次运行的资源限制
 * 不大于 0 的限制表示不限制
 */
struct resource_limits {
    int64_t cpu_time_ms = 0;

    int64_t wall_time_ms = 0;

    int64_t memory_bytes = 0;

    /**
     * @brief stdout 和 stderr 各自保留的最大字节数，超出部分被丢弃并标记截断
     */
    int64_t max_output_bytes = 0;

    int64_t file_size_bytes = 0;

    int nproc = 0;
};

/**
 * @brief 可以在沙箱中运行的程序
 * 可能是编译产物，也可能是解释器加源代码
 */
struct artifact {
    /**
     * @brief 存放源代码和编译产物的主机目录，沙箱内挂载为只读
     */
    std::filesystem::path directory;

    /**
     * @brief 所有测试点共享的工作目录，沙箱中唯一可写的目录
     */
    std::filesystem::path scratch;

    /**
     * @brief 运行命令，其中的 {dir} 会被替换为沙箱内看到的 directory 路径
     */
    std::vector<std::string> command;

    /**
     * @brief 是否允许程序写入 directory，只有编译步骤需要
     */
    bool writable = false;
};

/**
 * @brief 一次运行的结果
 */
struct execution_outcome {
    int exit_code = -1;

    /**
     * @brief 终止程序的信号，正常退出时为 -1
     */
    int signal = -1;

    std::string stdout_data;

    std::string stderr_data;

    int64_t wall_time_ms = 0;

    int64_t cpu_time_ms = 0;

    /**
     * @brief 内存峰值（字节），无法测量时为 0
     */
    int64_t peak_memory_bytes = 0;

    termination_reason termination = termination_reason::SANDBOX_SETUP_FAILED;

    bool stdout_truncated = false;

    bool stderr_truncated = false;

    /**
     * @brief 沙箱建立失败的原因，只用于日志，不能返回给选手
     */
    std::string internal_error;
};

/**
 * @brief 取消一个提交的评测
 * 调度器为每个提交创建一个 token，执行器运行时登记 runguard 的 pid，
 * 取消时立即向 runguard 发送 SIGTERM，runguard 收到后杀死整个进程树。
 */
struct cancellation_token {
    /**
     * @brief 标记取消，并杀死正在运行的 runguard
     */
    void cancel();

    bool cancelled() const;

    /**
     * @brief 登记正在运行的 runguard 进程
     * 如果已经被取消，立即杀死该进程
     * 调用方必须在回收（waitpid）该进程之前调用 detach，避免杀死复用了 pid 的其他进程
     */
    void attach(pid_t pid);

    void detach();

private:
    mutable std::mutex mut;
    bool flag = false;
    pid_t pid = -1;
};

/**
 * @brief 沙箱执行器
 * 在隔离环境中运行一个程序，无网络，只读文件系统（除了工作目录）
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 在沙箱中运行程序
     * 调用总是在时钟时间限制加上有限的清理时间内返回，失败通过 termination 表达
     * @param art 要运行的程序
     * @param stdin_data 程序的标准输入
     * @param limits 资源限制
     * @param token 取消标记，取消后程序会被立即杀死
     * @return 运行结果
     */
    virtual execution_outcome execute(const artifact &art, const std::string &stdin_data,
                                      const resource_limits &limits, cancellation_token &token) = 0;
};

}  // namespace validator
