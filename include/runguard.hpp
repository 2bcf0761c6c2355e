#pragma once

#include <cstdint>
#include <filesystem>
#include "common/status.hpp"

namespace validator {

/**
 * @brief runguard 输出的 meta 文件的内容
 * 不存在的键保持默认值
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加  
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，由 cgroup 统计整个进程树的 CPU 时间
     */
    double cpu_time = -1;

    int exitcode = -1;

    /**
     * @brief 终止选手程序的信号，正常退出时为 -1
     */
    int signal = -1;

    /**
     * @brief runguard 自身出错的原因，非空时其他字段均不可信
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用峰值（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 "oom" 表示进程被 OOM killer 杀死
     */
    std::string memory_result;

    /**
     * @brief 为空表示没有超时，否则为 soft-timelimit 或 hard-timelimit
     */
    std::string time_result;

    /**
     * @brief 被截断的输出流，以逗号分隔，比如 "stdout,stderr"
     */
    std::string output_truncated;

    /**
     * @brief 为 "limit" 表示命令因为输出超过限制被 runguard 杀死
     */
    std::string output_result;

    int64_t stdin_bytes = 0;

    int64_t stdout_bytes = 0;

    int64_t stderr_bytes = 0;
};

runguard_result read_runguard_result(const std::filesystem::path &metafile);

/**
 * @brief 根据 runguard 的运行信息判断程序的终止原因
 * 判断顺序为 SandboxSetupFailed、MemoryExceeded、Timeout、OutputExceeded、
 * Crashed、NonZeroExit，都不满足时为 Completed。
 * @param memory_limit 内存限制（字节），不大于 0 表示没有限制
 */
termination_reason classify_termination(const runguard_result &result, int64_t memory_limit);

}  // namespace validator
