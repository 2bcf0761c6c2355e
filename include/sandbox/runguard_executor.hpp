#pragma once

#include "sandbox/executor.hpp"

namespace validator {

/**
 * @brief 通过 runguard 运行程序的执行器
 * 每次运行在 RUN_DIR/runs 下创建一个运行目录，存放输入输出和 meta 文件，
 * 运行结束后删除（DEBUG 模式下保留）。
 * runguard 负责所有的资源限制，执行器只在 runguard 本身超时后兜底杀死 runguard 和 cgroup 中的进程。
 */
struct runguard_executor : public executor {
    execution_outcome execute(const artifact &art, const std::string &stdin_data,
                              const resource_limits &limits, cancellation_token &token) override;

    /**
     * @brief 生成调用 runguard 的命令行
     * @param run_dir 本次运行的目录
     * @param cgroup runguard 创建的 cgroup 名称
     */
    std::vector<std::string> build_command(const artifact &art, const resource_limits &limits,
                                           const std::filesystem::path &run_dir, const std::string &cgroup) const;
};

}  // namespace validator
