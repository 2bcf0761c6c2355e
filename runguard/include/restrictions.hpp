#pragma once

#include "cgroup.hpp"
#include "runguard_options.hpp"

/**
 * 以下函数都在 fork 出的子进程中、exec 之前调用，失败时抛出 std::system_error
 */

/**
 * @brief 清理环境变量，只保留 PATH（除非要求保留全部）和额外指定的变量
 */
void restrict_environment(const runguard_options &opt);

/**
 * @brief 通过 rlimit 限制 CPU 时间、文件大小和进程数
 * 内存由 cgroup 限制，这里解除 RLIMIT_AS 等限制
 */
void restrict_resources(const runguard_options &opt);

/**
 * @brief 在私有的挂载命名空间中挂载 chroot 环境并切换根目录和工作目录
 * chroot 环境本身只读，只有标记为 rw 的挂载点可写
 */
void enter_root(const runguard_options &opt);

/**
 * @brief 切换到运行选手程序的用户和用户组
 * @throw std::runtime_error 如果最后仍然是 root
 */
void drop_privileges(const runguard_options &opt);

/**
 * @brief 按顺序施加除 seccomp 以外的所有限制，并将进程移入 cgroup 和新的会话
 */
void restrict_child(const runguard_options &opt, control_group &cg);

/**
 * @brief 安装 seccomp 过滤器，调用网络和命名空间相关的系统调用时杀死进程
 * 必须是 exec 之前的最后一步
 */
void install_seccomp(const runguard_options &opt);
