#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public std::runtime_error {
    /**
     * @param op 失败的操作
     * @param err libcgroup 的错误码，ECGOTHER 表示错误原因在 errno 中
     */
    cgroup_error(const std::string &op, int err);
};

/**
 * @brief cgroup 统计到的整个进程树的资源使用
 */
struct cgroup_usage {
    /**
     * @brief 内存加交换空间的峰值（字节）
     */
    int64_t memory_peak = 0;

    /**
     * @brief CPU 时间（秒），包含所有子进程和线程
     */
    double cpu_time = 0;

    /**
     * @brief 是否有进程被 OOM killer 杀死
     */
    bool oom_killed = false;
};

/**
 * @brief 选手程序所在的 cgroup（cgroup v1）
 * memory 控制器限制内存并统计峰值和 OOM 事件，cpuacct 控制器统计 CPU 时间。
 * 对象本身不持有内核资源，内核中的 cgroup 由 create 创建、destroy 删除。
 */
struct control_group {
    /**
     * @param name cgroup 的名称，如 /validator/5f0c...
     */
    explicit control_group(std::string name);

    static void init();

    const std::string &name() const;

    /**
     * @brief 在内核中创建 cgroup
     * @param memory_limit 内存限制（字节），不大于 0 表示不限制。交换空间的限制与内存相同，因此不会发生交换
     */
    void create(int64_t memory_limit);

    /**
     * @brief 将当前进程移入 cgroup，之后 fork 出的进程都在 cgroup 内
     */
    void attach();

    /**
     * @brief 杀死 cgroup 内的所有进程
     * 选手程序可能一直在 fork，因此会重复多轮
     * @return cgroup 内是否已经没有进程
     */
    bool kill_all();

    cgroup_usage usage() const;

    /**
     * @brief 从内核中删除 cgroup
     */
    void destroy();

private:
    std::string cg_name;
};
