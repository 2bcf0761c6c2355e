#pragma once

#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

/**
 * @brief 表示一个挂载进 chroot 环境的文件夹
 * 格式为 src:dst[:rw]，默认以只读方式挂载
 */
struct mount_point {
    std::string source;
    std::string target;
    bool writable = false;
};

struct runguard_options {
    std::string cgroupname;
    std::string chroot_dir;
    std::string work_dir;
    std::vector<mount_point> mounts;
    size_t nproc = std::numeric_limits<size_t>::max();
    int user_id = -1;
    int group_id = -1;

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Created file size limit in bytes
    int64_t stream_size = -1;   // Output limit in bytes
    bool no_core_dumps = false;
    bool no_network = false;    // Kill the command on network or namespace syscalls

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    bool preserve_sys_env = false;
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};

/**
 * @brief 解析命令行参数
 * @param opt 解析结果
 * @return -1 表示继续运行命令，否则为进程应当返回的退出码（显示帮助后为 0，参数不合法时为 1）
 */
int parse_options(int argc, const char *argv[], runguard_options &opt);
