#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace validator {

/**
 * @brief 在后台启动外部程序，不等待其结束
 * 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题。
 * 调用方负责通过 waitpid 回收子进程。
 * @param args 外部命令的路径 (args[0]) 和参数
 * @param log_file 外部程序的 stdout 和 stderr 重定向到此文件
 * @return 子进程的 pid
 */
pid_t spawn_program(const std::vector<std::string> &args, const std::filesystem::path &log_file);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace validator
