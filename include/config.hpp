#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace validator {

/**
 * @brief 选手程序编译及运行的根目录
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR
 * ├── submissions
 * │   └── 5f0c... // 每个提交随机生成的 uuid
 * │       ├── program // 选手程序的代码和编译产物，沙箱内挂载到 /program
 * │       │   ├── main.cpp // 选手程序的主代码（示例）
 * │       │   └── program // 编译产物
 * │       └── scratch // 所有测试点共享的工作目录，沙箱内挂载到 /scratch，是唯一可写的目录
 * └── runs
 *     └── 8a41... // 每次运行随机生成的 uuid，运行结束后删除
 *         ├── stdin // 选手程序的标准输入
 *         ├── stdout // 选手程序的 stdout 输出
 *         ├── stderr // 选手程序的 stderr 输出
 *         ├── meta // runguard 输出的运行信息
 *         └── runguard.log // runguard 自身的日志
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 配置好的 chroot 路径
 * 为空时不使用 chroot，此时选手程序可以读取主机的文件系统，只允许在 DEBUG 模式下使用
 */
extern std::filesystem::path CHROOT_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD_PATH;

/**
 * @brief 运行选手程序的用户和用户组，为空时 runguard 以调用者的身份运行选手程序
 */
extern std::string RUN_USER;

extern std::string RUN_GROUP;

/**
 * @brief 沙箱内看到的编译产物目录和工作目录
 */
extern const char *SANDBOX_PROGRAM_DIR;

extern const char *SANDBOX_SCRATCH_DIR;

/**
 * @brief 测试点没有指定时间限制时使用的 CPU 时间限制（毫秒）
 */
extern int64_t DEFAULT_TIME_LIMIT_MS;

/**
 * @brief 测试点没有指定内存限制时使用的内存限制（字节）
 */
extern int64_t DEFAULT_MEMORY_LIMIT;

/**
 * @brief 时钟时间限制为 CPU 时间限制的多少倍
 */
extern double WALL_TIME_FACTOR;

/**
 * @brief 选手程序 stdout/stderr 的最大长度（字节），超出部分被丢弃
 */
extern int64_t MAX_OUTPUT_BYTES;

/**
 * @brief 选手程序可以创建的文件的最大大小（字节）
 */
extern int64_t FILE_SIZE_LIMIT;

/**
 * @brief 选手程序最多同时存在的进程数
 */
extern int NPROC_LIMIT;

/**
 * @brief 编译的时间和内存限制
 */
extern int64_t COMPILE_TIME_LIMIT_MS;

extern int64_t COMPILE_MEMORY_LIMIT;

/**
 * @brief 反馈中差异描述和 stderr 摘录的最大长度
 */
extern size_t EXCERPT_LIMIT;

/**
 * @brief 反馈中编译日志的最大长度
 */
extern size_t COMPILE_LOG_LIMIT;

/**
 * @brief runguard 超过时钟时间限制这么久还没有退出时，强制杀死 runguard
 */
extern int64_t TEARDOWN_GRACE_MS;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的提交目录和运行目录，以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

/**
 * @brief 检查沙箱的文件系统隔离配置
 * 没有配置 chroot 目录时只允许在 DEBUG 模式下运行
 * @throw internal_error 如果 CHROOT_DIR 为空且不在 DEBUG 模式下，或者 CHROOT_DIR 不是目录
 */
void check_sandbox_root();

}  // namespace validator
