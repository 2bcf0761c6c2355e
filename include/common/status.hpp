#pragma once

namespace validator {

/**
 * @brief 表示数据点或整个提交的评测结果
 * 整个提交的结果按以下优先级从数据点结果中选出：
 * SYSTEM_ERROR > COMPILATION_ERROR > TIME_LIMIT_EXCEEDED > RESOURCE_EXCEEDED
 *   > RUNTIME_ERROR > WRONG_ANSWER > ACCEPTED
 */
enum class status {
    /**
     * @brief 用户程序本测试点评测通过
     */
    ACCEPTED = 0,

    /**
     * @brief 用户程序正常退出，但输出与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序出现运行时错误
     * 返回值非零或者因为信号崩溃
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 时钟时间或者 CPU 时间超限，此时输出不参与比较
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序内存使用或输出大小超出限制
     */
    RESOURCE_EXCEEDED = 4,

    /**
     * @brief 用户程序编译错误，或者找不到题目要求的函数
     * 此时不会运行任何测试点
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 内部错误，评测系统出错
     * 比如 runguard 无法建立沙箱或者评测队列已满。
     * 不计入选手的失败测试点。
     */
    SYSTEM_ERROR = 6,

    /**
     * @brief 提交被调用方取消
     */
    CANCELLED = 7,

    /**
     * @brief 测试点没有运行
     * 快速失败模式下第一个失败测试点之后的测试点，或者提交编译失败、被取消
     */
    SKIPPED = 8
};

const char *get_display_message(status);

/**
 * @brief 沙箱中程序的终止原因
 */
enum class termination_reason {
    COMPLETED = 0,
    NON_ZERO_EXIT = 1,
    TIMEOUT = 2,
    MEMORY_EXCEEDED = 3,
    OUTPUT_EXCEEDED = 4,
    CRASHED = 5,
    SANDBOX_SETUP_FAILED = 6
};

const char *get_display_message(termination_reason);

/**
 * @brief 将终止原因映射为数据点的评测结果
 * COMPLETED 映射为 ACCEPTED，是否答案正确需要调用方再比较输出
 */
status to_status(termination_reason reason);

}  // namespace validator
