#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace validator {

/**
 * @brief 选手输出与标准输出的比较方式
 */
enum class comparison_mode {
    /**
     * @brief 逐字节比较，只忽略最后一行的换行符
     */
    EXACT,

    /**
     * @brief 忽略行末空白字符和文末空行
     */
    TRIMMED_LINES,

    /**
     * @brief 按空白字符分割后逐个比较
     */
    TOKEN_SEQUENCE,

    /**
     * @brief 按空白字符分割，能解析为有限浮点数的部分在 epsilon 绝对误差内视为相等
     */
    NUMERIC_TOLERANCE
};

const char *get_display_message(comparison_mode mode);

/**
 * @brief 解析比较方式的名称，比如 "exact"、"trimmed_lines"、"tokens"、"numeric"
 * @throw std::invalid_argument 如果名称无法识别
 */
comparison_mode parse_comparison_mode(const std::string &name);

struct comparison_policy {
    comparison_mode mode = comparison_mode::EXACT;

    /**
     * @brief 只在 NUMERIC_TOLERANCE 下有效
     */
    double epsilon = 0;
};

/**
 * @brief 一个测试点
 * 由题库提供，评测时只读
 */
struct test_case {
    /**
     * @brief 测试点编号，按升序评测
     */
    size_t index = 0;

    std::string input_data;

    std::string expected_output;

    comparison_policy comparison;

    /**
     * @brief CPU 时间限制（毫秒），小于 0 表示使用默认值
     */
    int64_t time_limit_ms = -1;

    /**
     * @brief 内存限制（字节），小于 0 表示使用默认值
     */
    int64_t memory_limit_bytes = -1;
};

/**
 * @brief 一个选手提交
 * 创建后不再修改，评测期间归调度器所有
 */
struct submission {
    std::string submission_id;

    std::string task_id;

    std::string source_code;

    /**
     * @brief 选手代码的语言，用于选择编译方式
     */
    std::string language;

    /**
     * @brief 题目要求选手实现的函数名，为空表示不检查
     */
    std::string entry_point;

    time_t submitted_at = 0;
};

template <typename T>
T &operator<<(T &os, const submission &submit) {
    os << "Submission[" << submit.language << ":" << submit.task_id << "-" << submit.submission_id << "]";
    return os;
}

/**
 * @brief 一次运行结果中需要保留到评测报告中的部分
 */
struct outcome_summary {
    int exit_code = -1;

    int64_t wall_time_ms = 0;

    int64_t cpu_time_ms = 0;

    /**
     * @brief 内存峰值（字节），无法测量时为 0
     */
    int64_t peak_memory_bytes = 0;

    termination_reason termination = termination_reason::COMPLETED;
};

/**
 * @brief 一个测试点的评测结果
 */
struct test_result {
    size_t test_index = 0;

    bool passed = false;

    /**
     * @brief 测试点没有运行
     */
    bool skipped = false;

    status result = status::SKIPPED;

    outcome_summary outcome;

    /**
     * @brief 答案错误时为第一个不同的行或者单词及其位置，运行失败时为终止原因
     */
    std::optional<std::string> diff_summary;

    std::string stderr_excerpt;
};

/**
 * @brief 一个提交的评测报告
 * 返回给调用方后评测系统不再持有
 */
struct validation_report {
    std::string submission_id;

    status overall_status = status::SYSTEM_ERROR;

    size_t passed_count = 0;

    size_t total_count = 0;

    /**
     * @brief 编号最小的没有通过且没有跳过的测试点
     */
    std::optional<test_result> first_failure;

    std::vector<test_result> per_test_results;

    int64_t total_wall_time_ms = 0;

    /**
     * @brief 编译错误时的编译器输出（截断）
     */
    std::string compile_log;

    /**
     * @brief 给选手看的一句话总结
     */
    std::string message;
};

struct validate_options {
    /**
     * @brief 为 true 时遇到失败的测试点也继续评测后面的测试点
     */
    bool run_all = false;
};

}  // namespace validator
