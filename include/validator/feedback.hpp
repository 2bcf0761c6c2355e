#pragma once

#include <nlohmann/json.hpp>
#include <vector>
#include "validator/submission.hpp"

namespace validator {

/**
 * @brief 评测结果的优先级，数值越大越优先作为整个提交的结果
 */
int status_precedence(status stat);

/**
 * @brief 生成一个没有运行的测试点结果
 */
test_result skipped_result(const test_case &tc);

/**
 * @brief 将按编号排好序的测试点结果汇总成评测报告
 * 相同的输入总是得到相同的报告
 * @param submit 选手提交
 * @param results 测试点结果，快速失败模式下第一个失败之后的测试点标记为 skipped
 */
validation_report summarize(const submission &submit, const std::vector<test_result> &results);

/**
 * @brief 编译失败时的评测报告，所有测试点都没有运行
 * @param compile_log 编译器的输出，已经截断
 */
validation_report summarize_compile_error(const submission &submit, const std::vector<test_case> &test_cases,
                                          const std::string &compile_log);

/**
 * @brief 被取消或者内部错误时的评测报告，所有测试点都没有运行
 * @param stat CANCELLED 或者 SYSTEM_ERROR
 */
validation_report summarize_aborted(const submission &submit, const std::vector<test_case> &test_cases,
                                    status stat, const std::string &message);

void to_json(nlohmann::json &j, const test_result &result);

void to_json(nlohmann::json &j, const validation_report &report);

}  // namespace validator
