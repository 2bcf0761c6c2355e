#pragma once

#include <string>
#include "validator/submission.hpp"

namespace validator {

struct comparison_result {
    bool matched = false;

    /**
     * @brief 不匹配时描述第一个不同的行或单词及其位置（从 1 开始），每段摘录不超过 excerpt_limit
     */
    std::string diff_summary;
};

/**
 * @brief 按照比较方式比较选手输出和标准输出
 * @param expected 标准输出
 * @param actual 选手程序的 stdout
 * @param policy 比较方式
 * @param excerpt_limit diff_summary 中每段摘录的最大长度
 */
comparison_result compare_output(const std::string &expected, const std::string &actual,
                                  const comparison_policy &policy, size_t excerpt_limit);

}  // namespace validator
