#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "validator/submission.hpp"

namespace validator {

/**
 * @brief 题库中的一道题
 *
 * @code{.json}
 * {
 *     "id": "sum-two",
 *     "level": "easy",
 *     "task": "Read two integers and print their sum",
 *     "function_name": "main",
 *     "test_cases": [
 *         {"input": "3 4", "output": "7"},
 *         {"input": "0.1 0.2", "output": "0.3", "comparison": "numeric", "epsilon": 1e-6, "time_limit": 1000}
 *     ]
 * }
 * @endcode
 */
struct task {
    /**
     * @brief 题目 id，没有给出时为 "level/function_name"，与之前的题目重复时加上 #2 等后缀
     */
    std::string id;

    std::string level;

    /**
     * @brief 题目描述
     */
    std::string description;

    /**
     * @brief 选手代码中必须定义的函数名，为空表示不检查
     */
    std::string function_name;

    /**
     * @brief 测试点，编号从 1 开始
     */
    std::vector<test_case> test_cases;
};

void from_json(const nlohmann::json &j, test_case &tc);

void from_json(const nlohmann::json &j, task &t);

/**
 * @brief 从 JSON 文件读取题库
 * level、task 和 function_name 都相同的题目只保留第一道。
 * 默认 id 重复时依次加上 #2、#3 后缀
 * @throw std::invalid_argument 如果显式给出的 id 重复
 */
std::vector<task> load_tasks(const std::filesystem::path &path);

/**
 * @brief 按照 id 查找题目
 * @throw std::out_of_range 如果找不到
 */
const task &find_task(const std::vector<task> &tasks, const std::string &id);

}  // namespace validator
