#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "validator/task.hpp"

using namespace std;
using namespace validator;

TEST(TaskTest, ParseTask) {
    task t = nlohmann::json::parse(R"({
        "level": "easy",
        "task": "Print the sum of two integers",
        "function_name": "main",
        "test_cases": [
            {"input": "3 4", "output": "7"},
            {"input": "0.1 0.2", "output": "0.3", "comparison": "numeric", "epsilon": 1e-6, "time_limit": 1000, "memory_limit": 1048576}
        ]
    })").get<task>();

    EXPECT_EQ(t.id, "easy/main");
    EXPECT_EQ(t.level, "easy");
    EXPECT_EQ(t.function_name, "main");
    ASSERT_EQ(t.test_cases.size(), 2u);
    EXPECT_EQ(t.test_cases[0].index, 1u);
    EXPECT_EQ(t.test_cases[0].comparison.mode, comparison_mode::EXACT);
    EXPECT_EQ(t.test_cases[0].time_limit_ms, -1);
    EXPECT_EQ(t.test_cases[1].index, 2u);
    EXPECT_EQ(t.test_cases[1].comparison.mode, comparison_mode::NUMERIC_TOLERANCE);
    EXPECT_DOUBLE_EQ(t.test_cases[1].comparison.epsilon, 1e-6);
    EXPECT_EQ(t.test_cases[1].time_limit_ms, 1000);
    EXPECT_EQ(t.test_cases[1].memory_limit_bytes, 1048576);
}

TEST(TaskTest, NonStringValuesUseJsonText) {
    task t = nlohmann::json::parse(R"({
        "id": 42,
        "level": "medium",
        "task": "Reverse a list",
        "test_cases": [{"input": [1, 2, 3], "output": [3, 2, 1]}, {"input": 5, "output": true}]
    })").get<task>();

    EXPECT_EQ(t.id, "42");
    EXPECT_EQ(t.test_cases[0].input_data, "[1,2,3]");
    EXPECT_EQ(t.test_cases[0].expected_output, "[3,2,1]");
    EXPECT_EQ(t.test_cases[1].input_data, "5");
    EXPECT_EQ(t.test_cases[1].expected_output, "true");
}

TEST(TaskTest, UnknownComparisonRejected) {
    EXPECT_THROW(nlohmann::json::parse(R"({"input": "", "output": "", "comparison": "fuzzy"})").get<test_case>(),
                 invalid_argument);
}

TEST(TaskTest, LoadTasksDropsDuplicates) {
    filesystem::path path = RUN_DIR / "TaskTest.json";
    write_file_content(path, R"([
        {"id": "a", "level": "easy", "task": "Sum", "function_name": "add", "test_cases": [{"input": "1 2", "output": "3"}]},
        {"id": "b", "level": "easy", "task": "Sum", "function_name": "add", "test_cases": []},
        {"id": "c", "level": "hard", "task": "Sum", "function_name": "add", "test_cases": []}
    ])");

    auto tasks = load_tasks(path);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].id, "a");
    EXPECT_EQ(tasks[1].id, "c");
    EXPECT_EQ(find_task(tasks, "c").level, "hard");
    EXPECT_THROW(find_task(tasks, "b"), out_of_range);
    EXPECT_THROW(load_tasks(RUN_DIR / "missing.json"), invalid_argument);
}

TEST(TaskTest, DefaultIdsAreUnique) {
    filesystem::path path = RUN_DIR / "TaskTest-ids.json";
    write_file_content(path, R"([
        {"level": "easy", "task": "Sum two numbers", "function_name": "solve", "test_cases": [{"input": "1 2", "output": "3"}]},
        {"level": "easy", "task": "Reverse a string", "function_name": "solve", "test_cases": [{"input": "ab", "output": "ba"}]},
        {"level": "easy", "task": "Count vowels", "function_name": "solve", "test_cases": []}
    ])");

    auto tasks = load_tasks(path);
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].id, "easy/solve");
    EXPECT_EQ(tasks[1].id, "easy/solve#2");
    EXPECT_EQ(tasks[2].id, "easy/solve#3");
    EXPECT_EQ(find_task(tasks, "easy/solve").description, "Sum two numbers");
    EXPECT_EQ(find_task(tasks, "easy/solve#2").description, "Reverse a string");
}

TEST(TaskTest, DuplicateExplicitIdRejected) {
    filesystem::path path = RUN_DIR / "TaskTest-duplicate.json";
    write_file_content(path, R"([
        {"id": "x", "level": "easy", "task": "Sum", "function_name": "add", "test_cases": []},
        {"id": "x", "level": "easy", "task": "Product", "function_name": "mul", "test_cases": []}
    ])");

    EXPECT_THROW(load_tasks(path), invalid_argument);
}
