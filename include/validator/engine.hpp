#pragma once

#include <map>
#include <memory>
#include "sandbox/runguard_executor.hpp"
#include "scheduler.hpp"
#include "validator/language.hpp"

namespace validator {

/**
 * @brief 评测引擎，组合 runguard 执行器、编译步骤和调度器
 * 调用 start 后开始评测，stop 时等待队列中剩余的提交评测完成
 */
struct validation_engine {
    validation_engine(std::map<std::string, language> languages, scheduler_options options);

    /**
     * @brief 评测一个提交，阻塞直到得到报告
     * @throw overloaded_error 评测队列已满
     */
    validation_report validate(const submission &submit, const std::vector<test_case> &test_cases, validate_options options);

    /**
     * @brief 异步评测一个提交
     * @throw overloaded_error 评测队列已满
     */
    std::future<validation_report> submit(const submission &submit, const std::vector<test_case> &test_cases, validate_options options);

    /**
     * @brief 取消等待中或者正在评测的提交
     * @return 是否确实中断了一个提交
     */
    bool cancel(const std::string &submission_id);

    void register_monitor(std::unique_ptr<monitor> &&m);

    void start();

    void stop();

private:
    runguard_executor exec;
    toolchain tools;
    scheduler sched;
};

}  // namespace validator
