#pragma once

#include <string>
#include "monitor/worker_state.hpp"
#include "validator/submission.hpp"

namespace validator {

/**
 * @brief 执行监控行为
 * 默认实现什么都不做，子类只需要覆盖关心的事件
 * 回调在 worker 线程中执行，可能被多个 worker 并发调用
 */
struct monitor {
    virtual ~monitor();

    /**
     * @brief 监控上报当前 worker 已经取到一个提交
     */
    virtual void start_submission(int worker_id, const submission &submit);

    /**
     * @brief 监控上报当前已经开始评测某个测试点
     * @param worker_id 执行评测的 Worker 编号
     * @param submit 测试点所属的提交
     * @param tc 测试点
     */
    virtual void start_test(int worker_id, const submission &submit, const test_case &tc);

    /**
     * @brief 监控上报当前某个测试点已经评测结束
     * @param worker_id 执行评测的 Worker 编号
     * @param submit 测试点所属的提交
     * @param result 测试点的评测结果
     */
    virtual void end_test(int worker_id, const submission &submit, const test_result &result);

    /**
     * @brief 监控上报当前某个 Worker 的状态
     * @param worker_id Worker 编号
     * @param state Worker 的新状态
     * @param information 如果 Worker 崩溃，则为错误原因，用于日志记录
     */
    virtual void worker_state_changed(int worker_id, worker_state state, const std::string &information);

    /**
     * @brief 监控上报当前已经完成一个提交的评测
     * @param submit 提交
     * @param report 评测报告
     */
    virtual void end_submission(int worker_id, const submission &submit, const validation_report &report);
};

/**
 * @brief 将监控事件写入日志
 */
struct log_monitor : public monitor {
    void start_submission(int worker_id, const submission &submit) override;
    void end_test(int worker_id, const submission &submit, const test_result &result) override;
    void worker_state_changed(int worker_id, worker_state state, const std::string &information) override;
    void end_submission(int worker_id, const submission &submit, const validation_report &report) override;
};

}  // namespace validator
