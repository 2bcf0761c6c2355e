#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "monitor/monitor.hpp"
#include "validator/language.hpp"
#include "validator/test_runner.hpp"

/**
 * 评测调度相关函数
 * 调度器持有固定数量的 worker 线程和一个有界的 FIFO 评测队列。
 *
 * 每个 worker 从队列中取出一个提交，在同一个线程中完成编译和全部测试点的评测后
 * 才会取下一个提交，因此同一时刻最多只有 worker 数量个沙箱在运行。
 * 同一个提交的测试点严格按照编号顺序评测，它们共享提交的 scratch 目录。
 *
 * 队列和正在评测的提交表是唯一跨提交共享的可变状态，只通过 submit、cancel
 * 以及 worker 取出和完成提交这几个入口修改。
 */
namespace validator {

struct scheduler_options {
    /**
     * @brief worker 线程数，即最多同时运行的沙箱数
     */
    size_t workers = 1;

    /**
     * @brief 最多等待评测的提交数，超出时拒绝提交
     */
    size_t max_queue_depth = 64;

    /**
     * @brief 队列满时等待多久后重试一次
     */
    std::chrono::milliseconds overload_backoff{100};
};

struct scheduler {
    scheduler(compiler &comp, executor &exec, scheduler_options options);
    ~scheduler();

    scheduler(const scheduler &) = delete;
    scheduler &operator=(const scheduler &) = delete;

    /**
     * @brief 注册监控器
     * 必须在 start 之前调用
     */
    void register_monitor(std::unique_ptr<monitor> &&m);

    /**
     * @brief 启动 worker 线程
     */
    void start();

    /**
     * @brief 停止所有的 worker
     * 调用该函数后不再接受新提交，worker 评测完队列中剩余的提交后退出，函数等待所有 worker 退出后返回。
     */
    void stop();

    /**
     * @brief 提交评测
     * 队列满时等待 overload_backoff 后重试一次，仍然满则拒绝
     * @param submit 选手提交
     * @param test_cases 测试点，会按照编号排序
     * @param options 评测选项
     * @return 评测报告，被接受的提交一定会产生恰好一个报告
     * @throw overloaded_error 队列已满
     * @throw internal_error 调度器已经停止
     */
    std::future<validation_report> submit(const submission &submit, std::vector<test_case> test_cases, validate_options options);

    /**
     * @brief 取消提交
     * 还在队列中的提交直接出队并得到 CANCELLED 报告，正在评测的提交会立即杀死正在运行的沙箱
     * @return 是否确实中断了一个等待中或者正在评测的提交
     */
    bool cancel(const std::string &submission_id);

    /**
     * @brief 当前在队列中等待的提交数
     */
    size_t queued() const;

private:
    struct job {
        submission submit;
        std::vector<test_case> test_cases;
        validate_options options;
        std::shared_ptr<cancellation_token> token;
        std::promise<validation_report> promise;
    };

    void worker_loop(int worker_id);

    validation_report process(int worker_id, job &j);

    void call_monitor(int worker_id, const std::function<void(monitor &)> &callback);

    void unregister(const std::shared_ptr<job> &j);

    /**
     * @brief 登记并入队
     * @return 队列已满时返回 false
     * @throw internal_error 如果调度器已经停止
     */
    bool enqueue(const std::shared_ptr<job> &j);

    compiler &comp;
    test_runner runner;
    scheduler_options options;

    concurrent_queue<std::shared_ptr<job>> queue;

    // 保护 jobs 和 stopping 的置位，jobs 中为等待中和正在评测的提交
    std::mutex mut;
    std::multimap<std::string, std::shared_ptr<job>> jobs;

    std::vector<std::unique_ptr<monitor>> monitors;
    std::vector<std::thread> workers;
    std::atomic<bool> stopping{false};
};

}  // namespace validator
