#include <unistd.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "scheduler.hpp"
#include "test/fake_executor.hpp"
#include "validator/feedback.hpp"

using namespace std;
using namespace validator;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::ElementsAre;

struct mock_monitor : public monitor {
    MOCK_METHOD(void, start_submission, (int worker_id, const submission &submit), (override));
    MOCK_METHOD(void, start_test, (int worker_id, const submission &submit, const test_case &tc), (override));
    MOCK_METHOD(void, end_test, (int worker_id, const submission &submit, const test_result &result), (override));
    MOCK_METHOD(void, end_submission, (int worker_id, const submission &submit, const validation_report &report), (override));
};

class SchedulerTest : public ::testing::Test {
protected:
    static submission make_submission(const string &id, const string &source_code = "int main() {}") {
        submission submit;
        submit.submission_id = id;
        submit.task_id = "easy/sum";
        submit.language = "cpp";
        submit.source_code = source_code;
        return submit;
    }

    /**
     * @brief 生成 count 个测试点，编号为 failing 的测试点的标准输出与输入不同
     */
    static vector<test_case> make_tests(size_t count, size_t failing = 0) {
        vector<test_case> tests;
        for (size_t i = 1; i <= count; ++i) {
            test_case tc;
            tc.index = i;
            tc.input_data = to_string(i);
            tc.expected_output = i == failing ? "wrong" : to_string(i);
            tests.push_back(tc);
        }
        return tests;
    }

    static scheduler_options make_options(size_t workers, size_t max_queue_depth = 64) {
        scheduler_options options;
        options.workers = workers;
        options.max_queue_depth = max_queue_depth;
        options.overload_backoff = chrono::milliseconds(1);
        return options;
    }

    static validation_report wait(future<validation_report> &result) {
        EXPECT_EQ(result.wait_for(chrono::seconds(10)), future_status::ready);
        return result.get();
    }

    static void wait_until(const function<bool()> &pred) {
        for (int i = 0; i < 10000 && !pred(); ++i) usleep(1000);
        ASSERT_TRUE(pred());
    }

    fake_compiler comp;
};

TEST_F(SchedulerTest, AcceptedTest) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto result = sched.submit(make_submission("1"), make_tests(3), {});
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::ACCEPTED);
    EXPECT_EQ(report.passed_count, 3u);
    EXPECT_EQ(report.total_count, 3u);
    EXPECT_EQ(exec.executions(), 3u);
}

TEST_F(SchedulerTest, FailFastStopsAtFirstFailure) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto result = sched.submit(make_submission("1"), make_tests(5, 2), {});
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::WRONG_ANSWER);
    EXPECT_EQ(exec.executions(), 2u);
    EXPECT_EQ(report.passed_count, 1u);
    EXPECT_EQ(report.total_count, 5u);
    ASSERT_TRUE(report.first_failure);
    EXPECT_EQ(report.first_failure->test_index, 2u);
    ASSERT_EQ(report.per_test_results.size(), 5u);
    for (size_t i = 2; i < 5; ++i) {
        EXPECT_TRUE(report.per_test_results[i].skipped);
        EXPECT_FALSE(report.per_test_results[i].passed);
    }
}

TEST_F(SchedulerTest, RunAllContinuesAfterFailure) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    validate_options options;
    options.run_all = true;
    auto result = sched.submit(make_submission("1"), make_tests(5, 2), options);
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::WRONG_ANSWER);
    EXPECT_EQ(exec.executions(), 5u);
    EXPECT_EQ(report.passed_count, 4u);
    ASSERT_TRUE(report.first_failure);
    EXPECT_EQ(report.first_failure->test_index, 2u);
    for (auto &r : report.per_test_results) EXPECT_FALSE(r.skipped);
}

TEST_F(SchedulerTest, TestsRunInIndexOrder) {
    vector<string> inputs;
    mutex mut;
    fake_executor exec([&](const string &stdin_data, cancellation_token &) {
        lock_guard<mutex> guard(mut);
        inputs.push_back(stdin_data);
        return completed(stdin_data);
    });
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto tests = make_tests(3);
    reverse(tests.begin(), tests.end());
    auto result = sched.submit(make_submission("1"), tests, {});
    auto report = wait(result);
    EXPECT_THAT(inputs, ElementsAre("1", "2", "3"));
    ASSERT_EQ(report.per_test_results.size(), 3u);
    EXPECT_EQ(report.per_test_results[0].test_index, 1u);
    EXPECT_EQ(report.per_test_results[2].test_index, 3u);
}

TEST_F(SchedulerTest, Deterministic) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(2));
    sched.start();
    auto a = sched.submit(make_submission("1"), make_tests(4, 3), {});
    auto b = sched.submit(make_submission("1"), make_tests(4, 3), {});
    nlohmann::json ja = wait(a), jb = wait(b);
    EXPECT_EQ(ja, jb);
}

TEST_F(SchedulerTest, FifoOrder) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    vector<future<validation_report>> results;
    for (string id : {"a", "b", "c"})
        results.push_back(sched.submit(make_submission(id), make_tests(1), {}));
    sched.start();
    for (auto &result : results) wait(result);
    EXPECT_THAT(comp.compiled(), ElementsAre("a", "b", "c"));
}

TEST_F(SchedulerTest, ConcurrencyIsBounded) {
    fake_executor exec([](const string &stdin_data, cancellation_token &) {
        usleep(5 * 1000);
        return completed(stdin_data);
    });
    scheduler sched(comp, exec, make_options(2));
    sched.start();
    vector<future<validation_report>> results;
    for (int i = 0; i < 3; ++i)
        results.push_back(sched.submit(make_submission(to_string(i)), make_tests(3), {}));
    for (auto &result : results) EXPECT_EQ(wait(result).overall_status, status::ACCEPTED);
    EXPECT_LE(exec.max_concurrency(), 2u);
    EXPECT_EQ(exec.executions(), 9u);
}

TEST_F(SchedulerTest, OverloadedWhenQueueIsFull) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1, 1));
    auto first = sched.submit(make_submission("1"), make_tests(1), {});
    EXPECT_THROW(sched.submit(make_submission("2"), make_tests(1), {}), overloaded_error);
    EXPECT_EQ(sched.queued(), 1u);

    // 被拒绝的提交不会被登记，取消它不会中断任何提交
    EXPECT_FALSE(sched.cancel("2"));

    sched.start();
    EXPECT_EQ(wait(first).overall_status, status::ACCEPTED);
}

TEST_F(SchedulerTest, CancelWhileQueued) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    auto result = sched.submit(make_submission("1"), make_tests(3), {});
    EXPECT_TRUE(sched.cancel("1"));
    EXPECT_EQ(sched.queued(), 0u);

    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::CANCELLED);
    EXPECT_EQ(report.passed_count, 0u);
    EXPECT_EQ(report.total_count, 3u);
    for (auto &r : report.per_test_results) EXPECT_TRUE(r.skipped);
    EXPECT_EQ(exec.executions(), 0u);
    EXPECT_FALSE(sched.cancel("1"));
}

TEST_F(SchedulerTest, CancelWhileRunning) {
    atomic<bool> release{false};
    fake_executor exec(blocking_program(release));
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto result = sched.submit(make_submission("1"), make_tests(3), {});
    wait_until([&] { return exec.executions() > 0; });

    EXPECT_TRUE(sched.cancel("1"));
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::CANCELLED);
    EXPECT_EQ(report.passed_count, 0u);
    EXPECT_EQ(exec.executions(), 1u);
    release = true;
}

TEST_F(SchedulerTest, CancelUnknownSubmission) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    EXPECT_FALSE(sched.cancel("nothing"));
}

TEST_F(SchedulerTest, CompilationError) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto result = sched.submit(make_submission("1", "syntax error"), make_tests(3), {});
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::COMPILATION_ERROR);
    EXPECT_EQ(report.compile_log, "main.cpp:1:1: error: expected unqualified-id");
    EXPECT_EQ(report.passed_count, 0u);
    EXPECT_EQ(report.total_count, 3u);
    EXPECT_FALSE(report.first_failure);
    EXPECT_EQ(exec.executions(), 0u);
}

TEST_F(SchedulerTest, InternalErrorStillProducesReport) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    auto result = sched.submit(make_submission("1", "internal error"), make_tests(2), {});
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::SYSTEM_ERROR);
    EXPECT_EQ(report.message, "Internal error, please try again later");
    EXPECT_EQ(report.total_count, 2u);

    // worker 没有因此退出
    auto next = sched.submit(make_submission("2"), make_tests(2), {});
    EXPECT_EQ(wait(next).overall_status, status::ACCEPTED);
}

TEST_F(SchedulerTest, SandboxFailureStopsEvenWithRunAll) {
    fake_executor exec([](const string &, cancellation_token &) { return terminated(termination_reason::SANDBOX_SETUP_FAILED); });
    scheduler sched(comp, exec, make_options(1));
    sched.start();
    validate_options options;
    options.run_all = true;
    auto result = sched.submit(make_submission("1"), make_tests(3), options);
    auto report = wait(result);
    EXPECT_EQ(report.overall_status, status::SYSTEM_ERROR);
    EXPECT_EQ(report.passed_count, 0u);
    // 第一个测试点重试一次
    EXPECT_EQ(exec.executions(), 2u);
    EXPECT_FALSE(report.first_failure);
    ASSERT_EQ(report.per_test_results.size(), 3u);
    EXPECT_TRUE(report.per_test_results[0].skipped);
    EXPECT_FALSE(report.per_test_results[0].passed);
    EXPECT_TRUE(report.per_test_results[1].skipped);
    EXPECT_TRUE(report.per_test_results[2].skipped);
}

TEST_F(SchedulerTest, StopDrainsQueue) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(2));
    vector<future<validation_report>> results;
    for (int i = 0; i < 4; ++i)
        results.push_back(sched.submit(make_submission(to_string(i)), make_tests(2), {}));
    sched.start();
    sched.stop();
    for (auto &result : results)
        EXPECT_EQ(result.wait_for(chrono::seconds(0)), future_status::ready);
    EXPECT_THROW(sched.submit(make_submission("late"), make_tests(1), {}), internal_error);
}

TEST_F(SchedulerTest, SubmitRacingStopStillGetsReport) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(2, 1000));
    sched.start();

    vector<future<validation_report>> results;
    thread producer([&] {
        for (int i = 0; i < 500; ++i) {
            try {
                results.push_back(sched.submit(make_submission(to_string(i)), make_tests(1), {}));
            } catch (internal_error &) {
                break;
            }
        }
    });
    usleep(2000);
    sched.stop();
    producer.join();

    // 被接受的提交在 stop 返回时都已经有了报告
    for (auto &result : results)
        EXPECT_EQ(result.wait_for(chrono::seconds(0)), future_status::ready);
}

TEST_F(SchedulerTest, MonitorReceivesEvents) {
    fake_executor exec(echo_program());
    scheduler sched(comp, exec, make_options(1));
    auto m = make_unique<mock_monitor>();
    EXPECT_CALL(*m, start_submission(0, _)).Times(1);
    EXPECT_CALL(*m, start_test(0, _, _)).Times(2);
    EXPECT_CALL(*m, end_test(0, _, _)).Times(2);
    EXPECT_CALL(*m, end_submission(0, _, _)).Times(AtLeast(1));
    sched.register_monitor(move(m));
    sched.start();
    auto result = sched.submit(make_submission("1"), make_tests(2), {});
    wait(result);
    sched.stop();
}
