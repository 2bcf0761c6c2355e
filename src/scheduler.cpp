#include "scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "validator/feedback.hpp"

namespace validator {
using namespace std;
namespace fs = std::filesystem;

scheduler::scheduler(compiler &comp, executor &exec, scheduler_options options)
    : comp(comp), runner(exec), options(options), queue(options.max_queue_depth) {}

scheduler::~scheduler() {
    stop();
}

void scheduler::register_monitor(unique_ptr<monitor> &&m) {
    monitors.push_back(move(m));
}

void scheduler::start() {
    for (size_t i = 0; i < options.workers; ++i) {
        int worker_id = (int)i;
        workers.emplace_back([this, worker_id] { worker_loop(worker_id); });
    }
    LOG(INFO) << "started " << options.workers << " workers";
}

void scheduler::stop() {
    {
        // 与 submit 互斥，stopping 置位之后不会再有提交入队
        lock_guard<mutex> guard(mut);
        stopping = true;
    }
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    workers.clear();
}

size_t scheduler::queued() const {
    return queue.size();
}

void scheduler::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &m : monitors) callback(*m);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void scheduler::unregister(const shared_ptr<job> &j) {
    auto range = jobs.equal_range(j->submit.submission_id);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == j) {
            jobs.erase(it);
            break;
        }
    }
}

future<validation_report> scheduler::submit(const submission &submit, vector<test_case> test_cases, validate_options options) {
    auto j = make_shared<job>();
    j->submit = submit;
    j->test_cases = move(test_cases);
    j->options = options;
    j->token = make_shared<cancellation_token>();
    stable_sort(j->test_cases.begin(), j->test_cases.end(),
                [](const test_case &a, const test_case &b) { return a.index < b.index; });
    auto result = j->promise.get_future();

    if (enqueue(j)) return result;

    LOG(WARNING) << submit << " rejected since the queue is full, retrying";
    this_thread::sleep_for(this->options.overload_backoff);
    if (enqueue(j)) return result;
    throw overloaded_error(fmt::format("validation queue is full, {} submissions are waiting", queue.size()));
}

bool scheduler::enqueue(const shared_ptr<job> &j) {
    lock_guard<mutex> guard(mut);
    if (stopping) throw internal_error("scheduler has been stopped");

    // 先登记再入队，入队后立即被取消的提交也能被找到
    jobs.emplace(j->submit.submission_id, j);
    if (queue.try_push(j)) return true;
    unregister(j);
    return false;
}

bool scheduler::cancel(const string &submission_id) {
    bool interrupted = false;
    lock_guard<mutex> guard(mut);
    auto range = jobs.equal_range(submission_id);
    for (auto it = range.first; it != range.second;) {
        shared_ptr<job> j = it->second, removed;
        if (queue.remove_if([&j](const shared_ptr<job> &q) { return q == j; }, removed)) {
            // 还没有开始评测，直接出队
            LOG(INFO) << j->submit << " cancelled while waiting";
            j->token->cancel();
            j->promise.set_value(summarize_aborted(j->submit, j->test_cases, status::CANCELLED, "Cancelled before validation started"));
            it = jobs.erase(it);
            interrupted = true;
            continue;
        }
        if (!j->token->cancelled()) {
            // 正在评测，杀死正在运行的沙箱，worker 会生成 CANCELLED 报告
            LOG(INFO) << j->submit << " cancelled while validating";
            j->token->cancel();
            interrupted = true;
        }
        ++it;
    }
    return interrupted;
}

validation_report scheduler::process(int worker_id, job &j) {
    const submission &submit = j.submit;
    cancellation_token &token = *j.token;

    call_monitor(worker_id, [&](monitor &m) { m.start_submission(worker_id, submit); });

    if (token.cancelled())
        return summarize_aborted(submit, j.test_cases, status::CANCELLED, "Cancelled before validation started");

    fs::path workdir = RUN_DIR / "submissions" / boost::uuids::to_string(boost::uuids::random_generator()());
    defer {
        if (DEBUG) return;
        error_code ec;
        fs::remove_all(workdir, ec);
        if (ec) LOG(WARNING) << "unable to remove submission directory " << workdir << ": " << ec.message();
    };

    artifact art;
    try {
        art = comp.compile(submit, workdir, token);
    } catch (compilation_error &ex) {
        LOG(INFO) << submit << " " << ex.what();
        if (token.cancelled())
            return summarize_aborted(submit, j.test_cases, status::CANCELLED, "Cancelled");
        return summarize_compile_error(submit, j.test_cases, ex.error_log);
    }

    if (token.cancelled())
        return summarize_aborted(submit, j.test_cases, status::CANCELLED, "Cancelled");

    vector<test_result> results;
    bool stopped = false;
    for (auto &tc : j.test_cases) {
        if (stopped) {
            results.push_back(skipped_result(tc));
            continue;
        }

        call_monitor(worker_id, [&](monitor &m) { m.start_test(worker_id, submit, tc); });
        test_result result = runner.run(art, tc, token);
        call_monitor(worker_id, [&](monitor &m) { m.end_test(worker_id, submit, result); });

        // 取消时不返回部分结果
        if (token.cancelled())
            return summarize_aborted(submit, j.test_cases, status::CANCELLED, "Cancelled");

        // 内部错误时沙箱已经不可用，即使 run_all 也不再评测后续测试点，也不把它算作失败的测试点
        if (result.result == status::SYSTEM_ERROR)
            return summarize_aborted(submit, j.test_cases, status::SYSTEM_ERROR, "Internal error, please try again later");

        if (!result.passed && !j.options.run_all)
            stopped = true;
        results.push_back(move(result));
    }

    return summarize(submit, results);
}

void scheduler::worker_loop(int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    while (true) {
        shared_ptr<job> j;
        // 先读 stopping 再出队，stopping 置位之前入队的提交都能被看到
        bool draining = stopping;
        if (!queue.try_pop(j)) {
            if (draining) {
                // 如果需要停止 worker，在评测队列为空时自然退出 worker。
                // stop 之后不再接受新提交，队列不会再变长。
                break;
            }

            usleep(10 * 1000);  // 10ms，这里必须等待，不可以忙等
            continue;
        }

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });

        validation_report report;
        try {
            report = process(worker_id, *j);
        } catch (std::exception &ex) {
            // 任何异常都不能让提交得不到报告
            LOG(ERROR) << j->submit << " failed with internal error " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
            report = summarize_aborted(j->submit, j->test_cases, status::SYSTEM_ERROR, "Internal error, please try again later");
        }

        call_monitor(worker_id, [&](monitor &m) { m.end_submission(worker_id, j->submit, report); });

        {
            lock_guard<mutex> guard(mut);
            unregister(j);
        }
        j->promise.set_value(move(report));

        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

}  // namespace validator
