#include "monitor/monitor.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>

namespace validator {
using namespace std;

// clang-format off
static const unordered_map<worker_state, const char *> state_string = boost::assign::map_list_of
    (worker_state::START, "start")
    (worker_state::JUDGING, "judging")
    (worker_state::IDLE, "idle")
    (worker_state::CRASHED, "crashed")
    (worker_state::STOPPED, "stopped");
// clang-format on

const char *get_display_message(worker_state state) {
    return state_string.at(state);
}

monitor::~monitor() {}

void monitor::start_submission(int, const submission &) {}

void monitor::start_test(int, const submission &, const test_case &) {}

void monitor::end_test(int, const submission &, const test_result &) {}

void monitor::worker_state_changed(int, worker_state, const string &) {}

void monitor::end_submission(int, const submission &, const validation_report &) {}

void log_monitor::start_submission(int worker_id, const submission &submit) {
    LOG(INFO) << "Worker " << worker_id << " started judging " << submit;
}

void log_monitor::end_test(int worker_id, const submission &submit, const test_result &result) {
    LOG(INFO) << "Worker " << worker_id << " finished test " << result.test_index << " of " << submit
              << ": " << get_display_message(result.result)
              << ", " << result.outcome.wall_time_ms << "ms, " << result.outcome.peak_memory_bytes / 1024 << "kB";
}

void log_monitor::worker_state_changed(int worker_id, worker_state state, const string &information) {
    if (state == worker_state::CRASHED)
        LOG(ERROR) << "Worker " << worker_id << " crashed: " << information;
    else if (state != worker_state::JUDGING && state != worker_state::IDLE)
        LOG(INFO) << "Worker " << worker_id << " " << get_display_message(state);
}

void log_monitor::end_submission(int worker_id, const submission &submit, const validation_report &report) {
    LOG(INFO) << "Worker " << worker_id << " finished " << submit << ": " << get_display_message(report.overall_status)
              << " (" << report.passed_count << "/" << report.total_count << ")";
}

}  // namespace validator
