#include "validator/feedback.hpp"
#include <fmt/core.h>

namespace validator {
using namespace std;
using namespace nlohmann;

int status_precedence(status stat) {
    switch (stat) {
        case status::SYSTEM_ERROR: return 8;
        case status::CANCELLED: return 7;
        case status::COMPILATION_ERROR: return 6;
        case status::TIME_LIMIT_EXCEEDED: return 5;
        case status::RESOURCE_EXCEEDED: return 4;
        case status::RUNTIME_ERROR: return 3;
        case status::WRONG_ANSWER: return 2;
        case status::ACCEPTED: return 1;
        case status::SKIPPED:
        default: return 0;
    }
}

test_result skipped_result(const test_case &tc) {
    test_result result;
    result.test_index = tc.index;
    result.passed = false;
    result.skipped = true;
    result.result = status::SKIPPED;
    return result;
}

validation_report summarize(const submission &submit, const vector<test_result> &results) {
    validation_report report;
    report.submission_id = submit.submission_id;
    report.total_count = results.size();
    report.per_test_results = results;
    report.overall_status = status::ACCEPTED;

    for (auto &result : results) {
        if (result.passed) ++report.passed_count;
        if (!result.skipped) report.total_wall_time_ms += result.outcome.wall_time_ms;
        if (!result.passed && !result.skipped && !report.first_failure)
            report.first_failure = result;
        if (!result.skipped && status_precedence(result.result) > status_precedence(report.overall_status))
            report.overall_status = result.result;
    }

    // 没有失败的测试点，但有测试点没有运行
    if (report.passed_count != report.total_count && report.overall_status == status::ACCEPTED)
        report.overall_status = status::SYSTEM_ERROR;

    if (report.overall_status == status::ACCEPTED) {
        report.message = fmt::format("Accepted: all {} tests passed", report.total_count);
    } else if (report.first_failure) {
        auto &failure = *report.first_failure;
        report.message = fmt::format("{} on test {}", get_display_message(failure.result), failure.test_index);
        if (failure.diff_summary) report.message += ": " + *failure.diff_summary;
    } else {
        report.message = get_display_message(report.overall_status);
    }
    return report;
}

static validation_report summarize_skipped(const submission &submit, const vector<test_case> &test_cases,
                                           status stat, const string &message) {
    validation_report report;
    report.submission_id = submit.submission_id;
    report.overall_status = stat;
    report.total_count = test_cases.size();
    for (auto &tc : test_cases)
        report.per_test_results.push_back(skipped_result(tc));
    report.message = message;
    return report;
}

validation_report summarize_compile_error(const submission &submit, const vector<test_case> &test_cases,
                                          const string &compile_log) {
    validation_report report = summarize_skipped(submit, test_cases, status::COMPILATION_ERROR, "Compilation Error");
    report.compile_log = compile_log;
    if (!compile_log.empty() && compile_log.find('\n') == string::npos)
        report.message += ": " + compile_log;
    return report;
}

validation_report summarize_aborted(const submission &submit, const vector<test_case> &test_cases,
                                    status stat, const string &message) {
    return summarize_skipped(submit, test_cases, stat, message);
}

void to_json(json &j, const test_result &result) {
    j = {{"test_index", result.test_index},
         {"passed", result.passed},
         {"skipped", result.skipped},
         {"status", get_display_message(result.result)}};
    if (!result.skipped) {
        j["outcome"] = {{"exit_code", result.outcome.exit_code},
                        {"wall_time_ms", result.outcome.wall_time_ms},
                        {"cpu_time_ms", result.outcome.cpu_time_ms},
                        {"peak_memory_bytes", result.outcome.peak_memory_bytes},
                        {"termination", get_display_message(result.outcome.termination)}};
        j["stderr_excerpt"] = result.stderr_excerpt;
    }
    if (result.diff_summary) j["diff_summary"] = *result.diff_summary;
}

void to_json(json &j, const validation_report &report) {
    j = {{"submission_id", report.submission_id},
         {"overall_status", get_display_message(report.overall_status)},
         {"passed_count", report.passed_count},
         {"total_count", report.total_count},
         {"per_test_results", report.per_test_results},
         {"total_wall_time_ms", report.total_wall_time_ms},
         {"message", report.message}};
    if (report.first_failure) j["first_failure"] = *report.first_failure;
    if (!report.compile_log.empty()) j["compile_log"] = report.compile_log;
}

}  // namespace validator
