#include "validator/test_runner.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <string.h>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "validator/compare.hpp"

namespace validator {
using namespace std;

resource_limits limits_for(const test_case &tc) {
    resource_limits limits;
    limits.cpu_time_ms = tc.time_limit_ms >= 0 ? tc.time_limit_ms : DEFAULT_TIME_LIMIT_MS;
    limits.wall_time_ms = (int64_t)(limits.cpu_time_ms * WALL_TIME_FACTOR);
    limits.memory_bytes = tc.memory_limit_bytes >= 0 ? tc.memory_limit_bytes : DEFAULT_MEMORY_LIMIT;
    limits.max_output_bytes = MAX_OUTPUT_BYTES;
    limits.file_size_bytes = FILE_SIZE_LIMIT;
    limits.nproc = NPROC_LIMIT;
    return limits;
}

string describe_termination(const execution_outcome &outcome, const resource_limits &limits) {
    switch (outcome.termination) {
        case termination_reason::NON_ZERO_EXIT:
            return fmt::format("program exited with code {}", outcome.exit_code);
        case termination_reason::CRASHED:
            return fmt::format("program was terminated by signal {} ({})", outcome.signal, strsignal(outcome.signal));
        case termination_reason::TIMEOUT:
            return fmt::format("time limit of {} ms exceeded", limits.cpu_time_ms);
        case termination_reason::MEMORY_EXCEEDED:
            return fmt::format("memory limit of {} bytes exceeded", limits.memory_bytes);
        case termination_reason::OUTPUT_EXCEEDED:
            return fmt::format("output limit of {} bytes exceeded", limits.max_output_bytes);
        case termination_reason::SANDBOX_SETUP_FAILED:
            return "internal error, this test is not counted";
        case termination_reason::COMPLETED:
        default:
            return "";
    }
}

test_runner::test_runner(executor &exec) : exec(exec) {}

test_result test_runner::run(const artifact &art, const test_case &tc, cancellation_token &token) {
    test_result result;
    result.test_index = tc.index;
    result.skipped = false;

    resource_limits limits = limits_for(tc);
    execution_outcome outcome = exec.execute(art, tc.input_data, limits, token);
    if (outcome.termination == termination_reason::SANDBOX_SETUP_FAILED && !token.cancelled()) {
        LOG(WARNING) << "sandbox setup failed on test " << tc.index << ", retrying";
        outcome = exec.execute(art, tc.input_data, limits, token);
    }

    result.outcome.exit_code = outcome.exit_code;
    result.outcome.wall_time_ms = outcome.wall_time_ms;
    result.outcome.cpu_time_ms = outcome.cpu_time_ms;
    result.outcome.peak_memory_bytes = outcome.peak_memory_bytes;
    result.outcome.termination = outcome.termination;

    if (token.cancelled()) {
        result.result = status::CANCELLED;
        return result;
    }

    if (outcome.termination != termination_reason::SANDBOX_SETUP_FAILED)
        result.stderr_excerpt = excerpt(outcome.stderr_data, EXCERPT_LIMIT);

    if (outcome.termination != termination_reason::COMPLETED) {
        result.result = to_status(outcome.termination);
        result.diff_summary = describe_termination(outcome, limits);
        return result;
    }

    comparison_result cmp = compare_output(tc.expected_output, outcome.stdout_data, tc.comparison, EXCERPT_LIMIT);
    result.passed = cmp.matched;
    result.result = cmp.matched ? status::ACCEPTED : status::WRONG_ANSWER;
    if (!cmp.matched) result.diff_summary = cmp.diff_summary;
    return result;
}

}  // namespace validator
