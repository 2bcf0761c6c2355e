#include "test/fake_executor.hpp"
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <stdexcept>

namespace validator {
using namespace std;

execution_outcome completed(const string &stdout_data, int64_t wall_time_ms) {
    execution_outcome outcome;
    outcome.exit_code = 0;
    outcome.stdout_data = stdout_data;
    outcome.wall_time_ms = wall_time_ms;
    outcome.cpu_time_ms = wall_time_ms;
    outcome.peak_memory_bytes = 1 << 20;
    outcome.termination = termination_reason::COMPLETED;
    return outcome;
}

execution_outcome terminated(termination_reason reason) {
    execution_outcome outcome;
    outcome.termination = reason;
    switch (reason) {
        case termination_reason::NON_ZERO_EXIT:
            outcome.exit_code = 1;
            break;
        case termination_reason::CRASHED:
            outcome.signal = SIGSEGV;
            break;
        case termination_reason::TIMEOUT:
            outcome.signal = SIGKILL;
            outcome.wall_time_ms = 2000;
            break;
        case termination_reason::SANDBOX_SETUP_FAILED:
            outcome.internal_error = "unable to create cgroup";
            break;
        default:
            outcome.exit_code = 0;
            break;
    }
    return outcome;
}

program_script echo_program() {
    return [](const string &stdin_data, cancellation_token &) { return completed(stdin_data); };
}

program_script blocking_program(atomic<bool> &release) {
    return [&release](const string &stdin_data, cancellation_token &token) {
        while (!release && !token.cancelled()) usleep(1000);
        if (token.cancelled()) {
            execution_outcome outcome = terminated(termination_reason::CRASHED);
            outcome.signal = SIGTERM;
            return outcome;
        }
        return completed(stdin_data);
    };
}

fake_executor::fake_executor(program_script script) : script(move(script)) {}

execution_outcome fake_executor::execute(const artifact &, const string &stdin_data,
                                         const resource_limits &limits, cancellation_token &token) {
    ++count;
    size_t now = ++running;
    size_t prev = peak;
    while (now > prev && !peak.compare_exchange_weak(prev, now))
        ;
    {
        lock_guard<mutex> guard(mut);
        this->limits = limits;
    }

    execution_outcome outcome;
    try {
        outcome = script(stdin_data, token);
    } catch (...) {
        --running;
        throw;
    }
    --running;
    return outcome;
}

size_t fake_executor::executions() const {
    return count;
}

size_t fake_executor::max_concurrency() const {
    return peak;
}

resource_limits fake_executor::last_limits() const {
    lock_guard<mutex> guard(mut);
    return limits;
}

artifact fake_compiler::compile(const submission &submit, const filesystem::path &workdir, cancellation_token &) {
    {
        lock_guard<mutex> guard(mut);
        order.push_back(submit.submission_id);
    }

    if (submit.source_code == "syntax error")
        throw compilation_error("compilation failed", "main.cpp:1:1: error: expected unqualified-id");
    if (submit.source_code == "internal error")
        throw runtime_error("compiler exploded");

    artifact art;
    art.directory = workdir / "program";
    art.scratch = workdir / "scratch";
    art.command = {"{dir}/program"};
    return art;
}

vector<string> fake_compiler::compiled() const {
    lock_guard<mutex> guard(mut);
    return order;
}

}  // namespace validator
