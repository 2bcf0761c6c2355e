#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace validator {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::RESOURCE_EXCEEDED, "Resource Exceeded")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::SYSTEM_ERROR, "System Error")
    (status::CANCELLED, "Cancelled")
    (status::SKIPPED, "Skipped");

static const unordered_map<termination_reason, const char *> termination_string = boost::assign::map_list_of
    (termination_reason::COMPLETED, "Completed")
    (termination_reason::NON_ZERO_EXIT, "NonZeroExit")
    (termination_reason::TIMEOUT, "Timeout")
    (termination_reason::MEMORY_EXCEEDED, "MemoryExceeded")
    (termination_reason::OUTPUT_EXCEEDED, "OutputExceeded")
    (termination_reason::CRASHED, "Crashed")
    (termination_reason::SANDBOX_SETUP_FAILED, "SandboxSetupFailed");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_display_message(termination_reason reason) {
    return termination_string.at(reason);
}

status to_status(termination_reason reason) {
    switch (reason) {
        case termination_reason::COMPLETED:
            return status::ACCEPTED;
        case termination_reason::NON_ZERO_EXIT:
        case termination_reason::CRASHED:
            return status::RUNTIME_ERROR;
        case termination_reason::TIMEOUT:
            return status::TIME_LIMIT_EXCEEDED;
        case termination_reason::MEMORY_EXCEEDED:
        case termination_reason::OUTPUT_EXCEEDED:
            return status::RESOURCE_EXCEEDED;
        case termination_reason::SANDBOX_SETUP_FAILED:
        default:
            return status::SYSTEM_ERROR;
    }
}

}  // namespace validator
