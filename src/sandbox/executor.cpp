#include "sandbox/executor.hpp"
#include <glog/logging.h>
#include <signal.h>
#include <string.h>

namespace validator {
using namespace std;

executor::~executor() {}

void cancellation_token::cancel() {
    lock_guard<mutex> guard(mut);
    flag = true;
    if (pid > 0) {
        LOG(INFO) << "cancelling, sending SIGTERM to runguard " << pid;
        if (kill(pid, SIGTERM) != 0 && errno != ESRCH)
            LOG(WARNING) << "unable to send SIGTERM to runguard " << pid << ": " << strerror(errno);
    }
}

bool cancellation_token::cancelled() const {
    lock_guard<mutex> guard(mut);
    return flag;
}

void cancellation_token::attach(pid_t runguard_pid) {
    lock_guard<mutex> guard(mut);
    pid = runguard_pid;
    if (flag && kill(pid, SIGTERM) != 0 && errno != ESRCH)
        LOG(WARNING) << "unable to send SIGTERM to runguard " << pid << ": " << strerror(errno);
}

void cancellation_token::detach() {
    lock_guard<mutex> guard(mut);
    pid = -1;
}

}  // namespace validator
