#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <system_error>

namespace validator {
using namespace std;

pid_t spawn_program(const vector<string> &args, const filesystem::path &log_file) {
    if (args.empty()) throw invalid_argument("empty command");

    // 在 fork 之前准备好参数，子进程中只能调用异步信号安全的函数
    vector<char *> argv;
    for (auto &arg : args) argv.push_back(const_cast<char *>(arg.c_str()));
    argv.push_back(nullptr);

    int log_fd = open(log_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (log_fd < 0) throw system_error(errno, generic_category(), "unable to open log file " + log_file.string());

    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            close(log_fd);
            throw system_error(err, generic_category(), "unable to fork");
        }
        case 0: {  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd < 0 || dup2(null_fd, STDIN_FILENO) < 0) _exit(EXIT_FAILURE);
            if (dup2(log_fd, STDOUT_FILENO) < 0 || dup2(log_fd, STDERR_FILENO) < 0) _exit(EXIT_FAILURE);
            execvp(argv[0], argv.data());
            _exit(EXIT_FAILURE);
        }
        default:  // 父进程
            close(log_fd);
            return pid;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace validator
