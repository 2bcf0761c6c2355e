#include "runguard.hpp"
#include <signal.h>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace validator {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // runguard 写入的空值没有尾随空格
            if (!line.empty() && line.back() == ':') mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const string &key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    try {
        value = boost::lexical_cast<T>(it->second);
    } catch (boost::bad_lexical_cast &) {
        // ignore exception
    }
}

template <>
void try_to_parse(const map<string, string> &metadata, const string &key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    try_to_parse(metadata, "output-result", result.output_result);
    try_to_parse(metadata, "stdin-bytes", result.stdin_bytes);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    try_to_parse(metadata, "stderr-bytes", result.stderr_bytes);
    try_to_parse(metadata, "internal-error", result.internal_error);
    return result;
}

termination_reason classify_termination(const runguard_result &result, int64_t memory_limit) {
    if (!result.internal_error.empty())
        return termination_reason::SANDBOX_SETUP_FAILED;

    // runguard 在命令结束后一定会写入 exitcode
    if (result.exitcode < 0)
        return termination_reason::SANDBOX_SETUP_FAILED;

    bool signaled = result.signal > 0;
    bool failed = signaled || result.exitcode != 0;

    // cgroup 限制内存后，malloc 返回 NULL 或者 new 抛出 bad_alloc 会让程序自行崩溃，
    // 此时 OOM killer 不一定出手，但内存峰值一定已经到达限制
    if (result.memory_result == "oom" ||
        (failed && memory_limit > 0 && result.memory >= memory_limit))
        return termination_reason::MEMORY_EXCEEDED;

    // 被杀死的命令可能同时超过了 CPU 时间，但触发终止的是输出限制
    if (result.output_result == "limit")
        return termination_reason::OUTPUT_EXCEEDED;

    if (!result.time_result.empty())
        return termination_reason::TIMEOUT;

    if (!result.output_truncated.empty() || result.signal == SIGXFSZ)
        return termination_reason::OUTPUT_EXCEEDED;

    if (signaled)
        return termination_reason::CRASHED;

    if (result.exitcode != 0)
        return termination_reason::NON_ZERO_EXIT;

    return termination_reason::COMPLETED;
}

}  // namespace validator
