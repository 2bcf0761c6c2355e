#include "cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <string.h>
#include <fstream>
#include <memory>
#include <vector>

using namespace std;

static string describe(int err) {
    if (err == ECGOTHER) return strerror(cgroup_get_last_errno());
    return cgroup_strerror(err);
}

cgroup_error::cgroup_error(const string &op, int err)
    : runtime_error(fmt::format("{}: {}", op, describe(err))) {}

static void check(int err, const string &op) {
    if (err != 0) throw cgroup_error(op, err);
}

struct cgroup_deleter {
    void operator()(struct cgroup *cg) const {
        cgroup_free(&cg);
    }
};

using cgroup_handle = unique_ptr<struct cgroup, cgroup_deleter>;

static cgroup_handle new_handle(const string &name) {
    cgroup_handle cg(cgroup_new_cgroup(name.c_str()));
    if (!cg) throw cgroup_error(fmt::format("cgroup_new_cgroup({})", name), ECGOTHER);
    return cg;
}

static struct cgroup_controller *add_controller(struct cgroup *cg, const char *controller) {
    struct cgroup_controller *ctrl = cgroup_add_controller(cg, controller);
    if (!ctrl) throw cgroup_error(fmt::format("cgroup_add_controller({})", controller), ECGOTHER);
    return ctrl;
}

static int64_t read_value(struct cgroup *cg, const char *controller, const char *key) {
    struct cgroup_controller *ctrl = cgroup_get_controller(cg, controller);
    if (!ctrl) throw cgroup_error(fmt::format("cgroup_get_controller({})", controller), ECGOTHER);
    int64_t value;
    check(cgroup_get_value_int64(ctrl, key, &value), fmt::format("cgroup_get_value_int64({})", key));
    return value;
}

void control_group::init() {
    check(cgroup_init(), "cgroup_init");
}

control_group::control_group(string name) : cg_name(move(name)) {}

const string &control_group::name() const {
    return cg_name;
}

void control_group::create(int64_t memory_limit) {
    cgroup_handle cg = new_handle(cg_name);

    struct cgroup_controller *memory = add_controller(cg.get(), "memory");
    if (memory_limit > 0) {
        check(cgroup_add_value_int64(memory, "memory.limit_in_bytes", memory_limit), "set memory.limit_in_bytes");
        check(cgroup_add_value_int64(memory, "memory.memsw.limit_in_bytes", memory_limit), "set memory.memsw.limit_in_bytes");
    }
    add_controller(cg.get(), "cpuacct");

    check(cgroup_create_cgroup(cg.get(), 1), fmt::format("cgroup_create_cgroup({})", cg_name));
    LOG(INFO) << "created cgroup " << cg_name;
}

void control_group::attach() {
    cgroup_handle cg = new_handle(cg_name);
    check(cgroup_get_cgroup(cg.get()), fmt::format("cgroup_get_cgroup({})", cg_name));
    check(cgroup_attach_task(cg.get()), fmt::format("cgroup_attach_task({})", cg_name));
}

bool control_group::kill_all() {
    for (int round = 0; round < 10; ++round) {
        vector<pid_t> pids;
        void *handle = nullptr;
        pid_t pid;
        int ret = cgroup_get_task_begin(cg_name.c_str(), "memory", &handle, &pid);
        while (ret == 0) {
            pids.push_back(pid);
            ret = cgroup_get_task_next(&handle, &pid);
        }
        cgroup_get_task_end(&handle);
        if (ret != ECGEOF) throw cgroup_error(fmt::format("cgroup_get_task({})", cg_name), ret);

        if (pids.empty()) return true;
        for (pid_t p : pids)
            if (kill(p, SIGKILL) != 0 && errno != ESRCH)
                LOG(WARNING) << "unable to kill process " << p << ": " << strerror(errno);
    }
    LOG(WARNING) << "cgroup " << cg_name << " still has tasks after killing";
    return false;
}

cgroup_usage control_group::usage() const {
    cgroup_handle cg = new_handle(cg_name);
    check(cgroup_get_cgroup(cg.get()), fmt::format("cgroup_get_cgroup({})", cg_name));

    cgroup_usage result;
    result.memory_peak = read_value(cg.get(), "memory", "memory.memsw.max_usage_in_bytes");
    result.cpu_time = read_value(cg.get(), "cpuacct", "cpuacct.usage") / 1e9;  // ns

    // memory.oom_control 有多行，libcgroup 无法按整数读取
    ifstream fin("/sys/fs/cgroup/memory" + cg_name + "/memory.oom_control");
    string key;
    int64_t value;
    while (fin >> key >> value)
        if (key == "oom_kill") result.oom_killed = value > 0;
    return result;
}

void control_group::destroy() {
    cgroup_handle cg = new_handle(cg_name);
    add_controller(cg.get(), "cpuacct");
    add_controller(cg.get(), "memory");
    check(cgroup_delete_cgroup_ext(cg.get(), CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE),
          fmt::format("cgroup_delete_cgroup({})", cg_name));
}
