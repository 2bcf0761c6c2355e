#include "restrictions.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <math.h>
#include <seccomp.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>
#include <system_error>

using namespace std;

[[noreturn]] static void fail(const string &what) {
    throw system_error(errno, generic_category(), what);
}

void restrict_environment(const runguard_options &opt) {
    if (!opt.preserve_sys_env) {
        const char *path = getenv("PATH");
        string saved_path = path ? path : "";
        if (clearenv() != 0) fail("clearenv");
        if (!saved_path.empty()) setenv("PATH", saved_path.c_str(), 1);
    }

    for (auto &variable : opt.env) {
        auto eq = variable.find('=');
        if (eq == string::npos) {
            LOG(WARNING) << "ignoring malformed environment variable " << variable;
            continue;
        }
        if (setenv(variable.substr(0, eq).c_str(), variable.substr(eq + 1).c_str(), 1) != 0)
            fail("setenv " + variable);
    }
}

static void limit(int resource, const char *name, rlim_t soft, rlim_t hard) {
    struct rlimit lim = {soft, hard};
    if (setrlimit(resource, &lim) != 0) fail(fmt::format("setrlimit {}", name));
}

void restrict_resources(const runguard_options &opt) {
    if (opt.use_cpu_limit) {
        // 软限制时内核发送 SIGXCPU，一秒后的硬限制发送 SIGKILL
        rlim_t seconds = (rlim_t)ceil(opt.cpu_limit.hard);
        limit(RLIMIT_CPU, "RLIMIT_CPU", seconds, seconds + 1);
    }

    limit(RLIMIT_AS, "RLIMIT_AS", RLIM_INFINITY, RLIM_INFINITY);
    limit(RLIMIT_DATA, "RLIMIT_DATA", RLIM_INFINITY, RLIM_INFINITY);
    limit(RLIMIT_STACK, "RLIMIT_STACK", RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) limit(RLIMIT_FSIZE, "RLIMIT_FSIZE", opt.file_limit, opt.file_limit);
    if (opt.nproc != numeric_limits<size_t>::max()) limit(RLIMIT_NPROC, "RLIMIT_NPROC", opt.nproc, opt.nproc);
    if (opt.no_core_dumps) limit(RLIMIT_CORE, "RLIMIT_CORE", 0, 0);
}

static void bind_mount(const string &source, const string &target, bool writable) {
    if (mount(source.c_str(), target.c_str(), nullptr, MS_BIND | MS_REC, nullptr) != 0)
        fail(fmt::format("bind {} to {}", source, target));
    // bind mount 的只读标志只能通过 remount 设置
    if (!writable && mount(source.c_str(), target.c_str(), nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY | MS_NOSUID, nullptr) != 0)
        fail(fmt::format("remount {} read-only", target));
}

void enter_root(const runguard_options &opt) {
    if (!opt.chroot_dir.empty()) {
        if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
            fail("make mounts private");

        bind_mount(opt.chroot_dir, opt.chroot_dir, false);
        for (auto &m : opt.mounts) {
            bind_mount(m.source, opt.chroot_dir + m.target, m.writable);
            LOG(INFO) << "mounted " << m.source << " at " << m.target << (m.writable ? " (rw)" : " (ro)");
        }

        if (chroot(opt.chroot_dir.c_str()) != 0) fail("chroot to " + opt.chroot_dir);
        if (chdir("/") != 0) fail("chdir to / in chroot");
        LOG(INFO) << "chrooted to " << opt.chroot_dir;
    } else if (!opt.mounts.empty()) {
        LOG(WARNING) << "mounts are ignored without a root directory";
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        fail("chdir to " + opt.work_dir);
}

void drop_privileges(const runguard_options &opt) {
    if (opt.group_id >= 0) {
        gid_t gid = opt.group_id;
        if (setgid(gid) != 0) fail("setgid");
        if (setgroups(1, &gid) != 0) fail("setgroups");
    }

    if (setuid(opt.user_id >= 0 ? (uid_t)opt.user_id : getuid()) != 0) fail("setuid");

    if (getuid() == 0 || geteuid() == 0)
        throw runtime_error("refusing to run the command as root");
}

void restrict_child(const runguard_options &opt, control_group &cg) {
    restrict_environment(opt);
    restrict_resources(opt);
    cg.attach();

    // 新的会话使得整个进程组可以被一个信号杀死
    if (setsid() == -1) fail("setsid");

    enter_root(opt);
    drop_privileges(opt);
}

void install_seccomp(const runguard_options &opt) {
    if (!opt.no_network) return;

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (!ctx) throw runtime_error("seccomp_init failed");

    static const int denied[] = {
        SCMP_SYS(connect), SCMP_SYS(bind), SCMP_SYS(listen), SCMP_SYS(accept), SCMP_SYS(accept4),
        SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root), SCMP_SYS(chroot),
        SCMP_SYS(unshare), SCMP_SYS(setns), SCMP_SYS(ptrace),
        SCMP_SYS(reboot), SCMP_SYS(kexec_load), SCMP_SYS(init_module), SCMP_SYS(finit_module),
        SCMP_SYS(delete_module)};

    int ret = 0;
    for (size_t i = 0; ret == 0 && i < sizeof(denied) / sizeof(denied[0]); ++i)
        ret = seccomp_rule_add(ctx, SCMP_ACT_KILL, denied[i], 0);

    // 只禁止网络套接字，语言运行时会用到本地的 socketpair
    for (int domain : {AF_INET, AF_INET6})
        if (ret == 0) ret = seccomp_rule_add(ctx, SCMP_ACT_KILL, SCMP_SYS(socket), 1, SCMP_A0(SCMP_CMP_EQ, domain));

    if (ret == 0) ret = seccomp_load(ctx);
    seccomp_release(ctx);

    if (ret < 0) throw system_error(-ret, generic_category(), "install seccomp filter");
}
