#include <math.h>
#include <time.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "runguard_options.hpp"
#include "utils.hpp"

using namespace std;
namespace po = boost::program_options;

/**
 * @brief 非负整数，拒绝 lexical_cast 会接受的 "-1"
 */
struct non_negative {
    size_t value = 0;
};

void validate(boost::any &v, const vector<string> &values, non_negative *, int) {
    po::validators::check_first_occurrence(v);
    const string &s = po::validators::get_single_string(values);
    if (!is_number(s)) throw po::invalid_option_value(s);
    v = non_negative{boost::lexical_cast<size_t>(s)};
}

/**
 * @brief soft[:hard]，省略 hard 时与 soft 相同
 */
void validate(boost::any &v, const vector<string> &values, time_limit *, int) {
    po::validators::check_first_occurrence(v);
    const string &s = po::validators::get_single_string(values);

    time_limit limit;
    size_t colon = s.find(':');
    try {
        limit.soft = boost::lexical_cast<double>(s.substr(0, colon));
        limit.hard = colon == string::npos ? limit.soft : boost::lexical_cast<double>(s.substr(colon + 1));
    } catch (boost::bad_lexical_cast &) {
        throw po::invalid_option_value(s);
    }

    if (!isfinite(limit.soft) || !isfinite(limit.hard) || limit.soft < 0 || limit.hard < limit.soft)
        throw po::invalid_option_value(s);
    v = limit;
}

static int resolve_id(const string &name, int (*lookup)(const char *)) {
    return is_number(name) ? boost::lexical_cast<int>(name) : lookup(name.c_str());
}

static int64_t kilobytes(size_t kb) {
    if (kb > (size_t)numeric_limits<int64_t>::max() / 1024) return -1;
    return (int64_t)kb * 1024;
}

int parse_options(int argc, const char *argv[], runguard_options &opt) {
    string user, group;
    vector<string> mounts;

    po::options_description desc("runguard options");
    // clang-format off
    desc.add_options()
        ("root,r", po::value(&opt.chroot_dir), "run the command inside this directory mounted read-only as root")
        ("mount,b", po::value(&mounts), "bind a host directory into the root as src:dst[:rw], read-only unless ':rw' is given")
        ("work-dir,w", po::value(&opt.work_dir), "working directory of the command, inside the root if one is given")
        ("cgroup,c", po::value(&opt.cgroupname), "name of the control group to create, defaults to /validator/runguard_<pid>_<time>")
        ("user,u", po::value(&user), "run the command as this user name or user id")
        ("group,g", po::value(&group), "run the command under this group name or group id, defaults to the user")
        ("wall-time,T", po::value<time_limit>()->notifier([&](const time_limit &t) { opt.use_wall_limit = true; opt.wall_limit = t; }),
            "kill the command after soft[:hard] seconds of wall clock time")
        ("cpu-time,t", po::value<time_limit>()->notifier([&](const time_limit &t) { opt.use_cpu_limit = true; opt.cpu_limit = t; }),
            "limit the cpu time of the command to soft[:hard] seconds")
        ("memory-limit,m", po::value<non_negative>()->notifier([&](non_negative kb) { opt.memory_limit = kilobytes(kb.value); }),
            "limit the memory of the command in KB")
        ("file-limit,f", po::value<non_negative>()->notifier([&](non_negative kb) { opt.file_limit = kilobytes(kb.value); }),
            "limit the size of files created by the command in KB")
        ("nproc,p", po::value<non_negative>()->notifier([&](non_negative n) { opt.nproc = n.value; }),
            "limit the number of processes living at the same time")
        ("no-core-dumps", po::bool_switch(&opt.no_core_dumps), "disable core dumps")
        ("no-network", po::bool_switch(&opt.no_network), "kill the command when it opens internet sockets or changes namespaces and mounts")
        ("standard-input-file,i", po::value(&opt.stdin_filename), "redirect standard input of the command from this file")
        ("standard-output-file,o", po::value(&opt.stdout_filename), "redirect standard output of the command to this file")
        ("standard-error-file,e", po::value(&opt.stderr_filename), "redirect standard error of the command to this file")
        ("stream-size,s", po::value<non_negative>()->notifier([&](non_negative n) { opt.stream_size = (int64_t)n.value; }),
            "truncate the output streams at this size in bytes")
        ("environment,E", po::bool_switch(&opt.preserve_sys_env), "preserve the environment variables, otherwise only PATH is kept")
        ("variable,V", po::value(&opt.env), "add an environment variable as key=value")
        ("out-meta,M", po::value(&opt.metafile_path), "write the run results (times, exitcode, memory, ...) to this file")
        ("cmd", po::value(&opt.command)->required(), "command to run")
        ("help", "display this help text")
        ("version", "display the version");
    // clang-format on

    po::positional_options_description pos;
    pos.add("cmd", -1);

    try {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);

        if (vm.count("help")) {
            cout << "Usage: " << argv[0] << " [options] -- command [args...]" << endl
                 << "Runs the command with resource limits inside a cgroup. Requires root." << endl
                 << desc << endl;
            return 0;
        }
        if (vm.count("version")) {
            cout << "runguard" << endl;
            return 0;
        }

        po::notify(vm);

        for (auto &spec : mounts) opt.mounts.push_back(parse_mount_point(spec));
        if (!user.empty()) opt.user_id = resolve_id(user, get_userid);
        if (group.empty()) group = user;
        if (!group.empty()) opt.group_id = resolve_id(group, get_groupid);
    } catch (std::exception &e) {
        cerr << e.what() << endl
             << endl
             << desc << endl;
        return 1;
    }

    if (opt.cgroupname.empty())
        opt.cgroupname = "/validator/runguard_" + to_string(getpid()) + "_" + to_string(time(nullptr));
    return -1;
}
