#include "utils.hpp"
#include <fmt/core.h>
#include <grp.h>
#include <pwd.h>
#include <algorithm>
#include <stdexcept>
#include "runguard_options.hpp"

using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

int get_userid(const char *name) {
    struct passwd *pwd = getpwnam(name);
    if (!pwd) throw runtime_error(fmt::format("unknown user {}", name));
    return (int)pwd->pw_uid;
}

int get_groupid(const char *name) {
    struct group *grp = getgrnam(name);
    if (!grp) throw runtime_error(fmt::format("unknown group {}", name));
    return (int)grp->gr_gid;
}

mount_point parse_mount_point(const string &spec) {
    mount_point result;
    auto first = spec.find(':');
    if (first == string::npos || first == 0)
        throw invalid_argument(fmt::format("malformed mount {}", spec));
    result.source = spec.substr(0, first);
    auto second = spec.find(':', first + 1);
    result.target = spec.substr(first + 1, second == string::npos ? string::npos : second - first - 1);
    if (second != string::npos) {
        string mode = spec.substr(second + 1);
        if (mode == "rw")
            result.writable = true;
        else if (mode != "ro")
            throw invalid_argument(fmt::format("unknown mount mode {}", mode));
    }
    if (result.target.empty() || result.target[0] != '/')
        throw invalid_argument(fmt::format("mount target must be absolute: {}", spec));
    return result;
}
