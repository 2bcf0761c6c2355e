#include "common/io_utils.hpp"
#include <fmt/core.h>
#include <fstream>
#include <system_error>

namespace validator {
using namespace std;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(filesystem::path const &path, const string &def) {
    if (!filesystem::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const filesystem::path &path, size_t limit, bool &truncated) {
    truncated = false;
    ifstream fin(path.string(), ios::binary);
    if (!fin) return "";

    string result(limit, '\0');
    fin.read(result.data(), limit);
    result.resize(fin.gcount());
    if (result.size() == limit && fin.peek() != char_traits<char>::eof())
        truncated = true;
    return result;
}

void write_file_content(const filesystem::path &path, const string &content) {
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout) throw system_error(errno, generic_category(), fmt::format("unable to open file {}", path.string()));
    fout << content;
    if (!fout) throw system_error(errno, generic_category(), fmt::format("unable to write file {}", path.string()));
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.empty() || subpath[0] == '/')
        throw runtime_error("subpath is not safe " + subpath);
    return subpath;
}

string excerpt(const string &text, size_t limit) {
    if (text.size() <= limit) return text;
    return text.substr(0, limit) + "...";
}

}  // namespace validator
