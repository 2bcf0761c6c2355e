#include "validator/task.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <fstream>
#include <set>
#include <tuple>
#include "common/json_utils.hpp"

namespace validator {
using namespace std;
using namespace nlohmann;

/**
 * @brief 题库中的输入输出可能不是字符串，比如数字或者列表，此时使用其 JSON 文本
 */
static string as_text(const json &j) {
    if (j.is_string()) return j.get<string>();
    return j.dump();
}

void from_json(const json &j, test_case &tc) {
    tc.input_data = as_text(j.at("input"));
    tc.expected_output = as_text(j.at("output"));
    if (exists(j, "comparison"))
        tc.comparison.mode = parse_comparison_mode(get_value<string>(j, "comparison"));
    assign_optional(j, tc.comparison.epsilon, "epsilon");
    assign_optional(j, tc.time_limit_ms, "time_limit");
    assign_optional(j, tc.memory_limit_bytes, "memory_limit");
}

void from_json(const json &j, task &t) {
    j.at("level").get_to(t.level);
    j.at("task").get_to(t.description);
    assign_optional(j, t.function_name, "function_name");
    if (exists(j, "id"))
        t.id = as_text(j.at("id"));
    else
        t.id = fmt::format("{}/{}", t.level, t.function_name);

    size_t index = 0;
    for (auto &item : j.at("test_cases")) {
        test_case tc = item.get<test_case>();
        tc.index = ++index;
        t.test_cases.push_back(move(tc));
    }
}

vector<task> load_tasks(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) throw invalid_argument("unable to open task file " + path.string());

    json j = json::parse(fin);
    vector<task> tasks;
    set<tuple<string, string, string>> seen;
    set<string> ids;
    for (auto &item : j) {
        task t = item.get<task>();
        if (!seen.insert({t.level, t.description, t.function_name}).second) {
            LOG(INFO) << "dropping duplicate task " << t.id;
            continue;
        }

        if (ids.count(t.id)) {
            if (exists(item, "id")) throw invalid_argument("duplicate task id " + t.id + " in " + path.string());
            // 不同的题目可能要求同一个函数名，默认 id 依次加上 #2、#3 区分
            string base = t.id;
            for (size_t n = 2; ids.count(t.id); ++n) t.id = fmt::format("{}#{}", base, n);
            LOG(WARNING) << "task id " << base << " is taken, using " << t.id;
        }
        ids.insert(t.id);
        tasks.push_back(move(t));
    }
    LOG(INFO) << "loaded " << tasks.size() << " tasks from " << path;
    return tasks;
}

const task &find_task(const vector<task> &tasks, const string &id) {
    for (auto &t : tasks)
        if (t.id == id) return t;
    throw out_of_range("task " + id + " not found");
}

}  // namespace validator
