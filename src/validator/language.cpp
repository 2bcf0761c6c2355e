#include "validator/language.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <fstream>
#include <regex>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace validator {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

compilation_error::compilation_error(const string &what, const string &error_log)
    : validator_exception(what), error_log(error_log) {}

void from_json(const json &j, language &lang) {
    j.at("source").get_to(lang.source);
    j.at("run").get_to(lang.run);
    assign_optional(j, lang.compile, "compile");
    assign_optional(j, lang.entry_pattern, "entry_pattern");
    assign_optional(j, lang.compile_time_limit_ms, "compile_time_limit");
    assign_optional(j, lang.compile_memory_limit, "compile_memory_limit");

    assert_safe_path(lang.source);
    if (lang.run.empty())
        throw invalid_argument("run command of a language should not be empty");
}

map<string, language> load_languages(const fs::path &path) {
    ifstream fin(path);
    if (!fin) throw invalid_argument("unable to open language configuration " + path.string());

    json j = json::parse(fin);
    map<string, language> languages;
    for (auto &[name, value] : j.items()) {
        language lang = value.get<language>();
        lang.name = name;
        languages[name] = move(lang);
    }
    LOG(INFO) << "loaded " << languages.size() << " languages from " << path;
    return languages;
}

vector<string> expand_command(const vector<string> &command, const language &lang) {
    vector<string> result;
    for (auto &arg : command)
        result.push_back(boost::algorithm::replace_all_copy(arg, "{source}", lang.source));
    return result;
}

static string escape_regex(const string &text) {
    static const regex special(R"([.^$|()\[\]{}*+?\\])");
    return regex_replace(text, special, R"(\$&)");
}

bool has_entry_point(const language &lang, const string &source_code, const string &entry) {
    if (lang.entry_pattern.empty()) return true;
    string pattern = boost::algorithm::replace_all_copy(lang.entry_pattern, "{entry}", escape_regex(entry));
    return regex_search(source_code, regex(pattern));
}

compiler::~compiler() {}

toolchain::toolchain(executor &exec, map<string, language> languages)
    : exec(exec), langs(move(languages)) {}

const map<string, language> &toolchain::languages() const {
    return langs;
}

artifact toolchain::compile(const submission &submit, const fs::path &workdir, cancellation_token &token) {
    auto it = langs.find(submit.language);
    if (it == langs.end())
        throw compilation_error("unsupported language", fmt::format("language '{}' is not supported", submit.language));
    const language &lang = it->second;

    if (!submit.entry_point.empty() && !has_entry_point(lang, submit.source_code, submit.entry_point))
        throw compilation_error("entry point not found", fmt::format("function '{}' not found", submit.entry_point));

    artifact art;
    art.directory = workdir / "program";
    art.scratch = workdir / "scratch";
    fs::create_directories(art.directory);
    fs::create_directories(art.scratch);
    // 沙箱内以 RUN_USER 运行，需要能够写入这两个目录
    fs::permissions(art.directory, fs::perms::all);
    fs::permissions(art.scratch, fs::perms::all);

    write_file_content(art.directory / lang.source, submit.source_code);
    art.command = expand_command(lang.run, lang);

    if (lang.compile.empty()) return art;

    artifact build = art;
    build.command = expand_command(lang.compile, lang);
    build.writable = true;

    resource_limits limits;
    limits.cpu_time_ms = lang.compile_time_limit_ms > 0 ? lang.compile_time_limit_ms : COMPILE_TIME_LIMIT_MS;
    limits.wall_time_ms = (int64_t)(limits.cpu_time_ms * WALL_TIME_FACTOR);
    limits.memory_bytes = lang.compile_memory_limit > 0 ? lang.compile_memory_limit : COMPILE_MEMORY_LIMIT;
    limits.max_output_bytes = COMPILE_LOG_LIMIT;
    limits.file_size_bytes = FILE_SIZE_LIMIT;
    limits.nproc = NPROC_LIMIT;

    execution_outcome outcome = exec.execute(build, "", limits, token);
    if (outcome.termination == termination_reason::SANDBOX_SETUP_FAILED && !token.cancelled()) {
        LOG(WARNING) << submit << " sandbox setup failed when compiling, retrying";
        outcome = exec.execute(build, "", limits, token);
    }

    // 取消由调用方检查
    if (token.cancelled()) return art;

    if (outcome.termination == termination_reason::SANDBOX_SETUP_FAILED)
        throw sandbox_error("sandbox setup failed when compiling");

    if (outcome.termination != termination_reason::COMPLETED) {
        string log = outcome.stdout_data + outcome.stderr_data;
        // 编译器的输出中可能包含主机上的路径
        boost::algorithm::replace_all(log, art.directory.string(), SANDBOX_PROGRAM_DIR);
        boost::algorithm::replace_all(log, art.scratch.string(), SANDBOX_SCRATCH_DIR);
        throw compilation_error(fmt::format("compilation failed ({})", get_display_message(outcome.termination)),
                                excerpt(log, COMPILE_LOG_LIMIT));
    }

    return art;
}

}  // namespace validator
