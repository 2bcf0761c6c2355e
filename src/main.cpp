#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "validator/engine.hpp"
#include "validator/feedback.hpp"
#include "validator/task.hpp"
using namespace std;

/**
 * @brief 命令行或者批量文件中的一个提交
 */
struct pending_submission {
    validator::submission submit;
    const validator::task* task;
};

static validator::submission make_submission(const string& id, const validator::task& t, const string& language, const string& source_code) {
    validator::submission submit;
    submit.submission_id = id.empty() ? boost::uuids::to_string(boost::uuids::random_generator()()) : id;
    submit.task_id = t.id;
    submit.language = language;
    submit.source_code = source_code;
    submit.entry_point = t.function_name;
    submit.submitted_at = time(nullptr);
    return submit;
}

/**
 * @brief 读取批量提交文件
 * 文件内容为提交列表，每个提交包含 task、language、source（代码）或者 source_file（代码路径，相对于批量文件），
 * 以及可选的 submission_id
 */
static vector<pending_submission> load_batch(const filesystem::path& path, const vector<validator::task>& tasks) {
    using namespace nlohmann;
    ifstream fin(path);
    CHECK(fin) << "Batch file " << path << " does not exist";

    json j = json::parse(fin);
    vector<pending_submission> result;
    for (auto& item : j) {
        const validator::task& t = validator::find_task(tasks, get_value<string>(item, "task"));
        string source_code;
        if (exists(item, "source"))
            source_code = get_value<string>(item, "source");
        else
            source_code = validator::read_file_content(path.parent_path() / get_value<string>(item, "source_file"));

        string id;
        assign_optional(item, id, "submission_id");
        result.push_back({make_submission(id, t, get_value<string>(item, "language"), source_code), &t});
    }
    return result;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    filesystem::path current(argv[0]);
    filesystem::path bin_dir(filesystem::weakly_canonical(current).parent_path());

    namespace po = boost::program_options;
    po::options_description desc("validator options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("languages", po::value<string>(), "set the language configuration file. You can either pass it from environ LANGUAGES")
        ("tasks", po::value<string>(), "set the task file. You can either pass it from environ TASKS")
        ("task", po::value<string>(), "id of the task to validate the source against")
        ("source", po::value<string>(), "path of the source code to validate")
        ("language", po::value<string>(), "language of the source code")
        ("submission-id", po::value<string>(), "id of the submission, a random id is generated if not given")
        ("run-all", "run all test cases even if an earlier one fails")
        ("batch", po::value<string>(), "validate all submissions listed in the JSON file concurrently")
        ("workers", po::value<size_t>()->default_value(1), "number of submissions validated concurrently")
        ("queue-depth", po::value<size_t>()->default_value(64), "maximum number of submissions waiting for validation")
        ("run-dir", po::value<string>(), "set the directory to run user programs, store compiled user program. You can either pass it from environ RUNDIR")
        ("chroot-dir", po::value<string>(), "set the chroot directory, required unless --debug is given. You can either pass it from environ CHROOTDIR")
        ("runguard", po::value<string>(), "set the path of runguard executable. You can either pass it from environ RUNGUARD")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("default-time-limit", po::value<int64_t>(), "set CPU time limit in milliseconds for test cases without one, default to 2000")
        ("default-memory-limit", po::value<int64_t>(), "set memory limit in KB for test cases without one, default to 262144(256MB)")
        ("wall-time-factor", po::value<double>(), "set wall time limit as a multiple of CPU time limit, default to 2")
        ("debug", "turn on the debug mode to disable checking whether it is in privileged mode, and not to delete submission directory to check the validity of result files.")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "Validator: validate submitted source code against hidden test cases in a sandbox" << endl
             << "This app requires root privilege" << endl
             << "Usage: " << argv[0] << " --languages <file> --tasks <file> (--task <id> --source <file> --language <name> | --batch <file>)" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "validator 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        validator::DEBUG = true;
    } else if (getenv("DEBUG")) {
        validator::DEBUG = true;
    }

    if (getuid() != 0) {
        cerr << "You should run this program in privileged mode" << endl;
        if (!validator::DEBUG) return EXIT_FAILURE;
    }

    if (vm.count("runguard")) {
        validator::RUNGUARD_PATH = filesystem::path(vm.at("runguard").as<string>());
    } else if (getenv("RUNGUARD")) {
        validator::RUNGUARD_PATH = filesystem::path(getenv("RUNGUARD"));
    } else if (filesystem::exists(bin_dir / "runguard")) {
        // 默认情况下，假设 runguard 和 validator 编译在同一个目录下
        validator::RUNGUARD_PATH = bin_dir / "runguard";
    }
    CHECK(filesystem::is_regular_file(validator::RUNGUARD_PATH))
        << "runguard " << validator::RUNGUARD_PATH << " does not exist";

    if (vm.count("run-dir")) {
        validator::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        validator::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    CHECK(filesystem::is_directory(validator::RUN_DIR))
        << "Run directory " << validator::RUN_DIR << " does not exist";

    if (vm.count("chroot-dir")) {
        validator::CHROOT_DIR = filesystem::path(vm.at("chroot-dir").as<string>());
    } else if (getenv("CHROOTDIR")) {
        validator::CHROOT_DIR = filesystem::path(getenv("CHROOTDIR"));
    }
    try {
        validator::check_sandbox_root();
    } catch (validator::internal_error& e) {
        LOG(ERROR) << e.what();
        return EXIT_FAILURE;
    }

    if (vm.count("run-user")) {
        validator::RUN_USER = vm["run-user"].as<string>();
    } else {
        validator::RUN_USER = validator::get_env("RUNUSER", "");
    }

    if (vm.count("run-group")) {
        validator::RUN_GROUP = vm["run-group"].as<string>();
    } else {
        validator::RUN_GROUP = validator::get_env("RUNGROUP", "");
    }

    if (vm.count("default-time-limit")) validator::DEFAULT_TIME_LIMIT_MS = vm["default-time-limit"].as<int64_t>();
    if (vm.count("default-memory-limit")) validator::DEFAULT_MEMORY_LIMIT = vm["default-memory-limit"].as<int64_t>() * 1024;
    if (vm.count("wall-time-factor")) validator::WALL_TIME_FACTOR = vm["wall-time-factor"].as<double>();
    CHECK(validator::WALL_TIME_FACTOR >= 1) << "wall time factor should be at least 1";

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    string languages_file = vm.count("languages") ? vm["languages"].as<string>() : validator::get_env("LANGUAGES", "");
    string tasks_file = vm.count("tasks") ? vm["tasks"].as<string>() : validator::get_env("TASKS", "");
    CHECK(!languages_file.empty()) << "Language configuration file should be specified";
    CHECK(!tasks_file.empty()) << "Task file should be specified";

    map<string, validator::language> languages;
    vector<validator::task> tasks;
    vector<pending_submission> submissions;
    try {
        languages = validator::load_languages(languages_file);
        tasks = validator::load_tasks(tasks_file);

        if (vm.count("batch")) {
            submissions = load_batch(vm["batch"].as<string>(), tasks);
        } else {
            CHECK(vm.count("task") && vm.count("source") && vm.count("language"))
                << "--task, --source and --language should be specified when --batch is not given";
            const validator::task& t = validator::find_task(tasks, vm["task"].as<string>());
            string id = vm.count("submission-id") ? vm["submission-id"].as<string>() : "";
            string source_code = validator::read_file_content(vm["source"].as<string>());
            submissions.push_back({make_submission(id, t, vm["language"].as<string>(), source_code), &t});
        }
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to load configuration: " << e.what();
        return EXIT_FAILURE;
    }

    validator::scheduler_options options;
    options.workers = vm["workers"].as<size_t>();
    options.max_queue_depth = vm["queue-depth"].as<size_t>();
    CHECK(options.workers > 0) << "at least one worker is required";

    validator::validation_engine engine(move(languages), options);
    engine.register_monitor(make_unique<validator::log_monitor>());
    engine.start();

    validator::validate_options validate_opts;
    validate_opts.run_all = vm.count("run-all") > 0;

    vector<future<validator::validation_report>> reports;
    int exitcode = EXIT_SUCCESS;
    for (auto& pending : submissions) {
        try {
            reports.push_back(engine.submit(pending.submit, pending.task->test_cases, validate_opts));
        } catch (validator::overloaded_error& e) {
            LOG(ERROR) << pending.submit << " rejected: " << e.what();
            nlohmann::json rejected = {{"submission_id", pending.submit.submission_id},
                                       {"overall_status", validator::get_display_message(validator::status::SYSTEM_ERROR)},
                                       {"message", "Validation queue is full, please try again later"}};
            cout << rejected.dump() << endl;
            exitcode = EXIT_FAILURE;
        }
    }

    for (auto& report : reports) {
        nlohmann::json j = report.get();
        cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
    }

    engine.stop();
    return exitcode;
}
