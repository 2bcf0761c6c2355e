#include "test/environment.hpp"
#include <glog/logging.h>
#include <unistd.h>
#include <filesystem>
#include "common/utils.hpp"
#include "config.hpp"

namespace validator {
using namespace std;

void setup_test_environment() {
    if (getenv("DEBUG")) validator::DEBUG = true;

    validator::RUN_DIR = filesystem::temp_directory_path() / ("validator-test-" + to_string(getpid()));
    filesystem::create_directories(validator::RUN_DIR);
    CHECK(filesystem::is_directory(validator::RUN_DIR))
        << "Run directory " << validator::RUN_DIR << " cannot be created";

    validator::RUNGUARD_PATH = filesystem::weakly_canonical(filesystem::path(get_env("RUNGUARD", "runguard")));
    validator::CHROOT_DIR.clear();
}

void teardown_test_environment() {
    if (validator::DEBUG) return;
    error_code ec;
    filesystem::remove_all(validator::RUN_DIR, ec);
}

}  // namespace validator
