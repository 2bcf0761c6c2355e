#include "config.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace validator {
using namespace std;

filesystem::path RUN_DIR;
filesystem::path CHROOT_DIR;
filesystem::path RUNGUARD_PATH = "runguard";
string RUN_USER;
string RUN_GROUP;

const char *SANDBOX_PROGRAM_DIR = "/program";
const char *SANDBOX_SCRATCH_DIR = "/scratch";

int64_t DEFAULT_TIME_LIMIT_MS = 2000;          // 2s
int64_t DEFAULT_MEMORY_LIMIT = 256ll << 20;    // 256M
double WALL_TIME_FACTOR = 2;
int64_t MAX_OUTPUT_BYTES = 16ll << 20;         // 16M
int64_t FILE_SIZE_LIMIT = 64ll << 20;          // 64M
int NPROC_LIMIT = 64;
int64_t COMPILE_TIME_LIMIT_MS = 10000;         // 10s
int64_t COMPILE_MEMORY_LIMIT = 512ll << 20;    // 512M
size_t EXCERPT_LIMIT = 256;
size_t COMPILE_LOG_LIMIT = 4096;
int64_t TEARDOWN_GRACE_MS = 2000;
bool DEBUG = false;

void check_sandbox_root() {
    if (CHROOT_DIR.empty()) {
        if (!DEBUG) throw internal_error("no chroot directory given, refusing to run programs on the host file system");
        LOG(WARNING) << "No chroot directory given, user programs can read the host file system";
        return;
    }
    if (!filesystem::is_directory(CHROOT_DIR))
        throw internal_error("chroot directory " + CHROOT_DIR.string() + " does not exist");
}

}  // namespace validator
