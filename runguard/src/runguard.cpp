#include <glog/logging.h>
#include "runguard_options.hpp"
#include "watchdog.hpp"

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    runguard_options opt;
    int status = parse_options(argc, argv, opt);
    if (status >= 0) return status;

    watchdog guard(std::move(opt));
    return guard.run();
}
