#include "validator/engine.hpp"

namespace validator {
using namespace std;

validation_engine::validation_engine(map<string, language> languages, scheduler_options options)
    : exec(), tools(exec, move(languages)), sched(tools, exec, options) {}

validation_report validation_engine::validate(const submission &submit, const vector<test_case> &test_cases, validate_options options) {
    return sched.submit(submit, test_cases, options).get();
}

future<validation_report> validation_engine::submit(const submission &submit, const vector<test_case> &test_cases, validate_options options) {
    return sched.submit(submit, test_cases, options);
}

bool validation_engine::cancel(const string &submission_id) {
    return sched.cancel(submission_id);
}

void validation_engine::register_monitor(unique_ptr<monitor> &&m) {
    sched.register_monitor(move(m));
}

void validation_engine::start() {
    sched.start();
}

void validation_engine::stop() {
    sched.stop();
}

}  // namespace validator
