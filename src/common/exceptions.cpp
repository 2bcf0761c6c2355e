#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace validator {
using namespace std;

validator_exception::validator_exception()
    : validator_exception("") {}

validator_exception::validator_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *validator_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const validator_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : validator_exception() {}

internal_error::internal_error(const string &message)
    : validator_exception(message) {}

sandbox_error::sandbox_error(const string &message)
    : internal_error(message) {}

overloaded_error::overloaded_error(const string &message)
    : validator_exception(message) {}

}  // namespace validator
