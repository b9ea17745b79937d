#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace autograder {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

build_failure::build_failure()
    : grader_exception() {}

build_failure::build_failure(const string &message)
    : grader_exception(message) {}

engine_unavailable::engine_unavailable()
    : grader_exception() {}

engine_unavailable::engine_unavailable(const string &message)
    : grader_exception(message) {}

engine_error::engine_error()
    : grader_exception() {}

engine_error::engine_error(const string &message)
    : grader_exception(message) {}

store_error::store_error()
    : grader_exception() {}

store_error::store_error(const string &message)
    : grader_exception(message) {}

}  // namespace autograder
