#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace grader {
using namespace std;

grader_exception::grader_exception()
    : grader_exception("") {}

grader_exception::grader_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const grader_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : grader_exception() {}

internal_error::internal_error(const string &message)
    : grader_exception(message) {}

malformed_descriptor::malformed_descriptor(const string &message)
    : grader_exception(message) {}

malformed_spec::malformed_spec(const string &message)
    : grader_exception(message) {}

data_error::data_error(const string &message)
    : grader_exception(message) {}

spawn_error::spawn_error(const string &message, int error_code)
    : grader_exception(message), error_code(error_code) {}

execution_error::execution_error(const string &message)
    : grader_exception(message) {}

alignment_error::alignment_error(const string &message)
    : grader_exception(message) {}

reference_error::reference_error(const string &message)
    : grader_exception(message) {}

}  // namespace grader
