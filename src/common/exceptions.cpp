#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

invalid_path_error::invalid_path_error(const string &message)
    : runner_exception(message) {}

unsupported_language_error::unsupported_language_error(const string &message)
    : runner_exception(message) {}

entry_file_not_found_error::entry_file_not_found_error(const string &message)
    : runner_exception(message) {}

sandbox_creation_error::sandbox_creation_error(const string &message)
    : runner_exception(message) {}

execution_timeout_error::execution_timeout_error(const string &message)
    : runner_exception(message) {}

daemon_error::daemon_error(const string &message)
    : runner_exception(message) {}

invalid_request_error::invalid_request_error(const string &message)
    : runner_exception(message) {}

}  // namespace runner
