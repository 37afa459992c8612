#include "polyrun/common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace polyrun {
using namespace std;

polyrun_exception::polyrun_exception()
    : polyrun_exception("") {}

polyrun_exception::polyrun_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *polyrun_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const polyrun_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : polyrun_exception() {}

internal_error::internal_error(const string &message)
    : polyrun_exception(message) {}

resource_exhausted::resource_exhausted()
    : polyrun_exception() {}

resource_exhausted::resource_exhausted(const string &message)
    : polyrun_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : polyrun_exception("Unsupported language: " + language) {}

invalid_submission::invalid_submission(const string &message)
    : polyrun_exception(message) {}

}  // namespace polyrun
