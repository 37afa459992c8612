#include "polyrun/common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace polyrun {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::COMPILE_ERROR, "CompileError")
    (status::RUNTIME_ERROR, "RuntimeError")
    (status::TIMEOUT, "Timeout")
    (status::RESOURCE_EXCEEDED, "ResourceExceeded")
    (status::INTERNAL_ERROR, "InternalError")
    (status::INVALID_SUBMISSION, "InvalidSubmission")
    (status::UNSUPPORTED_LANGUAGE, "UnsupportedLanguage")
    (status::RESOURCE_EXHAUSTED, "ResourceExhausted")
    (status::REJECTED, "Rejected");

static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::SUCCESS, "Success")
    (status::COMPILE_ERROR, "Compilation Error")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIMEOUT, "Time Limit Exceeded")
    (status::RESOURCE_EXCEEDED, "Resource Limit Exceeded")
    (status::INTERNAL_ERROR, "Internal Error")
    (status::INVALID_SUBMISSION, "Invalid Submission")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::RESOURCE_EXHAUSTED, "Resource Exhausted")
    (status::REJECTED, "Server Busy");
// clang-format on

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

status parse_status(const string &name) {
    for (auto &[stat, str] : status_name)
        if (name == str) return stat;
    throw invalid_argument("unknown status " + name);
}

void to_json(nlohmann::json &j, const status &stat) {
    j = get_status_name(stat);
}

void from_json(const nlohmann::json &j, status &stat) {
    stat = parse_status(j.get<string>());
}

}  // namespace polyrun
