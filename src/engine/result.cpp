#include "polyrun/engine/result.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const execution_result &result) {
    j = {{"status", result.stat},
         {"statusMessage", get_display_message(result.stat)},
         {"stdout", result.stdout_data},
         {"stderr", result.stderr_data},
         {"stdoutTruncated", result.stdout_truncated},
         {"stderrTruncated", result.stderr_truncated},
         {"exitCode", result.exit_code},
         {"signal", result.signal},
         {"durationMs", result.duration_ms},
         {"cpuTimeMs", result.cpu_time_ms},
         {"memoryBytes", result.memory_bytes},
         {"timedOut", result.timed_out}};
    if (!result.id.empty()) j["id"] = result.id;
    if (result.compile_error) j["compileError"] = *result.compile_error;
    if (!result.message.empty()) j["message"] = result.message;
}

const char *get_outcome_name(test_outcome outcome) {
    switch (outcome) {
        case test_outcome::PASS:
            return "Pass";
        case test_outcome::FAIL:
            return "Fail";
        default:
            return "Error";
    }
}

string get_verdict_name(status stat) {
    switch (stat) {
        case status::SUCCESS:
            return "Accepted";
        case status::TIMEOUT:
            return "TimeLimitExceeded";
        default:
            return get_status_name(stat);
    }
}

void to_json(json &j, const test_case_result &result) {
    j = result.execution;
    j.erase("id");
    j["name"] = result.name;
    j["outcome"] = get_outcome_name(result.outcome);
    j["expectedOutput"] = result.expected_output;
}

void to_json(json &j, const test_report &report) {
    j = {{"verdict", report.verdict},
         {"passed", report.passed},
         {"total", report.total},
         {"durationMs", report.duration_ms},
         {"results", report.results}};
    if (!report.id.empty()) j["id"] = report.id;
    if (report.compile_error) j["compileError"] = *report.compile_error;
    if (!report.message.empty()) j["message"] = report.message;
}

}  // namespace polyrun
