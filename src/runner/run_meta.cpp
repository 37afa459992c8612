#include "polyrun/runner/run_meta.hpp"
#include <fmt/format.h>
#include <signal.h>
#include <boost/algorithm/string/join.hpp>
#include <string>
#include <vector>

namespace polyrun {
using namespace std;

const char *get_time_result(const run_result &result) {
    if (result.timed_out) return "hard-timelimit";
    if (result.signal && *result.signal == SIGXCPU) return "soft-timelimit";
    // 在 shell 下运行时，SIGXCPU 表现为返回值
    if (!result.signal && result.stat == status::RESOURCE_EXCEEDED && result.exit_code == 128 + SIGXCPU)
        return "soft-timelimit";
    return "";
}

void write_run_meta(ostream &os, const run_result &result) {
    os << "wall-time: " << fmt::format("{:.3f}", result.wall_time_ms / 1000.0) << endl;
    os << "cpu-time: " << fmt::format("{:.3f}", result.cpu_time_ms / 1000.0) << endl;
    os << "memory-bytes: " << result.memory_bytes << endl;
    os << "exitcode: " << result.exit_code << endl;
    if (result.signal) os << "signal: " << *result.signal << endl;
    os << "time-result: " << get_time_result(result) << endl;

    vector<string> output_truncated;
    if (result.stdout_truncated) output_truncated.push_back("stdout");
    if (result.stderr_truncated) output_truncated.push_back("stderr");
    os << "output-truncated: " << boost::algorithm::join(output_truncated, ",") << endl;
    os << "status: " << get_status_name(result.stat) << endl;
    if (result.stat == status::INTERNAL_ERROR) os << "internal-error: " << result.error << endl;
}

}  // namespace polyrun
