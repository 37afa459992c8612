#include "polyrun/engine/engine_config.hpp"
#include <thread>
#include "polyrun/common/json_utils.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

size_t engine_config::concurrency() const {
    if (max_concurrency > 0) return max_concurrency;
    return max<size_t>(thread::hardware_concurrency(), 1);
}

resource_limits engine_config::default_max_run_limits() {
    resource_limits limits;
    limits.timeout_ms = 60000;
    limits.cpu_time_ms = 60000;
    limits.memory_bytes = 2048LL * 1024 * 1024;
    limits.max_output_bytes = 16 * 1024 * 1024;
    limits.file_size_bytes = 256LL * 1024 * 1024;
    return limits;
}

void from_json(const json &j, engine_config &config) {
    if (exists(j, "runDir")) config.run_dir = j.at("runDir").get<string>();
    if (exists(j, "languagesFile")) config.languages_file = j.at("languagesFile").get<string>();
    assign_optional(j, config.max_concurrency, "maxConcurrency");
    assign_optional(j, config.admission_timeout_ms, "admissionTimeoutMs");
    assign_optional(j, config.max_workspaces, "maxWorkspaces");
    assign_optional(j, config.max_source_bytes, "maxSourceBytes");
    assign_optional(j, config.max_stdin_bytes, "maxStdinBytes");
    assign_optional(j, config.max_files, "maxFiles");
    assign_optional(j, config.max_total_bytes, "maxTotalBytes");
    if (exists(j, "maxRunLimits")) j.at("maxRunLimits").get_to(config.max_run_limits);

    assign_optional(j, config.sandbox.use_cgroup, "sandbox", "useCgroup");
    assign_optional(j, config.sandbox.cgroup_root, "sandbox", "cgroupRoot");
    assign_optional(j, config.sandbox.poll_interval_ms, "sandbox", "pollIntervalMs");
    assign_optional(j, config.sandbox.isolate, "sandbox", "isolate");
    assign_optional(j, config.run_user, "sandbox", "runUser");
    assign_optional(j, config.run_group, "sandbox", "runGroup");
}

}  // namespace polyrun
