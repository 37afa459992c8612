#include "polyrun/runner/limits.hpp"

namespace polyrun {
using namespace std;
using namespace nlohmann;

template <typename T>
static T clamp_limit(T value, T ceiling) {
    if (ceiling < 0) return value;
    if (value < 0) return ceiling;
    return value < ceiling ? value : ceiling;
}

resource_limits resource_limits::clamp(const resource_limits &ceiling) const {
    resource_limits result;
    result.timeout_ms = clamp_limit(timeout_ms, ceiling.timeout_ms);
    result.cpu_time_ms = clamp_limit(cpu_time_ms, ceiling.cpu_time_ms);
    result.memory_bytes = clamp_limit(memory_bytes, ceiling.memory_bytes);
    result.max_output_bytes = clamp_limit(max_output_bytes, ceiling.max_output_bytes);
    result.file_size_bytes = clamp_limit(file_size_bytes, ceiling.file_size_bytes);
    result.proc_limit = clamp_limit(proc_limit, ceiling.proc_limit);
    return result;
}

resource_limits limits_override::apply(const resource_limits &base) const {
    resource_limits result = base;
    if (timeout_ms) result.timeout_ms = *timeout_ms;
    if (cpu_time_ms) result.cpu_time_ms = *cpu_time_ms;
    if (memory_bytes) result.memory_bytes = *memory_bytes;
    if (max_output_bytes) result.max_output_bytes = *max_output_bytes;
    if (file_size_bytes) result.file_size_bytes = *file_size_bytes;
    if (proc_limit) result.proc_limit = *proc_limit;
    return result;
}

bool limits_override::is_valid() const {
    if (timeout_ms && *timeout_ms <= 0) return false;
    if (cpu_time_ms && *cpu_time_ms <= 0) return false;
    if (memory_bytes && *memory_bytes <= 0) return false;
    if (max_output_bytes && *max_output_bytes <= 0) return false;
    if (file_size_bytes && *file_size_bytes <= 0) return false;
    if (proc_limit && *proc_limit <= 0) return false;
    return true;
}

void from_json(const json &j, resource_limits &limits) {
    if (j.count("timeoutMs")) j.at("timeoutMs").get_to(limits.timeout_ms);
    if (j.count("cpuTimeMs")) j.at("cpuTimeMs").get_to(limits.cpu_time_ms);
    if (j.count("memoryBytes")) j.at("memoryBytes").get_to(limits.memory_bytes);
    if (j.count("maxOutputBytes")) j.at("maxOutputBytes").get_to(limits.max_output_bytes);
    if (j.count("fileSizeBytes")) j.at("fileSizeBytes").get_to(limits.file_size_bytes);
    if (j.count("processLimit")) j.at("processLimit").get_to(limits.proc_limit);
}

void to_json(json &j, const resource_limits &limits) {
    j = {{"timeoutMs", limits.timeout_ms},
         {"cpuTimeMs", limits.cpu_time_ms},
         {"memoryBytes", limits.memory_bytes},
         {"maxOutputBytes", limits.max_output_bytes},
         {"fileSizeBytes", limits.file_size_bytes},
         {"processLimit", limits.proc_limit}};
}

template <typename T>
static void read_optional(const json &j, const char *key, optional<T> &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = j.at(key).get<T>();
}

void from_json(const json &j, limits_override &limits) {
    read_optional(j, "timeoutMs", limits.timeout_ms);
    read_optional(j, "cpuTimeMs", limits.cpu_time_ms);
    read_optional(j, "memoryBytes", limits.memory_bytes);
    read_optional(j, "maxOutputBytes", limits.max_output_bytes);
    read_optional(j, "fileSizeBytes", limits.file_size_bytes);
    read_optional(j, "processLimit", limits.proc_limit);
}

}  // namespace polyrun
