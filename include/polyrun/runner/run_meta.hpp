#pragma once

#include <ostream>
#include "polyrun/runner/process_runner.hpp"

namespace polyrun {

/**
 * @brief 将运行结果写成 runguard 的元数据格式
 * 每行一个 "key: value"，依次为 wall-time、cpu-time（秒，保留三位小数）、memory-bytes、exitcode、
 * signal（仅被信号杀死时）、time-result、output-truncated、status，
 * 状态为 InternalError 时最后追加 internal-error
 */
void write_run_meta(std::ostream &os, const run_result &result);

/**
 * @brief 超时类型：hard-timelimit 表示超过时钟时间被杀死，soft-timelimit 表示超过 CPU 时间，否则为空
 */
const char *get_time_result(const run_result &result);

}  // namespace polyrun
