#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "polyrun/common/status.hpp"

namespace polyrun {

/**
 * @brief 一次执行的结果
 * 不论执行是否成功，调用方总是得到一个完整的结果
 */
struct execution_result {
    /**
     * @brief 提交的编号
     */
    std::string id;

    status stat = status::INTERNAL_ERROR;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 运行的返回值，没有运行时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 杀死程序的信号，没有被信号杀死时为 -1
     */
    int signal = -1;

    /**
     * @brief 编译和运行的总时钟时间（毫秒）
     */
    int64_t duration_ms = 0;

    int64_t cpu_time_ms = 0;

    /**
     * @brief 运行时的内存使用峰值（字节）
     */
    int64_t memory_bytes = 0;

    bool timed_out = false;

    /**
     * @brief 编译器的输出，只有编译错误时存在
     */
    std::optional<std::string> compile_error;

    /**
     * @brief 非成功状态的诊断信息
     */
    std::string message;
};

void to_json(nlohmann::json &j, const execution_result &result);

/**
 * @brief 一个测试点的判定
 */
enum class test_outcome {
    PASS,
    FAIL,
    ERROR
};

const char *get_outcome_name(test_outcome outcome);

/**
 * @brief 执行状态对应的总评测结果名称
 * SUCCESS 为 "Accepted"，TIMEOUT 为 "TimeLimitExceeded"，其余与 get_status_name 相同
 */
std::string get_verdict_name(status stat);

struct test_case_result {
    std::string name;
    test_outcome outcome = test_outcome::ERROR;
    execution_result execution;
    std::string expected_output;
};

/**
 * @brief 按测试点评测的报告
 */
struct test_report {
    std::string id;

    /**
     * @brief 总评测结果
     * 全部通过时为 Accepted；第一个没有通过的测试点输出不符时为 WrongAnswer，
     * 执行出错时由 get_verdict_name 根据其状态给出，如 TimeLimitExceeded
     */
    std::string verdict;

    std::vector<test_case_result> results;

    size_t passed = 0;
    size_t total = 0;

    int64_t duration_ms = 0;

    std::optional<std::string> compile_error;

    std::string message;
};

void to_json(nlohmann::json &j, const test_case_result &result);

void to_json(nlohmann::json &j, const test_report &report);

}  // namespace polyrun
