#pragma once

#include <optional>
#include <string>
#include <variant>
#include "polyrun/engine/concurrency_limiter.hpp"
#include "polyrun/engine/engine_config.hpp"
#include "polyrun/engine/result.hpp"
#include "polyrun/engine/submission.hpp"
#include "polyrun/language/language_registry.hpp"
#include "polyrun/runner/cancellation.hpp"
#include "polyrun/runner/process_runner.hpp"
#include "polyrun/workspace/workspace_manager.hpp"

namespace polyrun {

/**
 * @brief 编译失败，不再运行
 */
struct compile_failure {
    /**
     * @brief COMPILE_ERROR；编译器无法启动时为 INTERNAL_ERROR；编译被取消时为 TIMEOUT
     */
    status stat = status::COMPILE_ERROR;

    /**
     * @brief 编译器的输出或者诊断信息
     */
    std::string diagnostic;

    run_result compile;
};

/**
 * @brief 编译成功（或者不需要编译）并且已经运行
 */
struct run_outcome {
    run_result compile;
    run_result run;
};

using stage_result = std::variant<compile_failure, run_outcome>;

/**
 * @brief 输出比较前的规范化：CRLF 转为 LF，去掉首尾空白字符
 */
std::string normalize_output(const std::string &output);

/**
 * @brief 执行引擎
 * 一次执行的流程：
 * 1. 检查提交是否合法，不合法时直接返回 INVALID_SUBMISSION
 * 2. 查找语言，找不到时直接返回 UNSUPPORTED_LANGUAGE
 * 3. 申请执行许可，超时后返回 REJECTED
 * 4. 创建工作目录，写入源代码和附加文件
 * 5. 若语言需要编译则编译，编译失败时返回 COMPILE_ERROR，不再运行
 * 6. 运行程序
 * 7. 根据 stage_result 生成执行结果
 * 8. 删除工作目录，归还执行许可
 * 任何一步出现意外的异常都会被记录日志，并返回 INTERNAL_ERROR。
 *
 * 语言表、配置在启动时构建，以引用的方式传入，执行引擎不拥有它们。
 * 可以在多个线程中同时调用 execute。
 */
struct executor {
    executor(const language_registry &registry,
             workspace_manager &workspaces,
             process_runner &runner,
             concurrency_limiter &limiter,
             const engine_config &config);

    /**
     * @brief 执行一次提交
     * @param cancel 调用方的取消令牌，被取消时正在运行的进程会被杀死，结果为 TIMEOUT
     * @return 执行结果，不会抛出异常
     */
    execution_result execute(const submission &sub, const cancellation_token *cancel = nullptr);

    /**
     * @brief 按测试点评测
     * 只编译一次，然后以每个测试点的输入各运行一次程序，将规范化后的输出与期望输出比较。
     * 整个评测只占用一个执行许可和一个工作目录。
     * @return 评测报告，不会抛出异常
     */
    test_report execute_tests(const submission &sub, const cancellation_token *cancel = nullptr);

    /**
     * @brief 检查提交是否合法
     * @param reason 不合法时保存原因
     */
    bool validate(const submission &sub, std::string &reason) const;

    /**
     * @brief 提交实际使用的运行限制
     * 在语言默认限制的基础上应用提交的覆盖，再收紧到配置的上限以内
     */
    resource_limits effective_run_limits(const language_spec &spec, const submission &sub) const;

private:
    void prepare(const workspace &ws, const language_spec &spec, const submission &sub);

    /**
     * @brief 编译，语言不需要编译时直接成功
     * @return 编译失败时返回 compile_failure
     */
    std::optional<compile_failure> compile(const workspace &ws, const language_spec &spec,
                                           const resource_limits &run_limits,
                                           const cancellation_token *cancel, run_result &compile_result);

    run_result run(const workspace &ws, const language_spec &spec, const resource_limits &run_limits,
                   const std::optional<std::string> &stdin_data, const cancellation_token *cancel);

    const language_registry &registry;
    workspace_manager &workspaces;
    process_runner &runner;
    concurrency_limiter &limiter;
    const engine_config &config;
};

/**
 * @brief 根据各阶段的结果生成执行结果
 */
execution_result assemble_result(const std::string &id, stage_result &&stage);

}  // namespace polyrun
