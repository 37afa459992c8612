#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace polyrun {

/**
 * @brief 表示一次执行的终止状态
 * 每个执行结果有且只有一个状态
 */
enum class status {
    /**
     * @brief 程序正常退出（退出码为 0），且没有触发任何限制
     */
    SUCCESS = 0,

    /**
     * @brief 编译失败
     * 编译器返回非零、超时或超出资源限制，此时不会运行程序
     */
    COMPILE_ERROR = 1,

    /**
     * @brief 程序以非零退出码退出，或者因为信号崩溃
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 程序运行的时钟时间超出限制，或者调用方取消了执行
     * 整个进程组会被杀死
     */
    TIMEOUT = 3,

    /**
     * @brief 程序的内存或 CPU 时间超出限制
     * 若同时返回了非零退出码，以资源超限为准
     */
    RESOURCE_EXCEEDED = 4,

    /**
     * @brief 执行引擎内部错误
     * 比如 fork 失败、编译器不存在、文件系统异常
     */
    INTERNAL_ERROR = 5,

    /**
     * @brief 提交不合法（源代码为空、未指定语言、文件过大等）
     * 不会创建工作目录，也不会启动任何进程
     */
    INVALID_SUBMISSION = 6,

    /**
     * @brief 提交使用了未注册的语言
     */
    UNSUPPORTED_LANGUAGE = 7,

    /**
     * @brief 无法创建工作目录（磁盘、inode 耗尽或工作目录数量达到上限）
     */
    RESOURCE_EXHAUSTED = 8,

    /**
     * @brief 准入控制拒绝了本次执行，表示服务繁忙
     */
    REJECTED = 9
};

/**
 * @brief 状态的机器可读名称，比如 "Timeout"
 */
const char *get_status_name(status);

/**
 * @brief 状态的显示文本，比如 "Time Limit Exceeded"
 */
const char *get_display_message(status);

/**
 * @brief 根据机器可读名称查找状态
 * @throw std::invalid_argument 名称不存在时
 */
status parse_status(const std::string &name);

void to_json(nlohmann::json &j, const status &stat);

void from_json(const nlohmann::json &j, status &stat);

}  // namespace polyrun
