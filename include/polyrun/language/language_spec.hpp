#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "polyrun/runner/limits.hpp"

namespace polyrun {

/**
 * @brief 一种编程语言的编译运行方式
 *
 * 命令模板中可以使用以下占位符：
 * {source}: 源文件名，如 Main.java
 * {workdir}: 工作目录的绝对路径
 * {memoryMb}: 运行内存限制（MiB），用于 -XX:MaxRAM 和 --max-old-space-size
 */
struct language_spec {
    /**
     * @brief 语言的标识符，如 "cpp"
     */
    std::string id;

    /**
     * @brief 语言的别名，如 "c++"
     */
    std::vector<std::string> aliases;

    /**
     * @brief 源文件名，包含扩展名，如 "Main.java"
     */
    std::string source_file;

    /**
     * @brief 编译命令，为空表示解释型语言，不需要编译
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译和运行时额外的环境变量，值中也可以使用占位符
     */
    std::map<std::string, std::string> env;

    resource_limits compile_limits;

    resource_limits run_limits;

    bool has_compile_step() const;
};

/**
 * @brief 编译的默认限制：30s 时钟时间，1 GiB 内存
 */
resource_limits default_compile_limits();

/**
 * @brief 运行的默认限制：10s 时钟时间，10s CPU 时间，256 MiB 内存，1 MiB 输出
 */
resource_limits default_run_limits();

/**
 * @brief 展开命令模板时使用的变量
 */
struct command_context {
    std::string source_file;
    std::filesystem::path work_dir;

    /**
     * @brief 运行内存限制（字节），小于等于 0 表示不限制
     */
    int64_t memory_bytes = -1;
};

/**
 * @brief 替换字符串中的占位符
 */
std::string expand_template(const std::string &tmpl, const command_context &ctx);

std::vector<std::string> expand_command(const std::vector<std::string> &tmpl, const command_context &ctx);

std::map<std::string, std::string> expand_env(const std::map<std::string, std::string> &env, const command_context &ctx);

/**
 * @brief 从 JSON 读取语言设置
 * 命令可以是字符串数组，也可以是一个字符串；字符串会通过 sh -c 执行。
 * 未指定的限制使用 default_compile_limits() 和 default_run_limits()。
 */
void from_json(const nlohmann::json &j, language_spec &spec);
void to_json(nlohmann::json &j, const language_spec &spec);

}  // namespace polyrun
