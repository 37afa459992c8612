#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "polyrun/runner/limits.hpp"
#include "polyrun/runner/process_runner.hpp"

namespace polyrun {

/**
 * @brief 执行引擎的配置，在启动时读取一次
 */
struct engine_config {
    /**
     * @brief 工作目录的父目录
     */
    std::filesystem::path run_dir = std::filesystem::temp_directory_path() / "polyrun";

    /**
     * @brief 语言设置文件，为空时只使用内置语言
     */
    std::filesystem::path languages_file;

    /**
     * @brief 最多同时进行的执行数，0 表示使用 CPU 线程数
     */
    size_t max_concurrency = 0;

    /**
     * @brief 没有空闲执行许可时最多等待多久（毫秒）
     */
    int64_t admission_timeout_ms = 200;

    /**
     * @brief 最多同时存在的工作目录数，小于等于 0 表示不限制
     */
    int max_workspaces = -1;

    size_t max_source_bytes = 50000;
    size_t max_stdin_bytes = 10000;
    size_t max_files = 10;

    /**
     * @brief 源代码、标准输入、附加文件的总大小上限
     */
    size_t max_total_bytes = 200000;

    /**
     * @brief 提交覆盖运行限制时不能超过的上限
     */
    resource_limits max_run_limits = default_max_run_limits();

    sandbox_options sandbox;

    /**
     * @brief 运行用户和组的名称或编号，为空表示不切换
     */
    std::string run_user, run_group;

    /**
     * @brief max_concurrency 为 0 时返回 CPU 线程数
     */
    size_t concurrency() const;

    static resource_limits default_max_run_limits();
};

/**
 * @brief 从 JSON 读取配置，JSON 中没有的项保持原值
 */
void from_json(const nlohmann::json &j, engine_config &config);

}  // namespace polyrun
