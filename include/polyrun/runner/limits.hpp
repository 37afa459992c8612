#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>

namespace polyrun {

/**
 * @brief 一次进程运行的资源限制
 * 所有数值小于 0 表示不限制
 */
struct resource_limits {
    /**
     * @brief 时钟时间限制（毫秒）
     * 超时后整个进程组会被杀死，结果为 TIMEOUT
     */
    int64_t timeout_ms = 10000;

    /**
     * @brief CPU 时间限制（毫秒），通过 RLIMIT_CPU 实现，精度为秒
     */
    int64_t cpu_time_ms = -1;

    /**
     * @brief 内存限制（字节），统计整个进程组的常驻内存
     */
    int64_t memory_bytes = -1;

    /**
     * @brief stdout、stderr 各自最多保留多少字节，超出部分直接丢弃
     */
    int64_t max_output_bytes = -1;

    /**
     * @brief 程序能创建的最大文件大小（字节），通过 RLIMIT_FSIZE 实现
     */
    int64_t file_size_bytes = -1;

    /**
     * @brief 最多同时存在的进程数，通过 RLIMIT_NPROC 实现
     * 注意 RLIMIT_NPROC 按用户统计，只应在配置了独立运行用户时使用
     */
    int proc_limit = -1;

    /**
     * @brief 将每一项限制收紧到 ceiling 以内
     * ceiling 中不限制的项保持不变
     */
    resource_limits clamp(const resource_limits &ceiling) const;
};

/**
 * @brief 提交中对默认运行限制的部分覆盖
 */
struct limits_override {
    std::optional<int64_t> timeout_ms;
    std::optional<int64_t> cpu_time_ms;
    std::optional<int64_t> memory_bytes;
    std::optional<int64_t> max_output_bytes;
    std::optional<int64_t> file_size_bytes;
    std::optional<int> proc_limit;

    /**
     * @brief 用已设置的项覆盖 base
     */
    resource_limits apply(const resource_limits &base) const;

    /**
     * @brief 是否所有已设置的项都为正数
     */
    bool is_valid() const;
};

void from_json(const nlohmann::json &j, resource_limits &limits);
void to_json(nlohmann::json &j, const resource_limits &limits);

void from_json(const nlohmann::json &j, limits_override &limits);

}  // namespace polyrun
