#pragma once

#include <sys/types.h>
#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace polyrun {

struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(const std::string &cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 *
 * 我们只用到了以下两个 controller：
 * 1. cpuacct - 自动生成 cgroup 中任务占用 CPU 资源的报告
 * 2. memory - 对 cgroup 中的任务可用内存做出限制，并且自动生成任务占用内存资源报告
 *
 * https://access.redhat.com/documentation/zh-cn/red_hat_enterprise_linux/7/html/resource_management_guide/ch-subsystems_and_tunable_parameters
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup
     * cgroup_guard 在创建时只会记录 cgroup 的信息，而不会对内核中存储的 cgroup
     * 进行修改。通过 create_cgroup 能真正在内核中创建这个 cgroup。
     * 这里将 add_controller 函数、add_value 函数添加的数据也写入内核中。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得指定的 controller
     * 必须是 add_controller 已添加过的或者根据 get_cgroup 从内核中获得的已有的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息。
     */
    void get_cgroup();

    /**
     * @brief 将指定进程移入本 cgroup
     */
    void attach_task_pid(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup。
     * 所有的进程都会被移入上一层的 cgroup。
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 一次运行使用的 cgroup
 * 构造时在内核中创建带内存限制的 cgroup，析构时杀死其中残留的所有进程并删除 cgroup
 */
struct job_cgroup {
    /**
     * @param name cgroup 名称，如 /polyrun/job_xxx
     * @param memory_limit 内存限制（字节），小于 0 表示不限制
     */
    job_cgroup(const std::string &name, int64_t memory_limit);

    ~job_cgroup();

    job_cgroup(const job_cgroup &) = delete;
    job_cgroup &operator=(const job_cgroup &) = delete;

    void attach(pid_t pid);

    /**
     * @brief 杀死 cgroup 内的所有进程
     */
    void kill_all();

    /**
     * @brief cgroup 内所有进程的内存使用峰值（字节）
     */
    int64_t max_memory_usage();

    /**
     * @brief cgroup 内所有进程使用的 CPU 时间（纳秒）
     */
    int64_t cpu_usage_ns();

    /**
     * @brief 是否触发过内核 OOM killer
     */
    bool is_oom() const;

private:
    std::string name;
};

}  // namespace polyrun
