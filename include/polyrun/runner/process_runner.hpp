#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "polyrun/common/status.hpp"
#include "polyrun/runner/cancellation.hpp"
#include "polyrun/runner/limits.hpp"

namespace polyrun {

/**
 * @brief 一次进程运行的请求
 */
struct run_request {
    /**
     * @brief 命令及参数，command[0] 会在 PATH 中查找
     */
    std::vector<std::string> command;

    /**
     * @brief 子进程的工作目录，同时作为 HOME 和 TMPDIR
     */
    std::filesystem::path work_dir;

    /**
     * @brief 标准输入的内容，为空时子进程的 stdin 会立即读到 EOF
     */
    std::optional<std::string> stdin_data;

    /**
     * @brief 额外的环境变量，会覆盖默认的 PATH、HOME、TMPDIR
     */
    std::map<std::string, std::string> env;

    resource_limits limits;

    /**
     * @brief 调用方的取消令牌，可以为空
     */
    const cancellation_token *cancel = nullptr;
};

/**
 * @brief 一次进程运行的结果
 */
struct run_result {
    /**
     * @brief 运行状态
     * SUCCESS: 正常退出且返回值为 0
     * RUNTIME_ERROR: 返回值非 0 或者被信号杀死
     * TIMEOUT: 超过时钟时间限制或者被取消
     * RESOURCE_EXCEEDED: 超过内存、CPU 时间或文件大小限制
     * INTERNAL_ERROR: 无法启动进程，error 中记录了原因
     */
    status stat = status::SUCCESS;

    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;

    /**
     * @brief 进程返回值，被信号杀死时为 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief 杀死进程的信号，正常退出时为 nullopt
     */
    std::optional<int> signal;

    int64_t wall_time_ms = 0;
    int64_t cpu_time_ms = 0;

    /**
     * @brief 进程组的内存使用峰值（字节）
     */
    int64_t memory_bytes = 0;

    /**
     * @brief 进程是否因为超时或取消被杀死
     */
    bool timed_out = false;

    /**
     * @brief 对运行结果的描述，如 "Time Limit Exceeded"、"Unable to start command"
     */
    std::string error;
};

/**
 * @brief 进程运行器
 * 负责在受限的环境下运行一个命令，收集输出和资源使用情况。
 * 运行器保证 run 返回时该命令产生的所有进程都已经退出。
 */
struct process_runner {
    virtual ~process_runner();

    /**
     * @brief 运行一个命令并等待其结束
     * 除非无法启动进程，否则所有的失败都会记录在返回值中，而不是抛出异常
     */
    virtual run_result run(const run_request &request) = 0;
};

/**
 * @brief 本地进程运行器的沙箱设置
 */
struct sandbox_options {
    /**
     * @brief 是否使用 cgroup 进行内存限制和统计
     * 不使用 cgroup 时，通过轮询 /proc 统计进程组的常驻内存
     */
    bool use_cgroup = false;

    /**
     * @brief 本进程创建的 cgroup 的父 cgroup
     */
    std::string cgroup_root = "/polyrun";

    /**
     * @brief 运行子进程的用户和组，-1 表示不切换
     */
    int run_uid = -1;
    int run_gid = -1;

    /**
     * @brief 轮询子进程状态的间隔（毫秒）
     */
    int poll_interval_ms = 10;

    /**
     * @brief 是否将子进程放进独立的 mount、network、IPC、UTS 命名空间
     * 子进程只能写入自己的工作目录，其余挂载点都被重新挂载为只读。
     * 没有设置运行用户时还会创建 user 命名空间，因此不需要 root 权限，
     * 但是要求系统允许非特权用户创建 user 命名空间。
     */
    bool isolate = true;
};

/**
 * @brief 通过 fork/exec 在本机运行进程
 * 1. 子进程通过 setsid 进入独立的进程组，以便通过一个信号杀死所有后代进程
 * 2. 子进程通过 rlimit 限制 CPU 时间、文件大小、进程数，并禁止 core dump
 * 3. 父进程通过 poll 同时写入 stdin、读取 stdout/stderr，并轮询子进程状态
 * 4. 超时、被取消或内存超限时，先向进程组发送 SIGTERM，0.1s 后发送 SIGKILL
 * 5. 子进程退出后杀死进程组中残留的所有进程，隔离模式下还会杀死同一个挂载命名空间中的进程
 * 6. 隔离模式下，子进程只能写入工作目录
 * 可以在多个线程中同时调用 run。
 */
struct local_process_runner : public process_runner {
    explicit local_process_runner(const sandbox_options &options = sandbox_options());

    run_result run(const run_request &request) override;

    /**
     * @brief 已经尝试启动的进程数
     */
    int64_t spawn_count() const;

    /**
     * @brief 在 dir 中试运行一个命令，检查当前系统能否建立沙箱
     * 没有开启隔离时总是返回 true
     */
    bool check_isolation(const std::filesystem::path &dir);

private:
    run_result run_process(const run_request &request);

    sandbox_options options;
    std::atomic<int64_t> spawned{0};
};

}  // namespace polyrun
