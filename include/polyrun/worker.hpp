#pragma once

#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <thread>
#include "polyrun/common/concurrent_queue.hpp"
#include "polyrun/engine/executor.hpp"
#include "polyrun/runner/cancellation.hpp"

/**
 * 批量执行相关函数
 * 主线程从标准输入或者提交文件中逐行读取提交（每行一个 JSON），放入任务队列。
 * 每个 worker 从任务队列中取出提交，交给执行引擎执行，再将结果以一行 JSON 的形式输出。
 * 结果按完成的先后顺序输出，调用方可以通过 id 将结果与提交对应起来。
 */
namespace polyrun {

/**
 * @brief 一个待执行的提交
 */
struct batch_job {
    /**
     * @brief 提交在输入中的位置，从 1 开始，用于日志
     */
    size_t seq = 0;

    /**
     * @brief 提交的 JSON 文本
     */
    std::string request;
};

/**
 * @brief 多个 worker 共享的结果输出，每个结果占一行
 */
struct result_writer {
    explicit result_writer(std::ostream &os);

    void write(const nlohmann::json &j);

private:
    std::mutex mut;
    std::ostream &os;
};

/**
 * @brief 停止所有的 worker
 * 调用该函数后，正在运行的程序会被杀死，队列中剩余的提交不再执行而是直接返回 REJECTED。
 * 只修改原子变量，可以在信号处理函数中调用。
 */
void stop_workers();

/**
 * @brief 是否已经调用过 stop_workers
 */
bool workers_stopped();

/**
 * @brief 解析并执行一个提交
 * 提交中带有 tests 时按测试点评测，返回评测报告；否则返回执行结果。
 * JSON 格式不正确时返回 INVALID_SUBMISSION 的执行结果。
 */
nlohmann::json process_job(executor &exec, const batch_job &job, const cancellation_token *cancel);

/**
 * @brief 启动 worker 线程
 * worker 在队列关闭且为空时退出
 * @param worker_id worker 编号，用于日志
 */
std::thread start_worker(size_t worker_id, executor &exec, concurrent_queue<batch_job> &queue, result_writer &writer);

}  // namespace polyrun
