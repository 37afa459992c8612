#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace polyrun {

struct concurrency_limiter;

/**
 * @brief 执行许可，析构时归还给 concurrency_limiter
 * 只能移动不能复制
 */
struct admission_token {
    admission_token(admission_token &&other) noexcept;
    admission_token &operator=(admission_token &&other) noexcept;
    admission_token(const admission_token &) = delete;
    admission_token &operator=(const admission_token &) = delete;
    ~admission_token();

    /**
     * @brief 提前归还许可
     */
    void release();

private:
    friend struct concurrency_limiter;
    explicit admission_token(concurrency_limiter *limiter);

    concurrency_limiter *limiter;
};

/**
 * @brief 限制同时进行的执行数量的计数信号量
 * 超过上限的请求最多等待一个较短的时间，超时后被拒绝，而不是无限排队
 */
struct concurrency_limiter {
    /**
     * @param max_concurrency 最多同时进行的执行数，至少为 1
     */
    explicit concurrency_limiter(size_t max_concurrency);

    /**
     * @brief 申请一个许可
     * @param timeout 没有空闲许可时最多等待多久
     * @return 超时仍没有空闲许可时返回 nullopt
     */
    std::optional<admission_token> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief 正在使用的许可数
     */
    size_t in_use() const;

    size_t capacity() const;

private:
    friend struct admission_token;
    void release();

    const size_t max_concurrency;
    size_t used = 0;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace polyrun
