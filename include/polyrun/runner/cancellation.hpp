#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace polyrun {

/**
 * @brief 调用方用来中止一次执行的令牌
 * 调用方可以随时 cancel()（比如客户端断开连接），或者设置一个请求级的截止时间。
 * process_runner 在监视子进程时会轮询这个令牌，一旦被取消或者超过截止时间，
 * 就像时钟时间超限一样杀死整个进程组。
 * 令牌可以在多个线程之间共享。
 */
struct cancellation_token {
    using clock = std::chrono::steady_clock;

    void cancel() noexcept;

    bool is_cancelled() const noexcept;

    void set_deadline(clock::time_point deadline) noexcept;

    std::optional<clock::time_point> deadline() const noexcept;

    /**
     * @brief 被取消或者已经超过截止时间
     */
    bool expired(clock::time_point now = clock::now()) const noexcept;

private:
    std::atomic<bool> cancelled{false};
    // 截止时间自 steady_clock 纪元起的纳秒数，0 表示没有截止时间
    std::atomic<int64_t> deadline_ns{0};
};

}  // namespace polyrun
