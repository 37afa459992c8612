#pragma once

#include <functional>

#define POLYRUN_DEFER_1(x, y) x##y
#define POLYRUN_DEFER_2(x, y) POLYRUN_DEFER_1(x, y)
#define POLYRUN_DEFER_0(x) POLYRUN_DEFER_2(x, __COUNTER__)
#define defer auto POLYRUN_DEFER_0(_defered_option) = ::polyrun::scoped_guard() + [&]

namespace polyrun {

/**
 * @brief 在作用域结束时执行回调
 * 析构时回调抛出的异常会被吞掉并记录日志，避免在栈展开期间终止程序
 */
struct scoped_guard {
    scoped_guard();
    explicit scoped_guard(std::function<void()> f);
    scoped_guard(scoped_guard &&other) noexcept;
    scoped_guard(const scoped_guard &) = delete;
    scoped_guard &operator=(const scoped_guard &) = delete;
    ~scoped_guard();

    /**
     * @brief 取消回调，之后析构时不再执行
     */
    void dismiss();

    scoped_guard operator+(std::function<void()> f) const;

private:
    std::function<void()> f;
};

}  // namespace polyrun
