#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace polyrun {

/**
 * @brief 并发队列，写者读者模型
 * 关闭队列后不再接受新元素，读者取完剩余元素后 pop 返回 false
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素或者队列被关闭
     * @param element 弹出的队头元素
     * @return 若队列已关闭且为空，返回 false
     */
    bool pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty() || closed; });
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     * @return 若队列已关闭，不插入并返回 false
     */
    bool push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return false;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 关闭队列，唤醒所有等待中的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
    bool closed = false;
};

}  // namespace polyrun
