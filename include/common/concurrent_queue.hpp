#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace runner {

/**
 * @brief 并发队列，写者读者模型
 * 写者在数据源结束后调用 close，此后读者取完剩余元素后 pop 返回空
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
     * @return 队列头元素，队列已关闭且为空时返回 std::nullopt
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty() && !closed) cond.wait(mlock);
        if (q.empty()) return std::nullopt;
        std::optional<T> result(std::move(q.front()));
        q.pop();
        return result;
    }

    /**
     * @brief 向队列中插入一个新元素，队列关闭之后插入的元素将被丢弃
     */
    void push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (closed) return;
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
    }

    /**
     * @brief 标记数据源已经结束，唤醒所有等待的读者
     */
    void close() {
        std::unique_lock<std::mutex> mlock(mut);
        closed = true;
        mlock.unlock();
        cond.notify_all();
    }

    bool is_closed() const {
        std::unique_lock<std::mutex> mlock(mut);
        return closed;
    }

private:
    std::queue<T> q;
    bool closed = false;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace runner
