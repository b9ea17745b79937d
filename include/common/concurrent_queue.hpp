#pragma once

#include <mutex>
#include <queue>

namespace autograder {

/**
 * @brief 并发队列，多个工作线程从队列中领取任务
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
        std::lock_guard<std::mutex> guard(mut);
        if (q.empty()) return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    void push(const T &value) {
        std::lock_guard<std::mutex> guard(mut);
        q.push(value);
    }

    bool empty() const {
        std::lock_guard<std::mutex> guard(mut);
        return q.empty();
    }

private:
    std::queue<T> q;
    mutable std::mutex mut;
};

}  // namespace autograder
