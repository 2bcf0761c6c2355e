#pragma once

#include <condition_variable>
#include <deque>
#include <limits>
#include <mutex>

namespace validator {

/**
 * @brief 有界并发队列，写者读者模型
 * 队列满时 try_push 失败，由调用方决定重试还是拒绝
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    explicit concurrent_queue(size_t capacity = std::numeric_limits<size_t>::max())
        : capacity(capacity) {}

    /**
     * @brief 尝试从队列中弹出队头元素，如果队列为空返回 false
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否成功弹出队列头元素
     */
    bool try_pop(T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.empty()) return false;
        element = q.front();
        q.pop_front();
        return true;
    }

    /**
     * @brief 从队列中弹出队头元素，如果队列为空则阻塞等待直到有元素为止
     * @return 队列头元素
     */
    T pop() {
        std::unique_lock<std::mutex> mlock(mut);
        while (q.empty()) cond.wait(mlock);
        auto result = q.front();
        q.pop_front();
        return result;
    }

    /**
     * @brief 尝试向队尾插入一个新元素
     * @return 若队列已满则返回 false，元素没有入队
     */
    bool try_push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        if (q.size() >= capacity) return false;
        q.push_back(value);
        mlock.unlock();
        cond.notify_one();
        return true;
    }

    /**
     * @brief 移除第一个满足条件的元素，其余元素的顺序不变
     * @param pred 判断元素是否需要移除
     * @param element 如果找到，保存被移除的元素
     * @return 是否移除了元素
     */
    template <typename Pred>
    bool remove_if(Pred pred, T &element) {
        std::unique_lock<std::mutex> mlock(mut);
        for (auto it = q.begin(); it != q.end(); ++it) {
            if (pred(*it)) {
                element = *it;
                q.erase(it);
                return true;
            }
        }
        return false;
    }

    size_t size() const {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::deque<T> q;
    size_t capacity;
    mutable std::mutex mut;
    std::condition_variable cond;
};

}  // namespace validator
