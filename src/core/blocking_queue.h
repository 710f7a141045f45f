#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace cronhub {

// 多生产者 / 单消费者队列，CronScheduler 用它把 add / remove / snapshot / stop
// 投递给 loop 线程。loop 同时在等下一个 entry 到点，所以消费端只有带 deadline 的取法
template<typename T>
class BlockingQueue {
public:
    BlockingQueue() = default;

    BlockingQueue(const BlockingQueue&) = delete;
    BlockingQueue& operator=(const BlockingQueue&) = delete;

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(m_mtx);
            m_items.push_back(std::move(value));
        }
        m_cv.notify_one();
    }

    // 等到有元素或 deadline；超时返回 std::nullopt
    template<typename Clock, typename Duration>
    std::optional<T> popUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::mutex> lock(m_mtx);
        if (!m_cv.wait_until(lock, deadline, [this] { return !m_items.empty(); })) {
            return std::nullopt;
        }
        return frontLocked();
    }

    // 不等待；loop 退出时用它处理残留命令
    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mtx);
        return frontLocked();
    }

private:
    std::optional<T> frontLocked() {
        if (m_items.empty()) {
            return std::nullopt;
        }
        std::optional<T> out(std::move(m_items.front()));
        m_items.pop_front();
        return out;
    }

    std::mutex m_mtx;
    std::condition_variable m_cv;
    std::deque<T> m_items;
};

} // namespace cronhub
