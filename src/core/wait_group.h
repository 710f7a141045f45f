#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace cronhub {

// 计数器：dispatch 时 add(1)，job 结束时 done()，wait() 阻塞到计数归零
class WaitGroup {
public:
    WaitGroup() = default;

    WaitGroup(const WaitGroup&) = delete;
    WaitGroup& operator=(const WaitGroup&) = delete;

    void add(std::size_t n = 1) {
        std::lock_guard<std::mutex> lk(_mu);
        _count += n;
    }

    void done() {
        bool drained = false;
        {
            std::lock_guard<std::mutex> lk(_mu);
            if (_count > 0) {
                --_count;
            }
            drained = (_count == 0);
        }
        if (drained) {
            _cv.notify_all();
        }
    }

    void wait() {
        std::unique_lock<std::mutex> lk(_mu);
        _cv.wait(lk, [this] { return _count == 0; });
    }

private:
    std::mutex _mu;
    std::condition_variable _cv;
    std::size_t _count{0};
};

} // namespace cronhub
