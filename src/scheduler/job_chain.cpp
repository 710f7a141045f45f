#include "job_chain.h"
#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <sstream>
#include <boost/stacktrace.hpp>
#include "core/utils.h"

namespace cronhub::scheduler {

namespace {

// 调用栈最多记录的帧数
constexpr std::size_t kMaxStackFrames = 64;

std::string captureStack() {
    std::ostringstream oss;
    // 跳过 captureStack 自己这一帧
    oss << boost::stacktrace::stacktrace(1, kMaxStackFrames);
    return oss.str();
}

} // namespace

Chain::Chain(std::vector<JobWrapper> wrappers)
    : _wrappers(std::move(wrappers))
{
}

Chain::Chain(std::initializer_list<JobWrapper> wrappers)
    : _wrappers(wrappers)
{
}

Job Chain::then(Job job) const {
    // 从最后一个开始包，第一个在最外层
    for (auto it = _wrappers.rbegin(); it != _wrappers.rend(); ++it) {
        job = (*it)(std::move(job));
    }
    return job;
}

JobWrapper recover(LoggerPtr logger) {
    return [logger](Job job) -> Job {
        return [logger, job = std::move(job)]() {
            std::string err;
            try {
                job();
                return;
            } catch (const std::exception& ex) {
                err = ex.what();
            } catch (...) {
                err = "unknown exception";
            }
            logger->error(err, "panic", {{"stack", "...\n" + captureStack()}});
        };
    };
}

JobWrapper delayIfStillRunning(LoggerPtr logger) {
    return [logger](Job job) -> Job {
        auto mu = std::make_shared<std::mutex>();
        return [logger, mu, job = std::move(job)]() {
            const auto start = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> lk(*mu);
            const auto waited = std::chrono::steady_clock::now() - start;
            if (waited > std::chrono::minutes(1)) {
                logger->info("delay", {{"duration", utils::formatDuration(
                    std::chrono::duration_cast<std::chrono::nanoseconds>(waited))}});
            }
            job();
        };
    };
}

JobWrapper skipIfStillRunning(LoggerPtr logger) {
    return [logger](Job job) -> Job {
        auto running = std::make_shared<std::atomic_bool>(false);
        return [logger, running, job = std::move(job)]() {
            if (running->exchange(true)) {
                logger->info("skip");
                return;
            }
            try {
                job();
            } catch (...) {
                running->store(false);
                throw;
            }
            running->store(false);
        };
    };
}

} // namespace cronhub::scheduler
