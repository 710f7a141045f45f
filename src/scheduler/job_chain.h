#pragma once
#include <functional>
#include <initializer_list>
#include <vector>
#include "cron_entry.h"
#include "log/logger.h"

namespace cronhub::scheduler {

/// Decorates a job with extra behavior (overlap policy, fault capture ...).
using JobWrapper = std::function<Job(Job)>;

/// Sequence of JobWrappers applied to every job the scheduler runs.
///
///   Chain({a, b, c}).then(job) == a(b(c(job)))
///
/// The first wrapper is the outermost one.
class Chain {
public:
    Chain() = default;
    explicit Chain(std::vector<JobWrapper> wrappers);
    Chain(std::initializer_list<JobWrapper> wrappers);

    Job then(Job job) const;

    std::size_t size() const { return _wrappers.size(); }
    bool empty() const { return _wrappers.empty(); }

private:
    std::vector<JobWrapper> _wrappers;
};

// job 抛出的异常被捕获，连同调用栈写入 logger->error，不再向外传播
JobWrapper recover(LoggerPtr logger);

// 同一个被包装 job 的多次调用串行执行：上一次没结束，这一次等着。
// 等待超过一分钟时记一条 info 日志
JobWrapper delayIfStillRunning(LoggerPtr logger);

// 同一个被包装 job 上一次还在运行时，这一次直接跳过并记一条 info 日志
JobWrapper skipIfStillRunning(LoggerPtr logger);

} // namespace cronhub::scheduler
