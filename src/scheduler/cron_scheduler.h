#pragma once

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/blocking_queue.h"
#include "core/wait_group.h"
#include "cron_entry.h"
#include "cron_parser.h"
#include "job_chain.h"
#include "log/logger.h"

namespace cronhub::scheduler {

/// CronScheduler：维护所有 CronEntry，在后台 loop 里按时触发。
///
/// 运行中所有对 entry 集合的修改都经由命令队列交给 loop 处理，
/// 未运行时调用方直接修改。每个到点的 job 在自己的线程里执行。
class CronScheduler {
public:
    struct Options {
        // 计算下次运行时间所用的时区，默认本地时区
        std::optional<core::TimeZone> location;
        // 默认 CronParser::standard()
        ParserPtr parser;
        // 默认 {recover(logger)}
        std::optional<Chain> chain;
        // 默认 Logger::makeDefault()
        LoggerPtr logger;
    };

    CronScheduler();
    explicit CronScheduler(Options options);
    ~CronScheduler();

    CronScheduler(const CronScheduler&) = delete;
    CronScheduler& operator=(const CronScheduler&) = delete;

    /// 用配置的 parser 解析 spec 后注册 job
    /// @throws std::invalid_argument spec 不合法时，此时不会注册任何东西
    EntryId addJob(const std::string& spec, Job job);

    /// 注册一个已构造好的 schedule；运行中立即生效
    EntryId schedule(SchedulePtr schedule, Job job);

    /// 删除一个 entry（不存在则忽略）；已经开始执行的那次不受影响
    void remove(EntryId id);

    /// 当前所有 entry 的拷贝，按 next 升序（未计算 / 永不运行的在最后）
    std::vector<CronEntry> entries() const;

    /// 指定 id 的 entry；找不到时返回 valid() == false 的空 entry
    CronEntry entry(EntryId id) const;

    const core::TimeZone& location() const { return _location; }

    bool running() const;

    /// 启动后台调度线程；已在运行则什么都不做
    void start();

    /// 在调用者线程里运行 loop，直到 stop()；已在运行则立即返回
    void run();

    /// 停止 loop（不会中断正在执行的 job）。多次调用无副作用。
    /// 返回的 future 在所有已派发的 job 结束后就绪
    std::shared_future<void> stop();

private:
    struct Command {
        enum class Type { Add, Remove, Snapshot, Stop };

        Type type{Type::Stop};
        CronEntry entry;                                              // Add
        EntryId id{0};                                                // Remove
        std::shared_ptr<std::promise<std::vector<CronEntry>>> reply;  // Snapshot
    };

    /// 后台主循环
    void loop();

    /// loop() 外壳：标记 loop 活跃状态，记录逃逸的异常，退出前调用 finishLoop()
    void runLoop();

    /// loop 退出时（正常 stop 或异常）：在 _runningMu 下处理队列里剩下的命令并清掉
    /// running 标志，之后调用方回到直接修改 _entries 的路径
    void finishLoop();

    /// schedule->next() 抛异常时记录错误并返回零值，entry 停放到最后
    TimePoint nextActivation(const CronEntry& e, TimePoint now) const;

    void startJob(const Job& job);

    void removeEntry(EntryId id);

    /// 等 loop 退出并回收后台线程
    void waitLoopExit();

    std::string fmt(TimePoint tp) const { return _location.format(tp); }

private:
    core::TimeZone _location;
    ParserPtr _parser;
    Chain _chain;
    LoggerPtr _logger;

    // running 标志，以及未运行时的 _entries，都由它保护
    mutable std::mutex _runningMu;
    bool _running{false};

    // 运行中只有 loop 线程读写
    std::vector<CronEntry> _entries;
    EntryId _nextId{0};

    mutable BlockingQueue<Command> _commands;

    std::thread _worker;

    // loop 是否还在执行；stop() 靠它等 loop 退出。_worker 的 join 也在它下面做
    std::mutex _loopMu;
    std::condition_variable _loopCv;
    bool _loopActive{false};

    // job 线程可能比 CronScheduler 活得久，所以共享所有权
    std::shared_ptr<WaitGroup> _jobWaiter;
};

} // namespace cronhub::scheduler
