#include "cron_scheduler.h"
#include <algorithm>
#include <chrono>
#include <exception>
#include <system_error>

namespace cronhub::scheduler {

namespace {

// 没有任何可运行 entry 时 loop 的等待时长；新命令会提前唤醒它
constexpr std::chrono::hours kIdleWait{100000};

// next 升序，零值排最后；相同 next 保持原有顺序
void sortEntries(std::vector<CronEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(),
                     [](const CronEntry& a, const CronEntry& b) {
                         if (isZero(a.next)) return false;
                         if (isZero(b.next)) return true;
                         return a.next < b.next;
                     });
}

} // namespace

CronScheduler::CronScheduler()
    : CronScheduler(Options{})
{
}

CronScheduler::CronScheduler(Options options)
    : _location(options.location ? *options.location : core::TimeZone::local())
    , _parser(options.parser ? options.parser : CronParser::standard())
    , _logger(options.logger ? options.logger : Logger::makeDefault())
    , _jobWaiter(std::make_shared<WaitGroup>())
{
    _chain = options.chain ? *options.chain : Chain{recover(_logger)};
}

CronScheduler::~CronScheduler()
{
    stop();
}

EntryId CronScheduler::addJob(const std::string& spec, Job job)
{
    SchedulePtr parsed = _parser->parse(spec);
    return schedule(std::move(parsed), std::move(job));
}

EntryId CronScheduler::schedule(SchedulePtr schedule, Job job)
{
    std::lock_guard<std::mutex> lk(_runningMu);

    CronEntry entry;
    entry.id = ++_nextId;
    entry.schedule = std::move(schedule);
    entry.wrappedJob = _chain.then(job);
    entry.job = std::move(job);

    const EntryId id = entry.id;
    if (!_running) {
        _entries.push_back(std::move(entry));
    } else {
        Command cmd;
        cmd.type = Command::Type::Add;
        cmd.entry = std::move(entry);
        _commands.push(std::move(cmd));
    }
    return id;
}

void CronScheduler::remove(EntryId id)
{
    std::lock_guard<std::mutex> lk(_runningMu);
    if (_running) {
        Command cmd;
        cmd.type = Command::Type::Remove;
        cmd.id = id;
        _commands.push(std::move(cmd));
    } else {
        removeEntry(id);
    }
}

std::vector<CronEntry> CronScheduler::entries() const
{
    std::future<std::vector<CronEntry>> fut;
    {
        std::lock_guard<std::mutex> lk(_runningMu);
        if (!_running) {
            return _entries;
        }

        // 运行中只能让 loop 自己拷贝；等回复时不占着锁
        auto reply = std::make_shared<std::promise<std::vector<CronEntry>>>();
        fut = reply->get_future();
        Command cmd;
        cmd.type = Command::Type::Snapshot;
        cmd.reply = reply;
        _commands.push(std::move(cmd));
    }
    return fut.get();
}

CronEntry CronScheduler::entry(EntryId id) const
{
    for (auto& e : entries()) {
        if (e.id == id) {
            return e;
        }
    }
    return CronEntry{};
}

bool CronScheduler::running() const
{
    std::lock_guard<std::mutex> lk(_runningMu);
    return _running;
}

void CronScheduler::start()
{
    std::lock_guard<std::mutex> lk(_runningMu);
    if (_running) {
        return;
    }
    _running = true;
    {
        // 上一次的 loop 线程可能异常退出后还没人回收
        std::unique_lock<std::mutex> lk2(_loopMu);
        _loopCv.wait(lk2, [this] { return !_loopActive; });
        if (_worker.joinable()) {
            _worker.join();
        }
        _loopActive = true;
    }
    _worker = std::thread([this] { runLoop(); });
}

void CronScheduler::run()
{
    {
        std::lock_guard<std::mutex> lk(_runningMu);
        if (_running) {
            return;
        }
        _running = true;
        std::lock_guard<std::mutex> lk2(_loopMu);
        _loopActive = true;
    }
    runLoop();
}

std::shared_future<void> CronScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lk(_runningMu);
        if (_running) {
            Command cmd;
            cmd.type = Command::Type::Stop;
            _commands.push(std::move(cmd));
        }
    }
    // 等 loop 真正退出，之后 _entries 重新归调用方直接访问
    waitLoopExit();

    auto done = std::make_shared<std::promise<void>>();
    std::shared_future<void> fut = done->get_future().share();
    auto waiter = _jobWaiter;
    try {
        std::thread([waiter, done] {
            waiter->wait();
            done->set_value();
        }).detach();
    } catch (const std::system_error& ex) {
        _logger->error(ex.what(), "failed to start stop waiter, waiting inline");
        waiter->wait();
        done->set_value();
    }
    return fut;
}

void CronScheduler::waitLoopExit()
{
    std::unique_lock<std::mutex> lk(_loopMu);
    _loopCv.wait(lk, [this] { return !_loopActive; });
    // job 里调用 stop() 时不能 join 自己
    if (_worker.joinable() && _worker.get_id() != std::this_thread::get_id()) {
        _worker.join();
    }
}

void CronScheduler::runLoop()
{
    try {
        loop();
    } catch (const std::exception& ex) {
        _logger->error(ex.what(), "scheduler loop aborted");
    }
    finishLoop();

    {
        std::lock_guard<std::mutex> lk(_loopMu);
        _loopActive = false;
    }
    _loopCv.notify_all();
}

void CronScheduler::finishLoop()
{
    std::lock_guard<std::mutex> lk(_runningMu);
    // 拿着锁时不会再有新命令进队列；剩下的在这里直接生效
    while (std::optional<Command> cmd = _commands.tryPop()) {
        switch (cmd->type) {
        case Command::Type::Add:
            // next 留空，下次 start() 时再算
            _entries.push_back(std::move(cmd->entry));
            break;
        case Command::Type::Remove:
            removeEntry(cmd->id);
            break;
        case Command::Type::Snapshot:
            cmd->reply->set_value(_entries);
            break;
        case Command::Type::Stop:
            break;
        }
    }
    _running = false;
}

TimePoint CronScheduler::nextActivation(const CronEntry& e, TimePoint now) const
{
    try {
        return e.schedule->next(now, _location);
    } catch (const std::exception& ex) {
        _logger->error(ex.what(), "schedule failed, entry parked", {{"entry", std::to_string(e.id)}});
    } catch (...) {
        _logger->error("unknown exception", "schedule failed, entry parked", {{"entry", std::to_string(e.id)}});
    }
    return TimePoint{};
}

void CronScheduler::loop()
{
    _logger->info("start");

    // 启动时统一计算每个 entry 的下一次运行时间
    TimePoint now = Clock::now();
    for (auto& e : _entries) {
        e.next = nextActivation(e, now);
        _logger->info("schedule", {{"now", fmt(now)},
                                   {"entry", std::to_string(e.id)},
                                   {"next", fmt(e.next)}});
    }

    while (true) {
        sortEntries(_entries);

        // 最近的 entry 决定等待多久；没有可运行的 entry 就等很久
        std::chrono::steady_clock::time_point deadline;
        if (_entries.empty() || isZero(_entries.front().next)) {
            deadline = std::chrono::steady_clock::now() + kIdleWait;
        } else {
            const auto wait = _entries.front().next - Clock::now();
            deadline = std::chrono::steady_clock::now()
                     + std::chrono::duration_cast<std::chrono::steady_clock::duration>(wait);
        }

        // 快照请求不影响定时器，其余事件都回到外层重新排序
        bool rescan = false;
        while (!rescan) {
            std::optional<Command> cmd = _commands.popUntil(deadline);

            if (!cmd) {
                now = Clock::now();
                _logger->info("wake", {{"now", fmt(now)}});

                for (auto& e : _entries) {
                    if (e.next > now || isZero(e.next)) {
                        break;
                    }
                    startJob(e.wrappedJob);
                    e.prev = e.next;
                    e.next = nextActivation(e, now);
                    _logger->info("run", {{"now", fmt(now)},
                                          {"entry", std::to_string(e.id)},
                                          {"next", fmt(e.next)}});
                }
                rescan = true;
                continue;
            }

            switch (cmd->type) {
            case Command::Type::Add: {
                now = Clock::now();
                CronEntry& added = cmd->entry;
                added.next = nextActivation(added, now);
                _logger->info("added", {{"now", fmt(now)},
                                        {"entry", std::to_string(added.id)},
                                        {"next", fmt(added.next)}});
                _entries.push_back(std::move(added));
                rescan = true;
                break;
            }
            case Command::Type::Remove:
                removeEntry(cmd->id);
                _logger->info("removed", {{"entry", std::to_string(cmd->id)}});
                rescan = true;
                break;
            case Command::Type::Snapshot:
                cmd->reply->set_value(_entries);
                break;
            case Command::Type::Stop:
                _logger->info("stop");
                return;
            }
        }
    }
}

void CronScheduler::startJob(const Job& job)
{
    _jobWaiter->add(1);

    auto waiter = _jobWaiter;
    auto logger = _logger;
    try {
        std::thread([waiter, logger, job] {
            // 正常情况下 recover 已经兜住；没配 recover 时在这里记录
            try {
                job();
            } catch (const std::exception& ex) {
                logger->error(ex.what(), "job failed");
            } catch (...) {
                logger->error("unknown exception", "job failed");
            }
            waiter->done();
        }).detach();
    } catch (const std::system_error& ex) {
        waiter->done();
        _logger->error(ex.what(), "failed to start job thread");
    }
}

void CronScheduler::removeEntry(EntryId id)
{
    _entries.erase(std::remove_if(_entries.begin(), _entries.end(),
                                  [id](const CronEntry& e) { return e.id == id; }),
                   _entries.end());
}

} // namespace cronhub::scheduler
