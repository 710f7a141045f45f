#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "log/log_buffer.h"
#include "log/logger.h"
#include "scheduler/job_chain.h"

using namespace cronhub;
using namespace cronhub::scheduler;

// 日志写到内存里，方便断言
struct Capture {
    std::shared_ptr<core::LogBuffer> buffer = std::make_shared<core::LogBuffer>(100);
    LoggerPtr logger = std::make_shared<Logger>(
        std::vector<std::shared_ptr<core::ILogSink>>{ buffer }, LogLevel::Info);
};

static JobWrapper appendWrapper(std::vector<std::string>& trace, const std::string& name) {
    return [&trace, name](Job job) -> Job {
        return [&trace, name, job]() {
            trace.push_back(name + "-in");
            job();
            trace.push_back(name + "-out");
        };
    };
}

static void test_chain_order() {
    std::vector<std::string> trace;
    Chain chain({appendWrapper(trace, "a"), appendWrapper(trace, "b"), appendWrapper(trace, "c")});
    assert(chain.size() == 3);

    Job wrapped = chain.then([&trace] { trace.push_back("job"); });
    wrapped();

    const std::vector<std::string> expected = {
        "a-in", "b-in", "c-in", "job", "c-out", "b-out", "a-out"};
    assert(trace == expected);

    // 空 chain 原样返回
    int runs = 0;
    Chain empty;
    assert(empty.empty());
    empty.then([&runs] { ++runs; })();
    assert(runs == 1);

    std::cout << "[OK] chain applies first wrapper outermost\n";
}

static void test_recover() {
    Capture cap;
    Job wrapped = Chain{recover(cap.logger)}.then([] { throw std::runtime_error("boom"); });

    // 不会抛出
    wrapped();

    auto panics = cap.buffer->find("panic");
    assert(panics.size() == 1);
    assert(panics[0].level == LogLevel::Error);
    assert(panics[0].error == "boom");
    assert(panics[0].field("stack").rfind("...\n", 0) == 0);

    // 非 std::exception 也能兜住
    Chain{recover(cap.logger)}.then([] { throw 42; })();
    panics = cap.buffer->find("panic");
    assert(panics.size() == 2);
    assert(panics[1].error == "unknown exception");

    // 正常结束不打日志
    int runs = 0;
    Chain{recover(cap.logger)}.then([&runs] { ++runs; })();
    assert(runs == 1);
    assert(cap.buffer->find("panic").size() == 2);

    std::cout << "[OK] recover\n";
}

static void test_skip_if_still_running() {
    Capture cap;
    std::atomic<int> runs{0};
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> releaseF = release.get_future().share();

    Job wrapped = Chain{skipIfStillRunning(cap.logger)}.then([&] {
        if (runs.fetch_add(1) == 0) {
            started.set_value();
            releaseF.wait();
        }
    });

    std::thread first(wrapped);
    started.get_future().wait();

    // 第一次还没结束：直接跳过
    wrapped();
    wrapped();
    assert(runs.load() == 1);
    assert(cap.buffer->find("skip").size() == 2);

    release.set_value();
    first.join();

    // 结束之后可以再次运行
    wrapped();
    assert(runs.load() == 2);

    std::cout << "[OK] skipIfStillRunning\n";
}

static void test_skip_releases_after_exception() {
    Capture cap;
    int runs = 0;
    Job wrapped = Chain{skipIfStillRunning(cap.logger)}.then([&runs] {
        ++runs;
        if (runs == 1) {
            throw std::runtime_error("first run fails");
        }
    });

    bool threw = false;
    try {
        wrapped();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    wrapped();
    assert(runs == 2);
    assert(cap.buffer->find("skip").empty());

    // recover 在外层时异常被记录，skip 的占位同样释放
    int runs2 = 0;
    Job guarded = Chain({recover(cap.logger), skipIfStillRunning(cap.logger)}).then([&runs2] {
        ++runs2;
        throw std::runtime_error("always");
    });
    guarded();
    guarded();
    assert(runs2 == 2);
    assert(cap.buffer->find("panic").size() == 2);

    std::cout << "[OK] skipIfStillRunning releases after exception\n";
}

static void test_skip_is_per_job() {
    Capture cap;
    JobWrapper skip = skipIfStillRunning(cap.logger);

    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> releaseF = release.get_future().share();
    int otherRuns = 0;

    Job slow = skip([&] {
        started.set_value();
        releaseF.wait();
    });
    Job other = skip([&otherRuns] { ++otherRuns; });

    std::thread t(slow);
    started.get_future().wait();

    // 同一个 wrapper 包装的不同 job 互不影响
    other();
    assert(otherRuns == 1);
    assert(cap.buffer->find("skip").empty());

    release.set_value();
    t.join();
    std::cout << "[OK] skip state is per wrapped job\n";
}

static void test_delay_if_still_running() {
    Capture cap;
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> runs{0};

    Job wrapped = Chain{delayIfStillRunning(cap.logger)}.then([&] {
        const int now = active.fetch_add(1) + 1;
        int prev = maxActive.load();
        while (now > prev && !maxActive.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        active.fetch_sub(1);
        runs.fetch_add(1);
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back(wrapped);
    }
    for (auto& t : threads) {
        t.join();
    }

    // 全部运行，但从不并发
    assert(runs.load() == 4);
    assert(maxActive.load() == 1);
    // 等待远小于一分钟，不打 delay 日志
    assert(cap.buffer->find("delay").empty());

    std::cout << "[OK] delayIfStillRunning\n";
}

int main() {
    test_chain_order();
    test_recover();
    test_skip_if_still_running();
    test_skip_releases_after_exception();
    test_skip_is_per_job();
    test_delay_if_still_running();
    std::cout << "All job chain tests passed.\n";
    return 0;
}
