#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "log_sink.h"

namespace cronhub::core {

// 内存里保留最近 N 条记录（log.bufferRecords）。每条分配递增 seq，
// 调用方记住 nextFrom 就能增量拉取；测试里也用它断言 scheduler 打了哪些事件
class LogBuffer : public ILogSink {
public:
    struct QueryResult {
        std::uint64_t nextFrom{0};
        std::vector<LogRecord> records;
    };

    explicit LogBuffer(std::size_t maxRecords = 2000);

    void consume(const LogRecord& rec) override { append(rec); }

    // 返回带 seq 的副本
    LogRecord append(const LogRecord& rec);

    // seq >= fromSeq 的最多 limit 条；已被挤掉的 seq 直接跳过
    QueryResult get(std::uint64_t fromSeq, std::size_t limit) const;

    std::vector<LogRecord> tail(std::size_t n) const;

    // message == msg，且 match 里每个 key=value 都命中
    std::vector<LogRecord> find(const std::string& msg, const LogFields& match = {}) const;

    std::size_t size() const;

    void clear();

    void pruneOlderThan(std::chrono::milliseconds maxAge);

private:
    const std::size_t _maxRecords;
    mutable std::mutex _mu;
    std::deque<LogRecord> _records; // seq 升序
    std::uint64_t _nextSeq{1};
};

} // namespace cronhub::core
