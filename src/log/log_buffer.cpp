#include "log_buffer.h"
#include <algorithm>
#include <iterator>

namespace cronhub::core {

LogBuffer::LogBuffer(std::size_t maxRecords)
    : _maxRecords(std::max<std::size_t>(maxRecords, 1))
{
}

LogRecord LogBuffer::append(const LogRecord& rec) {
    std::lock_guard<std::mutex> lk(_mu);
    if (_records.size() == _maxRecords) {
        _records.pop_front();
    }
    _records.push_back(rec);
    _records.back().seq = _nextSeq++;
    return _records.back();
}

LogBuffer::QueryResult LogBuffer::get(std::uint64_t fromSeq, std::size_t limit) const {
    QueryResult out;
    out.nextFrom = fromSeq;

    std::lock_guard<std::mutex> lk(_mu);
    auto first = std::lower_bound(_records.begin(), _records.end(), fromSeq,
                                  [](const LogRecord& r, std::uint64_t seq) { return r.seq < seq; });
    const auto avail = static_cast<std::size_t>(std::distance(first, _records.end()));
    const auto last = std::next(first, static_cast<std::ptrdiff_t>(std::min(limit, avail)));

    out.records.assign(first, last);
    if (!out.records.empty()) {
        out.nextFrom = out.records.back().seq + 1;
    }
    return out;
}

std::vector<LogRecord> LogBuffer::tail(std::size_t n) const {
    std::lock_guard<std::mutex> lk(_mu);
    const std::size_t take = std::min(n, _records.size());
    return std::vector<LogRecord>(_records.end() - static_cast<std::ptrdiff_t>(take), _records.end());
}

std::vector<LogRecord> LogBuffer::find(const std::string& msg, const LogFields& match) const {
    std::vector<LogRecord> out;
    std::lock_guard<std::mutex> lk(_mu);
    std::copy_if(_records.begin(), _records.end(), std::back_inserter(out),
                 [&](const LogRecord& r) {
                     if (r.message != msg) return false;
                     return std::all_of(match.begin(), match.end(), [&r](const auto& kv) {
                         return r.field(kv.first) == kv.second;
                     });
                 });
    return out;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lk(_mu);
    return _records.size();
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lk(_mu);
    _records.clear();
}

void LogBuffer::pruneOlderThan(std::chrono::milliseconds maxAge) {
    const auto cutoff = std::chrono::system_clock::now() - maxAge;
    std::lock_guard<std::mutex> lk(_mu);
    // 按追加顺序近似按时间排列，从头删到第一条够新的
    while (!_records.empty() && _records.front().ts < cutoff) {
        _records.pop_front();
    }
}

} // namespace cronhub::core
