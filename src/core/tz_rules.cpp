#include "tz_rules.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace cronhub::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400;

// 公历日期 -> 1970-01-01 起的天数（proleptic Gregorian）
std::int64_t daysFromCivil(std::int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::int64_t yearOfDays(std::int64_t days) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const std::int64_t month = mp < 10 ? mp + 3 : mp - 9;
    return yoe + era * 400 + (month <= 2 ? 1 : 0);
}

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
    return a / b - ((a % b != 0 && (a < 0) != (b < 0)) ? 1 : 0);
}

bool isLeap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(std::int64_t y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeap(y) ? 29 : kDays[m - 1];
}

// 0 = Sunday
int weekday(std::int64_t days) {
    const std::int64_t w = (days + 4) % 7;
    return static_cast<int>(w < 0 ? w + 7 : w);
}

std::invalid_argument badRule(const std::string& text) {
    return std::invalid_argument("invalid POSIX TZ rule \"" + text + "\"");
}

// POSIX TZ 字符串的逐字符读取
class RuleCursor {
public:
    explicit RuleCursor(const std::string& text) : _s(text) {}

    bool done() const { return _i >= _s.size(); }
    char peek() const { return done() ? '\0' : _s[_i]; }
    bool consume(char c) {
        if (peek() != c) return false;
        ++_i;
        return true;
    }

    // <+0330> 或至少 3 个字母
    std::string name() {
        std::string out;
        if (consume('<')) {
            while (!done() && peek() != '>') out += _s[_i++];
            if (!consume('>') || out.empty()) throw badRule(_s);
            return out;
        }
        while (!done() && std::isalpha(static_cast<unsigned char>(peek()))) out += _s[_i++];
        if (out.size() < 3) throw badRule(_s);
        return out;
    }

    int number(int maxValue) {
        if (!std::isdigit(static_cast<unsigned char>(peek()))) throw badRule(_s);
        int v = 0;
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            v = v * 10 + (_s[_i++] - '0');
            if (v > maxValue) throw badRule(_s);
        }
        return v;
    }

    // [+-]hh[:mm[:ss]]，返回带符号的秒数
    std::int32_t clock(int maxHours) {
        int sign = 1;
        if (consume('-')) sign = -1;
        else consume('+');
        std::int32_t secs = number(maxHours) * 3600;
        if (consume(':')) {
            secs += number(59) * 60;
            if (consume(':')) secs += number(59);
        }
        return sign * secs;
    }

    bool offsetFollows() const {
        const char c = peek();
        return c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c));
    }

private:
    const std::string& _s;
    std::size_t _i{0};
};

// 大端读取 TZif
class TzifReader {
public:
    explicit TzifReader(const std::vector<unsigned char>& data) : _d(data) {}

    std::uint8_t u8() {
        need(1);
        return _d[_pos++];
    }

    std::uint32_t be32() {
        need(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i) v = (v << 8) | _d[_pos++];
        return v;
    }

    std::int64_t be64() {
        need(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i) v = (v << 8) | _d[_pos++];
        return static_cast<std::int64_t>(v);
    }

    std::string bytes(std::size_t n) {
        need(n);
        std::string out(_d.begin() + static_cast<std::ptrdiff_t>(_pos),
                        _d.begin() + static_cast<std::ptrdiff_t>(_pos + n));
        _pos += n;
        return out;
    }

    void skip(std::size_t n) {
        need(n);
        _pos += n;
    }

    bool done() const { return _pos >= _d.size(); }

private:
    void need(std::size_t n) const {
        if (_d.size() - _pos < n) {
            throw std::invalid_argument("truncated TZif data");
        }
    }

    const std::vector<unsigned char>& _d;
    std::size_t _pos{0};
};

struct TzifHeader {
    char version{0};
    std::uint32_t isutcnt{0};
    std::uint32_t isstdcnt{0};
    std::uint32_t leapcnt{0};
    std::uint32_t timecnt{0};
    std::uint32_t typecnt{0};
    std::uint32_t charcnt{0};
};

TzifHeader readHeader(TzifReader& in) {
    if (in.bytes(4) != "TZif") {
        throw std::invalid_argument("not a TZif file");
    }
    TzifHeader h;
    h.version = static_cast<char>(in.u8());
    in.skip(15);
    h.isutcnt  = in.be32();
    h.isstdcnt = in.be32();
    h.leapcnt  = in.be32();
    h.timecnt  = in.be32();
    h.typecnt  = in.be32();
    h.charcnt  = in.be32();
    if (h.typecnt == 0) {
        throw std::invalid_argument("TZif data without local time types");
    }
    return h;
}

fs::path zoneInfoDir() {
    if (const char* dir = std::getenv("TZDIR")) {
        if (*dir) return fs::path(dir);
    }
    return fs::path("/usr/share/zoneinfo");
}

} // namespace

PosixTzRule PosixTzRule::parse(const std::string& text) {
    RuleCursor in(text);
    PosixTzRule rule;

    rule._std.abbr = in.name();
    // POSIX 偏移以西为正，与 utcOffset 相反
    rule._std.utcOffset = -in.clock(24);

    if (in.done()) {
        return rule;
    }

    LocalType dst;
    dst.isDst = true;
    dst.abbr = in.name();
    dst.utcOffset = in.offsetFollows() ? -in.clock(24) : rule._std.utcOffset + 3600;
    rule._dst = dst;

    auto parseDate = [&](DateRule& r) {
        if (in.consume('J')) {
            r.kind = DateRule::Kind::Julian;
            r.day = in.number(365);
            if (r.day < 1) throw badRule(text);
        } else if (in.consume('M')) {
            r.kind = DateRule::Kind::MonthWeekDay;
            r.month = in.number(12);
            if (!in.consume('.')) throw badRule(text);
            r.week = in.number(5);
            if (!in.consume('.')) throw badRule(text);
            r.day = in.number(6);
            if (r.month < 1 || r.week < 1) throw badRule(text);
        } else {
            r.kind = DateRule::Kind::ZeroBased;
            r.day = in.number(365);
        }
        if (in.consume('/')) {
            r.secondOfDay = in.clock(167);
        }
    };

    if (in.done()) {
        // 没写切换规则时按美国规则
        rule._start = DateRule{DateRule::Kind::MonthWeekDay, 0, 2, 3, 2 * 3600};
        rule._end   = DateRule{DateRule::Kind::MonthWeekDay, 0, 1, 11, 2 * 3600};
        return rule;
    }

    if (!in.consume(',')) throw badRule(text);
    parseDate(rule._start);
    if (!in.consume(',')) throw badRule(text);
    parseDate(rule._end);
    if (!in.done()) throw badRule(text);
    return rule;
}

std::int64_t PosixTzRule::localTransition(const DateRule& r, int year) {
    std::int64_t day = 0;
    switch (r.kind) {
    case DateRule::Kind::Julian:
        day = daysFromCivil(year, 1, 1) + r.day - 1;
        if (isLeap(year) && r.day >= 60) ++day;
        break;
    case DateRule::Kind::ZeroBased:
        day = daysFromCivil(year, 1, 1) + r.day;
        break;
    case DateRule::Kind::MonthWeekDay: {
        const std::int64_t first = daysFromCivil(year, r.month, 1);
        int offset = (r.day - weekday(first) + 7) % 7 + (r.week - 1) * 7;
        // 第 5 周表示该月最后一个
        while (offset >= daysInMonth(year, r.month)) offset -= 7;
        day = first + offset;
        break;
    }
    }
    return day * kSecondsPerDay + r.secondOfDay;
}

const LocalType& PosixTzRule::lookup(std::int64_t utcSeconds) const {
    if (!_dst) {
        return _std;
    }
    const int year = static_cast<int>(
        yearOfDays(floorDiv(utcSeconds + _std.utcOffset, kSecondsPerDay)));

    // 开始时刻按标准时间给出，结束时刻按夏令时给出
    const std::int64_t start = localTransition(_start, year) - _std.utcOffset;
    const std::int64_t end   = localTransition(_end, year) - _dst->utcOffset;

    bool inDst = false;
    if (start < end) {
        inDst = utcSeconds >= start && utcSeconds < end;
    } else {
        // 南半球：夏令时跨年
        inDst = !(utcSeconds >= end && utcSeconds < start);
    }
    return inDst ? *_dst : _std;
}

std::shared_ptr<const ZoneRules> ZoneRules::fromTzif(const std::vector<unsigned char>& data) {
    TzifReader in(data);
    TzifHeader h = readHeader(in);

    std::size_t timeSize = 4;
    if (h.version >= '2') {
        // v1 数据块只为老读者保留，直接跳过
        in.skip(static_cast<std::size_t>(h.timecnt) * 5 + static_cast<std::size_t>(h.typecnt) * 6
                + h.charcnt + static_cast<std::size_t>(h.leapcnt) * 8 + h.isstdcnt + h.isutcnt);
        h = readHeader(in);
        timeSize = 8;
    }

    auto rules = std::make_shared<ZoneRules>();
    rules->_transitions.reserve(h.timecnt);
    for (std::uint32_t i = 0; i < h.timecnt; ++i) {
        rules->_transitions.push_back(timeSize == 8
            ? in.be64()
            : static_cast<std::int64_t>(static_cast<std::int32_t>(in.be32())));
    }
    rules->_typeIndex.reserve(h.timecnt);
    for (std::uint32_t i = 0; i < h.timecnt; ++i) {
        const std::uint8_t idx = in.u8();
        if (idx >= h.typecnt) {
            throw std::invalid_argument("TZif transition refers to unknown type");
        }
        rules->_typeIndex.push_back(idx);
    }

    std::vector<std::uint8_t> abbrIndex;
    for (std::uint32_t i = 0; i < h.typecnt; ++i) {
        LocalType type;
        type.utcOffset = static_cast<std::int32_t>(in.be32());
        type.isDst = in.u8() != 0;
        abbrIndex.push_back(in.u8());
        rules->_types.push_back(type);
    }
    const std::string chars = in.bytes(h.charcnt);
    for (std::size_t i = 0; i < rules->_types.size(); ++i) {
        if (abbrIndex[i] < chars.size()) {
            rules->_types[i].abbr = chars.c_str() + abbrIndex[i];
        }
    }

    in.skip(static_cast<std::size_t>(h.leapcnt) * (timeSize + 4) + h.isstdcnt + h.isutcnt);

    // 页脚："\n<POSIX TZ>\n"
    if (timeSize == 8 && !in.done() && in.u8() == '\n') {
        std::string footer;
        while (!in.done()) {
            const char c = static_cast<char>(in.u8());
            if (c == '\n') break;
            footer += c;
        }
        if (!footer.empty()) {
            rules->_footer = PosixTzRule::parse(footer);
        }
    }
    return rules;
}

std::shared_ptr<const ZoneRules> ZoneRules::load(const std::string& name) {
    static std::mutex mu;
    static std::map<std::string, std::shared_ptr<const ZoneRules>> cache;

    std::lock_guard<std::mutex> lk(mu);
    auto it = cache.find(name);
    if (it != cache.end()) {
        return it->second;
    }

    const fs::path path = zoneInfoDir() / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::invalid_argument("unknown time zone " + name);
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw std::invalid_argument("unknown time zone " + name);
    }
    const std::vector<unsigned char> data((std::istreambuf_iterator<char>(ifs)),
                                          std::istreambuf_iterator<char>());

    std::shared_ptr<const ZoneRules> rules;
    try {
        rules = fromTzif(data);
    } catch (const std::invalid_argument& ex) {
        throw std::invalid_argument("unknown time zone " + name + ": " + ex.what());
    }
    cache.emplace(name, rules);
    return rules;
}

const LocalType& ZoneRules::lookup(std::int64_t utcSeconds) const {
    if (_transitions.empty() || utcSeconds < _transitions.front()) {
        if (_transitions.empty() && _footer) {
            return _footer->lookup(utcSeconds);
        }
        return _types.front();
    }
    if (utcSeconds >= _transitions.back() && _footer) {
        return _footer->lookup(utcSeconds);
    }
    auto it = std::upper_bound(_transitions.begin(), _transitions.end(), utcSeconds);
    const auto idx = static_cast<std::size_t>(std::distance(_transitions.begin(), it)) - 1;
    return _types[_typeIndex[idx]];
}

std::int64_t ZoneRules::toUtc(std::int64_t localSeconds) const {
    // 先把墙上时间当作 UTC 猜一次偏移，再用猜出的瞬间校正
    const std::int32_t guess = lookup(localSeconds).utcOffset;
    const std::int32_t offset = lookup(localSeconds - guess).utcOffset;
    return localSeconds - offset;
}

} // namespace cronhub::core
