#include "time_zone.h"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "tz_rules.h"

namespace cronhub::core {

namespace {

std::time_t toTimeT(TimePoint tp) {
    const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    return static_cast<std::time_t>(secs.time_since_epoch().count());
}

TimePoint fromTimeT(std::time_t t) {
    return TimePoint(std::chrono::seconds(t));
}

} // namespace

TimeZone::TimeZone(Kind kind, std::string name, std::shared_ptr<const ZoneRules> rules)
    : _kind(kind)
    , _name(std::move(name))
    , _rules(std::move(rules))
{
}

TimeZone TimeZone::local() {
    return TimeZone(Kind::Local, "Local");
}

TimeZone TimeZone::utc() {
    return TimeZone(Kind::Utc, "UTC");
}

TimeZone TimeZone::load(const std::string& name) {
    if (name.empty() || name == "UTC") {
        return utc();
    }
    if (name == "Local") {
        return local();
    }
    if (name.find("..") != std::string::npos || name[0] == '/' || name[0] == '\\') {
        throw std::invalid_argument("invalid time zone name " + name);
    }
    return TimeZone(Kind::Named, name, ZoneRules::load(name));
}

std::tm TimeZone::civil(TimePoint tp) const {
    const std::time_t t = toTimeT(tp);
    std::tm tm{};
    switch (_kind) {
    case Kind::Utc:
        gmtime_r(&t, &tm);
        break;
    case Kind::Local:
        localtime_r(&t, &tm);
        break;
    case Kind::Named: {
        // 先算出墙上时间（按 UTC 拆分），再补上偏移和缩写
        const LocalType& type = _rules->lookup(static_cast<std::int64_t>(t));
        const std::time_t wall = t + type.utcOffset;
        gmtime_r(&wall, &tm);
        tm.tm_isdst = type.isDst ? 1 : 0;
        tm.tm_gmtoff = type.utcOffset;
        tm.tm_zone = type.abbr.c_str();
        break;
    }
    }
    return tm;
}

TimePoint TimeZone::fromCivil(std::tm tm) const {
    tm.tm_isdst = -1;
    std::time_t t = 0;
    switch (_kind) {
    case Kind::Utc:
        t = timegm(&tm);
        break;
    case Kind::Local:
        t = std::mktime(&tm);
        break;
    case Kind::Named: {
        // timegm 负责把溢出的字段归一化（2 月 30 日 -> 3 月 1 日）
        const std::time_t wall = timegm(&tm);
        t = static_cast<std::time_t>(_rules->toUtc(static_cast<std::int64_t>(wall)));
        break;
    }
    }
    return fromTimeT(t);
}

TimePoint TimeZone::fromCivil(int year, int month, int day,
                              int hour, int minute, int second) const {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;
    return fromCivil(tm);
}

long TimeZone::utcOffset(TimePoint tp) const {
    return civil(tp).tm_gmtoff;
}

std::string TimeZone::format(TimePoint tp) const {
    const std::tm tm = civil(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    long off = tm.tm_gmtoff;
    if (off == 0) {
        oss << 'Z';
        return oss.str();
    }
    oss << (off < 0 ? '-' : '+');
    if (off < 0) off = -off;
    oss << std::setfill('0') << std::setw(2) << off / 3600
        << ':' << std::setw(2) << (off % 3600) / 60;
    return oss.str();
}

} // namespace cronhub::core
