#pragma once
#include <chrono>
#include <ctime>
#include <memory>
#include <string>

namespace cronhub {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::nanoseconds;

// 零值 time_point 代表 "没有时间"（未计算 / 无法满足 / 从未运行）
inline bool isZero(const TimePoint& tp) {
    return tp == TimePoint{};
}

namespace core {

class ZoneRules;

/// A time zone used for calendar arithmetic.
///
/// Named IANA zones are read from the TZif files under $TZDIR (default
/// /usr/share/zoneinfo) and evaluated without touching process state. The
/// process zone ("Local") goes through libc localtime_r / mktime, UTC through
/// gmtime_r / timegm. The process environment (TZ) is never modified.
class TimeZone {
public:
    static TimeZone local();
    static TimeZone utc();

    /// Loads an IANA zone ("America/New_York"). "" and "UTC" give utc(),
    /// "Local" gives local().
    /// @throws std::invalid_argument for unknown or malformed names
    static TimeZone load(const std::string& name);

    const std::string& name() const { return _name; }
    bool isLocal() const { return _kind == Kind::Local; }
    bool isUtc() const { return _kind == Kind::Utc; }

    /// Broken-down wall clock time of tp in this zone (sub-seconds dropped).
    std::tm civil(TimePoint tp) const;

    /// Instant of the given wall clock time. Out-of-range fields are
    /// normalized (day 32 rolls into the next month); tm_isdst is ignored.
    TimePoint fromCivil(std::tm tm) const;
    TimePoint fromCivil(int year, int month, int day,
                        int hour = 0, int minute = 0, int second = 0) const;

    /// Seconds east of UTC at tp.
    long utcOffset(TimePoint tp) const;

    /// RFC3339, e.g. 2012-03-11T03:00:00-04:00
    std::string format(TimePoint tp) const;

    bool operator==(const TimeZone& other) const {
        return _kind == other._kind && _name == other._name;
    }
    bool operator!=(const TimeZone& other) const { return !(*this == other); }

private:
    enum class Kind { Local, Utc, Named };

    TimeZone(Kind kind, std::string name, std::shared_ptr<const ZoneRules> rules = nullptr);

    Kind _kind;
    std::string _name;
    std::shared_ptr<const ZoneRules> _rules; // 仅 Named

};

} // namespace core
} // namespace cronhub
