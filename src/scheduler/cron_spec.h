#pragma once
#include <cstdint>
#include <ctime>
#include <optional>
#include "schedule.h"

namespace cronhub::scheduler {

// 字段里出现 * 或 ? 时置最高位；只有 dom/dow 的并/交判断会用到它
constexpr std::uint64_t kStarBit = 1ULL << 63;

/// Traditional crontab schedule with second granularity, stored as one
/// bitset per field (bit i set = value i allowed).
class CronSpec : public Schedule {
public:
    CronSpec(std::uint64_t second, std::uint64_t minute, std::uint64_t hour,
             std::uint64_t dom, std::uint64_t month, std::uint64_t dow,
             std::optional<core::TimeZone> location = std::nullopt);

    using Schedule::next;

    /// First instant after t matching every field, searching at most five
    /// calendar years ahead; the zero time_point when nothing matches.
    TimePoint next(TimePoint t, const core::TimeZone& zone) const override;

    /// dom/dow check for the given wall clock date. If either field was a
    /// wildcard both must match, otherwise either one is enough.
    bool dayMatches(const std::tm& tm) const;

    std::uint64_t second() const { return _second; }
    std::uint64_t minute() const { return _minute; }
    std::uint64_t hour() const { return _hour; }
    std::uint64_t dom() const { return _dom; }
    std::uint64_t month() const { return _month; }
    std::uint64_t dow() const { return _dow; }

    /// Zone overriding the caller's, set by a TZ=/CRON_TZ= prefix.
    const std::optional<core::TimeZone>& location() const { return _location; }

private:
    // 以下每个函数：字段匹配返回 true；发生回绕返回 false，调用方从月份重新开始
    bool matchMonth(TimePoint& t, std::tm& tm, bool& added, const core::TimeZone& loc) const;
    bool matchDay(TimePoint& t, std::tm& tm, bool& added, const core::TimeZone& loc) const;
    bool matchHour(TimePoint& t, std::tm& tm, bool& added, const core::TimeZone& loc) const;
    bool matchMinute(TimePoint& t, std::tm& tm, bool& added, const core::TimeZone& loc) const;
    bool matchSecond(TimePoint& t, std::tm& tm, bool& added, const core::TimeZone& loc) const;

private:
    std::uint64_t _second;
    std::uint64_t _minute;
    std::uint64_t _hour;
    std::uint64_t _dom;
    std::uint64_t _month;
    std::uint64_t _dow;

    std::optional<core::TimeZone> _location;
};

} // namespace cronhub::scheduler
