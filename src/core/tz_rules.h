#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cronhub::core {

/// One local time type of a zone: offset east of UTC, DST flag, abbreviation.
struct LocalType {
    std::int32_t utcOffset{0};
    bool isDst{false};
    std::string abbr;
};

/// POSIX TZ rule ("EST5EDT,M3.2.0,M11.1.0"), the footer of a TZif v2+ file.
/// Covers instants after the last explicit transition.
class PosixTzRule {
public:
    /// @throws std::invalid_argument on malformed input
    static PosixTzRule parse(const std::string& text);

    const LocalType& lookup(std::int64_t utcSeconds) const;

private:
    // 一年中的切换日：Jn（不计 2 月 29 日）、n（从 0 起，计闰日）、Mm.w.d
    struct DateRule {
        enum class Kind { Julian, ZeroBased, MonthWeekDay } kind{Kind::MonthWeekDay};
        int day{0};
        int week{0};
        int month{0};
        std::int32_t secondOfDay{2 * 3600};
    };

    // 当年切换时刻（本地墙上时间的秒数，从 1970-01-01 起算）
    static std::int64_t localTransition(const DateRule& r, int year);

    LocalType _std;
    std::optional<LocalType> _dst;
    DateRule _start;
    DateRule _end;
};

/// Transition table of one IANA zone, read from a TZif file (RFC 8536).
///
/// Immutable once built; lookups need no locking and touch no process state.
class ZoneRules {
public:
    /// @throws std::invalid_argument if the data is not a valid TZif file
    static std::shared_ptr<const ZoneRules> fromTzif(const std::vector<unsigned char>& data);

    /// Rules loaded from $TZDIR (or /usr/share/zoneinfo), cached per name.
    /// @throws std::invalid_argument for unknown zones or unreadable files
    static std::shared_ptr<const ZoneRules> load(const std::string& name);

    /// Local time type in effect at the given instant.
    const LocalType& lookup(std::int64_t utcSeconds) const;

    /// Instant of a wall clock time (seconds since the epoch as if it were UTC).
    /// A wall time inside a gap or an overlap resolves against the offset in
    /// effect just before the instant it would name under the first guess.
    std::int64_t toUtc(std::int64_t localSeconds) const;

private:
    std::vector<std::int64_t> _transitions; // 升序
    std::vector<std::uint8_t> _typeIndex;   // 与 _transitions 一一对应
    std::vector<LocalType> _types;
    std::optional<PosixTzRule> _footer;
};

} // namespace cronhub::core
