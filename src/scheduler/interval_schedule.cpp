#include "interval_schedule.h"

namespace cronhub::scheduler {

namespace {

Duration normalizeDelay(Duration d) {
    if (d < std::chrono::seconds(1)) {
        return std::chrono::seconds(1);
    }
    return d - d % std::chrono::seconds(1);
}

} // namespace

IntervalSchedule::IntervalSchedule(Duration delay)
    : _delay(normalizeDelay(delay))
{
}

TimePoint IntervalSchedule::next(TimePoint t, const core::TimeZone& /*zone*/) const
{
    const auto subSecond = t - std::chrono::floor<std::chrono::seconds>(t);
    return std::chrono::time_point_cast<Clock::duration>(t + _delay - subSecond);
}

IntervalSchedule every(Duration duration)
{
    return IntervalSchedule(duration);
}

} // namespace cronhub::scheduler
