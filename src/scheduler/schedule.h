#pragma once
#include <memory>
#include "core/time_zone.h"

namespace cronhub::scheduler {

/// Describes a job's duty cycle.
class Schedule {
public:
    virtual ~Schedule() = default;

    /// Next activation strictly after t, or the zero time_point when there is
    /// none. `zone` is the zone t is observed in; schedules carrying their own
    /// zone ignore it.
    virtual TimePoint next(TimePoint t, const core::TimeZone& zone) const = 0;

    /// next() observed in the process local zone.
    TimePoint next(TimePoint t) const {
        return next(t, core::TimeZone::local());
    }
};

using SchedulePtr = std::shared_ptr<const Schedule>;

} // namespace cronhub::scheduler
