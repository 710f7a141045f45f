#pragma once
#include "schedule.h"

namespace cronhub::scheduler {

// 固定间隔的循环，例如 "每 5 分钟"。不支持小于 1 秒的间隔
class IntervalSchedule : public Schedule {
public:
    explicit IntervalSchedule(Duration delay);

    using Schedule::next;

    // 下一次激活时间，对齐到整秒
    TimePoint next(TimePoint t, const core::TimeZone& zone) const override;

    Duration delay() const { return _delay; }

private:
    Duration _delay;
};

// 小于 1 秒的间隔按 1 秒处理；秒以下的部分截掉
IntervalSchedule every(Duration duration);

} // namespace cronhub::scheduler
