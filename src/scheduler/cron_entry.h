#pragma once
#include <functional>
#include "schedule.h"

namespace cronhub::scheduler {

using Job = std::function<void()>;

// 0 代表无效 id；同一个 CronScheduler 内从 1 开始递增
using EntryId = int;

/// One registered job: its schedule, the job itself, and run bookkeeping.
struct CronEntry {
    EntryId id{0};

    SchedulePtr schedule;

    // 下一次运行时间；零值表示还没算过或永远不会运行
    TimePoint next{};

    // 上一次运行时间；零值表示还没运行过
    TimePoint prev{};

    // 经过 Chain 包装后的 job，调度时真正执行的是它
    Job wrappedJob;

    // 注册时传入的原始 job
    Job job;

    bool valid() const { return id != 0; }
};

} // namespace cronhub::scheduler
