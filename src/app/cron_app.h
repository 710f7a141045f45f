#pragma once
#include <memory>
#include <string>
#include <vector>
#include "core/config.h"
#include "log/log_buffer.h"
#include "log/logger.h"
#include "scheduler/cron_scheduler.h"

namespace cronhub {

/// cronhubd：读配置、建日志、注册 shell 命令 job，直到收到 SIGINT / SIGTERM
class CronApp {
public:
    CronApp();
    ~CronApp();

    // 程序主入口；configPath 为空时按默认路径查找
    int run(const std::string& configPath);

    /// Maps the scheduler.* keys onto CronScheduler options.
    /// @throws std::invalid_argument for an unknown time zone or chain wrapper name
    static scheduler::CronScheduler::Options buildOptions(const Config& cfg, LoggerPtr logger);

    /// Registers every valid entry of the "jobs" array; invalid ones are
    /// logged and skipped. Returns how many were registered.
    static std::size_t registerJobs(const Config& cfg,
                                    scheduler::CronScheduler& sched,
                                    LoggerPtr logger);

    /// Job running a shell command, logging its exit code and output size.
    static scheduler::Job makeCommandJob(const std::string& name,
                                         const std::string& command,
                                         LoggerPtr logger);

    /// Console sink, plus a file sink when log.path is set and an in-memory
    /// buffer when log.bufferRecords > 0.
    static std::vector<std::shared_ptr<core::ILogSink>> buildSinks(const Config& cfg);

private:
    void init_config(const std::string& configPath);
    void init_logger();
    int wait_for_signal();

private:
    Config m_config;
    std::vector<std::shared_ptr<core::ILogSink>> m_sinks;
    LoggerPtr m_logger;
    std::unique_ptr<scheduler::CronScheduler> m_scheduler;
};

} // namespace cronhub
