#pragma once
#include <memory>
#include <string>
#include <vector>

#include "log_record.h"
#include "log_sink.h"

namespace cronhub {

/// Structured logger handed to the scheduler and the job wrappers.
///
/// There is no process-wide instance: whoever builds a CronScheduler passes
/// one in (or gets Logger::makeDefault()). Sink failures are reported on
/// stderr and never reach the caller.
class Logger {
public:
    explicit Logger(std::vector<std::shared_ptr<core::ILogSink>> sinks,
                    LogLevel minLevel = LogLevel::Info,
                    std::string component = "cron");

    /// Console, errors only.
    static std::shared_ptr<Logger> makeDefault();
    /// Console, info and above.
    static std::shared_ptr<Logger> makeVerbose();
    /// Drops everything.
    static std::shared_ptr<Logger> discard();

    void debug(const std::string& msg, const LogFields& fields = {}) const;
    void info(const std::string& msg, const LogFields& fields = {}) const;
    void warn(const std::string& msg, const LogFields& fields = {}) const;
    void error(const std::string& err, const std::string& msg, const LogFields& fields = {}) const;

    bool enabled(LogLevel level) const { return level >= _minLevel; }
    LogLevel minLevel() const { return _minLevel; }
    const std::string& component() const { return _component; }

    /// Same sinks, different component tag and level.
    std::shared_ptr<Logger> withComponent(const std::string& component, LogLevel minLevel) const;

    static std::string level_to_string(LogLevel level);

private:
    void write(LogLevel level, const std::string& err,
               const std::string& msg, const LogFields& fields) const;

private:
    const std::vector<std::shared_ptr<core::ILogSink>> _sinks;
    LogLevel _minLevel;
    std::string _component;
};

using LoggerPtr = std::shared_ptr<Logger>;

} // namespace cronhub
