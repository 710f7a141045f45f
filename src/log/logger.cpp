#include "logger.h"
#include <iostream>
#include "core/utils.h"
#include "log_formatter.h"
#include "log_sink_console.h"

namespace cronhub {

Logger::Logger(std::vector<std::shared_ptr<core::ILogSink>> sinks,
               LogLevel minLevel,
               std::string component)
    : _sinks(std::move(sinks))
    , _minLevel(minLevel)
    , _component(std::move(component))
{
}

std::shared_ptr<Logger> Logger::makeDefault() {
    return std::make_shared<Logger>(
        std::vector<std::shared_ptr<core::ILogSink>>{ std::make_shared<core::ConsoleLogSink>() },
        LogLevel::Error);
}

std::shared_ptr<Logger> Logger::makeVerbose() {
    return std::make_shared<Logger>(
        std::vector<std::shared_ptr<core::ILogSink>>{ std::make_shared<core::ConsoleLogSink>() },
        LogLevel::Info);
}

std::shared_ptr<Logger> Logger::discard() {
    return std::make_shared<Logger>(std::vector<std::shared_ptr<core::ILogSink>>{}, LogLevel::Error);
}

void Logger::debug(const std::string &msg, const LogFields &fields) const {
    write(LogLevel::Debug, "", msg, fields);
}

void Logger::info(const std::string &msg, const LogFields &fields) const {
    write(LogLevel::Info, "", msg, fields);
}

void Logger::warn(const std::string &msg, const LogFields &fields) const {
    write(LogLevel::Warn, "", msg, fields);
}

void Logger::error(const std::string &err, const std::string &msg, const LogFields &fields) const {
    write(LogLevel::Error, err, msg, fields);
}

std::shared_ptr<Logger> Logger::withComponent(const std::string &component, LogLevel minLevel) const {
    return std::make_shared<Logger>(_sinks, minLevel, component);
}

void Logger::write(LogLevel level, const std::string &err,
                   const std::string &msg, const LogFields &fields) const {
    if (!enabled(level)) return;

    core::LogRecord rec;
    rec.component = _component;
    rec.level = level;
    rec.message = msg;
    rec.error = err;
    rec.fields = fields;
    rec.ts = std::chrono::system_clock::now();

    for (const auto& s : _sinks) {
        if (!s) continue;
        try {
            s->consume(rec);
        } catch (const std::exception& ex) {
            // Fallback (should be rare): never lose the line, never throw into the caller.
            std::cerr << utils::now_string() << " [" << level_to_string(level) << "] "
                      << msg << " (log sink failed: " << ex.what() << ")" << std::endl;
        }
    }
}

std::string Logger::level_to_string(LogLevel level) {
    return core::LogFormatter::levelName(level);
}

} // namespace cronhub
