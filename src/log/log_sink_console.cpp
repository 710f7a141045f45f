#include "log_sink_console.h"
#include "log_formatter.h"

namespace cronhub::core {

ConsoleLogSink::ConsoleLogSink(std::ostream& out, std::ostream& err)
    : _out(out)
    , _err(err)
{
}

void ConsoleLogSink::consume(const LogRecord& rec) {
    const std::string line = LogFormatter::instance().formatLine(rec);
    std::lock_guard<std::mutex> lk(_mu);
    if (rec.level == LogLevel::Error) {
        _err << line << std::endl;
    } else {
        _out << line << '\n';
    }
}

} // namespace cronhub::core
