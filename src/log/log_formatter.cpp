#include "log_formatter.h"
#include "core/utils.h"

namespace cronhub::core {

namespace {

bool needsQuote(const std::string& v) {
    if (v.empty()) return true;
    for (char c : v) {
        if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\r' || c == '\t') {
            return true;
        }
    }
    return false;
}

// 保证一条记录只占一行
void appendQuoted(std::string& out, const std::string& v) {
    out += '"';
    for (char c : v) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    out += '"';
}

void appendPair(std::string& out, const std::string& key, const std::string& v, bool forceQuote) {
    out += ' ';
    out += key;
    out += '=';
    if (forceQuote || needsQuote(v)) {
        appendQuoted(out, v);
    } else {
        out += v;
    }
}

} // namespace

LogFormatter& LogFormatter::instance() {
    static LogFormatter f;
    return f;
}

const char* LogFormatter::levelName(LogLevel lv) {
    switch (lv) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

std::string LogFormatter::formatLine(const LogRecord& r) const {
    std::string line;
    line.reserve(96 + r.message.size() + r.fields.size() * 24);

    line += "ts=[";
    line += utils::formatTimestampMs(r.ts);
    line += "] level=[";
    line += levelName(r.level);
    line += ']';

    if (!r.component.empty()) appendPair(line, "component", r.component, false);
    if (r.seq > 0)            appendPair(line, "seq", std::to_string(r.seq), false);

    appendPair(line, "msg", r.message, true);
    if (!r.error.empty()) appendPair(line, "error", r.error, true);

    for (const auto& kv : r.fields) {
        appendPair(line, kv.first, kv.second, false);
    }
    return line;
}

} // namespace cronhub::core
