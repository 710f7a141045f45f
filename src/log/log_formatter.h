#pragma once
#include <string>
#include "log_record.h"

namespace cronhub::core {

// 单行 key=value 文本，文件和控制台共用
// 例：
// ts=[2024-01-01 10:00:00.123] level=[INFO] component=cron msg="run" entry=3 next=2024-01-01T10:01:00Z
//
// msg / error 总是加引号；附加字段只有含空白、引号、'=' 或为空时才加引号
class LogFormatter {
public:
    static LogFormatter& instance();

    std::string formatLine(const LogRecord& r) const;

    static const char* levelName(LogLevel lv);

private:
    LogFormatter() = default;
};

} // namespace cronhub::core
