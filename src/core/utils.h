#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace cronhub {
namespace utils {

// 当前时间，格式：YYYY-MM-DD HH:MM:SS.mmm
std::string now_string();

std::string formatTimestampMs(const std::chrono::system_clock::time_point& ts);

// "300ms", "1.5h", "1h30m", "-2m3.4s"
// 单位：ns, us (µs), ms, s, m, h；解析失败抛 std::invalid_argument
std::chrono::nanoseconds parseDuration(const std::string& text);

// parseDuration 的反向：1h2m3.5s / 250ms / 0s
std::string formatDuration(std::chrono::nanoseconds d);

// 执行 shell 命令，返回 {退出码, stdout}
std::pair<int, std::string> run_command(const std::string& cmd);

} // namespace utils
} // namespace cronhub
