#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace cronhub {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// key=value 附加字段，保持调用方给出的顺序
using LogFields = std::vector<std::pair<std::string, std::string>>;

namespace core {

struct LogRecord {
    // ---- routing ----
    std::string component{"cron"};        // 哪个子系统打的日志

    // ---- content ----
    LogLevel level{LogLevel::Info};
    std::string message;
    std::string error;                     // 可选：error() 传入的错误描述

    // ---- timing ----
    std::chrono::system_clock::time_point ts{std::chrono::system_clock::now()};

    // ---- extra fields ----
    LogFields fields;

    // 序列号（由 LogBuffer 分配，用于分页/增量拉取）
    std::uint64_t seq{0};

    // 小工具：按 key 取字段，找不到返回空串
    std::string field(const std::string& key) const {
        for (const auto& kv : fields) {
            if (kv.first == key) return kv.second;
        }
        return {};
    }
};

} // namespace core
} // namespace cronhub
