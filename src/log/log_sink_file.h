#pragma once
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include "log_rotation.h"
#include "log_sink.h"

namespace cronhub::core {

// 追加写文件；超过 rotateBytes 时交给 LogRotation 轮转
class FileLogSink : public ILogSink {
public:
    struct Options {
        std::string path = "./logs/cronhub.log";
        std::size_t rotateBytes = 10 * 1024 * 1024; // 0 = 不轮转
        int maxFiles = 5;                           // cronhub.log.1 ... cronhub.log.5
        bool flushEachLine = false;
    };

    explicit FileLogSink(Options opt);

    void consume(const LogRecord& rec) override;

    const std::string& path() const { return _opt.path; }

private:
    // 打开失败返回 false，这条日志丢弃
    bool openLocked();
    void rotateLocked();

private:
    Options _opt;
    LogRotation _rot;
    std::ofstream _ofs;
    std::uint64_t _bytes{0}; // 当前文件已写入的字节数
    std::mutex _mu;
};

} // namespace cronhub::core
