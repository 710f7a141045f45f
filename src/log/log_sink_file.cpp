#include "log_sink_file.h"
#include <filesystem>
#include <system_error>
#include "log_formatter.h"

namespace fs = std::filesystem;

namespace cronhub::core {

FileLogSink::FileLogSink(Options opt)
    : _opt(std::move(opt))
    , _rot(RotationPolicy{_opt.rotateBytes, _opt.maxFiles})
{
}

bool FileLogSink::openLocked() {
    if (_ofs.is_open()) return true;
    if (_opt.path.empty()) return false;

    std::error_code ec;
    const fs::path parent = fs::path(_opt.path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    _ofs.open(_opt.path, std::ios::app);
    if (!_ofs.is_open()) return false;

    const auto size = fs::file_size(_opt.path, ec);
    _bytes = ec ? 0 : static_cast<std::uint64_t>(size);
    return true;
}

void FileLogSink::rotateLocked() {
    _ofs.close();
    _rot.rotate(_opt.path);
    _bytes = 0;
    openLocked();
}

void FileLogSink::consume(const LogRecord& rec) {
    std::string line = LogFormatter::instance().formatLine(rec);
    line += '\n';

    std::lock_guard<std::mutex> lk(_mu);
    if (!openLocked()) return;

    if (_rot.shouldRotate(_bytes, line.size())) {
        rotateLocked();
        if (!_ofs.is_open()) return;
    }

    _ofs << line;
    _bytes += line.size();
    if (_opt.flushEachLine) {
        _ofs.flush();
    }
}

} // namespace cronhub::core
