#include "log_rotation.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace cronhub::core {

LogRotation::LogRotation(RotationPolicy policy) : _p(policy) {}

bool LogRotation::shouldRotate(std::uint64_t currentSizeBytes,
                               std::uint64_t addBytes) const {
    if (_p.maxBytes == 0 || currentSizeBytes == 0) return false;
    return currentSizeBytes + addBytes > _p.maxBytes;
}

std::string LogRotation::rotatedName(const std::string& basePath, int index) {
    return basePath + "." + std::to_string(index);
}

void LogRotation::rotate(const std::string& basePath) const {
    std::error_code ec;
    if (!fs::exists(basePath, ec)) return;

    if (_p.maxFiles <= 0) {
        fs::remove(basePath, ec);
        return;
    }

    // 最旧的一个挤出去
    fs::remove(rotatedName(basePath, _p.maxFiles), ec);

    for (int i = _p.maxFiles - 1; i >= 1; --i) {
        const std::string from = rotatedName(basePath, i);
        if (fs::exists(from, ec)) {
            fs::rename(from, rotatedName(basePath, i + 1), ec);
        }
    }
    fs::rename(basePath, rotatedName(basePath, 1), ec);
}

} // namespace cronhub::core
