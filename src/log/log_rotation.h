#pragma once
#include <cstdint>
#include <string>

namespace cronhub::core {

// 按大小轮转，编号越大越旧：
//   cronhub.log      当前写入
//   cronhub.log.1    上一个
//   cronhub.log.2    ...
// 超过 maxFiles 的直接删除
struct RotationPolicy {
    std::uint64_t maxBytes = 10 * 1024 * 1024; // 0 = 不轮转
    int maxFiles = 5;                          // 0 = 不保留历史
};

class LogRotation {
public:
    explicit LogRotation(RotationPolicy policy);

    // currentSizeBytes: 写入前的文件大小；addBytes: 这次要追加的字节数
    bool shouldRotate(std::uint64_t currentSizeBytes, std::uint64_t addBytes) const;

    // 依次后移历史文件，再把 basePath 改名为 basePath.1；调用方之后重新打开 basePath
    void rotate(const std::string& basePath) const;

    static std::string rotatedName(const std::string& basePath, int index);

    const RotationPolicy& policy() const { return _p; }

private:
    RotationPolicy _p;
};

} // namespace cronhub::core
