#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace cronhub {

class Logger;

// JSON 配置：一层展开成 "section.key"，顶层 key 也保留原始值（比如 jobs 数组）
class Config {
public:
    explicit Config(std::shared_ptr<Logger> logger = nullptr);

    // 加载配置文件；不存在 / 解析失败返回 false 并打日志
    bool load(const std::string& path);

    // 同 load，但直接给 JSON 文本
    bool loadFromString(const std::string& text, const std::string& origin = "<inline>");

    // 从环境变量覆盖配置
    void load_from_env();

    template<typename T>
    T get(const std::string& key, const T& def = T{}) const {
        auto it = m_config.find(key);
        if (it == m_config.end() || it->second.is_null()) {
            return def;
        }
        try {
            return it->second.template get<T>();
        } catch (const nlohmann::json::exception&) {
            return def;
        }
    }

    std::string get(const std::string& key, const char* def) const {
        return get<std::string>(key, std::string(def));
    }

    bool contains(const std::string& key) const { return m_config.count(key) > 0; }

    // 原始 JSON 值（找不到返回 null）
    nlohmann::json raw(const std::string& key) const;

    void set(const std::string& key, nlohmann::json value);

    // 最近一次成功加载的来源（文件路径或 origin）
    const std::string& source() const { return m_source; }

private:
    void apply(const nlohmann::json& j);

private:
    std::shared_ptr<Logger> m_logger;
    std::unordered_map<std::string, nlohmann::json> m_config;
    std::string m_source;
};

} // namespace cronhub
