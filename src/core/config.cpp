#include "config.h"
#include <cstdlib>          // getenv
#include <fstream>
#include <sstream>
#include "log/logger.h"

namespace cronhub {

Config::Config(std::shared_ptr<Logger> logger)
    : m_logger(std::move(logger))
{
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        if (m_logger) m_logger->warn("Config file not found: " + path + ", using defaults");
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return loadFromString(ss.str(), path);
}

bool Config::loadFromString(const std::string& text, const std::string& origin) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            if (m_logger) m_logger->error("top level is not an object", "Failed to parse config: " + origin);
            return false;
        }
        apply(j);
        m_source = origin;
        if (m_logger) m_logger->info("Config loaded from: " + origin);
        return true;
    }
    catch (const nlohmann::json::exception& ex) {
        if (m_logger) m_logger->error(ex.what(), "Failed to parse config: " + origin);
        return false;
    }
}

void Config::apply(const nlohmann::json& j) {
    for (auto& [key, value] : j.items()) {
        m_config[key] = value;
        if (value.is_object()) {
            for (auto& [k, v] : value.items()) {
                m_config[key + "." + k] = v;
            }
        }
    }
}

nlohmann::json Config::raw(const std::string& key) const {
    auto it = m_config.find(key);
    if (it == m_config.end()) return nullptr;
    return it->second;
}

void Config::set(const std::string& key, nlohmann::json value) {
    m_config[key] = std::move(value);
}

// 从环境变量覆盖
void Config::load_from_env() {
    if (const char* p = std::getenv("CRONHUB_TZ")) {
        m_config["scheduler.timezone"] = std::string(p);
    }
    if (const char* p = std::getenv("CRONHUB_LOG")) {
        m_config["log.path"] = std::string(p);
    }
    if (const char* p = std::getenv("CRONHUB_VERBOSE")) {
        const std::string v(p);
        m_config["scheduler.verbose"] = (v == "1" || v == "true" || v == "yes");
    }
}

} // namespace cronhub
