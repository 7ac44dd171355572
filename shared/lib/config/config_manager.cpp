/**
 * @file config_manager.cpp
 * @brief ConfigManager implementation
 */

#include "config_manager.h"
#include "exceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <json/json.h>
#include <spdlog/spdlog.h>

namespace certpin::common {

namespace {

const char* const kEnvironmentKeys[] = {
    ConfigManager::PIN_SERVER_CERT_REFERENCE,
    ConfigManager::PIN_CLIENT_PKCS12,
    ConfigManager::PIN_CLIENT_PKCS12_PASSPHRASE,
    ConfigManager::PIN_CA_FILE,
    ConfigManager::PIN_THUMBPRINT_DIGEST,
    ConfigManager::PIN_ALLOW_BOOTSTRAP,
    ConfigManager::LOG_LEVEL,
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = config_.find(key);
        if (it != config_.end()) return it->second;
    }
    return getEnv(key, defaultValue);
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    const std::string value = toLower(getString(key));
    if (value.empty()) return defaultValue;

    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;

    spdlog::warn("Config '{}' is not a boolean; using {}", key, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config_.count(key) > 0) return true;
    }
    return std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    setLocked(key, value);
}

void ConfigManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::setLocked(const std::string& key, const std::string& value) {
    config_[key] = value;
    if (isSecretKey(key)) {
        spdlog::debug("Config {} set (<redacted, {} chars>)", key, value.size());
    } else {
        spdlog::debug("Config {} = {}", key, value);
    }
}

void ConfigManager::loadFromEnvironment() {
    std::lock_guard<std::mutex> lock(mutex_);
    int found = 0;
    for (const char* key : kEnvironmentKeys) {
        if (const char* env = std::getenv(key)) {
            setLocked(key, env);
            found++;
        }
    }
    spdlog::debug("{} configuration keys taken from the environment", found);
}

void ConfigManager::loadFromJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigException("Cannot open config file: " + path);
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &root, &errors)) {
        throw ConfigException("Invalid JSON in " + path + ": " + errors);
    }
    if (!root.isObject()) {
        throw ConfigException("Config file " + path + " must contain a JSON object");
    }

    // Validate every member before applying any of them
    std::vector<std::pair<std::string, std::string>> updates;
    std::vector<std::string> removals;
    for (const auto& name : root.getMemberNames()) {
        const Json::Value& value = root[name];
        if (value.isString()) {
            updates.emplace_back(name, value.asString());
        } else if (value.isBool()) {
            updates.emplace_back(name, value.asBool() ? "true" : "false");
        } else if (value.isIntegral()) {
            updates.emplace_back(name, std::to_string(value.asLargestInt()));
        } else if (value.isNull()) {
            removals.push_back(name);
        } else {
            throw ConfigException("Unsupported value type for '" + name + "' in " + path);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& update : updates) {
        setLocked(update.first, update.second);
    }
    for (const auto& name : removals) {
        config_.erase(name);
    }
    spdlog::info("Configuration loaded from {} ({} keys)", path, updates.size());
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

bool ConfigManager::isSecretKey(const std::string& key) {
    return key == PIN_CLIENT_PKCS12 || key == PIN_CLIENT_PKCS12_PASSPHRASE;
}

} // namespace certpin::common
