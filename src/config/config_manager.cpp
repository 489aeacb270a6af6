/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "tradeid/config/config_manager.h"
#include "tradeid/exception/exceptions.h"
#include "tradeid/utils/string_utils.h"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tradeid::config {

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
    spdlog::debug("ConfigManager initialized");
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (utils::trim(value.substr(consumed)).empty()) {
            return parsed;
        }
        spdlog::warn("Failed to parse integer config '{}': trailing characters in '{}' (using default: {})",
                     key, value, defaultValue);
        return defaultValue;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        return parseBool(key, value);
    } catch (const exception::ConfigException&) {
        spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                     key, value, defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::parseBool(const std::string& key, const std::string& value) {
    std::string lowerValue = utils::toLower(utils::trim(value));

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    throw exception::ConfigException("'" + key + "' is not a boolean: " + value);
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.find(key) != config_.end() || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {MAX_LENGTH, ALLOW_INNER_WHITESPACE, FORBIDDEN_CHARS,
                            GUID_CASE, GUID_DELIMITER, LOG_LEVEL}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }

    spdlog::debug("Configuration loaded from environment");
}

std::string ConfigManager::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : defaultValue;
}

} // namespace tradeid::config
