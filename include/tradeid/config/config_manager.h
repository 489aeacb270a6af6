/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and explicitly set values.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace tradeid::config {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Values passed to set() take precedence over the process environment.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     *
     * Unparseable values, including trailing non-space characters, are
     * logged and replaced by the default.
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value (environment lookup applies again)
     */
    void remove(const std::string& key);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Get environment variable
     * @param key Environment variable name
     * @param defaultValue Default if not found
     * @return Environment variable value
     */
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /**
     * @brief Parse a boolean literal
     * @return true/false, or throws ConfigException when unrecognized
     */
    static bool parseBool(const std::string& key, const std::string& value);

    /// @name Predefined Configuration Keys

    // Validation
    static constexpr const char* MAX_LENGTH = "TRADEID_MAX_LENGTH";
    static constexpr const char* ALLOW_INNER_WHITESPACE = "TRADEID_ALLOW_INNER_WHITESPACE";
    static constexpr const char* FORBIDDEN_CHARS = "TRADEID_FORBIDDEN_CHARS";

    // GUID format
    static constexpr const char* GUID_CASE = "TRADEID_GUID_CASE";
    static constexpr const char* GUID_DELIMITER = "TRADEID_GUID_DELIMITER";

    // Logging
    static constexpr const char* LOG_LEVEL = "TRADEID_LOG_LEVEL";
};

} // namespace tradeid::config
