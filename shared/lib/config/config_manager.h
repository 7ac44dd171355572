/**
 * @file config_manager.h
 * @brief Process-wide pinning configuration
 *
 * Holds the PIN_* provisioning values (pinned reference, client bundle,
 * passphrase, trust anchors) and LOG_LEVEL. Sources, in increasing
 * precedence: process environment, JSON config file, explicit set().
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace certpin::common {

/**
 * @brief Configuration store (singleton)
 *
 * Values of secret keys (client bundle, passphrase) are redacted from
 * debug logs.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Reads the environment once
    ConfigManager();

    void setLocked(const std::string& key, const std::string& value);

public:
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Value for key; falls back to the environment, then defaultValue
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Boolean value
     *
     * true/1/yes/on and false/0/no/off, case-insensitive. Anything else
     * yields defaultValue.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    bool has(const std::string& key) const;

    void set(const std::string& key, const std::string& value);

    /// @brief Drop an explicit value (an environment variable still applies)
    void remove(const std::string& key);

    /// @brief Copy the known keys present in the environment
    void loadFromEnvironment();

    /**
     * @brief Merge a JSON object file
     *
     * Member names are keys. String, bool and integer members are stored;
     * a null member removes the key.
     *
     * @throws ConfigException if the file is unreadable, not a JSON object,
     *         or holds a value of another type
     */
    void loadFromJsonFile(const std::string& path);

    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");

    /// @brief True for keys whose values must never be logged
    static bool isSecretKey(const std::string& key);

    /// @name Keys
    /// @{
    static constexpr const char* PIN_SERVER_CERT_REFERENCE = "PIN_SERVER_CERT_REFERENCE";
    static constexpr const char* PIN_CLIENT_PKCS12 = "PIN_CLIENT_PKCS12";
    static constexpr const char* PIN_CLIENT_PKCS12_PASSPHRASE = "PIN_CLIENT_PKCS12_PASSPHRASE";
    static constexpr const char* PIN_CA_FILE = "PIN_CA_FILE";
    static constexpr const char* PIN_THUMBPRINT_DIGEST = "PIN_THUMBPRINT_DIGEST";
    static constexpr const char* PIN_ALLOW_BOOTSTRAP = "PIN_ALLOW_BOOTSTRAP";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    /// @}
};

} // namespace certpin::common
