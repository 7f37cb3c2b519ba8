#ifndef EMUFLOW_CONFIG_MANAGER_H
#define EMUFLOW_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "types.h"

namespace emuflow {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    /**
     * @brief Load configuration; a missing file is created with defaults
     * @return false if the file exists but cannot be parsed (defaults stay active)
     */
    bool loadConfig(const std::string& configPath = "config/emuflow.json");
    bool saveConfig(const std::string& configPath = "config/emuflow.json");

    // Merge a document over the defaults without touching the filesystem
    void loadFromJson(const nlohmann::json& config);
    void resetToDefaults();

    // Engine
    int getDefaultMaxIterations() const;
    int getWaitPollIntervalMs() const;

    // Capture
    int getCaptureTtlMs() const;
    int getCaptureTimeoutMs() const;

    // Device
    std::string getAdbPath() const;
    int getResolutionTimeoutMs() const;
    int getDeviceCommandTimeoutMs() const;

    // Logging
    std::string getLogLevel() const;
    std::string getLogFile() const;
    int getLogMaxSizeMb() const;
    int getLogMaxFiles() const;

    /**
     * @brief Target bindings from the "targets" array
     * @throws ConfigurationError on a malformed entry
     */
    std::vector<TargetBinding> getTargetBindings() const;

    std::string getConfigPath() const;
    nlohmann::json toJson() const;

    // Dot separated key access ("capture.ttl_ms")
    template<typename T>
    T get(const std::string& key) const;

    template<typename T>
    void set(const std::string& key, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    mutable std::mutex m_mutex;
    nlohmann::json m_config;
    std::string m_configPath;

    static nlohmann::json defaults();
    int getPositiveInt(const std::string& path, int defaultValue) const;
    const nlohmann::json* find(const std::string& path) const;
    static std::string getEnvironmentVariable(const std::string& name);
};

template<typename T>
T ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = find(key);
    if (!value) {
        throw std::out_of_range("Configuration key not found: " + key);
    }
    return value->get<T>();
}

template<typename T>
void ConfigManager::set(const std::string& key, const T& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string path = "/";
    for (char c : key) {
        path += (c == '.') ? '/' : c;
    }
    m_config[nlohmann::json::json_pointer(path)] = value;
}

} // namespace emuflow

#endif // EMUFLOW_CONFIG_MANAGER_H
