#include "config_manager.h"
#include "structured_logger.h"
#include "error_handler.h"
#include "file_utils.h"
#include "json_utils.h"
#include "input_validator.h"
#include <cstdlib>

namespace emuflow {

ConfigManager::ConfigManager()
    : m_config(defaults()) {
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configPath = configPath;
    }

    if (!utils::FileUtils::fileExists(configPath)) {
        SLOG_WARNING().message("Config file not found, writing defaults").context("config_path", configPath);
        resetToDefaults();
        if (!saveConfig(configPath)) {
            SLOG_WARNING().message("Running with unsaved default configuration").context("config_path", configPath);
        }
        return true;
    }

    nlohmann::json loaded;
    std::string error;
    if (!utils::FileUtils::loadJsonFromFile(configPath, loaded, &error)) {
        SLOG_ERROR().message("Failed to load config, using defaults")
            .context("config_path", configPath)
            .context("error", error);
        resetToDefaults();
        return false;
    }

    if (!loaded.is_object()) {
        SLOG_ERROR().message("Config root must be an object, using defaults").context("config_path", configPath);
        resetToDefaults();
        return false;
    }

    loadFromJson(loaded);
    SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
    return true;
}

bool ConfigManager::saveConfig(const std::string& configPath) {
    nlohmann::json snapshot = toJson();
    if (utils::FileUtils::saveJsonToFile(configPath, snapshot)) {
        SLOG_DEBUG().message("Configuration saved").context("config_path", configPath);
        return true;
    }
    SLOG_ERROR().message("Failed to save configuration").context("config_path", configPath);
    return false;
}

void ConfigManager::loadFromJson(const nlohmann::json& config) {
    nlohmann::json merged = utils::JsonUtils::mergeJsonObjects(defaults(), config);

    std::string adbPath = getEnvironmentVariable("EMUFLOW_ADB_PATH");
    if (!adbPath.empty() && merged["device"].is_object()) {
        merged["device"]["adb_path"] = adbPath;
    }
    std::string logLevel = getEnvironmentVariable("EMUFLOW_LOG_LEVEL");
    if (!logLevel.empty() && merged["logging"].is_object()) {
        merged["logging"]["level"] = logLevel;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = merged;
}

void ConfigManager::resetToDefaults() {
    loadFromJson(nlohmann::json::object());
}

nlohmann::json ConfigManager::defaults() {
    return nlohmann::json{
        {"engine", {
            {"default_max_iterations", 10000},
            {"wait_poll_interval_ms", 100}
        }},
        {"capture", {
            {"ttl_ms", 1000},
            {"timeout_ms", 5000}
        }},
        {"device", {
            {"adb_path", "adb"},
            {"resolution_timeout_ms", 5000},
            {"command_timeout_ms", 5000}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", ""},
            {"max_size_mb", 10},
            {"max_files", 5}
        }},
        {"targets", nlohmann::json::array()}
    };
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : std::string();
}

const nlohmann::json* ConfigManager::find(const std::string& path) const {
    return utils::JsonUtils::findPath(m_config, path);
}

int ConfigManager::getPositiveInt(const std::string& path, int defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = find(path);
    if (!value || !value->is_number_integer()) {
        return defaultValue;
    }
    auto raw = value->get<int64_t>();
    if (raw <= 0 || raw > 86400000) {
        SLOG_WARNING().message("Configuration value out of range, using default")
            .context("key", path)
            .context("value", raw)
            .context("default", defaultValue);
        return defaultValue;
    }
    return static_cast<int>(raw);
}

int ConfigManager::getDefaultMaxIterations() const {
    return getPositiveInt("engine.default_max_iterations", 10000);
}

int ConfigManager::getWaitPollIntervalMs() const {
    return getPositiveInt("engine.wait_poll_interval_ms", 100);
}

int ConfigManager::getCaptureTtlMs() const {
    return getPositiveInt("capture.ttl_ms", 1000);
}

int ConfigManager::getCaptureTimeoutMs() const {
    return getPositiveInt("capture.timeout_ms", 5000);
}

std::string ConfigManager::getAdbPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* value = find("device.adb_path");
    if (!value || !value->is_string() || value->get<std::string>().empty()) {
        return "adb";
    }
    return value->get<std::string>();
}

int ConfigManager::getResolutionTimeoutMs() const {
    return getPositiveInt("device.resolution_timeout_ms", 5000);
}

int ConfigManager::getDeviceCommandTimeoutMs() const {
    return getPositiveInt("device.command_timeout_ms", 5000);
}

std::string ConfigManager::getLogLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* logging = find("logging");
    return logging ? utils::JsonUtils::getStringField(*logging, "level", "INFO") : "INFO";
}

std::string ConfigManager::getLogFile() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const nlohmann::json* logging = find("logging");
    return logging ? utils::JsonUtils::getStringField(*logging, "file", "") : "";
}

int ConfigManager::getLogMaxSizeMb() const {
    return getPositiveInt("logging.max_size_mb", 10);
}

int ConfigManager::getLogMaxFiles() const {
    return getPositiveInt("logging.max_files", 5);
}

std::vector<TargetBinding> ConfigManager::getTargetBindings() const {
    nlohmann::json targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const nlohmann::json* value = find("targets");
        if (!value) {
            return {};
        }
        targets = *value;
    }

    if (!targets.is_array()) {
        throw ConfigurationError("'targets' must be an array", "config");
    }

    std::vector<TargetBinding> bindings;
    for (size_t i = 0; i < targets.size(); ++i) {
        const auto& entry = targets[i];
        std::string where = "targets[" + std::to_string(i) + "]";

        TargetBinding binding;
        if (entry.is_string()) {
            binding.id = entry.get<std::string>();
        } else if (entry.is_object()) {
            binding.id = utils::JsonUtils::getStringField(entry, "id");

            auto surface = entry.find("surface");
            if (surface != entry.end() && !surface->is_null()) {
                SurfaceRect rect(utils::JsonUtils::getIntField(*surface, "x", 0),
                                 utils::JsonUtils::getIntField(*surface, "y", 0),
                                 utils::JsonUtils::getIntField(*surface, "width", 0),
                                 utils::JsonUtils::getIntField(*surface, "height", 0));
                if (!rect.isValid()) {
                    throw ConfigurationError(where + ".surface must have positive width and height", "config");
                }
                binding.surface = rect;
            }

            auto resolution = entry.find("resolution");
            if (resolution != entry.end() && !resolution->is_null()) {
                Resolution res(utils::JsonUtils::getIntField(*resolution, "width", 0),
                               utils::JsonUtils::getIntField(*resolution, "height", 0));
                if (!res.isValid()) {
                    throw ConfigurationError(where + ".resolution must have positive width and height", "config");
                }
                binding.resolution = res;
            }
        } else {
            throw ConfigurationError(where + " must be a string or an object", "config");
        }

        auto idCheck = InputValidator::validateDeviceId(binding.id);
        if (!idCheck.isValid) {
            throw ConfigurationError(where + ": " + idCheck.errorMessage, "config");
        }
        bindings.push_back(binding);
    }

    return bindings;
}

std::string ConfigManager::getConfigPath() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_configPath;
}

nlohmann::json ConfigManager::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

} // namespace emuflow
