#include "json_utils.h"
#include "structured_logger.h"
#include <cmath>
#include <limits>

namespace emuflow {
namespace utils {

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    if (!json.is_object()) {
        return defaultValue;
    }

    auto it = json.find(fieldName);
    if (it == json.end() || !it->is_string()) {
        return defaultValue;
    }
    return it->get<std::string>();
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    if (!json.is_object()) {
        return defaultValue;
    }

    auto it = json.find(fieldName);
    if (it == json.end() || !it->is_number()) {
        return defaultValue;
    }

    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value) ||
            value > static_cast<double>(std::numeric_limits<int>::max()) ||
            value < static_cast<double>(std::numeric_limits<int>::min())) {
            SLOG_WARNING().message("Numeric field out of int range, using default").context("field", fieldName);
            return defaultValue;
        }
        return static_cast<int>(value);
    }

    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            SLOG_WARNING().message("Numeric field out of int range, using default").context("field", fieldName);
            return defaultValue;
        }
        return static_cast<int>(value);
    }

    auto value = it->get<int64_t>();
    if (value > std::numeric_limits<int>::max() || value < std::numeric_limits<int>::min()) {
        SLOG_WARNING().message("Numeric field out of int range, using default").context("field", fieldName);
        return defaultValue;
    }
    return static_cast<int>(value);
}

const nlohmann::json* JsonUtils::findPath(const nlohmann::json& json, const std::string& path) {
    const nlohmann::json* current = &json;
    size_t start = 0;

    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }

    return current;
}

nlohmann::json JsonUtils::mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay;
    }

    nlohmann::json result = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        auto existing = result.find(it.key());
        if (existing != result.end() && existing->is_object() && it->is_object()) {
            *existing = mergeJsonObjects(*existing, *it);
        } else {
            result[it.key()] = *it;
        }
    }
    return result;
}

} // namespace utils
} // namespace emuflow
