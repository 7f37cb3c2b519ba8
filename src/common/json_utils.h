#ifndef EMUFLOW_JSON_UTILS_H
#define EMUFLOW_JSON_UTILS_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace emuflow {
namespace utils {

/**
 * @brief Lenient typed accessors over JSON objects
 *
 * Every getter returns the default value when the field is missing or has an
 * incompatible type. Numeric getters accept any JSON number.
 */
class JsonUtils {
public:
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    /**
     * @brief Look up a field by dot separated path ("capture.ttl_ms")
     * @return Pointer into json, or nullptr if any segment is missing
     */
    static const nlohmann::json* findPath(const nlohmann::json& json, const std::string& path);

    /**
     * @brief Recursively merge overlay into base; overlay wins on conflicts
     */
    static nlohmann::json mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay);
};

} // namespace utils
} // namespace emuflow

#endif // EMUFLOW_JSON_UTILS_H
