#ifndef EMUFLOW_SCRIPT_SERIALIZER_H
#define EMUFLOW_SCRIPT_SERIALIZER_H

#include <string>
#include <nlohmann/json.hpp>
#include "script.h"

namespace emuflow {

/**
 * @class ScriptSerializer
 * @brief Reads and writes the versioned JSON script document
 *
 * Document layout:
 *   { "version": 1, "max_iterations": N, "variables_global": {...},
 *     "sequence": [command...], "on_error_handler": command|null }
 *
 * Every command field is written, absent optionals as null, so a load
 * followed by a save reproduces the document.
 */
class ScriptSerializer {
public:
    static constexpr int FORMAT_VERSION = 1;

    // All readers throw ConfigurationError on malformed input.
    // defaultMaxIterations applies when the document has no max_iterations.
    static Script fromJson(const nlohmann::json& document,
                           int defaultMaxIterations = Script::DEFAULT_MAX_ITERATIONS);
    static nlohmann::json toJson(const Script& script);

    static Command commandFromJson(const nlohmann::json& json, const std::string& where = "command");
    static nlohmann::json commandToJson(const Command& command);

    static Script loadFromFile(const std::string& path,
                               int defaultMaxIterations = Script::DEFAULT_MAX_ITERATIONS);

    // Returns false and logs when the file cannot be written
    static bool saveToFile(const Script& script, const std::string& path);
};

} // namespace emuflow

#endif // EMUFLOW_SCRIPT_SERIALIZER_H
