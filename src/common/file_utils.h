#ifndef EMUFLOW_FILE_UTILS_H
#define EMUFLOW_FILE_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace emuflow {
namespace utils {

/**
 * @brief File I/O helpers used for scripts, configuration and capture dumps
 *
 * All functions report failure through their return value and log the cause;
 * none of them throw.
 */
class FileUtils {
public:
    /**
     * @brief Load and parse a JSON document
     * @param filePath Path to JSON file (must not be empty)
     * @param jsonOutput Receives the parsed document
     * @param errorMessage Receives a description of the failure, if any
     * @return true if the file exists and parsed cleanly
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput,
                                 std::string* errorMessage = nullptr);

    /**
     * @brief Save JSON to file atomically (temp file + rename)
     * @param filePath Destination path; parent directories are created
     * @param jsonData Document to write, pretty printed with 2 space indent
     * @return true if successful
     */
    static bool saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData);

    static bool fileExists(const std::string& filePath);

    static bool createDirectoryIfNotExists(const std::string& directoryPath);

    static bool readFileToString(const std::string& filePath, std::string& content);

    /**
     * @brief Write string content to file atomically
     * @note Binary safe; used for raw capture dumps as well as text
     */
    static bool writeStringToFile(const std::string& filePath, const std::string& content);

private:
    static bool validateFilePath(const std::string& filePath);
    static bool ensureParentDirectoryExists(const std::string& filePath);
};

} // namespace utils
} // namespace emuflow

#endif // EMUFLOW_FILE_UTILS_H
