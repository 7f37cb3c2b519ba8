#include "file_utils.h"
#include "structured_logger.h"
#include "input_validator.h"
#include <fstream>
#include <filesystem>
#include <sstream>

namespace emuflow {
namespace utils {

bool FileUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput,
                                 std::string* errorMessage) {
    auto fail = [errorMessage](const std::string& message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    if (!validateFilePath(filePath)) {
        return fail("Invalid file path: " + filePath);
    }

    if (!fileExists(filePath)) {
        SLOG_DEBUG().message("File not found").context("path", filePath);
        return fail("File not found: " + filePath);
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return fail("Cannot open file: " + filePath);
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return fail(std::string("JSON parse error: ") + e.what());
    }

    if (file.bad()) {
        SLOG_ERROR().message("Failed to read JSON from file").context("path", filePath);
        return fail("Failed to read file: " + filePath);
    }

    SLOG_DEBUG().message("Loaded JSON from file").context("path", filePath);
    return true;
}

bool FileUtils::saveJsonToFile(const std::string& filePath, const nlohmann::json& jsonData) {
    std::string content;
    try {
        content = jsonData.dump(2);
    } catch (const nlohmann::json::type_error& e) {
        SLOG_ERROR().message("JSON serialization error").context("path", filePath).context("error", e.what());
        return false;
    }
    return writeStringToFile(filePath, content + "\n");
}

bool FileUtils::fileExists(const std::string& filePath) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    std::error_code ec;
    return std::filesystem::is_regular_file(filePath, ec);
}

bool FileUtils::createDirectoryIfNotExists(const std::string& directoryPath) {
    if (directoryPath.empty()) {
        SLOG_ERROR().message("Empty directory path provided to createDirectoryIfNotExists");
        return false;
    }

    std::error_code ec;
    if (std::filesystem::exists(directoryPath, ec)) {
        if (std::filesystem::is_directory(directoryPath, ec)) {
            return true;
        }
        SLOG_ERROR().message("Path exists but is not a directory").context("path", directoryPath);
        return false;
    }

    std::filesystem::create_directories(directoryPath, ec);
    if (ec) {
        SLOG_ERROR().message("Could not create directory").context("path", directoryPath).context("error", ec.message());
        return false;
    }

    SLOG_DEBUG().message("Created directory").context("path", directoryPath);
    return true;
}

bool FileUtils::readFileToString(const std::string& filePath, std::string& content) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!fileExists(filePath)) {
        SLOG_ERROR().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath, std::ios::binary);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        SLOG_ERROR().message("Error reading file content").context("path", filePath);
        return false;
    }

    content = buffer.str();
    return true;
}

bool FileUtils::writeStringToFile(const std::string& filePath, const std::string& content) {
    if (!validateFilePath(filePath)) {
        return false;
    }

    if (!ensureParentDirectoryExists(filePath)) {
        SLOG_ERROR().message("Cannot create parent directory").context("path", filePath);
        return false;
    }

    std::string tempFilePath = filePath + ".tmp";
    std::error_code ec;

    {
        std::ofstream tempFile(tempFilePath, std::ios::binary | std::ios::trunc);
        if (!tempFile.is_open()) {
            SLOG_ERROR().message("Cannot create temporary file").context("temp_path", tempFilePath);
            return false;
        }

        tempFile << content;
        tempFile.flush();

        if (tempFile.fail()) {
            SLOG_ERROR().message("Failed to write content to temporary file").context("temp_path", tempFilePath);
            tempFile.close();
            std::filesystem::remove(tempFilePath, ec);
            return false;
        }
    }

    std::filesystem::rename(tempFilePath, filePath, ec);
    if (ec) {
        SLOG_ERROR().message("Failed to rename temporary file").context("path", filePath).context("error", ec.message());
        std::error_code cleanup;
        std::filesystem::remove(tempFilePath, cleanup);
        return false;
    }

    SLOG_DEBUG().message("Wrote file").context("path", filePath).context("bytes", content.length());
    return true;
}

bool FileUtils::validateFilePath(const std::string& filePath) {
    auto validation = InputValidator::validateFilePath(filePath);
    if (!validation.isValid) {
        SLOG_ERROR().message("Invalid file path").context("path", filePath).context("error", validation.errorMessage);
        return false;
    }
    return true;
}

bool FileUtils::ensureParentDirectoryExists(const std::string& filePath) {
    std::filesystem::path parentPath = std::filesystem::path(filePath).parent_path();
    if (parentPath.empty()) {
        return true;
    }
    return createDirectoryIfNotExists(parentPath.string());
}

} // namespace utils
} // namespace emuflow
