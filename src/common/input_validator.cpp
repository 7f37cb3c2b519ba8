#include "input_validator.h"
#include <algorithm>
#include <cctype>

namespace emuflow {

const std::regex InputValidator::DEVICE_ID_PATTERN(R"(^[A-Za-z0-9._:-]{1,64}$)");
const std::regex InputValidator::EMULATOR_ID_PATTERN(R"(^emulator-[0-9]{1,5}$)");
const std::regex InputValidator::NETWORK_ID_PATTERN(R"(^[A-Za-z0-9.-]+:([0-9]{1,5})$)");

namespace {
    const size_t MAX_PATH_LENGTH = 4096;
    const size_t MAX_DEVICE_ID_LENGTH = 64;
}

bool InputValidator::isNotEmpty(const std::string& input) {
    return std::any_of(input.begin(), input.end(),
                       [](unsigned char c) { return !std::isspace(c); });
}

bool InputValidator::matchesPattern(const std::string& input, const std::string& pattern) {
    try {
        std::regex customPattern(pattern);
        return std::regex_match(input, customPattern);
    } catch (const std::regex_error&) {
        return false;
    }
}

bool InputValidator::isInRange(int value, int min, int max) {
    return value >= min && value <= max;
}

bool InputValidator::isNonNegative(int value) {
    return value >= 0;
}

std::string InputValidator::quoteForShell(const std::string& input) {
    std::string result = "'";
    result.reserve(input.length() + 2);
    for (char c : input) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

InputValidator::ValidationResult InputValidator::validateFilePath(const std::string& path) {
    if (path.empty()) {
        return ValidationResult(false, "File path cannot be empty");
    }

    if (containsNullByte(path)) {
        return ValidationResult(false, "File path contains null bytes");
    }

    if (containsControlCharacters(path)) {
        return ValidationResult(false, "File path contains control characters");
    }

    if (path.length() > MAX_PATH_LENGTH) {
        return ValidationResult(false, "File path exceeds maximum length");
    }

    return ValidationResult(true);
}

InputValidator::ValidationResult InputValidator::validateDeviceId(const std::string& deviceId) {
    if (deviceId.empty()) {
        return ValidationResult(false, "Device id cannot be empty");
    }

    if (deviceId.length() > MAX_DEVICE_ID_LENGTH) {
        return ValidationResult(false, "Device id exceeds 64 characters");
    }

    if (!std::regex_match(deviceId, DEVICE_ID_PATTERN)) {
        return ValidationResult(false, "Device id contains characters outside [A-Za-z0-9._:-]");
    }

    if (deviceId.rfind("emulator-", 0) == 0 && !std::regex_match(deviceId, EMULATOR_ID_PATTERN)) {
        return ValidationResult(false, "Emulator id must be emulator-<port>");
    }

    std::smatch match;
    if (deviceId.find(':') != std::string::npos) {
        if (!std::regex_match(deviceId, match, NETWORK_ID_PATTERN)) {
            return ValidationResult(false, "Network device id must be host:port");
        }
        int port = std::stoi(match[1].str());
        if (!isInRange(port, 1, 65535)) {
            return ValidationResult(false, "Network device port out of range");
        }
    }

    return ValidationResult(true);
}

bool InputValidator::containsControlCharacters(const std::string& input) {
    return std::any_of(input.begin(), input.end(), [](unsigned char c) {
        return std::iscntrl(c) && c != '\t';
    });
}

bool InputValidator::containsNullByte(const std::string& input) {
    return input.find('\0') != std::string::npos;
}

} // namespace emuflow
