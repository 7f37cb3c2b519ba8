#ifndef EMUFLOW_INPUT_VALIDATOR_H
#define EMUFLOW_INPUT_VALIDATOR_H

#include <string>
#include <regex>

namespace emuflow {

/**
 * @class InputValidator
 * @brief Validation of values that cross the process boundary
 *
 * Device identifiers and file paths are checked here before they are handed
 * to the shell transport or the filesystem.
 */
class InputValidator {
public:
    static bool isNotEmpty(const std::string& input);
    static bool matchesPattern(const std::string& input, const std::string& pattern);

    static bool isInRange(int value, int min, int max);
    static bool isNonNegative(int value);

    /**
     * @brief Wrap a value in single quotes so a POSIX shell reads it verbatim
     */
    static std::string quoteForShell(const std::string& input);

    struct ValidationResult {
        bool isValid;
        std::string errorMessage;

        ValidationResult(bool valid, const std::string& error = "")
            : isValid(valid), errorMessage(error) {}

        operator bool() const { return isValid; }
    };

    static ValidationResult validateFilePath(const std::string& path);

    /**
     * @brief Accepts emulator-NNNN, host:port and plain ADB serials
     * ([A-Za-z0-9._:-], at most 64 characters)
     */
    static ValidationResult validateDeviceId(const std::string& deviceId);

private:
    static bool containsControlCharacters(const std::string& input);
    static bool containsNullByte(const std::string& input);

    static const std::regex DEVICE_ID_PATTERN;
    static const std::regex EMULATOR_ID_PATTERN;
    static const std::regex NETWORK_ID_PATTERN;
};

} // namespace emuflow

#endif // EMUFLOW_INPUT_VALIDATOR_H
