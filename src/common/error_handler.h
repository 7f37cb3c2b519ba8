#ifndef EMUFLOW_ERROR_HANDLER_H
#define EMUFLOW_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <mutex>
#include <vector>
#include <chrono>

namespace emuflow {

enum class ErrorType {
    CONFIGURATION_ERROR,
    COMMAND_EXECUTION_ERROR,
    TIMEOUT_ERROR,
    CAPABILITY_ERROR,
    OUT_OF_RANGE_ERROR,
    ITERATION_LIMIT_EXCEEDED,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class EmuflowException : public std::exception {
public:
    explicit EmuflowException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType getType() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Invalid script, command field, label reference or config document.
 * Always fatal; never routed through a command's on-fail policy.
 */
class ConfigurationError : public EmuflowException {
public:
    explicit ConfigurationError(const std::string& message, const std::string& context = "")
        : EmuflowException(ErrorInfo(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                                     message, "", context)) {}
};

/**
 * @brief A dispatched command did not achieve its effect.
 * Handled per command by the worker according to the command's on-fail policy.
 */
class CommandExecutionError : public EmuflowException {
public:
    explicit CommandExecutionError(const std::string& message, const std::string& context = "")
        : EmuflowException(ErrorInfo(ErrorType::COMMAND_EXECUTION_ERROR, ErrorSeverity::MEDIUM,
                                     message, "", context)) {}

protected:
    CommandExecutionError(ErrorType type, const std::string& message, const std::string& context)
        : EmuflowException(ErrorInfo(type, ErrorSeverity::MEDIUM, message, "", context)) {}
};

class TimeoutError : public CommandExecutionError {
public:
    explicit TimeoutError(const std::string& message, const std::string& context = "")
        : CommandExecutionError(ErrorType::TIMEOUT_ERROR, message, context) {}
};

class OutOfRangeError : public CommandExecutionError {
public:
    explicit OutOfRangeError(const std::string& message, const std::string& context = "")
        : CommandExecutionError(ErrorType::OUT_OF_RANGE_ERROR, message, context) {}
};

/**
 * @brief Every capture provider failed for a target. Fatal for that worker only.
 */
class CapabilityError : public EmuflowException {
public:
    explicit CapabilityError(const std::string& message, const std::string& context = "")
        : EmuflowException(ErrorInfo(ErrorType::CAPABILITY_ERROR, ErrorSeverity::HIGH,
                                     message, "", context)) {}
};

class IterationLimitExceeded : public EmuflowException {
public:
    explicit IterationLimitExceeded(const std::string& message, const std::string& context = "")
        : EmuflowException(ErrorInfo(ErrorType::ITERATION_LIMIT_EXCEEDED, ErrorSeverity::HIGH,
                                     message, "", context)) {}
};

class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    // Error logging and tracking
    void logError(const ErrorInfo& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10);
    size_t getErrorCount(ErrorType type);
    void clearErrorHistory();

    static std::string errorTypeToString(ErrorType type);
    static std::string errorSeverityToString(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    std::mutex m_mutex;
    std::vector<ErrorInfo> m_errorHistory;
};

} // namespace emuflow

#endif // EMUFLOW_ERROR_HANDLER_H
