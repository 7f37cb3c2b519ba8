#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>
#include <algorithm>

namespace emuflow {

namespace {
    const size_t MAX_ERROR_HISTORY = 1000;
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    logError(error);

    // Critical errors are never absorbed here
    if (error.severity == ErrorSeverity::CRITICAL) {
        throw EmuflowException(error);
    }
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const EmuflowException* emuflowError = dynamic_cast<const EmuflowException*>(&e);
    if (emuflowError) {
        ErrorInfo info = emuflowError->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        ErrorInfo error(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH,
                       e.what(), "", context);
        handleError(error);
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);

        if (m_errorHistory.size() > MAX_ERROR_HISTORY) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }

    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] "
               << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::CRITICAL:
            SLOG_CRITICAL().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + start, m_errorHistory.end());
}

size_t ErrorHandler::getErrorCount(ErrorType type) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_errorHistory.begin(), m_errorHistory.end(),
        [type](const ErrorInfo& info) { return info.type == type; }));
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::CONFIGURATION_ERROR: return "ConfigurationError";
        case ErrorType::COMMAND_EXECUTION_ERROR: return "CommandExecutionError";
        case ErrorType::TIMEOUT_ERROR: return "TimeoutError";
        case ErrorType::CAPABILITY_ERROR: return "CapabilityError";
        case ErrorType::OUT_OF_RANGE_ERROR: return "OutOfRangeError";
        case ErrorType::ITERATION_LIMIT_EXCEEDED: return "IterationLimitExceeded";
        case ErrorType::UNKNOWN_ERROR: return "UnknownError";
        default: return "UnknownError";
    }
}

std::string ErrorHandler::errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace emuflow
