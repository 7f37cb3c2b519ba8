#ifndef EMUFLOW_STRUCTURED_LOGGER_H
#define EMUFLOW_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

namespace emuflow {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,
    CRITICAL
};

LogLevel logLevelFromString(const std::string& level, LogLevel fallback = LogLevel::INFO);
std::string logLevelToString(LogLevel level);

/**
 * @brief One log record
 *
 * target, command and iteration locate the record inside a run. target
 * defaults to the LogTargetScope of the emitting thread; iteration is -1
 * outside command dispatch.
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string file;
    int line;
    std::thread::id thread_id;

    std::string target;
    std::string command_id;
    std::string command_name;
    int iteration;

    nlohmann::json context;

    // Set for timing records only
    std::string operation_name;
    std::chrono::nanoseconds duration;

    LogEntry() : level(LogLevel::INFO), line(0), iteration(-1), duration(0) {}
};

/**
 * @brief Tags every record logged on this thread with a target id
 *
 * Workers open one for the duration of a run so device and capture calls
 * made on their behalf carry the target. Scopes nest.
 */
class LogTargetScope {
public:
    explicit LogTargetScope(const std::string& targetId);
    ~LogTargetScope();

    LogTargetScope(const LogTargetScope&) = delete;
    LogTargetScope& operator=(const LogTargetScope&) = delete;

    static std::string current();

private:
    std::string m_previous;
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line, used for file sinks
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Console sink; ERROR and above go to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File sink with size based rotation (app.log, app.1.log, ...)
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config,
                        std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openNewFile();
    std::string generateFileName(int index = 0);
};

/**
 * @brief Aggregated timings for named operations (capture, device calls)
 */
class PerformanceTracker {
public:
    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    void reset();

private:
    struct Metrics {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> total_duration_ns{0};
        std::atomic<uint64_t> min_duration_ns{UINT64_MAX};
        std::atomic<uint64_t> max_duration_ns{0};
        std::atomic<uint64_t> errors{0};
    };

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> m_metrics;
};

/**
 * @brief RAII performance timer
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_success = false; }
    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_success;
    bool m_cancelled;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);

    void log(const LogEntry& entry);
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& context = {});

    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);

    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;

        LogBuilder& message(const std::string& msg);
        LogBuilder& target(const std::string& targetId);
        LogBuilder& command(const std::string& id, const std::string& name);
        LogBuilder& iteration(int value);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();

    std::atomic<LogLevel> m_min_level;
    std::atomic<int64_t> m_slow_threshold_ms;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;

    PerformanceTracker m_performance_tracker;
};

#define SLOG_DEBUG() emuflow::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() emuflow::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() emuflow::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() emuflow::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() emuflow::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) emuflow::ScopedTimer _timer(operation)

} // namespace emuflow

#endif // EMUFLOW_STRUCTURED_LOGGER_H
