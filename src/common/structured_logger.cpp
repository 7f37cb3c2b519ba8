#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace emuflow {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t, &tm_buf);

        std::stringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }

    double durationMs(std::chrono::nanoseconds duration) {
        return std::chrono::duration<double, std::milli>(duration).count();
    }

    thread_local std::string t_logTarget;
}

// LogTargetScope implementation
LogTargetScope::LogTargetScope(const std::string& targetId)
    : m_previous(t_logTarget) {
    t_logTarget = targetId;
}

LogTargetScope::~LogTargetScope() {
    t_logTarget = m_previous;
}

std::string LogTargetScope::current() {
    return t_logTarget;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel logLevelFromString(const std::string& level, LogLevel fallback) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return fallback;
}

// JsonLogFormatter implementation
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json record = {
        {"timestamp", formatTimestamp(entry.timestamp)},
        {"level", logLevelToString(entry.level)},
        {"message", entry.message},
        {"thread", threadIdToString(entry.thread_id)}
    };

    if (!entry.target.empty()) {
        record["target"] = entry.target;
    }
    if (!entry.command_id.empty() || !entry.command_name.empty()) {
        record["command"] = {{"id", entry.command_id}, {"name", entry.command_name}};
    }
    if (entry.iteration >= 0) {
        record["iteration"] = entry.iteration;
    }
    if (!entry.operation_name.empty()) {
        record["operation"] = entry.operation_name;
        record["duration_ms"] = durationMs(entry.duration);
    }
    if (!entry.file.empty()) {
        record["source"] = {{"file", fs::path(entry.file).filename().string()}, {"line", entry.line}};
    }
    if (!entry.context.empty()) {
        record["context"] = entry.context;
    }

    // Replace invalid UTF-8 from device output instead of throwing
    return record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

// TextLogFormatter implementation
// [time] [LEVEL] [target] command#iteration: message (file:line) [operation: ms] {context}
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::ostringstream out;
    out << "[" << formatTimestamp(entry.timestamp) << "] "
        << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    if (!entry.target.empty()) {
        out << "[" << entry.target << "] ";
    }
    if (!entry.command_name.empty()) {
        out << entry.command_name;
        if (entry.iteration >= 0) {
            out << "#" << entry.iteration;
        }
        out << ": ";
    }
    out << entry.message;

    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        out << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }
    if (!entry.operation_name.empty()) {
        out << " [" << entry.operation_name << ": " << std::fixed << std::setprecision(2)
            << durationMs(entry.duration) << "ms]";
    }
    if (!entry.context.empty()) {
        out << " " << entry.context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    out << "\n";
    return out.str();
}

// ConsoleLogSink implementation
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(formatter) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);

    if (entry.level >= LogLevel::ERROR_LEVEL) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink implementation
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(formatter), m_current_size(0) {
    fs::path parent = fs::path(m_config.base_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent.string()
                      << ": " << ec.message() << "\n";
        }
    }
    openNewFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openNewFile();
        if (!m_file->is_open()) {
            return;
        }
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();

    std::error_code ec;
    for (int i = static_cast<int>(m_config.max_files) - 1; i >= 1; --i) {
        std::string old_name = generateFileName(i);
        if (!fs::exists(old_name, ec)) {
            continue;
        }
        if (i == static_cast<int>(m_config.max_files) - 1) {
            fs::remove(old_name, ec);  // Remove oldest
        } else {
            fs::rename(old_name, generateFileName(i + 1), ec);
        }
    }

    if (m_config.max_files > 1) {
        fs::rename(m_config.base_path, generateFileName(1), ec);
    } else {
        fs::remove(m_config.base_path, ec);
    }

    openNewFile();
}

void RotatingFileLogSink::openNewFile() {
    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    std::error_code ec;
    auto size = fs::file_size(m_config.base_path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

std::string RotatingFileLogSink::generateFileName(int index) {
    if (index == 0) {
        return m_config.base_path;
    }

    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

// PerformanceTracker implementation
double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (static_cast<double>(total_duration_ns) / count) / 1000000.0;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    nlohmann::json j;
    j["count"] = count;
    j["errors"] = errors;
    j["average_ms"] = getAverageDurationMs();
    j["min_ms"] = count == 0 ? 0.0 : min_duration_ns / 1000000.0;
    j["max_ms"] = max_duration_ns / 1000000.0;
    j["total_ms"] = total_duration_ns / 1000000.0;
    return j;
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    Metrics* metrics = nullptr;
    {
        std::shared_lock<std::shared_mutex> readLock(m_mutex);
        auto it = m_metrics.find(operation);
        if (it != m_metrics.end()) {
            metrics = it->second.get();
        }
    }
    if (!metrics) {
        std::unique_lock<std::shared_mutex> writeLock(m_mutex);
        auto& slot = m_metrics[operation];
        if (!slot) {
            slot = std::make_unique<Metrics>();
        }
        metrics = slot.get();
    }

    uint64_t dur = static_cast<uint64_t>(duration.count());
    metrics->count++;
    metrics->total_duration_ns += dur;

    uint64_t current_min = metrics->min_duration_ns.load();
    while (dur < current_min &&
           !metrics->min_duration_ns.compare_exchange_weak(current_min, dur)) {}

    uint64_t current_max = metrics->max_duration_ns.load();
    while (dur > current_max &&
           !metrics->max_duration_ns.compare_exchange_weak(current_max, dur)) {}

    if (!success) {
        metrics->errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    MetricsSnapshot result;
    auto it = m_metrics.find(operation);
    if (it != m_metrics.end() && it->second) {
        result.count = it->second->count.load();
        result.total_duration_ns = it->second->total_duration_ns.load();
        result.min_duration_ns = it->second->min_duration_ns.load();
        result.max_duration_ns = it->second->max_duration_ns.load();
        result.errors = it->second->errors.load();
    }
    return result;
}

std::unordered_map<std::string, PerformanceTracker::MetricsSnapshot>
PerformanceTracker::getAllMetrics() const {
    std::unordered_map<std::string, MetricsSnapshot> result;
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [op, metrics] : m_metrics) {
            names.push_back(op);
        }
    }
    for (const auto& name : names) {
        result[name] = getMetrics(name);
    }
    return result;
}

void PerformanceTracker::reset() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_metrics.clear();
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now())
    , m_success(true)
    , m_cancelled(false) {}

ScopedTimer::~ScopedTimer() {
    if (!m_cancelled && !m_operation_name.empty()) {
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - m_start);
        StructuredLogger::getInstance().logPerformance(m_operation_name, duration, m_success);
    }
}

// StructuredLogger implementation
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_slow_threshold_ms(1000) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(sink);
}

void StructuredLogger::removeSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    m_slow_threshold_ms = threshold.count();
}

void StructuredLogger::log(const LogEntry& entry) {
    if (entry.level < m_min_level.load()) return;

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

void StructuredLogger::log(LogLevel level, const std::string& message,
                           const nlohmann::json& context) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.thread_id = std::this_thread::get_id();
    entry.target = t_logTarget;
    entry.context = context;

    log(entry);
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success) {
    m_performance_tracker.recordOperation(operation, duration, success);

    bool slow = duration > std::chrono::milliseconds(m_slow_threshold_ms.load());
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = slow ? LogLevel::WARNING : LogLevel::DEBUG;
    entry.message = slow ? "Slow operation detected" : "Operation timed";
    entry.thread_id = std::this_thread::get_id();
    entry.target = t_logTarget;
    entry.operation_name = operation;
    entry.duration = duration;
    if (!success) {
        entry.context["failed"] = true;
    }
    log(entry);
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

// LogBuilder implementation
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
    m_entry.target = t_logTarget;
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger)
    , m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::target(const std::string& targetId) {
    m_entry.target = targetId;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::command(const std::string& id, const std::string& name) {
    m_entry.command_id = id;
    m_entry.command_name = name;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::iteration(int value) {
    m_entry.iteration = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace emuflow
