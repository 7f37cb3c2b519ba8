#include "device_resolution_service.h"
#include "../common/structured_logger.h"
#include "../common/input_validator.h"
#include <regex>

namespace emuflow {
namespace ocal {

namespace {

std::optional<Resolution> toResolution(const std::string& width, const std::string& height) {
    try {
        Resolution resolution(std::stoi(width), std::stoi(height));
        if (resolution.isValid()) {
            return resolution;
        }
    } catch (const std::exception&) {
        // Out of int range; treated as unparseable
    }
    return std::nullopt;
}

} // anonymous namespace

std::string resolutionTierToString(ResolutionTier tier) {
    switch (tier) {
        case ResolutionTier::NONE: return "none";
        case ResolutionTier::PRIMARY: return "wm_size";
        case ResolutionTier::SECONDARY: return "dumpsys_display";
        case ResolutionTier::CACHED: return "cached";
    }
    return "unknown";
}

std::string queryFailureToString(QueryFailure failure) {
    switch (failure) {
        case QueryFailure::NONE: return "none";
        case QueryFailure::TIMEOUT: return "timeout";
        case QueryFailure::TRANSPORT: return "transport";
        case QueryFailure::PARSE: return "parse";
        case QueryFailure::INVALID_ID: return "invalid_id";
    }
    return "unknown";
}

DeviceResolutionService::DeviceResolutionService(IDeviceShell& shell, int defaultTimeoutMs)
    : m_shell(shell),
      m_defaultTimeoutMs(defaultTimeoutMs > 0 ? defaultTimeoutMs : 5000) {
}

std::optional<Resolution> DeviceResolutionService::parseWmSize(const std::string& output) {
    static const std::regex overridePattern(R"(Override size:\s*(\d+)\s*x\s*(\d+))");
    static const std::regex anyPattern(R"((\d+)x(\d+))");

    std::smatch match;
    if (std::regex_search(output, match, overridePattern)) {
        auto resolution = toResolution(match[1].str(), match[2].str());
        if (resolution) {
            return resolution;
        }
    }
    if (std::regex_search(output, match, anyPattern)) {
        return toResolution(match[1].str(), match[2].str());
    }
    return std::nullopt;
}

std::optional<Resolution> DeviceResolutionService::parseDumpsysDisplay(const std::string& output) {
    static const std::regex pattern(R"((\d{3,4})\s*x\s*(\d{3,4}))");

    std::smatch match;
    if (std::regex_search(output, match, pattern)) {
        return toResolution(match[1].str(), match[2].str());
    }
    return std::nullopt;
}

QueryFailure DeviceResolutionService::classify(const ShellResult& result) const {
    switch (result.status) {
        case ShellStatus::TIMEOUT: return QueryFailure::TIMEOUT;
        case ShellStatus::TRANSPORT_ERROR: return QueryFailure::TRANSPORT;
        case ShellStatus::OK: break;
    }
    return result.exitCode == 0 ? QueryFailure::NONE : QueryFailure::TRANSPORT;
}

std::mutex& DeviceResolutionService::targetMutex(const std::string& targetId) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto& slot = m_targetMutexes[targetId];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

ResolutionRecord DeviceResolutionService::queryResolution(const std::string& targetId) {
    return queryResolution(targetId, m_defaultTimeoutMs);
}

ResolutionRecord DeviceResolutionService::queryResolution(const std::string& targetId, int timeoutMs) {
    ResolutionRecord record;
    record.targetId = targetId;

    auto idCheck = InputValidator::validateDeviceId(targetId);
    if (!idCheck.isValid) {
        record.primaryFailure = QueryFailure::INVALID_ID;
        record.secondaryFailure = QueryFailure::INVALID_ID;
        SLOG_WARNING().message("Resolution query rejected")
            .target(targetId)
            .context("reason", idCheck.errorMessage);
        return record;
    }

    if (timeoutMs <= 0) {
        timeoutMs = m_defaultTimeoutMs;
    }

    std::lock_guard<std::mutex> targetLock(targetMutex(targetId));

    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        auto cached = m_cache.find(targetId);
        if (cached != m_cache.end()) {
            ResolutionRecord hit = cached->second;
            hit.tier = ResolutionTier::CACHED;
            return hit;
        }
    }

    // Primary: wm size
    ShellResult primary;
    {
        SCOPED_TIMER("resolution.wm_size");
        primary = m_shell.runShell(targetId, "wm size", timeoutMs);
    }
    record.primaryFailure = classify(primary);
    if (record.primaryFailure == QueryFailure::NONE) {
        record.resolution = parseWmSize(primary.output);
        if (record.resolution) {
            record.tier = ResolutionTier::PRIMARY;
        } else {
            record.primaryFailure = QueryFailure::PARSE;
        }
    }

    if (!record.resolution) {
        SLOG_WARNING().message("Primary resolution query failed, trying dumpsys display")
            .target(targetId)
            .context("failure", queryFailureToString(record.primaryFailure))
            .context("timeout_ms", timeoutMs);

        ShellResult secondary;
        {
            SCOPED_TIMER("resolution.dumpsys_display");
            secondary = m_shell.runShell(targetId, "dumpsys display", timeoutMs);
        }
        record.secondaryFailure = classify(secondary);
        if (record.secondaryFailure == QueryFailure::NONE) {
            record.resolution = parseDumpsysDisplay(secondary.output);
            if (record.resolution) {
                record.tier = ResolutionTier::SECONDARY;
            } else {
                record.secondaryFailure = QueryFailure::PARSE;
            }
        }
    }

    if (!record.resolution) {
        SLOG_ERROR().message("Resolution unresolved")
            .target(targetId)
            .context("primary_failure", queryFailureToString(record.primaryFailure))
            .context("secondary_failure", queryFailureToString(record.secondaryFailure));
        return record;
    }

    record.resolvedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        m_cache[targetId] = record;
    }

    SLOG_INFO().message("Resolution resolved")
        .target(targetId)
        .context("width", record.resolution->width)
        .context("height", record.resolution->height)
        .context("tier", resolutionTierToString(record.tier));
    return record;
}

void DeviceResolutionService::invalidate(const std::string& targetId) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    m_cache.erase(targetId);
}

void DeviceResolutionService::clear() {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    m_cache.clear();
}

std::optional<ResolutionRecord> DeviceResolutionService::getCached(const std::string& targetId) const {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto it = m_cache.find(targetId);
    if (it == m_cache.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ocal
} // namespace emuflow
