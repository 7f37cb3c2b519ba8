#ifndef EMUFLOW_DEVICE_RESOLUTION_SERVICE_H
#define EMUFLOW_DEVICE_RESOLUTION_SERVICE_H

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include "device_interface.h"
#include "../common/types.h"

namespace emuflow {
namespace ocal {

enum class ResolutionTier {
    NONE,       // unresolved
    PRIMARY,    // wm size
    SECONDARY,  // dumpsys display
    CACHED
};

enum class QueryFailure {
    NONE,
    TIMEOUT,
    TRANSPORT,
    PARSE,
    INVALID_ID
};

std::string resolutionTierToString(ResolutionTier tier);
std::string queryFailureToString(QueryFailure failure);

struct ResolutionRecord {
    std::string targetId;
    std::optional<Resolution> resolution;
    ResolutionTier tier;
    QueryFailure primaryFailure;
    QueryFailure secondaryFailure;
    std::chrono::system_clock::time_point resolvedAt;

    ResolutionRecord()
        : tier(ResolutionTier::NONE),
          primaryFailure(QueryFailure::NONE),
          secondaryFailure(QueryFailure::NONE) {}

    bool isResolved() const { return resolution.has_value(); }
};

/**
 * @class DeviceResolutionService
 * @brief Resolves the physical display size of targets
 *
 * One instance is shared by every worker. Queries for the same target are
 * serialized behind a per-target lock, queries for different targets run
 * in parallel. Only successful results are cached.
 */
class DeviceResolutionService {
public:
    explicit DeviceResolutionService(IDeviceShell& shell, int defaultTimeoutMs = 5000);

    DeviceResolutionService(const DeviceResolutionService&) = delete;
    DeviceResolutionService& operator=(const DeviceResolutionService&) = delete;

    // Never throws; an unresolved record describes why each tier failed
    ResolutionRecord queryResolution(const std::string& targetId);
    ResolutionRecord queryResolution(const std::string& targetId, int timeoutMs);

    void invalidate(const std::string& targetId);
    void clear();

    std::optional<ResolutionRecord> getCached(const std::string& targetId) const;

    // "Physical size: 1080x1920" plus an optional "Override size: WxH" line, which wins
    static std::optional<Resolution> parseWmSize(const std::string& output);

    // First "W x H" pair with 3 or 4 digit components
    static std::optional<Resolution> parseDumpsysDisplay(const std::string& output);

private:
    QueryFailure classify(const ShellResult& result) const;
    std::mutex& targetMutex(const std::string& targetId);

    IDeviceShell& m_shell;
    int m_defaultTimeoutMs;

    mutable std::mutex m_mapMutex;
    std::map<std::string, std::unique_ptr<std::mutex>> m_targetMutexes;
    std::map<std::string, ResolutionRecord> m_cache;
};

} // namespace ocal
} // namespace emuflow

#endif // EMUFLOW_DEVICE_RESOLUTION_SERVICE_H
