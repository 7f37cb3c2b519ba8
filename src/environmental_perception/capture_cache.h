#ifndef EMUFLOW_CAPTURE_CACHE_H
#define EMUFLOW_CAPTURE_CACHE_H

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include "capture_provider.h"

namespace emuflow {

/**
 * @class CaptureCache
 * @brief Short lived per-target cache of the latest frame
 *
 * A frame younger than the TTL is served from the cache. Otherwise the
 * providers are tried in order and the first frame obtained replaces the
 * entry. Each target has its own lock, so a slow capture on one target
 * never blocks another.
 */
class CaptureCache {
public:
    CaptureCache(std::vector<std::unique_ptr<ICaptureProvider>> providers,
                 int ttlMs = 1000,
                 int timeoutMs = 5000);

    CaptureCache(const CaptureCache&) = delete;
    CaptureCache& operator=(const CaptureCache&) = delete;

    /**
     * @throws CapabilityError when every provider fails
     */
    std::shared_ptr<const Screenshot> get(const std::string& targetId, bool forceRefresh = false);

    void invalidate(const std::string& targetId);
    void clear();

    std::vector<std::string> getProviderNames() const;
    int getTtlMs() const { return m_ttlMs; }
    int getTimeoutMs() const { return m_timeoutMs; }

private:
    struct Entry {
        std::mutex mutex;
        std::shared_ptr<const Screenshot> frame;
    };

    std::shared_ptr<Entry> entryFor(const std::string& targetId);
    std::shared_ptr<const Screenshot> acquire(const std::string& targetId);

    std::vector<std::unique_ptr<ICaptureProvider>> m_providers;
    int m_ttlMs;
    int m_timeoutMs;

    std::mutex m_mapMutex;
    std::map<std::string, std::shared_ptr<Entry>> m_entries;
};

} // namespace emuflow

#endif // EMUFLOW_CAPTURE_CACHE_H
