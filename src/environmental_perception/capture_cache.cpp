#include "capture_cache.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"

namespace emuflow {

CaptureCache::CaptureCache(std::vector<std::unique_ptr<ICaptureProvider>> providers,
                           int ttlMs,
                           int timeoutMs)
    : m_providers(std::move(providers)),
      m_ttlMs(ttlMs >= 0 ? ttlMs : 0),
      m_timeoutMs(timeoutMs > 0 ? timeoutMs : 5000) {
    if (m_providers.empty()) {
        throw ConfigurationError("Capture cache needs at least one provider", "capture");
    }
}

std::shared_ptr<CaptureCache::Entry> CaptureCache::entryFor(const std::string& targetId) {
    std::lock_guard<std::mutex> lock(m_mapMutex);
    auto& entry = m_entries[targetId];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

std::shared_ptr<const Screenshot> CaptureCache::get(const std::string& targetId, bool forceRefresh) {
    auto entry = entryFor(targetId);
    std::lock_guard<std::mutex> lock(entry->mutex);

    if (!forceRefresh && entry->frame) {
        auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - entry->frame->capturedAt).count();
        if (age < m_ttlMs) {
            return entry->frame;
        }
    }

    entry->frame = acquire(targetId);
    return entry->frame;
}

std::shared_ptr<const Screenshot> CaptureCache::acquire(const std::string& targetId) {
    for (const auto& provider : m_providers) {
        ScopedTimer timer("capture." + provider->name());
        auto frame = provider->grab(targetId, m_timeoutMs);
        if (frame && frame->isValid()) {
            if (frame->provider.empty()) {
                frame->provider = provider->name();
            }
            frame->capturedAt = std::chrono::steady_clock::now();
            SLOG_DEBUG().message("Frame captured")
                .target(targetId)
                .context("provider", provider->name())
                .context("width", frame->width)
                .context("height", frame->height);
            return std::make_shared<const Screenshot>(std::move(*frame));
        }
        timer.markFailed();
        SLOG_DEBUG().message("Capture provider failed, trying next")
            .target(targetId)
            .context("provider", provider->name());
    }

    SLOG_ERROR().message("All capture providers failed")
        .target(targetId)
        .context("providers", getProviderNames());
    throw CapabilityError("No capture provider could grab a frame from " + targetId, targetId);
}

void CaptureCache::invalidate(const std::string& targetId) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        auto it = m_entries.find(targetId);
        if (it == m_entries.end()) {
            return;
        }
        entry = it->second;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->frame.reset();
}

void CaptureCache::clear() {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::lock_guard<std::mutex> lock(m_mapMutex);
        for (const auto& pair : m_entries) {
            entries.push_back(pair.second);
        }
    }
    for (const auto& entry : entries) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->frame.reset();
    }
}

std::vector<std::string> CaptureCache::getProviderNames() const {
    std::vector<std::string> names;
    for (const auto& provider : m_providers) {
        names.push_back(provider->name());
    }
    return names;
}

} // namespace emuflow
