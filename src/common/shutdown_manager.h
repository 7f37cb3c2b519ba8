#ifndef EMUFLOW_SHUTDOWN_MANAGER_H
#define EMUFLOW_SHUTDOWN_MANAGER_H

#include <atomic>

namespace emuflow {

/**
 * @brief Process wide shutdown flag set from the signal handler
 *
 * Only lock free atomics are touched so the setters are async-signal-safe.
 */
class ShutdownManager {
public:
    static ShutdownManager& getInstance() {
        static ShutdownManager instance;
        return instance;
    }

    void requestShutdown() {
        m_shutdown_requested = true;
    }

    bool isShutdownRequested() const {
        return m_shutdown_requested.load();
    }

    int incrementSignalCount() {
        return ++m_signal_count;
    }

private:
    ShutdownManager() : m_shutdown_requested(false), m_signal_count(0) {}

    std::atomic<bool> m_shutdown_requested;
    std::atomic<int> m_signal_count;
};

} // namespace emuflow

#endif // EMUFLOW_SHUTDOWN_MANAGER_H
