#ifndef EMUFLOW_WORKER_MANAGER_H
#define EMUFLOW_WORKER_MANAGER_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "worker.h"

namespace emuflow {

/**
 * @class WorkerManager
 * @brief One Worker per target, all sharing the same collaborators
 *
 * The controller, resolution service and capture cache are borrowed and
 * must outlive the manager.
 */
class WorkerManager {
public:
    WorkerManager(ocal::IDeviceController& controller,
                  ocal::DeviceResolutionService& resolution,
                  CaptureCache& capture,
                  const WorkerOptions& options = WorkerOptions());
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    /**
     * @brief Replace the worker set with one worker per binding
     * @throws ConfigurationError on duplicate or empty target ids, or while workers run
     */
    void createWorkers(const std::vector<TargetBinding>& bindings);

    // Bindings for every target the controller reports, with its observed surface
    std::vector<TargetBinding> discoverTargets();

    void startAll(std::shared_ptr<const Script> script);
    void pauseAll();
    void resumeAll();
    void stopAll();

    /**
     * @brief Wait for every worker, up to timeoutMs in total (negative waits forever)
     * @return target id -> report, including workers still running at the deadline
     */
    std::map<std::string, RunReport> waitAll(int timeoutMs = -1);

    std::map<std::string, RunReport> getReports() const;
    Worker* getWorker(const std::string& targetId);
    std::vector<std::string> getTargetIds() const;
    size_t size() const;
    bool isAnyRunning() const;

private:
    ocal::IDeviceController& m_controller;
    ocal::DeviceResolutionService& m_resolution;
    CaptureCache& m_capture;
    WorkerOptions m_options;

    mutable std::mutex m_mutex;
    std::map<std::string, std::unique_ptr<Worker>> m_workers;
};

} // namespace emuflow

#endif // EMUFLOW_WORKER_MANAGER_H
