#include "worker_manager.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <chrono>

namespace emuflow {

WorkerManager::WorkerManager(ocal::IDeviceController& controller,
                             ocal::DeviceResolutionService& resolution,
                             CaptureCache& capture,
                             const WorkerOptions& options)
    : m_controller(controller),
      m_resolution(resolution),
      m_capture(capture),
      m_options(options) {
}

WorkerManager::~WorkerManager() {
    stopAll();
    waitAll();
}

void WorkerManager::createWorkers(const std::vector<TargetBinding>& bindings) {
    std::map<std::string, std::unique_ptr<Worker>> workers;
    for (const auto& binding : bindings) {
        if (binding.id.empty()) {
            throw ConfigurationError("Target binding without an id", "workers");
        }
        if (workers.count(binding.id)) {
            throw ConfigurationError("Target '" + binding.id + "' is bound twice", "workers");
        }
        workers[binding.id] = std::make_unique<Worker>(binding, m_controller, m_resolution, m_capture, m_options);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& pair : m_workers) {
        WorkerState state = pair.second->getState();
        if (state == WorkerState::RUNNING || state == WorkerState::PAUSED) {
            throw ConfigurationError("Cannot replace workers while '" + pair.first + "' is running", "workers");
        }
    }
    m_workers = std::move(workers);

    SLOG_INFO().message("Workers created").context("count", m_workers.size());
}

std::vector<TargetBinding> WorkerManager::discoverTargets() {
    std::vector<TargetBinding> bindings;
    for (const auto& id : m_controller.listTargets()) {
        TargetBinding binding;
        binding.id = id;
        binding.surface = m_controller.observeSurface(id);
        if (!binding.surface) {
            SLOG_WARNING().message("Target surface not observable").target(id);
        }
        bindings.push_back(binding);
    }
    SLOG_INFO().message("Targets discovered").context("count", bindings.size());
    return bindings;
}

void WorkerManager::startAll(std::shared_ptr<const Script> script) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_workers.empty()) {
        throw ConfigurationError("No targets to run on", "workers");
    }
    for (auto& pair : m_workers) {
        pair.second->start(script);
    }
    SLOG_INFO().message("All workers started").context("count", m_workers.size());
}

void WorkerManager::pauseAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& pair : m_workers) {
        pair.second->pause();
    }
}

void WorkerManager::resumeAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& pair : m_workers) {
        pair.second->resume();
    }
}

void WorkerManager::stopAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& pair : m_workers) {
        pair.second->stop();
    }
}

std::map<std::string, RunReport> WorkerManager::waitAll(int timeoutMs) {
    // Wait without holding m_mutex so stopAll() stays callable meanwhile
    std::vector<std::pair<std::string, Worker*>> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& pair : m_workers) {
            workers.emplace_back(pair.first, pair.second.get());
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs < 0 ? 0 : timeoutMs);
    std::map<std::string, RunReport> reports;
    for (auto& pair : workers) {
        if (timeoutMs < 0) {
            pair.second->waitForCompletion();
        } else {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (!pair.second->waitForCompletion(static_cast<int>(remaining > 0 ? remaining : 0))) {
                SLOG_DEBUG().message("Worker still running at deadline").target(pair.first);
            }
        }
        reports[pair.first] = pair.second->getReport();
    }
    return reports;
}

std::map<std::string, RunReport> WorkerManager::getReports() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::map<std::string, RunReport> reports;
    for (const auto& pair : m_workers) {
        reports[pair.first] = pair.second->getReport();
    }
    return reports;
}

Worker* WorkerManager::getWorker(const std::string& targetId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_workers.find(targetId);
    return it != m_workers.end() ? it->second.get() : nullptr;
}

std::vector<std::string> WorkerManager::getTargetIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& pair : m_workers) {
        ids.push_back(pair.first);
    }
    return ids;
}

size_t WorkerManager::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.size();
}

bool WorkerManager::isAnyRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& pair : m_workers) {
        WorkerState state = pair.second->getState();
        if (state == WorkerState::RUNNING || state == WorkerState::PAUSED) {
            return true;
        }
    }
    return false;
}

} // namespace emuflow
