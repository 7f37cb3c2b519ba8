#ifndef EMUFLOW_WORKER_H
#define EMUFLOW_WORKER_H

#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <random>
#include <chrono>
#include <nlohmann/json.hpp>
#include "../common/types.h"
#include "../common/error_handler.h"
#include "../script/script.h"
#include "../ocal/device_interface.h"
#include "../ocal/device_resolution_service.h"
#include "../environmental_perception/capture_cache.h"
#include "coordinate_mapper.h"

namespace emuflow {

struct WorkerOptions {
    int waitPollIntervalMs;
    int resolutionTimeoutMs;
    bool humanize;  // honor humanize delays and typing speed; tests turn this off

    WorkerOptions() : waitPollIntervalMs(100), resolutionTimeoutMs(5000), humanize(true) {}
};

// Outcome of one run, readable while the run is still in progress
struct RunReport {
    std::string targetId;
    WorkerState state;
    std::string lastCommandId;
    std::string lastCommandName;
    std::string errorKind;     // ErrorHandler::errorTypeToString, empty on success
    std::string errorMessage;
    int iterations;
    long long elapsedMs;
    nlohmann::json variables;

    RunReport() : state(WorkerState::IDLE), iterations(0), elapsedMs(0),
                  variables(nlohmann::json::object()) {}

    nlohmann::json toJson() const;
};

/**
 * @class Worker
 * @brief Runs a Script against one target on a dedicated thread
 *
 * States: Idle -> Running <-> Paused -> {Stopped | Completed | Failed}.
 * pause(), resume() and stop() may be called from any thread. Stop and
 * pause take effect at the next dispatch boundary or Wait poll tick; a
 * dispatched action is never interrupted.
 *
 * The resolution service and capture cache are shared with other workers
 * and must outlive this one.
 */
class Worker {
public:
    Worker(const TargetBinding& binding,
           ocal::IDeviceController& controller,
           ocal::DeviceResolutionService& resolution,
           CaptureCache& capture,
           const WorkerOptions& options = WorkerOptions());
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /**
     * @brief Begin a run on the worker thread
     * @throws ConfigurationError if a run is already active
     */
    void start(std::shared_ptr<const Script> script);

    // Same as start() + waitForCompletion(), on the calling thread
    RunReport run(std::shared_ptr<const Script> script);

    void pause();
    void resume();
    void stop();

    // Negative timeout waits indefinitely. Returns false if the run is still active.
    bool waitForCompletion(int timeoutMs = -1);

    WorkerState getState() const;
    RunReport getReport() const;
    int getIterationCount() const;
    const std::string& getTargetId() const { return m_binding.id; }
    CoordinateMapper getMapper() const;

private:
    struct StepResult {
        enum Kind { NEXT, JUMP, HALT, INTERRUPTED };
        Kind kind;
        size_t target;

        static StepResult next() { return StepResult{NEXT, 0}; }
        static StepResult jump(size_t index) { return StepResult{JUMP, index}; }
        static StepResult halt() { return StepResult{HALT, 0}; }
        static StepResult interrupted() { return StepResult{INTERRUPTED, 0}; }
    };

    void reset(const Script& script);
    void execute(std::shared_ptr<const Script> script);
    void prepareGeometry();
    void finish(WorkerState state);
    void runErrorHandler(const Script& script);

    // Control flow
    StepResult runPass(const std::vector<Command>& commands, const Script& script);
    StepResult dispatch(const Command& command, const Script& script);
    StepResult applyOnFail(const Command& command, const CommandExecutionError& error, const Script& script);
    size_t resolveJump(const std::string& label, const Script& script) const;
    void consumeIteration(const Script& script);

    // Per-kind handlers; actions throw CommandExecutionError when the target rejects them
    StepResult executeClick(const ClickParams& params, nlohmann::json& result);
    StepResult executeCropImage(const CropImageParams& params, nlohmann::json& result);
    StepResult executeKeyPress(const KeyPressParams& params, nlohmann::json& result);
    StepResult executeHotKey(const HotKeyParams& params, nlohmann::json& result);
    StepResult executeText(const TextParams& params, nlohmann::json& result);
    StepResult executeWait(const WaitParams& params, nlohmann::json& result);
    StepResult executeRepeat(const RepeatParams& params, const Script& script, nlohmann::json& result);
    StepResult executeGoto(const GotoParams& params, const Script& script, nlohmann::json& result);
    StepResult executeCondition(const ConditionParams& params, const Script& script, nlohmann::json& result);

    void applyVariablesOut(const Command& command, const nlohmann::json& result);
    void setVariable(const std::string& key, const nlohmann::json& value);
    void recordFailure(const std::string& kind, const std::string& message);

    // Blocks while paused; false once stop() was requested
    bool checkpoint();
    // Sleeps up to ms; false once stop() was requested
    bool sleepFor(int ms);
    int randomBetween(int low, int high);

    TargetBinding m_binding;
    ocal::IDeviceController& m_controller;
    ocal::DeviceResolutionService& m_resolution;
    CaptureCache& m_capture;
    WorkerOptions m_options;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::mutex m_joinMutex;
    std::thread m_thread;

    // Guarded by m_mutex
    WorkerState m_state;
    bool m_running;
    bool m_paused;
    bool m_stopped;
    RunReport m_report;
    CoordinateMapper m_mapper;

    // Written by the worker thread only; other threads read copies under m_mutex
    nlohmann::json m_variables;
    int m_iterations;
    bool m_inErrorHandler;
    std::chrono::steady_clock::time_point m_startedAt;

    std::mt19937 m_rng;
};

} // namespace emuflow

#endif // EMUFLOW_WORKER_H
