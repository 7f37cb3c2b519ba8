#include "worker.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include "../environmental_perception/image_analysis.h"
#include <algorithm>
#include <cmath>

namespace emuflow {

namespace {

const char* LOOP_INDEX_VAR = "_loop_index";

ocal::MouseButton toMouseButton(ButtonType button) {
    switch (button) {
        case ButtonType::LEFT: return ocal::MouseButton::LEFT;
        case ButtonType::RIGHT: return ocal::MouseButton::RIGHT;
        case ButtonType::DOUBLE: return ocal::MouseButton::DOUBLE;
        case ButtonType::WHEEL_UP: return ocal::MouseButton::WHEEL_UP;
        case ButtonType::WHEEL_DOWN: return ocal::MouseButton::WHEEL_DOWN;
    }
    return ocal::MouseButton::LEFT;
}

vision::SearchMode toSearchMode(ScanMode mode) {
    switch (mode) {
        case ScanMode::EXACT: return vision::SearchMode::EXACT;
        case ScanMode::MAX_MATCH: return vision::SearchMode::MAX_MATCH;
        case ScanMode::GRID: return vision::SearchMode::GRID;
    }
    return vision::SearchMode::EXACT;
}

// Split UTF-8 text into code points so humanized typing never cuts a character
std::vector<std::string> splitCodePoints(const std::string& text) {
    std::vector<std::string> chars;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if (lead >= 0xF0) {
            len = 4;
        } else if (lead >= 0xE0) {
            len = 3;
        } else if (lead >= 0xC0) {
            len = 2;
        }
        len = std::min(len, text.size() - i);
        chars.push_back(text.substr(i, len));
        i += len;
    }
    return chars;
}

long long millisSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

// Restores the enclosing value of _loop_index when a Repeat pass ends
class LoopIndexScope {
public:
    LoopIndexScope(nlohmann::json& variables, std::mutex& mutex)
        : m_variables(variables), m_mutex(mutex), m_hadPrevious(false) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_variables.find(LOOP_INDEX_VAR);
        if (it != m_variables.end()) {
            m_previous = *it;
            m_hadPrevious = true;
        }
    }

    ~LoopIndexScope() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_hadPrevious) {
            m_variables[LOOP_INDEX_VAR] = m_previous;
        } else {
            m_variables.erase(LOOP_INDEX_VAR);
        }
    }

    void set(int index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_variables[LOOP_INDEX_VAR] = index;
    }

private:
    nlohmann::json& m_variables;
    std::mutex& m_mutex;
    nlohmann::json m_previous;
    bool m_hadPrevious;
};

} // anonymous namespace

nlohmann::json RunReport::toJson() const {
    nlohmann::json j;
    j["target"] = targetId;
    j["state"] = workerStateToString(state);
    j["last_command_id"] = lastCommandId;
    j["last_command_name"] = lastCommandName;
    j["iterations"] = iterations;
    j["elapsed_ms"] = elapsedMs;
    if (!errorKind.empty()) {
        j["error_kind"] = errorKind;
        j["error_message"] = errorMessage;
    }
    j["variables"] = variables;
    return j;
}

Worker::Worker(const TargetBinding& binding,
               ocal::IDeviceController& controller,
               ocal::DeviceResolutionService& resolution,
               CaptureCache& capture,
               const WorkerOptions& options)
    : m_binding(binding),
      m_controller(controller),
      m_resolution(resolution),
      m_capture(capture),
      m_options(options),
      m_state(WorkerState::IDLE),
      m_running(false),
      m_paused(false),
      m_stopped(false),
      m_variables(nlohmann::json::object()),
      m_iterations(0),
      m_inErrorHandler(false),
      m_startedAt(std::chrono::steady_clock::now()),
      m_rng(std::random_device{}()) {
    if (m_options.waitPollIntervalMs <= 0) {
        m_options.waitPollIntervalMs = 100;
    }
    m_report.targetId = m_binding.id;
}

Worker::~Worker() {
    stop();
    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

void Worker::start(std::shared_ptr<const Script> script) {
    if (!script) {
        throw ConfigurationError("Worker started without a script", m_binding.id);
    }

    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running) {
            throw ConfigurationError("Worker " + m_binding.id + " is already running", m_binding.id);
        }
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }

    reset(*script);
    m_thread = std::thread(&Worker::execute, this, script);
}

RunReport Worker::run(std::shared_ptr<const Script> script) {
    if (!script) {
        throw ConfigurationError("Worker started without a script", m_binding.id);
    }
    {
        std::lock_guard<std::mutex> joinLock(m_joinMutex);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_running) {
                throw ConfigurationError("Worker " + m_binding.id + " is already running", m_binding.id);
            }
        }
        if (m_thread.joinable()) {
            m_thread.join();
        }
        reset(*script);
    }
    execute(script);
    return getReport();
}

void Worker::reset(const Script& script) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_variables = script.variablesGlobal();
    m_iterations = 0;
    m_inErrorHandler = false;
    m_paused = false;
    m_stopped = false;
    m_running = true;
    m_state = WorkerState::RUNNING;
    m_startedAt = std::chrono::steady_clock::now();

    m_report = RunReport();
    m_report.targetId = m_binding.id;
    m_report.state = WorkerState::RUNNING;
    m_report.variables = m_variables;
}

void Worker::pause() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != WorkerState::RUNNING) {
        return;
    }
    m_paused = true;
    m_state = WorkerState::PAUSED;
    SLOG_INFO().message("Worker paused").target(m_binding.id).iteration(m_iterations);
}

void Worker::resume() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != WorkerState::PAUSED) {
            return;
        }
        m_paused = false;
        m_state = WorkerState::RUNNING;
        SLOG_INFO().message("Worker resumed").target(m_binding.id).iteration(m_iterations);
    }
    m_cv.notify_all();
}

void Worker::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_stopped) {
            SLOG_INFO().message("Worker stop requested").target(m_binding.id);
        }
        m_stopped = true;
        if (m_state == WorkerState::IDLE) {
            m_state = WorkerState::STOPPED;
            m_report.state = WorkerState::STOPPED;
        }
    }
    m_cv.notify_all();
}

bool Worker::waitForCompletion(int timeoutMs) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto done = [this] { return !m_running; };
        if (timeoutMs < 0) {
            m_cv.wait(lock, done);
        } else if (!m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), done)) {
            return false;
        }
    }

    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
    return true;
}

WorkerState Worker::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

RunReport Worker::getReport() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    RunReport report = m_report;
    report.state = m_state;
    report.iterations = m_iterations;
    if (m_running) {
        report.elapsedMs = millisSince(m_startedAt);
        report.variables = m_variables;
    }
    return report;
}

int Worker::getIterationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_iterations;
}

CoordinateMapper Worker::getMapper() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_mapper;
}

void Worker::execute(std::shared_ptr<const Script> script) {
    LogTargetScope logScope(m_binding.id);
    const auto& sequence = script->sequence();
    SLOG_INFO().message("Worker run started")
        .target(m_binding.id)
        .context("commands", script->commandCount())
        .context("max_iterations", script->maxIterations());

    try {
        prepareGeometry();

        size_t cursor = 0;
        while (cursor < sequence.size()) {
            if (!checkpoint()) {
                finish(WorkerState::STOPPED);
                return;
            }
            consumeIteration(*script);

            StepResult step = dispatch(sequence[cursor], *script);
            switch (step.kind) {
                case StepResult::NEXT:
                    ++cursor;
                    break;
                case StepResult::JUMP:
                    cursor = step.target;
                    break;
                case StepResult::HALT:
                    runErrorHandler(*script);
                    finish(WorkerState::FAILED);
                    return;
                case StepResult::INTERRUPTED:
                    finish(WorkerState::STOPPED);
                    return;
            }
        }
    } catch (const EmuflowException& e) {
        ErrorHandler::getInstance().logError(e.getErrorInfo());
        recordFailure(ErrorHandler::errorTypeToString(e.getType()), e.what());
        runErrorHandler(*script);
        finish(WorkerState::FAILED);
        return;
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().logError(
            ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH, e.what(), "", m_binding.id));
        recordFailure(ErrorHandler::errorTypeToString(ErrorType::UNKNOWN_ERROR), e.what());
        runErrorHandler(*script);
        finish(WorkerState::FAILED);
        return;
    }

    finish(WorkerState::COMPLETED);
}

void Worker::prepareGeometry() {
    std::optional<SurfaceRect> surface = m_binding.surface;
    if (!surface) {
        surface = m_controller.observeSurface(m_binding.id);
    }

    Resolution logical;
    if (m_binding.resolution) {
        logical = *m_binding.resolution;
    } else {
        ocal::ResolutionRecord record = m_resolution.queryResolution(m_binding.id, m_options.resolutionTimeoutMs);
        if (record.isResolved()) {
            logical = *record.resolution;
        } else if (surface && surface->isValid()) {
            SLOG_WARNING().message("Resolution unresolved, falling back to the observed surface size")
                .target(m_binding.id)
                .context("primary_failure", ocal::queryFailureToString(record.primaryFailure))
                .context("secondary_failure", ocal::queryFailureToString(record.secondaryFailure))
                .context("width", surface->width)
                .context("height", surface->height);
            logical = Resolution(surface->width, surface->height);
        }
    }

    if (!surface && logical.isValid()) {
        surface = SurfaceRect(0, 0, logical.width, logical.height);
    }
    if (!surface || !surface->isValid() || !logical.isValid()) {
        throw CapabilityError("Neither the resolution nor the surface of " + m_binding.id + " could be determined",
                              m_binding.id);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_mapper.update(logical, *surface);
}

void Worker::finish(WorkerState state) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = state;
        m_running = false;
        m_paused = false;
        m_report.state = state;
        m_report.iterations = m_iterations;
        m_report.elapsedMs = millisSince(m_startedAt);
        m_report.variables = m_variables;

        auto& logger = StructuredLogger::getInstance();
        StructuredLogger::LogBuilder log = state == WorkerState::FAILED ? logger.error() : logger.info();
        log.file(__FILE__, __LINE__)
            .message("Worker run finished")
            .target(m_binding.id)
            .context("state", workerStateToString(state))
            .context("iterations", m_iterations)
            .context("elapsed_ms", m_report.elapsedMs);
        if (state == WorkerState::FAILED) {
            log.context("last_command", m_report.lastCommandName)
                .context("error_kind", m_report.errorKind)
                .context("error", m_report.errorMessage);
        }
    }
    m_cv.notify_all();
}

void Worker::runErrorHandler(const Script& script) {
    const Command* handler = script.onErrorHandler();
    if (!handler) {
        return;
    }

    // The handler must not overwrite the failure it is reacting to
    RunReport saved;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        saved = m_report;
    }

    SLOG_INFO().message("Running error handler")
        .target(m_binding.id)
        .command(handler->id, handler->name);
    // Nothing the handler dispatches counts toward the iteration limit
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inErrorHandler = true;
    }
    try {
        StepResult step = dispatch(*handler, script);
        if (step.kind == StepResult::HALT) {
            SLOG_WARNING().message("Error handler failed").target(m_binding.id);
        } else if (step.kind == StepResult::JUMP) {
            SLOG_DEBUG().message("Jump from error handler ignored").target(m_binding.id);
        }
    } catch (const EmuflowException& e) {
        ErrorHandler::getInstance().logError(e.getErrorInfo());
        SLOG_WARNING().message("Error handler raised").target(m_binding.id).context("error", e.what());
    } catch (const std::exception& e) {
        SLOG_WARNING().message("Error handler raised").target(m_binding.id).context("error", e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_inErrorHandler = false;
    m_report.lastCommandId = saved.lastCommandId;
    m_report.lastCommandName = saved.lastCommandName;
    m_report.errorKind = saved.errorKind;
    m_report.errorMessage = saved.errorMessage;
}

void Worker::consumeIteration(const Script& script) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_inErrorHandler) {
        return;
    }
    if (m_iterations >= script.maxIterations()) {
        throw IterationLimitExceeded("Iteration limit of " + std::to_string(script.maxIterations()) +
                                     " reached", m_binding.id);
    }
    ++m_iterations;
}

Worker::StepResult Worker::runPass(const std::vector<Command>& commands, const Script& script) {
    for (const auto& command : commands) {
        if (!checkpoint()) {
            return StepResult::interrupted();
        }
        consumeIteration(script);

        StepResult step = dispatch(command, script);
        if (step.kind != StepResult::NEXT) {
            // Jumps leave the nested pass and reposition the top-level cursor
            return step;
        }
    }
    return StepResult::next();
}

Worker::StepResult Worker::dispatch(const Command& command, const Script& script) {
    int iteration;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_report.lastCommandId = command.id;
        m_report.lastCommandName = command.name;
        iteration = m_iterations;
    }

    if (!command.enabled) {
        SLOG_DEBUG().message("Command disabled, skipping")
            .target(m_binding.id)
            .command(command.id, command.name)
            .iteration(iteration);
        return StepResult::next();
    }

    SLOG_DEBUG().message("Executing command")
        .target(m_binding.id)
        .command(command.id, command.name)
        .context("type", toString(command.type()))
        .iteration(iteration);

    try {
        nlohmann::json result = nlohmann::json::object();
        StepResult step = StepResult::next();

        switch (command.type()) {
            case CommandType::CLICK:
                step = executeClick(std::get<ClickParams>(command.params), result);
                break;
            case CommandType::CROP_IMAGE:
                step = executeCropImage(std::get<CropImageParams>(command.params), result);
                break;
            case CommandType::KEY_PRESS:
                step = executeKeyPress(std::get<KeyPressParams>(command.params), result);
                break;
            case CommandType::HOT_KEY:
                step = executeHotKey(std::get<HotKeyParams>(command.params), result);
                break;
            case CommandType::TEXT:
                step = executeText(std::get<TextParams>(command.params), result);
                break;
            case CommandType::WAIT:
                step = executeWait(std::get<WaitParams>(command.params), result);
                break;
            case CommandType::REPEAT:
                step = executeRepeat(std::get<RepeatParams>(command.params), script, result);
                break;
            case CommandType::GOTO:
                step = executeGoto(std::get<GotoParams>(command.params), script, result);
                break;
            case CommandType::CONDITION:
                step = executeCondition(std::get<ConditionParams>(command.params), script, result);
                break;
        }

        if (step.kind == StepResult::NEXT || step.kind == StepResult::JUMP) {
            applyVariablesOut(command, result);
        }
        return step;
    } catch (const CommandExecutionError& e) {
        return applyOnFail(command, e, script);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const CapabilityError&) {
        throw;
    } catch (const IterationLimitExceeded&) {
        throw;
    } catch (const std::exception& e) {
        CommandExecutionError wrapped("Unexpected error in '" + command.name + "': " + e.what(), m_binding.id);
        ErrorHandler::getInstance().logError(wrapped.getErrorInfo());
        SLOG_ERROR().message("Unexpected error, stopping")
            .target(m_binding.id)
            .command(command.id, command.name)
            .iteration(iteration)
            .context("error", e.what());
        recordFailure(ErrorHandler::errorTypeToString(wrapped.getType()), wrapped.what());
        return StepResult::halt();
    }
}

Worker::StepResult Worker::applyOnFail(const Command& command, const CommandExecutionError& error,
                                       const Script& script) {
    ErrorHandler::getInstance().logError(error.getErrorInfo());
    SLOG_WARNING().message("Command failed")
        .target(m_binding.id)
        .command(command.id, command.name)
        .iteration(getIterationCount())
        .context("error_kind", ErrorHandler::errorTypeToString(error.getType()))
        .context("error", error.what())
        .context("on_fail", toString(command.onFail));

    switch (command.onFail) {
        case OnFailAction::SKIP:
            return StepResult::next();
        case OnFailAction::STOP:
            recordFailure(ErrorHandler::errorTypeToString(error.getType()), error.what());
            return StepResult::halt();
        case OnFailAction::GOTO_LABEL:
            if (!command.onFailLabel) {
                throw ConfigurationError("Command '" + command.name + "' has on_fail GotoLabel without a label",
                                         command.id);
            }
            return StepResult::jump(resolveJump(*command.onFailLabel, script));
    }
    return StepResult::halt();
}

size_t Worker::resolveJump(const std::string& label, const Script& script) const {
    auto index = script.resolveLabel(label);
    if (!index) {
        throw ConfigurationError("Label '" + label + "' does not resolve to a top-level command", m_binding.id);
    }
    return *index;
}

Worker::StepResult Worker::executeClick(const ClickParams& params, nlohmann::json& result) {
    CoordinateMapper mapper = getMapper();
    Point screen = mapper.localToScreen(params.x, params.y);

    int delta = 0;
    if (params.wheelDelta) {
        delta = std::max(1, static_cast<int>(std::lround(*params.wheelDelta * mapper.getScaleY())));
    }

    if (m_options.humanize && params.humanizeDelayMaxMs > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(
            randomBetween(params.humanizeDelayMinMs, params.humanizeDelayMaxMs)));
    }

    ocal::TapRequest request(toMouseButton(params.button), screen.x, screen.y, delta);
    if (!m_controller.sendClick(m_binding.id, request)) {
        throw CommandExecutionError("Click at (" + std::to_string(params.x) + ", " + std::to_string(params.y) +
                                    ") was rejected", m_binding.id);
    }

    result["x"] = params.x;
    result["y"] = params.y;
    result["screen_x"] = screen.x;
    result["screen_y"] = screen.y;
    result["button"] = toString(params.button);
    return StepResult::next();
}

Worker::StepResult Worker::executeCropImage(const CropImageParams& params, nlohmann::json& result) {
    // The output variable is always written; it stays null unless a match is found
    setVariable(params.outputVar, nullptr);

    auto frame = m_capture.get(m_binding.id);
    CoordinateMapper mapper = getMapper();
    Region area = mapper.regionToImage(params.region, frame->width, frame->height);

    auto match = vision::findColor(*frame, area, params.targetColor, params.tolerance, toSearchMode(params.scanMode));
    if (!match) {
        throw CommandExecutionError("Color not found in region (" + std::to_string(params.region.x1) + ", " +
                                    std::to_string(params.region.y1) + ")-(" + std::to_string(params.region.x2) +
                                    ", " + std::to_string(params.region.y2) + ")", m_binding.id);
    }

    Point local = mapper.imageToLocal(match->x, match->y, frame->width, frame->height);
    nlohmann::json found = {
        {"x", local.x},
        {"y", local.y},
        {"confidence", match->confidence}
    };
    setVariable(params.outputVar, found);

    result = found;
    result[params.outputVar] = found;
    return StepResult::next();
}

Worker::StepResult Worker::executeKeyPress(const KeyPressParams& params, nlohmann::json& result) {
    for (int i = 0; i < params.repeat; ++i) {
        if (i > 0 && params.delayBetweenMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(params.delayBetweenMs));
        }
        if (!m_controller.sendKey(m_binding.id, params.key)) {
            throw CommandExecutionError("Key '" + params.key + "' was rejected", m_binding.id);
        }
    }
    result["key"] = params.key;
    result["count"] = params.repeat;
    return StepResult::next();
}

Worker::StepResult Worker::executeHotKey(const HotKeyParams& params, nlohmann::json& result) {
    bool simultaneous = params.order == HotKeyOrder::SIMULTANEOUS;
    if (!m_controller.sendHotkey(m_binding.id, params.keys, simultaneous)) {
        throw CommandExecutionError("Hotkey was rejected", m_binding.id);
    }
    result["keys"] = params.keys;
    return StepResult::next();
}

Worker::StepResult Worker::executeText(const TextParams& params, nlohmann::json& result) {
    if (params.focusX && params.focusY) {
        Point focus = getMapper().localToScreen(*params.focusX, *params.focusY);
        if (!m_controller.sendClick(m_binding.id, ocal::TapRequest(ocal::MouseButton::LEFT, focus.x, focus.y))) {
            throw CommandExecutionError("Focus click before text entry was rejected", m_binding.id);
        }
    }

    if (params.mode == TextMode::PASTE) {
        if (!m_controller.sendText(m_binding.id, params.content)) {
            throw CommandExecutionError("Text entry was rejected", m_binding.id);
        }
    } else {
        for (const auto& ch : splitCodePoints(params.content)) {
            if (!m_controller.sendText(m_binding.id, ch)) {
                throw CommandExecutionError("Text entry was rejected", m_binding.id);
            }
            if (m_options.humanize) {
                int cps = randomBetween(params.speedMinCps, params.speedMaxCps);
                std::this_thread::sleep_for(std::chrono::milliseconds(1000 / std::max(cps, 1)));
            }
        }
    }

    result["text"] = params.content;
    result["length"] = static_cast<int>(splitCodePoints(params.content).size());
    return StepResult::next();
}

Worker::StepResult Worker::executeWait(const WaitParams& params, nlohmann::json& result) {
    const long long timeoutMs = static_cast<long long>(std::llround(params.timeoutSec * 1000.0));

    std::shared_ptr<const Screenshot> baseline;
    Region changeArea;
    if (params.waitType == WaitType::SCREEN_CHANGE) {
        baseline = m_capture.get(m_binding.id, true);
        changeArea = params.hasRegion()
            ? getMapper().regionToImage(params.region(), baseline->width, baseline->height)
            : Region(0, 0, baseline->width, baseline->height);
    }
    Screenshot baselineArea = baseline ? baseline->crop(changeArea) : Screenshot();
    double requiredChange = 1.0 - params.screenThreshold;

    // Active time only; a pause freezes the clock
    long long activeMs = 0;
    auto last = std::chrono::steady_clock::now();

    while (true) {
        bool satisfied = false;
        if (params.waitType == WaitType::TIMEOUT) {
            satisfied = activeMs >= timeoutMs;
        } else if (params.waitType == WaitType::PIXEL_COLOR) {
            auto frame = m_capture.get(m_binding.id, true);
            Point p = getMapper().localToImage(*params.pixelX, *params.pixelY, frame->width, frame->height);
            satisfied = vision::pixelMatches(frame->pixelAt(p.x, p.y), *params.pixelColor,
                                             params.pixelTolerance.value_or(10));
        } else {
            auto frame = m_capture.get(m_binding.id, true);
            double change = 1.0 - vision::similarity(baselineArea, frame->crop(changeArea));
            satisfied = change > requiredChange;
        }

        if (satisfied) {
            result["elapsed_ms"] = activeMs;
            return StepResult::next();
        }
        if (activeMs >= timeoutMs) {
            throw TimeoutError("Wait (" + toString(params.waitType) + ") timed out after " +
                               std::to_string(activeMs) + " ms", m_binding.id);
        }

        int tick = static_cast<int>(std::min<long long>(m_options.waitPollIntervalMs, timeoutMs - activeMs));
        if (!sleepFor(tick)) {
            return StepResult::interrupted();
        }
        activeMs += millisSince(last);
        if (!checkpoint()) {
            return StepResult::interrupted();
        }
        last = std::chrono::steady_clock::now();
    }
}

Worker::StepResult Worker::executeRepeat(const RepeatParams& params, const Script& script, nlohmann::json& result) {
    int passes = 0;
    if (!params.innerCommands.empty()) {
        while (params.count == 0 || passes < params.count) {
            if (!checkpoint()) {
                return StepResult::interrupted();
            }
            ++passes;

            bool untilMet = false;
            {
                // The until-condition still sees this pass's _loop_index
                LoopIndexScope loopIndex(m_variables, m_mutex);
                loopIndex.set(passes);
                StepResult step = runPass(params.innerCommands, script);
                if (step.kind != StepResult::NEXT) {
                    return step;
                }
                untilMet = params.untilConditionExpr &&
                           script.expression(*params.untilConditionExpr).evaluateBool(m_variables);
            }

            if (untilMet) {
                SLOG_DEBUG().message("Repeat until-condition met")
                    .target(m_binding.id)
                    .context("passes", passes);
                break;
            }
        }
    }
    result["iterations"] = passes;
    return StepResult::next();
}

Worker::StepResult Worker::executeGoto(const GotoParams& params, const Script& script, nlohmann::json& result) {
    bool jump = !params.conditionExpr || script.expression(*params.conditionExpr).evaluateBool(m_variables);
    result["jumped"] = jump;
    if (!jump) {
        return StepResult::next();
    }
    return StepResult::jump(resolveJump(params.targetLabel, script));
}

Worker::StepResult Worker::executeCondition(const ConditionParams& params, const Script& script,
                                            nlohmann::json& result) {
    bool value = script.expression(params.expr).evaluateBool(m_variables);
    result["result"] = value;

    const auto& label = value ? params.thenLabel : params.elseLabel;
    const auto& nested = value ? params.nestedThen : params.nestedElse;
    if (label) {
        return StepResult::jump(resolveJump(*label, script));
    }
    if (!nested.empty()) {
        return runPass(nested, script);
    }
    return StepResult::next();
}

void Worker::applyVariablesOut(const Command& command, const nlohmann::json& result) {
    for (const auto& key : command.variablesOut) {
        auto it = result.find(key);
        setVariable(key, it != result.end() ? *it : result);
    }
}

void Worker::setVariable(const std::string& key, const nlohmann::json& value) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_variables[key] = value;
}

void Worker::recordFailure(const std::string& kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_report.errorKind = kind;
    m_report.errorMessage = message;
}

bool Worker::checkpoint() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait(lock, [this] { return m_stopped || !m_paused; });
    return !m_stopped;
}

bool Worker::sleepFor(int ms) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, std::chrono::milliseconds(std::max(ms, 0)), [this] { return m_stopped; });
    return !m_stopped;
}

int Worker::randomBetween(int low, int high) {
    if (high <= low) {
        return std::max(low, 0);
    }
    std::uniform_int_distribution<int> dist(low, high);
    return dist(m_rng);
}

} // namespace emuflow
