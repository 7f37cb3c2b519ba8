#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <csignal>
#include "common/structured_logger.h"
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/shutdown_manager.h"
#include "script/script_serializer.h"
#include "ocal/adb_device.h"
#include "ocal/device_resolution_service.h"
#include "environmental_perception/adb_capture_providers.h"
#include "environmental_perception/capture_cache.h"
#include "orchestrator/worker_manager.h"

using namespace emuflow;

namespace {

const char* EMUFLOW_VERSION = "1.0.0";

const int EXIT_OK = 0;
const int EXIT_FAILED = 1;
const int EXIT_USAGE = 2;
const int EXIT_INTERRUPTED = 130;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        auto& shutdownMgr = ShutdownManager::getInstance();
        if (shutdownMgr.incrementSignalCount() == 1) {
            shutdownMgr.requestShutdown();
        } else {
            // Second signal: no cleanup
            std::_Exit(EXIT_INTERRUPTED);
        }
    }
}

void printUsage() {
    std::cout << "emuflow - automation script runner for emulated device targets\n";
    std::cout << "Usage:\n";
    std::cout << "  emuflow run <script.json> [--target <id>]...   Run a script on every target\n";
    std::cout << "  emuflow validate <script.json>                  Check a script without running it\n";
    std::cout << "  emuflow targets                                 List reachable targets\n";
    std::cout << "  emuflow resolution <id>                         Query a target's resolution\n";
    std::cout << "  emuflow capture <id> <out.ppm>                  Save one frame of a target\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <path>      Configuration file (default config/emuflow.json)\n";
    std::cout << "  --target <id>        Target to run on; repeatable, overrides configured targets\n";
    std::cout << "  --log-level <level>  DEBUG, INFO, WARNING, ERROR or CRITICAL\n";
    std::cout << "  --help, -h           Show this help message\n";
    std::cout << "  --version, -v        Show version information\n";
}

struct Options {
    std::string subcommand;
    std::vector<std::string> positional;
    std::string configPath = "config/emuflow.json";
    std::vector<std::string> targets;
    std::string logLevel;
    bool help = false;
    bool version = false;
};

// Returns false and prints the reason on a usage error
bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string& name) -> const char* {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << name << " option requires an argument\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--version" || arg == "-v") {
            options.version = true;
        } else if (arg == "--config") {
            const char* value = requireValue(arg);
            if (!value) return false;
            options.configPath = value;
        } else if (arg == "--target") {
            const char* value = requireValue(arg);
            if (!value) return false;
            options.targets.push_back(value);
        } else if (arg == "--log-level") {
            const char* value = requireValue(arg);
            if (!value) return false;
            options.logLevel = value;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        } else if (options.subcommand.empty()) {
            options.subcommand = arg;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

void configureLogging(const ConfigManager& config, const std::string& levelOverride) {
    auto& slogger = StructuredLogger::getInstance();
    std::string levelName = levelOverride.empty() ? config.getLogLevel() : levelOverride;
    slogger.setLogLevel(logLevelFromString(levelName, LogLevel::INFO));

    std::string logFile = config.getLogFile();
    if (!logFile.empty()) {
        RotatingFileLogSink::Config fileConfig;
        fileConfig.base_path = logFile;
        fileConfig.max_file_size = static_cast<size_t>(config.getLogMaxSizeMb()) * 1024 * 1024;
        fileConfig.max_files = static_cast<size_t>(config.getLogMaxFiles());
        slogger.addSink(std::make_shared<RotatingFileLogSink>(fileConfig, std::make_shared<JsonLogFormatter>()));
    }

    SLOG_DEBUG().message("Logging configured")
        .context("log_level", levelName)
        .context("log_file", logFile);
}

// Device stack shared by every worker for the lifetime of the process
struct DeviceStack {
    std::unique_ptr<ocal::AdbDevice> adb;
    std::unique_ptr<ocal::DeviceResolutionService> resolution;
    std::unique_ptr<CaptureCache> capture;

    explicit DeviceStack(const ConfigManager& config) {
        adb = std::make_unique<ocal::AdbDevice>(config.getAdbPath(), config.getDeviceCommandTimeoutMs());
        resolution = std::make_unique<ocal::DeviceResolutionService>(*adb, config.getResolutionTimeoutMs());

        std::vector<std::unique_ptr<ICaptureProvider>> providers;
        providers.push_back(std::make_unique<ExecOutScreencapProvider>(*adb));
        providers.push_back(std::make_unique<DeviceFileScreencapProvider>(*adb));
        capture = std::make_unique<CaptureCache>(std::move(providers), config.getCaptureTtlMs(),
                                                 config.getCaptureTimeoutMs());
    }
};

bool isNetworkTarget(const std::string& id) {
    return id.find(':') != std::string::npos;
}

int commandValidate(const Options& options, const ConfigManager& config) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: validate takes exactly one script path\n";
        return EXIT_USAGE;
    }
    Script script = ScriptSerializer::loadFromFile(options.positional[0], config.getDefaultMaxIterations());
    std::cout << "OK: " << script.sequence().size() << " top-level commands, "
              << script.commandCount() << " total, max_iterations " << script.maxIterations() << "\n";
    return EXIT_OK;
}

int commandTargets(DeviceStack& devices) {
    auto targets = devices.adb->listTargets();
    for (const auto& id : targets) {
        auto surface = devices.adb->observeSurface(id);
        std::cout << id;
        if (surface) {
            std::cout << "\t" << surface->width << "x" << surface->height;
        }
        std::cout << "\n";
    }
    if (targets.empty()) {
        std::cerr << "No targets in the device state\n";
    }
    return EXIT_OK;
}

int commandResolution(const Options& options, DeviceStack& devices) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: resolution takes exactly one target id\n";
        return EXIT_USAGE;
    }
    ocal::ResolutionRecord record = devices.resolution->queryResolution(options.positional[0]);
    if (!record.isResolved()) {
        std::cerr << "Unresolved (primary: " << ocal::queryFailureToString(record.primaryFailure)
                  << ", secondary: " << ocal::queryFailureToString(record.secondaryFailure) << ")\n";
        return EXIT_FAILED;
    }
    std::cout << record.resolution->width << "x" << record.resolution->height
              << " (" << ocal::resolutionTierToString(record.tier) << ")\n";
    return EXIT_OK;
}

int commandCapture(const Options& options, DeviceStack& devices) {
    if (options.positional.size() != 2) {
        std::cerr << "Error: capture takes a target id and an output path\n";
        return EXIT_USAGE;
    }
    auto frame = devices.capture->get(options.positional[0], true);
    if (!frame->saveToFile(options.positional[1])) {
        std::cerr << "Error: cannot write " << options.positional[1] << "\n";
        return EXIT_FAILED;
    }
    std::cout << frame->width << "x" << frame->height << " frame from " << frame->provider
              << " saved to " << options.positional[1] << "\n";
    return EXIT_OK;
}

int commandRun(const Options& options, const ConfigManager& config, DeviceStack& devices) {
    if (options.positional.size() != 1) {
        std::cerr << "Error: run takes exactly one script path\n";
        return EXIT_USAGE;
    }
    auto script = std::make_shared<const Script>(ScriptSerializer::loadFromFile(options.positional[0],
                                                                                  config.getDefaultMaxIterations()));

    WorkerOptions workerOptions;
    workerOptions.waitPollIntervalMs = config.getWaitPollIntervalMs();
    workerOptions.resolutionTimeoutMs = config.getResolutionTimeoutMs();
    WorkerManager manager(*devices.adb, *devices.resolution, *devices.capture, workerOptions);

    std::vector<TargetBinding> bindings;
    if (!options.targets.empty()) {
        for (const auto& id : options.targets) {
            TargetBinding binding;
            binding.id = id;
            bindings.push_back(binding);
        }
    } else {
        bindings = config.getTargetBindings();
    }

    for (const auto& binding : bindings) {
        if (isNetworkTarget(binding.id) && !devices.adb->connect(binding.id)) {
            SLOG_WARNING().message("Network target not connected, continuing").target(binding.id);
        }
    }
    if (bindings.empty()) {
        bindings = manager.discoverTargets();
    }
    if (bindings.empty()) {
        std::cerr << "Error: no targets configured or reachable\n";
        return EXIT_FAILED;
    }

    manager.createWorkers(bindings);
    manager.startAll(script);

    auto& shutdown = ShutdownManager::getInstance();
    bool interrupted = false;
    while (manager.isAnyRunning()) {
        if (shutdown.isShutdownRequested() && !interrupted) {
            SLOG_INFO().message("Shutdown requested, stopping workers (signal again to force exit)");
            manager.stopAll();
            interrupted = true;
        }
        manager.waitAll(200);
    }

    bool allCompleted = true;
    for (const auto& pair : manager.waitAll()) {
        const RunReport& report = pair.second;
        std::cout << report.toJson().dump() << "\n";
        if (report.state != WorkerState::COMPLETED) {
            allCompleted = false;
        }
    }

    nlohmann::json timings = nlohmann::json::object();
    for (const auto& pair : StructuredLogger::getInstance().getPerformanceTracker().getAllMetrics()) {
        timings[pair.first] = pair.second.toJson();
    }
    SLOG_DEBUG().message("Operation timings").context("metrics", timings);

    if (interrupted) {
        return EXIT_INTERRUPTED;
    }
    return allCompleted ? EXIT_OK : EXIT_FAILED;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage();
        return EXIT_USAGE;
    }
    if (options.help) {
        printUsage();
        return EXIT_OK;
    }
    if (options.version) {
        std::cout << "emuflow " << EMUFLOW_VERSION << "\n";
        return EXIT_OK;
    }
    if (options.subcommand.empty()) {
        printUsage();
        return EXIT_USAGE;
    }

    try {
        auto& config = ConfigManager::getInstance();
        if (!config.loadConfig(options.configPath)) {
            std::cerr << "Error: cannot parse configuration " << options.configPath << "\n";
            return EXIT_FAILED;
        }
        configureLogging(config, options.logLevel);

        int exitCode = EXIT_USAGE;
        if (options.subcommand == "validate") {
            exitCode = commandValidate(options, config);
        } else if (options.subcommand == "run" || options.subcommand == "targets" ||
                   options.subcommand == "resolution" || options.subcommand == "capture") {
            DeviceStack devices(config);
            if (options.subcommand == "run") {
                exitCode = commandRun(options, config, devices);
            } else if (options.subcommand == "targets") {
                exitCode = commandTargets(devices);
            } else if (options.subcommand == "resolution") {
                exitCode = commandResolution(options, devices);
            } else {
                exitCode = commandCapture(options, devices);
            }
        } else {
            std::cerr << "Error: unknown command " << options.subcommand << "\n";
            printUsage();
        }

        StructuredLogger::getInstance().flush();
        return exitCode;

    } catch (const EmuflowException& e) {
        ErrorHandler::getInstance().logError(e.getErrorInfo());
        std::cerr << ErrorHandler::errorTypeToString(e.getType()) << ": " << e.what() << "\n";
        StructuredLogger::getInstance().flush();
        return EXIT_FAILED;
    } catch (const std::exception& e) {
        ErrorHandler::getInstance().handleException(e, "main");
        std::cerr << "Fatal error: " << e.what() << "\n";
        StructuredLogger::getInstance().flush();
        return EXIT_FAILED;
    }
}
