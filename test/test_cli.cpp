#include <iostream>
#include <filesystem>
#include <string>
#include <vector>
#include "common/file_utils.h"
#include "ocal/system_command.h"
#include "test_support.h"

using namespace emuflow;
using namespace emuflow::ocal::system;

#ifndef EMUFLOW_BINARY
#error "EMUFLOW_BINARY must name the emuflow executable"
#endif

namespace {

const std::string BINARY = EMUFLOW_BINARY;
const std::filesystem::path WORK_DIR = std::filesystem::temp_directory_path() / "emuflow_cli_test";

// Geometry is bound in the config so runs never reach adb
const char* CONFIG = R"({
    "engine": {"default_max_iterations": 250, "wait_poll_interval_ms": 20},
    "device": {"adb_path": "/nonexistent/adb"},
    "targets": [
        {"id": "emulator-5554",
         "surface": {"x": 0, "y": 0, "width": 540, "height": 960},
         "resolution": {"width": 1080, "height": 1920}}
    ]
})";

const char* SHORT_SCRIPT = R"({
    "version": 1,
    "sequence": [
        {"id": "c1", "name": "settle", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 0.05}
    ]
})";

const char* LONG_SCRIPT = R"({
    "version": 1,
    "sequence": [
        {"id": "c1", "name": "long_settle", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 30}
    ]
})";

const char* CAPPED_SCRIPT = R"({
    "version": 1,
    "max_iterations": 2,
    "sequence": [
        {"name": "a", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 0.01},
        {"name": "b", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 0.01},
        {"name": "c", "type": "Wait", "wait_type": "Timeout", "timeout_sec": 0.01}
    ]
})";

const char* BAD_SCRIPT = R"({"sequence": [{"name": "x", "type": "Swipe"}]})";

std::string pathOf(const std::string& name) {
    return (WORK_DIR / name).string();
}

void writeFixture(const std::string& name, const std::string& content) {
    CHECK(utils::FileUtils::writeStringToFile(pathOf(name), content));
}

CommandResult runEmuflow(std::vector<std::string> args) {
    args.insert(args.begin(), BINARY);
    return executeCommand(args, 20000);
}

bool mentions(const CommandResult& result, const std::string& text) {
    return result.output.find(text) != std::string::npos || result.error.find(text) != std::string::npos;
}

} // anonymous namespace

void testValidate() {
    std::cout << "[TEST] Validate Subcommand\n";

    CommandResult good = runEmuflow({"validate", pathOf("short.json"), "--config", pathOf("emuflow.json")});
    CHECK(good.exitCode == 0);
    // The configured default applies when the script sets no bound
    CHECK(mentions(good, "OK: 1 top-level commands, 1 total, max_iterations 250"));

    CommandResult capped = runEmuflow({"validate", pathOf("capped.json"), "--config", pathOf("emuflow.json")});
    CHECK(capped.exitCode == 0);
    CHECK(mentions(capped, "max_iterations 2"));

    CommandResult bad = runEmuflow({"validate", pathOf("bad.json"), "--config", pathOf("emuflow.json")});
    CHECK(bad.exitCode == 1);
    CHECK(mentions(bad, "ConfigurationError"));

    CommandResult missing = runEmuflow({"validate", pathOf("absent.json"), "--config", pathOf("emuflow.json")});
    CHECK(missing.exitCode == 1);

    std::cout << "[OK] Validate subcommand test passed\n\n";
}

void testUsageErrors() {
    std::cout << "[TEST] Usage Errors\n";

    CHECK(runEmuflow({}).exitCode == 2);
    CHECK(runEmuflow({"--bogus"}).exitCode == 2);
    CHECK(runEmuflow({"validate", "--config"}).exitCode == 2);
    CHECK(runEmuflow({"validate", "--config", pathOf("emuflow.json")}).exitCode == 2);
    CHECK(runEmuflow({"frobnicate", "--config", pathOf("emuflow.json")}).exitCode == 2);

    CommandResult help = runEmuflow({"--help"});
    CHECK(help.exitCode == 0);
    CHECK(mentions(help, "Usage:"));
    CHECK(runEmuflow({"--version"}).exitCode == 0);

    std::cout << "[OK] Usage errors test passed\n\n";
}

void testRunExitCodes() {
    std::cout << "[TEST] Run Exit Codes\n";

    CommandResult completed = runEmuflow({"run", pathOf("short.json"), "--config", pathOf("emuflow.json")});
    CHECK(completed.exitCode == 0);
    CHECK(mentions(completed, "\"state\":\"Completed\""));
    CHECK(mentions(completed, "\"target\":\"emulator-5554\""));

    CommandResult failed = runEmuflow({"run", pathOf("capped.json"), "--config", pathOf("emuflow.json")});
    CHECK(failed.exitCode == 1);
    CHECK(mentions(failed, "\"error_kind\":\"IterationLimitExceeded\""));

    CommandResult unparseable = runEmuflow({"run", pathOf("short.json"), "--config", pathOf("bad_config.json")});
    CHECK(unparseable.exitCode == 1);

    std::cout << "[OK] Run exit codes test passed\n\n";
}

void testInterruptedRun() {
    std::cout << "[TEST] Interrupted Run\n";

    // The shell reports the exit status emuflow returns after stopping its workers
    CommandResult interrupted = executeCommand(
        {"sh", "-c", "\"$0\" run \"$1\" --config \"$2\" & pid=$!; sleep 1; kill -TERM $pid; wait $pid",
         BINARY, pathOf("long.json"), pathOf("emuflow.json")},
        20000);
    CHECK(!interrupted.timedOut);
    CHECK(interrupted.exitCode == 130);
    CHECK(mentions(interrupted, "\"state\":\"Stopped\""));

    std::cout << "[OK] Interrupted run test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Command Line Test Suite ===\n\n";

    try {
        std::filesystem::remove_all(WORK_DIR);
        std::filesystem::create_directories(WORK_DIR);
        writeFixture("emuflow.json", CONFIG);
        writeFixture("bad_config.json", "{ not json");
        writeFixture("short.json", SHORT_SCRIPT);
        writeFixture("long.json", LONG_SCRIPT);
        writeFixture("capped.json", CAPPED_SCRIPT);
        writeFixture("bad.json", BAD_SCRIPT);

        testValidate();
        testUsageErrors();
        testRunExitCodes();
        testInterruptedRun();

        std::filesystem::remove_all(WORK_DIR);
        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
