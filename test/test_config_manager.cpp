#include <iostream>
#include <filesystem>
#include <cstdlib>
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/file_utils.h"
#include "common/json_utils.h"
#include "test_support.h"

using namespace emuflow;
using nlohmann::json;

void testDefaults() {
    std::cout << "[TEST] Configuration Defaults\n";

    unsetenv("EMUFLOW_ADB_PATH");
    unsetenv("EMUFLOW_LOG_LEVEL");
    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    CHECK(config.getDefaultMaxIterations() == 10000);
    CHECK(config.getWaitPollIntervalMs() == 100);
    CHECK(config.getCaptureTtlMs() == 1000);
    CHECK(config.getCaptureTimeoutMs() == 5000);
    CHECK(config.getAdbPath() == "adb");
    CHECK(config.getResolutionTimeoutMs() == 5000);
    CHECK(config.getDeviceCommandTimeoutMs() == 5000);
    CHECK(config.getLogLevel() == "INFO");
    CHECK(config.getLogFile().empty());
    CHECK(config.getLogMaxSizeMb() == 10);
    CHECK(config.getLogMaxFiles() == 5);
    CHECK(config.getTargetBindings().empty());

    std::cout << "[OK] Configuration defaults test passed\n\n";
}

void testMergeAndValidation() {
    std::cout << "[TEST] Merge and Validation\n";

    auto& config = ConfigManager::getInstance();
    config.loadFromJson(json{
        {"capture", {{"ttl_ms", 250}}},
        {"engine", {{"wait_poll_interval_ms", -5}}},
        {"device", {{"adb_path", ""}, {"command_timeout_ms", "fast"}}}
    });

    // Siblings of an overridden key keep their defaults
    CHECK(config.getCaptureTtlMs() == 250);
    CHECK(config.getCaptureTimeoutMs() == 5000);

    // Out of range or mistyped values fall back
    CHECK(config.getWaitPollIntervalMs() == 100);
    CHECK(config.getDeviceCommandTimeoutMs() == 5000);
    CHECK(config.getAdbPath() == "adb");

    CHECK(config.get<int>("capture.ttl_ms") == 250);
    config.set("capture.ttl_ms", 0);
    CHECK(config.getCaptureTtlMs() == 1000);
    CHECK_THROWS_AS(config.get<int>("capture.missing"), std::out_of_range);

    std::cout << "[OK] Merge and validation test passed\n\n";
}

void testEnvironmentOverrides() {
    std::cout << "[TEST] Environment Overrides\n";

    setenv("EMUFLOW_ADB_PATH", "/opt/platform-tools/adb", 1);
    setenv("EMUFLOW_LOG_LEVEL", "DEBUG", 1);

    auto& config = ConfigManager::getInstance();
    config.loadFromJson(json{{"device", {{"adb_path", "/usr/bin/adb"}}}});
    CHECK(config.getAdbPath() == "/opt/platform-tools/adb");
    CHECK(config.getLogLevel() == "DEBUG");

    unsetenv("EMUFLOW_ADB_PATH");
    unsetenv("EMUFLOW_LOG_LEVEL");
    config.resetToDefaults();
    CHECK(config.getAdbPath() == "adb");

    std::cout << "[OK] Environment overrides test passed\n\n";
}

void testTargetBindings() {
    std::cout << "[TEST] Target Bindings\n";

    auto& config = ConfigManager::getInstance();
    json bound = json::object();
    bound["id"] = "127.0.0.1:62001";
    bound["surface"] = json{{"x", 0}, {"y", 40}, {"width", 540}, {"height", 960}};
    bound["resolution"] = json{{"width", 1080}, {"height", 1920}};
    json targets = json::array();
    targets.push_back("emulator-5554");
    targets.push_back(bound);
    config.loadFromJson(json{{"targets", targets}});

    auto bindings = config.getTargetBindings();
    CHECK(bindings.size() == 2);
    CHECK(bindings[0].id == "emulator-5554");
    CHECK(!bindings[0].surface && !bindings[0].resolution);
    CHECK(bindings[1].id == "127.0.0.1:62001");
    CHECK(bindings[1].surface && *bindings[1].surface == SurfaceRect(0, 40, 540, 960));
    CHECK(bindings[1].resolution && *bindings[1].resolution == Resolution(1080, 1920));

    json flat = json::object();
    flat["id"] = "emulator-5554";
    flat["surface"] = json{{"width", 0}};
    config.loadFromJson(json{{"targets", json::array({flat})}});
    CHECK_THROWS_AS(config.getTargetBindings(), ConfigurationError);

    config.loadFromJson(json{{"targets", json::array({"bad id; reboot"})}});
    CHECK_THROWS_AS(config.getTargetBindings(), ConfigurationError);

    config.loadFromJson(json{{"targets", json::array({42})}});
    CHECK_THROWS_AS(config.getTargetBindings(), ConfigurationError);

    config.loadFromJson(json{{"targets", "emulator-5554"}});
    CHECK_THROWS_AS(config.getTargetBindings(), ConfigurationError);

    config.resetToDefaults();
    std::cout << "[OK] Target bindings test passed\n\n";
}

void testLoadAndSave() {
    std::cout << "[TEST] Load and Save\n";

    auto dir = std::filesystem::temp_directory_path() / "emuflow_config_test";
    std::filesystem::remove_all(dir);
    std::string path = (dir / "emuflow.json").string();

    auto& config = ConfigManager::getInstance();

    // A missing file is created with the defaults
    CHECK(config.loadConfig(path));
    CHECK(utils::FileUtils::fileExists(path));
    CHECK(config.getConfigPath() == path);

    config.set("engine.default_max_iterations", 500);
    CHECK(config.saveConfig(path));
    config.resetToDefaults();
    CHECK(config.getDefaultMaxIterations() == 10000);

    CHECK(config.loadConfig(path));
    CHECK(config.getDefaultMaxIterations() == 500);

    // Unparseable file keeps the defaults active
    CHECK(utils::FileUtils::writeStringToFile(path, "{ not json"));
    CHECK(!config.loadConfig(path));
    CHECK(config.getDefaultMaxIterations() == 10000);

    CHECK(utils::FileUtils::writeStringToFile(path, "[1, 2]"));
    CHECK(!config.loadConfig(path));

    std::filesystem::remove_all(dir);
    config.resetToDefaults();
    std::cout << "[OK] Load and save test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Configuration Test Suite ===\n\n";

    try {
        testDefaults();
        testMergeAndValidation();
        testEnvironmentOverrides();
        testTargetBindings();
        testLoadAndSave();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
