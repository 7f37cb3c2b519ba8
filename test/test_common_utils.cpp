#include <iostream>
#include "common/error_handler.h"
#include "common/input_validator.h"
#include "common/json_utils.h"
#include "test_support.h"

using namespace emuflow;
using nlohmann::json;

void testErrorHistory() {
    std::cout << "[TEST] Error History\n";

    auto& handler = ErrorHandler::getInstance();
    handler.clearErrorHistory();

    handler.logError(TimeoutError("Wait timed out", "emulator-5554").getErrorInfo());
    handler.logError(OutOfRangeError("Click outside", "emulator-5554").getErrorInfo());
    handler.handleException(TimeoutError("Second timeout"), "emulator-5556");
    handler.handleException(std::runtime_error("socket closed"), "main");

    CHECK(handler.getErrorCount(ErrorType::TIMEOUT_ERROR) == 2);
    CHECK(handler.getErrorCount(ErrorType::UNKNOWN_ERROR) == 1);
    CHECK(handler.getErrorCount(ErrorType::CAPABILITY_ERROR) == 0);

    auto recent = handler.getRecentErrors(2);
    CHECK(recent.size() == 2);
    CHECK(recent[0].context == "emulator-5556");
    CHECK(recent[1].message == "socket closed");
    CHECK(recent[1].severity == ErrorSeverity::HIGH);

    // Critical errors are logged and then rethrown
    CHECK_THROWS_AS(handler.handleError(ErrorInfo(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::CRITICAL,
                                                  "config unreadable")),
                    EmuflowException);
    CHECK(handler.getErrorCount(ErrorType::CONFIGURATION_ERROR) == 1);

    handler.clearErrorHistory();
    CHECK(handler.getRecentErrors().empty());

    CHECK(ErrorHandler::errorSeverityToString(ErrorSeverity::MEDIUM) == "MEDIUM");
    CHECK(ErrorHandler::errorTypeToString(ErrorType::ITERATION_LIMIT_EXCEEDED) == "IterationLimitExceeded");
    CHECK(TimeoutError("x").getErrorInfo().severity == ErrorSeverity::MEDIUM);

    std::cout << "[OK] Error history test passed\n\n";
}

void testInputValidator() {
    std::cout << "[TEST] Input Validator\n";

    CHECK(InputValidator::validateDeviceId("emulator-5554"));
    CHECK(InputValidator::validateDeviceId("127.0.0.1:5555"));
    CHECK(InputValidator::validateDeviceId("R58M123ABC"));
    CHECK(!InputValidator::validateDeviceId(""));
    CHECK(!InputValidator::validateDeviceId("emulator-x"));
    CHECK(!InputValidator::validateDeviceId("host:70000"));
    CHECK(!InputValidator::validateDeviceId("a b"));
    CHECK(!InputValidator::validateDeviceId(std::string(65, 'a')));

    CHECK(InputValidator::validateFilePath("/tmp/script.json"));
    CHECK(!InputValidator::validateFilePath(""));
    CHECK(!InputValidator::validateFilePath(std::string("a\0b", 3)));
    CHECK(!InputValidator::validateFilePath("line\nbreak"));

    CHECK(InputValidator::quoteForShell("a b") == "'a b'");
    CHECK(InputValidator::quoteForShell("it's") == "'it'\\''s'");

    CHECK(InputValidator::isNotEmpty(" x "));
    CHECK(!InputValidator::isNotEmpty(" \t"));
    CHECK(InputValidator::isInRange(255, 0, 255));
    CHECK(!InputValidator::isNonNegative(-1));
    CHECK(!InputValidator::matchesPattern("abc", "(["));

    std::cout << "[OK] Input validator test passed\n\n";
}

void testJsonUtils() {
    std::cout << "[TEST] JSON Utils\n";

    json document = {
        {"capture", {{"ttl_ms", 250}, {"timeout_ms", 5000.0}}},
        {"name", "emuflow"}
    };

    const json* ttl = utils::JsonUtils::findPath(document, "capture.ttl_ms");
    CHECK(ttl && *ttl == 250);
    CHECK(!utils::JsonUtils::findPath(document, "capture.missing"));
    CHECK(!utils::JsonUtils::findPath(document, "name.inner"));

    CHECK(utils::JsonUtils::getIntField(document["capture"], "timeout_ms") == 5000);
    CHECK(utils::JsonUtils::getIntField(document, "name", 7) == 7);
    CHECK(utils::JsonUtils::getStringField(document, "name") == "emuflow");
    CHECK(utils::JsonUtils::getStringField(json::array(), "name", "none") == "none");

    json merged = utils::JsonUtils::mergeJsonObjects(document, json{{"capture", {{"ttl_ms", 0}}}});
    CHECK(merged["capture"]["ttl_ms"] == 0);
    CHECK(merged["capture"]["timeout_ms"] == 5000.0);
    CHECK(merged["name"] == "emuflow");

    std::cout << "[OK] JSON utils test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Common Utilities Test Suite ===\n\n";

    try {
        testErrorHistory();
        testInputValidator();
        testJsonUtils();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
