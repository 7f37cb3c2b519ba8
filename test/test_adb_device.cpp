#include <iostream>
#include "ocal/adb_device.h"
#include "test_support.h"

using namespace emuflow;
using namespace emuflow::ocal;

void testParseDeviceList() {
    std::cout << "[TEST] Parse Device List\n";

    std::string output =
        "* daemon not running; starting now at tcp:5037\r\n"
        "* daemon started successfully\r\n"
        "List of devices attached\r\n"
        "emulator-5554\tdevice\r\n"
        "emulator-5556\toffline\r\n"
        "127.0.0.1:62001\tdevice product:x model:y\r\n"
        "R58M123ABC\tunauthorized\r\n"
        "\r\n";

    auto serials = AdbDevice::parseDeviceList(output);
    CHECK(serials.size() == 2);
    CHECK(serials[0] == "emulator-5554");
    CHECK(serials[1] == "127.0.0.1:62001");

    CHECK(AdbDevice::parseDeviceList("").empty());
    CHECK(AdbDevice::parseDeviceList("List of devices attached\n\n").empty());

    std::cout << "[OK] Parse device list test passed\n\n";
}

void testKeyCodes() {
    std::cout << "[TEST] Key Codes\n";

    CHECK(AdbDevice::keyCodeFor("Enter") == std::optional<std::string>("KEYCODE_ENTER"));
    CHECK(AdbDevice::keyCodeFor("back") == std::optional<std::string>("KEYCODE_BACK"));
    CHECK(AdbDevice::keyCodeFor("a") == std::optional<std::string>("KEYCODE_A"));
    CHECK(AdbDevice::keyCodeFor("7") == std::optional<std::string>("KEYCODE_7"));
    CHECK(AdbDevice::keyCodeFor("F5") == std::optional<std::string>("KEYCODE_F5"));
    CHECK(AdbDevice::keyCodeFor("Page Down") == std::optional<std::string>("KEYCODE_PAGE_DOWN"));
    CHECK(AdbDevice::keyCodeFor("arrow_up") == std::optional<std::string>("KEYCODE_DPAD_UP"));
    CHECK(AdbDevice::keyCodeFor("keycode_home") == std::optional<std::string>("KEYCODE_HOME"));
    CHECK(AdbDevice::keyCodeFor("66") == std::optional<std::string>("66"));
    CHECK(AdbDevice::keyCodeFor("Ctrl") == std::optional<std::string>("KEYCODE_CTRL_LEFT"));

    CHECK(!AdbDevice::keyCodeFor(""));
    CHECK(!AdbDevice::keyCodeFor("F13"));
    CHECK(!AdbDevice::keyCodeFor("Hyper"));
    CHECK(!AdbDevice::keyCodeFor("KEYCODE_X; reboot"));

    std::cout << "[OK] Key codes test passed\n\n";
}

void testEscapeInputText() {
    std::cout << "[TEST] Escape Input Text\n";

    CHECK(AdbDevice::escapeInputText("hello") == "'hello'");
    CHECK(AdbDevice::escapeInputText("hello world") == "'hello%sworld'");
    CHECK(AdbDevice::escapeInputText("it's") == "'it'\\''s'");
    CHECK(AdbDevice::escapeInputText("$(reboot)") == "'$(reboot)'");

    std::cout << "[OK] Escape input text test passed\n\n";
}

void testUnreachableTransport() {
    std::cout << "[TEST] Unreachable Transport\n";

    AdbDevice device("/nonexistent/emuflow/adb", 1000);

    ShellResult result = device.runShell("emulator-5554", "wm size", 1000);
    CHECK(result.status == ShellStatus::TRANSPORT_ERROR);
    CHECK(!result.ok());

    CHECK(device.listTargets().empty());
    CHECK(!device.observeSurface("emulator-5554"));
    CHECK(!device.sendClick("emulator-5554", TapRequest(MouseButton::LEFT, 10, 10)));
    CHECK(!device.connect("127.0.0.1:5555"));

    // Rejected before any process is spawned
    ShellResult rejected = device.execOut("bad id", "screencap", 1000);
    CHECK(rejected.status == ShellStatus::TRANSPORT_ERROR);
    CHECK(!rejected.error.empty());

    CHECK(!device.sendKey("emulator-5554", "NoSuchKey"));
    CHECK(!device.sendHotkey("emulator-5554", {}, true));
    CHECK(!device.connect("emulator-5554"));
    CHECK(device.sendText("emulator-5554", ""));

    std::cout << "[OK] Unreachable transport test passed\n\n";
}

int main() {
    std::cout << "=== emuflow ADB Device Test Suite ===\n\n";

    try {
        testParseDeviceList();
        testKeyCodes();
        testEscapeInputText();
        testUnreachableTransport();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
