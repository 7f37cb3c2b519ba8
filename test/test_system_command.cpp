#include <iostream>
#include <chrono>
#include "ocal/system_command.h"
#include "test_support.h"

using namespace emuflow::ocal::system;

void testCapturesOutput() {
    std::cout << "[TEST] Captures Output\n";

    CommandResult result = executeCommand({"sh", "-c", "printf 'hello'; printf 'oops' >&2"}, 5000);
    CHECK(result.success);
    CHECK(result.exitCode == 0);
    CHECK(result.output == "hello");
    CHECK(result.error == "oops");
    CHECK(!result.timedOut);
    CHECK(!result.launchFailed);

    std::cout << "[OK] Captures output test passed\n\n";
}

void testArgumentsAreNotShellExpanded() {
    std::cout << "[TEST] Arguments Not Shell Expanded\n";

    CommandResult result = executeCommand({"echo", "$HOME; rm -rf /"}, 5000);
    CHECK(result.success);
    CHECK(result.output == "$HOME; rm -rf /\n");

    std::cout << "[OK] Arguments not shell expanded test passed\n\n";
}

void testExitCode() {
    std::cout << "[TEST] Exit Code\n";

    CommandResult result = executeCommand({"sh", "-c", "exit 3"}, 5000);
    CHECK(!result.success);
    CHECK(result.exitCode == 3);
    CHECK(!result.launchFailed);

    std::cout << "[OK] Exit code test passed\n\n";
}

void testTimeoutKillsChild() {
    std::cout << "[TEST] Timeout Kills Child\n";

    auto start = std::chrono::steady_clock::now();
    CommandResult result = executeCommand({"sleep", "5"}, 200);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    CHECK(result.timedOut);
    CHECK(!result.success);
    CHECK(result.exitCode == -1);
    CHECK(elapsed < 2000);

    std::cout << "[OK] Timeout kills child test passed\n\n";
}

void testLaunchFailures() {
    std::cout << "[TEST] Launch Failures\n";

    CommandResult missing = executeCommand({"/nonexistent/emuflow-binary"}, 5000);
    CHECK(!missing.success);
    CHECK(missing.launchFailed);

    CommandResult empty = executeCommand({}, 5000);
    CHECK(empty.launchFailed);

    CommandResult badTimeout = executeCommand({"true"}, 0);
    CHECK(badTimeout.launchFailed);

    std::cout << "[OK] Launch failures test passed\n\n";
}

void testOutputLimit() {
    std::cout << "[TEST] Output Limit\n";

    CommandResult result = executeCommand({"sh", "-c", "head -c 4096 /dev/zero"}, 5000, 100);
    CHECK(result.success);
    CHECK(result.output.size() == 100);

    std::cout << "[OK] Output limit test passed\n\n";
}

void testFormatCommandLine() {
    std::cout << "[TEST] Format Command Line\n";

    CHECK(formatCommandLine({"adb", "-s", "emulator-5554", "shell", "wm size"}) ==
          "adb -s emulator-5554 shell 'wm size'");
    CHECK(formatCommandLine({"echo", ""}) == "echo ''");

    std::cout << "[OK] Format command line test passed\n\n";
}

int main() {
    std::cout << "=== emuflow System Command Test Suite ===\n\n";

    try {
        testCapturesOutput();
        testArgumentsAreNotShellExpanded();
        testExitCode();
        testTimeoutKillsChild();
        testLaunchFailures();
        testOutputLimit();
        testFormatCommandLine();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
