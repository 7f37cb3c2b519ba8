#include <iostream>
#include <atomic>
#include <thread>
#include <vector>
#include "ocal/device_resolution_service.h"
#include "test_fakes.h"
#include "test_support.h"

using namespace emuflow;
using namespace emuflow::ocal;
using emuflow::testing::FakeShell;
using emuflow::testing::shellOk;
using emuflow::testing::shellStatus;

void testParsers() {
    std::cout << "[TEST] Output Parsers\n";

    auto physical = DeviceResolutionService::parseWmSize("Physical size: 1080x1920\n");
    CHECK(physical && *physical == Resolution(1080, 1920));

    auto overridden = DeviceResolutionService::parseWmSize(
        "Physical size: 1080x1920\nOverride size: 720x1280\n");
    CHECK(overridden && *overridden == Resolution(720, 1280));

    CHECK(!DeviceResolutionService::parseWmSize("error: no devices/emulators found"));
    CHECK(!DeviceResolutionService::parseWmSize("Physical size: 0x1920"));

    auto display = DeviceResolutionService::parseDumpsysDisplay(
        "DisplayDeviceInfo{\"Built-in Screen\": uniqueId=\"local:0\", 1440 x 2560, modeId 1");
    CHECK(display && *display == Resolution(1440, 2560));
    CHECK(!DeviceResolutionService::parseDumpsysDisplay("mDisplayId=0 12 x 34"));

    CHECK(resolutionTierToString(ResolutionTier::PRIMARY) == "wm_size");
    CHECK(resolutionTierToString(ResolutionTier::SECONDARY) == "dumpsys_display");
    CHECK(queryFailureToString(QueryFailure::INVALID_ID) == "invalid_id");

    std::cout << "[OK] Output parsers test passed\n\n";
}

void testPrimaryTierAndCache() {
    std::cout << "[TEST] Primary Tier and Cache\n";

    FakeShell shell;
    shell.setResponse("wm size", shellOk("Physical size: 1080x1920\n"));
    DeviceResolutionService service(shell, 1000);

    ResolutionRecord first = service.queryResolution("emulator-5554");
    CHECK(first.isResolved());
    CHECK(*first.resolution == Resolution(1080, 1920));
    CHECK(first.tier == ResolutionTier::PRIMARY);
    CHECK(first.primaryFailure == QueryFailure::NONE);

    ResolutionRecord second = service.queryResolution("emulator-5554");
    CHECK(second.tier == ResolutionTier::CACHED);
    CHECK(*second.resolution == Resolution(1080, 1920));
    CHECK(shell.callCount("wm size") == 1);

    CHECK(shell.calls()[0].timeoutMs == 1000);
    CHECK(shell.calls()[0].targetId == "emulator-5554");

    service.invalidate("emulator-5554");
    CHECK(!service.getCached("emulator-5554"));
    service.queryResolution("emulator-5554", 250);
    CHECK(shell.callCount("wm size") == 2);
    CHECK(shell.calls().back().timeoutMs == 250);

    std::cout << "[OK] Primary tier and cache test passed\n\n";
}

void testSecondaryFallback() {
    std::cout << "[TEST] Secondary Fallback\n";

    FakeShell shell;
    shell.setResponse("wm size", shellStatus(ShellStatus::TIMEOUT));
    shell.setResponse("dumpsys display", shellOk("mBaseDisplayInfo=DisplayInfo{ real 720 x 1280, }"));
    DeviceResolutionService service(shell);

    ResolutionRecord record = service.queryResolution("127.0.0.1:5555");
    CHECK(record.isResolved());
    CHECK(*record.resolution == Resolution(720, 1280));
    CHECK(record.tier == ResolutionTier::SECONDARY);
    CHECK(record.primaryFailure == QueryFailure::TIMEOUT);
    CHECK(record.secondaryFailure == QueryFailure::NONE);

    // Unparseable primary output also falls through
    FakeShell garbled;
    garbled.setResponse("wm size", shellOk("nothing useful"));
    garbled.setResponse("dumpsys display", shellOk("800 x 600"));
    DeviceResolutionService second(garbled);
    ResolutionRecord parsed = second.queryResolution("emulator-5556");
    CHECK(parsed.primaryFailure == QueryFailure::PARSE);
    CHECK(parsed.tier == ResolutionTier::SECONDARY);

    std::cout << "[OK] Secondary fallback test passed\n\n";
}

void testFailuresAreNotCached() {
    std::cout << "[TEST] Failures Not Cached\n";

    FakeShell shell;
    shell.setResponse("wm size", shellStatus(ShellStatus::OK, 1));
    shell.setResponse("dumpsys display", shellOk("no sizes here"));
    DeviceResolutionService service(shell);

    ResolutionRecord record = service.queryResolution("emulator-5554");
    CHECK(!record.isResolved());
    CHECK(record.tier == ResolutionTier::NONE);
    CHECK(record.primaryFailure == QueryFailure::TRANSPORT);
    CHECK(record.secondaryFailure == QueryFailure::PARSE);
    CHECK(!service.getCached("emulator-5554"));

    service.queryResolution("emulator-5554");
    CHECK(shell.callCount("wm size") == 2);
    CHECK(shell.callCount("dumpsys display") == 2);

    std::cout << "[OK] Failures not cached test passed\n\n";
}

void testInvalidIdsSkipTransport() {
    std::cout << "[TEST] Invalid Ids Skip Transport\n";

    FakeShell shell;
    DeviceResolutionService service(shell);

    const char* invalid[] = {"", "emulator-abc", "host:99999", "bad id", "x;reboot"};
    for (const char* id : invalid) {
        ResolutionRecord record = service.queryResolution(id);
        CHECK(!record.isResolved());
        CHECK(record.primaryFailure == QueryFailure::INVALID_ID);
        CHECK(record.secondaryFailure == QueryFailure::INVALID_ID);
    }
    CHECK(shell.calls().empty());

    std::cout << "[OK] Invalid ids skip transport test passed\n\n";
}

void testConcurrentQueries() {
    std::cout << "[TEST] Concurrent Queries\n";

    FakeShell shell;
    shell.setResponse("wm size", shellOk("Physical size: 1080x2340"));
    DeviceResolutionService service(shell);

    std::atomic<int> resolved{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        std::string id = (i % 2 == 0) ? "emulator-5554" : "emulator-5556";
        threads.emplace_back([&service, &resolved, id]() {
            if (service.queryResolution(id).isResolved()) {
                ++resolved;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(resolved == 8);
    // One transport call per target; the rest are cache hits behind the per-target lock
    CHECK(shell.callCount("wm size") == 2);

    service.clear();
    CHECK(!service.getCached("emulator-5554"));
    CHECK(!service.getCached("emulator-5556"));

    std::cout << "[OK] Concurrent queries test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Device Resolution Service Test Suite ===\n\n";

    try {
        testParsers();
        testPrimaryTierAndCache();
        testSecondaryFallback();
        testFailuresAreNotCached();
        testInvalidIdsSkipTransport();
        testConcurrentQueries();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
