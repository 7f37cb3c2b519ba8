#include <iostream>
#include "orchestrator/coordinate_mapper.h"
#include "common/error_handler.h"
#include "test_support.h"

using namespace emuflow;

void testScaleAndOrigin() {
    std::cout << "[TEST] Scale and Origin\n";

    CoordinateMapper mapper;
    CHECK(!mapper.isReady());
    CHECK_THROWS_AS(mapper.localToScreen(0, 0), CommandExecutionError);

    CHECK(mapper.update(Resolution(1080, 1920), SurfaceRect(100, 50, 540, 960)));
    CHECK(mapper.isReady());
    CHECK(mapper.getScaleX() == 0.5);
    CHECK(mapper.getScaleY() == 0.5);

    CHECK(mapper.localToScreen(540, 960) == Point(370, 530));
    CHECK(mapper.localToScreen(0, 0) == Point(100, 50));
    CHECK(mapper.localToScreen(1079, 1919) == Point(640, 1010));

    std::cout << "[OK] Scale and origin test passed\n\n";
}

void testOutOfRangeIsRejected() {
    std::cout << "[TEST] Out Of Range Rejected\n";

    CoordinateMapper mapper;
    mapper.update(Resolution(1080, 1920), SurfaceRect(0, 0, 540, 960));

    CHECK_THROWS_AS(mapper.localToScreen(1080, 960), OutOfRangeError);
    CHECK_THROWS_AS(mapper.localToScreen(-1, 0), OutOfRangeError);
    CHECK_THROWS_AS(mapper.localToScreen(0, 1920), OutOfRangeError);
    CHECK_THROWS_AS(mapper.localToImage(1080, 0, 540, 960), OutOfRangeError);

    // OutOfRangeError is a command failure, so on_fail policies apply to it
    try {
        mapper.localToScreen(5000, 5000);
        CHECK(false);
    } catch (const CommandExecutionError& e) {
        CHECK(e.getType() == ErrorType::OUT_OF_RANGE_ERROR);
    }

    std::cout << "[OK] Out of range rejected test passed\n\n";
}

void testImageMapping() {
    std::cout << "[TEST] Image Mapping\n";

    CoordinateMapper mapper;
    mapper.update(Resolution(1080, 1920), SurfaceRect(0, 0, 1080, 1920));

    // Frames may come back at a different size than the logical resolution
    CHECK(mapper.localToImage(540, 960, 540, 960) == Point(270, 480));
    CHECK(mapper.localToImage(1079, 1919, 540, 960) == Point(539, 959));
    CHECK(mapper.imageToLocal(270, 480, 540, 960) == Point(540, 960));
    CHECK(mapper.imageToLocal(539, 959, 540, 960) == Point(1078, 1918));

    Region region = mapper.regionToImage(Region(0, 0, 540, 960), 540, 960);
    CHECK(region == Region(0, 0, 270, 480));

    Region sliver = mapper.regionToImage(Region(1, 1, 2, 2), 540, 960);
    CHECK(sliver.width() >= 1 && sliver.height() >= 1);

    CHECK_THROWS_AS(mapper.regionToImage(Region(0, 0, 1081, 10), 540, 960), OutOfRangeError);
    CHECK_THROWS_AS(mapper.regionToImage(Region(10, 0, 10, 10), 540, 960), OutOfRangeError);
    CHECK_THROWS_AS(mapper.localToImage(0, 0, 0, 0), CommandExecutionError);

    std::cout << "[OK] Image mapping test passed\n\n";
}

void testRecomputeOnlyOnChange() {
    std::cout << "[TEST] Recompute Only On Change\n";

    CoordinateMapper mapper;
    CHECK(mapper.update(Resolution(720, 1280), SurfaceRect(0, 0, 720, 1280)));
    CHECK(!mapper.update(Resolution(720, 1280), SurfaceRect(0, 0, 720, 1280)));
    CHECK(mapper.getRecomputeCount() == 1);
    CHECK(mapper.getScaleX() == 1.0);

    CHECK(mapper.update(Resolution(720, 1280), SurfaceRect(0, 0, 360, 640)));
    CHECK(mapper.getRecomputeCount() == 2);
    CHECK(mapper.getScaleY() == 0.5);

    CHECK_THROWS_AS(mapper.update(Resolution(0, 1280), SurfaceRect(0, 0, 360, 640)), ConfigurationError);
    CHECK_THROWS_AS(mapper.update(Resolution(720, 1280), SurfaceRect(0, 0, 0, 0)), ConfigurationError);

    // A rejected update leaves the previous geometry in place
    CHECK(mapper.getSurface() == SurfaceRect(0, 0, 360, 640));

    std::cout << "[OK] Recompute only on change test passed\n\n";
}

int main() {
    std::cout << "=== emuflow Coordinate Mapper Test Suite ===\n\n";

    try {
        testScaleAndOrigin();
        testOutOfRangeIsRejected();
        testImageMapping();
        testRecomputeOnlyOnChange();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
