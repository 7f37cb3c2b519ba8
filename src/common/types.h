#ifndef EMUFLOW_TYPES_H
#define EMUFLOW_TYPES_H

#include <string>
#include <optional>

namespace emuflow {

// Physical display size of a target in pixels
struct Resolution {
    int width;
    int height;

    Resolution() : width(0), height(0) {}
    Resolution(int w, int h) : width(w), height(h) {}

    bool isValid() const { return width > 0 && height > 0; }
    bool operator==(const Resolution& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Resolution& other) const { return !(*this == other); }
};

// Where a target's display is drawn and how large it is
struct SurfaceRect {
    int x, y;
    int width, height;

    SurfaceRect(int x = 0, int y = 0, int w = 0, int h = 0)
        : x(x), y(y), width(w), height(h) {}

    bool isValid() const { return width > 0 && height > 0; }
    bool operator==(const SurfaceRect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const SurfaceRect& other) const { return !(*this == other); }
};

// 8-bit per channel color; components are validated to 0..255 where parsed
struct Rgb {
    int r;
    int g;
    int b;

    Rgb(int r = 0, int g = 0, int b = 0) : r(r), g(g), b(b) {}
    bool isValid() const {
        return r >= 0 && r <= 255 && g >= 0 && g <= 255 && b >= 0 && b <= 255;
    }
    bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

// Half-open logical rectangle [x1, x2) x [y1, y2)
struct Region {
    int x1, y1, x2, y2;

    Region(int x1 = 0, int y1 = 0, int x2 = 0, int y2 = 0)
        : x1(x1), y1(y1), x2(x2), y2(y2) {}

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool operator==(const Region& other) const {
        return x1 == other.x1 && y1 == other.y1 && x2 == other.x2 && y2 == other.y2;
    }
};

struct Point {
    int x;
    int y;

    Point(int x = 0, int y = 0) : x(x), y(y) {}
    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief Binds a target id to optional fixed geometry.
 * A resolution given here wins over the device query; a surface given here
 * wins over the observed surface.
 */
struct TargetBinding {
    std::string id;
    std::optional<SurfaceRect> surface;
    std::optional<Resolution> resolution;
};

enum class WorkerState {
    IDLE,
    RUNNING,
    PAUSED,
    STOPPED,
    COMPLETED,
    FAILED
};

inline std::string workerStateToString(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE: return "Idle";
        case WorkerState::RUNNING: return "Running";
        case WorkerState::PAUSED: return "Paused";
        case WorkerState::STOPPED: return "Stopped";
        case WorkerState::COMPLETED: return "Completed";
        case WorkerState::FAILED: return "Failed";
    }
    return "Unknown";
}

} // namespace emuflow

#endif // EMUFLOW_TYPES_H
