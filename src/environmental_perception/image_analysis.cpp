#include "image_analysis.h"
#include <algorithm>
#include <cstdlib>

namespace emuflow {
namespace vision {

bool pixelMatches(const Rgb& pixel, const Rgb& target, int tolerance) {
    return std::abs(pixel.r - target.r) <= tolerance &&
           std::abs(pixel.g - target.g) <= tolerance &&
           std::abs(pixel.b - target.b) <= tolerance;
}

int colorDifference(const Rgb& a, const Rgb& b) {
    return std::abs(a.r - b.r) + std::abs(a.g - b.g) + std::abs(a.b - b.b);
}

std::optional<ColorMatch> findColor(const Screenshot& frame, const Region& region, const Rgb& target,
                                    int tolerance, SearchMode mode) {
    if (!frame.isValid()) {
        return std::nullopt;
    }

    int x1 = std::max(region.x1, 0);
    int y1 = std::max(region.y1, 0);
    int x2 = std::min(region.x2, frame.width);
    int y2 = std::min(region.y2, frame.height);
    if (x1 >= x2 || y1 >= y2) {
        return std::nullopt;
    }

    int step = mode == SearchMode::GRID ? GRID_STRIDE : 1;
    std::optional<ColorMatch> best;
    int bestDiff = 766;

    for (int y = y1; y < y2; y += step) {
        for (int x = x1; x < x2; x += step) {
            Rgb pixel = frame.pixelAt(x, y);
            if (!pixelMatches(pixel, target, tolerance)) {
                continue;
            }
            int diff = colorDifference(pixel, target);
            if (mode == SearchMode::EXACT) {
                return ColorMatch{x, y, 1.0 - diff / 765.0};
            }
            if (diff < bestDiff) {
                bestDiff = diff;
                best = ColorMatch{x, y, 1.0 - diff / 765.0};
                if (diff == 0) {
                    return best;
                }
            }
        }
    }
    return best;
}

double similarity(const Screenshot& a, const Screenshot& b) {
    if (!a.isValid() || !b.isValid() || a.width != b.width || a.height != b.height) {
        return 0.0;
    }

    uint64_t total = 0;
    for (size_t i = 0; i < a.data.size(); ++i) {
        total += static_cast<uint64_t>(std::abs(static_cast<int>(a.data[i]) - static_cast<int>(b.data[i])));
    }
    double meanDiff = static_cast<double>(total) / static_cast<double>(a.data.size());
    return 1.0 - meanDiff / 255.0;
}

} // namespace vision
} // namespace emuflow
