#ifndef EMUFLOW_IMAGE_ANALYSIS_H
#define EMUFLOW_IMAGE_ANALYSIS_H

#include <optional>
#include "screenshot.h"

namespace emuflow {
namespace vision {

enum class SearchMode {
    EXACT,      // first match in row-major order
    MAX_MATCH,  // smallest color difference in the region
    GRID        // best match among samples every GRID_STRIDE pixels
};

constexpr int GRID_STRIDE = 10;

struct ColorMatch {
    int x;              // frame coordinates
    int y;
    double confidence;  // 1 - (|dr| + |dg| + |db|) / 765
};

// Every channel within tolerance
bool pixelMatches(const Rgb& pixel, const Rgb& target, int tolerance);

int colorDifference(const Rgb& a, const Rgb& b);

/**
 * @brief Search region of frame for target color
 * @return nullopt when no pixel in the region is within tolerance
 */
std::optional<ColorMatch> findColor(const Screenshot& frame, const Region& region, const Rgb& target,
                                    int tolerance, SearchMode mode);

/**
 * @brief 1 - mean absolute channel difference / 255 over two frames of equal size
 * @return 0.0 when sizes differ or either frame is empty
 */
double similarity(const Screenshot& a, const Screenshot& b);

} // namespace vision
} // namespace emuflow

#endif // EMUFLOW_IMAGE_ANALYSIS_H
