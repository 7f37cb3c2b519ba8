#include "coordinate_mapper.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <algorithm>
#include <cmath>

namespace emuflow {

CoordinateMapper::CoordinateMapper()
    : m_scaleX(1.0), m_scaleY(1.0), m_recomputeCount(0) {
}

bool CoordinateMapper::update(const Resolution& logical, const SurfaceRect& surface) {
    if (logical == m_logical && surface == m_surface && isReady()) {
        return false;
    }
    if (!logical.isValid() || !surface.isValid()) {
        throw ConfigurationError("Coordinate mapper needs a positive resolution and surface size", "mapper");
    }

    m_logical = logical;
    m_surface = surface;
    m_scaleX = static_cast<double>(surface.width) / logical.width;
    m_scaleY = static_cast<double>(surface.height) / logical.height;
    ++m_recomputeCount;

    SLOG_DEBUG().message("Coordinate scale recomputed")
        .context("logical", std::to_string(logical.width) + "x" + std::to_string(logical.height))
        .context("surface", std::to_string(surface.width) + "x" + std::to_string(surface.height))
        .context("scale_x", m_scaleX)
        .context("scale_y", m_scaleY);
    return true;
}

void CoordinateMapper::requireReady() const {
    if (!isReady()) {
        throw CommandExecutionError("Coordinate mapper has no geometry", "mapper");
    }
}

void CoordinateMapper::requireInside(int x, int y) const {
    if (x < 0 || y < 0 || x >= m_logical.width || y >= m_logical.height) {
        throw OutOfRangeError("Point (" + std::to_string(x) + ", " + std::to_string(y) +
                              ") is outside the logical area " + std::to_string(m_logical.width) + "x" +
                              std::to_string(m_logical.height), "mapper");
    }
}

Point CoordinateMapper::localToScreen(int x, int y) const {
    requireReady();
    requireInside(x, y);
    return Point(m_surface.x + static_cast<int>(std::lround(x * m_scaleX)),
                 m_surface.y + static_cast<int>(std::lround(y * m_scaleY)));
}

Point CoordinateMapper::localToImage(int x, int y, int imageWidth, int imageHeight) const {
    requireReady();
    requireInside(x, y);
    if (imageWidth <= 0 || imageHeight <= 0) {
        throw CommandExecutionError("Frame has no pixels", "mapper");
    }
    int ix = static_cast<int>(std::lround(static_cast<double>(x) * imageWidth / m_logical.width));
    int iy = static_cast<int>(std::lround(static_cast<double>(y) * imageHeight / m_logical.height));
    return Point(std::min(ix, imageWidth - 1), std::min(iy, imageHeight - 1));
}

Point CoordinateMapper::imageToLocal(int x, int y, int imageWidth, int imageHeight) const {
    requireReady();
    if (imageWidth <= 0 || imageHeight <= 0) {
        throw CommandExecutionError("Frame has no pixels", "mapper");
    }
    int lx = static_cast<int>(std::lround(static_cast<double>(x) * m_logical.width / imageWidth));
    int ly = static_cast<int>(std::lround(static_cast<double>(y) * m_logical.height / imageHeight));
    return Point(std::max(0, std::min(lx, m_logical.width - 1)),
                 std::max(0, std::min(ly, m_logical.height - 1)));
}

Region CoordinateMapper::regionToImage(const Region& region, int imageWidth, int imageHeight) const {
    requireReady();
    if (region.x1 < 0 || region.y1 < 0 || region.x1 >= region.x2 || region.y1 >= region.y2 ||
        region.x2 > m_logical.width || region.y2 > m_logical.height) {
        throw OutOfRangeError("Region (" + std::to_string(region.x1) + ", " + std::to_string(region.y1) + ")-(" +
                              std::to_string(region.x2) + ", " + std::to_string(region.y2) +
                              ") is outside the logical area " + std::to_string(m_logical.width) + "x" +
                              std::to_string(m_logical.height), "mapper");
    }
    if (imageWidth <= 0 || imageHeight <= 0) {
        throw CommandExecutionError("Frame has no pixels", "mapper");
    }

    double sx = static_cast<double>(imageWidth) / m_logical.width;
    double sy = static_cast<double>(imageHeight) / m_logical.height;
    int x1 = static_cast<int>(std::floor(region.x1 * sx));
    int y1 = static_cast<int>(std::floor(region.y1 * sy));
    int x2 = static_cast<int>(std::ceil(region.x2 * sx));
    int y2 = static_cast<int>(std::ceil(region.y2 * sy));
    return Region(x1, y1, std::max(x1 + 1, std::min(x2, imageWidth)), std::max(y1 + 1, std::min(y2, imageHeight)));
}

} // namespace emuflow
