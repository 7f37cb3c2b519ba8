#ifndef EMUFLOW_COORDINATE_MAPPER_H
#define EMUFLOW_COORDINATE_MAPPER_H

#include "../common/types.h"

namespace emuflow {

/**
 * @class CoordinateMapper
 * @brief Maps logical script coordinates onto a target's surface and frames
 *
 * Logical space is the target's resolution (rw x rh). Points outside
 * [0, rw) x [0, rh) are rejected with OutOfRangeError, never clamped.
 */
class CoordinateMapper {
public:
    CoordinateMapper();

    // Returns true when the scale had to be recomputed
    bool update(const Resolution& logical, const SurfaceRect& surface);

    bool isReady() const { return m_logical.isValid() && m_surface.isValid(); }

    Point localToScreen(int x, int y) const;
    Point localToImage(int x, int y, int imageWidth, int imageHeight) const;
    Point imageToLocal(int x, int y, int imageWidth, int imageHeight) const;

    // Half-open logical region to frame region; requires 0 <= x1 < x2 <= rw and likewise for y
    Region regionToImage(const Region& region, int imageWidth, int imageHeight) const;

    double getScaleX() const { return m_scaleX; }
    double getScaleY() const { return m_scaleY; }
    const Resolution& getLogical() const { return m_logical; }
    const SurfaceRect& getSurface() const { return m_surface; }
    int getRecomputeCount() const { return m_recomputeCount; }

private:
    void requireReady() const;
    void requireInside(int x, int y) const;

    Resolution m_logical;
    SurfaceRect m_surface;
    double m_scaleX;
    double m_scaleY;
    int m_recomputeCount;
};

} // namespace emuflow

#endif // EMUFLOW_COORDINATE_MAPPER_H
