#ifndef EMUFLOW_SCREENSHOT_H
#define EMUFLOW_SCREENSHOT_H

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <utility>
#include "../common/types.h"

namespace emuflow {

/**
 * @brief Captured frame of a target's display, 8-bit RGB, row-major
 */
struct Screenshot {
    std::vector<uint8_t> data;
    int width, height;
    std::string provider;
    std::chrono::steady_clock::time_point capturedAt;

    Screenshot() : width(0), height(0) {}
    Screenshot(int w, int h, std::vector<uint8_t> pixels, const std::string& providerName = "")
        : data(std::move(pixels)), width(w), height(h), provider(providerName),
          capturedAt(std::chrono::steady_clock::now()) {}

    bool isValid() const {
        return width > 0 && height > 0 &&
               data.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * 3;
    }

    bool contains(int x, int y) const { return x >= 0 && y >= 0 && x < width && y < height; }

    // Caller guarantees contains(x, y)
    Rgb pixelAt(int x, int y) const {
        size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(width) + static_cast<size_t>(x)) * 3;
        return Rgb(data[offset], data[offset + 1], data[offset + 2]);
    }

    // Intersection of region with the frame; empty Screenshot if they do not overlap
    Screenshot crop(const Region& region) const;

    // Binary PPM (P6)
    bool saveToFile(const std::string& path) const;
    bool loadFromFile(const std::string& path);
};

} // namespace emuflow

#endif // EMUFLOW_SCREENSHOT_H
