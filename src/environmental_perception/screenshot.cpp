#include "screenshot.h"
#include "../common/structured_logger.h"
#include "../common/input_validator.h"
#include "../common/file_utils.h"
#include <algorithm>
#include <sstream>

namespace emuflow {

Screenshot Screenshot::crop(const Region& region) const {
    int x1 = std::max(region.x1, 0);
    int y1 = std::max(region.y1, 0);
    int x2 = std::min(region.x2, width);
    int y2 = std::min(region.y2, height);
    if (!isValid() || x1 >= x2 || y1 >= y2) {
        return Screenshot();
    }

    int w = x2 - x1;
    int h = y2 - y1;
    std::vector<uint8_t> pixels;
    pixels.reserve(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
    for (int y = y1; y < y2; ++y) {
        auto rowStart = data.begin() + (static_cast<size_t>(y) * static_cast<size_t>(width) + x1) * 3;
        pixels.insert(pixels.end(), rowStart, rowStart + static_cast<size_t>(w) * 3);
    }

    Screenshot result(w, h, std::move(pixels), provider);
    result.capturedAt = capturedAt;
    return result;
}

bool Screenshot::saveToFile(const std::string& path) const {
    if (!isValid()) {
        SLOG_ERROR().message("Refusing to save an empty screenshot").context("path", path);
        return false;
    }

    auto pathValidation = InputValidator::validateFilePath(path);
    if (!pathValidation.isValid) {
        SLOG_ERROR().message("Invalid screenshot save path")
            .context("error", pathValidation.errorMessage);
        return false;
    }

    std::string content = "P6\n" + std::to_string(width) + " " + std::to_string(height) + "\n255\n";
    content.append(reinterpret_cast<const char*>(data.data()), data.size());
    if (!utils::FileUtils::writeStringToFile(path, content)) {
        SLOG_ERROR().message("Failed to save screenshot").context("path", path);
        return false;
    }

    SLOG_DEBUG().message("Screenshot saved")
        .context("path", path)
        .context("width", width)
        .context("height", height);
    return true;
}

bool Screenshot::loadFromFile(const std::string& path) {
    auto pathValidation = InputValidator::validateFilePath(path);
    if (!pathValidation.isValid) {
        SLOG_ERROR().message("Invalid screenshot load path")
            .context("error", pathValidation.errorMessage);
        return false;
    }

    std::string content;
    if (!utils::FileUtils::readFileToString(path, content)) {
        SLOG_ERROR().message("Screenshot file could not be read").context("path", path);
        return false;
    }

    std::istringstream header(content);
    std::string magic;
    int w = 0;
    int h = 0;
    int maxValue = 0;
    if (!(header >> magic >> w >> h >> maxValue) || magic != "P6" || maxValue != 255 || w <= 0 || h <= 0) {
        SLOG_ERROR().message("Unsupported screenshot format").context("path", path);
        return false;
    }

    // Exactly one whitespace byte separates the header from the pixels
    auto offset = static_cast<size_t>(header.tellg()) + 1;
    size_t expected = static_cast<size_t>(w) * static_cast<size_t>(h) * 3;
    if (offset > content.size() || content.size() - offset < expected) {
        SLOG_ERROR().message("Screenshot file is truncated")
            .context("path", path)
            .context("expected_bytes", expected);
        return false;
    }

    data.assign(content.begin() + static_cast<std::ptrdiff_t>(offset),
                content.begin() + static_cast<std::ptrdiff_t>(offset + expected));
    width = w;
    height = h;
    provider = "file";
    capturedAt = std::chrono::steady_clock::now();
    return true;
}

} // namespace emuflow
