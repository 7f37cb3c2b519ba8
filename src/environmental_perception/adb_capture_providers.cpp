#include "adb_capture_providers.h"
#include "../common/structured_logger.h"
#include "../common/input_validator.h"
#include <cstdint>

namespace emuflow {

namespace {

const uint32_t PIXEL_FORMAT_RGBA_8888 = 1;
const uint32_t PIXEL_FORMAT_RGBX_8888 = 2;
const uint32_t MAX_DIMENSION = 16384;

uint32_t readLe32(const std::string& raw, size_t offset) {
    return static_cast<uint32_t>(static_cast<uint8_t>(raw[offset])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(raw[offset + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(raw[offset + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(raw[offset + 3])) << 24);
}

} // anonymous namespace

std::optional<Screenshot> decodeRawScreencap(const std::string& raw, const std::string& provider) {
    if (raw.size() < 12) {
        return std::nullopt;
    }

    uint32_t width = readLe32(raw, 0);
    uint32_t height = readLe32(raw, 4);
    uint32_t format = readLe32(raw, 8);
    if (width == 0 || height == 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        return std::nullopt;
    }
    if (format != PIXEL_FORMAT_RGBA_8888 && format != PIXEL_FORMAT_RGBX_8888) {
        SLOG_WARNING().message("Unsupported screencap pixel format")
            .context("provider", provider)
            .context("format", format);
        return std::nullopt;
    }

    size_t pixelBytes = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    size_t headerSize;
    if (raw.size() == 12 + pixelBytes) {
        headerSize = 12;
    } else if (raw.size() >= 16 + pixelBytes) {
        headerSize = 16;
    } else {
        SLOG_WARNING().message("Truncated screencap stream")
            .context("provider", provider)
            .context("bytes", raw.size())
            .context("expected", 16 + pixelBytes);
        return std::nullopt;
    }

    std::vector<uint8_t> rgb;
    rgb.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    const char* src = raw.data() + headerSize;
    uint8_t* dst = rgb.data();
    for (size_t i = 0; i < static_cast<size_t>(width) * static_cast<size_t>(height); ++i) {
        dst[0] = static_cast<uint8_t>(src[0]);
        dst[1] = static_cast<uint8_t>(src[1]);
        dst[2] = static_cast<uint8_t>(src[2]);
        src += 4;
        dst += 3;
    }

    return Screenshot(static_cast<int>(width), static_cast<int>(height), std::move(rgb), provider);
}

std::optional<Screenshot> ExecOutScreencapProvider::grab(const std::string& targetId, int timeoutMs) {
    ocal::ShellResult result = m_shell.execOut(targetId, "screencap", timeoutMs);
    if (!result.ok()) {
        SLOG_DEBUG().message("exec-out screencap failed")
            .target(targetId)
            .context("timed_out", result.status == ocal::ShellStatus::TIMEOUT)
            .context("error", result.error);
        return std::nullopt;
    }
    return decodeRawScreencap(result.output, name());
}

std::optional<Screenshot> DeviceFileScreencapProvider::grab(const std::string& targetId, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    std::string quotedPath = InputValidator::quoteForShell(m_devicePath);

    ocal::ShellResult written = m_shell.runShell(targetId, "screencap " + quotedPath, timeoutMs);
    if (!written.ok()) {
        SLOG_DEBUG().message("screencap to device file failed")
            .target(targetId)
            .context("error", written.error);
        return std::nullopt;
    }

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (left <= 0) {
        return std::nullopt;
    }

    ocal::ShellResult pulled = m_shell.execOut(targetId, "cat " + quotedPath, static_cast<int>(left));
    if (!pulled.ok()) {
        SLOG_DEBUG().message("Reading screencap file failed")
            .target(targetId)
            .context("error", pulled.error);
        return std::nullopt;
    }
    return decodeRawScreencap(pulled.output, name());
}

} // namespace emuflow
