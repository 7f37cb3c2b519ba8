#ifndef EMUFLOW_TEST_FAKES_H
#define EMUFLOW_TEST_FAKES_H

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "ocal/device_interface.h"
#include "environmental_perception/capture_provider.h"
#include "environmental_perception/screenshot.h"

namespace emuflow {
namespace testing {

inline ocal::ShellResult shellOk(const std::string& output) {
    ocal::ShellResult result;
    result.status = ocal::ShellStatus::OK;
    result.exitCode = 0;
    result.output = output;
    return result;
}

inline ocal::ShellResult shellStatus(ocal::ShellStatus status, int exitCode = -1) {
    ocal::ShellResult result;
    result.status = status;
    result.exitCode = exitCode;
    return result;
}

inline Screenshot makeFrame(int width, int height, const Rgb& fill) {
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * static_cast<size_t>(height) * 3);
    for (size_t i = 0; i < pixels.size(); i += 3) {
        pixels[i] = static_cast<uint8_t>(fill.r);
        pixels[i + 1] = static_cast<uint8_t>(fill.g);
        pixels[i + 2] = static_cast<uint8_t>(fill.b);
    }
    return Screenshot(width, height, std::move(pixels), "fake");
}

inline void setPixel(Screenshot& frame, int x, int y, const Rgb& color) {
    size_t offset = (static_cast<size_t>(y) * static_cast<size_t>(frame.width) + static_cast<size_t>(x)) * 3;
    frame.data[offset] = static_cast<uint8_t>(color.r);
    frame.data[offset + 1] = static_cast<uint8_t>(color.g);
    frame.data[offset + 2] = static_cast<uint8_t>(color.b);
}

/**
 * Shell transport answering from a command -> result table.
 * Unknown commands get TRANSPORT_ERROR.
 */
class FakeShell : public ocal::IDeviceShell {
public:
    struct Call {
        std::string kind;  // "shell", "exec-out" or "adb"
        std::string targetId;
        std::string command;
        int timeoutMs;
    };

    void setResponse(const std::string& command, const ocal::ShellResult& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_responses[command] = result;
    }

    ocal::ShellResult runShell(const std::string& targetId, const std::string& command, int timeoutMs) override {
        return answer("shell", targetId, command, timeoutMs);
    }

    ocal::ShellResult execOut(const std::string& targetId, const std::string& command, int timeoutMs) override {
        return answer("exec-out", targetId, command, timeoutMs);
    }

    ocal::ShellResult runAdb(const std::vector<std::string>& args, int timeoutMs) override {
        std::string joined;
        for (const auto& arg : args) {
            joined += (joined.empty() ? "" : " ") + arg;
        }
        return answer("adb", "", joined, timeoutMs);
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    size_t callCount(const std::string& command) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t count = 0;
        for (const auto& call : m_calls) {
            if (call.command == command) {
                ++count;
            }
        }
        return count;
    }

private:
    ocal::ShellResult answer(const std::string& kind, const std::string& targetId,
                             const std::string& command, int timeoutMs) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back(Call{kind, targetId, command, timeoutMs});
        auto it = m_responses.find(command);
        if (it == m_responses.end()) {
            return shellStatus(ocal::ShellStatus::TRANSPORT_ERROR);
        }
        return it->second;
    }

    mutable std::mutex m_mutex;
    std::map<std::string, ocal::ShellResult> m_responses;
    std::vector<Call> m_calls;
};

// Records every input it is asked to send
class FakeController : public ocal::IDeviceController {
public:
    std::vector<std::string> targets;
    std::map<std::string, SurfaceRect> surfaces;
    bool rejectClicks = false;
    bool rejectKeys = false;

    std::vector<std::string> listTargets() override { return targets; }

    std::optional<SurfaceRect> observeSurface(const std::string& targetId) override {
        auto it = surfaces.find(targetId);
        if (it == surfaces.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool sendClick(const std::string& targetId, const ocal::TapRequest& request) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        (void)targetId;
        m_clicks.push_back(request);
        return !rejectClicks;
    }

    bool sendKey(const std::string& targetId, const std::string& key) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        (void)targetId;
        m_keys.push_back(key);
        return !rejectKeys;
    }

    bool sendText(const std::string& targetId, const std::string& text) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        (void)targetId;
        m_texts.push_back(text);
        return true;
    }

    bool sendHotkey(const std::string& targetId, const std::vector<std::string>& keys,
                    bool simultaneous) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        (void)targetId;
        m_hotkeys.push_back(std::make_pair(keys, simultaneous));
        return true;
    }

    std::vector<ocal::TapRequest> clicks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_clicks;
    }
    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_keys;
    }
    std::vector<std::string> texts() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_texts;
    }
    std::vector<std::pair<std::vector<std::string>, bool>> hotkeys() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_hotkeys;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<ocal::TapRequest> m_clicks;
    std::vector<std::string> m_keys;
    std::vector<std::string> m_texts;
    std::vector<std::pair<std::vector<std::string>, bool>> m_hotkeys;
};

/**
 * Capture provider serving frames from a generator; the argument is the
 * zero based grab count. A generator returning nullopt simulates failure.
 */
class FakeCaptureProvider : public ICaptureProvider {
public:
    using Generator = std::function<std::optional<Screenshot>(int)>;

    FakeCaptureProvider(const std::string& name, Generator generator)
        : m_name(name), m_generator(std::move(generator)), m_grabs(0) {}

    // Always the same frame
    FakeCaptureProvider(const std::string& name, const Screenshot& frame)
        : FakeCaptureProvider(name, [frame](int) { return std::optional<Screenshot>(frame); }) {}

    std::string name() const override { return m_name; }

    std::optional<Screenshot> grab(const std::string& targetId, int timeoutMs) override {
        (void)targetId;
        (void)timeoutMs;
        int index;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            index = m_grabs++;
        }
        return m_generator(index);
    }

    int grabCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_grabs;
    }

private:
    std::string m_name;
    Generator m_generator;
    mutable std::mutex m_mutex;
    int m_grabs;
};

} // namespace testing
} // namespace emuflow

#endif // EMUFLOW_TEST_FAKES_H
