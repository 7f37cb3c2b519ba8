#include "adb_device.h"
#include "device_resolution_service.h"
#include "../common/structured_logger.h"
#include "../common/input_validator.h"
#include <map>
#include <sstream>
#include <thread>
#include <chrono>
#include <algorithm>
#include <cctype>

namespace emuflow {
namespace ocal {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string stripSeparators(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c != ' ' && c != '_' && c != '-') {
            out += c;
        }
    }
    return out;
}

const std::map<std::string, std::string>& namedKeyCodes() {
    static const std::map<std::string, std::string> codes = {
        {"ENTER", "KEYCODE_ENTER"},
        {"RETURN", "KEYCODE_ENTER"},
        {"BACK", "KEYCODE_BACK"},
        {"ESC", "KEYCODE_ESCAPE"},
        {"ESCAPE", "KEYCODE_ESCAPE"},
        {"HOME", "KEYCODE_HOME"},
        {"MENU", "KEYCODE_MENU"},
        {"TAB", "KEYCODE_TAB"},
        {"SPACE", "KEYCODE_SPACE"},
        {"BACKSPACE", "KEYCODE_DEL"},
        {"DEL", "KEYCODE_FORWARD_DEL"},
        {"DELETE", "KEYCODE_FORWARD_DEL"},
        {"UP", "KEYCODE_DPAD_UP"},
        {"DOWN", "KEYCODE_DPAD_DOWN"},
        {"LEFT", "KEYCODE_DPAD_LEFT"},
        {"RIGHT", "KEYCODE_DPAD_RIGHT"},
        {"ARROWUP", "KEYCODE_DPAD_UP"},
        {"ARROWDOWN", "KEYCODE_DPAD_DOWN"},
        {"ARROWLEFT", "KEYCODE_DPAD_LEFT"},
        {"ARROWRIGHT", "KEYCODE_DPAD_RIGHT"},
        {"CENTER", "KEYCODE_DPAD_CENTER"},
        {"CTRL", "KEYCODE_CTRL_LEFT"},
        {"CONTROL", "KEYCODE_CTRL_LEFT"},
        {"SHIFT", "KEYCODE_SHIFT_LEFT"},
        {"ALT", "KEYCODE_ALT_LEFT"},
        {"META", "KEYCODE_META_LEFT"},
        {"WIN", "KEYCODE_META_LEFT"},
        {"PAGEUP", "KEYCODE_PAGE_UP"},
        {"PAGEDOWN", "KEYCODE_PAGE_DOWN"},
        {"MOVEHOME", "KEYCODE_MOVE_HOME"},
        {"END", "KEYCODE_MOVE_END"},
        {"INSERT", "KEYCODE_INSERT"},
        {"POWER", "KEYCODE_POWER"},
        {"VOLUMEUP", "KEYCODE_VOLUME_UP"},
        {"VOLUMEDOWN", "KEYCODE_VOLUME_DOWN"},
        {"MUTE", "KEYCODE_VOLUME_MUTE"},
        {"APPSWITCH", "KEYCODE_APP_SWITCH"},
        {"RECENTS", "KEYCODE_APP_SWITCH"},
        {"SEARCH", "KEYCODE_SEARCH"},
        {"CAMERA", "KEYCODE_CAMERA"},
        {"WAKEUP", "KEYCODE_WAKEUP"},
        {"SLEEP", "KEYCODE_SLEEP"},
        {"COMMA", "KEYCODE_COMMA"},
        {"PERIOD", "KEYCODE_PERIOD"},
        {"MINUS", "KEYCODE_MINUS"},
        {"EQUALS", "KEYCODE_EQUALS"},
        {"SLASH", "KEYCODE_SLASH"},
        {"SEMICOLON", "KEYCODE_SEMICOLON"}
    };
    return codes;
}

} // anonymous namespace

AdbDevice::AdbDevice(const std::string& adbPath, int commandTimeoutMs)
    : m_adbPath(adbPath.empty() ? "adb" : adbPath),
      m_commandTimeoutMs(commandTimeoutMs > 0 ? commandTimeoutMs : 5000) {
}

ShellResult AdbDevice::toShellResult(const system::CommandResult& result) const {
    ShellResult shell;
    shell.exitCode = result.exitCode;
    shell.output = result.output;
    shell.error = result.error;
    if (result.timedOut) {
        shell.status = ShellStatus::TIMEOUT;
    } else if (result.launchFailed) {
        shell.status = ShellStatus::TRANSPORT_ERROR;
    } else if (result.exitCode == 1 && (result.error.find("device '") != std::string::npos ||
                                        result.error.find("no devices") != std::string::npos ||
                                        result.error.find("offline") != std::string::npos)) {
        // adb itself reports unreachable targets with exit status 1 and a stderr message
        shell.status = ShellStatus::TRANSPORT_ERROR;
    } else {
        shell.status = ShellStatus::OK;
    }
    return shell;
}

ShellResult AdbDevice::rejectTarget(const std::string& targetId, const std::string& reason) const {
    ShellResult shell;
    shell.status = ShellStatus::TRANSPORT_ERROR;
    shell.error = reason;
    SLOG_WARNING().message("Rejected device id").target(targetId).context("reason", reason);
    return shell;
}

ShellResult AdbDevice::runShell(const std::string& targetId, const std::string& command, int timeoutMs) {
    auto idCheck = InputValidator::validateDeviceId(targetId);
    if (!idCheck) {
        return rejectTarget(targetId, idCheck.errorMessage);
    }
    return toShellResult(system::executeCommand({m_adbPath, "-s", targetId, "shell", command}, timeoutMs));
}

ShellResult AdbDevice::execOut(const std::string& targetId, const std::string& command, int timeoutMs) {
    auto idCheck = InputValidator::validateDeviceId(targetId);
    if (!idCheck) {
        return rejectTarget(targetId, idCheck.errorMessage);
    }
    return toShellResult(system::executeCommand({m_adbPath, "-s", targetId, "exec-out", command}, timeoutMs));
}

ShellResult AdbDevice::runAdb(const std::vector<std::string>& args, int timeoutMs) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(m_adbPath);
    argv.insert(argv.end(), args.begin(), args.end());
    return toShellResult(system::executeCommand(argv, timeoutMs));
}

std::vector<std::string> AdbDevice::parseDeviceList(const std::string& output) {
    std::vector<std::string> serials;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line.rfind("List of devices", 0) == 0 || line[0] == '*') {
            continue;
        }
        std::istringstream fields(line);
        std::string serial;
        std::string state;
        if (!(fields >> serial >> state)) {
            continue;
        }
        if (state == "device") {
            serials.push_back(serial);
        }
    }
    return serials;
}

std::vector<std::string> AdbDevice::listTargets() {
    ShellResult result = runAdb({"devices"}, m_commandTimeoutMs);
    if (!result.ok()) {
        SLOG_ERROR().message("adb devices failed")
            .context("adb_path", m_adbPath)
            .context("exit_code", result.exitCode)
            .context("error", result.error);
        return {};
    }

    std::vector<std::string> targets;
    for (const auto& serial : parseDeviceList(result.output)) {
        if (InputValidator::validateDeviceId(serial)) {
            targets.push_back(serial);
        } else {
            SLOG_WARNING().message("Ignoring device with unsupported serial").context("serial", serial);
        }
    }

    SLOG_DEBUG().message("Listed targets").context("count", targets.size());
    return targets;
}

std::optional<SurfaceRect> AdbDevice::observeSurface(const std::string& targetId) {
    ShellResult result = runShell(targetId, "wm size", m_commandTimeoutMs);
    if (!result.ok()) {
        SLOG_DEBUG().message("Surface observation failed")
            .target(targetId)
            .context("error", result.error);
        return std::nullopt;
    }
    auto size = DeviceResolutionService::parseWmSize(result.output);
    if (!size) {
        return std::nullopt;
    }
    return SurfaceRect(0, 0, size->width, size->height);
}

bool AdbDevice::sendInput(const std::string& targetId, const std::string& command) {
    ShellResult result = runShell(targetId, command, m_commandTimeoutMs);
    if (!result.ok()) {
        SLOG_WARNING().message("Input command failed")
            .target(targetId)
            .context("command", command)
            .context("exit_code", result.exitCode)
            .context("timed_out", result.status == ShellStatus::TIMEOUT)
            .context("error", result.error);
        return false;
    }
    return true;
}

bool AdbDevice::sendClick(const std::string& targetId, const TapRequest& request) {
    std::string tap = "input tap " + std::to_string(request.x) + " " + std::to_string(request.y);

    switch (request.button) {
        case MouseButton::LEFT:
            return sendInput(targetId, tap);

        case MouseButton::DOUBLE:
            if (!sendInput(targetId, tap)) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(DOUBLE_TAP_GAP_MS));
            return sendInput(targetId, tap);

        case MouseButton::RIGHT:
            // Touch targets have no secondary button; Back is the closest equivalent
            return sendInput(targetId, "input keyevent KEYCODE_BACK");

        case MouseButton::WHEEL_UP:
        case MouseButton::WHEEL_DOWN: {
            int delta = request.wheelDelta > 0 ? request.wheelDelta : DEFAULT_WHEEL_DELTA;
            int endY = request.button == MouseButton::WHEEL_UP ? request.y + delta : request.y - delta;
            if (endY < 0) {
                endY = 0;
            }
            return sendInput(targetId, "input swipe " + std::to_string(request.x) + " " +
                                       std::to_string(request.y) + " " + std::to_string(request.x) + " " +
                                       std::to_string(endY) + " 150");
        }
    }
    return false;
}

std::optional<std::string> AdbDevice::keyCodeFor(const std::string& keyName) {
    if (keyName.empty()) {
        return std::nullopt;
    }

    std::string upper = toUpper(keyName);

    if (upper.rfind("KEYCODE_", 0) == 0) {
        if (InputValidator::matchesPattern(upper, "^KEYCODE_[A-Z0-9_]+$")) {
            return upper;
        }
        return std::nullopt;
    }

    if (InputValidator::matchesPattern(upper, "^[0-9]{2,3}$")) {
        return upper;
    }

    if (upper.size() == 1) {
        char c = upper[0];
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
            return std::string("KEYCODE_") + c;
        }
    }

    if (InputValidator::matchesPattern(upper, "^F([1-9]|1[0-2])$")) {
        return "KEYCODE_" + upper;
    }

    const auto& codes = namedKeyCodes();
    auto it = codes.find(stripSeparators(upper));
    if (it != codes.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool AdbDevice::sendKey(const std::string& targetId, const std::string& key) {
    auto code = keyCodeFor(key);
    if (!code) {
        SLOG_WARNING().message("Unknown key name").target(targetId).context("key", key);
        return false;
    }
    return sendInput(targetId, "input keyevent " + *code);
}

bool AdbDevice::sendHotkey(const std::string& targetId, const std::vector<std::string>& keys,
                           bool simultaneous) {
    std::vector<std::string> codes;
    for (const auto& key : keys) {
        auto code = keyCodeFor(key);
        if (!code) {
            SLOG_WARNING().message("Unknown key name in hotkey").target(targetId).context("key", key);
            return false;
        }
        codes.push_back(*code);
    }
    if (codes.empty()) {
        return false;
    }

    if (simultaneous) {
        std::string command = "input keycombination";
        for (const auto& code : codes) {
            command += " " + code;
        }
        return sendInput(targetId, command);
    }

    for (const auto& code : codes) {
        if (!sendInput(targetId, "input keyevent " + code)) {
            return false;
        }
    }
    return true;
}

std::string AdbDevice::escapeInputText(const std::string& text) {
    std::string spaced;
    spaced.reserve(text.size());
    for (char c : text) {
        if (c == ' ') {
            spaced += "%s";
        } else {
            spaced += c;
        }
    }
    return InputValidator::quoteForShell(spaced);
}

bool AdbDevice::sendText(const std::string& targetId, const std::string& text) {
    if (text.empty()) {
        return true;
    }
    return sendInput(targetId, "input text " + escapeInputText(text));
}

bool AdbDevice::connect(const std::string& address) {
    auto idCheck = InputValidator::validateDeviceId(address);
    if (!idCheck || address.find(':') == std::string::npos) {
        SLOG_ERROR().message("Invalid network device address").context("address", address);
        return false;
    }

    ShellResult result = runAdb({"connect", address}, m_commandTimeoutMs);
    std::string lowered = result.output;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    bool connected = result.ok() && lowered.find("connected") != std::string::npos &&
                     lowered.find("cannot") == std::string::npos && lowered.find("failed") == std::string::npos;
    if (connected) {
        SLOG_INFO().message("Connected to network device").context("address", address);
    } else {
        SLOG_WARNING().message("Failed to connect to network device")
            .context("address", address)
            .context("output", result.output)
            .context("error", result.error);
    }
    return connected;
}

} // namespace ocal
} // namespace emuflow
