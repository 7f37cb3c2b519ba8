#ifndef EMUFLOW_DEVICE_INTERFACE_H
#define EMUFLOW_DEVICE_INTERFACE_H

#include <string>
#include <vector>
#include <optional>
#include "../common/types.h"

namespace emuflow {
namespace ocal {

enum class ShellStatus {
    OK,
    TIMEOUT,
    TRANSPORT_ERROR
};

struct ShellResult {
    ShellStatus status;
    int exitCode;
    std::string output;
    std::string error;

    ShellResult() : status(ShellStatus::TRANSPORT_ERROR), exitCode(-1) {}

    bool ok() const { return status == ShellStatus::OK && exitCode == 0; }
};

/**
 * @brief Command transport to a target (ADB or a test double)
 *
 * Every call carries an explicit timeout. A call never throws; failures are
 * reported through ShellResult::status.
 */
class IDeviceShell {
public:
    virtual ~IDeviceShell() = default;

    // `adb -s <id> shell <command>`
    virtual ShellResult runShell(const std::string& targetId, const std::string& command, int timeoutMs) = 0;

    // `adb -s <id> exec-out <command>`; output is binary safe
    virtual ShellResult execOut(const std::string& targetId, const std::string& command, int timeoutMs) = 0;

    // `adb <args...>`
    virtual ShellResult runAdb(const std::vector<std::string>& args, int timeoutMs) = 0;
};

enum class MouseButton {
    LEFT,
    RIGHT,
    DOUBLE,
    WHEEL_UP,
    WHEEL_DOWN
};

// Physical coordinates, already mapped from logical script space
struct TapRequest {
    MouseButton button;
    int x;
    int y;
    int wheelDelta;

    TapRequest(MouseButton b = MouseButton::LEFT, int px = 0, int py = 0, int delta = 0)
        : button(b), x(px), y(py), wheelDelta(delta) {}
};

/**
 * @brief Input and discovery operations against targets
 *
 * The send* calls return false when the target rejected the input or could
 * not be reached; they do not throw.
 */
class IDeviceController {
public:
    virtual ~IDeviceController() = default;

    virtual std::vector<std::string> listTargets() = 0;

    // Origin and size of the target's drawing surface, if it can be observed
    virtual std::optional<SurfaceRect> observeSurface(const std::string& targetId) = 0;

    virtual bool sendClick(const std::string& targetId, const TapRequest& request) = 0;
    virtual bool sendKey(const std::string& targetId, const std::string& key) = 0;
    virtual bool sendText(const std::string& targetId, const std::string& text) = 0;
    virtual bool sendHotkey(const std::string& targetId, const std::vector<std::string>& keys,
                            bool simultaneous) = 0;
};

} // namespace ocal
} // namespace emuflow

#endif // EMUFLOW_DEVICE_INTERFACE_H
