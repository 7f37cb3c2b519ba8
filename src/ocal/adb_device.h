#ifndef EMUFLOW_ADB_DEVICE_H
#define EMUFLOW_ADB_DEVICE_H

#include <string>
#include <vector>
#include <optional>
#include "device_interface.h"
#include "system_command.h"

namespace emuflow {
namespace ocal {

/**
 * @class AdbDevice
 * @brief Shell transport and device controller backed by the adb binary
 *
 * Stateless apart from configuration, so one instance can serve every
 * worker concurrently.
 */
class AdbDevice : public IDeviceShell, public IDeviceController {
public:
    static constexpr int DEFAULT_WHEEL_DELTA = 300;
    static constexpr int DOUBLE_TAP_GAP_MS = 80;

    explicit AdbDevice(const std::string& adbPath = "adb", int commandTimeoutMs = 5000);

    // IDeviceShell
    ShellResult runShell(const std::string& targetId, const std::string& command, int timeoutMs) override;
    ShellResult execOut(const std::string& targetId, const std::string& command, int timeoutMs) override;
    ShellResult runAdb(const std::vector<std::string>& args, int timeoutMs) override;

    // IDeviceController
    std::vector<std::string> listTargets() override;
    std::optional<SurfaceRect> observeSurface(const std::string& targetId) override;
    bool sendClick(const std::string& targetId, const TapRequest& request) override;
    bool sendKey(const std::string& targetId, const std::string& key) override;
    bool sendText(const std::string& targetId, const std::string& text) override;
    bool sendHotkey(const std::string& targetId, const std::vector<std::string>& keys,
                    bool simultaneous) override;

    // `adb connect host:port`
    bool connect(const std::string& address);

    const std::string& getAdbPath() const { return m_adbPath; }

    // Serials of `adb devices` rows in the "device" state
    static std::vector<std::string> parseDeviceList(const std::string& output);

    /**
     * @brief Map a key name ("Enter", "a", "F5", "KEYCODE_HOME", "66") to an
     * Android keycode name
     * @return nullopt for unknown names
     */
    static std::optional<std::string> keyCodeFor(const std::string& keyName);

    // Argument for `input text`: spaces become %s, then shell quoted
    static std::string escapeInputText(const std::string& text);

private:
    ShellResult toShellResult(const system::CommandResult& result) const;
    ShellResult rejectTarget(const std::string& targetId, const std::string& reason) const;
    bool sendInput(const std::string& targetId, const std::string& command);

    std::string m_adbPath;
    int m_commandTimeoutMs;
};

} // namespace ocal
} // namespace emuflow

#endif // EMUFLOW_ADB_DEVICE_H
