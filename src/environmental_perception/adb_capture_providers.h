#ifndef EMUFLOW_ADB_CAPTURE_PROVIDERS_H
#define EMUFLOW_ADB_CAPTURE_PROVIDERS_H

#include <string>
#include <optional>
#include "capture_provider.h"
#include "../ocal/device_interface.h"

namespace emuflow {

/**
 * @brief Decode `screencap` raw output: a 12 byte header (width, height,
 * format as little endian uint32) or a 16 byte header (newer Android adds a
 * color space word), followed by RGBA pixels.
 */
std::optional<Screenshot> decodeRawScreencap(const std::string& raw, const std::string& provider);

// `adb exec-out screencap` streamed straight to the host
class ExecOutScreencapProvider : public ICaptureProvider {
public:
    explicit ExecOutScreencapProvider(ocal::IDeviceShell& shell) : m_shell(shell) {}

    std::string name() const override { return "adb_exec_out"; }
    std::optional<Screenshot> grab(const std::string& targetId, int timeoutMs) override;

private:
    ocal::IDeviceShell& m_shell;
};

// `screencap` to a device file, then `exec-out cat`; for devices whose
// exec-out stream is unreliable
class DeviceFileScreencapProvider : public ICaptureProvider {
public:
    explicit DeviceFileScreencapProvider(ocal::IDeviceShell& shell,
                                         const std::string& devicePath = "/data/local/tmp/emuflow_cap.raw")
        : m_shell(shell), m_devicePath(devicePath) {}

    std::string name() const override { return "adb_device_file"; }
    std::optional<Screenshot> grab(const std::string& targetId, int timeoutMs) override;

private:
    ocal::IDeviceShell& m_shell;
    std::string m_devicePath;
};

} // namespace emuflow

#endif // EMUFLOW_ADB_CAPTURE_PROVIDERS_H
