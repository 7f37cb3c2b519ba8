#ifndef EMUFLOW_CAPTURE_PROVIDER_H
#define EMUFLOW_CAPTURE_PROVIDER_H

#include <string>
#include <optional>
#include "screenshot.h"

namespace emuflow {

/**
 * @brief One way of grabbing a frame from a target
 *
 * grab() returns nullopt on any failure; it must not throw and must return
 * within timeoutMs.
 */
class ICaptureProvider {
public:
    virtual ~ICaptureProvider() = default;

    virtual std::string name() const = 0;
    virtual std::optional<Screenshot> grab(const std::string& targetId, int timeoutMs) = 0;
};

} // namespace emuflow

#endif // EMUFLOW_CAPTURE_PROVIDER_H
