#pragma once

// device/evdev_rumble.h
//
// Linux force-feedback rumble through the evdev interface (linux/input.h).
//
//   - One FF_RUMBLE effect slot per device, updated in place on every apply().
//   - strong magnitude = intensity, weak magnitude = intensity / 2 (0..0xffff).
//   - Replay length = command duration (ms, clamped to the u16 range).
//   - Device id = filtered EVIOCGPHYS path, falling back to the node path.

#include <memory>
#include <string>
#include <vector>

#include "haptic_device.h"

namespace rh {
namespace device {

class EvdevRumbleDevice final : public HapticDevice {
public:
    static constexpr int kRumbleMax = 0xffff;

    // Opens node_path; returns null if it cannot be opened or lacks FF_RUMBLE.
    static std::unique_ptr<EvdevRumbleDevice> open(const std::string& node_path, std::string* err);

    ~EvdevRumbleDevice() override;

    EvdevRumbleDevice(const EvdevRumbleDevice&) = delete;
    EvdevRumbleDevice& operator=(const EvdevRumbleDevice&) = delete;

    const std::string& id() const override { return id_; }
    const std::string& name() const override { return name_; }
    const std::string& nodePath() const { return node_path_; }

    bool apply(const HapticCommand& cmd) override;
    bool stop() override;
    bool reset() override;
    bool reopen() override;
    std::string lastError() const override { return last_error_; }

private:
    EvdevRumbleDevice(std::string node_path, int fd);

    bool writeEvent(int code, int value);
    void closeFd();

    std::string node_path_;
    std::string id_;
    std::string name_;
    int fd_ = -1;
    int effect_id_ = -1;
    std::string last_error_;
};

// Scans /dev/input/event* for rumble-capable devices we have permission to open.
std::vector<std::unique_ptr<HapticDevice>> discoverEvdevRumbleDevices(const std::string& dir = "/dev/input");

} // namespace device
} // namespace rh
