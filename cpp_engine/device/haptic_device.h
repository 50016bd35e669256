#pragma once

// device/haptic_device.h
//
// Actuator abstraction and target routing for the receiving side.
//
// Design notes:
//   - A device belongs to exactly one target (its id unless configured otherwise).
//   - "broadcast" reaches every available device.
//   - A failing device is marked unavailable and reported as DEVICE_ERROR; it is
//     retried by rediscover(), never by the channel.
//   - Applying a command replaces whatever effect the device is playing, so only
//     the later of two overlapping commands remains applied.
//   - No networking, no logging sinks; thread-safe (one mutex).

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "HapticsTypes.h"

namespace rh {
namespace device {

class HapticDevice {
public:
    virtual ~HapticDevice() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& name() const = 0;

    virtual bool apply(const HapticCommand& cmd) = 0;
    virtual bool stop() = 0;
    // Returns the actuator to neutral. Idempotent.
    virtual bool reset() = 0;
    // Re-acquires the underlying handle after a failure.
    virtual bool reopen() { return true; }

    virtual std::string lastError() const { return std::string(); }
};

// evdev phys path -> device id ("=" becomes "_", lowercase).
std::string filterDeviceId(const std::string& raw);

struct DeviceRegistryConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(DeviceRegistryConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // device id -> target. Unlisted devices use their id as target.
    std::map<std::string, std::string> targets_by_device;

    // When non-empty, only these device ids are used.
    std::vector<std::string> enabled_devices;

    double rediscover_period_s = 5.0;
};

std::uint32_t computeDeviceRegistryConfigHash(const DeviceRegistryConfigV1& c);

struct DeviceStatus {
    std::string device_id;
    std::string name;
    std::string target;
    bool available = true;
    std::uint64_t active_command_id = 0;
    std::uint64_t applied_count = 0;
    std::uint64_t failure_count = 0;
};

struct ApplyResult {
    AckStatus status = AckStatus::Ok;
    std::uint32_t devices_applied_u32 = 0;
    // Commands cancelled on the devices this command reached.
    std::vector<std::uint64_t> preempted_command_ids;
};

class DeviceRegistry {
public:
    using Discovery = std::function<std::vector<std::unique_ptr<HapticDevice>>()>;

    explicit DeviceRegistry(const DeviceRegistryConfigV1& cfg, Discovery discovery = Discovery());

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Returns false if a device with the same id is already registered and available,
    // or is disabled. A new handle for an unavailable device replaces the old one.
    bool addDevice(std::unique_ptr<HapticDevice> dev);

    // Runs discovery and registers devices not yet known or currently unavailable.
    // Returns the number added or restored.
    std::size_t discover();

    // Re-opens unavailable devices and runs discovery. Returns devices restored or added.
    std::size_t rediscover();

    ApplyResult apply(const HapticCommand& cmd, double now_s);

    void resetAll();
    void stopAll();

    std::vector<std::string> targets() const;
    bool hasTarget(const std::string& target) const;
    bool anyUnavailable() const;
    std::size_t deviceCount() const;
    std::vector<DeviceStatus> status() const;

    const DeviceRegistryConfigV1& config() const noexcept { return cfg_; }

private:
    struct Entry {
        std::unique_ptr<HapticDevice> dev;
        std::string target;
        bool available = true;
        std::uint64_t active_command_id = 0;
        double active_until_s = 0.0;
        std::uint64_t applied_count = 0;
        std::uint64_t failure_count = 0;
    };

    bool addLocked(std::unique_ptr<HapticDevice> dev);
    std::string targetForLocked(const std::string& device_id) const;

    DeviceRegistryConfigV1 cfg_;
    Discovery discovery_;
    mutable std::mutex mu_;
    std::vector<Entry> entries_;
};

} // namespace device
} // namespace rh
