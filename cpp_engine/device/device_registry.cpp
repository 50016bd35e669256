// device/device_registry.cpp
//
// Routing rules:
//   - broadcast -> every available device
//   - otherwise -> devices whose target matches; none registered -> UNKNOWN_TARGET
//   - any device failure marks it unavailable and yields DEVICE_ERROR
//   - all matching devices already unavailable -> DEVICE_ERROR

#include "haptic_device.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {
namespace device {

std::string filterDeviceId(const std::string& raw) {
    std::string out = raw;
    for (auto& c : out) {
        if (c == '=') {
            c = '_';
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return out;
}

std::uint32_t computeDeviceRegistryConfigHash(const DeviceRegistryConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(c.targets_by_device.size()));
    for (const auto& kv : c.targets_by_device) {
        h = fnv1a32_add_str(h, kv.first);
        h = fnv1a32_add_str(h, kv.second);
    }
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(c.enabled_devices.size()));
    for (const auto& d : c.enabled_devices) h = fnv1a32_add_str(h, d);
    h = fnv1a32_add_f64(h, c.rediscover_period_s);
    return h;
}

DeviceRegistry::DeviceRegistry(const DeviceRegistryConfigV1& cfg, Discovery discovery)
    : cfg_(cfg), discovery_(std::move(discovery)) {
    cfg_.fnv_hash_u32 = computeDeviceRegistryConfigHash(cfg_);
}

std::string DeviceRegistry::targetForLocked(const std::string& device_id) const {
    auto it = cfg_.targets_by_device.find(device_id);
    if (it != cfg_.targets_by_device.end() && isValidTargetName(it->second)) return it->second;
    return device_id;
}

bool DeviceRegistry::addLocked(std::unique_ptr<HapticDevice> dev) {
    if (!dev) return false;
    const std::string id = dev->id();
    if (!cfg_.enabled_devices.empty() &&
        std::find(cfg_.enabled_devices.begin(), cfg_.enabled_devices.end(), id) == cfg_.enabled_devices.end()) {
        spdlog::debug("devices: skipping '{}' (not enabled)", id);
        return false;
    }
    for (auto& e : entries_) {
        if (e.dev->id() != id) continue;
        if (e.available) return false;
        // Same pad re-created at another node: take over the unavailable entry.
        if (!dev->reset()) {
            spdlog::warn("devices: '{}' found again but reset failed: {}", id, dev->lastError());
            return false;
        }
        e.dev = std::move(dev);
        e.available = true;
        e.active_command_id = 0;
        e.active_until_s = 0.0;
        spdlog::info("devices: '{}' available again ({})", id, e.dev->name());
        return true;
    }
    const std::string target = targetForLocked(id);
    if (!isValidTargetName(target) || target == kBroadcastTarget) {
        spdlog::warn("devices: '{}' has unusable target '{}'", id, target);
        return false;
    }
    Entry e;
    e.target = target;
    e.dev = std::move(dev);
    spdlog::info("devices: registered '{}' ({}) as target '{}'", id, e.dev->name(), target);
    entries_.push_back(std::move(e));
    return true;
}

bool DeviceRegistry::addDevice(std::unique_ptr<HapticDevice> dev) {
    std::lock_guard<std::mutex> lock(mu_);
    return addLocked(std::move(dev));
}

std::size_t DeviceRegistry::discover() {
    if (!discovery_) return 0;
    std::vector<std::unique_ptr<HapticDevice>> found = discovery_();
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t added = 0;
    for (auto& d : found) {
        if (addLocked(std::move(d))) ++added;
    }
    return added;
}

std::size_t DeviceRegistry::rediscover() {
    std::size_t restored = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        for (auto& e : entries_) {
            if (e.available) continue;
            if (e.dev->reopen() && e.dev->reset()) {
                e.available = true;
                e.active_command_id = 0;
                ++restored;
                spdlog::info("devices: '{}' available again", e.dev->id());
            }
        }
    }
    return restored + discover();
}

ApplyResult DeviceRegistry::apply(const HapticCommand& cmd, double now_s) {
    ApplyResult r;
    std::lock_guard<std::mutex> lock(mu_);

    const bool broadcast = cmd.isBroadcast();
    bool matched = false;
    bool failed = false;
    for (auto& e : entries_) {
        if (!broadcast && e.target != cmd.device_target) continue;
        matched = true;
        if (!e.available) {
            failed = true;
            continue;
        }
        if (e.active_command_id != 0 && e.active_until_s > now_s) {
            r.preempted_command_ids.push_back(e.active_command_id);
        }
        if (!e.dev->apply(cmd)) {
            e.available = false;
            e.active_command_id = 0;
            ++e.failure_count;
            failed = true;
            spdlog::error("devices: {} on '{}': {}", errorCodeName(ErrorCode::DeviceError), e.dev->id(),
                          e.dev->lastError());
            continue;
        }
        e.active_command_id = cmd.command_id;
        e.active_until_s = now_s + cmd.duration_s;
        ++e.applied_count;
        ++r.devices_applied_u32;
    }

    if (!matched && !broadcast) {
        r.status = AckStatus::UnknownTarget;
    } else if (failed || (!matched && broadcast)) {
        r.status = AckStatus::DeviceError;
    }
    return r;
}

void DeviceRegistry::resetAll() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& e : entries_) {
        e.active_command_id = 0;
        e.active_until_s = 0.0;
        if (!e.available) continue;
        if (!e.dev->reset()) {
            e.available = false;
            ++e.failure_count;
            spdlog::error("devices: reset failed on '{}': {}", e.dev->id(), e.dev->lastError());
        }
    }
}

void DeviceRegistry::stopAll() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& e : entries_) {
        e.active_command_id = 0;
        if (e.available && !e.dev->stop()) {
            spdlog::warn("devices: stop failed on '{}': {}", e.dev->id(), e.dev->lastError());
        }
    }
}

std::vector<std::string> DeviceRegistry::targets() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        if (std::find(out.begin(), out.end(), e.target) == out.end()) out.push_back(e.target);
    }
    return out;
}

bool DeviceRegistry::hasTarget(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : entries_) {
        if (e.target == target) return true;
    }
    return false;
}

bool DeviceRegistry::anyUnavailable() const {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& e : entries_) {
        if (!e.available) return true;
    }
    return false;
}

std::size_t DeviceRegistry::deviceCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}

std::vector<DeviceStatus> DeviceRegistry::status() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<DeviceStatus> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        DeviceStatus s;
        s.device_id = e.dev->id();
        s.name = e.dev->name();
        s.target = e.target;
        s.available = e.available;
        s.active_command_id = e.active_command_id;
        s.applied_count = e.applied_count;
        s.failure_count = e.failure_count;
        out.push_back(std::move(s));
    }
    return out;
}

} // namespace device
} // namespace rh
