// device/evdev_rumble.cpp

#include "evdev_rumble.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>

#include <dirent.h>
#include <fcntl.h>
#include <linux/input.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {
namespace device {

namespace {

constexpr std::size_t kBitsPerLong = sizeof(unsigned long) * 8;
constexpr std::size_t kFfLongs = (FF_CNT + kBitsPerLong - 1) / kBitsPerLong;

static inline bool testBit(std::size_t bit, const unsigned long* array) {
    return (array[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

static inline std::string errnoText(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

bool hasRumble(int fd) {
    unsigned long ff_bits[kFfLongs];
    std::memset(ff_bits, 0, sizeof(ff_bits));
    if (::ioctl(fd, EVIOCGBIT(EV_FF, sizeof(ff_bits)), ff_bits) < 0) return false;
    return testBit(FF_RUMBLE, ff_bits);
}


} // namespace

EvdevRumbleDevice::EvdevRumbleDevice(std::string node_path, int fd) : node_path_(std::move(node_path)), fd_(fd) {
    char buf[256];

    std::memset(buf, 0, sizeof(buf));
    if (::ioctl(fd_, EVIOCGNAME(sizeof(buf) - 1), buf) >= 0) name_ = buf;
    if (name_.empty()) name_ = node_path_;

    std::memset(buf, 0, sizeof(buf));
    std::string phys;
    if (::ioctl(fd_, EVIOCGPHYS(sizeof(buf) - 1), buf) >= 0) phys = buf;
    id_ = filterDeviceId(phys.empty() ? node_path_ : phys);
}

EvdevRumbleDevice::~EvdevRumbleDevice() {
    reset();
    closeFd();
}

std::unique_ptr<EvdevRumbleDevice> EvdevRumbleDevice::open(const std::string& node_path, std::string* err) {
    const int fd = ::open(node_path.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        if (err) *err = errnoText(node_path.c_str());
        return nullptr;
    }
    if (!hasRumble(fd)) {
        ::close(fd);
        if (err) *err = node_path + ": no FF_RUMBLE support";
        return nullptr;
    }
    return std::unique_ptr<EvdevRumbleDevice>(new EvdevRumbleDevice(node_path, fd));
}

void EvdevRumbleDevice::closeFd() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    effect_id_ = -1;
}

bool EvdevRumbleDevice::writeEvent(int code, int value) {
    input_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.type = EV_FF;
    ev.code = static_cast<decltype(ev.code)>(code);
    ev.value = value;
    const ssize_t w = ::write(fd_, &ev, sizeof(ev));
    if (w != static_cast<ssize_t>(sizeof(ev))) {
        last_error_ = errnoText("write EV_FF");
        return false;
    }
    return true;
}

bool EvdevRumbleDevice::apply(const HapticCommand& cmd) {
    if (fd_ < 0) {
        last_error_ = "device closed";
        return false;
    }

    const double intensity = clamp01(cmd.intensity_0_1);
    const double length_ms = std::clamp(cmd.duration_s * 1000.0, 1.0, 65535.0);

    ff_effect effect;
    std::memset(&effect, 0, sizeof(effect));
    effect.type = FF_RUMBLE;
    // -1 uploads a new effect; an existing id updates it in place.
    effect.id = static_cast<decltype(effect.id)>(effect_id_);
    effect.replay.length = static_cast<std::uint16_t>(std::lround(length_ms));
    effect.replay.delay = 0;
    effect.u.rumble.strong_magnitude = static_cast<std::uint16_t>(std::lround(intensity * kRumbleMax));
    effect.u.rumble.weak_magnitude = static_cast<std::uint16_t>(std::lround(0.5 * intensity * kRumbleMax));

    if (::ioctl(fd_, EVIOCSFF, &effect) < 0) {
        last_error_ = errnoText("EVIOCSFF");
        return false;
    }
    effect_id_ = effect.id;
    return writeEvent(effect_id_, 1);
}

bool EvdevRumbleDevice::stop() {
    if (fd_ < 0 || effect_id_ < 0) return true;
    return writeEvent(effect_id_, 0);
}

bool EvdevRumbleDevice::reset() {
    if (fd_ < 0 || effect_id_ < 0) return true;
    bool ok = writeEvent(effect_id_, 0);
    if (::ioctl(fd_, EVIOCRMFF, effect_id_) < 0) {
        last_error_ = errnoText("EVIOCRMFF");
        ok = false;
    }
    effect_id_ = -1;
    return ok;
}

bool EvdevRumbleDevice::reopen() {
    closeFd();
    const int fd = ::open(node_path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        last_error_ = errnoText(node_path_.c_str());
        return false;
    }
    if (!hasRumble(fd)) {
        ::close(fd);
        last_error_ = node_path_ + ": no FF_RUMBLE support";
        return false;
    }
    fd_ = fd;
    return true;
}

std::vector<std::unique_ptr<HapticDevice>> discoverEvdevRumbleDevices(const std::string& dir) {
    std::vector<std::unique_ptr<HapticDevice>> out;
    DIR* d = ::opendir(dir.c_str());
    if (!d) {
        spdlog::warn("devices: cannot scan {}: {}", dir, std::strerror(errno));
        return out;
    }
    std::vector<std::string> nodes;
    while (dirent* ent = ::readdir(d)) {
        const std::string n = ent->d_name;
        if (n.rfind("event", 0) == 0) nodes.push_back(dir + "/" + n);
    }
    ::closedir(d);
    std::sort(nodes.begin(), nodes.end());

    for (const auto& node : nodes) {
        std::string err;
        std::unique_ptr<EvdevRumbleDevice> dev = EvdevRumbleDevice::open(node, &err);
        if (!dev) {
            spdlog::debug("devices: {}", err);
            continue;
        }
        out.push_back(std::move(dev));
    }
    return out;
}

} // namespace device
} // namespace rh
