#include "HapticsTypes.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace rh {

const char* errorCodeName(ErrorCode e) {
    switch (e) {
    case ErrorCode::None:              return "None";
    case ErrorCode::DecodeError:       return "DecodeError";
    case ErrorCode::PlayerUnavailable: return "PlayerUnavailable";
    case ErrorCode::HandshakeFailed:   return "HandshakeFailed";
    case ErrorCode::Timeout:           return "Timeout";
    case ErrorCode::ConnectionReset:   return "ConnectionReset";
    case ErrorCode::DeviceError:       return "DeviceError";
    case ErrorCode::ConfigError:       return "ConfigError";
    }
    return "Unknown";
}

const char* frequencyBandName(FrequencyBand b) {
    switch (b) {
    case FrequencyBand::All:    return "all";
    case FrequencyBand::Bass:   return "bass";
    case FrequencyBand::Mid:    return "mid";
    case FrequencyBand::Treble: return "treble";
    case FrequencyBand::Count:  break;
    }
    return "unknown";
}

bool parseFrequencyBand(const std::string& name, FrequencyBand* out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (int i = 0; i < kNumFrequencyBands; ++i) {
        const FrequencyBand b = static_cast<FrequencyBand>(i);
        if (v == frequencyBandName(b)) {
            if (out) *out = b;
            return true;
        }
    }
    return false;
}

const char* ackStatusName(AckStatus s) {
    switch (s) {
    case AckStatus::Ok:            return "OK";
    case AckStatus::DeviceError:   return "DEVICE_ERROR";
    case AckStatus::UnknownTarget: return "UNKNOWN_TARGET";
    case AckStatus::Stale:         return "STALE";
    }
    return "UNKNOWN";
}

bool parseAckStatus(const std::string& name, AckStatus* out) {
    static const AckStatus all[] = {
        AckStatus::Ok, AckStatus::DeviceError, AckStatus::UnknownTarget, AckStatus::Stale,
    };
    for (AckStatus s : all) {
        if (name == ackStatusName(s)) {
            if (out) *out = s;
            return true;
        }
    }
    return false;
}

const char* connectionStateName(ConnectionState s) {
    switch (s) {
    case ConnectionState::Connecting:   return "Connecting";
    case ConnectionState::VersionCheck: return "VersionCheck";
    case ConnectionState::DevicesSet:   return "DevicesSet";
    case ConnectionState::Active:       return "Active";
    case ConnectionState::Disconnected: return "Disconnected";
    case ConnectionState::Error:        return "Error";
    }
    return "Unknown";
}

double exponentialBackoff_s(double initial_s, double max_s, std::uint32_t attempt) {
    const double initial = (initial_s > 0.0 && std::isfinite(initial_s)) ? initial_s : 0.25;
    const double cap = std::max(initial, std::isfinite(max_s) ? max_s : initial);
    if (attempt <= 1) return initial;
    const std::uint32_t doublings = std::min<std::uint32_t>(attempt - 1, 30);
    return std::min(initial * std::pow(2.0, static_cast<double>(doublings)), cap);
}

bool isValidTargetName(const std::string& name) {
    if (name.empty() || name.size() > 128) return false;
    for (unsigned char c : name) {
        if (std::isspace(c) || c == ',' || c == ':' || !std::isprint(c)) {
            return false;
        }
    }
    return true;
}

} // namespace rh
