#include "WireProtocol.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rh {
namespace wire {

namespace {

std::vector<std::string> splitComma(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t c = s.find(',', start);
        if (c == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, c - start));
        start = c + 1;
    }
    return out;
}

bool parseU64(const std::string& s, std::uint64_t* out) {
    if (s.empty() || s[0] < '0' || s[0] > '9') return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    if (out) *out = static_cast<std::uint64_t>(v);
    return true;
}

bool parseReal(const std::string& s, double* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || !end || *end != '\0' || !std::isfinite(v)) return false;
    if (out) *out = v;
    return true;
}

} // namespace

std::string versionReply() { return std::string(kProtocolName) + ":" + kProtocolVersion; }

bool isCompatibleVersion(const std::string& reply) { return reply == versionReply(); }

std::string helpText() {
    return "Commands: ver | devices:<target>[,<target>...] | ack:<id>,<status> | help | quit";
}

bool startsWith(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

std::string formatReal(double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", kProtocolPrecisionPlaces, std::isfinite(v) ? v : 0.0);
    return buf;
}

std::string encodeDevices(const std::vector<std::string>& targets) {
    std::string line = kDevicesPrefix;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        if (i) line += ",";
        line += targets[i];
    }
    return line;
}

bool parseDevices(const std::string& line, std::vector<std::string>* out) {
    if (!startsWith(line, kDevicesPrefix)) return false;
    const std::string body = line.substr(std::string(kDevicesPrefix).size());
    std::vector<std::string> targets;
    if (!body.empty()) {
        for (const auto& t : splitComma(body)) {
            if (!isValidTargetName(t)) return false;
            targets.push_back(t);
        }
    }
    if (out) *out = std::move(targets);
    return true;
}

std::string encodeCommand(const HapticCommand& c, double wall_dispatch_s) {
    std::string line = kCommandPrefix;
    line += std::to_string(c.command_id);
    line += ",";
    line += formatReal(wall_dispatch_s);
    line += ",";
    line += formatReal(c.intensity_0_1);
    line += ",";
    line += formatReal(c.duration_s);
    line += ",";
    line += c.device_target;
    return line;
}

bool parseCommand(const std::string& line, HapticCommand* out) {
    if (!startsWith(line, kCommandPrefix)) return false;
    const std::vector<std::string> f = splitComma(line.substr(std::string(kCommandPrefix).size()));
    if (f.size() != 5) return false;

    HapticCommand c;
    if (!parseU64(f[0], &c.command_id) || c.command_id == 0) return false;
    if (!parseReal(f[1], &c.dispatch_time_s)) return false;
    if (!parseReal(f[2], &c.intensity_0_1) || c.intensity_0_1 < 0.0 || c.intensity_0_1 > 1.0) return false;
    if (!parseReal(f[3], &c.duration_s) || c.duration_s < 0.0) return false;
    if (!isValidTargetName(f[4])) return false;
    c.device_target = f[4];
    if (out) *out = std::move(c);
    return true;
}

std::string encodeAck(std::uint64_t command_id, AckStatus status) {
    return std::string(kAckPrefix) + std::to_string(command_id) + "," + ackStatusName(status);
}

bool parseAck(const std::string& line, std::uint64_t* command_id, AckStatus* status) {
    if (!startsWith(line, kAckPrefix)) return false;
    const std::vector<std::string> f = splitComma(line.substr(std::string(kAckPrefix).size()));
    if (f.size() != 2) return false;
    std::uint64_t id = 0;
    AckStatus s = AckStatus::Ok;
    if (!parseU64(f[0], &id) || !parseAckStatus(f[1], &s)) return false;
    if (command_id) *command_id = id;
    if (status) *status = s;
    return true;
}

} // namespace wire
} // namespace rh
