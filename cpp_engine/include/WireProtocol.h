#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "HapticsTypes.h"

namespace rh {
namespace wire {

// ============================================================
// Command channel line protocol (CRLF terminated, ASCII)
//
//   R->S  ver                          -> S: RemoteHaptics:0.2
//   R->S  devices:<t1>,<t2>            -> S: ACK | INVALID_REQUEST
//   S->R  cmd:<id>,<wall_time>,<intensity>,<duration>,<target>
//   R->S  ack:<id>,<OK|DEVICE_ERROR|UNKNOWN_TARGET|STALE>
//   any   help | quit
//
// Real numbers carry kProtocolPrecisionPlaces decimals. The dispatch time on the
// wire is wall-clock (Unix epoch seconds); peers are expected to be NTP-synced.
// ============================================================

constexpr const char* kProtocolName = "RemoteHaptics";
constexpr const char* kProtocolVersion = "0.2";

constexpr const char* kVersionQuery = "ver";
constexpr const char* kAck = "ACK";
constexpr const char* kInvalidRequest = "INVALID_REQUEST";
constexpr const char* kHelp = "help";
constexpr const char* kQuit = "quit";

constexpr const char* kDevicesPrefix = "devices:";
constexpr const char* kCommandPrefix = "cmd:";
constexpr const char* kAckPrefix = "ack:";

std::string versionReply();
bool isCompatibleVersion(const std::string& reply);

std::string helpText();

bool startsWith(const std::string& s, const char* prefix);

std::string formatReal(double v);

std::string encodeDevices(const std::vector<std::string>& targets);
bool parseDevices(const std::string& line, std::vector<std::string>* out);

// wall_dispatch_s replaces the command's monotonic dispatch time on the wire.
std::string encodeCommand(const HapticCommand& c, double wall_dispatch_s);
// out->dispatch_time_s receives the wall-clock time.
bool parseCommand(const std::string& line, HapticCommand* out);

std::string encodeAck(std::uint64_t command_id, AckStatus status);
bool parseAck(const std::string& line, std::uint64_t* command_id, AckStatus* status);

} // namespace wire
} // namespace rh
