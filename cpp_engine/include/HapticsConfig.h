#pragma once

#include <cstdint>
#include <string>

#include <json/json.h>

#include "../device/haptic_device.h"
#include "CommandChannel.h"
#include "EventScheduler.h"
#include "HapticsSender.h"
#include "ImpulseExtractor.h"
#include "Logging.h"
#include "PlaybackTracker.h"
#include "SessionRecording.h"

namespace rh {

// ============================================================
// Process configuration (JSON on disk, versioned structs in memory)
//
// Unknown keys are ignored; missing keys keep their defaults. Every section
// carries its own FNV-1a hash, refreshed by finalize*Config().
// ============================================================

struct SenderConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SenderConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    // Audio file analysed alongside the player; empty = live capture.
    std::string audio_file;
    // PulseAudio source for live capture; empty = default sink monitor.
    std::string capture_source;
    std::uint32_t capture_rate_hz_u32 = 44100;
    // Use the player's clock (mpv IPC). File sources without it run on their own clock.
    std::uint32_t follow_player_u32 = 1;

    SenderPipelineConfigV1 pipeline;
    ImpulseDetectorConfigV1 detector;
    TrackerConfigV1 tracker;
    SchedulerConfigV1 scheduler;
    ServerChannelConfigV1 channel;
    LoggingConfigV1 logging;
};

struct ReceiverConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ReceiverConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::string device_dir = "/dev/input";

    ClientChannelConfigV1 channel;
    device::DeviceRegistryConfigV1 devices;
    RecordingConfigV1 recording;
    LoggingConfigV1 logging;
};

void finalizeSenderConfig(SenderConfigV1* c);
void finalizeReceiverConfig(ReceiverConfigV1* c);

Json::Value senderConfigToJson(const SenderConfigV1& c);
Json::Value receiverConfigToJson(const ReceiverConfigV1& c);
bool senderConfigFromJson(const Json::Value& root, SenderConfigV1* out, std::string* err);
bool receiverConfigFromJson(const Json::Value& root, ReceiverConfigV1* out, std::string* err);

bool loadSenderConfig(const std::string& path, SenderConfigV1* out, std::string* err);
bool loadReceiverConfig(const std::string& path, ReceiverConfigV1* out, std::string* err);
bool saveSenderConfig(const std::string& path, const SenderConfigV1& c, std::string* err);
bool saveReceiverConfig(const std::string& path, const ReceiverConfigV1& c, std::string* err);

// Human readable effective configuration with per-section hashes. Returns bytes written.
int exportSenderConfigText(const SenderConfigV1& c, char* buf, int cap);
int exportReceiverConfigText(const ReceiverConfigV1& c, char* buf, int cap);

} // namespace rh
