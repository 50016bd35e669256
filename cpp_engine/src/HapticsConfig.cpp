#include "HapticsConfig.h"

#include <cmath>
#include <fstream>
#include <memory>

#include "ConfigHash.h"

namespace rh {

namespace {

// Field readers: absent keys leave *out untouched, wrong types fail with a path.
bool readNumber(const Json::Value& obj, const char* key, double* out, const std::string& path, std::string* err) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isNumeric() || !std::isfinite(v.asDouble())) {
        if (err) *err = path + "." + key + ": expected a finite number";
        return false;
    }
    *out = v.asDouble();
    return true;
}

bool readU32(const Json::Value& obj, const char* key, std::uint32_t* out, const std::string& path,
             std::string* err) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (v.isBool()) {
        *out = v.asBool() ? 1u : 0u;
        return true;
    }
    if (!v.isUInt()) {
        if (err) *err = path + "." + key + ": expected a non-negative integer";
        return false;
    }
    *out = v.asUInt();
    return true;
}

bool readI32(const Json::Value& obj, const char* key, std::int32_t* out, const std::string& path,
             std::string* err) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isInt()) {
        if (err) *err = path + "." + key + ": expected an integer";
        return false;
    }
    *out = v.asInt();
    return true;
}

bool readString(const Json::Value& obj, const char* key, std::string* out, const std::string& path,
                std::string* err) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isString()) {
        if (err) *err = path + "." + key + ": expected a string";
        return false;
    }
    *out = v.asString();
    return true;
}

bool readStringList(const Json::Value& obj, const char* key, std::vector<std::string>* out, const std::string& path,
                    std::string* err) {
    if (!obj.isMember(key)) return true;
    const Json::Value& v = obj[key];
    if (!v.isArray()) {
        if (err) *err = path + "." + key + ": expected an array of strings";
        return false;
    }
    std::vector<std::string> items;
    for (const auto& item : v) {
        if (!item.isString()) {
            if (err) *err = path + "." + key + ": expected an array of strings";
            return false;
        }
        items.push_back(item.asString());
    }
    *out = items;
    return true;
}

bool section(const Json::Value& root, const char* key, const Json::Value** out, std::string* err) {
    static const Json::Value empty(Json::objectValue);
    *out = &empty;
    if (!root.isMember(key)) return true;
    if (!root[key].isObject()) {
        if (err) *err = std::string(key) + ": expected an object";
        return false;
    }
    *out = &root[key];
    return true;
}

Json::Value stringList(const std::vector<std::string>& items) {
    Json::Value v(Json::arrayValue);
    for (const auto& s : items) v.append(s);
    return v;
}

Json::Value bandList(std::uint32_t mask) {
    Json::Value v(Json::arrayValue);
    for (int i = 0; i < kNumFrequencyBands; ++i) {
        const FrequencyBand b = static_cast<FrequencyBand>(i);
        if (mask & bandMaskFor(b)) v.append(frequencyBandName(b));
    }
    return v;
}

// ---- per-module sections ----

Json::Value toJson(const ImpulseDetectorConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["bands"] = bandList(c.band_mask_u32);
    v["hop_frames"] = c.hop_frames_u32;
    v["bass_cutoff_hz"] = c.bass_cutoff_hz;
    v["treble_cutoff_hz"] = c.treble_cutoff_hz;
    v["compress_k"] = c.compress_k;
    v["threshold_k"] = c.threshold_k;
    v["threshold_floor"] = c.threshold_floor_0_1;
    v["history_s"] = c.history_s;
    v["min_interval_s"] = c.min_interval_s;
    return v;
}

bool fromJson(const Json::Value& v, ImpulseDetectorConfigV1* c, std::string* err) {
    const std::string p = "detector";
    std::vector<std::string> bands;
    bool ok = readStringList(v, "bands", &bands, p, err) && readU32(v, "hop_frames", &c->hop_frames_u32, p, err) &&
              readNumber(v, "bass_cutoff_hz", &c->bass_cutoff_hz, p, err) &&
              readNumber(v, "treble_cutoff_hz", &c->treble_cutoff_hz, p, err) &&
              readNumber(v, "compress_k", &c->compress_k, p, err) &&
              readNumber(v, "threshold_k", &c->threshold_k, p, err) &&
              readNumber(v, "threshold_floor", &c->threshold_floor_0_1, p, err) &&
              readNumber(v, "history_s", &c->history_s, p, err) &&
              readNumber(v, "min_interval_s", &c->min_interval_s, p, err);
    if (!ok) return false;
    if (v.isMember("bands")) {
        std::uint32_t mask = 0;
        for (const auto& name : bands) {
            FrequencyBand b = FrequencyBand::All;
            if (!parseFrequencyBand(name, &b)) {
                if (err) *err = p + ".bands: unknown band '" + name + "'";
                return false;
            }
            mask |= bandMaskFor(b);
        }
        if (mask == 0u) {
            if (err) *err = p + ".bands: at least one band is required";
            return false;
        }
        c->band_mask_u32 = mask;
    }
    return true;
}

Json::Value toJson(const TrackerConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["socket_path"] = c.socket_path;
    v["reconnect_initial_s"] = c.reconnect_initial_s;
    v["reconnect_max_s"] = c.reconnect_max_s;
    v["max_retries"] = c.max_retries_u32;
    v["sync_period_s"] = c.sync_period_s;
    v["seek_skew_s"] = c.seek_skew_s;
    v["notice_capacity"] = c.notice_capacity_u32;
    return v;
}

bool fromJson(const Json::Value& v, TrackerConfigV1* c, std::string* err) {
    const std::string p = "tracker";
    return readString(v, "socket_path", &c->socket_path, p, err) &&
           readNumber(v, "reconnect_initial_s", &c->reconnect_initial_s, p, err) &&
           readNumber(v, "reconnect_max_s", &c->reconnect_max_s, p, err) &&
           readU32(v, "max_retries", &c->max_retries_u32, p, err) &&
           readNumber(v, "sync_period_s", &c->sync_period_s, p, err) &&
           readNumber(v, "seek_skew_s", &c->seek_skew_s, p, err) &&
           readU32(v, "notice_capacity", &c->notice_capacity_u32, p, err);
}

Json::Value toJson(const SchedulerConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["paused_queue_capacity"] = c.paused_queue_capacity_u32;
    v["pulse_duration_s"] = c.pulse_duration_s;
    v["intensity_gain"] = c.intensity_gain;
    v["min_intensity"] = c.min_intensity_0_1;
    v["max_late_s"] = c.max_late_s;
    v["min_lead_s"] = c.min_lead_s;
    v["channel_targets"] = stringList(c.channel_targets);
    return v;
}

bool fromJson(const Json::Value& v, SchedulerConfigV1* c, std::string* err) {
    const std::string p = "scheduler";
    if (!(readU32(v, "paused_queue_capacity", &c->paused_queue_capacity_u32, p, err) &&
          readNumber(v, "pulse_duration_s", &c->pulse_duration_s, p, err) &&
          readNumber(v, "intensity_gain", &c->intensity_gain, p, err) &&
          readNumber(v, "min_intensity", &c->min_intensity_0_1, p, err) &&
          readNumber(v, "max_late_s", &c->max_late_s, p, err) &&
          readNumber(v, "min_lead_s", &c->min_lead_s, p, err) &&
          readStringList(v, "channel_targets", &c->channel_targets, p, err))) {
        return false;
    }
    for (const auto& t : c->channel_targets) {
        if (!t.empty() && !isValidTargetName(t)) {
            if (err) *err = p + ".channel_targets: invalid target '" + t + "'";
            return false;
        }
    }
    return true;
}

Json::Value toJson(const ServerChannelConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["bind_address"] = c.bind_address;
    v["port"] = c.port_i32;
    v["cert_file"] = c.cert_file;
    v["key_file"] = c.key_file;
    v["insecure"] = c.insecure_u32 != 0u;
    v["handshake_timeout_s"] = c.handshake_timeout_s;
    v["ack_timeout_s"] = c.ack_timeout_s;
    v["session_queue_capacity"] = c.session_queue_capacity_u32;
    v["max_sessions"] = c.max_sessions_u32;
    return v;
}

bool fromJson(const Json::Value& v, ServerChannelConfigV1* c, std::string* err) {
    const std::string p = "channel";
    return readString(v, "bind_address", &c->bind_address, p, err) && readI32(v, "port", &c->port_i32, p, err) &&
           readString(v, "cert_file", &c->cert_file, p, err) && readString(v, "key_file", &c->key_file, p, err) &&
           readU32(v, "insecure", &c->insecure_u32, p, err) &&
           readNumber(v, "handshake_timeout_s", &c->handshake_timeout_s, p, err) &&
           readNumber(v, "ack_timeout_s", &c->ack_timeout_s, p, err) &&
           readU32(v, "session_queue_capacity", &c->session_queue_capacity_u32, p, err) &&
           readU32(v, "max_sessions", &c->max_sessions_u32, p, err);
}

Json::Value toJson(const ClientChannelConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["host"] = c.host;
    v["port"] = c.port_i32;
    v["ca_file"] = c.ca_file;
    v["pinned_sha256"] = c.pinned_sha256;
    v["insecure"] = c.insecure_u32 != 0u;
    v["connect_timeout_s"] = c.connect_timeout_s;
    v["handshake_timeout_s"] = c.handshake_timeout_s;
    v["reconnect_initial_s"] = c.reconnect_initial_s;
    v["reconnect_max_s"] = c.reconnect_max_s;
    v["max_reconnects"] = c.max_reconnects_u32;
    v["stale_after_s"] = c.stale_after_s;
    return v;
}

bool fromJson(const Json::Value& v, ClientChannelConfigV1* c, std::string* err) {
    const std::string p = "channel";
    return readString(v, "host", &c->host, p, err) && readI32(v, "port", &c->port_i32, p, err) &&
           readString(v, "ca_file", &c->ca_file, p, err) &&
           readString(v, "pinned_sha256", &c->pinned_sha256, p, err) &&
           readU32(v, "insecure", &c->insecure_u32, p, err) &&
           readNumber(v, "connect_timeout_s", &c->connect_timeout_s, p, err) &&
           readNumber(v, "handshake_timeout_s", &c->handshake_timeout_s, p, err) &&
           readNumber(v, "reconnect_initial_s", &c->reconnect_initial_s, p, err) &&
           readNumber(v, "reconnect_max_s", &c->reconnect_max_s, p, err) &&
           readU32(v, "max_reconnects", &c->max_reconnects_u32, p, err) &&
           readNumber(v, "stale_after_s", &c->stale_after_s, p, err);
}

Json::Value toJson(const device::DeviceRegistryConfigV1& c) {
    Json::Value v(Json::objectValue);
    Json::Value targets(Json::objectValue);
    for (const auto& kv : c.targets_by_device) targets[kv.first] = kv.second;
    v["targets"] = targets;
    v["enabled"] = stringList(c.enabled_devices);
    v["rediscover_period_s"] = c.rediscover_period_s;
    return v;
}

bool fromJson(const Json::Value& v, device::DeviceRegistryConfigV1* c, std::string* err) {
    const std::string p = "devices";
    if (!(readStringList(v, "enabled", &c->enabled_devices, p, err) &&
          readNumber(v, "rediscover_period_s", &c->rediscover_period_s, p, err))) {
        return false;
    }
    if (v.isMember("targets")) {
        const Json::Value& t = v["targets"];
        if (!t.isObject()) {
            if (err) *err = p + ".targets: expected an object";
            return false;
        }
        c->targets_by_device.clear();
        for (const auto& id : t.getMemberNames()) {
            if (!t[id].isString() || !isValidTargetName(t[id].asString()) || t[id].asString() == kBroadcastTarget) {
                if (err) *err = p + ".targets." + id + ": expected a target name";
                return false;
            }
            c->targets_by_device[id] = t[id].asString();
        }
    }
    return true;
}

Json::Value toJson(const LoggingConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["dir"] = c.log_dir;
    v["console_level"] = c.console_level;
    v["files"] = c.file_sinks_u32 != 0u;
    v["max_file_bytes"] = c.max_file_bytes_u32;
    v["max_files"] = c.max_files_u32;
    return v;
}

bool fromJson(const Json::Value& v, LoggingConfigV1* c, std::string* err) {
    const std::string p = "logging";
    return readString(v, "dir", &c->log_dir, p, err) &&
           readString(v, "console_level", &c->console_level, p, err) &&
           readU32(v, "files", &c->file_sinks_u32, p, err) &&
           readU32(v, "max_file_bytes", &c->max_file_bytes_u32, p, err) &&
           readU32(v, "max_files", &c->max_files_u32, p, err);
}

Json::Value toJson(const RecordingConfigV1& c) {
    Json::Value v(Json::objectValue);
    v["enabled"] = c.enabled_u32 != 0u;
    v["destination_dir"] = c.destination_dir;
    v["flush_interval_s"] = c.flush_interval_s;
    v["timestamp_interval_s"] = c.timestamp_interval_s;
    return v;
}

bool fromJson(const Json::Value& v, RecordingConfigV1* c, std::string* err) {
    const std::string p = "recording";
    if (!readU32(v, "enabled", &c->enabled_u32, p, err) ||
        !readString(v, "destination_dir", &c->destination_dir, p, err) ||
        !readNumber(v, "flush_interval_s", &c->flush_interval_s, p, err) ||
        !readNumber(v, "timestamp_interval_s", &c->timestamp_interval_s, p, err)) {
        return false;
    }
    if (c->destination_dir.empty() || !(c->flush_interval_s > 0.0) || !(c->timestamp_interval_s > 0.0)) {
        if (err) *err = p + ": destination_dir must be set and intervals must be positive";
        return false;
    }
    return true;
}

bool readJsonFile(const std::string& path, Json::Value* root, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::string errs;
    if (!Json::parseFromStream(builder, in, root, &errs)) {
        if (err) *err = path + ": " + errs;
        return false;
    }
    if (!root->isObject()) {
        if (err) *err = path + ": top level must be an object";
        return false;
    }
    return true;
}

bool writeJsonFile(const std::string& path, const Json::Value& root, std::string* err) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        if (err) *err = "cannot write " + path;
        return false;
    }
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &out);
    out << "\n";
    if (!out) {
        if (err) *err = "write failed: " + path;
        return false;
    }
    return true;
}

} // namespace

// ============================================================
// Hashes
// ============================================================

void finalizeSenderConfig(SenderConfigV1* c) {
    c->pipeline.fnv_hash_u32 = computeSenderPipelineConfigHash(c->pipeline);
    c->detector.fnv_hash_u32 = computeDetectorConfigHash(c->detector);
    c->tracker.fnv_hash_u32 = computeTrackerConfigHash(c->tracker);
    c->scheduler.fnv_hash_u32 = computeSchedulerConfigHash(c->scheduler);
    c->channel.fnv_hash_u32 = computeServerChannelConfigHash(c->channel);
    c->logging.fnv_hash_u32 = computeLoggingConfigHash(c->logging);

    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c->version_u32);
    h = fnv1a32_add_str(h, c->audio_file);
    h = fnv1a32_add_str(h, c->capture_source);
    h = fnv1a32_add_u32(h, c->capture_rate_hz_u32);
    h = fnv1a32_add_u32(h, c->follow_player_u32);
    h = fnv1a32_add_u32(h, c->pipeline.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->detector.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->tracker.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->scheduler.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->channel.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->logging.fnv_hash_u32);
    c->fnv_hash_u32 = h;
}

void finalizeReceiverConfig(ReceiverConfigV1* c) {
    c->channel.fnv_hash_u32 = computeClientChannelConfigHash(c->channel);
    c->devices.fnv_hash_u32 = device::computeDeviceRegistryConfigHash(c->devices);
    c->recording.fnv_hash_u32 = computeRecordingConfigHash(c->recording);
    c->logging.fnv_hash_u32 = computeLoggingConfigHash(c->logging);

    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c->version_u32);
    h = fnv1a32_add_str(h, c->device_dir);
    h = fnv1a32_add_u32(h, c->channel.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->devices.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->recording.fnv_hash_u32);
    h = fnv1a32_add_u32(h, c->logging.fnv_hash_u32);
    c->fnv_hash_u32 = h;
}

// ============================================================
// JSON
// ============================================================

Json::Value senderConfigToJson(const SenderConfigV1& c) {
    Json::Value root(Json::objectValue);
    root["version"] = c.version_u32;
    Json::Value audio(Json::objectValue);
    audio["file"] = c.audio_file;
    audio["capture_source"] = c.capture_source;
    audio["capture_rate_hz"] = c.capture_rate_hz_u32;
    audio["follow_player"] = c.follow_player_u32 != 0u;
    audio["lookahead_s"] = c.pipeline.lookahead_s;
    audio["impulse_queue_capacity"] = c.pipeline.impulse_queue_capacity_u32;
    root["audio"] = audio;
    root["detector"] = toJson(c.detector);
    root["tracker"] = toJson(c.tracker);
    root["scheduler"] = toJson(c.scheduler);
    root["channel"] = toJson(c.channel);
    root["logging"] = toJson(c.logging);
    return root;
}

bool senderConfigFromJson(const Json::Value& root, SenderConfigV1* out, std::string* err) {
    if (!root.isObject()) {
        if (err) *err = "configuration must be an object";
        return false;
    }
    SenderConfigV1 c = *out;
    std::uint32_t version = c.version_u32;
    if (!readU32(root, "version", &version, "sender", err)) return false;
    if (version != 1u) {
        if (err) *err = "unsupported configuration version " + std::to_string(version);
        return false;
    }

    const Json::Value* s = nullptr;
    if (!section(root, "audio", &s, err)) return false;
    if (!(readString(*s, "file", &c.audio_file, "audio", err) &&
          readString(*s, "capture_source", &c.capture_source, "audio", err) &&
          readU32(*s, "capture_rate_hz", &c.capture_rate_hz_u32, "audio", err) &&
          readU32(*s, "follow_player", &c.follow_player_u32, "audio", err) &&
          readNumber(*s, "lookahead_s", &c.pipeline.lookahead_s, "audio", err) &&
          readU32(*s, "impulse_queue_capacity", &c.pipeline.impulse_queue_capacity_u32, "audio", err))) {
        return false;
    }
    if (!section(root, "detector", &s, err) || !fromJson(*s, &c.detector, err)) return false;
    if (!section(root, "tracker", &s, err) || !fromJson(*s, &c.tracker, err)) return false;
    if (!section(root, "scheduler", &s, err) || !fromJson(*s, &c.scheduler, err)) return false;
    if (!section(root, "channel", &s, err) || !fromJson(*s, &c.channel, err)) return false;
    if (!section(root, "logging", &s, err) || !fromJson(*s, &c.logging, err)) return false;

    finalizeSenderConfig(&c);
    *out = c;
    return true;
}

Json::Value receiverConfigToJson(const ReceiverConfigV1& c) {
    Json::Value root(Json::objectValue);
    root["version"] = c.version_u32;
    root["device_dir"] = c.device_dir;
    root["channel"] = toJson(c.channel);
    root["devices"] = toJson(c.devices);
    root["recording"] = toJson(c.recording);
    root["logging"] = toJson(c.logging);
    return root;
}

bool receiverConfigFromJson(const Json::Value& root, ReceiverConfigV1* out, std::string* err) {
    if (!root.isObject()) {
        if (err) *err = "configuration must be an object";
        return false;
    }
    ReceiverConfigV1 c = *out;
    std::uint32_t version = c.version_u32;
    if (!readU32(root, "version", &version, "receiver", err)) return false;
    if (version != 1u) {
        if (err) *err = "unsupported configuration version " + std::to_string(version);
        return false;
    }
    if (!readString(root, "device_dir", &c.device_dir, "receiver", err)) return false;

    const Json::Value* s = nullptr;
    if (!section(root, "channel", &s, err) || !fromJson(*s, &c.channel, err)) return false;
    if (!section(root, "devices", &s, err) || !fromJson(*s, &c.devices, err)) return false;
    if (!section(root, "recording", &s, err) || !fromJson(*s, &c.recording, err)) return false;
    if (!section(root, "logging", &s, err) || !fromJson(*s, &c.logging, err)) return false;

    finalizeReceiverConfig(&c);
    *out = c;
    return true;
}

bool loadSenderConfig(const std::string& path, SenderConfigV1* out, std::string* err) {
    Json::Value root;
    return readJsonFile(path, &root, err) && senderConfigFromJson(root, out, err);
}

bool loadReceiverConfig(const std::string& path, ReceiverConfigV1* out, std::string* err) {
    Json::Value root;
    return readJsonFile(path, &root, err) && receiverConfigFromJson(root, out, err);
}

bool saveSenderConfig(const std::string& path, const SenderConfigV1& c, std::string* err) {
    return writeJsonFile(path, senderConfigToJson(c), err);
}

bool saveReceiverConfig(const std::string& path, const ReceiverConfigV1& c, std::string* err) {
    return writeJsonFile(path, receiverConfigToJson(c), err);
}

// ============================================================
// Text export
// ============================================================

int exportSenderConfigText(const SenderConfigV1& in, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    SenderConfigV1 c = in;
    finalizeSenderConfig(&c);
    TextAppender t(buf, cap);

    t.app("SenderConfigV1\n");
    t.app("  audio_file=%s\n", c.audio_file.empty() ? "<live capture>" : c.audio_file.c_str());
    t.app("  capture_source=%s\n", c.capture_source.empty() ? "<default monitor>" : c.capture_source.c_str());
    t.app("  capture_rate_hz_u32=%u\n", c.capture_rate_hz_u32);
    t.app("  follow_player_u32=%u\n", c.follow_player_u32);
    t.app("  lookahead_s=%.6f\n", c.pipeline.lookahead_s);
    t.app("  fnv_hash_u32=0x%08X\n", c.fnv_hash_u32);

    const ImpulseDetectorConfigV1& d = c.detector;
    t.app("ImpulseDetectorConfigV1\n");
    t.app("  band_mask_u32=0x%X\n", d.band_mask_u32);
    t.app("  hop_frames_u32=%u\n", d.hop_frames_u32);
    t.app("  bass_cutoff_hz=%.6f treble_cutoff_hz=%.6f\n", d.bass_cutoff_hz, d.treble_cutoff_hz);
    t.app("  compress_k=%.9g threshold_k=%.9g threshold_floor_0_1=%.9g\n", d.compress_k, d.threshold_k,
          d.threshold_floor_0_1);
    t.app("  history_s=%.6f min_interval_s=%.6f\n", d.history_s, d.min_interval_s);
    t.app("  fnv_hash_u32=0x%08X\n", d.fnv_hash_u32);

    const TrackerConfigV1& r = c.tracker;
    t.app("TrackerConfigV1\n");
    t.app("  socket_path=%s\n", r.socket_path.c_str());
    t.app("  reconnect_initial_s=%.6f reconnect_max_s=%.6f max_retries_u32=%u\n", r.reconnect_initial_s,
          r.reconnect_max_s, r.max_retries_u32);
    t.app("  sync_period_s=%.6f seek_skew_s=%.6f\n", r.sync_period_s, r.seek_skew_s);
    t.app("  fnv_hash_u32=0x%08X\n", r.fnv_hash_u32);

    const SchedulerConfigV1& s = c.scheduler;
    t.app("SchedulerConfigV1\n");
    t.app("  paused_queue_capacity_u32=%u\n", s.paused_queue_capacity_u32);
    t.app("  pulse_duration_s=%.6f intensity_gain=%.6f min_intensity_0_1=%.6f\n", s.pulse_duration_s,
          s.intensity_gain, s.min_intensity_0_1);
    t.app("  max_late_s=%.6f min_lead_s=%.6f\n", s.max_late_s, s.min_lead_s);
    for (std::size_t i = 0; i < s.channel_targets.size(); ++i) {
        t.app("  channel_targets[%u]=%s\n", static_cast<unsigned>(i), s.channel_targets[i].c_str());
    }
    t.app("  fnv_hash_u32=0x%08X\n", s.fnv_hash_u32);

    const ServerChannelConfigV1& ch = c.channel;
    t.app("ServerChannelConfigV1\n");
    t.app("  bind=%s:%d\n", ch.bind_address.empty() ? "*" : ch.bind_address.c_str(), ch.port_i32);
    t.app("  cert_file=%s key_file=%s insecure_u32=%u\n", ch.cert_file.c_str(), ch.key_file.c_str(),
          ch.insecure_u32);
    t.app("  handshake_timeout_s=%.6f ack_timeout_s=%.6f\n", ch.handshake_timeout_s, ch.ack_timeout_s);
    t.app("  session_queue_capacity_u32=%u max_sessions_u32=%u\n", ch.session_queue_capacity_u32,
          ch.max_sessions_u32);
    t.app("  fnv_hash_u32=0x%08X\n", ch.fnv_hash_u32);

    t.app("LoggingConfigV1\n");
    t.app("  dir=%s component=%s console_level=%s files_u32=%u\n", c.logging.log_dir.c_str(),
          c.logging.component.c_str(), c.logging.console_level.c_str(), c.logging.file_sinks_u32);
    t.app("  fnv_hash_u32=0x%08X\n", c.logging.fnv_hash_u32);
    return t.written();
}

int exportReceiverConfigText(const ReceiverConfigV1& in, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    ReceiverConfigV1 c = in;
    finalizeReceiverConfig(&c);
    TextAppender t(buf, cap);

    t.app("ReceiverConfigV1\n");
    t.app("  device_dir=%s\n", c.device_dir.c_str());
    t.app("  fnv_hash_u32=0x%08X\n", c.fnv_hash_u32);

    const ClientChannelConfigV1& ch = c.channel;
    t.app("ClientChannelConfigV1\n");
    t.app("  server=%s:%d insecure_u32=%u\n", ch.host.c_str(), ch.port_i32, ch.insecure_u32);
    t.app("  ca_file=%s\n", ch.ca_file.c_str());
    t.app("  pinned_sha256=%s\n", ch.pinned_sha256.empty() ? "<none>" : ch.pinned_sha256.c_str());
    t.app("  connect_timeout_s=%.6f handshake_timeout_s=%.6f\n", ch.connect_timeout_s, ch.handshake_timeout_s);
    t.app("  reconnect_initial_s=%.6f reconnect_max_s=%.6f max_reconnects_u32=%u\n", ch.reconnect_initial_s,
          ch.reconnect_max_s, ch.max_reconnects_u32);
    t.app("  stale_after_s=%.6f\n", ch.stale_after_s);
    t.app("  fnv_hash_u32=0x%08X\n", ch.fnv_hash_u32);

    t.app("DeviceRegistryConfigV1\n");
    for (const auto& kv : c.devices.targets_by_device) {
        t.app("  target[%s]=%s\n", kv.first.c_str(), kv.second.c_str());
    }
    for (const auto& id : c.devices.enabled_devices) t.app("  enabled=%s\n", id.c_str());
    t.app("  rediscover_period_s=%.6f\n", c.devices.rediscover_period_s);
    t.app("  fnv_hash_u32=0x%08X\n", c.devices.fnv_hash_u32);

    t.app("RecordingConfigV1\n");
    t.app("  enabled_u32=%u destination_dir=%s\n", c.recording.enabled_u32, c.recording.destination_dir.c_str());
    t.app("  flush_interval_s=%.6f timestamp_interval_s=%.6f\n", c.recording.flush_interval_s,
          c.recording.timestamp_interval_s);
    t.app("  fnv_hash_u32=0x%08X\n", c.recording.fnv_hash_u32);

    t.app("LoggingConfigV1\n");
    t.app("  dir=%s component=%s console_level=%s files_u32=%u\n", c.logging.log_dir.c_str(),
          c.logging.component.c_str(), c.logging.console_level.c_str(), c.logging.file_sinks_u32);
    t.app("  fnv_hash_u32=0x%08X\n", c.logging.fnv_hash_u32);
    return t.written();
}

} // namespace rh
