#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rh {

// ============================================================
// Shared constants (seconds unless noted)
// ============================================================

// Default network port for the command channel.
constexpr int kNetDefaultPort = 7837;

// Upper bound on haptics update rate (60 feedbacks per second).
constexpr double kMaxUpdateRate_s = 1.0 / 60.0;

// How often the media player position is re-polled to bound drift.
constexpr double kMediaSyncRate_s = 0.5;

// Allowed difference between extrapolated and reported media position before
// the change is treated as a seek.
constexpr double kMediaPositionSkew_s = 0.15;

// Decimal places carried on the wire for intensities, durations and times.
constexpr int kProtocolPrecisionPlaces = 6;

constexpr const char* kBroadcastTarget = "broadcast";

// ============================================================
// Error taxonomy
// ============================================================
enum class ErrorCode : std::uint32_t {
    None = 0,
    DecodeError,        // audio source unusable for this extraction pass
    PlayerUnavailable,  // media control retries exhausted
    HandshakeFailed,    // TLS or protocol handshake failed (fatal per session)
    Timeout,            // per-command ack timeout (transient)
    ConnectionReset,    // transport failure (transient up to a retry ceiling)
    DeviceError,        // per-device actuation failure
    ConfigError,
};

const char* errorCodeName(ErrorCode e);

// Frequency bands produced by the impulse extractor; the band index doubles as
// ImpulseEvent::channel.
enum class FrequencyBand : std::uint32_t {
    All = 0,
    Bass = 1,
    Mid = 2,
    Treble = 3,
    Count
};

constexpr int kNumFrequencyBands = static_cast<int>(FrequencyBand::Count);

const char* frequencyBandName(FrequencyBand b);
bool parseFrequencyBand(const std::string& name, FrequencyBand* out);

// ============================================================
// Data model
// ============================================================

struct ImpulseEvent {
    // Media-relative time of the transient (seconds).
    double timestamp_s = 0.0;
    double magnitude_0_1 = 0.0;
    // Source index (frequency band); -1 = unspecified.
    int channel = -1;
};

struct PlaybackState {
    double position_s = 0.0;
    // Signed playback rate; 0 = paused.
    double rate = 0.0;
    // Incremented on every seek and every effective rate change.
    std::uint64_t sequence = 0;
    // Incremented on seeks only (subset of sequence changes).
    std::uint64_t seek_count = 0;
    // Monotonic time at which position_s was observed.
    double captured_at_s = 0.0;
    // Set while the tracker is disconnected from the player.
    bool stale = false;
    bool end_of_media = false;

    // Position extrapolated to now_s using the current rate.
    double positionAt(double now_s) const {
        const double dt = now_s - captured_at_s;
        if (!(dt > 0.0)) return position_s;
        return position_s + dt * rate;
    }
};

struct HapticCommand {
    std::uint64_t command_id = 0;
    // Dispatch time on the sender's monotonic clock (seconds).
    double dispatch_time_s = 0.0;
    double intensity_0_1 = 0.0;
    double duration_s = 0.0;
    std::string device_target = kBroadcastTarget;

    // Provenance (not carried on the wire).
    double impulse_timestamp_s = 0.0;
    std::uint64_t playback_sequence = 0;

    double endTime_s() const { return dispatch_time_s + duration_s; }
    bool isBroadcast() const { return device_target == kBroadcastTarget; }
};

// Per-command acknowledgement status reported by receivers.
enum class AckStatus : std::uint32_t {
    Ok = 0,
    DeviceError,
    UnknownTarget,
    Stale,
};

const char* ackStatusName(AckStatus s);
bool parseAckStatus(const std::string& name, AckStatus* out);

enum class ConnectionState : std::uint32_t {
    Connecting = 0,
    VersionCheck,
    DevicesSet,
    Active,
    Disconnected,
    Error,
};

const char* connectionStateName(ConnectionState s);

// One per connected receiver; destroyed on disconnect.
struct SessionInfo {
    std::uint64_t session_id = 0;
    std::string peer;
    // SHA-256 of the peer certificate; empty when the peer presented none.
    std::string certificate_fingerprint;
    ConnectionState state = ConnectionState::Connecting;
    std::uint64_t last_acked_command_id = 0;
};

// ============================================================
// Clocks
// ============================================================

inline double monotonicNow_s() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

inline double wallNow_s() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

// initial_s doubling per attempt (attempt 1 = initial_s), capped at max_s.
double exponentialBackoff_s(double initial_s, double max_s, std::uint32_t attempt);

// Device target names travel in comma separated lists on the wire.
bool isValidTargetName(const std::string& name);

} // namespace rh
