#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "../device/haptic_device.h"
#include "BoundedQueue.h"
#include "CommandChannel.h"
#include "EventScheduler.h"
#include "HapticsConfig.h"
#include "HapticsSender.h"
#include "HapticsTypes.h"
#include "ImpulseExtractor.h"
#include "PlaybackTracker.h"
#include "SessionRecording.h"
#include "WireProtocol.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline double absd(double x) { return x < 0 ? -x : x; }

// ============================================================
// Fixtures
// ============================================================

// Silence with short noise bursts (deterministic LCG noise, mono).
static std::vector<float> burstClip(int rate_hz, double length_s, const std::vector<double>& bursts_s,
                                    double burst_len_s, float amplitude) {
    const std::size_t n = static_cast<std::size_t>(length_s * rate_hz);
    std::vector<float> pcm(n, 0.0f);
    std::uint32_t lcg = 12345u;
    for (double b : bursts_s) {
        const std::size_t start = static_cast<std::size_t>(b * rate_hz);
        const std::size_t len = static_cast<std::size_t>(burst_len_s * rate_hz);
        for (std::size_t i = start; i < start + len && i < n; ++i) {
            lcg = lcg * 1664525u + 1013904223u;
            const double u = static_cast<double>(lcg >> 8) / static_cast<double>(1u << 24);
            pcm[i] = static_cast<float>((2.0 * u - 1.0) * amplitude);
        }
    }
    return pcm;
}

static rh::ImpulseDetectorConfigV1 testDetectorConfig() {
    rh::ImpulseDetectorConfigV1 cfg;
    cfg.hop_frames_u32 = 256;
    return cfg;
}

static rh::PlaybackState playing(double position_s, double captured_at_s, std::uint64_t sequence) {
    rh::PlaybackState s;
    s.position_s = position_s;
    s.captured_at_s = captured_at_s;
    s.rate = 1.0;
    s.sequence = sequence;
    return s;
}

static rh::ImpulseEvent impulseAt(double ts_s, double magnitude, int channel = 0) {
    rh::ImpulseEvent e;
    e.timestamp_s = ts_s;
    e.magnitude_0_1 = magnitude;
    e.channel = channel;
    return e;
}

class FakeDevice final : public rh::device::HapticDevice {
public:
    FakeDevice(std::string id, std::vector<std::string>* log) : id_(std::move(id)), name_("fake " + id_), log_(log) {}

    const std::string& id() const override { return id_; }
    const std::string& name() const override { return name_; }

    bool apply(const rh::HapticCommand& cmd) override {
        if (fail_apply) {
            err_ = "write failed";
            return false;
        }
        log_->push_back(id_ + ":apply:" + std::to_string(cmd.command_id));
        return true;
    }
    bool stop() override {
        log_->push_back(id_ + ":stop");
        return true;
    }
    bool reset() override {
        ++resets;
        log_->push_back(id_ + ":reset");
        return true;
    }
    bool reopen() override { return reopen_ok; }
    std::string lastError() const override { return err_; }

    bool fail_apply = false;
    bool reopen_ok = true;
    int resets = 0;

private:
    std::string id_;
    std::string name_;
    std::string err_;
    std::vector<std::string>* log_;
};

static rh::HapticCommand commandFor(std::uint64_t id, const std::string& target, double duration_s = 0.08) {
    rh::HapticCommand c;
    c.command_id = id;
    c.intensity_0_1 = 0.5;
    c.duration_s = duration_s;
    c.device_target = target;
    return c;
}

// ============================================================
// Impulse extraction
// ============================================================

static void runExtractorFindsBursts() {
    const int rate = 8000;
    rh::MemoryAudioSource src(burstClip(rate, 3.0, {0.5, 1.5, 2.5}, 0.05, 0.8f), rate, 1);
    rh::ImpulseExtractor ex(src, testDetectorConfig());

    std::vector<rh::ImpulseEvent> found;
    rh::ImpulseEvent ev;
    rh::ExtractStatus st;
    while ((st = ex.nextImpulse(&ev)) == rh::ExtractStatus::Impulse) found.push_back(ev);

    REQUIRE(st == rh::ExtractStatus::EndOfStream, "extractor should end with EndOfStream");
    REQUIRE(found.size() == 3, "expected one impulse per burst, got " << found.size());
    const double expect[] = {0.5, 1.5, 2.5};
    for (std::size_t i = 0; i < found.size(); ++i) {
        REQUIRE_FINITE(found[i].timestamp_s, "impulse timestamp");
        REQUIRE(absd(found[i].timestamp_s - expect[i]) < 0.06,
                "impulse " << i << " at " << found[i].timestamp_s << " expected near " << expect[i]);
        REQUIRE(found[i].magnitude_0_1 > 0.0 && found[i].magnitude_0_1 <= 1.0, "magnitude out of (0,1]");
        REQUIRE(found[i].channel == static_cast<int>(rh::FrequencyBand::All), "channel should be the all band");
    }
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::EndOfStream, "EndOfStream must be sticky");

    // A restart begins a fresh pass with media-relative timestamps.
    REQUIRE(ex.restart(1.0), "restart at 1.0 should succeed");
    REQUIRE(ex.passId() == 1, "first explicit restart is pass 1");
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Impulse, "impulse expected after restart");
    REQUIRE(absd(ev.timestamp_s - 1.5) < 0.06, "restarted pass should report media time, got " << ev.timestamp_s);

    std::cout << "[PASS] extractor finds bursts and restarts with media-relative timestamps\n";
}

static void runExtractorDecodeFailure() {
    const int rate = 8000;
    rh::MemoryAudioSource src(burstClip(rate, 3.0, {0.5, 1.5, 2.5}, 0.05, 0.8f), rate, 1);
    src.injectDecodeFailureAt(8010);
    rh::ImpulseExtractor ex(src, testDetectorConfig());

    rh::ImpulseEvent ev;
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Impulse, "impulse before the corrupt region");
    REQUIRE(absd(ev.timestamp_s - 0.5) < 0.06, "first impulse near 0.5");
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Error, "corrupt region must fail the pass");
    REQUIRE(ex.lastError() == rh::ErrorCode::DecodeError, "failure reported as DecodeError");
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Error, "failed pass stays failed");

    REQUIRE(!ex.restart(0.0), "restart at the failed offset must be refused");
    REQUIRE(ex.restart(2.0), "restart at another offset is allowed");
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Impulse, "impulse after restart past the corrupt region");
    REQUIRE(absd(ev.timestamp_s - 2.5) < 0.06, "impulse near 2.5 after restart, got " << ev.timestamp_s);
    REQUIRE(ex.lastError() == rh::ErrorCode::None, "restart clears the error");

    std::cout << "[PASS] extractor decode failure and restart policy\n";
}

static void runExtractorRejectsBadFormat() {
    rh::MemoryAudioSource src(std::vector<float>(1000, 0.0f), 0, 1);
    rh::ImpulseExtractor ex(src, testDetectorConfig());
    rh::ImpulseEvent ev;
    REQUIRE(ex.nextImpulse(&ev) == rh::ExtractStatus::Error, "zero sample rate is unusable");
    REQUIRE(ex.lastError() == rh::ErrorCode::DecodeError, "unsupported format is a DecodeError");
    std::cout << "[PASS] extractor rejects unsupported formats\n";
}

static void runExtractorFrameTrace() {
    const int rate = 8000;
    rh::MemoryAudioSource src(burstClip(rate, 1.0, {0.5}, 0.05, 0.8f), rate, 1);
    rh::ImpulseExtractor ex(src, testDetectorConfig());
    std::size_t frames = 0;
    bool bounded = true;
    ex.setFrameObserver([&](const rh::ExtractorFrameV1& f) {
        ++frames;
        for (int b = 0; b < rh::kNumFrequencyBands; ++b) {
            const float lv = f.level_0_1[static_cast<std::size_t>(b)];
            if (!(lv >= 0.0f && lv <= 1.0f)) bounded = false;
        }
    });
    rh::ImpulseEvent ev;
    while (ex.nextImpulse(&ev) == rh::ExtractStatus::Impulse) {
    }
    REQUIRE(frames == 32, "one trace per hop expected, got " << frames);
    REQUIRE(bounded, "band levels must stay in [0,1]");
    std::cout << "[PASS] extractor frame trace\n";
}

// ============================================================
// Event scheduling
// ============================================================

static void runSchedulerBasicMapping() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    const rh::PlaybackState st = playing(9.0, 100.0, 1);

    REQUIRE(sched.submit(impulseAt(10.0, 0.8), st, 100.0), "submit should be accepted");
    REQUIRE(sched.state() == rh::SchedulerState::Scheduling, "submit starts scheduling");
    double due = 0.0;
    REQUIRE(sched.nextDueTime_s(&due), "one command pending");
    REQUIRE(absd(due - 101.0) < 1e-9, "dispatch time should be now + 1.0, got " << due);

    std::vector<rh::Dispatch> out;
    REQUIRE(sched.collectDue(st, 100.5, &out) == 0, "nothing due before dispatch time");
    REQUIRE(sched.collectDue(st, 101.0, &out) == 1, "command due at dispatch time");
    const rh::HapticCommand& c = out[0].command;
    REQUIRE(c.command_id == 1, "first command id is 1");
    REQUIRE(absd(c.intensity_0_1 - 0.8) < 1e-12, "intensity follows magnitude");
    REQUIRE(absd(c.duration_s - 0.08) < 1e-12, "default pulse duration");
    REQUIRE(c.isBroadcast(), "no channel target configured: broadcast");
    REQUIRE(out[0].preempted_command_id == 0, "nothing to pre-empt");

    // Half speed stretches the lead time.
    REQUIRE(absd(rh::EventScheduler::computeDispatchTime_s(10.0, 9.0, 0.5, 0.0) - 2.0) < 1e-12, "rate 0.5");
    REQUIRE(std::isinf(rh::EventScheduler::computeDispatchTime_s(10.0, 9.0, 0.0, 0.0)), "rate 0 never dispatches");

    std::cout << "[PASS] scheduler maps media time onto the local clock\n";
}

static void runSchedulerLateAndWeak() {
    rh::SchedulerConfigV1 cfg;
    cfg.min_intensity_0_1 = 0.2;
    cfg.channel_targets = {"", "left"};
    rh::EventScheduler sched(cfg);
    const rh::PlaybackState st = playing(5.0, 0.0, 1);

    sched.submit(impulseAt(4.0, 0.9), st, 0.0);
    REQUIRE(sched.stats().dropped_late == 1, "impulse a second in the past is dropped");
    sched.submit(impulseAt(4.9, 0.9), st, 0.0);
    REQUIRE(sched.pendingCount() == 1, "slightly late impulse is still dispatched");
    double due = -1.0;
    REQUIRE(sched.nextDueTime_s(&due) && absd(due) < 1e-12, "late impulse dispatches immediately");
    sched.submit(impulseAt(5.5, 0.1), st, 0.0);
    REQUIRE(sched.stats().dropped_weak == 1, "impulse below min intensity is dropped");
    sched.submit(impulseAt(5.5, 0.5, 1), st, 0.0);
    const std::vector<rh::HapticCommand> pend = sched.pendingCommands();
    REQUIRE(pend.size() == 2 && pend[1].device_target == "left", "channel 1 routes to 'left'");
    std::cout << "[PASS] scheduler drops late and weak impulses\n";
}

static void runSchedulerDispatchOrder() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    const rh::PlaybackState st = playing(0.0, 0.0, 1);
    sched.submit(impulseAt(3.0, 0.5), st, 0.0);
    sched.submit(impulseAt(1.0, 0.5), st, 0.0);
    sched.submit(impulseAt(2.0, 0.5), st, 0.0);
    sched.submit(impulseAt(2.0, 0.6), st, 0.0);

    std::vector<rh::Dispatch> out;
    REQUIRE(sched.collectDue(st, 3.5, &out) == 4, "all four due");
    for (std::size_t i = 1; i < out.size(); ++i) {
        REQUIRE(out[i - 1].command.dispatch_time_s <= out[i].command.dispatch_time_s, "dispatch order");
    }
    REQUIRE(out[1].command.command_id == 3 && out[2].command.command_id == 4, "equal times keep submit order");
    std::cout << "[PASS] scheduler dispatch order is non-decreasing\n";
}

static void runSchedulerPreemption() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    const rh::PlaybackState st = playing(0.0, 0.0, 1);
    sched.submit(impulseAt(1.0, 0.5), st, 0.0);
    sched.submit(impulseAt(1.05, 0.7), st, 0.0);
    sched.submit(impulseAt(2.0, 0.7), st, 0.0);

    std::vector<rh::Dispatch> out;
    REQUIRE(sched.collectDue(st, 1.1, &out) == 2, "two overlapping commands due");
    REQUIRE(out[0].preempted_command_id == 0, "first command pre-empts nothing");
    REQUIRE(out[1].preempted_command_id == out[0].command.command_id, "second pulse pre-empts the first");
    REQUIRE(sched.stats().preempted == 1, "pre-emption counted");

    out.clear();
    REQUIRE(sched.collectDue(st, 2.0, &out) == 1, "isolated command due");
    REQUIRE(out[0].preempted_command_id == 0, "expired in-flight command is not pre-empted");

    // Band 0 broadcasts, bass drives "left", mid drives "right".
    rh::SchedulerConfigV1 routed;
    routed.channel_targets = {"", "left", "right"};
    rh::EventScheduler mixed(routed);
    mixed.submit(impulseAt(3.0, 0.5, 0), st, 0.0);
    mixed.submit(impulseAt(3.02, 0.5, 1), st, 0.0);
    mixed.submit(impulseAt(3.04, 0.5, 2), st, 0.0);
    mixed.submit(impulseAt(3.06, 0.5, 1), st, 0.0);
    out.clear();
    REQUIRE(mixed.collectDue(st, 3.1, &out) == 4, "four overlapping commands due");
    REQUIRE(out[0].command.isBroadcast() && out[0].preempted_command_id == 0, "broadcast first");
    REQUIRE(out[1].preempted_command_id == out[0].command.command_id, "left pulse pre-empts the broadcast");
    REQUIRE(out[2].preempted_command_id == out[0].command.command_id, "right pulse pre-empts the broadcast");
    REQUIRE(out[3].preempted_command_id == out[1].command.command_id, "second left pulse pre-empts the first");

    mixed.submit(impulseAt(4.0, 0.5, 1), st, 0.0);
    mixed.submit(impulseAt(4.02, 0.5, 0), st, 0.0);
    out.clear();
    REQUIRE(mixed.collectDue(st, 4.1, &out) == 2, "left then broadcast due");
    REQUIRE(out[0].preempted_command_id == 0, "earlier pulses have ended");
    REQUIRE(out[1].preempted_command_id == out[0].command.command_id, "broadcast pre-empts the left pulse");
    REQUIRE(mixed.stats().preempted == 4, "pre-emptions across targets counted");
    std::cout << "[PASS] scheduler pre-empts overlapping commands per target\n";
}

static void runSchedulerPausedQueue() {
    rh::SchedulerConfigV1 cfg;
    cfg.paused_queue_capacity_u32 = 2;
    rh::EventScheduler sched(cfg);

    rh::PlaybackState paused = playing(0.0, 0.0, 1);
    paused.rate = 0.0;
    sched.submit(impulseAt(1.0, 0.5), paused, 0.0);
    sched.submit(impulseAt(2.0, 0.5), paused, 0.0);
    sched.submit(impulseAt(3.0, 0.5), paused, 0.0);

    REQUIRE(sched.queuedCount() == 2, "paused queue is bounded");
    REQUIRE(sched.stats().dropped_overflow == 1, "one overflow drop");
    const std::vector<rh::ImpulseEvent> q = sched.queuedImpulses();
    REQUIRE(absd(q[0].timestamp_s - 2.0) < 1e-12 && absd(q[1].timestamp_s - 3.0) < 1e-12, "oldest dropped");
    REQUIRE(sched.pendingCount() == 0, "nothing scheduled while paused");

    const rh::PlaybackState resumed = playing(0.0, 10.0, 2);
    std::vector<rh::Dispatch> out;
    sched.collectDue(resumed, 10.0, &out);
    REQUIRE(sched.queuedCount() == 0, "queue flushed on resume");
    REQUIRE(sched.pendingCount() == 2, "queued impulses scheduled on resume");
    double due = 0.0;
    REQUIRE(sched.nextDueTime_s(&due) && absd(due - 12.0) < 1e-9, "resumed impulse at 12.0, got " << due);
    std::cout << "[PASS] scheduler queues impulses while paused\n";
}

static void runSchedulerSeekDiscards() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    const rh::PlaybackState st = playing(0.0, 0.0, 1);
    sched.submit(impulseAt(1.0, 0.5), st, 0.0);

    rh::PlaybackState seeked = playing(5.0, 0.5, 2);
    seeked.seek_count = 1;
    std::vector<rh::Dispatch> out;
    REQUIRE(sched.collectDue(seeked, 2.0, &out) == 0, "command from before the seek is never dispatched");
    REQUIRE(sched.stats().discarded_stale == 1, "stale command counted");
    REQUIRE(sched.stats().rescheduled == 0, "seek does not re-schedule");
    REQUIRE(sched.pendingCount() == 0, "nothing left pending");
    std::cout << "[PASS] scheduler discards commands on seek\n";
}

static void runSchedulerPauseReschedules() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    sched.submit(impulseAt(2.0, 0.5), playing(0.0, 0.0, 1), 0.0);

    rh::PlaybackState paused = playing(0.5, 0.5, 2);
    paused.rate = 0.0;
    std::vector<rh::Dispatch> out;
    sched.collectDue(paused, 0.5, &out);
    REQUIRE(out.empty(), "nothing dispatched on pause");
    REQUIRE(sched.pendingCount() == 0 && sched.queuedCount() == 1, "impulse moved to the paused queue");
    REQUIRE(sched.stats().rescheduled == 1, "pause re-schedules");

    const rh::PlaybackState resumed = playing(0.5, 3.0, 3);
    sched.collectDue(resumed, 3.0, &out);
    double due = 0.0;
    REQUIRE(sched.nextDueTime_s(&due) && absd(due - 4.5) < 1e-9, "re-scheduled at 4.5, got " << due);
    REQUIRE(sched.collectDue(resumed, 4.5, &out) == 1, "re-scheduled command dispatched");
    REQUIRE(out[0].command.command_id == 2, "re-scheduled command gets a new id");
    REQUIRE(out[0].command.playback_sequence == 3, "carries the current sequence");

    // Speed change: same impulse distance, half the wall time.
    rh::EventScheduler fast(rh::SchedulerConfigV1{});
    fast.submit(impulseAt(2.0, 0.5), playing(0.0, 0.0, 1), 0.0);
    rh::PlaybackState doubled = playing(1.0, 1.0, 2);
    doubled.rate = 2.0;
    fast.collectDue(doubled, 1.0, &out);
    REQUIRE(fast.nextDueTime_s(&due) && absd(due - 1.5) < 1e-9, "rate 2 re-schedule at 1.5, got " << due);
    std::cout << "[PASS] scheduler re-schedules on pause and rate change\n";
}

static void runSchedulerDrain() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    rh::PlaybackState st = playing(0.0, 0.0, 1);
    sched.submit(impulseAt(1.0, 0.5), st, 0.0);

    st.end_of_media = true;
    std::vector<rh::Dispatch> out;
    sched.collectDue(st, 0.5, &out);
    REQUIRE(sched.state() == rh::SchedulerState::Draining, "end of media drains");
    REQUIRE(!sched.submit(impulseAt(1.5, 0.5), st, 0.5), "draining rejects new impulses");
    REQUIRE(sched.stats().rejected_draining == 1, "rejection counted");
    REQUIRE(sched.collectDue(st, 1.0, &out) == 1, "pending command still dispatched while draining");
    REQUIRE(sched.state() == rh::SchedulerState::Idle, "empty drain returns to Idle");
    std::cout << "[PASS] scheduler drains at end of media\n";
}

static void runSchedulerPlayerUnavailable() {
    rh::EventScheduler sched(rh::SchedulerConfigV1{});
    const rh::PlaybackState st = playing(0.0, 0.0, 1);
    sched.submit(impulseAt(1.0, 0.5), st, 0.0);
    sched.setPlayerAvailable(false);
    REQUIRE(sched.pendingCount() == 0, "pending commands discarded when the player is gone");
    REQUIRE(sched.stats().discarded_unavailable == 1, "discard counted");
    sched.submit(impulseAt(2.0, 0.5), st, 0.5);
    REQUIRE(sched.queuedCount() == 1, "impulses wait while the player is unavailable");
    sched.setPlayerAvailable(true);
    std::vector<rh::Dispatch> out;
    sched.collectDue(st, 0.6, &out);
    REQUIRE(sched.pendingCount() == 1 && sched.queuedCount() == 0, "queue flushed once available");
    std::cout << "[PASS] scheduler handles an unavailable player\n";
}

// ============================================================
// Playback tracking
// ============================================================

static void requireNotice(rh::PlaybackTracker& t, rh::PlaybackNoticeKind kind, const char* what) {
    rh::PlaybackNotice n;
    REQUIRE(t.pollNotice(&n), "expected notice " << what);
    REQUIRE(n.kind == kind, "expected " << what << ", got " << rh::playbackNoticeName(n.kind));
}

static void runTrackerProtocol() {
    rh::TrackerConfigV1 cfg;
    cfg.max_retries_u32 = 3;
    rh::PlaybackTracker t(cfg, nullptr);
    REQUIRE(t.currentState()->stale, "state is stale before the first connection");

    t.handleConnected(10.0);
    REQUIRE(!t.currentState()->stale, "connected state is live");
    t.handleMessage(R"({"event":"property-change","id":1,"name":"pause","data":false})", 10.0);
    requireNotice(t, rh::PlaybackNoticeKind::Resume, "Resume");
    t.handleMessage(R"({"request_id":1,"error":"success","data":42.0})", 10.0);
    requireNotice(t, rh::PlaybackNoticeKind::Seek, "Seek (initial anchor)");

    std::shared_ptr<const rh::PlaybackState> s = t.currentState();
    REQUIRE(absd(s->positionAt(11.0) - 43.0) < 1e-9, "position extrapolates at rate 1");
    const std::uint64_t seq = s->sequence;

    t.handleMessage(R"({"request_id":1,"error":"success","data":43.05})", 11.0);
    REQUIRE(t.currentState()->sequence == seq, "drift within the skew allowance is not a seek");
    REQUIRE(absd(t.currentState()->position_s - 43.05) < 1e-9, "position re-anchored");

    t.handleMessage(R"({"request_id":1,"error":"success","data":50.0})", 12.0);
    requireNotice(t, rh::PlaybackNoticeKind::Seek, "Seek (deviation)");
    REQUIRE(t.currentState()->seek_count == 2, "deviation counted as a seek");

    t.handleMessage(R"({"event":"property-change","id":2,"name":"speed","data":2.0})", 12.0);
    requireNotice(t, rh::PlaybackNoticeKind::RateChange, "RateChange");
    REQUIRE(absd(t.currentState()->rate - 2.0) < 1e-12, "rate follows speed");

    t.handleMessage("not json", 12.0);
    t.handleMessage(R"({"request_id":1,"error":"property unavailable"})", 12.0);
    rh::PlaybackNotice n;
    REQUIRE(!t.pollNotice(&n), "malformed and failed replies change nothing");

    t.handleMessage(R"({"event":"seek"})", 12.5);
    t.handleMessage(R"({"event":"playback-restart"})", 12.6);
    t.handleMessage(R"({"request_id":1,"error":"success","data":100.0})", 12.7);
    requireNotice(t, rh::PlaybackNoticeKind::Seek, "Seek (player)");
    REQUIRE(absd(t.currentState()->position_s - 100.0) < 1e-9, "seek target adopted");

    t.handleMessage(R"({"event":"property-change","id":1,"name":"pause","data":true})", 13.0);
    requireNotice(t, rh::PlaybackNoticeKind::Pause, "Pause");
    REQUIRE(t.currentState()->rate == 0.0, "paused rate is 0");

    t.handleMessage(R"({"event":"property-change","id":4,"name":"eof-reached","data":true})", 13.0);
    requireNotice(t, rh::PlaybackNoticeKind::EndOfMedia, "EndOfMedia");
    REQUIRE(t.currentState()->end_of_media, "end of media flagged");

    t.handleDisconnected(14.0);
    requireNotice(t, rh::PlaybackNoticeKind::Disconnected, "Disconnected");
    REQUIRE(t.currentState()->stale, "disconnected state is stale");
    t.handleConnectFailed(2);
    REQUIRE(!t.playerUnavailable(), "below the retry limit");
    t.handleConnectFailed(3);
    requireNotice(t, rh::PlaybackNoticeKind::PlayerUnavailable, "PlayerUnavailable");
    REQUIRE(t.playerUnavailable(), "retry limit reached");

    t.handleConnected(20.0);
    requireNotice(t, rh::PlaybackNoticeKind::Reconnected, "Reconnected");
    REQUIRE(!t.playerUnavailable() && !t.currentState()->stale, "recovered");

    REQUIRE(!t.seek(5.0), "transport control needs a connection");
    REQUIRE(absd(rh::PlaybackTracker::backoffDelay_s(cfg, 1) - 0.25) < 1e-12, "first backoff");
    REQUIRE(absd(rh::PlaybackTracker::backoffDelay_s(cfg, 20) - 8.0) < 1e-12, "backoff capped");
    std::cout << "[PASS] tracker follows the player protocol\n";
}

// ============================================================
// Wire protocol
// ============================================================

static void runWireProtocol() {
    REQUIRE(rh::wire::versionReply() == "RemoteHaptics:0.2", "version string");
    REQUIRE(!rh::wire::isCompatibleVersion("RemoteHaptics:0.1"), "older version is incompatible");

    rh::HapticCommand c = commandFor(3, "broadcast");
    REQUIRE(rh::wire::encodeCommand(c, 12.5) == "cmd:3,12.500000,0.500000,0.080000,broadcast", "command encoding");

    rh::HapticCommand p;
    REQUIRE(rh::wire::parseCommand("cmd:7,1700000000.250000,0.500000,0.080000,left", &p), "valid command");
    REQUIRE(p.command_id == 7 && p.device_target == "left", "id and target parsed");
    REQUIRE(absd(p.dispatch_time_s - 1700000000.25) < 1e-6, "wall time parsed");
    REQUIRE(!rh::wire::parseCommand("cmd:7,1.0,1.5,0.08,left", &p), "intensity above 1 rejected");
    REQUIRE(!rh::wire::parseCommand("cmd:7,1.0,0.5,0.08", &p), "missing field rejected");
    REQUIRE(!rh::wire::parseCommand("cmd:0,1.0,0.5,0.08,left", &p), "command id 0 rejected");
    REQUIRE(!rh::wire::parseCommand("cmd:-3,1.0,0.5,0.08,left", &p), "negative id rejected");
    REQUIRE(!rh::wire::parseCommand("cmd:7,nan,0.5,0.08,left", &p), "non-finite time rejected");
    REQUIRE(!rh::wire::parseCommand("cmd:7,1.0,0.5,0.08,le ft", &p), "target with whitespace rejected");

    std::vector<std::string> targets;
    REQUIRE(rh::wire::parseDevices("devices:", &targets) && targets.empty(), "empty target list allowed");
    REQUIRE(rh::wire::parseDevices("devices:left,right", &targets) && targets.size() == 2, "two targets");
    REQUIRE(!rh::wire::parseDevices("devices:a,,b", &targets), "empty target name rejected");
    REQUIRE(rh::wire::encodeDevices({"left", "right"}) == "devices:left,right", "devices encoding");

    std::uint64_t id = 0;
    rh::AckStatus st = rh::AckStatus::Ok;
    REQUIRE(rh::wire::parseAck("ack:5,UNKNOWN_TARGET", &id, &st), "valid ack");
    REQUIRE(id == 5 && st == rh::AckStatus::UnknownTarget, "ack fields");
    REQUIRE(!rh::wire::parseAck("ack:5,MAYBE", &id, &st), "unknown status rejected");
    REQUIRE(rh::wire::encodeAck(9, rh::AckStatus::Stale) == "ack:9,STALE", "ack encoding");
    std::cout << "[PASS] wire protocol encoding and parsing\n";
}

// ============================================================
// Devices
// ============================================================

static void runDeviceRegistry() {
    std::vector<std::string> log;
    rh::device::DeviceRegistryConfigV1 cfg;
    cfg.targets_by_device["pad0"] = "left";
    rh::device::DeviceRegistry reg(cfg);

    auto pad0 = std::make_unique<FakeDevice>("pad0", &log);
    auto pad1 = std::make_unique<FakeDevice>("pad1", &log);
    FakeDevice* p0 = pad0.get();
    FakeDevice* p1 = pad1.get();
    REQUIRE(reg.addDevice(std::move(pad0)), "pad0 registered");
    REQUIRE(reg.addDevice(std::move(pad1)), "pad1 registered");
    REQUIRE(!reg.addDevice(std::make_unique<FakeDevice>("pad0", &log)), "duplicate id refused");
    REQUIRE(reg.hasTarget("left") && reg.hasTarget("pad1"), "mapped and default targets");

    rh::device::ApplyResult r = reg.apply(commandFor(1, "left"), 1.0);
    REQUIRE(r.status == rh::AckStatus::Ok && r.devices_applied_u32 == 1, "targeted apply");
    r = reg.apply(commandFor(2, "nowhere"), 1.0);
    REQUIRE(r.status == rh::AckStatus::UnknownTarget, "unknown target");
    r = reg.apply(commandFor(3, "broadcast"), 1.02);
    REQUIRE(r.status == rh::AckStatus::Ok && r.devices_applied_u32 == 2, "broadcast reaches every device");
    REQUIRE(r.preempted_command_ids.size() == 1 && r.preempted_command_ids[0] == 1, "broadcast pre-empts pulse 1");

    reg.resetAll();
    reg.resetAll();
    REQUIRE(p0->resets == 2 && p1->resets == 2, "reset reaches every device each time");
    for (const auto& s : reg.status()) REQUIRE(s.active_command_id == 0, "reset leaves devices neutral");
    r = reg.apply(commandFor(4, "left"), 1.03);
    REQUIRE(r.preempted_command_ids.empty(), "nothing to pre-empt after reset");

    p1->fail_apply = true;
    r = reg.apply(commandFor(5, "pad1"), 2.0);
    REQUIRE(r.status == rh::AckStatus::DeviceError, "failing device reports DEVICE_ERROR");
    REQUIRE(reg.anyUnavailable(), "failing device marked unavailable");
    r = reg.apply(commandFor(6, "broadcast"), 2.5);
    REQUIRE(r.status == rh::AckStatus::DeviceError && r.devices_applied_u32 == 1, "broadcast partially applied");

    p1->fail_apply = false;
    p1->reopen_ok = false;
    REQUIRE(reg.rediscover() == 0, "reopen failure keeps the device unavailable");
    p1->reopen_ok = true;
    REQUIRE(reg.rediscover() == 1, "device restored by rediscovery");
    REQUIRE(!reg.anyUnavailable(), "all devices available");
    r = reg.apply(commandFor(7, "pad1"), 3.0);
    REQUIRE(r.status == rh::AckStatus::Ok, "restored device accepts commands");

    rh::device::DeviceRegistryConfigV1 only;
    only.enabled_devices = {"pad0"};
    rh::device::DeviceRegistry filtered(only, [&log]() {
        std::vector<std::unique_ptr<rh::device::HapticDevice>> v;
        v.push_back(std::make_unique<FakeDevice>("pad0", &log));
        v.push_back(std::make_unique<FakeDevice>("pad1", &log));
        return v;
    });
    REQUIRE(filtered.discover() == 1 && filtered.deviceCount() == 1, "only enabled devices are used");
    REQUIRE(filtered.discover() == 0, "discovery does not duplicate devices");

    // Pad unplugged and re-created by udev under a new event node.
    std::vector<std::string> replug_log;
    bool replugged = false;
    FakeDevice* fresh = nullptr;
    rh::device::DeviceRegistry hotplug(rh::device::DeviceRegistryConfigV1{}, [&]() {
        std::vector<std::unique_ptr<rh::device::HapticDevice>> v;
        if (replugged) {
            auto d = std::make_unique<FakeDevice>("pad1", &replug_log);
            fresh = d.get();
            v.push_back(std::move(d));
        }
        return v;
    });
    auto old_pad = std::make_unique<FakeDevice>("pad1", &replug_log);
    FakeDevice* stale = old_pad.get();
    REQUIRE(hotplug.addDevice(std::move(old_pad)), "pad1 registered");
    stale->fail_apply = true;
    stale->reopen_ok = false;
    REQUIRE(hotplug.apply(commandFor(8, "pad1"), 4.0).status == rh::AckStatus::DeviceError, "unplugged pad fails");
    REQUIRE(hotplug.rediscover() == 0 && hotplug.anyUnavailable(), "old node gone, pad stays unavailable");
    replugged = true;
    REQUIRE(hotplug.rediscover() == 1, "pad found again at its new node");
    REQUIRE(!hotplug.anyUnavailable() && hotplug.deviceCount() == 1, "entry restored, not duplicated");
    REQUIRE(fresh != nullptr && fresh->resets == 1, "new handle reset before use");
    r = hotplug.apply(commandFor(9, "pad1"), 5.0);
    REQUIRE(r.status == rh::AckStatus::Ok && r.devices_applied_u32 == 1, "restored pad accepts commands");
    REQUIRE(replug_log.back() == "pad1:apply:9", "command reached the new handle");
    REQUIRE(hotplug.discover() == 0, "available pad not replaced again");

    REQUIRE(rh::device::filterDeviceId("usb-0000:00:14.0-1/INPUT0=x") == "usb-0000:00:14.0-1/input0_x",
            "device id normalisation");
    std::cout << "[PASS] device registry routing, reset and recovery\n";
}

// ============================================================
// Channel sessions
// ============================================================

static void runSenderSession() {
    rh::SenderSession s(1, "127.0.0.1:5000", "");
    s.setState(rh::ConnectionState::VersionCheck);
    bool close = false;

    std::vector<std::string> r = s.onLine("devices:left", &close);
    REQUIRE(r.size() == 1 && r[0] == "INVALID_REQUEST", "devices before ver rejected");
    r = s.onLine("ver", &close);
    REQUIRE(r.size() == 1 && r[0] == "RemoteHaptics:0.2", "version reply");
    REQUIRE(s.state() == rh::ConnectionState::DevicesSet, "awaiting devices");
    REQUIRE(!s.accepts(commandFor(1, "broadcast")), "no commands before the session is active");
    r = s.onLine("devices:left,right", &close);
    REQUIRE(r.size() == 1 && r[0] == "ACK", "devices acknowledged");
    REQUIRE(s.state() == rh::ConnectionState::Active, "session active");

    REQUIRE(s.accepts(commandFor(1, "left")), "announced target accepted");
    REQUIRE(!s.accepts(commandFor(1, "rear")), "other target not routed here");
    REQUIRE(s.accepts(commandFor(1, "broadcast")), "broadcast always routed");

    s.noteSent(1, 10.0);
    s.noteSent(2, 10.2);
    r = s.onLine("ack:1,OK", &close);
    REQUIRE(r.empty(), "acks get no reply");
    REQUIRE(s.acks().ok == 1 && s.info().last_acked_command_id == 1, "ack recorded");
    REQUIRE(s.expireAcks(11.1, 1.0).empty(), "not yet timed out");
    const std::vector<std::uint64_t> expired = s.expireAcks(11.3, 1.0);
    REQUIRE(expired.size() == 1 && expired[0] == 2, "command 2 timed out");
    s.onLine("ack:2,OK", &close);
    REQUIRE(s.acks().total() == 1, "late ack ignored");

    r = s.onLine("ack:x", &close);
    REQUIRE(r.size() == 1 && r[0] == "INVALID_REQUEST", "malformed ack");
    r = s.onLine("bogus", &close);
    REQUIRE(r.size() == 1 && r[0] == "INVALID_REQUEST", "unknown request");
    r = s.onLine("help", &close);
    REQUIRE(r.size() == 1 && r[0] == rh::wire::helpText(), "help text");
    REQUIRE(!close, "not closed yet");
    s.onLine("quit", &close);
    REQUIRE(close, "quit closes the session");
    std::cout << "[PASS] sender session protocol\n";
}

static void runReceiverSession() {
    std::vector<std::string> log;
    rh::device::DeviceRegistry reg(rh::device::DeviceRegistryConfigV1{});
    reg.addDevice(std::make_unique<FakeDevice>("pad0", &log));

    rh::ReceiverSession rs(reg, 0.5);
    std::vector<std::string> out = rs.begin();
    REQUIRE(out.size() == 1 && out[0] == "ver", "session opens with ver");
    REQUIRE(log.size() == 1 && log[0] == "pad0:reset", "devices reset before anything else");

    bool fatal = false;
    out = rs.onLine("RemoteHaptics:0.2", 100.0, 5.0, &fatal);
    REQUIRE(out.size() == 1 && out[0] == "devices:pad0", "targets announced");
    out = rs.onLine("ACK", 100.0, 5.0, &fatal);
    REQUIRE(rs.state() == rh::ConnectionState::Active && !fatal, "active after ACK");

    out = rs.onLine("cmd:7,100.000000,0.500000,0.080000,pad0", 100.1, 5.0, &fatal);
    REQUIRE(out.size() == 1 && out[0] == "ack:7,OK", "command applied");
    REQUIRE(log.back() == "pad0:apply:7", "device received command 7");
    out = rs.onLine("cmd:8,99.000000,0.500000,0.080000,pad0", 100.1, 5.1, &fatal);
    REQUIRE(out.size() == 1 && out[0] == "ack:8,STALE", "old command acknowledged STALE");
    REQUIRE(log.back() == "pad0:apply:7", "stale command not applied");
    out = rs.onLine("cmd:9,100.100000,0.500000,0.080000,rear", 100.1, 5.2, &fatal);
    REQUIRE(out.size() == 1 && out[0] == "ack:9,UNKNOWN_TARGET", "unknown target");
    out = rs.onLine("cmd:junk", 100.1, 5.2, &fatal);
    REQUIRE(out.empty() && rs.stats().commands_malformed == 1, "malformed command dropped");
    REQUIRE(rs.stats().commands_received == 3, "three valid commands");

    rh::ReceiverSession bad(reg, 0.0);
    bad.begin();
    fatal = false;
    bad.onLine("RemoteHaptics:0.1", 100.0, 5.0, &fatal);
    REQUIRE(fatal && bad.state() == rh::ConnectionState::Error, "incompatible server is fatal");
    REQUIRE(!bad.failure().empty(), "failure described");
    std::cout << "[PASS] receiver session protocol\n";
}

// Command sent at 5.0, connection lost, reconnected at 5.3: the command is gone.
static void runReconnectDoesNotReplay() {
    std::vector<std::string> log;
    rh::device::DeviceRegistry reg(rh::device::DeviceRegistryConfigV1{});
    reg.addDevice(std::make_unique<FakeDevice>("pad0", &log));

    {
        rh::SenderSession s1(1, "peer", "");
        s1.setState(rh::ConnectionState::Active);
        s1.noteSent(8, 5.0);
        REQUIRE(s1.awaitingAckCount() == 1, "command in flight when the link drops");
    }

    rh::ReceiverSession rs(reg, 0.0);
    rh::SenderSession s2(2, "peer", "");
    s2.setState(rh::ConnectionState::VersionCheck);
    bool close = false;
    bool fatal = false;
    const std::size_t mark = log.size();

    std::vector<std::string> lines = rs.begin();
    while (!lines.empty()) {
        std::vector<std::string> next;
        for (const auto& l : lines) {
            for (const auto& reply : s2.onLine(l, &close)) {
                for (const auto& back : rs.onLine(reply, 105.3, 5.3, &fatal)) next.push_back(back);
            }
        }
        lines = next;
    }
    REQUIRE(rs.state() == rh::ConnectionState::Active && s2.state() == rh::ConnectionState::Active,
            "handshake completes after reconnect");
    REQUIRE(log.size() == mark + 1 && log[mark] == "pad0:reset", "reconnect resets devices and applies nothing");
    REQUIRE(s2.awaitingAckCount() == 0, "new session has nothing to retry");
    s2.onLine("ack:8,OK", &close);
    REQUIRE(s2.acks().total() == 0, "ack for the old session's command is ignored");
    std::cout << "[PASS] reconnect resets devices and does not replay commands\n";
}

// ============================================================
// Session recording
// ============================================================

static std::filesystem::path scratchDir(const char* name) {
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("rh_" + std::string(name) + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

static std::vector<std::string> fileLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static void writeFile(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << text;
}

static void runRecordingTimestamps() {
    REQUIRE(rh::formatUtcTimestamp(0.0) == "1970-01-01 00:00:00.000000+00:00", "epoch formatted");
    REQUIRE(rh::formatUtcTimestamp(1.5) == "1970-01-01 00:00:01.500000+00:00", "fraction formatted");

    double t = -1.0;
    REQUIRE(rh::parseUtcTimestamp(rh::formatUtcTimestamp(1760875200.25), &t), "own format parses");
    REQUIRE(absd(t - 1760875200.25) < 1e-6, "timestamp round trip: " << t);
    REQUIRE(rh::parseUtcTimestamp("1970-01-01 02:00:00+02:00", &t) && absd(t) < 1e-9, "offset applied");
    REQUIRE(rh::parseUtcTimestamp("1970-01-01T00:00:10Z", &t) && absd(t - 10.0) < 1e-9, "T and Z accepted");
    REQUIRE(!rh::parseUtcTimestamp("1970-01-01", &t), "date alone rejected");
    REQUIRE(!rh::parseUtcTimestamp("1970-01-01 00:00:00 junk", &t), "trailing text rejected");

    REQUIRE(rh::safeFileComponent("host:name/../x") == "hostname..x", "separators removed");
    REQUIRE(rh::safeFileComponent("::") == "unknown", "empty name replaced");
    std::cout << "[PASS] recording timestamps and file names\n";
}

static void runSessionRecording() {
    const std::filesystem::path dir = scratchDir("recording");
    const std::string path = (dir / "a.rec").string();

    rh::RecordingConfigV1 cfg;
    std::string err;
    {
        rh::SessionRecorder rec(cfg);
        REQUIRE(rec.open(path, 1000.0, &err), "recording opens: " << err);
        rh::HapticCommand c = commandFor(1, "pad0");
        c.intensity_0_1 = 0.75;
        rec.recordCommand(c, 1000.5);
        rec.remark("hello\nworld", 1001.0);
        rec.recordCommand(commandFor(2, rh::kBroadcastTarget, 0.05), 1070.0);
        REQUIRE(rec.entriesWritten() == 3, "three entries written");
        rec.close(1080.0);
        REQUIRE(!rec.isOpen(), "closed");
    }

    const std::vector<std::string> lines = fileLines(path);
    REQUIRE(lines.size() == 8, "header, start, two comments, three entries, footer: " << lines.size());
    REQUIRE(lines[0] == rh::kRecordingHeader, "header line");
    REQUIRE(lines[1] == "@session_start:1970-01-01 00:16:40.000000+00:00", "start line: " << lines[1]);
    REQUIRE(lines[3] == "0.500000:0.750000,0.080000,pad0", "command line: " << lines[3]);
    REQUIRE(lines[4] == "1.000000:text=hello world", "remark kept on one line: " << lines[4]);
    REQUIRE(lines[5].rfind("# timestamp = ", 0) == 0, "timestamp comment after a minute");
    REQUIRE(lines[7] == "@session_end:1970-01-01 00:18:00.000000+00:00", "footer line: " << lines[7]);

    rh::RecordingReader reader;
    REQUIRE(reader.open(path, &err), "recording reads: " << err);
    REQUIRE(absd(reader.sessionStart_s() - 1000.0) < 1e-9, "session start parsed");
    rh::RecordingEntry e;
    REQUIRE(reader.next(&e) && e.kind == rh::RecordingEntryKind::Command, "first entry is a command");
    REQUIRE(absd(e.time_delta_s - 0.5) < 1e-9 && absd(e.intensity_0_1 - 0.75) < 1e-9 && e.target == "pad0",
            "command fields read back");
    REQUIRE(reader.next(&e) && e.kind == rh::RecordingEntryKind::Remark && e.text == "hello world", "remark read");
    REQUIRE(reader.next(&e) && e.target == rh::kBroadcastTarget && absd(e.time_delta_s - 70.0) < 1e-9,
            "comment skipped before the broadcast entry");
    REQUIRE(!reader.next(&e) && reader.reachedEnd() && reader.lastError().empty(), "footer ends the recording");
    REQUIRE(reader.rewind() && reader.next(&e) && e.target == "pad0", "rewind starts over");

    const std::string bad_header = (dir / "bad.rec").string();
    writeFile(bad_header, "NotARecording\n@session_start:1970-01-01 00:00:00\n");
    err.clear();
    REQUIRE(!reader.open(bad_header, &err) && !err.empty(), "wrong header rejected");

    const std::string bad_entry = (dir / "entry.rec").string();
    writeFile(bad_entry, std::string(rh::kRecordingHeader) + "\n@session_start:1970-01-01 00:00:00\n0.1:1.5,0.1,pad0\n");
    REQUIRE(reader.open(bad_entry, &err), "header valid");
    REQUIRE(!reader.next(&e) && !reader.lastError().empty(), "out of range intensity reported");

    // Unterminated file (receiver killed) still reads to EOF.
    const std::string cut = (dir / "cut.rec").string();
    writeFile(cut, std::string(rh::kRecordingHeader) + "\n@session_start:1970-01-01 00:00:00\n0.1:0.5,0.1,pad0\n");
    REQUIRE(reader.open(cut, &err) && reader.next(&e) && !reader.next(&e), "entry read without footer");
    REQUIRE(reader.reachedEnd() && reader.lastError().empty(), "EOF is a normal end");

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] session recording write and read back\n";
}

static void runRecordingMerge() {
    const std::filesystem::path dir = scratchDir("merge");
    const std::string a = (dir / "a.rec").string();
    const std::string b = (dir / "b.rec").string();
    const std::string merged = (dir / "merged.rec").string();

    rh::RecordingConfigV1 cfg;
    std::string err;
    {
        rh::SessionRecorder ra(cfg);
        REQUIRE(ra.open(a, 1000.0, &err), "a opens");
        ra.recordCommand(commandFor(1, "a1"), 1000.5);
        ra.recordCommand(commandFor(2, "a2"), 1003.0);
        ra.close(1004.0);
        rh::SessionRecorder rb(cfg);
        REQUIRE(rb.open(b, 1001.0, &err), "b opens");
        rb.recordCommand(commandFor(3, "b1"), 1001.2);
        rb.remark("cue", 1002.0);
        rb.close(1005.0);
    }

    REQUIRE(rh::mergeRecordings(merged, {b, a}, &err), "merge succeeds: " << err);
    rh::RecordingReader reader;
    REQUIRE(reader.open(merged, &err), "merged file reads");
    REQUIRE(absd(reader.sessionStart_s() - 1000.0) < 1e-9, "merged start is the earliest start");

    const double expected_s[] = {0.5, 1.2, 2.0, 3.0};
    const char* expected_what[] = {"a1", "b1", "cue", "a2"};
    rh::RecordingEntry e;
    for (int i = 0; i < 4; ++i) {
        REQUIRE(reader.next(&e), "merged entry " << i);
        const std::string what = e.kind == rh::RecordingEntryKind::Remark ? e.text : e.target;
        REQUIRE(what == expected_what[i] && absd(e.time_delta_s - expected_s[i]) < 1e-6,
                "merged order " << i << ": " << what << " at " << e.time_delta_s);
    }
    REQUIRE(!reader.next(&e) && reader.lastError().empty(), "merged file ends after four entries");
    const std::vector<std::string> lines = fileLines(merged);
    REQUIRE(!lines.empty() && lines.back() == "@session_end:1970-01-01 00:16:43.000000+00:00",
            "footer at the last entry: " << (lines.empty() ? "" : lines.back()));

    err.clear();
    REQUIRE(!rh::mergeRecordings(merged, {a, (dir / "missing.rec").string()}, &err) && !err.empty(),
            "missing input reported");
    std::filesystem::remove_all(dir);
    std::cout << "[PASS] recordings merge in absolute time order\n";
}

static void runReceiverRecordsAppliedCommands() {
    const std::filesystem::path dir = scratchDir("receiver_rec");
    std::vector<std::string> log;
    rh::device::DeviceRegistry reg(rh::device::DeviceRegistryConfigV1{});
    reg.addDevice(std::make_unique<FakeDevice>("pad0", &log));

    rh::RecordingConfigV1 cfg;
    cfg.enabled_u32 = 1;
    cfg.destination_dir = dir.string();
    rh::SessionRecorder rec(cfg);
    std::string err;
    REQUIRE(rec.openForPeer("haptics.example:7837", 100.0, &err), "per server recording opens: " << err);
    REQUIRE(std::filesystem::path(rec.path()).parent_path() == dir / "haptics.example7837", "file under server dir");
    REQUIRE(std::filesystem::path(rec.path()).extension() == ".rec", "recording extension");
    rh::SessionRecorder second(cfg);
    REQUIRE(second.openForPeer("haptics.example:7837", 100.0, &err), "second session opens");
    REQUIRE(second.path() != rec.path(), "same second gets its own file");
    second.close(100.0);

    rh::ReceiverSession rs(reg, 0.5);
    rs.setRecorder(&rec);
    rs.begin();
    bool fatal = false;
    rs.onLine("RemoteHaptics:0.2", 100.0, 5.0, &fatal);
    rs.onLine("ACK", 100.0, 5.0, &fatal);
    REQUIRE(rs.state() == rh::ConnectionState::Active, "active");

    rs.onLine("cmd:7,100.000000,0.600000,0.080000,pad0", 100.1, 5.0, &fatal);
    rs.onLine("cmd:8,99.000000,0.500000,0.080000,pad0", 100.2, 5.1, &fatal);
    rs.onLine("cmd:9,100.200000,0.500000,0.080000,rear", 100.2, 5.1, &fatal);
    REQUIRE(rec.entriesWritten() == 1, "only the applied command is recorded");
    const std::string path = rec.path();
    rec.close(101.0);

    rh::RecordingReader reader;
    rh::RecordingEntry e;
    REQUIRE(reader.open(path, &err) && reader.next(&e), "receiver recording reads");
    REQUIRE(e.target == "pad0" && absd(e.intensity_0_1 - 0.6) < 1e-9 && absd(e.time_delta_s - 0.1) < 1e-6,
            "applied command recorded at arrival time");
    REQUIRE(!reader.next(&e) && reader.lastError().empty(), "nothing else recorded");

    rh::ReceiverConfigV1 rc;
    rh::finalizeReceiverConfig(&rc);
    rh::ReceiverConfigV1 on = rc;
    on.recording = cfg;
    rh::finalizeReceiverConfig(&on);
    REQUIRE(on.fnv_hash_u32 != rc.fnv_hash_u32, "recording settings change the receiver hash");
    rh::ReceiverConfigV1 back;
    REQUIRE(rh::receiverConfigFromJson(rh::receiverConfigToJson(on), &back, &err), "recording section parses");
    REQUIRE(back.recording.enabled_u32 == 1 && back.recording.destination_dir == dir.string(),
            "recording section round trip");
    Json::Value bad = rh::receiverConfigToJson(on);
    bad["recording"]["flush_interval_s"] = 0.0;
    REQUIRE(!rh::receiverConfigFromJson(bad, &back, &err) && err.find("recording") != std::string::npos,
            "non-positive flush interval rejected");

    std::filesystem::remove_all(dir);
    std::cout << "[PASS] receiver records applied commands\n";
}

// ============================================================
// Sender pipeline (own clock, no player)
// ============================================================

static void runSenderPipeline() {
    const int rate = 8000;
    // Bursts start on hop boundaries (256 frames at 8 kHz).
    rh::MemoryAudioSource src(burstClip(rate, 1.4, {0.192, 1.216}, 0.05, 0.8f), rate, 1);

    std::mutex mu;
    std::vector<rh::Dispatch> seen;
    rh::HapticsSender sender(rh::SenderPipelineConfigV1{}, testDetectorConfig(), rh::SchedulerConfigV1{}, src,
                             nullptr, [&](const rh::Dispatch& d) {
                                 std::lock_guard<std::mutex> lock(mu);
                                 seen.push_back(d);
                                 return static_cast<std::size_t>(1);
                             });
    REQUIRE(sender.start(), "sender starts");
    for (int i = 0; i < 300; ++i) {
        {
            std::lock_guard<std::mutex> lock(mu);
            if (seen.size() >= 2) break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    sender.stop();

    std::lock_guard<std::mutex> lock(mu);
    REQUIRE(seen.size() == 2, "two bursts, two commands, got " << seen.size());
    for (const auto& d : seen) {
        const double media_t = d.command.dispatch_time_s - sender.clockOrigin_s();
        REQUIRE(absd(media_t - d.command.impulse_timestamp_s) < 1e-6, "own clock maps media time 1:1");
    }
    REQUIRE(seen[0].command.dispatch_time_s <= seen[1].command.dispatch_time_s, "dispatch order");
    const rh::SenderStats st = sender.stats();
    REQUIRE(st.commands_delivered == 2 && st.impulses_extracted == 2, "stats follow deliveries");
    std::cout << "[PASS] sender pipeline delivers on its own clock\n";
}

// ============================================================
// Utilities and configuration
// ============================================================

static void runBoundedQueue() {
    rh::BoundedQueue<int> q(2);
    bool dropped = false;
    q.push(1, &dropped);
    q.push(2, &dropped);
    REQUIRE(!dropped, "no drop below capacity");
    q.push(3, &dropped);
    REQUIRE(dropped && q.size() == 2 && q.droppedCount() == 1, "oldest dropped on overflow");
    int v = 0;
    REQUIRE(q.tryPop(&v) && v == 2, "oldest survivor first");
    q.close();
    REQUIRE(!q.push(4), "closed queue refuses pushes");
    REQUIRE(q.popFor(&v, 0.01) && v == 3, "queued element poppable after close");
    REQUIRE(!q.popFor(&v, 0.01), "closed and empty");
    std::cout << "[PASS] bounded queue\n";
}

static void runBackoffAndTargets() {
    REQUIRE(absd(rh::exponentialBackoff_s(0.5, 8.0, 1) - 0.5) < 1e-12, "attempt 1 = initial");
    REQUIRE(absd(rh::exponentialBackoff_s(0.5, 8.0, 2) - 1.0) < 1e-12, "attempt 2 doubles");
    REQUIRE(absd(rh::exponentialBackoff_s(0.5, 8.0, 10) - 8.0) < 1e-12, "capped");
    REQUIRE(rh::isValidTargetName("left-pad_1"), "plain target");
    REQUIRE(!rh::isValidTargetName("a,b") && !rh::isValidTargetName("a:b") && !rh::isValidTargetName(""),
            "separators and empty names rejected");
    rh::FrequencyBand b = rh::FrequencyBand::All;
    REQUIRE(rh::parseFrequencyBand("Bass", &b) && b == rh::FrequencyBand::Bass, "band names are case-insensitive");
    REQUIRE(!rh::parseFrequencyBand("sub", &b), "unknown band");
    std::cout << "[PASS] backoff, target names and bands\n";
}

static void runConfigRoundTrip() {
    rh::SenderConfigV1 c;
    c.audio_file = "track.flac";
    c.detector.band_mask_u32 = rh::bandMaskFor(rh::FrequencyBand::Bass) | rh::bandMaskFor(rh::FrequencyBand::Treble);
    c.scheduler.channel_targets = {"", "left", "", "right"};
    c.scheduler.pulse_duration_s = 0.05;
    c.channel.port_i32 = 9000;
    rh::finalizeSenderConfig(&c);

    rh::SenderConfigV1 back;
    std::string err;
    REQUIRE(rh::senderConfigFromJson(rh::senderConfigToJson(c), &back, &err), "sender config parses: " << err);
    REQUIRE(back.fnv_hash_u32 == c.fnv_hash_u32, "round trip preserves the configuration hash");
    REQUIRE(back.scheduler.channel_targets == c.scheduler.channel_targets, "channel targets preserved");
    REQUIRE(back.detector.band_mask_u32 == c.detector.band_mask_u32, "band selection preserved");

    rh::SenderConfigV1 changed = c;
    changed.detector.threshold_k = 2.0;
    rh::finalizeSenderConfig(&changed);
    REQUIRE(changed.detector.fnv_hash_u32 != c.detector.fnv_hash_u32, "detector hash tracks tuning");
    REQUIRE(changed.fnv_hash_u32 != c.fnv_hash_u32, "aggregate hash tracks sections");

    Json::Value bad = rh::senderConfigToJson(c);
    bad["audio"]["capture_rate_hz"] = "fast";
    rh::SenderConfigV1 rejected;
    err.clear();
    REQUIRE(!rh::senderConfigFromJson(bad, &rejected, &err), "type error rejected");
    REQUIRE(err.find("audio.capture_rate_hz") != std::string::npos, "error names the key: " << err);

    Json::Value future = rh::senderConfigToJson(c);
    future["version"] = 2;
    REQUIRE(!rh::senderConfigFromJson(future, &rejected, &err), "unknown version rejected");

    rh::ReceiverConfigV1 rc;
    rc.channel.pinned_sha256 = "ab:cd";
    rc.devices.targets_by_device["pad0"] = "left";
    rh::finalizeReceiverConfig(&rc);
    rh::ReceiverConfigV1 rback;
    REQUIRE(rh::receiverConfigFromJson(rh::receiverConfigToJson(rc), &rback, &err), "receiver config parses");
    REQUIRE(rback.fnv_hash_u32 == rc.fnv_hash_u32, "receiver round trip preserves the hash");

    char buf[8192];
    const int n = rh::exportSenderConfigText(c, buf, static_cast<int>(sizeof(buf)));
    REQUIRE(n > 0 && std::string(buf).find("track.flac") != std::string::npos, "config export names the file");
    std::cout << "[PASS] configuration round trip and validation\n";
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    runExtractorFindsBursts();
    runExtractorDecodeFailure();
    runExtractorRejectsBadFormat();
    runExtractorFrameTrace();

    runSchedulerBasicMapping();
    runSchedulerLateAndWeak();
    runSchedulerDispatchOrder();
    runSchedulerPreemption();
    runSchedulerPausedQueue();
    runSchedulerSeekDiscards();
    runSchedulerPauseReschedules();
    runSchedulerDrain();
    runSchedulerPlayerUnavailable();

    runTrackerProtocol();
    runWireProtocol();
    runDeviceRegistry();

    runSenderSession();
    runReceiverSession();
    runReconnectDoesNotReplay();

    runRecordingTimestamps();
    runSessionRecording();
    runRecordingMerge();
    runReceiverRecordsAppliedCommands();

    runSenderPipeline();

    runBoundedQueue();
    runBackoffAndTargets();
    runConfigRoundTrip();

    return 0;
}
