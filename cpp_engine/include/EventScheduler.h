#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "BoundedQueue.h"
#include "HapticsTypes.h"

namespace rh {

// ============================================================
// Event scheduler
//
// Maps media-relative impulses onto the sender's monotonic clock:
//   dispatch_time = now + (impulse.timestamp - position_at(now)) / rate
//
// Rules:
// - A command carries the playback sequence it was scheduled under; if the
//   sequence changes before dispatch the command is discarded (never delivered).
// - Seeks also discard the paused-impulse queue. Pause and rate changes re-schedule
//   the discarded commands' impulses under new command ids.
// - Paused, stale or unavailable player: impulses wait in a bounded queue that
//   drops the oldest on overflow.
// - A due command overlapping the in-flight command on the same target pre-empts it.
// - Not thread-safe: owned by the scheduling task.
// ============================================================

enum class SchedulerState : std::uint32_t {
    Idle = 0,
    Scheduling,
    Draining,
};

const char* schedulerStateName(SchedulerState s);

struct SchedulerConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SchedulerConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::uint32_t paused_queue_capacity_u32 = 32;
    double pulse_duration_s = 0.08;
    double intensity_gain = 1.0;
    double min_intensity_0_1 = 0.0;

    // Impulses whose dispatch time is further in the past than this are dropped;
    // anything less late is dispatched immediately.
    double max_late_s = kMediaPositionSkew_s;
    double min_lead_s = 0.0;

    // Index = ImpulseEvent::channel (frequency band). Empty or missing = broadcast.
    std::vector<std::string> channel_targets;
};

std::uint32_t computeSchedulerConfigHash(const SchedulerConfigV1& c);

struct SchedulerStats {
    std::uint64_t submitted = 0;
    std::uint64_t scheduled = 0;
    std::uint64_t rescheduled = 0;
    std::uint64_t queued_paused = 0;
    std::uint64_t dropped_overflow = 0;
    std::uint64_t dropped_late = 0;
    std::uint64_t dropped_weak = 0;
    std::uint64_t rejected_draining = 0;
    std::uint64_t discarded_stale = 0;
    std::uint64_t discarded_unavailable = 0;
    std::uint64_t dispatched = 0;
    std::uint64_t preempted = 0;
};

struct Dispatch {
    HapticCommand command;
    // Non-zero when this command cancels an overlapping in-flight command on the
    // same target (broadcast overlaps every target). Receivers enforce the
    // cancellation by applying the later command; the id is for logs and stats.
    std::uint64_t preempted_command_id = 0;
};

class EventScheduler {
public:
    explicit EventScheduler(const SchedulerConfigV1& cfg);

    EventScheduler(const EventScheduler&) = delete;
    EventScheduler& operator=(const EventScheduler&) = delete;

    void begin();
    void drain();
    void reset();

    void setPlayerAvailable(bool available);
    bool playerAvailable() const noexcept { return player_available_; }

    // Applies sequence changes (discard / re-schedule) and flushes the paused queue
    // once playback runs again. Called implicitly by submit() and collectDue().
    void observe(const PlaybackState& state, double now_s);

    // Returns false when the impulse was not accepted (draining); queued, late and
    // weak impulses count as accepted and show up in stats().
    bool submit(const ImpulseEvent& impulse, const PlaybackState& state, double now_s);

    // Appends every command due at now_s in non-decreasing dispatch time order.
    std::size_t collectDue(const PlaybackState& state, double now_s, std::vector<Dispatch>* out);

    bool nextDueTime_s(double* out) const;
    std::size_t pendingCount() const noexcept { return pending_.size(); }
    std::size_t queuedCount() const { return paused_queue_.size(); }
    std::vector<ImpulseEvent> queuedImpulses() const { return paused_queue_.snapshot(); }
    std::vector<HapticCommand> pendingCommands() const;

    SchedulerState state() const noexcept { return state_; }
    const SchedulerStats& stats() const noexcept { return stats_; }
    const SchedulerConfigV1& config() const noexcept { return cfg_; }

    // Pure mapping used by scheduleImpulse(); exposed for tests and the monitor.
    static double computeDispatchTime_s(double impulse_ts_s, double position_now_s, double rate, double now_s);

private:
    struct Pending {
        HapticCommand cmd;
        ImpulseEvent impulse;
    };

    enum class Placement { Scheduled, Queued, Dropped };

    Placement scheduleImpulse(const ImpulseEvent& impulse, const PlaybackState& state, double now_s);
    void enqueuePaused(const ImpulseEvent& impulse);
    void insertPending(Pending p);
    std::string targetFor(int channel) const;
    void finishDrainIfEmpty();

    SchedulerConfigV1 cfg_;
    SchedulerState state_ = SchedulerState::Idle;
    SchedulerStats stats_;

    std::deque<Pending> pending_; // sorted by dispatch time, stable
    BoundedQueue<ImpulseEvent> paused_queue_;
    std::map<std::string, HapticCommand> in_flight_;

    bool player_available_ = true;
    bool have_state_ = false;
    std::uint64_t last_sequence_ = 0;
    std::uint64_t last_seek_count_ = 0;
    std::uint64_t next_command_id_ = 1;
};

} // namespace rh
