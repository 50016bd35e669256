#include "EventScheduler.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {

const char* schedulerStateName(SchedulerState s) {
    switch (s) {
    case SchedulerState::Idle:       return "Idle";
    case SchedulerState::Scheduling: return "Scheduling";
    case SchedulerState::Draining:   return "Draining";
    }
    return "Unknown";
}

std::uint32_t computeSchedulerConfigHash(const SchedulerConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.paused_queue_capacity_u32);
    h = fnv1a32_add_f64(h, c.pulse_duration_s);
    h = fnv1a32_add_f64(h, c.intensity_gain);
    h = fnv1a32_add_f64(h, c.min_intensity_0_1);
    h = fnv1a32_add_f64(h, c.max_late_s);
    h = fnv1a32_add_f64(h, c.min_lead_s);
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(c.channel_targets.size()));
    for (const auto& t : c.channel_targets) h = fnv1a32_add_str(h, t);
    return h;
}

double EventScheduler::computeDispatchTime_s(double impulse_ts_s, double position_now_s, double rate, double now_s) {
    if (!(std::abs(rate) > 0.0) || !std::isfinite(rate)) {
        return std::numeric_limits<double>::infinity();
    }
    return now_s + (impulse_ts_s - position_now_s) / rate;
}

EventScheduler::EventScheduler(const SchedulerConfigV1& cfg)
    : cfg_(cfg), paused_queue_(cfg.paused_queue_capacity_u32 > 0 ? cfg.paused_queue_capacity_u32 : 1u) {
    if (!(cfg_.pulse_duration_s > 0.0)) cfg_.pulse_duration_s = kMaxUpdateRate_s;
    if (!std::isfinite(cfg_.intensity_gain) || cfg_.intensity_gain < 0.0) cfg_.intensity_gain = 1.0;
    cfg_.min_intensity_0_1 = clamp01(cfg_.min_intensity_0_1);
    if (!(cfg_.max_late_s >= 0.0)) cfg_.max_late_s = 0.0;
    if (!(cfg_.min_lead_s >= 0.0)) cfg_.min_lead_s = 0.0;
    cfg_.fnv_hash_u32 = computeSchedulerConfigHash(cfg_);
}

void EventScheduler::begin() {
    if (state_ == SchedulerState::Idle) {
        state_ = SchedulerState::Scheduling;
        spdlog::debug("scheduler: Idle -> Scheduling");
    }
}

void EventScheduler::drain() {
    if (state_ != SchedulerState::Scheduling) return;
    state_ = SchedulerState::Draining;
    const std::size_t queued = paused_queue_.size();
    paused_queue_.clear();
    spdlog::debug("scheduler: Scheduling -> Draining ({} pending, {} queued discarded)", pending_.size(), queued);
    finishDrainIfEmpty();
}

void EventScheduler::finishDrainIfEmpty() {
    if (state_ == SchedulerState::Draining && pending_.empty()) {
        state_ = SchedulerState::Idle;
        spdlog::debug("scheduler: Draining -> Idle");
    }
}

void EventScheduler::reset() {
    pending_.clear();
    paused_queue_.clear();
    in_flight_.clear();
    have_state_ = false;
    state_ = SchedulerState::Idle;
}

void EventScheduler::setPlayerAvailable(bool available) {
    if (available == player_available_) return;
    player_available_ = available;
    if (!available) {
        stats_.discarded_unavailable += pending_.size();
        if (!pending_.empty()) {
            spdlog::warn("scheduler: player unavailable, discarding {} pending commands", pending_.size());
        }
        pending_.clear();
        in_flight_.clear();
        finishDrainIfEmpty();
    } else {
        spdlog::info("scheduler: player available again ({} impulses queued)", paused_queue_.size());
    }
}

std::string EventScheduler::targetFor(int channel) const {
    if (channel >= 0 && static_cast<std::size_t>(channel) < cfg_.channel_targets.size()) {
        const std::string& t = cfg_.channel_targets[static_cast<std::size_t>(channel)];
        if (!t.empty()) return t;
    }
    return kBroadcastTarget;
}

void EventScheduler::enqueuePaused(const ImpulseEvent& impulse) {
    bool dropped = false;
    paused_queue_.push(impulse, &dropped);
    ++stats_.queued_paused;
    if (dropped) {
        ++stats_.dropped_overflow;
        spdlog::debug("scheduler: paused queue full, dropped oldest impulse");
    }
}

void EventScheduler::insertPending(Pending p) {
    const double t = p.cmd.dispatch_time_s;
    auto pos = std::upper_bound(pending_.begin(), pending_.end(), t,
                                [](double v, const Pending& e) { return v < e.cmd.dispatch_time_s; });
    pending_.insert(pos, std::move(p));
}

EventScheduler::Placement EventScheduler::scheduleImpulse(const ImpulseEvent& impulse, const PlaybackState& state,
                                                          double now_s) {
    const bool runnable = player_available_ && !state.stale && state.rate != 0.0;
    if (!runnable) {
        enqueuePaused(impulse);
        return Placement::Queued;
    }

    const double pos = state.positionAt(now_s);
    double t = computeDispatchTime_s(impulse.timestamp_s, pos, state.rate, now_s);
    if (!std::isfinite(t) || t < now_s - cfg_.max_late_s) {
        ++stats_.dropped_late;
        return Placement::Dropped;
    }
    t = std::max(t, now_s + cfg_.min_lead_s);

    const double intensity = clamp01(impulse.magnitude_0_1 * cfg_.intensity_gain);
    if (intensity <= 0.0 || intensity < cfg_.min_intensity_0_1) {
        ++stats_.dropped_weak;
        return Placement::Dropped;
    }

    Pending p;
    p.impulse = impulse;
    p.cmd.command_id = next_command_id_++;
    p.cmd.dispatch_time_s = t;
    p.cmd.intensity_0_1 = intensity;
    p.cmd.duration_s = cfg_.pulse_duration_s;
    p.cmd.device_target = targetFor(impulse.channel);
    p.cmd.impulse_timestamp_s = impulse.timestamp_s;
    p.cmd.playback_sequence = state.sequence;
    insertPending(std::move(p));
    ++stats_.scheduled;
    return Placement::Scheduled;
}

void EventScheduler::observe(const PlaybackState& state, double now_s) {
    if (!have_state_) {
        have_state_ = true;
        last_sequence_ = state.sequence;
        last_seek_count_ = state.seek_count;
    } else if (state.sequence != last_sequence_) {
        const bool seek = state.seek_count != last_seek_count_;
        std::vector<ImpulseEvent> carry;
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->cmd.playback_sequence != state.sequence) {
                ++stats_.discarded_stale;
                if (!seek) carry.push_back(it->impulse);
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
        if (seek) {
            const std::size_t queued = paused_queue_.size();
            paused_queue_.clear();
            in_flight_.clear();
            spdlog::debug("scheduler: seek (seq {}), discarded pending and {} queued impulses", state.sequence, queued);
        }
        last_sequence_ = state.sequence;
        last_seek_count_ = state.seek_count;

        for (const auto& imp : carry) {
            if (scheduleImpulse(imp, state, now_s) != Placement::Dropped) ++stats_.rescheduled;
        }
    }

    if (state.end_of_media && state_ == SchedulerState::Scheduling) drain();

    const bool runnable = player_available_ && !state.stale && state.rate != 0.0;
    if (runnable && paused_queue_.size() > 0) {
        for (const auto& imp : paused_queue_.drainAll()) scheduleImpulse(imp, state, now_s);
    }
    finishDrainIfEmpty();
}

bool EventScheduler::submit(const ImpulseEvent& impulse, const PlaybackState& state, double now_s) {
    observe(state, now_s);
    if (state_ == SchedulerState::Draining) {
        ++stats_.rejected_draining;
        return false;
    }
    begin();
    ++stats_.submitted;
    scheduleImpulse(impulse, state, now_s);
    return true;
}

std::size_t EventScheduler::collectDue(const PlaybackState& state, double now_s, std::vector<Dispatch>* out) {
    observe(state, now_s);

    std::size_t n = 0;
    while (!pending_.empty() && pending_.front().cmd.dispatch_time_s <= now_s) {
        Pending p = std::move(pending_.front());
        pending_.pop_front();
        if (p.cmd.playback_sequence != state.sequence) {
            ++stats_.discarded_stale;
            continue;
        }

        Dispatch d;
        d.command = p.cmd;
        // Broadcast overlaps every target; report the most recent overlapping command.
        for (const auto& kv : in_flight_) {
            const bool same_device = p.cmd.isBroadcast() || kv.second.isBroadcast() || kv.first == p.cmd.device_target;
            if (!same_device || kv.second.endTime_s() <= p.cmd.dispatch_time_s) continue;
            d.preempted_command_id = std::max(d.preempted_command_id, kv.second.command_id);
        }
        if (d.preempted_command_id != 0) ++stats_.preempted;
        if (p.cmd.isBroadcast()) in_flight_.clear();
        in_flight_[p.cmd.device_target] = p.cmd;

        ++stats_.dispatched;
        ++n;
        if (out) out->push_back(std::move(d));
    }

    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (it->second.endTime_s() <= now_s) {
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }

    finishDrainIfEmpty();
    return n;
}

bool EventScheduler::nextDueTime_s(double* out) const {
    if (pending_.empty()) return false;
    if (out) *out = pending_.front().cmd.dispatch_time_s;
    return true;
}

std::vector<HapticCommand> EventScheduler::pendingCommands() const {
    std::vector<HapticCommand> v;
    v.reserve(pending_.size());
    for (const auto& p : pending_) v.push_back(p.cmd);
    return v;
}

} // namespace rh
