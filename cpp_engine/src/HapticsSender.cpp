#include "HapticsSender.h"

#include <algorithm>
#include <chrono>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {

namespace {
constexpr double kIdleWait_s = 0.01;
}

std::uint32_t computeSenderPipelineConfigHash(const SenderPipelineConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_f64(h, c.lookahead_s);
    h = fnv1a32_add_u32(h, c.impulse_queue_capacity_u32);
    return h;
}

HapticsSender::HapticsSender(const SenderPipelineConfigV1& cfg, const ImpulseDetectorConfigV1& detector,
                             const SchedulerConfigV1& scheduler, AudioSource& source, PlaybackTracker* tracker,
                             DispatchSink sink)
    : cfg_(cfg),
      source_(source),
      tracker_(tracker),
      sink_(std::move(sink)),
      extractor_(source, detector),
      scheduler_(scheduler),
      impulses_(cfg.impulse_queue_capacity_u32 ? cfg.impulse_queue_capacity_u32 : 256u) {
    if (!(cfg_.lookahead_s > 0.0)) cfg_.lookahead_s = 1.0;
    cfg_.fnv_hash_u32 = computeSenderPipelineConfigHash(cfg_);
}

HapticsSender::~HapticsSender() { stop(); }

bool HapticsSender::start() {
    if (running_.load()) return true;
    if (!sink_) {
        std::lock_guard<std::mutex> lock(stats_mu_);
        last_error_ = ErrorCode::ConfigError;
        last_error_text_ = "no dispatch sink";
        return false;
    }

    clock_origin_s_ = monotonicNow_s();
    impulses_.reopen();
    requestRestart(0.0);

    running_.store(true);
    extract_thread_ = std::thread([this] { extractionLoop(); });
    schedule_thread_ = std::thread([this] { schedulingLoop(); });
    spdlog::info("sender: pipeline started ({} source, {})", source_.isLive() ? "live" : "file",
                 tracker_ ? "player clock" : "own clock");
    return true;
}

void HapticsSender::stop() {
    if (!running_.exchange(false)) return;
    source_.interrupt();
    impulses_.close();
    if (extract_thread_.joinable()) extract_thread_.join();
    if (schedule_thread_.joinable()) schedule_thread_.join();
    spdlog::info("sender: pipeline stopped");
}

SenderStats HapticsSender::stats() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return stats_;
}

ErrorCode HapticsSender::lastError() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return last_error_;
}

std::string HapticsSender::lastErrorText() const {
    std::lock_guard<std::mutex> lock(stats_mu_);
    return last_error_text_;
}

PlaybackState HapticsSender::mediaState(double /*now_s*/) const {
    if (tracker_) return *tracker_->currentState();
    PlaybackState s;
    s.position_s = 0.0;
    s.rate = 1.0;
    s.captured_at_s = clock_origin_s_;
    return s;
}

void HapticsSender::requestRestart(double offset_s) {
    std::lock_guard<std::mutex> lock(restart_mu_);
    restart_pending_ = true;
    restart_offset_s_ = offset_s;
    epoch_.fetch_add(1);
    impulses_.clear();
}

bool HapticsSender::waitForWork(double seconds) {
    if (!running_.load()) return false;
    std::this_thread::sleep_for(std::chrono::duration<double>(std::max(seconds, 0.001)));
    return running_.load();
}

void HapticsSender::extractionLoop() {
    std::uint64_t epoch = 0;
    bool idle = true;

    while (running_.load()) {
        bool restart = false;
        double offset_s = 0.0;
        {
            std::lock_guard<std::mutex> lock(restart_mu_);
            if (restart_pending_) {
                restart = true;
                offset_s = restart_offset_s_;
                epoch = epoch_.load();
                restart_pending_ = false;
            }
        }
        if (restart) {
            const bool ok = extractor_.restart(offset_s);
            std::lock_guard<std::mutex> lock(stats_mu_);
            if (ok) {
                ++stats_.passes;
                stats_.extraction_finished = false;
                idle = false;
            } else {
                ++stats_.extraction_errors;
                last_error_ = extractor_.lastError();
                last_error_text_ = extractor_.lastErrorText();
                idle = true;
            }
        }
        if (idle) {
            waitForWork(kIdleWait_s);
            continue;
        }

        if (!source_.isLive()) {
            const double now_s = monotonicNow_s();
            const double ahead_s = extractor_.consumedTime_s() - mediaState(now_s).positionAt(now_s);
            if (ahead_s > cfg_.lookahead_s) {
                waitForWork(std::min(ahead_s - cfg_.lookahead_s, 2.0 * kIdleWait_s));
                continue;
            }
        }

        ImpulseEvent ev;
        const ExtractStatus st = extractor_.nextImpulse(&ev);
        if (st == ExtractStatus::Impulse) {
            TaggedImpulse t;
            t.impulse = ev;
            t.epoch = epoch;
            bool dropped = false;
            impulses_.push(t, &dropped);
            if (dropped) spdlog::debug("sender: impulse queue full, oldest impulse dropped");
            std::lock_guard<std::mutex> lock(stats_mu_);
            ++stats_.impulses_extracted;
        } else if (st == ExtractStatus::EndOfStream) {
            idle = true;
            std::lock_guard<std::mutex> lock(stats_mu_);
            stats_.extraction_finished = true;
            spdlog::info("sender: extraction reached end of audio at {:.3f}s", extractor_.consumedTime_s());
        } else {
            idle = true;
            std::lock_guard<std::mutex> lock(stats_mu_);
            ++stats_.extraction_errors;
            last_error_ = extractor_.lastError();
            last_error_text_ = extractor_.lastErrorText();
        }
    }
}

void HapticsSender::handleNotice(const PlaybackNotice& n) {
    spdlog::debug("sender: playback notice {} at {:.3f}s (seq {})", playbackNoticeName(n.kind), n.state.position_s,
                  n.state.sequence);
    switch (n.kind) {
    case PlaybackNoticeKind::Seek:
        requestRestart(n.state.positionAt(monotonicNow_s()));
        break;
    case PlaybackNoticeKind::PlayerUnavailable:
        scheduler_.setPlayerAvailable(false);
        break;
    case PlaybackNoticeKind::Reconnected:
        scheduler_.setPlayerAvailable(true);
        break;
    case PlaybackNoticeKind::EndOfMedia:
        spdlog::info("sender: end of media, draining schedule");
        break;
    default:
        break;
    }
}

void HapticsSender::schedulingLoop() {
    scheduler_.begin();
    const bool live = source_.isLive();
    std::vector<Dispatch> due;

    while (running_.load()) {
        if (tracker_) {
            PlaybackNotice n;
            while (tracker_->pollNotice(&n)) handleNotice(n);
        }

        const double now_s = monotonicNow_s();
        const PlaybackState state = mediaState(now_s);
        const std::uint64_t epoch = epoch_.load();

        std::uint64_t superseded = 0;
        for (const TaggedImpulse& t : impulses_.drainAll()) {
            if (t.epoch != epoch) {
                ++superseded;
                continue;
            }
            if (live) {
                PlaybackState at = state;
                at.position_s = t.impulse.timestamp_s;
                at.captured_at_s = now_s;
                scheduler_.submit(t.impulse, at, now_s);
            } else {
                scheduler_.submit(t.impulse, state, now_s);
            }
        }

        due.clear();
        scheduler_.collectDue(state, now_s, &due);
        std::uint64_t delivered = 0;
        std::uint64_t unrouted = 0;
        for (const Dispatch& d : due) {
            if (sink_(d) > 0) {
                ++delivered;
            } else {
                ++unrouted;
            }
        }

        {
            std::lock_guard<std::mutex> lock(stats_mu_);
            stats_.impulses_superseded += superseded;
            stats_.commands_delivered += delivered;
            stats_.commands_unrouted += unrouted;
            stats_.scheduler = scheduler_.stats();
            stats_.scheduler_state = scheduler_.state();
        }

        double wait_s = kMaxUpdateRate_s;
        double next_s = 0.0;
        if (scheduler_.nextDueTime_s(&next_s)) wait_s = std::clamp(next_s - monotonicNow_s(), 0.0, kMaxUpdateRate_s);
        if (!waitForWork(wait_s)) break;
    }
}

} // namespace rh
