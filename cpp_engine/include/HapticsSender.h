#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "BoundedQueue.h"
#include "EventScheduler.h"
#include "HapticsTypes.h"
#include "ImpulseExtractor.h"
#include "PlaybackTracker.h"

namespace rh {

// ============================================================
// Sender pipeline
//
// extraction thread:  AudioSource -> ImpulseExtractor -> impulse queue
// scheduling thread:  impulse queue + tracker snapshot/notices -> EventScheduler -> sink
//
// Media clock:
// - With a tracker: the player's PlaybackState. Extraction stays at most lookahead_s
//   ahead of the playback position and restarts at the new position on every seek.
// - Without a tracker, file sources follow the sender's own clock from start().
// - Live sources dispatch each impulse as soon as it is detected.
// ============================================================

struct SenderPipelineConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(SenderPipelineConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    double lookahead_s = 1.0;
    std::uint32_t impulse_queue_capacity_u32 = 256;
};

std::uint32_t computeSenderPipelineConfigHash(const SenderPipelineConfigV1& c);

struct SenderStats {
    std::uint64_t impulses_extracted = 0;
    std::uint64_t impulses_superseded = 0; // produced by a pass a seek replaced
    std::uint64_t passes = 0;
    std::uint64_t extraction_errors = 0;
    std::uint64_t commands_delivered = 0;
    std::uint64_t commands_unrouted = 0;
    bool extraction_finished = false;
    SchedulerState scheduler_state = SchedulerState::Idle;
    SchedulerStats scheduler;
};

class HapticsSender {
public:
    // Returns the number of receivers the command was routed to.
    using DispatchSink = std::function<std::size_t(const Dispatch&)>;

    // tracker may be null. source and tracker must outlive the sender.
    HapticsSender(const SenderPipelineConfigV1& cfg, const ImpulseDetectorConfigV1& detector,
                  const SchedulerConfigV1& scheduler, AudioSource& source, PlaybackTracker* tracker,
                  DispatchSink sink);
    ~HapticsSender();

    HapticsSender(const HapticsSender&) = delete;
    HapticsSender& operator=(const HapticsSender&) = delete;

    bool start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Monotonic time at which the sender's own media clock reads 0.
    double clockOrigin_s() const noexcept { return clock_origin_s_; }

    SenderStats stats() const;
    ErrorCode lastError() const;
    std::string lastErrorText() const;

    const SenderPipelineConfigV1& config() const noexcept { return cfg_; }

private:
    struct TaggedImpulse {
        ImpulseEvent impulse;
        std::uint64_t epoch = 0;
    };

    void extractionLoop();
    void schedulingLoop();
    PlaybackState mediaState(double now_s) const;
    void handleNotice(const PlaybackNotice& n);
    void requestRestart(double offset_s);
    bool waitForWork(double seconds);

    SenderPipelineConfigV1 cfg_;
    AudioSource& source_;
    PlaybackTracker* tracker_ = nullptr;
    DispatchSink sink_;

    ImpulseExtractor extractor_;   // extraction thread only
    EventScheduler scheduler_;     // scheduling thread only
    BoundedQueue<TaggedImpulse> impulses_;

    std::atomic<bool> running_{false};
    std::thread extract_thread_;
    std::thread schedule_thread_;
    double clock_origin_s_ = 0.0;

    // Seek restarts, handed from the scheduling to the extraction thread.
    std::mutex restart_mu_;
    bool restart_pending_ = false;
    double restart_offset_s_ = 0.0;
    std::atomic<std::uint64_t> epoch_{0};

    mutable std::mutex stats_mu_;
    SenderStats stats_;
    ErrorCode last_error_ = ErrorCode::None;
    std::string last_error_text_;
};

} // namespace rh
