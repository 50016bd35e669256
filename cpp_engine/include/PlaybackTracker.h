#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "BoundedQueue.h"
#include "HapticsTypes.h"
#include "LineStream.h"

namespace rh {

// Connection to the media player's JSON-IPC endpoint.
class MediaIpcConnection : public LineStream {
public:
    virtual bool connect() = 0;
    virtual bool isConnected() const = 0;
};

// mpv --input-ipc-server=<path>
class UnixSocketIpc final : public MediaIpcConnection {
public:
    explicit UnixSocketIpc(std::string path);
    ~UnixSocketIpc() override;

    UnixSocketIpc(const UnixSocketIpc&) = delete;
    UnixSocketIpc& operator=(const UnixSocketIpc&) = delete;

    bool connect() override;
    bool isConnected() const override;
    bool writeLine(const std::string& line) override;
    ReadResult readLine(std::string* out, double timeout_s) override;
    void close() override;
    std::string peerName() const override { return path_; }
    std::string lastError() const override;

private:
    std::string path_;
    mutable std::mutex write_mu_;
    mutable std::mutex err_mu_;
    std::atomic<int> fd_{-1};
    LineBuffer rx_;
    std::string last_error_;

    void setError(const std::string& e);
};

struct TrackerConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(TrackerConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::string socket_path = "/tmp/remote-haptics-mpv.sock";

    // Reconnect backoff: initial, doubling per failed attempt, capped.
    double reconnect_initial_s = 0.25;
    double reconnect_max_s = 8.0;
    // Failed attempts before PlayerUnavailable is published (retries continue).
    std::uint32_t max_retries_u32 = 8;

    double sync_period_s = kMediaSyncRate_s;
    double seek_skew_s = kMediaPositionSkew_s;
    std::uint32_t notice_capacity_u32 = 64;
};

std::uint32_t computeTrackerConfigHash(const TrackerConfigV1& c);

enum class PlaybackNoticeKind : std::uint32_t {
    Seek = 0,
    Pause,
    Resume,
    RateChange,
    EndOfMedia,
    Disconnected,
    Reconnected,
    PlayerUnavailable,
};

const char* playbackNoticeName(PlaybackNoticeKind k);

struct PlaybackNotice {
    PlaybackNoticeKind kind = PlaybackNoticeKind::Seek;
    PlaybackState state;
};

// ============================================================
// Playback position tracker
//
// Single writer (the tracker thread, or a test calling handle*()),
// many readers via currentState(). Observes pause/speed/seeking/eof-reached,
// polls time-pos every sync period and treats a deviation beyond the skew
// allowance as a seek.
// ============================================================
class PlaybackTracker {
public:
    PlaybackTracker(const TrackerConfigV1& cfg, std::unique_ptr<MediaIpcConnection> ipc);
    ~PlaybackTracker();

    PlaybackTracker(const PlaybackTracker&) = delete;
    PlaybackTracker& operator=(const PlaybackTracker&) = delete;

    bool start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Non-blocking; never null.
    std::shared_ptr<const PlaybackState> currentState() const;

    bool pollNotice(PlaybackNotice* out) { return notices_.tryPop(out); }
    bool waitNotice(PlaybackNotice* out, double timeout_s) { return notices_.popFor(out, timeout_s); }

    // Transport control over the same IPC connection. False when not connected.
    bool play();
    bool pause();
    bool seek(double position_s);

    // Protocol handlers, driven by the tracker thread.
    void handleConnected(double now_s);
    void handleMessage(const std::string& line, double now_s);
    void handleDisconnected(double now_s);
    void handleConnectFailed(std::uint32_t attempt);

    bool playerUnavailable() const noexcept { return unavailable_.load(); }
    const TrackerConfigV1& config() const noexcept { return cfg_; }

    static double backoffDelay_s(const TrackerConfigV1& cfg, std::uint32_t attempt);

private:
    void run();
    bool sendCommand(const std::string& json);
    bool requestPosition();
    void subscribe();
    void publish();
    void notify(PlaybackNoticeKind kind);
    void applyRate(double now_s, PlaybackNoticeKind kind);
    void applySeek(double position_s, double now_s);
    void applyPosition(double position_s, double now_s);
    bool sleepInterruptible(double seconds);

    TrackerConfigV1 cfg_;
    std::unique_ptr<MediaIpcConnection> ipc_;
    BoundedQueue<PlaybackNotice> notices_;

    std::shared_ptr<const PlaybackState> snapshot_;

    // Tracker-thread working state.
    PlaybackState work_;
    bool paused_ = true;
    double speed_ = 1.0;
    bool seek_in_progress_ = false;
    bool awaiting_seek_position_ = false;
    bool ever_connected_ = false;
    bool disconnect_reported_ = false;

    std::atomic<bool> unavailable_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
};

} // namespace rh
