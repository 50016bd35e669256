#include "PlaybackTracker.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {

namespace {

// Observed property ids (mpv echoes them in property-change events).
constexpr int kObservePause = 1;
constexpr int kObserveSpeed = 2;
constexpr int kObserveSeeking = 3;
constexpr int kObserveEof = 4;

// Request ids. time-pos replies are recognised by id.
constexpr int kRequestTimePos = 1;
constexpr int kRequestControl = 10;

std::string toJsonLine(const Json::Value& v) {
    Json::StreamWriterBuilder w;
    w["indentation"] = "";
    return Json::writeString(w, v);
}

bool parseJsonLine(const std::string& line, Json::Value* out, std::string* errs) {
    Json::CharReaderBuilder b;
    std::unique_ptr<Json::CharReader> reader(b.newCharReader());
    return reader->parse(line.data(), line.data() + line.size(), out, errs);
}

} // namespace

const char* playbackNoticeName(PlaybackNoticeKind k) {
    switch (k) {
    case PlaybackNoticeKind::Seek:              return "Seek";
    case PlaybackNoticeKind::Pause:             return "Pause";
    case PlaybackNoticeKind::Resume:            return "Resume";
    case PlaybackNoticeKind::RateChange:        return "RateChange";
    case PlaybackNoticeKind::EndOfMedia:        return "EndOfMedia";
    case PlaybackNoticeKind::Disconnected:      return "Disconnected";
    case PlaybackNoticeKind::Reconnected:       return "Reconnected";
    case PlaybackNoticeKind::PlayerUnavailable: return "PlayerUnavailable";
    }
    return "Unknown";
}

std::uint32_t computeTrackerConfigHash(const TrackerConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_str(h, c.socket_path);
    h = fnv1a32_add_f64(h, c.reconnect_initial_s);
    h = fnv1a32_add_f64(h, c.reconnect_max_s);
    h = fnv1a32_add_u32(h, c.max_retries_u32);
    h = fnv1a32_add_f64(h, c.sync_period_s);
    h = fnv1a32_add_f64(h, c.seek_skew_s);
    h = fnv1a32_add_u32(h, c.notice_capacity_u32);
    return h;
}

double PlaybackTracker::backoffDelay_s(const TrackerConfigV1& cfg, std::uint32_t attempt) {
    return exponentialBackoff_s(cfg.reconnect_initial_s, cfg.reconnect_max_s, attempt);
}

PlaybackTracker::PlaybackTracker(const TrackerConfigV1& cfg, std::unique_ptr<MediaIpcConnection> ipc)
    : cfg_(cfg), ipc_(std::move(ipc)), notices_(cfg.notice_capacity_u32 > 0 ? cfg.notice_capacity_u32 : 64u) {
    if (!(cfg_.sync_period_s > 0.0)) cfg_.sync_period_s = kMediaSyncRate_s;
    if (!(cfg_.seek_skew_s > 0.0)) cfg_.seek_skew_s = kMediaPositionSkew_s;
    if (cfg_.max_retries_u32 == 0u) cfg_.max_retries_u32 = 1u;
    cfg_.fnv_hash_u32 = computeTrackerConfigHash(cfg_);

    work_.stale = true;
    publish();
}

PlaybackTracker::~PlaybackTracker() { stop(); }

bool PlaybackTracker::start() {
    if (running_.load()) return true;
    if (!ipc_) {
        spdlog::error("playback tracker: no IPC connection configured");
        return false;
    }
    notices_.reopen();
    running_.store(true);
    thread_ = std::thread([this] { run(); });
    return true;
}

void PlaybackTracker::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mu_);
        running_.store(false);
    }
    stop_cv_.notify_all();
    if (thread_.joinable()) thread_.join();
    if (ipc_) ipc_->close();
    notices_.close();
}

std::shared_ptr<const PlaybackState> PlaybackTracker::currentState() const {
    return std::atomic_load(&snapshot_);
}

void PlaybackTracker::publish() {
    std::shared_ptr<const PlaybackState> next = std::make_shared<PlaybackState>(work_);
    std::atomic_store(&snapshot_, next);
}

void PlaybackTracker::notify(PlaybackNoticeKind kind) {
    PlaybackNotice n;
    n.kind = kind;
    n.state = work_;
    bool dropped = false;
    notices_.push(n, &dropped);
    if (dropped) spdlog::debug("playback tracker: notice queue full, dropped oldest");
    spdlog::debug("playback tracker: {} (pos {:.3f}s rate {:.2f} seq {})", playbackNoticeName(kind),
                  work_.position_s, work_.rate, work_.sequence);
}

bool PlaybackTracker::sendCommand(const std::string& json) {
    if (!ipc_ || !ipc_->isConnected()) return false;
    return ipc_->writeLine(json);
}

bool PlaybackTracker::requestPosition() {
    Json::Value req;
    req["command"].append("get_property");
    req["command"].append("time-pos");
    req["request_id"] = kRequestTimePos;
    return sendCommand(toJsonLine(req));
}

void PlaybackTracker::subscribe() {
    const std::pair<int, const char*> props[] = {
        {kObservePause, "pause"},
        {kObserveSpeed, "speed"},
        {kObserveSeeking, "seeking"},
        {kObserveEof, "eof-reached"},
    };
    for (const auto& p : props) {
        Json::Value req;
        req["command"].append("observe_property");
        req["command"].append(p.first);
        req["command"].append(p.second);
        if (!sendCommand(toJsonLine(req))) {
            spdlog::warn("playback tracker: failed to observe '{}'", p.second);
        }
    }
}

bool PlaybackTracker::play() {
    Json::Value req;
    req["command"].append("set_property");
    req["command"].append("pause");
    req["command"].append(false);
    req["request_id"] = kRequestControl;
    return sendCommand(toJsonLine(req));
}

bool PlaybackTracker::pause() {
    Json::Value req;
    req["command"].append("set_property");
    req["command"].append("pause");
    req["command"].append(true);
    req["request_id"] = kRequestControl;
    return sendCommand(toJsonLine(req));
}

bool PlaybackTracker::seek(double position_s) {
    if (!std::isfinite(position_s)) return false;
    Json::Value req;
    req["command"].append("seek");
    req["command"].append(std::max(0.0, position_s));
    req["command"].append("absolute");
    req["request_id"] = kRequestControl;
    return sendCommand(toJsonLine(req));
}

void PlaybackTracker::applyRate(double now_s, PlaybackNoticeKind kind) {
    const double new_rate = (paused_ || work_.end_of_media) ? 0.0 : speed_;
    if (kind != PlaybackNoticeKind::EndOfMedia && new_rate == work_.rate) return;

    work_.position_s = work_.positionAt(now_s);
    work_.captured_at_s = now_s;
    work_.rate = new_rate;
    ++work_.sequence;
    publish();
    notify(kind);
}

void PlaybackTracker::applySeek(double position_s, double now_s) {
    work_.position_s = std::max(0.0, position_s);
    work_.captured_at_s = now_s;
    work_.end_of_media = false;
    work_.rate = paused_ ? 0.0 : speed_;
    ++work_.sequence;
    ++work_.seek_count;
    publish();
    notify(PlaybackNoticeKind::Seek);
}

void PlaybackTracker::applyPosition(double position_s, double now_s) {
    if (awaiting_seek_position_) {
        awaiting_seek_position_ = false;
        applySeek(position_s, now_s);
        return;
    }
    if (seek_in_progress_) return;

    const double expected = work_.positionAt(now_s);
    if (std::abs(position_s - expected) > cfg_.seek_skew_s) {
        spdlog::debug("playback tracker: position {:.3f}s deviates from {:.3f}s, treating as seek", position_s,
                      expected);
        applySeek(position_s, now_s);
        return;
    }
    work_.position_s = position_s;
    work_.captured_at_s = now_s;
    publish();
}

void PlaybackTracker::handleMessage(const std::string& line, double now_s) {
    Json::Value root;
    std::string errs;
    if (!parseJsonLine(line, &root, &errs) || !root.isObject()) {
        spdlog::debug("playback tracker: ignoring malformed IPC line: {}", errs);
        return;
    }

    if (root.isMember("event")) {
        const std::string ev = root["event"].asString();
        if (ev == "property-change") {
            const std::string name = root.get("name", "").asString();
            const Json::Value& data = root["data"];
            if (name == "pause" && data.isBool()) {
                paused_ = data.asBool();
                applyRate(now_s, paused_ ? PlaybackNoticeKind::Pause : PlaybackNoticeKind::Resume);
            } else if (name == "speed" && data.isNumeric()) {
                const double s = data.asDouble();
                if (std::isfinite(s)) {
                    speed_ = s;
                    applyRate(now_s, PlaybackNoticeKind::RateChange);
                }
            } else if (name == "seeking" && data.isBool()) {
                if (data.asBool()) {
                    seek_in_progress_ = true;
                } else if (seek_in_progress_) {
                    seek_in_progress_ = false;
                    awaiting_seek_position_ = true;
                    requestPosition();
                }
            } else if (name == "eof-reached" && data.isBool()) {
                if (data.asBool() && !work_.end_of_media) {
                    work_.end_of_media = true;
                    applyRate(now_s, PlaybackNoticeKind::EndOfMedia);
                } else if (!data.asBool() && work_.end_of_media) {
                    work_.end_of_media = false;
                    applyRate(now_s, paused_ ? PlaybackNoticeKind::Pause : PlaybackNoticeKind::Resume);
                }
            } else if (name == "time-pos" && data.isNumeric()) {
                applyPosition(data.asDouble(), now_s);
            }
        } else if (ev == "seek") {
            seek_in_progress_ = true;
        } else if (ev == "playback-restart") {
            if (seek_in_progress_) {
                seek_in_progress_ = false;
                awaiting_seek_position_ = true;
                requestPosition();
            }
        }
        return;
    }

    if (root.isMember("request_id")) {
        const int id = root["request_id"].asInt();
        const std::string err = root.get("error", "success").asString();
        if (id == kRequestTimePos) {
            // "property unavailable" while no file is loaded.
            if (err != "success" || !root["data"].isNumeric()) return;
            applyPosition(root["data"].asDouble(), now_s);
        } else if (err != "success") {
            spdlog::warn("playback tracker: player rejected request {}: {}", id, err);
        }
    }
}

void PlaybackTracker::handleConnected(double now_s) {
    const bool recovered = (ever_connected_ && disconnect_reported_) || unavailable_.load();
    ever_connected_ = true;
    disconnect_reported_ = false;
    unavailable_.store(false);
    seek_in_progress_ = false;
    // The first position after (re)connecting re-anchors the timeline.
    awaiting_seek_position_ = true;

    work_.stale = false;
    work_.captured_at_s = now_s;
    publish();
    if (recovered) notify(PlaybackNoticeKind::Reconnected);
    spdlog::info("playback tracker: connected to {}", ipc_ ? ipc_->peerName() : std::string("<none>"));
}

void PlaybackTracker::handleDisconnected(double now_s) {
    work_.position_s = work_.positionAt(now_s);
    work_.captured_at_s = now_s;
    work_.stale = true;
    publish();
    if (!disconnect_reported_) {
        disconnect_reported_ = true;
        notify(PlaybackNoticeKind::Disconnected);
        spdlog::warn("playback tracker: lost connection to media player");
    }
}

void PlaybackTracker::handleConnectFailed(std::uint32_t attempt) {
    if (attempt >= cfg_.max_retries_u32 && !unavailable_.load()) {
        unavailable_.store(true);
        work_.stale = true;
        publish();
        notify(PlaybackNoticeKind::PlayerUnavailable);
        spdlog::error("playback tracker: {} after {} attempts ({})", errorCodeName(ErrorCode::PlayerUnavailable),
                      attempt, ipc_ ? ipc_->lastError() : std::string());
    }
}

bool PlaybackTracker::sleepInterruptible(double seconds) {
    std::unique_lock<std::mutex> lock(stop_mu_);
    stop_cv_.wait_for(lock, std::chrono::duration<double>(seconds), [&] { return !running_.load(); });
    return running_.load();
}

void PlaybackTracker::run() {
    std::uint32_t attempt = 0;
    while (running_.load()) {
        if (!ipc_->connect()) {
            ++attempt;
            spdlog::debug("playback tracker: connect attempt {} failed: {}", attempt, ipc_->lastError());
            handleConnectFailed(attempt);
            if (!sleepInterruptible(backoffDelay_s(cfg_, attempt))) break;
            continue;
        }
        attempt = 0;
        handleConnected(monotonicNow_s());
        subscribe();
        requestPosition();

        double next_poll_s = monotonicNow_s() + cfg_.sync_period_s;
        while (running_.load()) {
            const double now_s = monotonicNow_s();
            if (now_s >= next_poll_s) {
                requestPosition();
                next_poll_s = now_s + cfg_.sync_period_s;
            }
            const double wait_s = std::clamp(next_poll_s - now_s, 0.0, 0.1);
            std::string line;
            const LineStream::ReadResult r = ipc_->readLine(&line, wait_s);
            if (r == LineStream::ReadResult::Line) {
                handleMessage(line, monotonicNow_s());
            } else if (r == LineStream::ReadResult::Closed || r == LineStream::ReadResult::Error) {
                break;
            }
        }
        ipc_->close();
        if (!running_.load()) break;
        handleDisconnected(monotonicNow_s());
    }
}

} // namespace rh
