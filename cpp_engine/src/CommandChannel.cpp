#include "CommandChannel.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "../device/haptic_device.h"
#include "ConfigHash.h"
#include "WireProtocol.h"

namespace rh {

namespace {

// Session threads wait this long for inbound lines between outbound drains.
constexpr double kSessionPoll_s = 0.005;
constexpr double kClientPoll_s = 0.25;

void accumulate(ReceiverStats* into, const ReceiverStats& s) {
    into->connections += s.connections;
    into->device_resets += s.device_resets;
    into->commands_received += s.commands_received;
    into->commands_malformed += s.commands_malformed;
    into->preemptions += s.preemptions;
    into->acks.merge(s.acks);
}

} // namespace

std::uint32_t computeServerChannelConfigHash(const ServerChannelConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_str(h, c.bind_address);
    h = fnv1a32_add_i32(h, c.port_i32);
    h = fnv1a32_add_str(h, c.cert_file);
    h = fnv1a32_add_str(h, c.key_file);
    h = fnv1a32_add_u32(h, c.insecure_u32);
    h = fnv1a32_add_f64(h, c.handshake_timeout_s);
    h = fnv1a32_add_f64(h, c.ack_timeout_s);
    h = fnv1a32_add_u32(h, c.session_queue_capacity_u32);
    h = fnv1a32_add_u32(h, c.max_sessions_u32);
    return h;
}

std::uint32_t computeClientChannelConfigHash(const ClientChannelConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_str(h, c.host);
    h = fnv1a32_add_i32(h, c.port_i32);
    h = fnv1a32_add_str(h, c.ca_file);
    h = fnv1a32_add_str(h, normalizeFingerprint(c.pinned_sha256));
    h = fnv1a32_add_u32(h, c.insecure_u32);
    h = fnv1a32_add_f64(h, c.connect_timeout_s);
    h = fnv1a32_add_f64(h, c.handshake_timeout_s);
    h = fnv1a32_add_f64(h, c.reconnect_initial_s);
    h = fnv1a32_add_f64(h, c.reconnect_max_s);
    h = fnv1a32_add_u32(h, c.max_reconnects_u32);
    h = fnv1a32_add_f64(h, c.stale_after_s);
    return h;
}

void AckCounters::add(AckStatus s) {
    switch (s) {
    case AckStatus::Ok:            ++ok; break;
    case AckStatus::DeviceError:   ++device_error; break;
    case AckStatus::UnknownTarget: ++unknown_target; break;
    case AckStatus::Stale:         ++stale; break;
    }
}

void AckCounters::merge(const AckCounters& o) {
    ok += o.ok;
    device_error += o.device_error;
    unknown_target += o.unknown_target;
    stale += o.stale;
}

// ---- SenderSession ----

SenderSession::SenderSession(std::uint64_t session_id, std::string peer, std::string fingerprint) {
    info_.session_id = session_id;
    info_.peer = std::move(peer);
    info_.certificate_fingerprint = std::move(fingerprint);
    info_.state = ConnectionState::Connecting;
}

std::vector<std::string> SenderSession::onLine(const std::string& line, bool* close_requested) {
    std::vector<std::string> replies;
    if (line.empty()) return replies;

    if (line == wire::kVersionQuery) {
        if (info_.state == ConnectionState::VersionCheck) info_.state = ConnectionState::DevicesSet;
        replies.push_back(wire::versionReply());
    } else if (wire::startsWith(line, wire::kDevicesPrefix)) {
        std::vector<std::string> targets;
        if (info_.state == ConnectionState::VersionCheck || !wire::parseDevices(line, &targets)) {
            replies.push_back(wire::kInvalidRequest);
        } else {
            targets_ = std::move(targets);
            info_.state = ConnectionState::Active;
            replies.push_back(wire::kAck);
        }
    } else if (wire::startsWith(line, wire::kAckPrefix)) {
        std::uint64_t id = 0;
        AckStatus status = AckStatus::Ok;
        if (!wire::parseAck(line, &id, &status)) {
            replies.push_back(wire::kInvalidRequest);
        } else if (awaiting_.erase(id) > 0) {
            acks_.add(status);
            info_.last_acked_command_id = std::max(info_.last_acked_command_id, id);
            if (status != AckStatus::Ok) {
                spdlog::warn("channel: session {} command {} acknowledged {}", info_.session_id, id,
                             ackStatusName(status));
            }
        } else {
            spdlog::debug("channel: session {} late ack for command {}", info_.session_id, id);
        }
    } else if (line == wire::kHelp) {
        replies.push_back(wire::helpText());
    } else if (line == wire::kQuit) {
        if (close_requested) *close_requested = true;
    } else {
        replies.push_back(wire::kInvalidRequest);
    }
    return replies;
}

bool SenderSession::accepts(const HapticCommand& cmd) const {
    if (info_.state != ConnectionState::Active) return false;
    if (cmd.isBroadcast()) return true;
    return std::find(targets_.begin(), targets_.end(), cmd.device_target) != targets_.end();
}

void SenderSession::noteSent(std::uint64_t command_id, double now_s) { awaiting_[command_id] = now_s; }

std::vector<std::uint64_t> SenderSession::expireAcks(double now_s, double timeout_s) {
    std::vector<std::uint64_t> expired;
    for (auto it = awaiting_.begin(); it != awaiting_.end();) {
        if (now_s - it->second > timeout_s) {
            expired.push_back(it->first);
            it = awaiting_.erase(it);
        } else {
            ++it;
        }
    }
    return expired;
}

// ---- ChannelServer ----

ChannelServer::ChannelServer(const ServerChannelConfigV1& cfg) : cfg_(cfg) {
    if (!(cfg_.handshake_timeout_s > 0.0)) cfg_.handshake_timeout_s = 5.0;
    if (!(cfg_.ack_timeout_s > 0.0)) cfg_.ack_timeout_s = 1.0;
    if (cfg_.session_queue_capacity_u32 == 0u) cfg_.session_queue_capacity_u32 = 64u;
    if (cfg_.max_sessions_u32 == 0u) cfg_.max_sessions_u32 = 1u;
    cfg_.fnv_hash_u32 = computeServerChannelConfigHash(cfg_);
}

ChannelServer::~ChannelServer() { stop(); }

bool ChannelServer::start(std::string* err) {
    if (running_.load()) return true;
    ignoreSigpipe();

    if (cfg_.insecure_u32) {
        spdlog::warn("channel: insecure mode, commands travel over plain TCP");
    } else {
        tls_ = TlsContext::createServer(cfg_.cert_file, cfg_.key_file, err);
        if (!tls_) return false;
        spdlog::info("channel: receivers are not asked for client certificates");
    }

    listen_fd_ = tcpListen(cfg_.bind_address, cfg_.port_i32, &bound_port_, err);
    if (listen_fd_ < 0) return false;

    running_.store(true);
    accept_thread_ = std::thread([this] { acceptLoop(); });
    spdlog::info("channel: listening on port {} ({})", bound_port_, cfg_.insecure_u32 ? "plain TCP" : "TLS");
    return true;
}

void ChannelServer::stop() {
    running_.store(false);
    if (accept_thread_.joinable()) accept_thread_.join();
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::map<std::uint64_t, std::shared_ptr<Slot>> slots;
    {
        std::lock_guard<std::mutex> lock(mu_);
        slots.swap(slots_);
    }
    for (auto& kv : slots) {
        Slot& s = *kv.second;
        {
            std::lock_guard<std::mutex> lock(s.mu);
            if (s.stream) s.stream->close();
        }
        s.queue.close();
        if (s.thread.joinable()) s.thread.join();
    }
}

void ChannelServer::reapFinished() {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (it->second->done.load()) {
            if (it->second->thread.joinable()) it->second->thread.join();
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

void ChannelServer::acceptLoop() {
    while (running_.load()) {
        reapFinished();

        std::string peer;
        std::string err;
        const int fd = tcpAccept(listen_fd_, 0.2, &peer, &err);
        if (fd < 0) {
            if (!err.empty()) spdlog::warn("channel: accept failed: {}", err);
            continue;
        }

        std::lock_guard<std::mutex> lock(mu_);
        if (slots_.size() >= cfg_.max_sessions_u32) {
            ++stats_.sessions_rejected;
            ::close(fd);
            spdlog::warn("channel: rejecting {} (session limit {})", peer, cfg_.max_sessions_u32);
            continue;
        }
        const std::uint64_t id = next_session_id_++;
        auto slot = std::make_shared<Slot>(cfg_.session_queue_capacity_u32);
        slot->pending_fd = fd;
        slot->peer = peer;
        slot->session = std::make_unique<SenderSession>(id, peer, std::string());
        slots_[id] = slot;
        ++stats_.sessions_accepted;
        spdlog::info("channel: session {} from {}", id, peer);
        slot->thread = std::thread([this, slot] { runSession(slot); });
    }
}

void ChannelServer::runSession(std::shared_ptr<Slot> slot) {
    std::uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        id = slot->session->info().session_id;
    }

    std::string err;
    std::unique_ptr<SocketLineStream> stream;
    if (tls_) {
        stream = SocketLineStream::acceptTls(*tls_, slot->pending_fd, slot->peer, cfg_.handshake_timeout_s, &err);
    } else {
        stream = SocketLineStream::wrapPlain(slot->pending_fd, slot->peer);
    }
    slot->pending_fd = -1;

    if (!stream) {
        {
            std::lock_guard<std::mutex> lock(slot->mu);
            slot->session->setState(ConnectionState::Error);
        }
        {
            std::lock_guard<std::mutex> lock(mu_);
            ++stats_.handshake_failures;
        }
        spdlog::warn("channel: session {} {}: {}", id, errorCodeName(ErrorCode::HandshakeFailed), err);
        slot->done.store(true);
        return;
    }

    SocketLineStream* s = stream.get();
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        slot->session->setFingerprint(stream->peerFingerprint());
        slot->session->setState(ConnectionState::VersionCheck);
        slot->stream = std::move(stream);
    }

    bool reset = false;
    bool quit = false;
    while (running_.load() && !quit && !reset) {
        Outbound ob;
        while (slot->queue.tryPop(&ob)) {
            if (!s->writeLine(wire::encodeCommand(ob.cmd, ob.wall_dispatch_s))) {
                reset = true;
                break;
            }
            {
                std::lock_guard<std::mutex> lock(slot->mu);
                slot->session->noteSent(ob.cmd.command_id, monotonicNow_s());
            }
            std::lock_guard<std::mutex> lock(mu_);
            ++stats_.commands_sent;
        }
        if (reset) break;

        std::string line;
        const LineStream::ReadResult r = s->readLine(&line, kSessionPoll_s);
        if (r == LineStream::ReadResult::Line) {
            std::vector<std::string> replies;
            {
                std::lock_guard<std::mutex> lock(slot->mu);
                replies = slot->session->onLine(line, &quit);
            }
            for (const auto& reply : replies) {
                if (!s->writeLine(reply)) {
                    reset = true;
                    break;
                }
            }
        } else if (r == LineStream::ReadResult::Closed || r == LineStream::ReadResult::Error) {
            reset = true;
        }

        std::vector<std::uint64_t> expired;
        {
            std::lock_guard<std::mutex> lock(slot->mu);
            expired = slot->session->expireAcks(monotonicNow_s(), cfg_.ack_timeout_s);
        }
        if (!expired.empty()) {
            {
                std::lock_guard<std::mutex> lock(mu_);
                stats_.ack_timeouts += expired.size();
            }
            for (std::uint64_t cid : expired) {
                spdlog::warn("channel: session {} {} waiting for ack of command {}", id,
                             errorCodeName(ErrorCode::Timeout), cid);
            }
        }
    }

    if (reset && running_.load()) {
        spdlog::warn("channel: session {} {} ({})", id, errorCodeName(ErrorCode::ConnectionReset),
                     s->lastError().empty() ? std::string("peer closed") : s->lastError());
    }
    s->close();

    AckCounters acks;
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(slot->mu);
        slot->session->setState(ConnectionState::Disconnected);
        acks = slot->session->acks();
        dropped = slot->queue.size();
    }
    slot->queue.close();
    slot->queue.clear();
    {
        std::lock_guard<std::mutex> lock(mu_);
        stats_.acks.merge(acks);
        stats_.commands_dropped += dropped;
        if (reset && running_.load()) ++stats_.connection_resets;
    }
    spdlog::info("channel: session {} closed ({} queued commands discarded)", id, dropped);
    slot->done.store(true);
}

std::size_t ChannelServer::dispatch(const HapticCommand& cmd) {
    Outbound ob;
    ob.cmd = cmd;
    ob.wall_dispatch_s = wallNow_s() + (cmd.dispatch_time_s - monotonicNow_s());

    std::lock_guard<std::mutex> lock(mu_);
    std::size_t n = 0;
    for (auto& kv : slots_) {
        Slot& s = *kv.second;
        if (s.done.load()) continue;
        bool accepts = false;
        {
            std::lock_guard<std::mutex> slock(s.mu);
            accepts = s.session->accepts(cmd);
        }
        if (!accepts) continue;
        bool dropped = false;
        if (s.queue.push(ob, &dropped)) {
            ++n;
            if (dropped) ++stats_.commands_dropped;
        }
    }
    if (n == 0) {
        ++stats_.commands_unrouted;
    } else {
        ++stats_.commands_routed;
    }
    return n;
}

std::vector<SessionInfo> ChannelServer::sessions() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<SessionInfo> out;
    for (const auto& kv : slots_) {
        std::lock_guard<std::mutex> slock(kv.second->mu);
        out.push_back(kv.second->session->info());
    }
    return out;
}

std::size_t ChannelServer::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::size_t n = 0;
    for (const auto& kv : slots_) {
        std::lock_guard<std::mutex> slock(kv.second->mu);
        if (kv.second->session->state() == ConnectionState::Active) ++n;
    }
    return n;
}

ChannelServerStats ChannelServer::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    ChannelServerStats out = stats_;
    for (const auto& kv : slots_) {
        if (kv.second->done.load()) continue;
        std::lock_guard<std::mutex> slock(kv.second->mu);
        if (kv.second->session->state() != ConnectionState::Disconnected) out.acks.merge(kv.second->session->acks());
    }
    return out;
}

// ---- ReceiverSession ----

ReceiverSession::ReceiverSession(device::DeviceRegistry& devices, double stale_after_s)
    : devices_(devices), stale_after_s_(stale_after_s > 0.0 ? stale_after_s : 0.0) {}

std::vector<std::string> ReceiverSession::begin() {
    devices_.resetAll();
    ++stats_.device_resets;
    state_ = ConnectionState::VersionCheck;
    return {wire::kVersionQuery};
}

std::vector<std::string> ReceiverSession::onLine(const std::string& line, double wall_now_s, double mono_now_s,
                                                 bool* fatal) {
    std::vector<std::string> out;
    if (line.empty()) return out;

    switch (state_) {
    case ConnectionState::VersionCheck:
        if (wire::startsWith(line, wire::kProtocolName)) {
            if (!wire::isCompatibleVersion(line)) {
                failure_ = "incompatible server version '" + line + "', expected '" + wire::versionReply() + "'";
                state_ = ConnectionState::Error;
                if (fatal) *fatal = true;
                return out;
            }
            state_ = ConnectionState::DevicesSet;
            out.push_back(wire::encodeDevices(devices_.targets()));
        } else {
            spdlog::debug("channel: ignoring '{}' before version check", line);
        }
        return out;

    case ConnectionState::DevicesSet:
        if (line == wire::kAck) {
            state_ = ConnectionState::Active;
            spdlog::info("channel: session active");
        } else if (line == wire::kInvalidRequest) {
            failure_ = "server rejected announced device targets";
            state_ = ConnectionState::Error;
            if (fatal) *fatal = true;
        }
        return out;

    case ConnectionState::Active:
        break;

    default:
        return out;
    }

    if (wire::startsWith(line, wire::kCommandPrefix)) {
        HapticCommand cmd;
        if (!wire::parseCommand(line, &cmd)) {
            ++stats_.commands_malformed;
            spdlog::warn("channel: malformed command '{}'", line);
            return out;
        }
        ++stats_.commands_received;

        AckStatus status = AckStatus::Ok;
        if (stale_after_s_ > 0.0 && wall_now_s - cmd.dispatch_time_s > stale_after_s_) {
            status = AckStatus::Stale;
        } else {
            const device::ApplyResult r = devices_.apply(cmd, mono_now_s);
            stats_.preemptions += r.preempted_command_ids.size();
            status = r.status;
            if (recorder_ && r.devices_applied_u32 > 0) recorder_->recordCommand(cmd, wall_now_s);
        }
        stats_.acks.add(status);
        out.push_back(wire::encodeAck(cmd.command_id, status));
    } else if (line == wire::kInvalidRequest) {
        spdlog::warn("channel: server reported an invalid request");
    }
    return out;
}

// ---- ChannelClient ----

ChannelClient::ChannelClient(const ClientChannelConfigV1& cfg, device::DeviceRegistry& devices,
                             const RecordingConfigV1& recording)
    : cfg_(cfg), recording_(recording), devices_(devices) {
    if (!(cfg_.connect_timeout_s > 0.0)) cfg_.connect_timeout_s = 5.0;
    if (!(cfg_.handshake_timeout_s > 0.0)) cfg_.handshake_timeout_s = 5.0;
    cfg_.fnv_hash_u32 = computeClientChannelConfigHash(cfg_);
}

void ChannelClient::setState(ConnectionState s) {
    std::lock_guard<std::mutex> lock(mu_);
    state_ = s;
}

ConnectionState ChannelClient::state() const {
    std::lock_guard<std::mutex> lock(mu_);
    return state_;
}

std::string ChannelClient::lastErrorText() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_error_text_;
}

void ChannelClient::publishStats(const ReceiverStats& live) {
    std::lock_guard<std::mutex> lock(mu_);
    live_ = live;
}

void ChannelClient::retireStats(const ReceiverStats& finished) {
    std::lock_guard<std::mutex> lock(mu_);
    accumulate(&retired_, finished);
    live_ = ReceiverStats();
}

ReceiverStats ChannelClient::stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    ReceiverStats out = retired_;
    accumulate(&out, live_);
    return out;
}

bool ChannelClient::sleepWhileRunning(double seconds, const std::atomic<bool>& running) {
    const double until_s = monotonicNow_s() + seconds;
    while (running.load()) {
        const double left_s = until_s - monotonicNow_s();
        if (left_s <= 0.0) return true;
        std::this_thread::sleep_for(std::chrono::duration<double>(std::min(left_s, 0.05)));
    }
    return false;
}

ChannelClient::SessionEnd ChannelClient::serveConnection(SocketLineStream& stream, const std::atomic<bool>& running,
                                                         bool* reached_active) {
    std::unique_ptr<SessionRecorder> recorder;
    if (recording_.enabled_u32) {
        recorder = std::make_unique<SessionRecorder>(recording_);
        std::string err;
        if (recorder->openForPeer(cfg_.host, wallNow_s(), &err)) {
            spdlog::info("recording: writing '{}'", recorder->path());
        } else {
            spdlog::warn("recording: {}", err);
            recorder.reset();
        }
    }

    ReceiverSession session(devices_, cfg_.stale_after_s);
    session.setRecorder(recorder.get());

    for (const auto& line : session.begin()) {
        if (!stream.writeLine(line)) {
            retireStats(session.stats());
            return SessionEnd::Reset;
        }
    }
    setState(session.state());
    publishStats(session.stats());

    const double rediscover_period_s = std::max(0.5, devices_.config().rediscover_period_s);
    double next_rediscover_s = monotonicNow_s() + rediscover_period_s;

    while (running.load()) {
        std::string line;
        const LineStream::ReadResult r = stream.readLine(&line, kClientPoll_s);
        if (r == LineStream::ReadResult::Line) {
            bool fatal = false;
            const std::vector<std::string> replies = session.onLine(line, wallNow_s(), monotonicNow_s(), &fatal);
            if (fatal) {
                {
                    std::lock_guard<std::mutex> lock(mu_);
                    last_error_text_ = session.failure();
                }
                spdlog::error("channel: {}: {}", errorCodeName(ErrorCode::HandshakeFailed), session.failure());
                retireStats(session.stats());
                return SessionEnd::Fatal;
            }
            for (const auto& reply : replies) {
                if (!stream.writeLine(reply)) {
                    retireStats(session.stats());
                    return SessionEnd::Reset;
                }
            }
            setState(session.state());
            publishStats(session.stats());
            if (session.state() == ConnectionState::Active && reached_active) *reached_active = true;
        } else if (r == LineStream::ReadResult::Closed || r == LineStream::ReadResult::Error) {
            retireStats(session.stats());
            return SessionEnd::Reset;
        }

        const double now_s = monotonicNow_s();
        if (now_s >= next_rediscover_s) {
            if (devices_.anyUnavailable()) devices_.rediscover();
            next_rediscover_s = now_s + rediscover_period_s;
        }
    }
    retireStats(session.stats());
    return SessionEnd::Stopped;
}

ErrorCode ChannelClient::run(const std::atomic<bool>& running) {
    ignoreSigpipe();

    std::unique_ptr<TlsContext> tls;
    if (cfg_.insecure_u32) {
        spdlog::warn("channel: insecure mode, server identity is not verified");
    } else {
        if (cfg_.ca_file.empty() && cfg_.pinned_sha256.empty()) {
            const std::string err = "no CA file or pinned fingerprint configured";
            {
                std::lock_guard<std::mutex> lock(mu_);
                last_error_text_ = err;
            }
            spdlog::error("channel: {}: {}", errorCodeName(ErrorCode::ConfigError), err);
            return ErrorCode::ConfigError;
        }
        std::string err;
        tls = TlsContext::createClient(cfg_.ca_file, &err);
        if (!tls) {
            {
                std::lock_guard<std::mutex> lock(mu_);
                last_error_text_ = err;
            }
            spdlog::error("channel: {}: {}", errorCodeName(ErrorCode::ConfigError), err);
            return ErrorCode::ConfigError;
        }
    }

    TlsClientOptions opts;
    opts.expected_host = cfg_.host;
    opts.pinned_sha256 = cfg_.pinned_sha256;
    const std::string peer = cfg_.host + ":" + std::to_string(cfg_.port_i32);

    std::uint32_t failures = 0;
    while (running.load()) {
        setState(ConnectionState::Connecting);
        std::string err;
        std::unique_ptr<SocketLineStream> stream;
        const int fd = tcpConnect(cfg_.host, cfg_.port_i32, cfg_.connect_timeout_s, &err);
        if (fd >= 0) {
            if (tls) {
                bool untrusted = false;
                stream = SocketLineStream::connectTls(*tls, fd, peer, opts, cfg_.handshake_timeout_s, &err, &untrusted);
                if (!stream && untrusted) {
                    {
                        std::lock_guard<std::mutex> lock(mu_);
                        last_error_text_ = err;
                    }
                    setState(ConnectionState::Error);
                    spdlog::error("channel: {} with {}: {}", errorCodeName(ErrorCode::HandshakeFailed), peer, err);
                    return ErrorCode::HandshakeFailed;
                }
            } else {
                stream = SocketLineStream::wrapPlain(fd, peer);
            }
        }

        if (stream) {
            {
                std::lock_guard<std::mutex> lock(mu_);
                ++retired_.connections;
            }
            spdlog::info("channel: connected to {}{}", peer, stream->isTls() ? "" : " (plain TCP)");
            bool active = false;
            const SessionEnd end = serveConnection(*stream, running, &active);
            stream->close();
            if (end == SessionEnd::Fatal) {
                setState(ConnectionState::Error);
                return ErrorCode::HandshakeFailed;
            }
            if (end == SessionEnd::Stopped) break;
            if (active) failures = 0;
            err = stream->lastError().empty() ? std::string("server closed the connection") : stream->lastError();
            spdlog::warn("channel: {} from {}: {}", errorCodeName(ErrorCode::ConnectionReset), peer, err);
        } else if (fd >= 0) {
            spdlog::warn("channel: {} from {} during handshake: {}", errorCodeName(ErrorCode::ConnectionReset), peer,
                         err);
        } else {
            spdlog::warn("channel: cannot reach {}: {}", peer, err);
        }

        setState(ConnectionState::Disconnected);
        ++failures;
        if (failures > cfg_.max_reconnects_u32) {
            {
                std::lock_guard<std::mutex> lock(mu_);
                last_error_text_ = err;
            }
            spdlog::error("channel: giving up after {} failed attempts ({})", failures,
                          errorCodeName(ErrorCode::ConnectionReset));
            devices_.resetAll();
            return ErrorCode::ConnectionReset;
        }
        const double delay_s = exponentialBackoff_s(cfg_.reconnect_initial_s, cfg_.reconnect_max_s, failures);
        spdlog::info("channel: reconnecting in {:.2f}s (attempt {})", delay_s, failures);
        if (!sleepWhileRunning(delay_s, running)) break;
    }

    devices_.resetAll();
    setState(ConnectionState::Disconnected);
    return ErrorCode::None;
}

} // namespace rh
