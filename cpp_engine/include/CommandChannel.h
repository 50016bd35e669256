#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "BoundedQueue.h"
#include "HapticsTypes.h"
#include "SessionRecording.h"
#include "TlsStream.h"

namespace rh {

namespace device {
class DeviceRegistry;
}

// ============================================================
// Secure command channel
//
// Server (sender side): accepts receivers, one session thread each; commands
// are routed by announced target, serialized in dispatch order and acknowledged
// individually. A dropped session takes its queue with it: nothing is replayed.
//
// Client (receiver side): connects, checks the protocol version, announces its
// targets and applies commands. Every new connection starts by resetting all
// devices. Reconnects use bounded exponential backoff up to a failure ceiling.
// An untrusted server is terminal; a handshake cut off by the transport is
// retried like any other reset.
// ============================================================

struct ServerChannelConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ServerChannelConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::string bind_address;  // empty = all interfaces
    std::int32_t port_i32 = kNetDefaultPort;
    std::string cert_file = "certs/server.crt";
    std::string key_file = "certs/server.key";
    // Plain TCP; only for trusted networks.
    std::uint32_t insecure_u32 = 0;

    double handshake_timeout_s = 5.0;
    double ack_timeout_s = 1.0;
    std::uint32_t session_queue_capacity_u32 = 64;
    std::uint32_t max_sessions_u32 = 16;
};

std::uint32_t computeServerChannelConfigHash(const ServerChannelConfigV1& c);

struct ClientChannelConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ClientChannelConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::string host = "localhost";
    std::int32_t port_i32 = kNetDefaultPort;
    // Certificate (or CA) the server must chain to; hostname is checked against it.
    std::string ca_file = "certs/server.crt";
    std::string pinned_sha256;
    std::uint32_t insecure_u32 = 0;

    double connect_timeout_s = 5.0;
    double handshake_timeout_s = 5.0;
    double reconnect_initial_s = 0.5;
    double reconnect_max_s = 8.0;
    // Consecutive failed connections before the receiver gives up.
    std::uint32_t max_reconnects_u32 = 10;

    // Commands older than this (wall clock) are acknowledged STALE. 0 = off.
    double stale_after_s = 0.0;
};

std::uint32_t computeClientChannelConfigHash(const ClientChannelConfigV1& c);

struct AckCounters {
    std::uint64_t ok = 0;
    std::uint64_t device_error = 0;
    std::uint64_t unknown_target = 0;
    std::uint64_t stale = 0;

    void add(AckStatus s);
    void merge(const AckCounters& o);
    std::uint64_t total() const { return ok + device_error + unknown_target + stale; }
};

// Server-side protocol state for one receiver. Transport agnostic.
class SenderSession {
public:
    SenderSession(std::uint64_t session_id, std::string peer, std::string fingerprint);

    void setState(ConnectionState s) { info_.state = s; }
    void setFingerprint(const std::string& fp) { info_.certificate_fingerprint = fp; }
    ConnectionState state() const noexcept { return info_.state; }
    const SessionInfo& info() const noexcept { return info_; }
    const std::vector<std::string>& targets() const noexcept { return targets_; }

    // Returns the replies to send. *close_requested is set on "quit".
    std::vector<std::string> onLine(const std::string& line, bool* close_requested);

    bool accepts(const HapticCommand& cmd) const;

    void noteSent(std::uint64_t command_id, double now_s);
    // Removes and returns commands unacknowledged for longer than timeout_s.
    std::vector<std::uint64_t> expireAcks(double now_s, double timeout_s);
    std::size_t awaitingAckCount() const { return awaiting_.size(); }

    const AckCounters& acks() const noexcept { return acks_; }

private:
    SessionInfo info_;
    std::vector<std::string> targets_;
    std::map<std::uint64_t, double> awaiting_; // command id -> sent at
    AckCounters acks_;
};

struct ChannelServerStats {
    std::uint64_t sessions_accepted = 0;
    std::uint64_t sessions_rejected = 0;
    std::uint64_t handshake_failures = 0;
    std::uint64_t connection_resets = 0;
    std::uint64_t commands_routed = 0;
    std::uint64_t commands_unrouted = 0;
    std::uint64_t commands_sent = 0;
    std::uint64_t commands_dropped = 0;
    std::uint64_t ack_timeouts = 0;
    AckCounters acks;
};

class ChannelServer {
public:
    explicit ChannelServer(const ServerChannelConfigV1& cfg);
    ~ChannelServer();

    ChannelServer(const ChannelServer&) = delete;
    ChannelServer& operator=(const ChannelServer&) = delete;

    bool start(std::string* err);
    void stop();
    bool running() const noexcept { return running_.load(); }
    int boundPort() const noexcept { return bound_port_; }

    // Queues cmd on every active session that accepts it. Returns the session count.
    // cmd.dispatch_time_s is monotonic; it is sent as wall-clock time.
    std::size_t dispatch(const HapticCommand& cmd);

    std::vector<SessionInfo> sessions() const;
    std::size_t activeSessionCount() const;
    ChannelServerStats stats() const;

    const ServerChannelConfigV1& config() const noexcept { return cfg_; }

private:
    struct Outbound {
        HapticCommand cmd;
        double wall_dispatch_s = 0.0;
    };

    struct Slot {
        explicit Slot(std::size_t capacity) : queue(capacity) {}
        std::mutex mu;
        std::unique_ptr<SenderSession> session;
        std::unique_ptr<SocketLineStream> stream;
        BoundedQueue<Outbound> queue;
        std::thread thread;
        std::atomic<bool> done{false};
        int pending_fd = -1;
        std::string peer;
    };

    void acceptLoop();
    void runSession(std::shared_ptr<Slot> slot);
    void reapFinished();

    ServerChannelConfigV1 cfg_;
    std::unique_ptr<TlsContext> tls_;
    int listen_fd_ = -1;
    int bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::thread accept_thread_;

    mutable std::mutex mu_;
    std::map<std::uint64_t, std::shared_ptr<Slot>> slots_;
    std::uint64_t next_session_id_ = 1;
    ChannelServerStats stats_;
};

struct ReceiverStats {
    std::uint64_t connections = 0;
    std::uint64_t device_resets = 0;
    std::uint64_t commands_received = 0;
    std::uint64_t commands_malformed = 0;
    std::uint64_t preemptions = 0;
    AckCounters acks;
};

// Client-side protocol state for one connection. Transport agnostic.
class ReceiverSession {
public:
    ReceiverSession(device::DeviceRegistry& devices, double stale_after_s);

    // Resets every device to neutral and returns the opening lines.
    std::vector<std::string> begin();

    // Returns the lines to send. *fatal is set when the server is incompatible
    // or refuses the announced targets.
    std::vector<std::string> onLine(const std::string& line, double wall_now_s, double mono_now_s, bool* fatal);

    // Applied commands are appended to the recorder. Not owned; may be null.
    void setRecorder(SessionRecorder* recorder) { recorder_ = recorder; }

    ConnectionState state() const noexcept { return state_; }
    const ReceiverStats& stats() const noexcept { return stats_; }
    const std::string& failure() const noexcept { return failure_; }

private:
    device::DeviceRegistry& devices_;
    SessionRecorder* recorder_ = nullptr;
    double stale_after_s_ = 0.0;
    ConnectionState state_ = ConnectionState::Connecting;
    ReceiverStats stats_;
    std::string failure_;
};

class ChannelClient {
public:
    // With recording enabled every connection writes its own file.
    ChannelClient(const ClientChannelConfigV1& cfg, device::DeviceRegistry& devices,
                  const RecordingConfigV1& recording = RecordingConfigV1());

    ChannelClient(const ChannelClient&) = delete;
    ChannelClient& operator=(const ChannelClient&) = delete;

    // Blocks until running is cleared (returns None) or a terminal failure:
    // HandshakeFailed, ConnectionReset (ceiling reached) or ConfigError.
    ErrorCode run(const std::atomic<bool>& running);

    ReceiverStats stats() const;
    ConnectionState state() const;
    std::string lastErrorText() const;
    const ClientChannelConfigV1& config() const noexcept { return cfg_; }

private:
    enum class SessionEnd { Reset, Fatal, Stopped };

    SessionEnd serveConnection(SocketLineStream& stream, const std::atomic<bool>& running, bool* reached_active);
    bool sleepWhileRunning(double seconds, const std::atomic<bool>& running);

    ClientChannelConfigV1 cfg_;
    RecordingConfigV1 recording_;
    device::DeviceRegistry& devices_;
    void setState(ConnectionState s);
    void publishStats(const ReceiverStats& live);
    void retireStats(const ReceiverStats& finished);

    mutable std::mutex mu_;
    ReceiverStats retired_;
    ReceiverStats live_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string last_error_text_;
};

} // namespace rh
