#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>

#include "../device/haptic_device.h"
#include "CommandChannel.h"
#include "HapticsTypes.h"
#include "TlsStream.h"

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

// ============================================================
// Fixtures
// ============================================================

struct TestCert {
    std::string dir;
    std::string cert_file;
    std::string key_file;
    std::string fingerprint;
};

// Self-signed P-256 certificate for CN=localhost, valid for one day.
static bool writeSelfSignedCert(const std::string& cert_file, const std::string& key_file) {
    EVP_PKEY* pkey = EVP_EC_gen("P-256");
    if (!pkey) return false;
    X509* x = X509_new();
    bool ok = x != nullptr;
    if (ok) {
        X509_set_version(x, 2);
        ASN1_INTEGER_set(X509_get_serialNumber(x), 1);
        X509_gmtime_adj(X509_getm_notBefore(x), 0);
        X509_gmtime_adj(X509_getm_notAfter(x), 24L * 3600L);
        X509_set_pubkey(x, pkey);
        X509_NAME* name = X509_get_subject_name(x);
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1,
                                   -1, 0);
        X509_set_issuer_name(x, name);
        ok = X509_sign(x, pkey, EVP_sha256()) > 0;
    }
    if (ok) {
        FILE* f = std::fopen(cert_file.c_str(), "wb");
        ok = f && PEM_write_X509(f, x) == 1;
        if (f) std::fclose(f);
    }
    if (ok) {
        FILE* f = std::fopen(key_file.c_str(), "wb");
        ok = f && PEM_write_PrivateKey(f, pkey, nullptr, nullptr, 0, nullptr, nullptr) == 1;
        if (f) std::fclose(f);
    }
    X509_free(x);
    EVP_PKEY_free(pkey);
    return ok;
}

static TestCert makeTestCert() {
    TestCert c;
    const std::filesystem::path dir =
        std::filesystem::temp_directory_path() / ("remotehaptics_tls_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
    c.dir = dir.string();
    c.cert_file = (dir / "server.crt").string();
    c.key_file = (dir / "server.key").string();
    REQUIRE(writeSelfSignedCert(c.cert_file, c.key_file), "failed to create test certificate");
    std::string err;
    REQUIRE(rh::certificateFileFingerprint(c.cert_file, &c.fingerprint, &err), "fingerprint: " << err);
    REQUIRE(c.fingerprint.size() == 64, "SHA-256 fingerprint is 64 hex digits");
    return c;
}

// Thread-safe apply log shared by the fake actuators.
struct DeviceLog {
    std::mutex mu;
    std::vector<std::string> lines;

    void add(const std::string& s) {
        std::lock_guard<std::mutex> lock(mu);
        lines.push_back(s);
    }
    std::vector<std::string> copy() {
        std::lock_guard<std::mutex> lock(mu);
        return lines;
    }
};

class LoggingDevice final : public rh::device::HapticDevice {
public:
    LoggingDevice(std::string id, DeviceLog* log) : id_(std::move(id)), name_(id_), log_(log) {}

    const std::string& id() const override { return id_; }
    const std::string& name() const override { return name_; }
    bool apply(const rh::HapticCommand& cmd) override {
        log_->add("apply:" + std::to_string(cmd.command_id));
        return true;
    }
    bool stop() override { return true; }
    bool reset() override {
        log_->add("reset");
        return true;
    }

private:
    std::string id_;
    std::string name_;
    DeviceLog* log_;
};

static bool waitFor(const std::function<bool()>& pred, double timeout_s) {
    const double until_s = rh::monotonicNow_s() + timeout_s;
    while (rh::monotonicNow_s() < until_s) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

static rh::ServerChannelConfigV1 serverConfig(const TestCert& cert) {
    rh::ServerChannelConfigV1 cfg;
    cfg.bind_address = "127.0.0.1";
    cfg.port_i32 = 0;
    cfg.cert_file = cert.cert_file;
    cfg.key_file = cert.key_file;
    cfg.ack_timeout_s = 5.0;
    return cfg;
}

static rh::ClientChannelConfigV1 clientConfig(int port, const std::string& pin) {
    rh::ClientChannelConfigV1 cfg;
    cfg.host = "127.0.0.1";
    cfg.port_i32 = port;
    cfg.ca_file.clear();
    cfg.pinned_sha256 = pin;
    cfg.connect_timeout_s = 2.0;
    cfg.handshake_timeout_s = 2.0;
    cfg.reconnect_initial_s = 0.01;
    cfg.reconnect_max_s = 0.02;
    cfg.max_reconnects_u32 = 2;
    return cfg;
}

static rh::HapticCommand commandNow(std::uint64_t id, const std::string& target) {
    rh::HapticCommand c;
    c.command_id = id;
    c.dispatch_time_s = rh::monotonicNow_s();
    c.intensity_0_1 = 0.75;
    c.duration_s = 0.08;
    c.device_target = target;
    return c;
}

// ============================================================
// Tests
// ============================================================

static void runPinnedDelivery(const TestCert& cert) {
    rh::ChannelServer server(serverConfig(cert));
    std::string err;
    REQUIRE(server.start(&err), "server start: " << err);
    REQUIRE(server.boundPort() > 0, "ephemeral port bound");

    DeviceLog log;
    rh::device::DeviceRegistry devices(rh::device::DeviceRegistryConfigV1{});
    devices.addDevice(std::make_unique<LoggingDevice>("pad0", &log));

    // Pin given in the colon separated uppercase form people copy from tools.
    std::string pin;
    for (std::size_t i = 0; i < cert.fingerprint.size(); i += 2) {
        if (i) pin += ":";
        pin += cert.fingerprint.substr(i, 2);
    }
    for (auto& ch : pin) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));

    rh::ChannelClient client(clientConfig(server.boundPort(), pin), devices);
    std::atomic<bool> running{true};
    rh::ErrorCode result = rh::ErrorCode::ConfigError;
    std::thread t([&] { result = client.run(running); });

    REQUIRE(waitFor([&] { return server.activeSessionCount() == 1; }, 5.0), "receiver session becomes active");
    REQUIRE(waitFor([&] { return client.state() == rh::ConnectionState::Active; }, 5.0), "client reports Active");

    REQUIRE(server.dispatch(commandNow(1, "pad0")) == 1, "command routed to the receiver");
    REQUIRE(server.dispatch(commandNow(2, "rear")) == 0, "unannounced target not routed");
    REQUIRE(server.dispatch(commandNow(3, "broadcast")) == 1, "broadcast routed");
    REQUIRE(waitFor([&] { return server.stats().acks.ok == 2; }, 5.0), "both commands acknowledged OK");

    const rh::ChannelServerStats st = server.stats();
    REQUIRE(st.commands_sent == 2 && st.commands_unrouted == 1, "server counters");
    const std::vector<rh::SessionInfo> sessions = server.sessions();
    REQUIRE(sessions.size() == 1 && sessions[0].last_acked_command_id == 3, "last acked id tracked");
    REQUIRE(sessions[0].certificate_fingerprint.empty(), "receivers present no certificate");

    running.store(false);
    t.join();
    REQUIRE(result == rh::ErrorCode::None, "client stops cleanly, got " << rh::errorCodeName(result));

    const rh::ReceiverStats rs = client.stats();
    REQUIRE(rs.connections == 1 && rs.commands_received == 2 && rs.acks.ok == 2, "receiver counters");
    const std::vector<std::string> lines = log.copy();
    REQUIRE(lines.size() == 4, "reset, two commands, reset on exit; got " << lines.size());
    REQUIRE(lines[0] == "reset", "devices reset before the first command");
    REQUIRE(lines[1] == "apply:1" && lines[2] == "apply:3", "commands applied in order");
    REQUIRE(lines[3] == "reset", "devices reset on exit");

    server.stop();
    std::cout << "[PASS] pinned TLS delivery and acknowledgement\n";
}

static void runPinMismatch(const TestCert& cert) {
    rh::ChannelServer server(serverConfig(cert));
    std::string err;
    REQUIRE(server.start(&err), "server start: " << err);

    DeviceLog log;
    rh::device::DeviceRegistry devices(rh::device::DeviceRegistryConfigV1{});
    devices.addDevice(std::make_unique<LoggingDevice>("pad0", &log));

    rh::ChannelClient client(clientConfig(server.boundPort(), std::string(64, '0')), devices);
    std::atomic<bool> running{true};
    const rh::ErrorCode result = client.run(running);
    REQUIRE(result == rh::ErrorCode::HandshakeFailed, "wrong pin fails the handshake, got "
                                                          << rh::errorCodeName(result));
    REQUIRE(!client.lastErrorText().empty(), "handshake failure described");
    REQUIRE(client.stats().connections == 0, "no session was established");
    REQUIRE(waitFor([&] { return server.stats().sessions_accepted >= 1; }, 5.0), "server saw the connection");
    REQUIRE(server.activeSessionCount() == 0, "no active session");
    for (const auto& l : log.copy()) REQUIRE(l != "apply:1", "nothing applied");

    server.stop();
    std::cout << "[PASS] certificate pin mismatch is terminal\n";
}

static void runServerLossHitsCeiling(const TestCert& cert) {
    rh::ChannelServer server(serverConfig(cert));
    std::string err;
    REQUIRE(server.start(&err), "server start: " << err);

    DeviceLog log;
    rh::device::DeviceRegistry devices(rh::device::DeviceRegistryConfigV1{});
    devices.addDevice(std::make_unique<LoggingDevice>("pad0", &log));

    rh::ChannelClient client(clientConfig(server.boundPort(), cert.fingerprint), devices);
    std::atomic<bool> running{true};
    rh::ErrorCode result = rh::ErrorCode::None;
    std::thread t([&] { result = client.run(running); });

    REQUIRE(waitFor([&] { return server.activeSessionCount() == 1; }, 5.0), "receiver session becomes active");
    server.stop();
    t.join();

    REQUIRE(result == rh::ErrorCode::ConnectionReset, "reconnect ceiling reached, got " << rh::errorCodeName(result));
    REQUIRE(client.stats().connections == 1, "no further connection succeeded");
    const std::vector<std::string> lines = log.copy();
    REQUIRE(!lines.empty() && lines.back() == "reset", "devices left neutral when giving up");
    std::cout << "[PASS] lost server exhausts the reconnect ceiling\n";
}

// A listener that accepts TCP and closes before any TLS byte is exchanged, the
// way a restarting or full server looks from the receiver.
static void runHandshakeDropIsRetried(const TestCert& cert) {
    std::string err;
    int port = 0;
    const int listen_fd = rh::tcpListen("127.0.0.1", 0, &port, &err);
    REQUIRE(listen_fd >= 0, "listen: " << err);

    std::atomic<bool> accepting{true};
    std::atomic<int> accepted{0};
    std::thread acceptor([&] {
        while (accepting.load()) {
            std::string peer;
            std::string accept_err;
            const int fd = rh::tcpAccept(listen_fd, 0.05, &peer, &accept_err);
            if (fd < 0) continue;
            accepted.fetch_add(1);
            ::close(fd);
        }
    });

    DeviceLog log;
    rh::device::DeviceRegistry devices(rh::device::DeviceRegistryConfigV1{});
    devices.addDevice(std::make_unique<LoggingDevice>("pad0", &log));

    rh::ChannelClient client(clientConfig(port, cert.fingerprint), devices);
    std::atomic<bool> running{true};
    rh::ErrorCode result = rh::ErrorCode::None;
    std::atomic<bool> done{false};
    std::thread t([&] {
        result = client.run(running);
        done.store(true);
    });
    // Read concurrently with the client thread updating it.
    while (!done.load()) {
        client.lastErrorText();
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    t.join();
    accepting.store(false);
    acceptor.join();
    ::close(listen_fd);

    REQUIRE(result == rh::ErrorCode::ConnectionReset, "dropped handshakes are retried up to the ceiling, got "
                                                          << rh::errorCodeName(result));
    REQUIRE(accepted.load() == 3, "one attempt plus two reconnects; got " << accepted.load());
    REQUIRE(client.stats().connections == 0, "no session was established");
    REQUIRE(!client.lastErrorText().empty(), "last transport failure described");
    for (const auto& l : log.copy()) REQUIRE(l == "reset", "nothing applied");
    std::cout << "[PASS] dropped handshake counts toward the reconnect ceiling\n";
}

static void runMissingTrustAnchor() {
    rh::device::DeviceRegistry devices(rh::device::DeviceRegistryConfigV1{});
    rh::ClientChannelConfigV1 cfg = clientConfig(rh::kNetDefaultPort, "");
    rh::ChannelClient client(cfg, devices);
    std::atomic<bool> running{true};
    REQUIRE(client.run(running) == rh::ErrorCode::ConfigError, "secure mode needs a CA file or a pin");
    std::cout << "[PASS] client refuses to connect without a trust anchor\n";
}

static void runFingerprintNormalisation() {
    REQUIRE(rh::normalizeFingerprint("AB:cd:0F") == "abcd0f", "colons removed and lowercased");
    std::string fp;
    std::string err;
    REQUIRE(!rh::certificateFileFingerprint("/nonexistent/server.crt", &fp, &err), "missing file reported");
    REQUIRE(!err.empty(), "error text for missing certificate");
    std::cout << "[PASS] fingerprint helpers\n";
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::off);

    const TestCert cert = makeTestCert();

    runFingerprintNormalisation();
    runMissingTrustAnchor();
    runPinnedDelivery(cert);
    runPinMismatch(cert);
    runServerLossHitsCeiling(cert);
    runHandshakeDropIsRetried(cert);

    std::error_code ec;
    std::filesystem::remove_all(cert.dir, ec);
    return 0;
}
