#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "LineStream.h"

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;
typedef struct x509_st X509;

namespace rh {

// ============================================================
// TLS transport (OpenSSL)
//
// - Server presents an X.509 certificate; clients are not authenticated.
// - Client verifies the server against a CA/certificate file with a hostname
//   check, and/or a pinned SHA-256 certificate fingerprint.
// - "insecure" sessions run the same line protocol over plain TCP.
// ============================================================

class TlsContext {
public:
    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    static std::unique_ptr<TlsContext> createServer(const std::string& cert_file, const std::string& key_file,
                                                    std::string* err);
    // ca_file may be empty when the server is authenticated by fingerprint only.
    static std::unique_ptr<TlsContext> createClient(const std::string& ca_file, std::string* err);

    SSL_CTX* native() const noexcept { return ctx_; }
    bool isServer() const noexcept { return server_; }
    bool verifiesChain() const noexcept { return verify_chain_; }

private:
    TlsContext(SSL_CTX* ctx, bool server, bool verify_chain);

    SSL_CTX* ctx_ = nullptr;
    bool server_ = false;
    bool verify_chain_ = false;
};

struct TlsClientOptions {
    // Hostname checked against the certificate when the chain is verified.
    std::string expected_host;
    // Hex SHA-256 of the server certificate (colons optional); empty = no pin.
    std::string pinned_sha256;
};

// Line stream over a connected TCP socket, optionally wrapped in TLS.
// Reads and writes may come from different threads; SSL calls are serialized.
class SocketLineStream final : public LineStream {
public:
    ~SocketLineStream() override;

    SocketLineStream(const SocketLineStream&) = delete;
    SocketLineStream& operator=(const SocketLineStream&) = delete;

    static std::unique_ptr<SocketLineStream> wrapPlain(int fd, std::string peer);
    static std::unique_ptr<SocketLineStream> acceptTls(TlsContext& ctx, int fd, std::string peer, double timeout_s,
                                                       std::string* err);
    // *trust_failure is set when the server was reached but could not be trusted
    // (chain, hostname or pin) or refused the handshake; it stays false when the
    // transport failed underneath (EOF, reset, timeout).
    static std::unique_ptr<SocketLineStream> connectTls(TlsContext& ctx, int fd, std::string peer,
                                                        const TlsClientOptions& opts, double timeout_s,
                                                        std::string* err, bool* trust_failure = nullptr);

    bool writeLine(const std::string& line) override;
    ReadResult readLine(std::string* out, double timeout_s) override;
    void close() override;
    std::string peerName() const override { return peer_; }
    std::string lastError() const override;

    bool isTls() const noexcept { return ssl_ != nullptr; }
    // SHA-256 of the peer certificate; empty when the peer presented none.
    const std::string& peerFingerprint() const noexcept { return peer_fingerprint_; }

private:
    SocketLineStream(int fd, SSL* ssl, std::string peer);

    void setError(const std::string& e);

    int fd_ = -1;
    SSL* ssl_ = nullptr;
    std::string peer_;
    std::string peer_fingerprint_;
    LineBuffer rx_;
    bool closed_ = false;
    mutable std::mutex io_mu_;
    mutable std::mutex err_mu_;
    std::string last_error_;
};

// Lowercase hex, colons removed.
std::string normalizeFingerprint(const std::string& fp);
bool certificateFingerprint(X509* cert, std::string* out);
bool certificateFileFingerprint(const std::string& pem_file, std::string* out, std::string* err);

// Returns a listening socket or -1. *bound_port receives the actual port (port 0 = any).
int tcpListen(const std::string& bind_address, int port, int* bound_port, std::string* err);
int tcpAccept(int listen_fd, double timeout_s, std::string* peer, std::string* err);
int tcpConnect(const std::string& host, int port, double timeout_s, std::string* err);

// SSL_write on a reset socket raises SIGPIPE otherwise.
void ignoreSigpipe();

std::string opensslErrorText();

} // namespace rh
