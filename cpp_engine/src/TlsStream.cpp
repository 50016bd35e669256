#include "TlsStream.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include "HapticsTypes.h"

namespace rh {

namespace {

// Bounds every blocking socket call so in-flight writes complete or time out.
constexpr double kSocketIoTimeout_s = 2.0;

static inline std::string errnoText(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

void setSocketTimeouts(int fd, double seconds) {
    timeval tv;
    const double s = std::max(0.001, seconds);
    tv.tv_sec = static_cast<time_t>(s);
    tv.tv_usec = static_cast<suseconds_t>((s - std::floor(s)) * 1e6);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void setNoDelay(int fd) {
    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

std::string describePeer(const sockaddr* sa, socklen_t len) {
    char host[NI_MAXHOST];
    char serv[NI_MAXSERV];
    if (::getnameinfo(sa, len, host, sizeof(host), serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0) {
        return "<unknown>";
    }
    if (sa->sa_family == AF_INET6) return std::string("[") + host + "]:" + serv;
    return std::string(host) + ":" + serv;
}

int pollMs(double timeout_s) {
    if (!(timeout_s > 0.0)) return 0;
    return static_cast<int>(std::ceil(std::min(timeout_s, 3600.0) * 1000.0));
}

} // namespace

std::string opensslErrorText() {
    std::string out;
    unsigned long e = 0;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? std::string("unknown TLS error") : out;
}

void ignoreSigpipe() { std::signal(SIGPIPE, SIG_IGN); }

std::string normalizeFingerprint(const std::string& fp) {
    std::string out;
    out.reserve(fp.size());
    for (unsigned char c : fp) {
        if (c == ':' || std::isspace(c)) continue;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool certificateFingerprint(X509* cert, std::string* out) {
    if (!cert) return false;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (X509_digest(cert, EVP_sha256(), md, &len) != 1) return false;
    static const char* kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kHex[md[i] >> 4]);
        hex.push_back(kHex[md[i] & 0x0f]);
    }
    if (out) *out = std::move(hex);
    return true;
}

bool certificateFileFingerprint(const std::string& pem_file, std::string* out, std::string* err) {
    BIO* bio = BIO_new_file(pem_file.c_str(), "r");
    if (!bio) {
        if (err) *err = "cannot open " + pem_file;
        return false;
    }
    X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!cert) {
        if (err) *err = "no certificate in " + pem_file + ": " + opensslErrorText();
        return false;
    }
    const bool ok = certificateFingerprint(cert, out);
    X509_free(cert);
    if (!ok && err) *err = "digest failed";
    return ok;
}

// ---- TlsContext ----

TlsContext::TlsContext(SSL_CTX* ctx, bool server, bool verify_chain)
    : ctx_(ctx), server_(server), verify_chain_(verify_chain) {}

TlsContext::~TlsContext() {
    if (ctx_) SSL_CTX_free(ctx_);
}

std::unique_ptr<TlsContext> TlsContext::createServer(const std::string& cert_file, const std::string& key_file,
                                                     std::string* err) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_server_method());
    if (!ctx) {
        if (err) *err = opensslErrorText();
        return nullptr;
    }
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);

    if (SSL_CTX_use_certificate_chain_file(ctx, cert_file.c_str()) != 1) {
        if (err) *err = "certificate '" + cert_file + "': " + opensslErrorText();
        SSL_CTX_free(ctx);
        return nullptr;
    }
    if (SSL_CTX_use_PrivateKey_file(ctx, key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        if (err) *err = "private key '" + key_file + "': " + opensslErrorText();
        SSL_CTX_free(ctx);
        return nullptr;
    }
    if (SSL_CTX_check_private_key(ctx) != 1) {
        if (err) *err = "private key does not match certificate";
        SSL_CTX_free(ctx);
        return nullptr;
    }
    return std::unique_ptr<TlsContext>(new TlsContext(ctx, true, false));
}

std::unique_ptr<TlsContext> TlsContext::createClient(const std::string& ca_file, std::string* err) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (!ctx) {
        if (err) *err = opensslErrorText();
        return nullptr;
    }
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);

    bool verify_chain = false;
    if (!ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(ctx, ca_file.c_str(), nullptr) != 1) {
            if (err) *err = "CA file '" + ca_file + "': " + opensslErrorText();
            SSL_CTX_free(ctx);
            return nullptr;
        }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        verify_chain = true;
    } else {
        // Authenticated by fingerprint after the handshake.
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    }
    return std::unique_ptr<TlsContext>(new TlsContext(ctx, false, verify_chain));
}

// ---- SocketLineStream ----

SocketLineStream::SocketLineStream(int fd, SSL* ssl, std::string peer) : fd_(fd), ssl_(ssl), peer_(std::move(peer)) {}

SocketLineStream::~SocketLineStream() {
    close();
    if (ssl_) SSL_free(ssl_);
    if (fd_ >= 0) ::close(fd_);
}

std::unique_ptr<SocketLineStream> SocketLineStream::wrapPlain(int fd, std::string peer) {
    setNoDelay(fd);
    setSocketTimeouts(fd, kSocketIoTimeout_s);
    return std::unique_ptr<SocketLineStream>(new SocketLineStream(fd, nullptr, std::move(peer)));
}

std::unique_ptr<SocketLineStream> SocketLineStream::acceptTls(TlsContext& ctx, int fd, std::string peer,
                                                              double timeout_s, std::string* err) {
    setNoDelay(fd);
    setSocketTimeouts(fd, timeout_s);
    SSL* ssl = SSL_new(ctx.native());
    if (!ssl) {
        if (err) *err = opensslErrorText();
        ::close(fd);
        return nullptr;
    }
    SSL_set_fd(ssl, fd);
    if (SSL_accept(ssl) != 1) {
        if (err) *err = "TLS accept failed: " + opensslErrorText();
        SSL_free(ssl);
        ::close(fd);
        return nullptr;
    }
    setSocketTimeouts(fd, kSocketIoTimeout_s);

    std::unique_ptr<SocketLineStream> s(new SocketLineStream(fd, ssl, std::move(peer)));
    X509* cert = SSL_get1_peer_certificate(ssl);
    if (cert) {
        certificateFingerprint(cert, &s->peer_fingerprint_);
        X509_free(cert);
    }
    return s;
}

std::unique_ptr<SocketLineStream> SocketLineStream::connectTls(TlsContext& ctx, int fd, std::string peer,
                                                               const TlsClientOptions& opts, double timeout_s,
                                                               std::string* err, bool* trust_failure) {
    if (trust_failure) *trust_failure = false;
    setNoDelay(fd);
    setSocketTimeouts(fd, timeout_s);
    SSL* ssl = SSL_new(ctx.native());
    if (!ssl) {
        if (err) *err = opensslErrorText();
        ::close(fd);
        return nullptr;
    }
    SSL_set_fd(ssl, fd);
    if (!opts.expected_host.empty()) {
        SSL_set_tlsext_host_name(ssl, opts.expected_host.c_str());
        if (ctx.verifiesChain()) SSL_set1_host(ssl, opts.expected_host.c_str());
    }

    const int rc = SSL_connect(ssl);
    if (rc != 1) {
        const int ssl_err = SSL_get_error(ssl, rc);
        const long vr = SSL_get_verify_result(ssl);
        const bool chain_rejected = ctx.verifiesChain() && vr != X509_V_OK;
        bool transport = false;
        if (ssl_err == SSL_ERROR_SYSCALL || ssl_err == SSL_ERROR_ZERO_RETURN || ssl_err == SSL_ERROR_WANT_READ ||
            ssl_err == SSL_ERROR_WANT_WRITE) {
            transport = true;
        } else if (ssl_err == SSL_ERROR_SSL) {
            transport = ERR_GET_REASON(ERR_peek_error()) == SSL_R_UNEXPECTED_EOF_WHILE_READING;
        }
        std::string e;
        if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE) {
            e = "TLS handshake timed out";
        } else if (ssl_err == SSL_ERROR_ZERO_RETURN || (ssl_err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
            e = "connection closed during TLS handshake";
            if (ssl_err == SSL_ERROR_SYSCALL && errno != 0) e += std::string(": ") + std::strerror(errno);
        } else {
            e = "TLS handshake failed: " + opensslErrorText();
        }
        if (chain_rejected) e += std::string(" (") + X509_verify_cert_error_string(vr) + ")";
        ERR_clear_error();
        if (trust_failure) *trust_failure = chain_rejected || !transport;
        if (err) *err = e;
        SSL_free(ssl);
        ::close(fd);
        return nullptr;
    }

    std::string fp;
    X509* cert = SSL_get1_peer_certificate(ssl);
    if (cert) {
        certificateFingerprint(cert, &fp);
        X509_free(cert);
    }
    if (!opts.pinned_sha256.empty() && normalizeFingerprint(opts.pinned_sha256) != fp) {
        if (trust_failure) *trust_failure = true;
        if (err) *err = "server certificate fingerprint mismatch (got " + (fp.empty() ? std::string("none") : fp) + ")";
        SSL_shutdown(ssl);
        SSL_free(ssl);
        ::close(fd);
        return nullptr;
    }
    setSocketTimeouts(fd, kSocketIoTimeout_s);

    std::unique_ptr<SocketLineStream> s(new SocketLineStream(fd, ssl, std::move(peer)));
    s->peer_fingerprint_ = fp;
    return s;
}

void SocketLineStream::setError(const std::string& e) {
    std::lock_guard<std::mutex> lock(err_mu_);
    last_error_ = e;
}

std::string SocketLineStream::lastError() const {
    std::lock_guard<std::mutex> lock(err_mu_);
    return last_error_;
}

bool SocketLineStream::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(io_mu_);
    if (closed_) return false;

    const std::string data = line + "\r\n";
    std::size_t off = 0;
    while (off < data.size()) {
        if (ssl_) {
            const int w = SSL_write(ssl_, data.data() + off, static_cast<int>(data.size() - off));
            if (w <= 0) {
                const int e = SSL_get_error(ssl_, w);
                if (e == SSL_ERROR_WANT_READ || e == SSL_ERROR_WANT_WRITE) {
                    setError("write timed out");
                } else {
                    setError("TLS write: " + opensslErrorText());
                }
                return false;
            }
            off += static_cast<std::size_t>(w);
        } else {
            const ssize_t w = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
            if (w < 0) {
                if (errno == EINTR) continue;
                setError(errno == EAGAIN || errno == EWOULDBLOCK ? std::string("write timed out") : errnoText("send"));
                return false;
            }
            off += static_cast<std::size_t>(w);
        }
    }
    return true;
}

LineStream::ReadResult SocketLineStream::readLine(std::string* out, double timeout_s) {
    if (rx_.nextLine(out)) return ReadResult::Line;

    const double deadline_s = monotonicNow_s() + std::max(0.0, timeout_s);
    while (true) {
        bool buffered = false;
        {
            std::lock_guard<std::mutex> lock(io_mu_);
            if (closed_) return ReadResult::Closed;
            buffered = ssl_ && SSL_pending(ssl_) > 0;
        }
        if (!buffered) {
            pollfd pfd;
            pfd.fd = fd_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            const int pr = ::poll(&pfd, 1, pollMs(deadline_s - monotonicNow_s()));
            if (pr == 0) return ReadResult::Timeout;
            if (pr < 0) {
                if (errno == EINTR) return ReadResult::Timeout;
                setError(errnoText("poll"));
                return ReadResult::Error;
            }
        }

        char buf[4096];
        int n = 0;
        {
            std::lock_guard<std::mutex> lock(io_mu_);
            if (closed_) return ReadResult::Closed;
            if (ssl_) {
                n = SSL_read(ssl_, buf, static_cast<int>(sizeof(buf)));
                if (n <= 0) {
                    const int e = SSL_get_error(ssl_, n);
                    if (e == SSL_ERROR_ZERO_RETURN || e == SSL_ERROR_SYSCALL) return ReadResult::Closed;
                    if (e != SSL_ERROR_WANT_READ && e != SSL_ERROR_WANT_WRITE) {
                        setError("TLS read: " + opensslErrorText());
                        return ReadResult::Error;
                    }
                    n = 0;
                }
            } else {
                const ssize_t r = ::recv(fd_, buf, sizeof(buf), 0);
                if (r == 0) return ReadResult::Closed;
                if (r < 0) {
                    if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
                        setError(errnoText("recv"));
                        return ReadResult::Error;
                    }
                    n = 0;
                } else {
                    n = static_cast<int>(r);
                }
            }
        }

        if (n > 0) {
            rx_.append(buf, static_cast<std::size_t>(n));
            if (rx_.nextLine(out)) return ReadResult::Line;
            if (rx_.overflowed()) {
                setError("line too long");
                return ReadResult::Error;
            }
        }
        if (monotonicNow_s() >= deadline_s) return ReadResult::Timeout;
    }
}

void SocketLineStream::close() {
    std::lock_guard<std::mutex> lock(io_mu_);
    if (closed_) return;
    closed_ = true;
    if (ssl_) SSL_shutdown(ssl_);
    // The descriptor stays open until destruction; a concurrent poll() wakes up.
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

// ---- TCP helpers ----

int tcpListen(const std::string& bind_address, int port, int* bound_port, std::string* err) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(port);
    const int gr = ::getaddrinfo(bind_address.empty() ? nullptr : bind_address.c_str(), port_str.c_str(), &hints, &res);
    if (gr != 0) {
        if (err) *err = std::string("resolve ") + bind_address + ": " + ::gai_strerror(gr);
        return -1;
    }

    int fd = -1;
    std::string last = "no usable address";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last = errnoText("socket");
            continue;
        }
        int one = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, 16) == 0) break;
        last = errnoText("bind/listen");
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) {
        if (err) *err = last;
        return -1;
    }

    if (bound_port) {
        sockaddr_storage ss;
        socklen_t len = sizeof(ss);
        *bound_port = port;
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
            if (ss.ss_family == AF_INET) {
                *bound_port = ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
            } else if (ss.ss_family == AF_INET6) {
                *bound_port = ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
            }
        }
    }
    return fd;
}

int tcpAccept(int listen_fd, double timeout_s, std::string* peer, std::string* err) {
    if (err) err->clear();
    pollfd pfd;
    pfd.fd = listen_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int pr = ::poll(&pfd, 1, pollMs(timeout_s));
    if (pr == 0) return -1;
    if (pr < 0) {
        if (errno != EINTR && err) *err = errnoText("poll");
        return -1;
    }
    sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    const int fd = ::accept4(listen_fd, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_CLOEXEC);
    if (fd < 0) {
        if (errno != EINTR && errno != EAGAIN && err) *err = errnoText("accept");
        return -1;
    }
    if (peer) *peer = describePeer(reinterpret_cast<sockaddr*>(&ss), len);
    return fd;
}

int tcpConnect(const std::string& host, int port, double timeout_s, std::string* err) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(port);
    const int gr = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gr != 0) {
        if (err) *err = "resolve " + host + ": " + ::gai_strerror(gr);
        return -1;
    }

    int fd = -1;
    std::string last = "no usable address";
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC | SOCK_NONBLOCK, ai->ai_protocol);
        if (fd < 0) {
            last = errnoText("socket");
            continue;
        }
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            rc = -1;
            if (::poll(&pfd, 1, pollMs(timeout_s)) == 1) {
                int so_err = 0;
                socklen_t len = sizeof(so_err);
                ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len);
                if (so_err == 0) {
                    rc = 0;
                } else {
                    errno = so_err;
                }
            } else {
                errno = ETIMEDOUT;
            }
        }
        if (rc == 0) {
            const int flags = ::fcntl(fd, F_GETFL, 0);
            ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
            break;
        }
        last = "connect " + host + ":" + port_str + ": " + std::strerror(errno);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0 && err) *err = last;
    return fd;
}

} // namespace rh
