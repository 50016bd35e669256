#include "PlaybackTracker.h"

#include <cerrno>
#include <cmath>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace rh {

UnixSocketIpc::UnixSocketIpc(std::string path) : path_(std::move(path)) {}

UnixSocketIpc::~UnixSocketIpc() { close(); }

void UnixSocketIpc::setError(const std::string& e) {
    std::lock_guard<std::mutex> lock(err_mu_);
    last_error_ = e;
}

std::string UnixSocketIpc::lastError() const {
    std::lock_guard<std::mutex> lock(err_mu_);
    return last_error_;
}

bool UnixSocketIpc::isConnected() const { return fd_.load() >= 0; }

bool UnixSocketIpc::connect() {
    close();

    sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path_.empty() || path_.size() >= sizeof(addr.sun_path)) {
        setError("invalid socket path '" + path_ + "'");
        return false;
    }
    std::memcpy(addr.sun_path, path_.c_str(), path_.size() + 1);

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        setError(std::string("socket: ") + std::strerror(errno));
        return false;
    }
    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        setError(std::string("connect ") + path_ + ": " + std::strerror(errno));
        ::close(fd);
        return false;
    }
    rx_.clear();
    fd_.store(fd);
    return true;
}

bool UnixSocketIpc::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mu_);
    const int fd = fd_.load();
    if (fd < 0) return false;

    const std::string data = line + "\n";
    std::size_t off = 0;
    while (off < data.size()) {
        const ssize_t w = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            setError(std::string("send: ") + std::strerror(errno));
            return false;
        }
        off += static_cast<std::size_t>(w);
    }
    return true;
}

LineStream::ReadResult UnixSocketIpc::readLine(std::string* out, double timeout_s) {
    if (rx_.nextLine(out)) return ReadResult::Line;

    const int fd = fd_.load();
    if (fd < 0) return ReadResult::Closed;

    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int ms = static_cast<int>(std::ceil(std::max(0.0, timeout_s) * 1000.0));
    const int pr = ::poll(&pfd, 1, ms);
    if (pr == 0) return ReadResult::Timeout;
    if (pr < 0) {
        if (errno == EINTR) return ReadResult::Timeout;
        setError(std::string("poll: ") + std::strerror(errno));
        return ReadResult::Error;
    }

    char buf[4096];
    const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n == 0) return ReadResult::Closed;
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return ReadResult::Timeout;
        setError(std::string("recv: ") + std::strerror(errno));
        return ReadResult::Error;
    }
    rx_.append(buf, static_cast<std::size_t>(n));
    if (rx_.nextLine(out)) return ReadResult::Line;
    if (rx_.overflowed()) {
        setError("line too long");
        return ReadResult::Error;
    }
    return ReadResult::Timeout;
}

void UnixSocketIpc::close() {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) ::close(fd);
}

} // namespace rh
