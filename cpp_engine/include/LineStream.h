#pragma once

#include <cstddef>
#include <string>

namespace rh {

// Line-oriented, bidirectional text transport. Implemented over TLS, plain TCP and
// Unix domain sockets. The command channel terminates lines with CRLF, media IPC
// with LF; lines are returned without terminator.
class LineStream {
public:
    enum class ReadResult {
        Line,
        Timeout,
        Closed,
        Error,
    };

    virtual ~LineStream() = default;

    virtual bool writeLine(const std::string& line) = 0;
    virtual ReadResult readLine(std::string* out, double timeout_s) = 0;
    virtual void close() = 0;
    virtual std::string peerName() const { return std::string(); }
    virtual std::string lastError() const { return std::string(); }
};

// Accumulates raw bytes and splits them on '\n', stripping a trailing '\r'.
class LineBuffer {
public:
    explicit LineBuffer(std::size_t max_line_bytes = 64 * 1024) : max_line_bytes_(max_line_bytes) {}

    void append(const char* data, std::size_t len) { pending_.append(data, len); }

    bool nextLine(std::string* out) {
        const std::size_t nl = pending_.find('\n');
        if (nl == std::string::npos) return false;
        std::string line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (out) *out = std::move(line);
        return true;
    }

    // True once a partial line has grown beyond the limit (peer is misbehaving).
    bool overflowed() const { return pending_.size() > max_line_bytes_; }

    void clear() { pending_.clear(); }

private:
    std::size_t max_line_bytes_;
    std::string pending_;
};

} // namespace rh
