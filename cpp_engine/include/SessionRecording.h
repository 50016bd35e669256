#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "HapticsTypes.h"

namespace rh {

// ============================================================
// Session recording (receiver side)
//
// One text file per connection, UTF-8, one entry per line:
//
//   RemoteHapticsRecording:0.2
//   @session_start:2026-10-19 12:00:00.000000+00:00
//   # timestamp = 2026-10-19 12:00:00.000000+00:00
//   0.512000:0.750000,0.080000,pad0        applied command (intensity, duration, target)
//   3.100000:text=free form remark
//   4.000000:media=...                     kept verbatim, not interpreted
//   @session_end:2026-10-19 12:01:00.000000+00:00
//
// The leading number is seconds since session start. Lines starting with '#'
// are comments. Files are flushed every flush_interval_s.
// ============================================================

constexpr const char* kRecordingHeader = "RemoteHapticsRecording:0.2";
constexpr const char* kRecordingStartPrefix = "@session_start:";
constexpr const char* kRecordingEndPrefix = "@session_end:";
constexpr const char* kRecordingRemarkPrefix = "text=";
constexpr const char* kRecordingMediaPrefix = "media=";
constexpr const char* kRecordingExtension = ".rec";

struct RecordingConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(RecordingConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::uint32_t enabled_u32 = 0;
    // Recordings go to <destination_dir>/<server host>/<local date time>.rec
    std::string destination_dir = "recordings";
    double flush_interval_s = 30.0;
    // Absolute UTC comment inserted at most this often (only before an entry).
    double timestamp_interval_s = 60.0;
};

std::uint32_t computeRecordingConfigHash(const RecordingConfigV1& c);

enum class RecordingEntryKind : std::uint32_t {
    Command = 0,
    Remark,
    Media,
};

struct RecordingEntry {
    double time_delta_s = 0.0;
    RecordingEntryKind kind = RecordingEntryKind::Command;
    double intensity_0_1 = 0.0;
    double duration_s = 0.0;
    std::string target;
    // Remark text or raw media directive.
    std::string text;

    std::string toLine() const;
};

bool parseRecordingLine(const std::string& line, RecordingEntry* out);

// "YYYY-MM-DD HH:MM:SS.ffffff+00:00"
std::string formatUtcTimestamp(double wall_s);
// Accepts the form above, with or without fraction and UTC offset.
bool parseUtcTimestamp(const std::string& text, double* wall_s);

// Keeps alphanumerics, ' ', '.' and '_'; trailing spaces removed.
std::string safeFileComponent(const std::string& raw);

class SessionRecorder {
public:
    explicit SessionRecorder(const RecordingConfigV1& cfg);
    ~SessionRecorder();

    SessionRecorder(const SessionRecorder&) = delete;
    SessionRecorder& operator=(const SessionRecorder&) = delete;

    bool open(const std::string& path, double wall_now_s, std::string* err);
    // Creates the per-host directory and a file named after the local time.
    bool openForPeer(const std::string& host, double wall_now_s, std::string* err);
    bool isOpen() const { return out_.is_open(); }
    const std::string& path() const noexcept { return path_; }

    void recordCommand(const HapticCommand& cmd, double wall_now_s);
    void remark(const std::string& text, double wall_now_s);
    // Writes the footer. Safe to call when not open.
    void close(double wall_now_s);

    std::uint64_t entriesWritten() const noexcept { return entries_; }

private:
    void write(const RecordingEntry& e, double wall_now_s);

    RecordingConfigV1 cfg_;
    std::ofstream out_;
    std::string path_;
    double start_wall_s_ = 0.0;
    double last_flush_s_ = 0.0;
    double last_comment_s_ = -1.0e300;
    std::uint64_t entries_ = 0;
};

class RecordingReader {
public:
    // Validates the header lines.
    bool open(const std::string& path, std::string* err);

    // Next entry; false at the footer or end of file, or on a malformed line
    // (lastError() is then non-empty).
    bool next(RecordingEntry* out);
    bool rewind();

    double sessionStart_s() const noexcept { return start_wall_s_; }
    bool reachedEnd() const noexcept { return reached_end_; }
    const std::string& lastError() const noexcept { return last_error_; }

private:
    bool readHeader();

    std::string path_;
    std::ifstream in_;
    double start_wall_s_ = 0.0;
    bool reached_end_ = false;
    std::string last_error_;
};

// Interleaves recordings by absolute time into one file that starts at the
// earliest session start.
bool mergeRecordings(const std::string& out_path, const std::vector<std::string>& inputs, std::string* err);

} // namespace rh
