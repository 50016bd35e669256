#include "SessionRecording.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <memory>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"
#include "WireProtocol.h"

namespace rh {

namespace {

bool parseReal(const std::string& s, double* out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (errno != 0 || !end || *end != '\0' || !std::isfinite(v)) return false;
    *out = v;
    return true;
}

std::string trimLineEnd(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

} // namespace

std::uint32_t computeRecordingConfigHash(const RecordingConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.enabled_u32);
    h = fnv1a32_add_str(h, c.destination_dir);
    h = fnv1a32_add_f64(h, c.flush_interval_s);
    h = fnv1a32_add_f64(h, c.timestamp_interval_s);
    return h;
}

// ---- entries ----

std::string RecordingEntry::toLine() const {
    std::string line = wire::formatReal(time_delta_s) + ":";
    switch (kind) {
    case RecordingEntryKind::Command:
        line += wire::formatReal(intensity_0_1) + "," + wire::formatReal(duration_s) + "," + target;
        break;
    case RecordingEntryKind::Remark:
        line += kRecordingRemarkPrefix + text;
        break;
    case RecordingEntryKind::Media:
        line += kRecordingMediaPrefix + text;
        break;
    }
    return line;
}

bool parseRecordingLine(const std::string& raw, RecordingEntry* out) {
    const std::string line = trimLineEnd(raw);
    const std::size_t colon = line.find(':');
    if (colon == std::string::npos) return false;

    RecordingEntry e;
    if (!parseReal(line.substr(0, colon), &e.time_delta_s) || e.time_delta_s < 0.0) return false;
    const std::string body = line.substr(colon + 1);

    if (wire::startsWith(body, kRecordingRemarkPrefix)) {
        e.kind = RecordingEntryKind::Remark;
        e.text = body.substr(std::string(kRecordingRemarkPrefix).size());
    } else if (wire::startsWith(body, kRecordingMediaPrefix)) {
        e.kind = RecordingEntryKind::Media;
        e.text = body.substr(std::string(kRecordingMediaPrefix).size());
    } else {
        const std::size_t c1 = body.find(',');
        const std::size_t c2 = c1 == std::string::npos ? std::string::npos : body.find(',', c1 + 1);
        if (c2 == std::string::npos) return false;
        e.kind = RecordingEntryKind::Command;
        e.target = body.substr(c2 + 1);
        if (!parseReal(body.substr(0, c1), &e.intensity_0_1) ||
            !parseReal(body.substr(c1 + 1, c2 - c1 - 1), &e.duration_s) || !isValidTargetName(e.target)) {
            return false;
        }
        if (e.intensity_0_1 < 0.0 || e.intensity_0_1 > 1.0 || e.duration_s < 0.0) return false;
    }
    if (out) *out = e;
    return true;
}

// ---- timestamps ----

std::string formatUtcTimestamp(double wall_s) {
    if (!std::isfinite(wall_s) || wall_s < 0.0) wall_s = 0.0;
    double whole = std::floor(wall_s);
    long micros = std::lround((wall_s - whole) * 1e6);
    if (micros >= 1000000L) {
        whole += 1.0;
        micros -= 1000000L;
    }
    const std::time_t t = static_cast<std::time_t>(whole);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s.%06ld+00:00", date, micros);
    return buf;
}

bool parseUtcTimestamp(const std::string& text, double* wall_s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%*1[ T]%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second,
                    &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) return false;

    std::size_t pos = static_cast<std::size_t>(consumed);
    double fraction = 0.0;
    if (pos < text.size() && text[pos] == '.') {
        const std::size_t start = ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == start) return false;
        fraction = std::strtod(("0." + text.substr(start, pos - start)).c_str(), nullptr);
    }

    long offset_s = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int oh = 0, om = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) return false;
        offset_s = (oh * 3600L + om * 60L) * (text[pos] == '-' ? -1 : 1);
        pos += 6;
    } else if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    }
    if (pos != text.size()) return false;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t t = timegm(&tm);
    if (wall_s) *wall_s = static_cast<double>(t) - static_cast<double>(offset_s) + fraction;
    return true;
}

std::string safeFileComponent(const std::string& raw) {
    std::string out;
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == ' ' || c == '.' || c == '_') out.push_back(static_cast<char>(c));
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    return out.empty() ? std::string("unknown") : out;
}

// ---- SessionRecorder ----

SessionRecorder::SessionRecorder(const RecordingConfigV1& cfg) : cfg_(cfg) {
    if (!(cfg_.flush_interval_s > 0.0)) cfg_.flush_interval_s = 30.0;
    if (!(cfg_.timestamp_interval_s > 0.0)) cfg_.timestamp_interval_s = 60.0;
    cfg_.fnv_hash_u32 = computeRecordingConfigHash(cfg_);
}

SessionRecorder::~SessionRecorder() { close(wallNow_s()); }

bool SessionRecorder::open(const std::string& path, double wall_now_s, std::string* err) {
    close(wall_now_s);
    out_.open(path, std::ios::out | std::ios::trunc);
    if (!out_) {
        if (err) *err = "cannot create recording '" + path + "'";
        return false;
    }
    path_ = path;
    start_wall_s_ = wall_now_s;
    last_flush_s_ = wall_now_s;
    last_comment_s_ = -1.0e300;
    entries_ = 0;
    out_ << kRecordingHeader << "\n" << kRecordingStartPrefix << formatUtcTimestamp(wall_now_s) << "\n";
    out_.flush();
    return static_cast<bool>(out_);
}

bool SessionRecorder::openForPeer(const std::string& host, double wall_now_s, std::string* err) {
    const std::filesystem::path dir = std::filesystem::path(cfg_.destination_dir) / safeFileComponent(host);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        if (err) *err = "cannot create '" + dir.string() + "': " + ec.message();
        return false;
    }

    const std::time_t t = static_cast<std::time_t>(wall_now_s);
    std::tm tm{};
    localtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H-%M-%S", &tm);

    // Two sessions within one second get a numeric suffix.
    std::filesystem::path file = dir / (std::string(stamp) + kRecordingExtension);
    for (int n = 1; std::filesystem::exists(file, ec) && n < 100; ++n) {
        file = dir / (std::string(stamp) + "_" + std::to_string(n) + kRecordingExtension);
    }
    return open(file.string(), wall_now_s, err);
}

void SessionRecorder::write(const RecordingEntry& e, double wall_now_s) {
    if (!out_.is_open()) return;
    if (wall_now_s - last_comment_s_ > cfg_.timestamp_interval_s) {
        out_ << "# timestamp = " << formatUtcTimestamp(wall_now_s) << "\n";
        last_comment_s_ = wall_now_s;
    }
    out_ << e.toLine() << "\n";
    ++entries_;
    if (wall_now_s - last_flush_s_ >= cfg_.flush_interval_s) {
        out_.flush();
        last_flush_s_ = wall_now_s;
    }
    if (!out_) {
        spdlog::error("recording: write to '{}' failed, recording stopped", path_);
        out_.close();
    }
}

void SessionRecorder::recordCommand(const HapticCommand& cmd, double wall_now_s) {
    RecordingEntry e;
    e.time_delta_s = std::max(0.0, wall_now_s - start_wall_s_);
    e.kind = RecordingEntryKind::Command;
    e.intensity_0_1 = clamp01(cmd.intensity_0_1);
    e.duration_s = std::max(0.0, cmd.duration_s);
    e.target = cmd.device_target;
    write(e, wall_now_s);
}

void SessionRecorder::remark(const std::string& text, double wall_now_s) {
    RecordingEntry e;
    e.time_delta_s = std::max(0.0, wall_now_s - start_wall_s_);
    e.kind = RecordingEntryKind::Remark;
    for (char c : text) e.text.push_back(c == '\n' || c == '\r' ? ' ' : c);
    write(e, wall_now_s);
}

void SessionRecorder::close(double wall_now_s) {
    if (!out_.is_open()) return;
    out_ << kRecordingEndPrefix << formatUtcTimestamp(std::max(wall_now_s, start_wall_s_)) << "\n";
    out_.close();
    spdlog::debug("recording: closed '{}' ({} entries)", path_, entries_);
}

// ---- RecordingReader ----

bool RecordingReader::readHeader() {
    std::string line;
    if (!std::getline(in_, line) || trimLineEnd(line) != kRecordingHeader) {
        last_error_ = path_ + ": first line is not '" + kRecordingHeader + "'";
        return false;
    }
    if (!std::getline(in_, line) || !wire::startsWith(line, kRecordingStartPrefix) ||
        !parseUtcTimestamp(trimLineEnd(line).substr(std::string(kRecordingStartPrefix).size()), &start_wall_s_)) {
        last_error_ = path_ + ": second line is not a session start timestamp";
        return false;
    }
    return true;
}

bool RecordingReader::open(const std::string& path, std::string* err) {
    path_ = path;
    last_error_.clear();
    reached_end_ = false;
    in_.close();
    in_.open(path);
    if (!in_) {
        last_error_ = "cannot open recording '" + path + "'";
    } else if (readHeader()) {
        return true;
    }
    if (err) *err = last_error_;
    return false;
}

bool RecordingReader::rewind() {
    in_.clear();
    in_.seekg(0);
    reached_end_ = false;
    last_error_.clear();
    return readHeader();
}

bool RecordingReader::next(RecordingEntry* out) {
    std::string line;
    while (!reached_end_) {
        if (!std::getline(in_, line)) {
            reached_end_ = true;
            break;
        }
        line = trimLineEnd(line);
        if (line.empty() || line[0] == '#') continue;
        if (wire::startsWith(line, kRecordingEndPrefix)) {
            reached_end_ = true;
            break;
        }
        if (!parseRecordingLine(line, out)) {
            last_error_ = path_ + ": malformed entry '" + line + "'";
            reached_end_ = true;
            return false;
        }
        return true;
    }
    return false;
}

// ---- merge ----

bool mergeRecordings(const std::string& out_path, const std::vector<std::string>& inputs, std::string* err) {
    if (inputs.empty()) {
        if (err) *err = "no recordings to merge";
        return false;
    }
    std::vector<std::unique_ptr<RecordingReader>> readers;
    for (const auto& path : inputs) {
        auto r = std::make_unique<RecordingReader>();
        if (!r->open(path, err)) return false;
        readers.push_back(std::move(r));
    }
    double earliest_s = readers[0]->sessionStart_s();
    for (const auto& r : readers) earliest_s = std::min(earliest_s, r->sessionStart_s());

    std::ofstream out(out_path, std::ios::out | std::ios::trunc);
    if (!out) {
        if (err) *err = "cannot create '" + out_path + "'";
        return false;
    }
    out << kRecordingHeader << "\n" << kRecordingStartPrefix << formatUtcTimestamp(earliest_s) << "\n";

    struct Head {
        RecordingEntry entry;
        bool valid = false;
    };
    std::vector<Head> heads(readers.size());
    double last_delta_s = 0.0;
    while (true) {
        std::size_t oldest = readers.size();
        for (std::size_t i = 0; i < readers.size(); ++i) {
            if (!heads[i].valid && !readers[i]->reachedEnd()) {
                heads[i].valid = readers[i]->next(&heads[i].entry);
                if (!heads[i].valid && !readers[i]->lastError().empty()) {
                    if (err) *err = readers[i]->lastError();
                    return false;
                }
                if (heads[i].valid) heads[i].entry.time_delta_s += readers[i]->sessionStart_s() - earliest_s;
            }
            if (heads[i].valid &&
                (oldest == readers.size() || heads[i].entry.time_delta_s < heads[oldest].entry.time_delta_s)) {
                oldest = i;
            }
        }
        if (oldest == readers.size()) break;
        out << heads[oldest].entry.toLine() << "\n";
        last_delta_s = heads[oldest].entry.time_delta_s;
        heads[oldest].valid = false;
    }
    out << kRecordingEndPrefix << formatUtcTimestamp(earliest_s + last_delta_s) << "\n";
    out.close();
    if (!out) {
        if (err) *err = "write to '" + out_path + "' failed";
        return false;
    }
    return true;
}

} // namespace rh
