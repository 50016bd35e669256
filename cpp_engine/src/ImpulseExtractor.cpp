#include "ImpulseExtractor.h"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "ConfigHash.h"

namespace rh {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Weighted band mix used for the "all" level (bass is felt, treble is heard).
constexpr double kAllMixBass = 0.25;
constexpr double kAllMixMid = 0.45;
constexpr double kAllMixTreble = 0.5;

// Offsets closer than this are treated as the same position.
constexpr double kSameOffsetEps_s = 1e-6;

static inline double onePoleAlpha(double cutoff_hz, double rate_hz) {
    if (!(cutoff_hz > 0.0) || !(rate_hz > 0.0)) return 1.0;
    const double a = 1.0 - std::exp(-2.0 * kPi * cutoff_hz / rate_hz);
    return std::clamp(a, 0.0, 1.0);
}

static inline double compressLevel(double rms, double k) {
    if (!std::isfinite(rms) || rms <= 0.0) return 0.0;
    if (!(k > 0.0)) return clamp01(rms);
    return clamp01(std::log1p(k * rms) / std::log1p(k));
}

} // namespace

// ---- MemoryAudioSource ----

MemoryAudioSource::MemoryAudioSource(std::vector<float> interleaved, int sample_rate_hz, int channels)
    : samples_(std::move(interleaved)), sample_rate_hz_(sample_rate_hz), channels_(channels) {}

long MemoryAudioSource::frameCount() const {
    if (channels_ <= 0) return 0;
    return static_cast<long>(samples_.size() / static_cast<std::size_t>(channels_));
}

bool MemoryAudioSource::seek(double offset_s) {
    if (!std::isfinite(offset_s) || offset_s < 0.0 || sample_rate_hz_ <= 0) {
        last_error_ = "invalid seek offset";
        return false;
    }
    const long frame = static_cast<long>(std::llround(offset_s * sample_rate_hz_));
    cursor_ = std::min(frame, frameCount());
    return true;
}

long MemoryAudioSource::readFrames(float* interleaved, long max_frames) {
    if (!interleaved || max_frames <= 0 || channels_ <= 0) return 0;
    const long total = frameCount();
    const long n = std::min(max_frames, total - cursor_);
    if (n <= 0) return 0;
    if (fail_frame_ >= 0 && fail_frame_ >= cursor_ && fail_frame_ < cursor_ + n) {
        last_error_ = "corrupt frame " + std::to_string(fail_frame_);
        return -1;
    }
    const std::size_t begin = static_cast<std::size_t>(cursor_) * static_cast<std::size_t>(channels_);
    const std::size_t count = static_cast<std::size_t>(n) * static_cast<std::size_t>(channels_);
    std::copy(samples_.begin() + begin, samples_.begin() + begin + count, interleaved);
    cursor_ += n;
    return n;
}

// ---- Config ----

std::uint32_t computeDetectorConfigHash(const ImpulseDetectorConfigV1& c) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, c.version_u32);
    h = fnv1a32_add_u32(h, c.size_bytes_u32);
    h = fnv1a32_add_u32(h, c.hop_frames_u32);
    h = fnv1a32_add_f64(h, c.bass_cutoff_hz);
    h = fnv1a32_add_f64(h, c.treble_cutoff_hz);
    h = fnv1a32_add_f64(h, c.compress_k);
    h = fnv1a32_add_f64(h, c.threshold_k);
    h = fnv1a32_add_f64(h, c.threshold_floor_0_1);
    h = fnv1a32_add_f64(h, c.history_s);
    h = fnv1a32_add_f64(h, c.min_interval_s);
    h = fnv1a32_add_u32(h, c.band_mask_u32);
    return h;
}

std::uint32_t bandMaskFor(FrequencyBand b) {
    if (b == FrequencyBand::Count) return 0u;
    return 1u << static_cast<std::uint32_t>(b);
}

// ---- ImpulseExtractor ----

ImpulseExtractor::ImpulseExtractor(AudioSource& source, const ImpulseDetectorConfigV1& cfg)
    : source_(source), cfg_(cfg) {
    if (cfg_.hop_frames_u32 < 16u) cfg_.hop_frames_u32 = 16u;
    if (!(cfg_.min_interval_s >= 0.0)) cfg_.min_interval_s = 0.0;
    if ((cfg_.band_mask_u32 & ((1u << kNumFrequencyBands) - 1u)) == 0u) {
        cfg_.band_mask_u32 = bandMaskFor(FrequencyBand::All);
    }
    cfg_.fnv_hash_u32 = computeDetectorConfigHash(cfg_);
    resetDetector();
}

void ImpulseExtractor::resetDetector() {
    const int rate = source_.sampleRate_hz();
    const int ch = source_.channelCount();
    hop_buf_.assign(static_cast<std::size_t>(cfg_.hop_frames_u32) * static_cast<std::size_t>(ch > 0 ? ch : 1), 0.0f);

    alpha_bass_ = onePoleAlpha(cfg_.bass_cutoff_hz, rate);
    alpha_treble_ = onePoleAlpha(cfg_.treble_cutoff_hz, rate);
    lp_bass_ = 0.0;
    lp_treble_ = 0.0;

    double hops_per_s = 0.0;
    if (rate > 0) hops_per_s = static_cast<double>(rate) / static_cast<double>(cfg_.hop_frames_u32);
    const double hl = std::max(1.0, std::round(cfg_.history_s * hops_per_s));
    history_len_ = static_cast<std::size_t>(hl);

    for (auto& b : bands_) b = BandState{};
    pending_.clear();
    frames_consumed_ = 0;
    end_of_stream_ = false;
}

double ImpulseExtractor::consumedTime_s() const {
    const int rate = source_.sampleRate_hz();
    if (rate <= 0) return pass_offset_s_;
    return pass_offset_s_ + static_cast<double>(frames_consumed_) / static_cast<double>(rate);
}

void ImpulseExtractor::fail(ErrorCode code, const std::string& text) {
    failed_ = true;
    failed_pass_known_ = true;
    failed_offset_s_ = pass_offset_s_;
    last_error_ = code;
    last_error_text_ = text;
    pending_.clear();
    spdlog::error("impulse extractor: {} at offset {:.3f}s: {}", errorCodeName(code), pass_offset_s_, text);
}

bool ImpulseExtractor::validateSource() {
    if (source_.sampleRate_hz() <= 0 || source_.channelCount() <= 0) {
        fail(ErrorCode::DecodeError, "unsupported audio format");
        return false;
    }
    return true;
}

bool ImpulseExtractor::restart(double offset_s) {
    if (!std::isfinite(offset_s) || offset_s < 0.0) offset_s = 0.0;

    if (failed_pass_known_ && std::abs(offset_s - failed_offset_s_) < kSameOffsetEps_s) {
        last_error_ = ErrorCode::DecodeError;
        last_error_text_ = "restart refused: previous pass failed at this offset";
        spdlog::warn("impulse extractor: restart at {:.3f}s refused (failed before)", offset_s);
        return false;
    }

    if (!source_.seek(offset_s)) {
        pass_offset_s_ = offset_s;
        fail(ErrorCode::DecodeError, "seek failed: " + source_.lastError());
        return false;
    }

    pass_offset_s_ = offset_s;
    ++pass_id_;
    failed_ = false;
    last_error_ = ErrorCode::None;
    last_error_text_.clear();
    resetDetector();
    spdlog::debug("impulse extractor: pass {} from {:.3f}s", pass_id_, offset_s);
    return true;
}

void ImpulseExtractor::evaluateCandidate(int band, double onset_now, double* thr_out) {
    BandState& s = bands_[static_cast<std::size_t>(band)];

    double mean = 0.0;
    double var = 0.0;
    if (!s.history.empty()) {
        for (double v : s.history) mean += v;
        mean /= static_cast<double>(s.history.size());
        for (double v : s.history) var += (v - mean) * (v - mean);
        var /= static_cast<double>(s.history.size());
    }
    const double thr = std::max(cfg_.threshold_floor_0_1, mean + cfg_.threshold_k * std::sqrt(var));
    if (thr_out) *thr_out = thr;

    if (!s.has_prev) return;

    const bool local_max = (s.onset_prev > s.onset_prev2) && (s.onset_prev >= onset_now);
    if (local_max && s.onset_prev > thr) {
        if (s.t_prev_s - s.last_emit_t_s >= cfg_.min_interval_s && s.t_prev_s > s.last_emit_t_s) {
            ImpulseEvent ev;
            ev.timestamp_s = s.t_prev_s;
            ev.magnitude_0_1 = clamp01(s.level_prev);
            ev.channel = band;
            pending_.push_back(ev);
            s.last_emit_t_s = s.t_prev_s;
        }
    }

    s.history.push_back(s.onset_prev);
    while (s.history.size() > history_len_) s.history.pop_front();
}

void ImpulseExtractor::processHop(long frames) {
    const int ch = source_.channelCount();
    const double t_hop_s = consumedTime_s();

    double acc_bass = 0.0;
    double acc_mid = 0.0;
    double acc_treble = 0.0;
    for (long f = 0; f < frames; ++f) {
        double mono = 0.0;
        const float* frame = hop_buf_.data() + static_cast<std::size_t>(f) * static_cast<std::size_t>(ch);
        for (int c = 0; c < ch; ++c) mono += static_cast<double>(frame[c]);
        mono /= static_cast<double>(ch);
        if (!std::isfinite(mono)) mono = 0.0;

        lp_bass_ += alpha_bass_ * (mono - lp_bass_);
        lp_treble_ += alpha_treble_ * (mono - lp_treble_);
        const double bass = lp_bass_;
        const double mid = lp_treble_ - lp_bass_;
        const double treble = mono - lp_treble_;
        acc_bass += bass * bass;
        acc_mid += mid * mid;
        acc_treble += treble * treble;
    }
    frames_consumed_ += frames;

    const double inv_n = 1.0 / static_cast<double>(frames);
    std::array<double, kNumFrequencyBands> level{};
    level[static_cast<std::size_t>(FrequencyBand::Bass)] = compressLevel(std::sqrt(acc_bass * inv_n), cfg_.compress_k);
    level[static_cast<std::size_t>(FrequencyBand::Mid)] = compressLevel(std::sqrt(acc_mid * inv_n), cfg_.compress_k);
    level[static_cast<std::size_t>(FrequencyBand::Treble)] = compressLevel(std::sqrt(acc_treble * inv_n), cfg_.compress_k);
    level[static_cast<std::size_t>(FrequencyBand::All)] =
        clamp01(kAllMixBass * level[static_cast<std::size_t>(FrequencyBand::Bass)] +
                kAllMixMid * level[static_cast<std::size_t>(FrequencyBand::Mid)] +
                kAllMixTreble * level[static_cast<std::size_t>(FrequencyBand::Treble)]);

    ExtractorFrameV1 trace;
    trace.t_s = t_hop_s;

    for (int b = 0; b < kNumFrequencyBands; ++b) {
        BandState& s = bands_[static_cast<std::size_t>(b)];
        const double lv = level[static_cast<std::size_t>(b)];
        const double onset = std::max(0.0, lv - s.prev_level);
        s.prev_level = lv;

        double thr = cfg_.threshold_floor_0_1;
        if (cfg_.band_mask_u32 & (1u << static_cast<std::uint32_t>(b))) {
            evaluateCandidate(b, onset, &thr);
        }

        s.onset_prev2 = s.onset_prev;
        s.onset_prev = onset;
        s.level_prev = lv;
        s.t_prev_s = t_hop_s;
        s.has_prev = true;

        trace.level_0_1[static_cast<std::size_t>(b)] = static_cast<float>(lv);
        trace.onset[static_cast<std::size_t>(b)] = static_cast<float>(onset);
        trace.threshold[static_cast<std::size_t>(b)] = static_cast<float>(thr);
    }

    if (observer_) observer_(trace);
}

void ImpulseExtractor::finishPass() {
    // The last hop can still be a peak: compare it against silence.
    for (int b = 0; b < kNumFrequencyBands; ++b) {
        if (cfg_.band_mask_u32 & (1u << static_cast<std::uint32_t>(b))) {
            evaluateCandidate(b, 0.0, nullptr);
        }
        bands_[static_cast<std::size_t>(b)].has_prev = false;
    }
    end_of_stream_ = true;
}

ExtractStatus ImpulseExtractor::nextImpulse(ImpulseEvent* out) {
    if (failed_) return ExtractStatus::Error;

    while (pending_.empty()) {
        if (end_of_stream_) return ExtractStatus::EndOfStream;
        if (!validateSource()) return ExtractStatus::Error;

        const long want = static_cast<long>(cfg_.hop_frames_u32);
        const long got = source_.readFrames(hop_buf_.data(), want);
        if (got < 0) {
            fail(ErrorCode::DecodeError, source_.lastError());
            return ExtractStatus::Error;
        }
        if (got == 0) {
            finishPass();
            continue;
        }
        processHop(got);
    }

    // Bands that fired on the same hop are emitted in band order.
    if (out) *out = pending_.front();
    pending_.pop_front();
    return ExtractStatus::Impulse;
}

} // namespace rh
