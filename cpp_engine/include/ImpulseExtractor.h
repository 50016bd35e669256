#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "HapticsTypes.h"

namespace rh {

// ============================================================
// Audio input seam
//
// - Interleaved float PCM in [-1, 1].
// - readFrames() returns frames read, 0 at end of stream, negative on decode failure.
// - Live sources treat seek() as "new time origin" and never report end of stream.
// ============================================================
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual int sampleRate_hz() const = 0;
    virtual int channelCount() const = 0;
    virtual bool isLive() const = 0;
    virtual bool seek(double offset_s) = 0;
    virtual long readFrames(float* interleaved, long max_frames) = 0;
    virtual std::string lastError() const { return std::string(); }
    // Unblocks a pending readFrames(); later reads report end of stream.
    virtual void interrupt() {}
};

// Fully buffered source. Used by tests, the monitor's synthetic signal and as the
// decoded form of small clips.
class MemoryAudioSource final : public AudioSource {
public:
    MemoryAudioSource(std::vector<float> interleaved, int sample_rate_hz, int channels);

    int sampleRate_hz() const override { return sample_rate_hz_; }
    int channelCount() const override { return channels_; }
    bool isLive() const override { return false; }
    bool seek(double offset_s) override;
    long readFrames(float* interleaved, long max_frames) override;
    std::string lastError() const override { return last_error_; }

    // Simulates a corrupt region: any read that touches frame_index fails.
    void injectDecodeFailureAt(long frame_index) { fail_frame_ = frame_index; }

    long frameCount() const;
    long cursorFrame() const { return cursor_; }

private:
    std::vector<float> samples_;
    int sample_rate_hz_ = 0;
    int channels_ = 0;
    long cursor_ = 0;
    long fail_frame_ = -1;
    std::string last_error_;
};

// ============================================================
// Detector configuration (versioned, hashable)
// ============================================================
struct ImpulseDetectorConfigV1 {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ImpulseDetectorConfigV1);
    std::uint32_t fnv_hash_u32 = 0;

    std::uint32_t hop_frames_u32 = 512;
    double bass_cutoff_hz = 150.0;
    double treble_cutoff_hz = 4000.0;

    // Level compression: log1p(k*rms) / log1p(k).
    double compress_k = 100.0;

    // Adaptive threshold: max(floor, mean + k * stddev) over the onset history.
    double threshold_k = 1.5;
    double threshold_floor_0_1 = 0.02;
    double history_s = 0.5;

    // Per-band refractory interval between impulses.
    double min_interval_s = 0.05;

    // Bit i enables FrequencyBand i.
    std::uint32_t band_mask_u32 = 1u << static_cast<std::uint32_t>(FrequencyBand::All);
};

std::uint32_t computeDetectorConfigHash(const ImpulseDetectorConfigV1& c);
std::uint32_t bandMaskFor(FrequencyBand b);

// Per-hop detector trace, for tuning displays.
struct ExtractorFrameV1 {
    double t_s = 0.0;
    std::array<float, kNumFrequencyBands> level_0_1{{0.0f}};
    std::array<float, kNumFrequencyBands> onset{{0.0f}};
    std::array<float, kNumFrequencyBands> threshold{{0.0f}};
};

enum class ExtractStatus : std::uint32_t {
    Impulse = 0,
    EndOfStream,
    Error,
};

// Pull-based transient detector. Reads only as much audio as needed to produce the
// next impulse. A pass starts at an offset (restart) and yields media-relative
// timestamps (offset + frames / rate). Not thread-safe; one owner thread.
class ImpulseExtractor {
public:
    using FrameObserver = std::function<void(const ExtractorFrameV1&)>;

    ImpulseExtractor(AudioSource& source, const ImpulseDetectorConfigV1& cfg);

    ImpulseExtractor(const ImpulseExtractor&) = delete;
    ImpulseExtractor& operator=(const ImpulseExtractor&) = delete;

    ExtractStatus nextImpulse(ImpulseEvent* out);

    // Starts a new pass at offset_s; previous pass state is discarded, not drained.
    // Refused when the previous pass failed at this same offset.
    bool restart(double offset_s);

    ErrorCode lastError() const noexcept { return last_error_; }
    const std::string& lastErrorText() const noexcept { return last_error_text_; }

    double passOffset_s() const noexcept { return pass_offset_s_; }
    // Media-relative time of the audio consumed so far in this pass.
    double consumedTime_s() const;
    std::uint64_t passId() const noexcept { return pass_id_; }

    void setFrameObserver(FrameObserver fn) { observer_ = std::move(fn); }
    const ImpulseDetectorConfigV1& config() const noexcept { return cfg_; }

private:
    struct BandState {
        double prev_level = 0.0;
        double onset_prev2 = 0.0;
        double onset_prev = 0.0;
        double level_prev = 0.0;
        double t_prev_s = 0.0;
        bool has_prev = false;
        std::deque<double> history;
        double last_emit_t_s = -1.0e300;
    };

    void resetDetector();
    bool validateSource();
    void processHop(long frames);
    void evaluateCandidate(int band, double onset_now, double* thr_out);
    void finishPass();
    void fail(ErrorCode code, const std::string& text);

    AudioSource& source_;
    ImpulseDetectorConfigV1 cfg_;
    FrameObserver observer_;

    std::vector<float> hop_buf_;
    std::array<BandState, kNumFrequencyBands> bands_;
    std::size_t history_len_ = 1;
    double alpha_bass_ = 0.0;
    double alpha_treble_ = 0.0;
    double lp_bass_ = 0.0;
    double lp_treble_ = 0.0;

    std::deque<ImpulseEvent> pending_;

    double pass_offset_s_ = 0.0;
    long frames_consumed_ = 0;
    std::uint64_t pass_id_ = 0;
    bool end_of_stream_ = false;
    bool failed_ = false;
    bool failed_pass_known_ = false;
    double failed_offset_s_ = 0.0;

    ErrorCode last_error_ = ErrorCode::None;
    std::string last_error_text_;
};

} // namespace rh
