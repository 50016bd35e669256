#pragma once

// audio/pulse_capture_source.h
//
// Live AudioSource capturing from PulseAudio (simple API).
//
// Notes:
//   - Default source is the default sink's monitor, i.e. whatever is playing.
//   - float32 interleaved, stereo, fixed rate; reads block for at most one request.
//   - seek() only flushes buffered audio; the extractor owns the time origin.

#include <atomic>
#include <memory>
#include <string>

#include "ImpulseExtractor.h"

struct pa_simple;

namespace rh {
namespace audio {

class PulseCaptureSource final : public AudioSource {
public:
    // source empty = "@DEFAULT_MONITOR@".
    static std::unique_ptr<PulseCaptureSource> open(const std::string& source, int rate_hz, std::string* err);
    ~PulseCaptureSource() override;

    PulseCaptureSource(const PulseCaptureSource&) = delete;
    PulseCaptureSource& operator=(const PulseCaptureSource&) = delete;

    int sampleRate_hz() const override { return rate_hz_; }
    int channelCount() const override { return kChannels; }
    bool isLive() const override { return true; }
    bool seek(double offset_s) override;
    long readFrames(float* interleaved, long max_frames) override;
    std::string lastError() const override { return last_error_; }
    void interrupt() override { interrupted_.store(true); }

private:
    static constexpr int kChannels = 2;
    // Upper bound per blocking read (~23 ms at 44.1 kHz) so interrupt() is prompt.
    static constexpr long kMaxReadFrames = 1024;

    PulseCaptureSource(pa_simple* stream, int rate_hz);

    pa_simple* stream_ = nullptr;
    int rate_hz_ = 0;
    std::atomic<bool> interrupted_{false};
    std::string last_error_;
};

} // namespace audio
} // namespace rh
