#include "pulse_capture_source.h"

#include <algorithm>

#include <pulse/error.h>
#include <pulse/simple.h>

#include <spdlog/spdlog.h>

namespace rh {
namespace audio {

std::unique_ptr<PulseCaptureSource> PulseCaptureSource::open(const std::string& source, int rate_hz,
                                                             std::string* err) {
    if (rate_hz <= 0) rate_hz = 44100;

    pa_sample_spec spec{};
    spec.format = PA_SAMPLE_FLOAT32LE;
    spec.rate = static_cast<std::uint32_t>(rate_hz);
    spec.channels = kChannels;

    // Small fragments keep capture latency near one hop.
    pa_buffer_attr attr{};
    attr.maxlength = static_cast<std::uint32_t>(-1);
    attr.fragsize = static_cast<std::uint32_t>(kMaxReadFrames * kChannels * sizeof(float));

    const std::string dev = source.empty() ? std::string("@DEFAULT_MONITOR@") : source;
    int error = 0;
    pa_simple* s = pa_simple_new(nullptr, "remote-haptics", PA_STREAM_RECORD, dev.c_str(), "impulse capture", &spec,
                                 nullptr, &attr, &error);
    if (!s) {
        if (err) *err = "pulseaudio: cannot record from " + dev + ": " + pa_strerror(error);
        return nullptr;
    }
    spdlog::info("audio: capturing {} at {} Hz", dev, rate_hz);
    return std::unique_ptr<PulseCaptureSource>(new PulseCaptureSource(s, rate_hz));
}

PulseCaptureSource::PulseCaptureSource(pa_simple* stream, int rate_hz) : stream_(stream), rate_hz_(rate_hz) {}

PulseCaptureSource::~PulseCaptureSource() {
    if (stream_) pa_simple_free(stream_);
}

bool PulseCaptureSource::seek(double /*offset_s*/) {
    int error = 0;
    if (pa_simple_flush(stream_, &error) < 0) {
        last_error_ = pa_strerror(error);
        return false;
    }
    interrupted_.store(false);
    return true;
}

long PulseCaptureSource::readFrames(float* interleaved, long max_frames) {
    if (interrupted_.load() || max_frames <= 0) return 0;
    const long frames = std::min(max_frames, kMaxReadFrames);
    int error = 0;
    if (pa_simple_read(stream_, interleaved, static_cast<std::size_t>(frames) * kChannels * sizeof(float), &error) <
        0) {
        last_error_ = std::string("pulseaudio read failed: ") + pa_strerror(error);
        return -1;
    }
    return frames;
}

} // namespace audio
} // namespace rh
