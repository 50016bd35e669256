#pragma once

// audio/sndfile_source.h
//
// File-bound AudioSource over libsndfile.
//
// Notes:
//   - Any format libsndfile decodes (wav, flac, ogg, ...); samples read as float.
//   - seek() past the end is clamped: the next read reports end of stream.
//   - Decode errors surface as a negative readFrames() with sf_strerror() text.

#include <memory>
#include <string>

#include <sndfile.h>

#include "ImpulseExtractor.h"

namespace rh {
namespace audio {

class SndFileSource final : public AudioSource {
public:
    static std::unique_ptr<SndFileSource> open(const std::string& path, std::string* err);
    ~SndFileSource() override;

    SndFileSource(const SndFileSource&) = delete;
    SndFileSource& operator=(const SndFileSource&) = delete;

    int sampleRate_hz() const override { return info_.samplerate; }
    int channelCount() const override { return info_.channels; }
    bool isLive() const override { return false; }
    bool seek(double offset_s) override;
    long readFrames(float* interleaved, long max_frames) override;
    std::string lastError() const override { return last_error_; }
    void interrupt() override { interrupted_ = true; }

    double duration_s() const;
    const std::string& path() const { return path_; }

private:
    SndFileSource(std::string path, SNDFILE* file, const SF_INFO& info);

    std::string path_;
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
    bool interrupted_ = false;
    std::string last_error_;
};

} // namespace audio
} // namespace rh
