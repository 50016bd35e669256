#include "sndfile_source.h"

#include <algorithm>
#include <cmath>

namespace rh {
namespace audio {

std::unique_ptr<SndFileSource> SndFileSource::open(const std::string& path, std::string* err) {
    SF_INFO info{};
    SNDFILE* f = sf_open(path.c_str(), SFM_READ, &info);
    if (!f) {
        if (err) *err = path + ": " + sf_strerror(nullptr);
        return nullptr;
    }
    if (info.channels <= 0 || info.samplerate <= 0 || info.frames <= 0) {
        sf_close(f);
        if (err) *err = path + ": no audio frames";
        return nullptr;
    }
    return std::unique_ptr<SndFileSource>(new SndFileSource(path, f, info));
}

SndFileSource::SndFileSource(std::string path, SNDFILE* file, const SF_INFO& info)
    : path_(std::move(path)), file_(file), info_(info) {}

SndFileSource::~SndFileSource() {
    if (file_) sf_close(file_);
}

double SndFileSource::duration_s() const {
    return static_cast<double>(info_.frames) / static_cast<double>(info_.samplerate);
}

bool SndFileSource::seek(double offset_s) {
    if (!std::isfinite(offset_s) || offset_s < 0.0) offset_s = 0.0;
    const sf_count_t frame = std::min<sf_count_t>(
        static_cast<sf_count_t>(std::llround(offset_s * static_cast<double>(info_.samplerate))), info_.frames);
    if (sf_seek(file_, frame, SEEK_SET) < 0) {
        last_error_ = sf_strerror(file_);
        return false;
    }
    interrupted_ = false;
    return true;
}

long SndFileSource::readFrames(float* interleaved, long max_frames) {
    if (interrupted_ || max_frames <= 0) return 0;
    const sf_count_t n = sf_readf_float(file_, interleaved, static_cast<sf_count_t>(max_frames));
    if (n < 0 || sf_error(file_) != SF_ERR_NO_ERROR) {
        last_error_ = sf_strerror(file_);
        return -1;
    }
    return static_cast<long>(n);
}

} // namespace audio
} // namespace rh
