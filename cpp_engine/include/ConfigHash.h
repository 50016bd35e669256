#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

namespace rh {

// FNV-1a32 over explicit field lists (fixed order) for config audit hashes.
static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}
static inline std::uint32_t fnv1a32_add_str(std::uint32_t h, const std::string& s) {
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(s.size()));
    return fnv1a32_update(h, s.data(), s.size());
}

static inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

// Bounded snprintf appender used by the exportConfigText() family.
class TextAppender {
public:
    TextAppender(char* buf, int cap) : buf_(buf), cap_(cap) {
        if (buf_ && cap_ > 0) buf_[0] = '\0';
    }

    template <typename... Args>
    void app(const char* fmt, Args... args) {
        if (!buf_ || n_ >= cap_) return;
        const int w = std::snprintf(buf_ + n_, static_cast<std::size_t>(cap_ - n_), fmt, args...);
        if (w > 0) n_ += std::min(w, cap_ - n_);
    }

    int written() const { return std::min(n_, cap_ > 0 ? cap_ - 1 : 0); }

private:
    char* buf_ = nullptr;
    int cap_ = 0;
    int n_ = 0;
};

} // namespace rh
