#ifndef RESTORE_CORE_UTIL_H
#define RESTORE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(high_resolution_clock::now().time_since_epoch()).count();
}
#endif

namespace restore {

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

} // namespace restore

#endif // RESTORE_CORE_UTIL_H
