#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

namespace util {

inline uint32_t read_u32_le(const uint8_t* p) {
    return p[0] |
           (static_cast<uint32_t>(p[1]) << 8)  |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline uint64_t read_u64_le(const uint8_t* p) {
    return static_cast<uint64_t>(read_u32_le(p)) |
           (static_cast<uint64_t>(read_u32_le(p + 4)) << 32);
}

// IEEE-754 reinterpretation; NaN and Inf pass through unchanged
inline float read_f32_le(const uint8_t* p) {
    uint32_t bits = read_u32_le(p);
    float v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

inline double read_f64_le(const uint8_t* p) {
    uint64_t bits = read_u64_le(p);
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

inline std::string format_hex(const uint8_t* p, size_t len) {
    std::string result;
    result.reserve(len * 3);
    char buf[4];
    for (size_t i = 0; i < len; ++i) {
        if (i > 0) result += ':';
        snprintf(buf, sizeof(buf), "%02x", p[i]);
        result += buf;
    }
    return result;
}

inline bool starts_with(const uint8_t* p, size_t len, const char* prefix) {
    size_t n = std::strlen(prefix);
    return len >= n && std::memcmp(p, prefix, n) == 0;
}

} // namespace util
