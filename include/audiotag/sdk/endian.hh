#ifndef AUDIOTAG_SDK_ENDIAN_H
#define AUDIOTAG_SDK_ENDIAN_H

#include <audiotag/sdk/types.hh>
#include <audiotag/audiotag_config.h>
#include <cstring>

namespace audiotag {

// Platform endianness detection using CMake-generated config
#if AUDIOTAG_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

// Byte swapping functions
inline uint16_t swap16(uint16_t x) {
    return static_cast<uint16_t>((x << 8) | (x >> 8));
}

inline uint32_t swap32(uint32_t x) {
    return ((x << 24) | ((x << 8) & 0x00FF0000) |
            ((x >> 8) & 0x0000FF00) | (x >> 24));
}

inline uint64_t swap64(uint64_t x) {
    return ((x << 56) |
            ((x << 40) & 0x00FF000000000000ULL) |
            ((x << 24) & 0x0000FF0000000000ULL) |
            ((x << 8)  & 0x000000FF00000000ULL) |
            ((x >> 8)  & 0x00000000FF000000ULL) |
            ((x >> 24) & 0x0000000000FF0000ULL) |
            ((x >> 40) & 0x000000000000FF00ULL) |
            (x >> 56));
}

// Conditional byte swapping based on platform
inline uint16_t swap16le(uint16_t x) {
    return is_little_endian ? x : swap16(x);
}

inline uint16_t swap16be(uint16_t x) {
    return is_big_endian ? x : swap16(x);
}

inline uint32_t swap32le(uint32_t x) {
    return is_little_endian ? x : swap32(x);
}

inline uint32_t swap32be(uint32_t x) {
    return is_big_endian ? x : swap32(x);
}

inline uint64_t swap64le(uint64_t x) {
    return is_little_endian ? x : swap64(x);
}

inline uint64_t swap64be(uint64_t x) {
    return is_big_endian ? x : swap64(x);
}

// Unaligned loads from byte buffers. Header structures in OGG and DSF are
// parsed out of raw arrays, so these go through memcpy.
inline uint32_t load32le(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return swap32le(v);
}

inline uint64_t load64le(const uint8_t* p) {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
    return swap64le(v);
}

} // namespace audiotag

#endif // AUDIOTAG_SDK_ENDIAN_H
