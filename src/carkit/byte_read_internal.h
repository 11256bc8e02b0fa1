#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace carkit::detail {

inline uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
in_bounds(std::span<const std::byte> bytes, uint64_t offset,
          uint64_t size) noexcept
{
    const uint64_t total = static_cast<uint64_t>(bytes.size());
    if (offset > total) {
        return false;
    }
    return size <= total - offset;
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || !in_bounds(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset]) << 8)
                                 | u8(bytes[offset + 1]));
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || !in_bounds(bytes, offset, 4)) {
        return false;
    }
    uint32_t v = 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 0])) << 24;
    v |= static_cast<uint32_t>(u8(bytes[offset + 1])) << 16;
    v |= static_cast<uint32_t>(u8(bytes[offset + 2])) << 8;
    v |= static_cast<uint32_t>(u8(bytes[offset + 3])) << 0;
    *out = v;
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || !in_bounds(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>(u8(bytes[offset])
                                 | (u8(bytes[offset + 1]) << 8));
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || !in_bounds(bytes, offset, 4)) {
        return false;
    }
    uint32_t v = 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 0])) << 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 1])) << 8;
    v |= static_cast<uint32_t>(u8(bytes[offset + 2])) << 16;
    v |= static_cast<uint32_t>(u8(bytes[offset + 3])) << 24;
    *out = v;
    return true;
}


inline bool
read_u64le(std::span<const std::byte> bytes, uint64_t offset,
           uint64_t* out) noexcept
{
    uint32_t lo = 0;
    uint32_t hi = 0;
    if (!out || !read_u32le(bytes, offset, &lo)
        || !read_u32le(bytes, offset + 4, &hi)) {
        return false;
    }
    *out = (static_cast<uint64_t>(hi) << 32) | lo;
    return true;
}


// Compares 4 bytes at `offset` with the ASCII tag `s` (as stored on disk).
inline bool
match_tag(std::span<const std::byte> bytes, uint64_t offset,
          const char* s) noexcept
{
    if (!s || !in_bounds(bytes, offset, 4)) {
        return false;
    }
    for (uint64_t i = 0; i < 4; ++i) {
        if (u8(bytes[offset + i]) != static_cast<uint8_t>(s[i])) {
            return false;
        }
    }
    return true;
}


// Reads a NUL-padded fixed-size character field.
inline std::string
padded_string(std::span<const std::byte> bytes, uint64_t offset,
              uint64_t size)
{
    std::string out;
    if (!in_bounds(bytes, offset, size)) {
        return out;
    }
    for (uint64_t i = 0; i < size; ++i) {
        const uint8_t c = u8(bytes[offset + i]);
        if (c == 0) {
            break;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

}  // namespace carkit::detail
