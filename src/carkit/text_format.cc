#include "carkit/text_format.h"

#include <cstdio>

namespace carkit {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        const char* esc = nullptr;
        switch (c) {
        case '\n': esc = "\\n"; break;
        case '\r': esc = "\\r"; break;
        case '\t': esc = "\\t"; break;
        default: break;
        }
        if (esc) {
            out->append(esc);
            escaped = true;
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    static constexpr char kHex[] = "0123456789ABCDEF";
    const uint32_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                           ? static_cast<uint32_t>(bytes.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t v = static_cast<uint8_t>(bytes[i]);
        out->push_back(kHex[v >> 4]);
        out->push_back(kHex[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_fourcc(uint32_t tag, std::string* out) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        const unsigned char c = static_cast<unsigned char>((tag >> shift)
                                                           & 0xFFU);
        out->push_back((c >= 0x20U && c < 0x7FU) ? static_cast<char>(c) : '.');
    }
}

}  // namespace carkit
