#pragma once

#include <cstdint>

/**
 * \file pixel_format.h
 * \brief Pixel format tags used by CSI rendition headers and their raster
 * layouts.
 */

namespace carkit {

/**
 * \brief Four-character pixel format tags (stored little-endian, so the
 * numeric value reads as the tag text).
 *
 * The enumeration is open: values outside this list are kept as raw integers.
 */
enum class PixelFormat : uint32_t {
    None = 0,
    /// `ARGB`: 8-bit BGRA, premultiplied.
    Argb = 0x41524742U,
    /// `GA8 `: 8-bit gray + alpha, premultiplied.
    Ga8 = 0x47413820U,
    /// `G8  `: 8-bit gray.
    G8 = 0x47382020U,
    /// `RGBW`: 16-bit BGRA, premultiplied.
    Rgbw = 0x52474257U,
    /// `GA16`: 16-bit gray + alpha, premultiplied.
    Ga16 = 0x47413136U,
    /// `DATA`: opaque data payload.
    Data = 0x44415441U,
    /// `JPEG`: embedded JPEG stream.
    Jpeg = 0x4A504547U,
    /// `HEIF`: embedded HEIF stream.
    Heif = 0x48454946U,
};

/// In-memory raster layouts produced by the rendition decoder.
enum class PixelLayout : uint8_t {
    Unknown,
    /// B, G, R, A bytes.
    Bgra8,
    /// Gray, alpha bytes.
    GrayAlpha8,
    /// One gray byte.
    Gray8,
    /// B, G, R, A as little-endian u16.
    Bgra16,
    /// Gray, alpha as little-endian u16.
    GrayAlpha16,
    /// R, G, B, A bytes (embedded codec output and sink format).
    Rgba8,
};

/// Channel order, depth and alpha handling of one raster pixel format.
struct PixelFormatInfo final {
    PixelLayout layout         = PixelLayout::Unknown;
    uint8_t channels           = 0;
    uint8_t bytes_per_channel  = 0;
    bool has_alpha             = false;
    bool premultiplied         = false;
};

/// Looks up a raster pixel format. Returns false for non-raster and unknown
/// tags.
bool
lookup_pixel_format(uint32_t tag, PixelFormatInfo* out) noexcept;

/// Bytes per pixel of \p layout (0 for \ref PixelLayout::Unknown).
uint32_t
pixel_layout_bytes_per_pixel(PixelLayout layout) noexcept;

/// True for tags whose payload is an embedded standard image stream.
bool
is_embedded_codec_format(uint32_t tag) noexcept;

}  // namespace carkit
