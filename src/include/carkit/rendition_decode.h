#pragma once

#include "carkit/car_catalog.h"
#include "carkit/pixel_format.h"
#include "carkit/standard_image_codec.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file rendition_decode.h
 * \brief Decodes rendition payloads into owned raster buffers.
 */

namespace carkit {

/// Per-rendition decode status. All values are recoverable.
enum class RenditionDecodeStatus : uint8_t {
    Ok,
    /// The pixel format tag has no raster mapping.
    UnsupportedPixelFormat,
    /// The compression scheme is not implemented (or its library is absent).
    UnsupportedCompression,
    /// The payload ends before the raster is complete, or would overrun it.
    TruncatedPayload,
    /// An embedded stream decoded to a different size than declared. The
    /// decoded raster is still returned.
    DimensionMismatch,
    /// An embedded stream needs a \ref StandardImageCodec and none was given.
    CodecUnavailable,
    /// The rendition carries no raster (color, data, multisize, ...).
    NotAnImage,
    /// The record or payload is inconsistent.
    Malformed,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/**
 * \brief Decoded raster. Owns its pixels; independent of the container
 * buffer.
 */
struct DecodedImage final {
    uint32_t width     = 0;
    uint32_t height    = 0;
    /// Bytes per row.
    uint32_t stride    = 0;
    PixelLayout layout = PixelLayout::Unknown;
    bool premultiplied = false;
    std::vector<std::byte> pixels;
};

/// Resource limits for \ref decode_rendition.
struct RenditionDecodeLimits final {
    /// Maximum width * height (0 = unlimited).
    uint64_t max_pixels = 1ULL << 28;
    /// Maximum decoded buffer size in bytes (0 = unlimited).
    uint64_t max_output_bytes = 1ULL << 30;
};

/// Options for \ref decode_rendition.
struct RenditionDecodeOptions final {
    /// Codec for embedded standard image streams (not owned, may be null).
    const StandardImageCodec* codec = nullptr;
    RenditionDecodeLimits limits;
};

struct RenditionDecodeResult final {
    RenditionDecodeStatus status = RenditionDecodeStatus::Ok;
    /// Status of the embedded codec call, when one was made.
    CodecStatus codec_status = CodecStatus::Ok;
    /// Payload bytes consumed.
    uint64_t consumed = 0;
    /// Raster bytes produced.
    uint64_t produced = 0;
};

/**
 * \brief Decodes the pixel payload of \p value.
 *
 * Pure function of \p value and \p options; safe to call concurrently. On
 * failure \p out is left empty, except for
 * \ref RenditionDecodeStatus::DimensionMismatch.
 */
RenditionDecodeResult
decode_rendition(const RenditionValue& value, DecodedImage* out,
                 const RenditionDecodeOptions& options
                 = RenditionDecodeOptions {}) noexcept;

/// Normalizes \p in to straight-alpha RGBA8.
RenditionDecodeStatus
convert_to_rgba8(const DecodedImage& in, DecodedImage* out) noexcept;

/// Formats of embedded streams recognized by their signature.
enum class EmbeddedFormat : uint8_t {
    None,
    Png,
    Jpeg,
    Heif,
    Gif,
    Pdf,
};

/// Identifies an embedded stream by its leading bytes.
EmbeddedFormat
sniff_embedded_format(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Returns the raw data bytes carried by \p value.
 *
 * `DWAR` records yield their data; uncompressed `CELM` records yield their
 * data. Other records yield an empty span.
 */
std::span<const std::byte>
rendition_raw_data(const RenditionValue& value) noexcept;

}  // namespace carkit
