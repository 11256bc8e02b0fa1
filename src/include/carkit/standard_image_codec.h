#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file standard_image_codec.h
 * \brief Seam for decoding embedded standard image streams (PNG, JPEG, ...).
 */

namespace carkit {

/// Codec call status.
enum class CodecStatus : uint8_t {
    Ok,
    /// The stream format is not handled by this codec.
    Unsupported,
    /// The stream is corrupt.
    Malformed,
    /// The decoded image would exceed the configured limits.
    LimitExceeded,
};

/// Raster returned by a codec: straight-alpha RGBA8, row-major, tightly packed.
struct CodecImage final {
    uint32_t width  = 0;
    uint32_t height = 0;
    std::vector<std::byte> rgba;
};

/**
 * \brief Decoder for embedded standard image streams.
 *
 * Implementations must be safe to call concurrently through a const
 * reference.
 */
class StandardImageCodec {
public:
    virtual ~StandardImageCodec() = default;

    virtual CodecStatus decode(std::span<const std::byte> bytes,
                               CodecImage* out) const noexcept
        = 0;
};

/// stb_image backed codec (PNG, JPEG, BMP, GIF, TGA).
class StbImageCodec final : public StandardImageCodec {
public:
    /// \p max_pixels caps width * height (0 = unlimited).
    explicit StbImageCodec(uint64_t max_pixels = 0) noexcept;

    CodecStatus decode(std::span<const std::byte> bytes,
                       CodecImage* out) const noexcept override;

private:
    uint64_t max_pixels_ = 0;
};

/// True when the library was built with stb_image support.
bool
stb_codec_available() noexcept;

/**
 * \brief Encodes straight-alpha RGBA8 pixels as a PNG stream.
 *
 * Returns \ref CodecStatus::Unsupported when built without stb_image_write.
 */
CodecStatus
encode_png_rgba8(uint32_t width, uint32_t height,
                 std::span<const std::byte> rgba,
                 std::vector<std::byte>* out) noexcept;

}  // namespace carkit
