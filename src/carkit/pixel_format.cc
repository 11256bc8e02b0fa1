#include "carkit/pixel_format.h"

namespace carkit {
namespace {

    struct PixelFormatRow final {
        PixelFormat tag;
        PixelFormatInfo info;
    };

    static constexpr PixelFormatRow kRasterFormats[] = {
        { PixelFormat::Argb, { PixelLayout::Bgra8, 4, 1, true, true } },
        { PixelFormat::Ga8, { PixelLayout::GrayAlpha8, 2, 1, true, true } },
        { PixelFormat::G8, { PixelLayout::Gray8, 1, 1, false, false } },
        { PixelFormat::Rgbw, { PixelLayout::Bgra16, 4, 2, true, true } },
        { PixelFormat::Ga16, { PixelLayout::GrayAlpha16, 2, 2, true, true } },
    };

}  // namespace


bool
lookup_pixel_format(uint32_t tag, PixelFormatInfo* out) noexcept
{
    for (const PixelFormatRow& row : kRasterFormats) {
        if (static_cast<uint32_t>(row.tag) == tag) {
            if (out) {
                *out = row.info;
            }
            return true;
        }
    }
    return false;
}


uint32_t
pixel_layout_bytes_per_pixel(PixelLayout layout) noexcept
{
    switch (layout) {
    case PixelLayout::Unknown: return 0;
    case PixelLayout::Bgra8: return 4;
    case PixelLayout::GrayAlpha8: return 2;
    case PixelLayout::Gray8: return 1;
    case PixelLayout::Bgra16: return 8;
    case PixelLayout::GrayAlpha16: return 4;
    case PixelLayout::Rgba8: return 4;
    }
    return 0;
}


bool
is_embedded_codec_format(uint32_t tag) noexcept
{
    return tag == static_cast<uint32_t>(PixelFormat::Jpeg)
           || tag == static_cast<uint32_t>(PixelFormat::Heif);
}

}  // namespace carkit
