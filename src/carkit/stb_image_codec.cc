#include "carkit/standard_image_codec.h"

#include <climits>
#include <cstring>
#include <utility>

#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
#    define STB_IMAGE_IMPLEMENTATION
#    define STBI_NO_STDIO
#    define STBI_NO_HDR
#    define STBI_NO_LINEAR
#    include <stb_image.h>
#    define STB_IMAGE_WRITE_IMPLEMENTATION
#    define STBI_WRITE_NO_STDIO
#    include <stb_image_write.h>
#endif

namespace carkit {
namespace {

#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
    static void append_png_bytes(void* context, void* data, int size)
    {
        std::vector<std::byte>* out = static_cast<std::vector<std::byte>*>(
            context);
        if (size <= 0) {
            return;
        }
        const std::byte* p = static_cast<const std::byte*>(data);
        out->insert(out->end(), p, p + size);
    }
#endif

}  // namespace


StbImageCodec::StbImageCodec(uint64_t max_pixels) noexcept
    : max_pixels_(max_pixels)
{
}


bool
stb_codec_available() noexcept
{
#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
    return true;
#else
    return false;
#endif
}


CodecStatus
StbImageCodec::decode(std::span<const std::byte> bytes,
                      CodecImage* out) const noexcept
{
    if (!out) {
        return CodecStatus::Malformed;
    }
#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
    if (bytes.empty() || bytes.size() > static_cast<size_t>(INT_MAX)) {
        return CodecStatus::Malformed;
    }
    const stbi_uc* in = reinterpret_cast<const stbi_uc*>(bytes.data());
    const int in_len  = static_cast<int>(bytes.size());

    int w = 0;
    int h = 0;
    int n = 0;
    if (stbi_info_from_memory(in, in_len, &w, &h, &n) == 0) {
        return CodecStatus::Unsupported;
    }
    if (w <= 0 || h <= 0) {
        return CodecStatus::Malformed;
    }
    const uint64_t pixels = static_cast<uint64_t>(w)
                            * static_cast<uint64_t>(h);
    if (max_pixels_ != 0U && pixels > max_pixels_) {
        return CodecStatus::LimitExceeded;
    }

    stbi_uc* data = stbi_load_from_memory(in, in_len, &w, &h, &n, 4);
    if (!data) {
        return CodecStatus::Malformed;
    }
    CodecImage img;
    img.width  = static_cast<uint32_t>(w);
    img.height = static_cast<uint32_t>(h);
    img.rgba.resize(static_cast<size_t>(pixels) * 4U);
    std::memcpy(img.rgba.data(), data, img.rgba.size());
    stbi_image_free(data);
    *out = std::move(img);
    return CodecStatus::Ok;
#else
    (void)bytes;
    return CodecStatus::Unsupported;
#endif
}


CodecStatus
encode_png_rgba8(uint32_t width, uint32_t height,
                 std::span<const std::byte> rgba,
                 std::vector<std::byte>* out) noexcept
{
    if (!out) {
        return CodecStatus::Malformed;
    }
#if defined(CARKIT_HAS_STB) && CARKIT_HAS_STB
    if (width == 0 || height == 0 || width > static_cast<uint32_t>(INT_MAX / 4)
        || height > static_cast<uint32_t>(INT_MAX)) {
        return CodecStatus::Malformed;
    }
    const uint64_t need = static_cast<uint64_t>(width) * height * 4ULL;
    if (rgba.size() != need) {
        return CodecStatus::Malformed;
    }
    std::vector<std::byte> png;
    const int ok = stbi_write_png_to_func(
        &append_png_bytes, &png, static_cast<int>(width),
        static_cast<int>(height), 4, rgba.data(),
        static_cast<int>(width * 4U));
    if (ok == 0 || png.empty()) {
        return CodecStatus::Malformed;
    }
    *out = std::move(png);
    return CodecStatus::Ok;
#else
    (void)width;
    (void)height;
    (void)rgba;
    return CodecStatus::Unsupported;
#endif
}

}  // namespace carkit
