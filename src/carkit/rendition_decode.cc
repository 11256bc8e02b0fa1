#include "carkit/rendition_decode.h"

#include "byte_read_internal.h"

#include <cstring>
#include <utility>

#if defined(CARKIT_HAS_ZLIB) && CARKIT_HAS_ZLIB
#    include <zlib.h>
#endif

#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
#    include <lzfse.h>
#endif

namespace carkit {
namespace {

    using detail::in_bounds;
    using detail::read_u16le;
    using detail::read_u32le;
    using detail::u8;

#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
    static constexpr uint32_t kPaletteMagic      = 0xCAFEF00DU;
    static constexpr uint32_t kPaletteHeaderSize = 10;
#endif

    // Output sink shared by the chunk decoders.
    struct RasterWriter final {
        std::vector<std::byte>* buf = nullptr;
        uint64_t written            = 0;

        uint64_t room() const noexcept { return buf->size() - written; }
    };


    static RenditionDecodeStatus fail(RenditionDecodeResult* r,
                                      RenditionDecodeStatus status) noexcept
    {
        r->status = status;
        return status;
    }


    static RenditionDecodeStatus copy_uncompressed(
        std::span<const std::byte> in, RasterWriter* w) noexcept
    {
        if (in.size() > w->room()) {
            return RenditionDecodeStatus::Malformed;
        }
        if (!in.empty()) {
            std::memcpy(w->buf->data() + w->written, in.data(), in.size());
        }
        w->written += in.size();
        return RenditionDecodeStatus::Ok;
    }


    // Pixel-granular PackBits: a control byte c with the high bit set repeats
    // the next pixel (c & 0x7F) + 1 times; otherwise c + 1 literal pixels
    // follow.
    static RenditionDecodeStatus expand_rle(std::span<const std::byte> in,
                                            uint32_t bpp,
                                            RasterWriter* w) noexcept
    {
        uint64_t p = 0;
        while (p < in.size()) {
            const uint8_t c       = u8(in[p]);
            p += 1;
            const uint64_t pixels = static_cast<uint64_t>(c & 0x7FU) + 1U;
            const uint64_t out_n  = pixels * bpp;
            if (out_n > w->room()) {
                return RenditionDecodeStatus::TruncatedPayload;
            }
            std::byte* dst = w->buf->data() + w->written;
            if ((c & 0x80U) != 0U) {
                if (!in_bounds(in, p, bpp)) {
                    return RenditionDecodeStatus::TruncatedPayload;
                }
                for (uint64_t i = 0; i < pixels; ++i) {
                    std::memcpy(dst + i * bpp, in.data() + p, bpp);
                }
                p += bpp;
            } else {
                if (!in_bounds(in, p, out_n)) {
                    return RenditionDecodeStatus::TruncatedPayload;
                }
                std::memcpy(dst, in.data() + p, static_cast<size_t>(out_n));
                p += out_n;
            }
            w->written += out_n;
        }
        return RenditionDecodeStatus::Ok;
    }


#if defined(CARKIT_HAS_ZLIB) && CARKIT_HAS_ZLIB
    static RenditionDecodeStatus inflate_zlib(std::span<const std::byte> in,
                                              RasterWriter* w) noexcept
    {
        if (in.size() > 0xFFFFFFFFULL) {
            return RenditionDecodeStatus::LimitExceeded;
        }
        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;
        if (inflateInit(&strm) != Z_OK) {
            return RenditionDecodeStatus::Malformed;
        }
        strm.next_in  = reinterpret_cast<Bytef*>(
            const_cast<std::byte*>(in.data()));
        strm.avail_in = static_cast<uInt>(in.size());

        RenditionDecodeStatus status = RenditionDecodeStatus::Ok;
        for (;;) {
            const uint64_t room = w->room();
            std::byte spill     = std::byte { 0 };
            if (room == 0) {
                // One more byte of output means the stream overruns the
                // raster.
                strm.next_out  = reinterpret_cast<Bytef*>(&spill);
                strm.avail_out = 1;
            } else {
                strm.next_out = reinterpret_cast<Bytef*>(w->buf->data()
                                                         + w->written);
                strm.avail_out = static_cast<uInt>(
                    (room < 0xFFFFFFFFULL) ? room : 0xFFFFFFFFULL);
            }
            const uInt before = strm.avail_out;
            const int ret     = inflate(&strm, Z_NO_FLUSH);
            const uInt used   = before - strm.avail_out;
            if (room == 0 && used != 0) {
                status = RenditionDecodeStatus::Malformed;
                break;
            }
            w->written += used;
            if (ret == Z_STREAM_END) {
                break;
            }
            if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
                status = RenditionDecodeStatus::TruncatedPayload;
                break;
            }
            if (ret != Z_OK && ret != Z_BUF_ERROR) {
                status = RenditionDecodeStatus::Malformed;
                break;
            }
        }
        (void)inflateEnd(&strm);
        return status;
    }
#endif


#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
    // Expands one `bvx` frame (LZFSE, LZVN or stored blocks) into `out`.
    // Output longer than `capacity` bytes is rejected.
    static RenditionDecodeStatus expand_lzfse(std::span<const std::byte> in,
                                              uint64_t capacity,
                                              std::vector<std::byte>* out) noexcept
    {
        out->clear();
        if (in.empty()) {
            return RenditionDecodeStatus::TruncatedPayload;
        }
        std::vector<std::byte> scratch(lzfse_decode_scratch_size());
        out->resize(static_cast<size_t>(capacity) + 1U);
        const size_t n = lzfse_decode_buffer(
            reinterpret_cast<uint8_t*>(out->data()), out->size(),
            reinterpret_cast<const uint8_t*>(in.data()), in.size(),
            scratch.data());
        if (n == 0 || n > capacity) {
            out->clear();
            return RenditionDecodeStatus::Malformed;
        }
        out->resize(n);
        return RenditionDecodeStatus::Ok;
    }


    static RenditionDecodeStatus inflate_lzfse(std::span<const std::byte> in,
                                               RasterWriter* w) noexcept
    {
        std::vector<std::byte> plain;
        const RenditionDecodeStatus st = expand_lzfse(in, w->room(), &plain);
        if (st != RenditionDecodeStatus::Ok) {
            return st;
        }
        return copy_uncompressed(plain, w);
    }


    // Quantized image: magic, version, u16 color count, A/R/G/B color
    // table, then u16 words holding two indices each (high byte first).
    static RenditionDecodeStatus decode_palette(std::span<const std::byte> in,
                                                uint32_t width,
                                                uint32_t height,
                                                DecodedImage* img) noexcept
    {
        uint32_t magic    = 0;
        uint16_t ncolors  = 0;
        if (!read_u32le(in, 0, &magic) || magic != kPaletteMagic) {
            return RenditionDecodeStatus::Malformed;
        }
        if (!read_u16le(in, 8, &ncolors) || ncolors == 0) {
            return RenditionDecodeStatus::Malformed;
        }
        const uint64_t colors_off = kPaletteHeaderSize;
        const uint64_t index_off  = colors_off + ncolors * 4ULL;
        const uint64_t pixels     = static_cast<uint64_t>(width) * height;
        const uint64_t words      = (pixels + 1U) / 2U;
        if (!in_bounds(in, colors_off, ncolors * 4ULL)
            || !in_bounds(in, index_off, words * 2ULL)) {
            return RenditionDecodeStatus::TruncatedPayload;
        }

        std::byte* dst = img->pixels.data();
        for (uint64_t i = 0; i < pixels; ++i) {
            uint16_t word = 0;
            (void)read_u16le(in, index_off + (i / 2U) * 2U, &word);
            const uint32_t index = ((i & 1U) == 0U) ? (word >> 8)
                                                     : (word & 0xFFU);
            if (index >= ncolors) {
                return RenditionDecodeStatus::Malformed;
            }
            const uint64_t c = colors_off + index * 4ULL;
            dst[i * 4 + 0]   = in[c + 1];
            dst[i * 4 + 1]   = in[c + 2];
            dst[i * 4 + 2]   = in[c + 3];
            dst[i * 4 + 3]   = in[c + 0];
        }
        return RenditionDecodeStatus::Ok;
    }
#endif


    // Palette images store the quantized image inside an LZFSE frame.
    static RenditionDecodeStatus expand_palette(std::span<const std::byte> in,
                                                uint32_t width,
                                                uint32_t height,
                                                DecodedImage* img) noexcept
    {
#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
        const uint64_t pixels   = static_cast<uint64_t>(width) * height;
        const uint64_t capacity = kPaletteHeaderSize + 0xFFFFULL * 4ULL
                                  + ((pixels + 1U) / 2U) * 2ULL;
        std::vector<std::byte> plain;
        const RenditionDecodeStatus st = expand_lzfse(in, capacity, &plain);
        if (st != RenditionDecodeStatus::Ok) {
            return st;
        }
        return decode_palette(plain, width, height, img);
#else
        (void)in;
        (void)width;
        (void)height;
        (void)img;
        return RenditionDecodeStatus::UnsupportedCompression;
#endif
    }


    static RenditionDecodeResult decode_embedded(
        const RenditionValue& value, std::span<const std::byte> stream,
        DecodedImage* out, const RenditionDecodeOptions& options) noexcept
    {
        RenditionDecodeResult r;
        if (!options.codec) {
            (void)fail(&r, RenditionDecodeStatus::CodecUnavailable);
            return r;
        }
        CodecImage decoded;
        r.codec_status = options.codec->decode(stream, &decoded);
        if (r.codec_status != CodecStatus::Ok) {
            (void)fail(&r, (r.codec_status == CodecStatus::LimitExceeded)
                               ? RenditionDecodeStatus::LimitExceeded
                               : RenditionDecodeStatus::Malformed);
            return r;
        }
        const uint64_t need = static_cast<uint64_t>(decoded.width)
                              * decoded.height * 4ULL;
        if (decoded.width == 0 || decoded.height == 0
            || decoded.rgba.size() != need) {
            (void)fail(&r, RenditionDecodeStatus::Malformed);
            return r;
        }

        DecodedImage img;
        img.width         = decoded.width;
        img.height        = decoded.height;
        img.stride        = decoded.width * 4U;
        img.layout        = PixelLayout::Rgba8;
        img.premultiplied = false;
        img.pixels        = std::move(decoded.rgba);

        r.consumed = stream.size();
        r.produced = img.pixels.size();
        if ((value.width != 0 && value.width != img.width)
            || (value.height != 0 && value.height != img.height)) {
            r.status = RenditionDecodeStatus::DimensionMismatch;
        }
        *out = std::move(img);
        return r;
    }


    static uint8_t unpremultiply(uint8_t c, uint8_t a) noexcept
    {
        if (a == 0) {
            return 0;
        }
        if (a == 255) {
            return c;
        }
        const uint32_t v = (static_cast<uint32_t>(c) * 255U + a / 2U) / a;
        return static_cast<uint8_t>((v > 255U) ? 255U : v);
    }

}  // namespace


EmbeddedFormat
sniff_embedded_format(std::span<const std::byte> bytes) noexcept
{
    static constexpr uint8_t kPng[8] = { 0x89, 'P', 'N', 'G',
                                         0x0D, 0x0A, 0x1A, 0x0A };
    if (bytes.size() >= 8) {
        bool png = true;
        for (size_t i = 0; i < 8; ++i) {
            png = png && (u8(bytes[i]) == kPng[i]);
        }
        if (png) {
            return EmbeddedFormat::Png;
        }
    }
    if (bytes.size() >= 3 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8
        && u8(bytes[2]) == 0xFF) {
        return EmbeddedFormat::Jpeg;
    }
    if (detail::match_tag(bytes, 0, "GIF8")) {
        return EmbeddedFormat::Gif;
    }
    if (detail::match_tag(bytes, 0, "%PDF")) {
        return EmbeddedFormat::Pdf;
    }
    if (detail::match_tag(bytes, 4, "ftyp")
        && (detail::match_tag(bytes, 8, "heic")
            || detail::match_tag(bytes, 8, "heix")
            || detail::match_tag(bytes, 8, "mif1"))) {
        return EmbeddedFormat::Heif;
    }
    return EmbeddedFormat::None;
}


std::span<const std::byte>
rendition_raw_data(const RenditionValue& value) noexcept
{
    if (value.payload_kind == RenditionPayloadKind::RawData) {
        return value.data;
    }
    if (value.payload_kind == RenditionPayloadKind::Bitmap
        && value.compression == CompressionType::Uncompressed
        && !value.chunked) {
        return value.data;
    }
    return {};
}


RenditionDecodeResult
decode_rendition(const RenditionValue& value, DecodedImage* out,
                 const RenditionDecodeOptions& options) noexcept
{
    RenditionDecodeResult r;
    if (!out) {
        (void)fail(&r, RenditionDecodeStatus::Malformed);
        return r;
    }
    *out = DecodedImage {};
    if (value.header_status != RenditionHeaderStatus::Ok) {
        (void)fail(&r, RenditionDecodeStatus::Malformed);
        return r;
    }

    if (value.payload_kind == RenditionPayloadKind::RawData) {
        const EmbeddedFormat f = sniff_embedded_format(value.data);
        if (is_embedded_codec_format(value.pixel_format)
            || f == EmbeddedFormat::Png || f == EmbeddedFormat::Jpeg
            || f == EmbeddedFormat::Gif) {
            return decode_embedded(value, value.data, out, options);
        }
        (void)fail(&r, RenditionDecodeStatus::NotAnImage);
        return r;
    }
    if (value.payload_kind != RenditionPayloadKind::Bitmap) {
        (void)fail(&r, RenditionDecodeStatus::NotAnImage);
        return r;
    }

    if (is_embedded_codec_format(value.pixel_format)) {
        if (value.compression != CompressionType::Uncompressed
            || value.chunked) {
            (void)fail(&r, RenditionDecodeStatus::UnsupportedCompression);
            return r;
        }
        return decode_embedded(value, value.data, out, options);
    }

    const bool palette = value.compression == CompressionType::PaletteImg;
    PixelFormatInfo info;
    if (!lookup_pixel_format(value.pixel_format, &info)) {
        (void)fail(&r, RenditionDecodeStatus::UnsupportedPixelFormat);
        return r;
    }
    if (palette) {
        info.layout        = PixelLayout::Rgba8;
        info.premultiplied = false;
    }
    if (value.width == 0 || value.height == 0) {
        (void)fail(&r, RenditionDecodeStatus::Malformed);
        return r;
    }

    const uint32_t bpp    = pixel_layout_bytes_per_pixel(info.layout);
    const uint64_t pixels = static_cast<uint64_t>(value.width) * value.height;
    const uint64_t stride = static_cast<uint64_t>(value.width) * bpp;
    const uint64_t total  = stride * value.height;
    const RenditionDecodeLimits& lim = options.limits;
    if ((lim.max_pixels != 0U && pixels > lim.max_pixels)
        || (lim.max_output_bytes != 0U && total > lim.max_output_bytes)
        || stride > 0xFFFFFFFFULL) {
        (void)fail(&r, RenditionDecodeStatus::LimitExceeded);
        return r;
    }

    DecodedImage img;
    img.width         = value.width;
    img.height        = value.height;
    img.stride        = static_cast<uint32_t>(stride);
    img.layout        = info.layout;
    img.premultiplied = info.premultiplied;
    img.pixels.resize(static_cast<size_t>(total));

    RasterWriter w;
    w.buf = &img.pixels;

    RenditionDecodeStatus st = RenditionDecodeStatus::Ok;
    if (palette) {
        if (value.chunks.size() != 1) {
            (void)fail(&r, RenditionDecodeStatus::UnsupportedCompression);
            return r;
        }
        st = expand_palette(value.chunks[0], value.width, value.height, &img);
        if (st == RenditionDecodeStatus::Ok) {
            w.written  = total;
            r.consumed = value.chunks[0].size();
        }
    } else {
        for (const std::span<const std::byte>& chunk : value.chunks) {
            switch (value.compression) {
            case CompressionType::Uncompressed:
                st = copy_uncompressed(chunk, &w);
                break;
            case CompressionType::Rle: st = expand_rle(chunk, bpp, &w); break;
            case CompressionType::Zip:
#if defined(CARKIT_HAS_ZLIB) && CARKIT_HAS_ZLIB
                st = inflate_zlib(chunk, &w);
#else
                st = RenditionDecodeStatus::UnsupportedCompression;
#endif
                break;
            case CompressionType::Lzvn:
            case CompressionType::Lzfse:
#if defined(CARKIT_HAS_LZFSE) && CARKIT_HAS_LZFSE
                st = inflate_lzfse(chunk, &w);
#else
                st = RenditionDecodeStatus::UnsupportedCompression;
#endif
                break;
            default: st = RenditionDecodeStatus::UnsupportedCompression; break;
            }
            if (st != RenditionDecodeStatus::Ok) {
                break;
            }
            r.consumed += chunk.size();
        }
    }
    if (st == RenditionDecodeStatus::Ok && w.written != total) {
        st = RenditionDecodeStatus::TruncatedPayload;
    }
    if (st != RenditionDecodeStatus::Ok) {
        (void)fail(&r, st);
        return r;
    }

    r.produced = total;
    *out       = std::move(img);
    return r;
}


RenditionDecodeStatus
convert_to_rgba8(const DecodedImage& in, DecodedImage* out) noexcept
{
    if (!out) {
        return RenditionDecodeStatus::Malformed;
    }
    const uint32_t bpp = pixel_layout_bytes_per_pixel(in.layout);
    if (bpp == 0) {
        return RenditionDecodeStatus::UnsupportedPixelFormat;
    }
    const uint64_t row_bytes = static_cast<uint64_t>(in.width) * bpp;
    if (in.stride < row_bytes
        || in.pixels.size() < static_cast<uint64_t>(in.stride) * in.height) {
        return RenditionDecodeStatus::Malformed;
    }

    DecodedImage img;
    img.width         = in.width;
    img.height        = in.height;
    img.stride        = in.width * 4U;
    img.layout        = PixelLayout::Rgba8;
    img.premultiplied = false;
    img.pixels.resize(static_cast<size_t>(img.stride) * img.height);

    const bool pm = in.premultiplied;
    for (uint32_t y = 0; y < in.height; ++y) {
        const std::byte* src = in.pixels.data()
                               + static_cast<size_t>(y) * in.stride;
        std::byte* dst = img.pixels.data()
                         + static_cast<size_t>(y) * img.stride;
        for (uint32_t x = 0; x < in.width; ++x) {
            const std::byte* s = src + static_cast<size_t>(x) * bpp;
            uint8_t cr = 0;
            uint8_t cg = 0;
            uint8_t cb = 0;
            uint8_t ca = 255;
            switch (in.layout) {
            case PixelLayout::Bgra8:
                cb = u8(s[0]);
                cg = u8(s[1]);
                cr = u8(s[2]);
                ca = u8(s[3]);
                break;
            case PixelLayout::GrayAlpha8:
                cr = cg = cb = u8(s[0]);
                ca           = u8(s[1]);
                break;
            case PixelLayout::Gray8: cr = cg = cb = u8(s[0]); break;
            case PixelLayout::Bgra16:
                cb = u8(s[1]);
                cg = u8(s[3]);
                cr = u8(s[5]);
                ca = u8(s[7]);
                break;
            case PixelLayout::GrayAlpha16:
                cr = cg = cb = u8(s[1]);
                ca           = u8(s[3]);
                break;
            case PixelLayout::Rgba8:
                cr = u8(s[0]);
                cg = u8(s[1]);
                cb = u8(s[2]);
                ca = u8(s[3]);
                break;
            case PixelLayout::Unknown: break;
            }
            if (pm) {
                cr = unpremultiply(cr, ca);
                cg = unpremultiply(cg, ca);
                cb = unpremultiply(cb, ca);
            }
            std::byte* d = dst + static_cast<size_t>(x) * 4U;
            d[0]         = std::byte { cr };
            d[1]         = std::byte { cg };
            d[2]         = std::byte { cb };
            d[3]         = std::byte { ca };
        }
    }
    *out = std::move(img);
    return RenditionDecodeStatus::Ok;
}

}  // namespace carkit
