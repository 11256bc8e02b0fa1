#include "carkit/rendition_names.h"

#include "carkit/car_catalog.h"
#include "carkit/pixel_format.h"

namespace carkit {
namespace {

    struct NameEntry final {
        uint32_t value   = 0;
        const char* name = nullptr;
    };

    // Tables are sorted by value.
    static constexpr NameEntry kAttributeNames[] = {
        { 0, "Look" },
        { 1, "Element" },
        { 2, "Part" },
        { 3, "Size" },
        { 4, "Direction" },
        { 5, "PlaceHolder" },
        { 6, "Value" },
        { 7, "Appearance" },
        { 8, "Dimension1" },
        { 9, "Dimension2" },
        { 10, "State" },
        { 11, "Layer" },
        { 12, "Scale" },
        { 13, "Unknown13" },
        { 14, "PresentationState" },
        { 15, "Idiom" },
        { 16, "Subtype" },
        { 17, "Identifier" },
        { 18, "PreviousValue" },
        { 19, "PreviousState" },
        { 20, "SizeClassHorizontal" },
        { 21, "SizeClassVertical" },
        { 22, "MemoryClass" },
        { 23, "GraphicsClass" },
        { 24, "DisplayGamut" },
        { 25, "DeploymentTarget" },
    };

    static constexpr NameEntry kIdiomNames[] = {
        { 0, "universal" }, { 1, "phone" }, { 2, "pad" },       { 3, "tv" },
        { 4, "car" },       { 5, "watch" }, { 6, "marketing" },
    };

    static constexpr NameEntry kCompressionNames[] = {
        { 0, "uncompressed" }, { 1, "rle" },           { 2, "zip" },
        { 3, "lzvn" },         { 4, "lzfse" },         { 5, "jpeg-lzfse" },
        { 6, "blurred" },      { 7, "astc" },          { 8, "palette-img" },
        { 9, "hevc" },         { 10, "deepmap-lzfse" }, { 11, "deepmap2" },
    };

    static constexpr NameEntry kLayoutNames[] = {
        { 0x007, "TextEffect" },
        { 0x009, "Vector" },
        { 10, "OnePartFixedSize" },
        { 11, "OnePartTile" },
        { 12, "OnePartScale" },
        { 20, "ThreePartHTile" },
        { 21, "ThreePartHScale" },
        { 22, "ThreePartHUniform" },
        { 23, "ThreePartVTile" },
        { 24, "ThreePartVScale" },
        { 25, "ThreePartVUniform" },
        { 30, "NinePartTile" },
        { 31, "NinePartScale" },
        { 32, "NinePartHorizontalUniformVerticalScale" },
        { 33, "NinePartHorizontalScaleVerticalUniform" },
        { 34, "NinePartEdgesOnly" },
        { 40, "ManyPartLayoutUnknown" },
        { 50, "AnimationFilmstrip" },
        { 0x3E8, "Data" },
        { 0x3E9, "ExternalLink" },
        { 0x3EA, "LayerStack" },
        { 0x3EB, "InternalReference" },
        { 0x3EC, "PackedImage" },
        { 0x3ED, "NameList" },
        { 0x3EE, "UnknownAddObject" },
        { 0x3EF, "Texture" },
        { 0x3F0, "TextureImage" },
        { 0x3F1, "Color" },
        { 0x3F2, "MultisizeImage" },
        { 0x3F4, "LayerReference" },
        { 0x3F5, "ContentRendition" },
        { 0x3F6, "RecognitionObject" },
    };

    static constexpr NameEntry kIdiomTitles[] = {
        { 0, "Universal" }, { 1, "Phone" }, { 2, "Pad" },       { 3, "TV" },
        { 4, "Car" },       { 5, "Watch" }, { 6, "Marketing" },
    };

    static constexpr NameEntry kPixelFormatNames[] = {
        { 0, "None" },
        { static_cast<uint32_t>(PixelFormat::Argb), "ARGB" },
        { static_cast<uint32_t>(PixelFormat::Data), "Data" },
        { static_cast<uint32_t>(PixelFormat::G8), "G8" },
        { static_cast<uint32_t>(PixelFormat::Ga16), "GA16" },
        { static_cast<uint32_t>(PixelFormat::Ga8), "Gray" },
        { static_cast<uint32_t>(PixelFormat::Heif), "HEIF" },
        { static_cast<uint32_t>(PixelFormat::Jpeg), "JPEG" },
        { static_cast<uint32_t>(PixelFormat::Rgbw), "RGBW" },
    };


    template<size_t N>
    static std::string_view find_name(const NameEntry (&entries)[N],
                                      uint32_t value) noexcept
    {
        uint32_t lo = 0;
        uint32_t hi = static_cast<uint32_t>(N);
        while (lo < hi) {
            const uint32_t mid = lo + (hi - lo) / 2;
            if (entries[mid].value < value) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }
        if (lo < N && entries[lo].value == value && entries[lo].name) {
            return entries[lo].name;
        }
        return {};
    }

}  // namespace


std::string_view
rendition_attribute_name(uint32_t tag) noexcept
{
    return find_name(kAttributeNames, tag);
}


std::string_view
idiom_name(uint16_t idiom) noexcept
{
    return find_name(kIdiomNames, idiom);
}


std::string_view
idiom_title(uint16_t idiom) noexcept
{
    return find_name(kIdiomTitles, idiom);
}


std::string_view
compression_name(uint32_t compression) noexcept
{
    return find_name(kCompressionNames, compression);
}


std::string_view
layout_name(uint16_t layout) noexcept
{
    return find_name(kLayoutNames, layout);
}


std::string_view
asset_type_name(uint16_t layout) noexcept
{
    if (is_image_layout(layout)) {
        return "Image";
    }
    switch (static_cast<RenditionLayout>(layout)) {
    case RenditionLayout::Data: return "Data";
    case RenditionLayout::Color: return "Color";
    case RenditionLayout::MultisizeImage: return "MultiSized Image";
    default: break;
    }
    return {};
}


std::string_view
color_model_name(uint32_t color_space) noexcept
{
    switch (color_space & 0xFU) {
    case 0: return "None";
    case 1: return "RGB";
    case 2: return "Monochrome";
    case 14: return "RGB";
    default: break;
    }
    return {};
}


std::string_view
pixel_format_name(uint32_t pixel_format) noexcept
{
    return find_name(kPixelFormatNames, pixel_format);
}


std::string_view
template_mode_name(uint32_t mode) noexcept
{
    switch (mode) {
    case 0: return "automatic";
    case 1: return "original";
    case 2: return "template";
    default: break;
    }
    return {};
}


std::string_view
state_name(uint16_t state) noexcept
{
    return (state == 0) ? std::string_view("Normal") : std::string_view();
}


std::string_view
value_name(uint16_t value) noexcept
{
    switch (value) {
    case 0: return "Off";
    case 1: return "On";
    default: break;
    }
    return {};
}

}  // namespace carkit
