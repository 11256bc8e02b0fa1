#pragma once

#include <cstdint>
#include <string_view>

/**
 * \file rendition_names.h
 * \brief Names for catalog enumerations, as printed by `assetutil --info`.
 *
 * All functions return an empty view for values without a name.
 */

namespace carkit {

/// Attribute tag name (e.g. `Idiom`, `Identifier`).
std::string_view
rendition_attribute_name(uint32_t tag) noexcept;

/// Idiom value name (e.g. `universal`, `phone`).
std::string_view
idiom_name(uint16_t idiom) noexcept;

/// Capitalized idiom name used in multisize `Sizes` strings (e.g. `Phone`).
std::string_view
idiom_title(uint16_t idiom) noexcept;

/// Compression id name (e.g. `palette-img`).
std::string_view
compression_name(uint32_t compression) noexcept;

/// CSI layout name, including the image subtypes (e.g. `OnePartScale`).
std::string_view
layout_name(uint16_t layout) noexcept;

/// `AssetType` of a layout: `Image`, `Data`, `Color` or `MultiSized Image`.
std::string_view
asset_type_name(uint16_t layout) noexcept;

/// Color model name from the low nibble of the CSI color space field.
std::string_view
color_model_name(uint32_t color_space) noexcept;

/// `Encoding` name of a pixel format tag (e.g. `ARGB`, `Gray`, `JPEG`).
std::string_view
pixel_format_name(uint32_t pixel_format) noexcept;

/// Template rendering mode name (`automatic`, `original`, `template`).
std::string_view
template_mode_name(uint32_t mode) noexcept;

/// State attribute name (`Normal`).
std::string_view
state_name(uint16_t state) noexcept;

/// Value attribute name (`Off`, `On`).
std::string_view
value_name(uint16_t value) noexcept;

}  // namespace carkit
