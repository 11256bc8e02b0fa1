#pragma once

#include "carkit/bom_store.h"
#include "carkit/bom_tree.h"
#include "carkit/car_catalog.h"
#include "carkit/rendition_decode.h"
#include "carkit/standard_image_codec.h"

#include <string_view>

/**
 * \file status_names.h
 * \brief Stable snake_case names for status values (tool output, logs).
 */

namespace carkit {

std::string_view
bom_status_name(BomStatus status) noexcept;

std::string_view
tree_status_name(TreeStatus status) noexcept;

std::string_view
catalog_status_name(CatalogStatus status) noexcept;

std::string_view
rendition_header_status_name(RenditionHeaderStatus status) noexcept;

std::string_view
catalog_warning_kind_name(CatalogWarningKind kind) noexcept;

std::string_view
rendition_decode_status_name(RenditionDecodeStatus status) noexcept;

std::string_view
codec_status_name(CodecStatus status) noexcept;

}  // namespace carkit
