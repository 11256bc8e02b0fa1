#include "carkit/status_names.h"

namespace carkit {

std::string_view
bom_status_name(BomStatus status) noexcept
{
    switch (status) {
    case BomStatus::Ok: return "ok";
    case BomStatus::TruncatedHeader: return "truncated_header";
    case BomStatus::BadMagic: return "bad_magic";
    case BomStatus::PointerOutOfBounds: return "pointer_out_of_bounds";
    case BomStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


std::string_view
tree_status_name(TreeStatus status) noexcept
{
    switch (status) {
    case TreeStatus::Ok: return "ok";
    case TreeStatus::NotFound: return "not_found";
    case TreeStatus::MalformedTree: return "malformed_tree";
    case TreeStatus::CyclicTree: return "cyclic_tree";
    case TreeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


std::string_view
catalog_status_name(CatalogStatus status) noexcept
{
    switch (status) {
    case CatalogStatus::Ok: return "ok";
    case CatalogStatus::TruncatedHeader: return "truncated_header";
    case CatalogStatus::BadMagic: return "bad_magic";
    case CatalogStatus::PointerOutOfBounds: return "pointer_out_of_bounds";
    case CatalogStatus::MalformedTree: return "malformed_tree";
    case CatalogStatus::CyclicTree: return "cyclic_tree";
    case CatalogStatus::MissingHeader: return "missing_header";
    case CatalogStatus::DuplicateHeader: return "duplicate_header";
    case CatalogStatus::MalformedHeader: return "malformed_header";
    case CatalogStatus::MalformedKey: return "malformed_key";
    case CatalogStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


std::string_view
rendition_header_status_name(RenditionHeaderStatus status) noexcept
{
    switch (status) {
    case RenditionHeaderStatus::Ok: return "ok";
    case RenditionHeaderStatus::BadMagic: return "bad_magic";
    case RenditionHeaderStatus::Truncated: return "truncated";
    case RenditionHeaderStatus::BadTlv: return "bad_tlv";
    case RenditionHeaderStatus::BadPayload: return "bad_payload";
    }
    return "unknown";
}


std::string_view
catalog_warning_kind_name(CatalogWarningKind kind) noexcept
{
    switch (kind) {
    case CatalogWarningKind::OrphanRendition: return "orphan_rendition";
    case CatalogWarningKind::DuplicateRendition: return "duplicate_rendition";
    case CatalogWarningKind::MalformedRendition: return "malformed_rendition";
    case CatalogWarningKind::MalformedFacet: return "malformed_facet";
    case CatalogWarningKind::MalformedAppearance:
        return "malformed_appearance";
    case CatalogWarningKind::MalformedBitmapKey:
        return "malformed_bitmap_key";
    }
    return "unknown";
}


std::string_view
rendition_decode_status_name(RenditionDecodeStatus status) noexcept
{
    switch (status) {
    case RenditionDecodeStatus::Ok: return "ok";
    case RenditionDecodeStatus::UnsupportedPixelFormat:
        return "unsupported_pixel_format";
    case RenditionDecodeStatus::UnsupportedCompression:
        return "unsupported_compression";
    case RenditionDecodeStatus::TruncatedPayload: return "truncated_payload";
    case RenditionDecodeStatus::DimensionMismatch: return "dimension_mismatch";
    case RenditionDecodeStatus::CodecUnavailable: return "codec_unavailable";
    case RenditionDecodeStatus::NotAnImage: return "not_an_image";
    case RenditionDecodeStatus::Malformed: return "malformed";
    case RenditionDecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


std::string_view
codec_status_name(CodecStatus status) noexcept
{
    switch (status) {
    case CodecStatus::Ok: return "ok";
    case CodecStatus::Unsupported: return "unsupported";
    case CodecStatus::Malformed: return "malformed";
    case CodecStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace carkit
