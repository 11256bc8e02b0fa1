#pragma once

#include "carkit/bom_store.h"
#include "carkit/bom_tree.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file car_catalog.h
 * \brief CoreUI asset catalog schema decoder and the read-only catalog model.
 */

namespace carkit {

/// Catalog decode status. Everything but \ref CatalogStatus::Ok is fatal.
enum class CatalogStatus : uint8_t {
    Ok,
    /// The BOM header is shorter than 32 bytes.
    TruncatedHeader,
    /// The bytes are not a BOM container.
    BadMagic,
    /// A BOM table or block reads past the end of the buffer.
    PointerOutOfBounds,
    /// A schema tree is structurally invalid.
    MalformedTree,
    /// A schema tree references a node twice.
    CyclicTree,
    /// `CARHEADER`, `KEYFORMAT`, `FACETKEYS` or `RENDITIONS` is missing.
    MissingHeader,
    /// `CARHEADER` or `KEYFORMAT` is named more than once.
    DuplicateHeader,
    /// A header record has a bad magic or is too short.
    MalformedHeader,
    /// A rendition key width differs from the key format width.
    MalformedKey,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/**
 * \brief Rendition key attribute tags (`KEYFORMAT` entries).
 *
 * Open enumeration: tags outside the known range are preserved as their raw
 * integer value.
 */
enum class RenditionAttribute : uint32_t {
    Look                = 0,
    Element             = 1,
    Part                = 2,
    Size                = 3,
    Direction           = 4,
    PlaceHolder         = 5,
    Value               = 6,
    Appearance          = 7,
    Dimension1          = 8,
    Dimension2          = 9,
    State               = 10,
    Layer               = 11,
    Scale               = 12,
    Unknown13           = 13,
    PresentationState   = 14,
    Idiom               = 15,
    Subtype             = 16,
    Identifier          = 17,
    PreviousValue       = 18,
    PreviousState       = 19,
    SizeClassHorizontal = 20,
    SizeClassVertical   = 21,
    MemoryClass         = 22,
    GraphicsClass       = 23,
    DisplayGamut        = 24,
    DeploymentTarget    = 25,
};

/// Compression ids stored in `CELM` payload records (open enumeration).
enum class CompressionType : uint32_t {
    Uncompressed = 0,
    Rle          = 1,
    Zip          = 2,
    Lzvn         = 3,
    Lzfse        = 4,
    JpegLzfse    = 5,
    Blurred      = 6,
    Astc         = 7,
    PaletteImg   = 8,
    Hevc         = 9,
    DeepmapLzfse = 10,
    Deepmap2     = 11,
};

/// CSI layout values (open enumeration).
enum class RenditionLayout : uint16_t {
    TextEffect        = 0x007,
    Vector            = 0x009,
    Image             = 0x00C,
    Data              = 0x3E8,
    ExternalLink      = 0x3E9,
    LayerStack        = 0x3EA,
    InternalReference = 0x3EB,
    PackedImage       = 0x3EC,
    NameList          = 0x3ED,
    UnknownAddObject  = 0x3EE,
    Texture           = 0x3EF,
    TextureImage      = 0x3F0,
    Color             = 0x3F1,
    MultisizeImage    = 0x3F2,
    LayerReference    = 0x3F4,
    ContentRendition  = 0x3F5,
    RecognitionObject = 0x3F6,
};

/// True for the image layouts (one/three/nine-part, many-part, filmstrip).
bool
is_image_layout(uint16_t layout) noexcept;

/// `CARHEADER` record.
struct CarHeader final {
    uint32_t core_ui_version   = 0;
    uint32_t storage_version   = 0;
    uint32_t storage_timestamp = 0;
    uint32_t rendition_count   = 0;
    std::string main_version;
    std::string version;
    std::array<uint8_t, 16> uuid {};
    uint32_t associated_checksum = 0;
    uint32_t schema_version      = 0;
    uint32_t color_space_id      = 0;
    uint32_t key_semantics       = 0;
};

static constexpr uint32_t kCarHeaderSize           = 436;
static constexpr uint32_t kCarExtendedMetadataSize = 1028;

/// Optional `EXTENDED_METADATA` record.
struct CarExtendedMetadata final {
    bool present = false;
    std::string thinning_arguments;
    std::string deployment_platform_version;
    std::string deployment_platform;
    std::string authoring_tool;
};

/**
 * \brief Rendition key layout (`KEYFORMAT`).
 *
 * Each attribute occupies \ref attribute_width bytes of a rendition key,
 * little-endian. Catalogs written by CoreUI use 2.
 */
struct KeyFormat final {
    uint32_t version         = 0;
    uint32_t attribute_width = 2;
    std::vector<RenditionAttribute> attributes;

    uint32_t key_width() const noexcept;
};

struct AttributeValue final {
    RenditionAttribute attribute = RenditionAttribute::Look;
    uint16_t value               = 0;
};

/// One `FACETKEYS` entry: a named asset and its key token.
struct FacetEntry final {
    std::string name;
    uint16_t hotspot_x = 0;
    uint16_t hotspot_y = 0;
    std::vector<AttributeValue> attributes;
    /// Value of the Identifier attribute, when the token carries one.
    bool has_identifier = false;
    uint16_t identifier = 0;
};

static constexpr uint32_t kNoFacet = 0xffffffffU;

/// A decoded rendition key.
struct RenditionKey final {
    std::vector<std::byte> raw;
    /// Attribute/value pairs in key format order.
    std::vector<AttributeValue> attributes;
    /// Index into \ref CatalogModel::facets, or \ref kNoFacet for orphans.
    uint32_t facet_index = kNoFacet;

    bool find_attribute(RenditionAttribute attribute,
                        uint16_t* out) const noexcept;
};

/// Health of one CSI record. Non-Ok values are recoverable.
enum class RenditionHeaderStatus : uint8_t {
    Ok,
    /// The record does not start with `ISTC`.
    BadMagic,
    /// The record is shorter than its header, TLV or payload lengths say.
    Truncated,
    /// A TLV record runs past the TLV area.
    BadTlv,
    /// The payload record is inconsistent with its own lengths.
    BadPayload,
};

/// Kind of the payload record that follows the TLV area.
enum class RenditionPayloadKind : uint8_t {
    /// No payload bytes.
    None,
    /// `CELM`: compressed bitmap.
    Bitmap,
    /// `DWAR`: raw data (data assets, embedded JPEG/PNG streams).
    RawData,
    /// `RLOC`: color components.
    Color,
    /// `SISM`: multisize image set.
    Multisize,
    /// Any other record; kept as opaque bytes.
    Unknown,
};

/// One TLV property record of a CSI header.
struct RenditionTlv final {
    uint32_t tag = 0;
    std::span<const std::byte> data;
};

/// TLV tags understood by the decoder.
static constexpr uint32_t kTlvSlices            = 0x3E9;
static constexpr uint32_t kTlvMetrics           = 0x3EB;
static constexpr uint32_t kTlvBlendModeOpacity  = 0x3EC;
static constexpr uint32_t kTlvUti               = 0x3ED;
static constexpr uint32_t kTlvExifOrientation   = 0x3EE;

struct MultisizeEntry final {
    uint32_t width  = 0;
    uint32_t height = 0;
    uint16_t index  = 0;
    uint16_t idiom  = 0;
};

static constexpr uint32_t kCsiHeaderSize = 184;

/**
 * \brief Metadata of one CSI rendition record.
 *
 * All spans borrow from the container buffer. Pixel data is not decoded here;
 * see \ref decode_rendition.
 */
struct RenditionValue final {
    /// The whole record (header, TLVs and payload).
    std::span<const std::byte> record;
    RenditionHeaderStatus header_status = RenditionHeaderStatus::Ok;

    uint32_t version      = 0;
    uint32_t flags        = 0;
    uint32_t width        = 0;
    uint32_t height       = 0;
    /// Scale times 100.
    uint32_t scale_factor = 0;
    uint32_t pixel_format = 0;
    /// Color model in the low nibble.
    uint32_t color_space  = 0;

    uint32_t mod_time = 0;
    uint16_t layout   = 0;
    std::string name;

    uint32_t tlv_length     = 0;
    uint32_t bitmap_count   = 0;
    uint32_t payload_length = 0;

    std::span<const std::byte> tlv;
    std::vector<RenditionTlv> properties;
    /// The payload record, including its magic.
    std::span<const std::byte> payload;

    RenditionPayloadKind payload_kind = RenditionPayloadKind::None;
    uint32_t payload_version          = 0;
    CompressionType compression       = CompressionType::Uncompressed;
    /// `CELM`/`DWAR` data following the record header.
    std::span<const std::byte> data;
    /// Compressed chunks of a `KCBC`-chunked bitmap (one entry otherwise).
    std::vector<std::span<const std::byte>> chunks;
    bool chunked = false;

    /// Row stride of the uncompressed raster (0 for non-raster formats).
    uint32_t bytes_per_row = 0;

    bool has_uti = false;
    std::string uti;
    bool has_slice_size  = false;
    uint32_t slice_width  = 0;
    uint32_t slice_height = 0;
    bool has_exif_orientation = false;
    uint32_t exif_orientation = 0;
    bool has_blend_mode = false;
    float blend_mode    = 0.0F;
    float opacity       = 1.0F;

    uint32_t color_flags = 0;
    std::vector<double> color_components;
    std::vector<MultisizeEntry> multisize;

    bool is_opaque() const noexcept;
    /// Template rendering mode bits (0 automatic, 1 original, 2 template).
    uint32_t template_mode() const noexcept;
};

/// One `RENDITIONS` entry.
struct RenditionEntry final {
    RenditionKey key;
    RenditionValue value;
    BlockId key_block   = kInvalidBlockId;
    BlockId value_block = kInvalidBlockId;
};

/// One `APPEARANCEKEYS` entry.
struct AppearanceEntry final {
    std::string name;
    uint32_t id = 0;
};

static constexpr uint32_t kBitmapKeyFields = 11;

/// One `BITMAPKEYS` entry.
struct BitmapKeyEntry final {
    uint32_t name_identifier = 0;
    std::array<uint16_t, kBitmapKeyFields> fields {};
};

enum class CatalogWarningKind : uint8_t {
    /// A rendition names no known facet.
    OrphanRendition,
    /// A rendition repeats the attribute tuple of an earlier one; dropped.
    /// Only raised with \ref CatalogDecodeOptions::check_rendition_order off.
    /// The warning index is the `RENDITIONS` entry index.
    DuplicateRendition,
    /// A CSI record has a header-level defect.
    MalformedRendition,
    /// A facet key token is malformed; the facet is kept without attributes.
    MalformedFacet,
    /// An `APPEARANCEKEYS` value is malformed; the entry is dropped.
    MalformedAppearance,
    /// A `BITMAPKEYS` value is malformed; the entry is dropped.
    MalformedBitmapKey,
};

/// Recoverable issue found while decoding a catalog.
struct CatalogWarning final {
    CatalogWarningKind kind = CatalogWarningKind::OrphanRendition;
    /// Rendition or facet index (tree order), depending on \ref kind.
    uint32_t index = 0;
    BlockId block  = kInvalidBlockId;
    RenditionHeaderStatus header_status = RenditionHeaderStatus::Ok;
};

/// Resource limits for catalog decoding.
struct CatalogDecodeLimits final {
    uint32_t max_facets            = 1U << 20;
    uint32_t max_renditions        = 1U << 22;
    uint32_t max_key_attributes    = 64;
    uint32_t max_tlv_records       = 256;
    uint32_t max_color_components  = 64;
    uint32_t max_multisize_entries = 4096;
    uint32_t max_chunks            = 4096;
};

/// Options for \ref decode_catalog and \ref parse_catalog.
struct CatalogDecodeOptions final {
    BomParseOptions bom;
    TreeWalkLimits tree_limits;
    /// Require bytewise-increasing `FACETKEYS` names.
    bool check_facet_order = true;
    /// Require `RENDITIONS` keys increasing attribute by attribute (a repeated
    /// key fails with \ref CatalogStatus::MalformedTree). When off, repeats
    /// are dropped with a \ref CatalogWarningKind::DuplicateRendition warning.
    bool check_rendition_order = true;
    /// Bytes per rendition key attribute.
    uint32_t key_attribute_width = 2;
    CatalogDecodeLimits limits;
};

struct CatalogDecodeResult final {
    CatalogStatus status = CatalogStatus::Ok;
    uint32_t facets      = 0;
    uint32_t renditions  = 0;
    /// Renditions that name no known facet.
    uint32_t orphans     = 0;
    uint32_t duplicates  = 0;
    uint32_t warnings    = 0;
    /// Non-null BOM blocks reached from no variable, tree node or leaf entry.
    uint32_t unreferenced_blocks = 0;
    /// Block where a fatal error was detected (\ref kInvalidBlockId if none).
    BlockId failed_block = kInvalidBlockId;
};

/**
 * \brief Read-only asset catalog.
 *
 * Built by \ref decode_catalog or \ref parse_catalog. The model holds a copy
 * of the \ref BomStore index; the container buffer must outlive the model.
 */
class CatalogModel final {
public:
    CatalogModel() = default;

    const BomStore& store() const noexcept;
    const CarHeader& header() const noexcept;
    const CarExtendedMetadata& extended_metadata() const noexcept;
    const KeyFormat& key_format() const noexcept;

    /// Facets sorted by name.
    std::span<const FacetEntry> facets() const noexcept;
    /// Renditions in tree order.
    std::span<const RenditionEntry> renditions() const noexcept;
    std::span<const AppearanceEntry> appearances() const noexcept;
    std::span<const BitmapKeyEntry> bitmap_keys() const noexcept;
    std::span<const CatalogWarning> warnings() const noexcept;

    /// Facet of \p rendition, or nullptr for orphans.
    const FacetEntry* facet_for(const RenditionEntry& rendition) const noexcept;
    /// Name of the appearance with \p id, or an empty view.
    std::string_view appearance_name(uint32_t id) const noexcept;

private:
    friend CatalogDecodeResult
    decode_catalog(const BomStore& store, CatalogModel* out,
                   const CatalogDecodeOptions& options) noexcept;

    BomStore store_;
    CarHeader header_;
    CarExtendedMetadata extended_;
    KeyFormat key_format_;
    std::vector<FacetEntry> facets_;
    std::vector<RenditionEntry> renditions_;
    std::vector<AppearanceEntry> appearances_;
    std::vector<BitmapKeyEntry> bitmap_keys_;
    std::vector<CatalogWarning> warnings_;
};

/**
 * \brief Decodes the catalog schema of a parsed BOM container.
 *
 * Fatal statuses leave \p out empty. Per-rendition defects are recorded on
 * the rendition and in \ref CatalogModel::warnings.
 */
CatalogDecodeResult
decode_catalog(const BomStore& store, CatalogModel* out,
               const CatalogDecodeOptions& options
               = CatalogDecodeOptions {}) noexcept;

/// Parses the BOM container in \p bytes and decodes its catalog.
CatalogDecodeResult
parse_catalog(std::span<const std::byte> bytes, CatalogModel* out,
              const CatalogDecodeOptions& options
              = CatalogDecodeOptions {}) noexcept;

/// Looks up one facet by name through the `FACETKEYS` tree.
TreeStatus
lookup_facet(const BomStore& store, std::string_view name, FacetEntry* out,
             const TreeWalkLimits& limits = TreeWalkLimits {}) noexcept;

/// Decodes the `KEYFORMAT` record.
CatalogStatus
decode_key_format(std::span<const std::byte> bytes, KeyFormat* out,
                  uint32_t max_attributes = 64) noexcept;

/**
 * \brief Splits \p bytes into attributes per \p format.
 *
 * Returns false when the width does not match \ref KeyFormat::key_width.
 */
bool
decode_rendition_key(const KeyFormat& format, std::span<const std::byte> bytes,
                     RenditionKey* out) noexcept;

/// Writes the attribute values of \p key back into key bytes per \p format.
bool
encode_rendition_key(const KeyFormat& format,
                     std::span<const AttributeValue> attributes,
                     std::vector<std::byte>* out) noexcept;

/// Parses one CSI record. Never fails; defects end up in `header_status`.
void
decode_rendition_value(std::span<const std::byte> record, RenditionValue* out,
                       const CatalogDecodeLimits& limits
                       = CatalogDecodeLimits {}) noexcept;

}  // namespace carkit
