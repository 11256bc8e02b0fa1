#include "carkit/car_catalog.h"

#include "carkit/pixel_format.h"

#include "byte_read_internal.h"

#include <algorithm>
#include <cstring>
#include <set>
#include <unordered_map>
#include <utility>

namespace carkit {
namespace {

    using detail::in_bounds;
    using detail::match_tag;
    using detail::padded_string;
    using detail::read_u16le;
    using detail::read_u32le;
    using detail::read_u64le;

    static constexpr uint32_t kKeyFormatHeaderSize = 12;
    static constexpr uint32_t kKeyTokenHeaderSize  = 6;
    static constexpr uint32_t kChunkHeaderSize     = 20;
    static constexpr uint32_t kMultisizeEntrySize  = 12;

    static CatalogStatus map_bom_status(BomStatus status) noexcept
    {
        switch (status) {
        case BomStatus::Ok: return CatalogStatus::Ok;
        case BomStatus::TruncatedHeader: return CatalogStatus::TruncatedHeader;
        case BomStatus::BadMagic: return CatalogStatus::BadMagic;
        case BomStatus::PointerOutOfBounds:
            return CatalogStatus::PointerOutOfBounds;
        case BomStatus::LimitExceeded: return CatalogStatus::LimitExceeded;
        }
        return CatalogStatus::MalformedHeader;
    }


    static CatalogStatus map_tree_status(TreeStatus status) noexcept
    {
        switch (status) {
        case TreeStatus::Ok: return CatalogStatus::Ok;
        case TreeStatus::NotFound: return CatalogStatus::MalformedTree;
        case TreeStatus::MalformedTree: return CatalogStatus::MalformedTree;
        case TreeStatus::CyclicTree: return CatalogStatus::CyclicTree;
        case TreeStatus::LimitExceeded: return CatalogStatus::LimitExceeded;
        }
        return CatalogStatus::MalformedTree;
    }


    static double read_f64le(std::span<const std::byte> bytes,
                             uint64_t offset) noexcept
    {
        uint64_t bits = 0;
        (void)read_u64le(bytes, offset, &bits);
        double d = 0.0;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }


    static float read_f32le(std::span<const std::byte> bytes,
                            uint64_t offset) noexcept
    {
        uint32_t bits = 0;
        (void)read_u32le(bytes, offset, &bits);
        float f = 0.0F;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }


    static bool decode_car_header(std::span<const std::byte> b,
                                  CarHeader* out) noexcept
    {
        if (b.size() < kCarHeaderSize || !match_tag(b, 0, "RATC")) {
            return false;
        }
        CarHeader h;
        (void)read_u32le(b, 4, &h.core_ui_version);
        (void)read_u32le(b, 8, &h.storage_version);
        (void)read_u32le(b, 12, &h.storage_timestamp);
        (void)read_u32le(b, 16, &h.rendition_count);
        h.main_version = padded_string(b, 20, 128);
        h.version      = padded_string(b, 148, 256);
        for (size_t i = 0; i < h.uuid.size(); ++i) {
            h.uuid[i] = detail::u8(b[404 + i]);
        }
        (void)read_u32le(b, 420, &h.associated_checksum);
        (void)read_u32le(b, 424, &h.schema_version);
        (void)read_u32le(b, 428, &h.color_space_id);
        (void)read_u32le(b, 432, &h.key_semantics);
        *out = std::move(h);
        return true;
    }


    static bool decode_extended_metadata(std::span<const std::byte> b,
                                         CarExtendedMetadata* out) noexcept
    {
        if (b.size() < kCarExtendedMetadataSize || !match_tag(b, 0, "ATEM")) {
            return false;
        }
        out->present                     = true;
        out->thinning_arguments          = padded_string(b, 4, 256);
        out->deployment_platform_version = padded_string(b, 260, 256);
        out->deployment_platform         = padded_string(b, 516, 256);
        out->authoring_tool              = padded_string(b, 772, 256);
        return true;
    }


    static bool decode_key_token(std::span<const std::byte> b,
                                 uint32_t max_attributes,
                                 FacetEntry* out) noexcept
    {
        uint16_t count = 0;
        if (!read_u16le(b, 0, &out->hotspot_x)
            || !read_u16le(b, 2, &out->hotspot_y)
            || !read_u16le(b, 4, &count)) {
            return false;
        }
        if (count > max_attributes
            || !in_bounds(b, kKeyTokenHeaderSize,
                          static_cast<uint64_t>(count) * 4ULL)) {
            return false;
        }
        out->attributes.clear();
        out->attributes.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            const uint64_t off = kKeyTokenHeaderSize + i * 4ULL;
            uint16_t tag       = 0;
            AttributeValue a;
            (void)read_u16le(b, off, &tag);
            (void)read_u16le(b, off + 2, &a.value);
            a.attribute = static_cast<RenditionAttribute>(tag);
            out->attributes.push_back(a);
            if (a.attribute == RenditionAttribute::Identifier
                && !out->has_identifier) {
                out->has_identifier = true;
                out->identifier     = a.value;
            }
        }
        return true;
    }


    static void decode_properties(RenditionValue* v,
                                  const CatalogDecodeLimits& limits) noexcept
    {
        const std::span<const std::byte> t = v->tlv;
        uint64_t p                         = 0;
        while (p + 8 <= t.size()) {
            RenditionTlv rec;
            uint32_t len = 0;
            (void)read_u32le(t, p, &rec.tag);
            (void)read_u32le(t, p + 4, &len);
            if (!in_bounds(t, p + 8, len)) {
                v->header_status = RenditionHeaderStatus::BadTlv;
                return;
            }
            if (v->properties.size() >= limits.max_tlv_records) {
                return;
            }
            rec.data = t.subspan(static_cast<size_t>(p + 8), len);
            v->properties.push_back(rec);
            p += 8ULL + len;

            const std::span<const std::byte> d = rec.data;
            switch (rec.tag) {
            case kTlvSlices:
                if (read_u32le(d, 12, &v->slice_height)
                    && read_u32le(d, 16, &v->slice_width)) {
                    v->has_slice_size = true;
                }
                break;
            case kTlvBlendModeOpacity:
                if (d.size() >= 8) {
                    v->has_blend_mode = true;
                    v->blend_mode     = read_f32le(d, 0);
                    v->opacity        = read_f32le(d, 4);
                }
                break;
            case kTlvUti: {
                uint32_t slen = 0;
                if (read_u32le(d, 0, &slen) && in_bounds(d, 8, slen)) {
                    v->has_uti = true;
                    v->uti     = padded_string(d, 8, slen);
                }
                break;
            }
            case kTlvExifOrientation:
                if (read_u32le(d, 0, &v->exif_orientation)) {
                    v->has_exif_orientation = true;
                }
                break;
            default: break;
            }
        }
    }


    static bool decode_chunks(RenditionValue* v,
                              const CatalogDecodeLimits& limits) noexcept
    {
        const std::span<const std::byte> d = v->data;
        uint64_t p                         = 0;
        while (p < d.size()) {
            uint32_t len = 0;
            if (!match_tag(d, p, "KCBC") || !read_u32le(d, p + 16, &len)
                || !in_bounds(d, p + kChunkHeaderSize, len)
                || v->chunks.size() >= limits.max_chunks) {
                return false;
            }
            v->chunks.push_back(
                d.subspan(static_cast<size_t>(p + kChunkHeaderSize), len));
            p += kChunkHeaderSize + static_cast<uint64_t>(len);
        }
        return true;
    }


    static void decode_payload(RenditionValue* v,
                               const CatalogDecodeLimits& limits) noexcept
    {
        const std::span<const std::byte> p = v->payload;
        if (p.empty()) {
            v->payload_kind = RenditionPayloadKind::None;
            return;
        }
        if (p.size() < 4) {
            v->payload_kind  = RenditionPayloadKind::Unknown;
            v->header_status = RenditionHeaderStatus::BadPayload;
            return;
        }
        (void)read_u32le(p, 4, &v->payload_version);

        if (match_tag(p, 0, "MLEC")) {
            v->payload_kind  = RenditionPayloadKind::Bitmap;
            uint32_t comp    = 0;
            uint32_t len     = 0;
            if (!read_u32le(p, 8, &comp) || !read_u32le(p, 12, &len)
                || !in_bounds(p, 16, len)) {
                v->header_status = RenditionHeaderStatus::BadPayload;
                return;
            }
            v->compression = static_cast<CompressionType>(comp);
            v->data        = p.subspan(16, len);
            if (match_tag(v->data, 0, "KCBC")) {
                v->chunked = true;
                if (!decode_chunks(v, limits)) {
                    v->chunks.clear();
                    v->header_status = RenditionHeaderStatus::BadPayload;
                }
            } else {
                v->chunks.push_back(v->data);
            }
            return;
        }
        if (match_tag(p, 0, "DWAR")) {
            v->payload_kind = RenditionPayloadKind::RawData;
            uint32_t len    = 0;
            if (!read_u32le(p, 8, &len) || !in_bounds(p, 12, len)) {
                v->header_status = RenditionHeaderStatus::BadPayload;
                return;
            }
            v->data = p.subspan(12, len);
            return;
        }
        if (match_tag(p, 0, "RLOC")) {
            v->payload_kind = RenditionPayloadKind::Color;
            uint32_t count  = 0;
            if (!read_u32le(p, 8, &v->color_flags)
                || !read_u32le(p, 12, &count)
                || count > limits.max_color_components
                || !in_bounds(p, 16, static_cast<uint64_t>(count) * 8ULL)) {
                v->header_status = RenditionHeaderStatus::BadPayload;
                return;
            }
            v->color_components.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                v->color_components.push_back(read_f64le(p, 16ULL + i * 8ULL));
            }
            return;
        }
        if (match_tag(p, 0, "SISM")) {
            v->payload_kind = RenditionPayloadKind::Multisize;
            uint32_t count  = 0;
            if (!read_u32le(p, 8, &count)
                || count > limits.max_multisize_entries
                || !in_bounds(p, 12,
                              static_cast<uint64_t>(count)
                                  * kMultisizeEntrySize)) {
                v->header_status = RenditionHeaderStatus::BadPayload;
                return;
            }
            v->multisize.reserve(count);
            for (uint32_t i = 0; i < count; ++i) {
                const uint64_t off = 12ULL + i * kMultisizeEntrySize;
                MultisizeEntry e;
                (void)read_u32le(p, off, &e.width);
                (void)read_u32le(p, off + 4, &e.height);
                (void)read_u16le(p, off + 8, &e.index);
                (void)read_u16le(p, off + 10, &e.idiom);
                v->multisize.push_back(e);
            }
            return;
        }
        v->payload_kind = RenditionPayloadKind::Unknown;
    }


    static void add_warning(std::vector<CatalogWarning>* warnings,
                            CatalogWarningKind kind, uint32_t index,
                            BlockId block,
                            RenditionHeaderStatus header_status
                            = RenditionHeaderStatus::Ok)
    {
        CatalogWarning w;
        w.kind          = kind;
        w.index         = index;
        w.block         = block;
        w.header_status = header_status;
        warnings->push_back(w);
    }


    static TreeWalkOptions block_tree_options(const TreeWalkLimits& limits,
                                              bool check_order) noexcept
    {
        TreeWalkOptions o;
        o.key_kind        = TreeRefKind::Block;
        o.value_kind      = TreeRefKind::Block;
        o.check_key_order = check_order;
        o.limits          = limits;
        return o;
    }


    // Every variable block is reached; variables holding a tree also reach
    // its nodes and leaf references. A damaged tree leaves the blocks below
    // the damage unreached.
    static uint32_t count_unreferenced_blocks(const BomStore& store,
                                              const TreeWalkLimits& limits)
    {
        std::vector<uint8_t> marks(store.block_count(), 0U);
        TreeWalkOptions o;
        o.key_kind        = TreeRefKind::Inline;
        o.value_kind      = TreeRefKind::Inline;
        o.check_key_order = false;
        o.limits          = limits;
        for (const BomVar& v : store.vars()) {
            if (!store.resolves(v.block)) {
                continue;
            }
            marks[v.block] = 1U;
            if (match_tag(store.block_bytes(v.block), 0, "tree")) {
                (void)mark_tree_blocks(store, v.block, &marks, o);
            }
        }
        uint32_t n = 0;
        for (uint32_t id = 0; id < marks.size(); ++id) {
            if (marks[id] == 0U && store.resolves(id)) {
                n += 1;
            }
        }
        return n;
    }


    static CatalogDecodeResult fail(CatalogStatus status, BlockId block)
    {
        CatalogDecodeResult r;
        r.status       = status;
        r.failed_block = block;
        return r;
    }


    static CatalogDecodeResult fail_tree(const TreeWalkResult& walk)
    {
        return fail(map_tree_status(walk.status), walk.failed_block);
    }

}  // namespace


bool
is_image_layout(uint16_t layout) noexcept
{
    return layout >= 10 && layout <= 50;
}


uint32_t
KeyFormat::key_width() const noexcept
{
    return static_cast<uint32_t>(attributes.size()) * attribute_width;
}


bool
RenditionKey::find_attribute(RenditionAttribute attribute,
                             uint16_t* out) const noexcept
{
    for (const AttributeValue& a : attributes) {
        if (a.attribute == attribute) {
            if (out) {
                *out = a.value;
            }
            return true;
        }
    }
    return false;
}


bool
RenditionValue::is_opaque() const noexcept
{
    return (flags & 0x2U) != 0U;
}


uint32_t
RenditionValue::template_mode() const noexcept
{
    return (flags >> 5) & 0x7U;
}


const BomStore&
CatalogModel::store() const noexcept
{
    return store_;
}


const CarHeader&
CatalogModel::header() const noexcept
{
    return header_;
}


const CarExtendedMetadata&
CatalogModel::extended_metadata() const noexcept
{
    return extended_;
}


const KeyFormat&
CatalogModel::key_format() const noexcept
{
    return key_format_;
}


std::span<const FacetEntry>
CatalogModel::facets() const noexcept
{
    return std::span<const FacetEntry>(facets_.data(), facets_.size());
}


std::span<const RenditionEntry>
CatalogModel::renditions() const noexcept
{
    return std::span<const RenditionEntry>(renditions_.data(),
                                           renditions_.size());
}


std::span<const AppearanceEntry>
CatalogModel::appearances() const noexcept
{
    return std::span<const AppearanceEntry>(appearances_.data(),
                                            appearances_.size());
}


std::span<const BitmapKeyEntry>
CatalogModel::bitmap_keys() const noexcept
{
    return std::span<const BitmapKeyEntry>(bitmap_keys_.data(),
                                           bitmap_keys_.size());
}


std::span<const CatalogWarning>
CatalogModel::warnings() const noexcept
{
    return std::span<const CatalogWarning>(warnings_.data(),
                                           warnings_.size());
}


const FacetEntry*
CatalogModel::facet_for(const RenditionEntry& rendition) const noexcept
{
    if (rendition.key.facet_index >= facets_.size()) {
        return nullptr;
    }
    return &facets_[rendition.key.facet_index];
}


std::string_view
CatalogModel::appearance_name(uint32_t id) const noexcept
{
    for (const AppearanceEntry& a : appearances_) {
        if (a.id == id) {
            return a.name;
        }
    }
    return {};
}


CatalogStatus
decode_key_format(std::span<const std::byte> bytes, KeyFormat* out,
                  uint32_t max_attributes) noexcept
{
    if (!out) {
        return CatalogStatus::MalformedHeader;
    }
    uint32_t count = 0;
    KeyFormat format;
    format.attribute_width = out->attribute_width;
    if (!match_tag(bytes, 0, "tmfk") || !read_u32le(bytes, 4, &format.version)
        || !read_u32le(bytes, 8, &count)) {
        return CatalogStatus::MalformedHeader;
    }
    if (count > max_attributes) {
        return CatalogStatus::LimitExceeded;
    }
    if (!in_bounds(bytes, kKeyFormatHeaderSize,
                   static_cast<uint64_t>(count) * 4ULL)) {
        return CatalogStatus::MalformedHeader;
    }
    format.attributes.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint32_t tag = 0;
        (void)read_u32le(bytes, kKeyFormatHeaderSize + i * 4ULL, &tag);
        format.attributes.push_back(static_cast<RenditionAttribute>(tag));
    }
    *out = std::move(format);
    return CatalogStatus::Ok;
}


bool
decode_rendition_key(const KeyFormat& format, std::span<const std::byte> bytes,
                     RenditionKey* out) noexcept
{
    if (!out || (format.attribute_width != 1 && format.attribute_width != 2)
        || bytes.size() != format.key_width()) {
        return false;
    }
    RenditionKey key;
    key.raw.assign(bytes.begin(), bytes.end());
    key.attributes.reserve(format.attributes.size());
    for (size_t i = 0; i < format.attributes.size(); ++i) {
        AttributeValue a;
        a.attribute = format.attributes[i];
        if (format.attribute_width == 1) {
            a.value = detail::u8(bytes[i]);
        } else {
            (void)read_u16le(bytes, i * 2ULL, &a.value);
        }
        key.attributes.push_back(a);
    }
    *out = std::move(key);
    return true;
}


bool
encode_rendition_key(const KeyFormat& format,
                     std::span<const AttributeValue> attributes,
                     std::vector<std::byte>* out) noexcept
{
    if (!out || (format.attribute_width != 1 && format.attribute_width != 2)
        || attributes.size() != format.attributes.size()) {
        return false;
    }
    std::vector<std::byte> bytes;
    bytes.reserve(format.key_width());
    for (size_t i = 0; i < attributes.size(); ++i) {
        if (attributes[i].attribute != format.attributes[i]) {
            return false;
        }
        const uint16_t v = attributes[i].value;
        if (format.attribute_width == 1) {
            if (v > 0xFFU) {
                return false;
            }
            bytes.push_back(static_cast<std::byte>(v));
        } else {
            bytes.push_back(static_cast<std::byte>(v & 0xFFU));
            bytes.push_back(static_cast<std::byte>(v >> 8));
        }
    }
    *out = std::move(bytes);
    return true;
}


void
decode_rendition_value(std::span<const std::byte> record, RenditionValue* out,
                       const CatalogDecodeLimits& limits) noexcept
{
    if (!out) {
        return;
    }
    RenditionValue v;
    v.record = record;
    if (record.size() < kCsiHeaderSize) {
        v.header_status = RenditionHeaderStatus::Truncated;
        *out            = std::move(v);
        return;
    }
    if (!match_tag(record, 0, "ISTC")) {
        v.header_status = RenditionHeaderStatus::BadMagic;
        *out            = std::move(v);
        return;
    }

    (void)read_u32le(record, 4, &v.version);
    (void)read_u32le(record, 8, &v.flags);
    (void)read_u32le(record, 12, &v.width);
    (void)read_u32le(record, 16, &v.height);
    (void)read_u32le(record, 20, &v.scale_factor);
    (void)read_u32le(record, 24, &v.pixel_format);
    (void)read_u32le(record, 28, &v.color_space);
    (void)read_u32le(record, 32, &v.mod_time);
    (void)read_u16le(record, 36, &v.layout);
    v.name = padded_string(record, 40, 128);
    (void)read_u32le(record, 168, &v.tlv_length);
    (void)read_u32le(record, 172, &v.bitmap_count);
    (void)read_u32le(record, 180, &v.payload_length);

    PixelFormatInfo info;
    if (lookup_pixel_format(v.pixel_format, &info)) {
        const uint64_t stride = static_cast<uint64_t>(v.width)
                                * pixel_layout_bytes_per_pixel(info.layout);
        if (stride <= 0xFFFFFFFFULL) {
            v.bytes_per_row = static_cast<uint32_t>(stride);
        }
    }

    if (!in_bounds(record, kCsiHeaderSize, v.tlv_length)) {
        v.header_status = RenditionHeaderStatus::Truncated;
        *out            = std::move(v);
        return;
    }
    v.tlv = record.subspan(kCsiHeaderSize, v.tlv_length);
    decode_properties(&v, limits);

    const uint64_t payload_off = static_cast<uint64_t>(kCsiHeaderSize)
                                 + v.tlv_length;
    if (!in_bounds(record, payload_off, v.payload_length)) {
        v.header_status = RenditionHeaderStatus::Truncated;
        *out            = std::move(v);
        return;
    }
    v.payload = record.subspan(static_cast<size_t>(payload_off),
                               v.payload_length);

    const RenditionHeaderStatus tlv_status = v.header_status;
    decode_payload(&v, limits);
    if (tlv_status != RenditionHeaderStatus::Ok) {
        v.header_status = tlv_status;
    }
    *out = std::move(v);
}


CatalogDecodeResult
decode_catalog(const BomStore& store, CatalogModel* out,
               const CatalogDecodeOptions& options) noexcept
{
    if (!out) {
        return fail(CatalogStatus::MalformedHeader, kInvalidBlockId);
    }
    *out = CatalogModel {};

    // Well-known named records.
    static constexpr const char* kSingletons[] = { "CARHEADER", "KEYFORMAT" };
    for (const char* name : kSingletons) {
        const uint32_t n = store.count_vars(name);
        if (n == 0) {
            return fail(CatalogStatus::MissingHeader, kInvalidBlockId);
        }
        if (n > 1) {
            return fail(CatalogStatus::DuplicateHeader, store.find_var(name));
        }
    }
    const BlockId facets_tree     = store.find_var("FACETKEYS");
    const BlockId renditions_tree = store.find_var("RENDITIONS");
    if (facets_tree == kInvalidBlockId || renditions_tree == kInvalidBlockId) {
        return fail(CatalogStatus::MissingHeader, kInvalidBlockId);
    }

    CarHeader header;
    const BlockId header_block = store.find_var("CARHEADER");
    if (!decode_car_header(store.block_bytes(header_block), &header)) {
        return fail(CatalogStatus::MalformedHeader, header_block);
    }

    CarExtendedMetadata extended;
    const BlockId extended_block = store.find_var("EXTENDED_METADATA");
    if (extended_block != kInvalidBlockId) {
        (void)decode_extended_metadata(store.block_bytes(extended_block),
                                       &extended);
    }

    KeyFormat key_format;
    key_format.attribute_width = options.key_attribute_width;
    if (options.key_attribute_width != 1 && options.key_attribute_width != 2) {
        return fail(CatalogStatus::MalformedHeader, kInvalidBlockId);
    }
    const BlockId key_format_block = store.find_var("KEYFORMAT");
    const CatalogStatus kfs
        = decode_key_format(store.block_bytes(key_format_block), &key_format,
                            options.limits.max_key_attributes);
    if (kfs != CatalogStatus::Ok) {
        return fail(kfs, key_format_block);
    }

    std::vector<CatalogWarning> warnings;

    // Facets.
    std::vector<TreeEntry> entries;
    TreeWalkResult walk
        = collect_tree(store, facets_tree, &entries,
                       block_tree_options(options.tree_limits,
                                          options.check_facet_order));
    if (walk.status != TreeStatus::Ok) {
        return fail_tree(walk);
    }
    if (entries.size() > options.limits.max_facets) {
        return fail(CatalogStatus::LimitExceeded, facets_tree);
    }
    std::vector<FacetEntry> facets;
    facets.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const TreeEntry& e = entries[i];
        FacetEntry facet;
        facet.name = padded_string(e.key, 0, e.key.size());
        if (!decode_key_token(e.value, options.limits.max_key_attributes,
                              &facet)) {
            facet.attributes.clear();
            facet.has_identifier = false;
            add_warning(&warnings, CatalogWarningKind::MalformedFacet,
                        static_cast<uint32_t>(i), e.value_ref);
        }
        facets.push_back(std::move(facet));
    }
    std::stable_sort(facets.begin(), facets.end(),
                     [](const FacetEntry& a, const FacetEntry& b) {
                         return a.name < b.name;
                     });
    std::unordered_map<uint16_t, uint32_t> facet_by_identifier;
    for (uint32_t i = 0; i < facets.size(); ++i) {
        if (facets[i].has_identifier) {
            facet_by_identifier.emplace(facets[i].identifier, i);
        }
    }

    // Renditions. Keys sort as attribute values, not as bytes.
    CatalogDecodeResult result;
    entries.clear();
    TreeWalkOptions rendition_walk
        = block_tree_options(options.tree_limits,
                             options.check_rendition_order);
    if (key_format.attribute_width == 2) {
        rendition_walk.key_order = TreeKeyOrder::Uint16Le;
    }
    walk = collect_tree(store, renditions_tree, &entries, rendition_walk);
    if (walk.status != TreeStatus::Ok) {
        return fail_tree(walk);
    }
    if (entries.size() > options.limits.max_renditions) {
        return fail(CatalogStatus::LimitExceeded, renditions_tree);
    }
    std::vector<RenditionEntry> renditions;
    renditions.reserve(entries.size());
    std::set<std::vector<std::byte>> seen_keys;
    for (size_t i = 0; i < entries.size(); ++i) {
        const TreeEntry& e = entries[i];
        RenditionEntry r;
        r.key_block   = e.key_ref;
        r.value_block = e.value_ref;
        if (!decode_rendition_key(key_format, e.key, &r.key)) {
            return fail(CatalogStatus::MalformedKey, e.key_ref);
        }
        const uint32_t index = static_cast<uint32_t>(renditions.size());
        if (!seen_keys.insert(r.key.raw).second) {
            result.duplicates += 1;
            add_warning(&warnings, CatalogWarningKind::DuplicateRendition,
                        static_cast<uint32_t>(i), e.key_ref);
            continue;
        }

        uint16_t identifier = 0;
        if (r.key.find_attribute(RenditionAttribute::Identifier,
                                 &identifier)) {
            const auto it = facet_by_identifier.find(identifier);
            if (it != facet_by_identifier.end()) {
                r.key.facet_index = it->second;
            }
        }
        if (r.key.facet_index == kNoFacet) {
            result.orphans += 1;
            add_warning(&warnings, CatalogWarningKind::OrphanRendition, index,
                        e.key_ref);
        }

        decode_rendition_value(e.value, &r.value, options.limits);
        if (r.value.header_status != RenditionHeaderStatus::Ok) {
            add_warning(&warnings, CatalogWarningKind::MalformedRendition,
                        index, e.value_ref, r.value.header_status);
        }
        renditions.push_back(std::move(r));
    }

    // Optional appearance names.
    std::vector<AppearanceEntry> appearances;
    const BlockId appearance_tree = store.find_var("APPEARANCEKEYS");
    if (appearance_tree != kInvalidBlockId) {
        entries.clear();
        walk = collect_tree(store, appearance_tree, &entries,
                            block_tree_options(options.tree_limits, false));
        if (walk.status != TreeStatus::Ok) {
            return fail_tree(walk);
        }
        for (size_t i = 0; i < entries.size(); ++i) {
            AppearanceEntry a;
            if (!read_u32le(entries[i].value, 0, &a.id)) {
                add_warning(&warnings, CatalogWarningKind::MalformedAppearance,
                            static_cast<uint32_t>(i), entries[i].value_ref);
                continue;
            }
            a.name = padded_string(entries[i].key, 0, entries[i].key.size());
            appearances.push_back(std::move(a));
        }
    }

    // Optional bitmap keys (inline name identifier keys).
    std::vector<BitmapKeyEntry> bitmap_keys;
    const BlockId bitmap_tree = store.find_var("BITMAPKEYS");
    if (bitmap_tree != kInvalidBlockId) {
        TreeWalkOptions o = block_tree_options(options.tree_limits, false);
        o.key_kind        = TreeRefKind::Inline;
        entries.clear();
        walk = collect_tree(store, bitmap_tree, &entries, o);
        if (walk.status != TreeStatus::Ok) {
            return fail_tree(walk);
        }
        for (size_t i = 0; i < entries.size(); ++i) {
            const TreeEntry& e = entries[i];
            if (!in_bounds(e.value, 0, kBitmapKeyFields * 2ULL)) {
                add_warning(&warnings, CatalogWarningKind::MalformedBitmapKey,
                            static_cast<uint32_t>(i), e.value_ref);
                continue;
            }
            BitmapKeyEntry k;
            k.name_identifier = e.key_ref;
            for (uint32_t f = 0; f < kBitmapKeyFields; ++f) {
                (void)read_u16le(e.value, f * 2ULL, &k.fields[f]);
            }
            bitmap_keys.push_back(k);
        }
    }

    result.facets     = static_cast<uint32_t>(facets.size());
    result.renditions = static_cast<uint32_t>(renditions.size());
    result.warnings   = static_cast<uint32_t>(warnings.size());
    result.unreferenced_blocks
        = count_unreferenced_blocks(store, options.tree_limits);

    out->store_       = store;
    out->header_      = std::move(header);
    out->extended_    = std::move(extended);
    out->key_format_  = std::move(key_format);
    out->facets_      = std::move(facets);
    out->renditions_  = std::move(renditions);
    out->appearances_ = std::move(appearances);
    out->bitmap_keys_ = std::move(bitmap_keys);
    out->warnings_    = std::move(warnings);
    return result;
}


CatalogDecodeResult
parse_catalog(std::span<const std::byte> bytes, CatalogModel* out,
              const CatalogDecodeOptions& options) noexcept
{
    if (out) {
        *out = CatalogModel {};
    }
    BomStore store;
    const BomParseResult bom = parse_bom(bytes, store, options.bom);
    if (bom.status != BomStatus::Ok) {
        return fail(map_bom_status(bom.status), kInvalidBlockId);
    }
    return decode_catalog(store, out, options);
}


TreeStatus
lookup_facet(const BomStore& store, std::string_view name, FacetEntry* out,
             const TreeWalkLimits& limits) noexcept
{
    if (!out) {
        return TreeStatus::MalformedTree;
    }
    const BlockId tree = store.find_var("FACETKEYS");
    if (tree == kInvalidBlockId) {
        return TreeStatus::NotFound;
    }
    TreeEntry entry;
    const std::span<const std::byte> key(
        reinterpret_cast<const std::byte*>(name.data()), name.size());
    const TreeStatus st = find_tree_entry(store, tree, key, &entry,
                                          block_tree_options(limits, false));
    if (st != TreeStatus::Ok) {
        return st;
    }
    FacetEntry facet;
    facet.name = std::string(name);
    if (!decode_key_token(entry.value,
                          CatalogDecodeLimits {}.max_key_attributes, &facet)) {
        return TreeStatus::MalformedTree;
    }
    *out = std::move(facet);
    return TreeStatus::Ok;
}

}  // namespace carkit
