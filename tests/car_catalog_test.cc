#include "carkit/car_catalog.h"

#include "carkit/pixel_format.h"

#include "car_test_builder.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace carkit {
namespace {

    using test::append_u32le;
    using test::as_span;
    using test::Bytes;
    using test::bytes_of;
    using test::CatalogBuilder;
    using test::CsiSpec;

    static constexpr uint16_t kAppearance = 7;
    static constexpr uint16_t kScale      = 12;
    static constexpr uint16_t kIdiom      = 15;
    static constexpr uint16_t kIdentifier = 17;

    // Appearance, Scale, Idiom, Identifier.
    static std::vector<uint32_t> standard_key_format()
    {
        return { kAppearance, kScale, kIdiom, kIdentifier };
    }


    static Bytes gray_csi(const std::string& name, uint32_t w, uint32_t h)
    {
        CsiSpec s;
        s.width        = w;
        s.height       = h;
        s.pixel_format = static_cast<uint32_t>(PixelFormat::G8);
        s.color_space  = 2;
        s.name         = name;
        s.payload      = test::mlec_payload(0, Bytes(w * h, std::byte { 0x7F }));
        return test::csi_bytes(s);
    }


    static Bytes uti_tlv(const std::string& uti)
    {
        Bytes d;
        append_u32le(&d, static_cast<uint32_t>(uti.size()));
        append_u32le(&d, 0);
        test::append_text(&d, uti);
        return test::tlv_bytes(kTlvUti, d);
    }


    static void append_f32le(Bytes* out, float f)
    {
        uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        append_u32le(out, bits);
    }


    // Two facets with three renditions: "arrow" at 1x and 2x, "badge" at 1x.
    static CatalogBuilder two_facet_catalog()
    {
        CatalogBuilder b(standard_key_format());
        b.set_extended_metadata(test::extended_metadata_bytes(
            "optimized", "12.0", "ios", "actool"));
        b.add_facet("badge", { { kIdentifier, 20 } });
        b.add_facet("arrow", { { 1, 85 }, { kIdentifier, 10 } });
        b.add_rendition({ 0, 100, 0, 10 }, gray_csi("arrow.png", 2, 2));
        b.add_rendition({ 0, 100, 1, 20 }, gray_csi("badge.png", 3, 1));
        b.add_rendition({ 0, 200, 0, 10 }, gray_csi("arrow@2x.png", 4, 4));
        b.add_appearance("NSAppearanceNameDarkAqua", 1);
        b.add_appearance("NSAppearanceNameSystem", 0);
        return b;
    }

}  // namespace


TEST(CarCatalog, DecodesOneByteKeyFormat)
{
    const Bytes kf = test::key_format_bytes({ kIdiom, kScale });
    KeyFormat format;
    format.attribute_width = 1;
    ASSERT_EQ(decode_key_format(as_span(kf), &format), CatalogStatus::Ok);
    EXPECT_EQ(format.attribute_width, 1U);
    ASSERT_EQ(format.attributes.size(), 2U);
    EXPECT_EQ(format.key_width(), 2U);

    const Bytes raw = bytes_of({ 0x01, 0x02 });
    RenditionKey key;
    ASSERT_TRUE(decode_rendition_key(format, as_span(raw), &key));
    ASSERT_EQ(key.attributes.size(), 2U);
    EXPECT_EQ(key.attributes[0].attribute, RenditionAttribute::Idiom);
    EXPECT_EQ(key.attributes[0].value, 1U);
    EXPECT_EQ(key.attributes[1].attribute, RenditionAttribute::Scale);
    EXPECT_EQ(key.attributes[1].value, 2U);

    uint16_t v = 0;
    EXPECT_TRUE(key.find_attribute(RenditionAttribute::Scale, &v));
    EXPECT_EQ(v, 2U);
    EXPECT_FALSE(key.find_attribute(RenditionAttribute::Identifier, &v));

    const Bytes wide = bytes_of({ 0x01, 0x00, 0x02 });
    EXPECT_FALSE(decode_rendition_key(format, as_span(wide), &key));
}


TEST(CarCatalog, RejectsBadKeyFormat)
{
    KeyFormat format;
    Bytes kf = test::key_format_bytes({ kIdiom });
    kf[0]    = std::byte { 'x' };
    EXPECT_EQ(decode_key_format(as_span(kf), &format),
              CatalogStatus::MalformedHeader);

    kf = test::key_format_bytes({ kIdiom, kScale });
    kf.resize(kf.size() - 1);
    EXPECT_EQ(decode_key_format(as_span(kf), &format),
              CatalogStatus::MalformedHeader);

    kf = test::key_format_bytes({ kIdiom, kScale, kAppearance });
    EXPECT_EQ(decode_key_format(as_span(kf), &format, 2),
              CatalogStatus::LimitExceeded);
}


TEST(CarCatalog, KeepsWideKeyFormatTags)
{
    // 0x10011 must not alias Identifier (17).
    const Bytes kf = test::key_format_bytes({ kIdiom, 0x10011U });
    KeyFormat format;
    ASSERT_EQ(decode_key_format(as_span(kf), &format), CatalogStatus::Ok);
    ASSERT_EQ(format.attributes.size(), 2U);
    EXPECT_EQ(static_cast<uint32_t>(format.attributes[1]), 0x10011U);
    EXPECT_NE(format.attributes[1], RenditionAttribute::Identifier);

    CatalogBuilder b({ kIdiom, 0x10011U });
    b.add_rendition({ 1, 9 }, gray_csi("x", 1, 1));
    const Bytes file = b.finish();
    CatalogModel model;
    ASSERT_EQ(parse_catalog(as_span(file), &model).status, CatalogStatus::Ok);
    ASSERT_EQ(model.renditions().size(), 1U);
    const RenditionKey& key = model.renditions()[0].key;
    uint16_t v              = 0;
    EXPECT_TRUE(key.find_attribute(static_cast<RenditionAttribute>(0x10011U),
                                   &v));
    EXPECT_EQ(v, 9U);
    EXPECT_FALSE(key.find_attribute(RenditionAttribute::Identifier, &v));
    EXPECT_EQ(key.facet_index, kNoFacet);
}


TEST(CarCatalog, EncodesKeysInFormatOrder)
{
    KeyFormat format;
    format.attributes = { RenditionAttribute::Scale,
                          RenditionAttribute::Identifier };
    const AttributeValue values[] = {
        { RenditionAttribute::Scale, 2 },
        { RenditionAttribute::Identifier, 0x1234 },
    };
    std::vector<std::byte> raw;
    ASSERT_TRUE(encode_rendition_key(format, values, &raw));
    EXPECT_EQ(raw, bytes_of({ 0x02, 0x00, 0x34, 0x12 }));

    RenditionKey key;
    ASSERT_TRUE(decode_rendition_key(format, raw, &key));
    EXPECT_EQ(key.attributes[1].value, 0x1234U);

    const AttributeValue swapped[] = {
        { RenditionAttribute::Identifier, 1 },
        { RenditionAttribute::Scale, 2 },
    };
    EXPECT_FALSE(encode_rendition_key(format, swapped, &raw));

    format.attribute_width = 1;
    EXPECT_FALSE(encode_rendition_key(format, values, &raw));
}


TEST(CarCatalog, DecodesCatalog)
{
    const Bytes file = two_facet_catalog().finish();
    CatalogModel model;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model);
    ASSERT_EQ(r.status, CatalogStatus::Ok);
    EXPECT_EQ(r.facets, 2U);
    EXPECT_EQ(r.renditions, 3U);
    EXPECT_EQ(r.orphans, 0U);
    EXPECT_EQ(r.duplicates, 0U);
    EXPECT_EQ(r.warnings, 0U);
    EXPECT_EQ(r.unreferenced_blocks, 0U);

    const CarHeader& h = model.header();
    EXPECT_EQ(h.core_ui_version, 498U);
    EXPECT_EQ(h.storage_version, 15U);
    EXPECT_EQ(h.storage_timestamp, 1539543253U);
    EXPECT_EQ(h.rendition_count, 3U);
    EXPECT_EQ(h.version, "IBCocoaTouchImageCatalogTool-10.0");
    EXPECT_EQ(h.uuid[0], 0xA0U);
    EXPECT_EQ(h.schema_version, 2U);
    EXPECT_EQ(h.key_semantics, 1U);

    const CarExtendedMetadata& ext = model.extended_metadata();
    EXPECT_TRUE(ext.present);
    EXPECT_EQ(ext.thinning_arguments, "optimized");
    EXPECT_EQ(ext.deployment_platform_version, "12.0");
    EXPECT_EQ(ext.deployment_platform, "ios");
    EXPECT_EQ(ext.authoring_tool, "actool");

    EXPECT_EQ(model.key_format().attributes.size(), 4U);

    ASSERT_EQ(model.facets().size(), 2U);
    EXPECT_EQ(model.facets()[0].name, "arrow");
    EXPECT_TRUE(model.facets()[0].has_identifier);
    EXPECT_EQ(model.facets()[0].identifier, 10U);
    EXPECT_EQ(model.facets()[0].attributes.size(), 2U);
    EXPECT_EQ(model.facets()[1].name, "badge");

    ASSERT_EQ(model.renditions().size(), 3U);
    const RenditionEntry& first = model.renditions()[0];
    ASSERT_NE(model.facet_for(first), nullptr);
    EXPECT_EQ(model.facet_for(first)->name, "arrow");
    EXPECT_EQ(first.value.name, "arrow.png");
    EXPECT_EQ(first.value.width, 2U);
    EXPECT_EQ(first.value.bytes_per_row, 2U);
    EXPECT_EQ(first.value.payload_kind, RenditionPayloadKind::Bitmap);
    EXPECT_EQ(first.value.compression, CompressionType::Uncompressed);
    EXPECT_EQ(first.value.data.size(), 4U);
    EXPECT_EQ(model.facet_for(model.renditions()[1])->name, "badge");

    uint16_t scale = 0;
    EXPECT_TRUE(model.renditions()[2].key.find_attribute(
        RenditionAttribute::Scale, &scale));
    EXPECT_EQ(scale, 200U);

    ASSERT_EQ(model.appearances().size(), 2U);
    EXPECT_EQ(model.appearance_name(1), "NSAppearanceNameDarkAqua");
    EXPECT_EQ(model.appearance_name(0), "NSAppearanceNameSystem");
    EXPECT_TRUE(model.appearance_name(7).empty());
}


TEST(CarCatalog, DecodesOneByteCatalogKeys)
{
    CatalogBuilder b({ kIdiom, kScale });
    b.add_raw_rendition(bytes_of({ 0x01, 0x02 }), gray_csi("x", 1, 1));
    const Bytes file = b.finish();

    CatalogDecodeOptions opts;
    opts.key_attribute_width = 1;
    CatalogModel model;
    ASSERT_EQ(parse_catalog(as_span(file), &model, opts).status,
              CatalogStatus::Ok);
    ASSERT_EQ(model.renditions().size(), 1U);
    const RenditionKey& key = model.renditions()[0].key;
    uint16_t idiom          = 0;
    uint16_t scale          = 0;
    EXPECT_TRUE(key.find_attribute(RenditionAttribute::Idiom, &idiom));
    EXPECT_TRUE(key.find_attribute(RenditionAttribute::Scale, &scale));
    EXPECT_EQ(idiom, 1U);
    EXPECT_EQ(scale, 2U);

    // The default two-byte width does not fit these keys.
    EXPECT_EQ(parse_catalog(as_span(file), &model).status,
              CatalogStatus::MalformedKey);
    EXPECT_TRUE(model.renditions().empty());

    opts.key_attribute_width = 3;
    EXPECT_EQ(parse_catalog(as_span(file), &model, opts).status,
              CatalogStatus::MalformedHeader);
}


TEST(CarCatalog, ReportsOrphansAndDuplicates)
{
    CatalogBuilder b(standard_key_format());
    b.add_facet("icon", { { kIdentifier, 5 } });
    b.add_rendition({ 0, 100, 0, 5 }, gray_csi("a", 1, 1));
    b.add_rendition({ 0, 100, 0, 5 }, gray_csi("b", 1, 1));
    b.add_rendition({ 0, 100, 0, 99 }, gray_csi("c", 1, 1));
    const Bytes file = b.finish();

    // A repeated key breaks the strict key order.
    CatalogModel model;
    EXPECT_EQ(parse_catalog(as_span(file), &model).status,
              CatalogStatus::MalformedTree);

    CatalogDecodeOptions lenient;
    lenient.check_rendition_order = false;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model,
                                                lenient);
    ASSERT_EQ(r.status, CatalogStatus::Ok);
    EXPECT_EQ(r.renditions, 2U);
    EXPECT_EQ(r.duplicates, 1U);
    EXPECT_EQ(r.orphans, 1U);
    EXPECT_EQ(r.warnings, 2U);

    ASSERT_EQ(model.renditions().size(), 2U);
    EXPECT_EQ(model.renditions()[0].value.name, "a");
    EXPECT_EQ(model.renditions()[1].key.facet_index, kNoFacet);
    EXPECT_EQ(model.facet_for(model.renditions()[1]), nullptr);

    ASSERT_EQ(model.warnings().size(), 2U);
    EXPECT_EQ(model.warnings()[0].kind,
              CatalogWarningKind::DuplicateRendition);
    EXPECT_EQ(model.warnings()[0].index, 1U);
    EXPECT_EQ(model.warnings()[1].kind, CatalogWarningKind::OrphanRendition);
    EXPECT_EQ(model.warnings()[1].index, 1U);
}


TEST(CarCatalog, DuplicateWarningUsesTreeIndex)
{
    CatalogBuilder b({ kScale, kIdentifier });
    b.add_facet("icon", { { kIdentifier, 1 } });
    b.add_rendition({ 100, 1 }, gray_csi("a", 1, 1));
    b.add_rendition({ 200, 1 }, gray_csi("b", 1, 1));
    b.add_rendition({ 300, 1 }, gray_csi("c", 1, 1));
    b.add_rendition({ 300, 1 }, gray_csi("d", 1, 1));
    b.add_rendition({ 300, 1 }, gray_csi("e", 1, 1));
    const Bytes file = b.finish();

    CatalogDecodeOptions lenient;
    lenient.check_rendition_order = false;
    CatalogModel model;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model,
                                                lenient);
    ASSERT_EQ(r.status, CatalogStatus::Ok);
    EXPECT_EQ(r.renditions, 3U);
    EXPECT_EQ(r.duplicates, 2U);
    ASSERT_EQ(model.warnings().size(), 2U);
    EXPECT_EQ(model.warnings()[0].index, 3U);
    EXPECT_EQ(model.warnings()[1].index, 4U);
    EXPECT_NE(model.warnings()[0].block, model.warnings()[1].block);
}


TEST(CarCatalog, RejectsOutOfOrderRenditionKeys)
{
    CatalogBuilder b({ kScale, kIdentifier });
    b.keep_rendition_order();
    b.add_facet("icon", { { kIdentifier, 1 } });
    b.add_rendition({ 200, 1 }, gray_csi("a", 1, 1));
    b.add_rendition({ 100, 1 }, gray_csi("b", 1, 1));
    b.add_rendition({ 200, 1 }, gray_csi("c", 1, 1));
    const Bytes file = b.finish();

    CatalogModel model;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model);
    EXPECT_EQ(r.status, CatalogStatus::MalformedTree);
    EXPECT_EQ(r.duplicates, 0U);
    EXPECT_TRUE(model.renditions().empty());

    CatalogBuilder swapped({ kScale, kIdentifier });
    swapped.keep_rendition_order();
    swapped.add_rendition({ 200, 1 }, gray_csi("a", 1, 1));
    swapped.add_rendition({ 100, 1 }, gray_csi("b", 1, 1));
    const Bytes two = swapped.finish();
    EXPECT_EQ(parse_catalog(as_span(two), &model).status,
              CatalogStatus::MalformedTree);

    CatalogDecodeOptions lenient;
    lenient.check_rendition_order = false;
    EXPECT_EQ(parse_catalog(as_span(two), &model, lenient).status,
              CatalogStatus::Ok);
    EXPECT_EQ(model.renditions().size(), 2U);
}


TEST(CarCatalog, RenditionKeysSortByAttributeValue)
{
    // 255 and 256 are ff 00 and 00 01 on disk: numeric and byte order
    // disagree.
    CatalogBuilder b({ kScale, kIdentifier });
    b.keep_rendition_order();
    b.add_rendition({ 255, 1 }, gray_csi("a", 1, 1));
    b.add_rendition({ 256, 1 }, gray_csi("b", 1, 1));
    const Bytes file = b.finish();

    CatalogModel model;
    ASSERT_EQ(parse_catalog(as_span(file), &model).status, CatalogStatus::Ok);
    ASSERT_EQ(model.renditions().size(), 2U);
    EXPECT_EQ(model.renditions()[0].value.name, "a");
    EXPECT_EQ(model.renditions()[1].value.name, "b");
}


TEST(CarCatalog, CountsUnreferencedBlocks)
{
    CatalogBuilder b(standard_key_format());
    b.add_facet("icon", { { kIdentifier, 5 } });
    b.add_rendition({ 0, 100, 0, 5 }, gray_csi("a", 1, 1));
    b.add_stray_block(bytes_of("left over"));
    b.add_stray_block(bytes_of("also unused"));
    const Bytes file = b.finish();

    BomStore store;
    const BomParseResult br = parse_bom(as_span(file), store);
    ASSERT_EQ(br.status, BomStatus::Ok);
    EXPECT_EQ(br.null_blocks, 1U);

    CatalogModel model;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model);
    ASSERT_EQ(r.status, CatalogStatus::Ok);
    EXPECT_EQ(r.unreferenced_blocks, 2U);
    EXPECT_EQ(r.orphans, 0U);
}


TEST(CarCatalog, MissingOrDuplicateHeaders)
{
    CatalogBuilder no_kf(standard_key_format());
    no_kf.omit_key_format();
    const Bytes a = no_kf.finish();
    CatalogModel model;
    EXPECT_EQ(parse_catalog(as_span(a), &model).status,
              CatalogStatus::MissingHeader);

    CatalogBuilder dup(standard_key_format());
    dup.duplicate_car_header();
    const Bytes b = dup.finish();
    EXPECT_EQ(parse_catalog(as_span(b), &model).status,
              CatalogStatus::DuplicateHeader);

    test::BomBuilder bom;
    bom.add_var("CARHEADER", bom.add_block(test::car_header_bytes()));
    bom.add_var("KEYFORMAT",
                bom.add_block(test::key_format_bytes({ kIdiom })));
    const Bytes c = bom.finish();
    EXPECT_EQ(parse_catalog(as_span(c), &model).status,
              CatalogStatus::MissingHeader);
}


TEST(CarCatalog, MalformedCarHeader)
{
    test::BomBuilder bom;
    Bytes header = test::car_header_bytes();
    header.resize(100);
    bom.add_var("CARHEADER", bom.add_block(header));
    bom.add_var("KEYFORMAT",
                bom.add_block(test::key_format_bytes({ kIdiom })));
    bom.add_var("FACETKEYS", bom.add_leaf_tree({}));
    bom.add_var("RENDITIONS", bom.add_leaf_tree({}));
    const Bytes file = bom.finish();

    CatalogModel model;
    EXPECT_EQ(parse_catalog(as_span(file), &model).status,
              CatalogStatus::MalformedHeader);
}


TEST(CarCatalog, TruncatedContainer)
{
    const Bytes file = two_facet_catalog().finish();
    CatalogModel model;

    const Bytes tiny(file.begin(), file.begin() + 20);
    EXPECT_EQ(parse_catalog(as_span(tiny), &model).status,
              CatalogStatus::TruncatedHeader);

    const Bytes cut(file.begin(), file.end() - 6);
    EXPECT_EQ(parse_catalog(as_span(cut), &model).status,
              CatalogStatus::PointerOutOfBounds);

    Bytes bad = file;
    bad[3]    = std::byte { 0 };
    EXPECT_EQ(parse_catalog(as_span(bad), &model).status,
              CatalogStatus::BadMagic);
}


TEST(CarCatalog, EveryTruncatedPrefixFails)
{
    const Bytes file = two_facet_catalog().finish();
    for (size_t len = 0; len < file.size(); ++len) {
        const Bytes cut(file.begin(),
                        file.begin() + static_cast<std::ptrdiff_t>(len));
        CatalogModel model;
        const CatalogStatus st = parse_catalog(as_span(cut), &model).status;
        EXPECT_TRUE(st == CatalogStatus::TruncatedHeader
                    || st == CatalogStatus::PointerOutOfBounds)
            << "len=" << len << " status=" << static_cast<int>(st);
    }
}


TEST(CarCatalog, MalformedRenditionIsRecoverable)
{
    CatalogBuilder b(standard_key_format());
    b.add_facet("icon", { { kIdentifier, 5 } });
    Bytes broken = gray_csi("broken", 2, 2);
    broken.resize(broken.size() - 2);
    b.add_rendition({ 0, 100, 0, 5 }, broken);
    b.add_raw_facet("zzz", bytes_of({ 0x00 }));
    const Bytes file = b.finish();

    CatalogModel model;
    const CatalogDecodeResult r = parse_catalog(as_span(file), &model);
    ASSERT_EQ(r.status, CatalogStatus::Ok);
    ASSERT_EQ(model.renditions().size(), 1U);
    EXPECT_EQ(model.renditions()[0].value.header_status,
              RenditionHeaderStatus::Truncated);

    bool saw_facet     = false;
    bool saw_rendition = false;
    for (const CatalogWarning& w : model.warnings()) {
        if (w.kind == CatalogWarningKind::MalformedFacet) {
            saw_facet = true;
        }
        if (w.kind == CatalogWarningKind::MalformedRendition) {
            saw_rendition = true;
            EXPECT_EQ(w.header_status, RenditionHeaderStatus::Truncated);
        }
    }
    EXPECT_TRUE(saw_facet);
    EXPECT_TRUE(saw_rendition);
    ASSERT_EQ(model.facets().size(), 2U);
    EXPECT_TRUE(model.facets()[1].attributes.empty());
}


TEST(CarCatalog, DecodesBitmapKeys)
{
    CatalogBuilder b(standard_key_format());
    Bytes fields;
    for (uint16_t i = 0; i < kBitmapKeyFields; ++i) {
        test::append_u16le(&fields, static_cast<uint16_t>(i + 1));
    }
    b.add_bitmap_key(10, fields);
    b.add_bitmap_key(20, bytes_of({ 0x01 }));
    const Bytes file = b.finish();

    CatalogModel model;
    ASSERT_EQ(parse_catalog(as_span(file), &model).status, CatalogStatus::Ok);
    ASSERT_EQ(model.bitmap_keys().size(), 1U);
    EXPECT_EQ(model.bitmap_keys()[0].name_identifier, 10U);
    EXPECT_EQ(model.bitmap_keys()[0].fields[0], 1U);
    EXPECT_EQ(model.bitmap_keys()[0].fields[10], 11U);
    ASSERT_EQ(model.warnings().size(), 1U);
    EXPECT_EQ(model.warnings()[0].kind,
              CatalogWarningKind::MalformedBitmapKey);
}


TEST(CarCatalog, LooksUpFacetByName)
{
    const Bytes file = two_facet_catalog().finish();
    BomStore store;
    ASSERT_EQ(parse_bom(as_span(file), store).status, BomStatus::Ok);

    FacetEntry facet;
    ASSERT_EQ(lookup_facet(store, "badge", &facet), TreeStatus::Ok);
    EXPECT_EQ(facet.name, "badge");
    EXPECT_TRUE(facet.has_identifier);
    EXPECT_EQ(facet.identifier, 20U);

    EXPECT_EQ(lookup_facet(store, "missing", &facet), TreeStatus::NotFound);
}


TEST(CarCatalog, DecodesCsiProperties)
{
    Bytes slices;
    append_u32le(&slices, 1);
    append_u32le(&slices, 0);
    append_u32le(&slices, 0);
    append_u32le(&slices, 48);  // height
    append_u32le(&slices, 64);  // width
    Bytes blend;
    append_f32le(&blend, 0.0F);
    append_f32le(&blend, 0.5F);
    Bytes orientation;
    append_u32le(&orientation, 6);

    CsiSpec s;
    s.flags        = 0x2U | (2U << 5);
    s.width        = 64;
    s.height       = 48;
    s.scale_factor = 200;
    s.pixel_format = static_cast<uint32_t>(PixelFormat::Argb);
    s.name         = "hero@2x.png";
    s.tlv          = test::tlv_bytes(kTlvSlices, slices);
    const Bytes uti = uti_tlv("public.png");
    s.tlv.insert(s.tlv.end(), uti.begin(), uti.end());
    const Bytes b2 = test::tlv_bytes(kTlvBlendModeOpacity, blend);
    s.tlv.insert(s.tlv.end(), b2.begin(), b2.end());
    const Bytes o = test::tlv_bytes(kTlvExifOrientation, orientation);
    s.tlv.insert(s.tlv.end(), o.begin(), o.end());
    s.payload = test::mlec_payload(1, bytes_of({ 0x80, 1, 2, 3, 4 }));
    const Bytes record = test::csi_bytes(s);

    RenditionValue v;
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_EQ(v.record.size(), record.size());
    EXPECT_EQ(v.version, 1U);
    EXPECT_EQ(v.scale_factor, 200U);
    EXPECT_EQ(v.layout, 12U);
    EXPECT_EQ(v.name, "hero@2x.png");
    EXPECT_EQ(v.bytes_per_row, 256U);
    EXPECT_TRUE(v.is_opaque());
    EXPECT_EQ(v.template_mode(), 2U);
    EXPECT_EQ(v.properties.size(), 4U);
    EXPECT_TRUE(v.has_slice_size);
    EXPECT_EQ(v.slice_width, 64U);
    EXPECT_EQ(v.slice_height, 48U);
    EXPECT_TRUE(v.has_uti);
    EXPECT_EQ(v.uti, "public.png");
    EXPECT_TRUE(v.has_blend_mode);
    EXPECT_FLOAT_EQ(v.opacity, 0.5F);
    EXPECT_TRUE(v.has_exif_orientation);
    EXPECT_EQ(v.exif_orientation, 6U);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::Bitmap);
    EXPECT_EQ(v.compression, CompressionType::Rle);
    EXPECT_EQ(v.data.size(), 5U);
    ASSERT_EQ(v.chunks.size(), 1U);
    EXPECT_FALSE(v.chunked);
}


TEST(CarCatalog, DecodesChunkedBitmap)
{
    Bytes chunks = test::kcbc_chunk(bytes_of({ 1, 2, 3 }));
    const Bytes second = test::kcbc_chunk(bytes_of({ 4 }));
    chunks.insert(chunks.end(), second.begin(), second.end());

    CsiSpec s;
    s.width        = 2;
    s.height       = 2;
    s.pixel_format = static_cast<uint32_t>(PixelFormat::G8);
    s.payload      = test::mlec_payload(0, chunks);
    const Bytes record = test::csi_bytes(s);

    RenditionValue v;
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_TRUE(v.chunked);
    ASSERT_EQ(v.chunks.size(), 2U);
    EXPECT_EQ(v.chunks[0].size(), 3U);
    EXPECT_EQ(v.chunks[1].size(), 1U);

    // A chunk that claims more bytes than remain.
    Bytes bad_chunks = test::kcbc_chunk(bytes_of({ 1, 2 }));
    bad_chunks[16]   = std::byte { 9 };
    s.payload        = test::mlec_payload(0, bad_chunks);
    const Bytes bad  = test::csi_bytes(s);
    decode_rendition_value(as_span(bad), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::BadPayload);
    EXPECT_TRUE(v.chunks.empty());
}


TEST(CarCatalog, DecodesColorAndMultisizePayloads)
{
    CsiSpec color;
    color.layout  = static_cast<uint16_t>(RenditionLayout::Color);
    color.payload = test::rloc_payload({ 1.0, 0.5, 0.25, 1.0 });
    const Bytes color_record = test::csi_bytes(color);

    RenditionValue v;
    decode_rendition_value(as_span(color_record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::Color);
    ASSERT_EQ(v.color_components.size(), 4U);
    EXPECT_DOUBLE_EQ(v.color_components[1], 0.5);
    EXPECT_DOUBLE_EQ(v.color_components[2], 0.25);

    CsiSpec multi;
    multi.layout  = static_cast<uint16_t>(RenditionLayout::MultisizeImage);
    multi.payload = test::sism_payload({ { 20, 20, 1, 1 }, { 29, 29, 2, 2 } });
    const Bytes multi_record = test::csi_bytes(multi);
    decode_rendition_value(as_span(multi_record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::Multisize);
    ASSERT_EQ(v.multisize.size(), 2U);
    EXPECT_EQ(v.multisize[1].width, 29U);
    EXPECT_EQ(v.multisize[1].index, 2U);
    EXPECT_EQ(v.multisize[1].idiom, 2U);

    CsiSpec data;
    data.layout       = static_cast<uint16_t>(RenditionLayout::Data);
    data.pixel_format = static_cast<uint32_t>(PixelFormat::Data);
    data.tlv          = uti_tlv("public.json");
    data.payload      = test::dwar_payload(bytes_of("{\"a\":1}"));
    const Bytes data_record = test::csi_bytes(data);
    decode_rendition_value(as_span(data_record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::RawData);
    EXPECT_EQ(v.data.size(), 7U);
    EXPECT_EQ(v.uti, "public.json");
    EXPECT_EQ(v.bytes_per_row, 0U);
}


TEST(CarCatalog, ReportsCsiDefects)
{
    RenditionValue v;
    const Bytes tiny = bytes_of("ISTC");
    decode_rendition_value(as_span(tiny), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Truncated);

    CsiSpec s;
    s.payload = test::dwar_payload(bytes_of("x"));
    Bytes record = test::csi_bytes(s);
    record[0]    = std::byte { 'J' };
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::BadMagic);

    // TLV claims 100 bytes of data inside a 12-byte area.
    Bytes tlv;
    append_u32le(&tlv, kTlvUti);
    append_u32le(&tlv, 100);
    append_u32le(&tlv, 0);
    s.tlv  = tlv;
    record = test::csi_bytes(s);
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::BadTlv);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::RawData);

    s.tlv.clear();
    s.payload = test::dwar_payload(bytes_of("abc"));
    s.payload.resize(s.payload.size() - 1);
    record = test::csi_bytes(s);
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::BadPayload);

    s.payload = bytes_of("????0000");
    record    = test::csi_bytes(s);
    decode_rendition_value(as_span(record), &v);
    EXPECT_EQ(v.header_status, RenditionHeaderStatus::Ok);
    EXPECT_EQ(v.payload_kind, RenditionPayloadKind::Unknown);
}


TEST(CarCatalog, LayoutClassification)
{
    EXPECT_TRUE(is_image_layout(10));
    EXPECT_TRUE(is_image_layout(12));
    EXPECT_TRUE(is_image_layout(50));
    EXPECT_FALSE(is_image_layout(9));
    EXPECT_FALSE(is_image_layout(
        static_cast<uint16_t>(RenditionLayout::Data)));
}

}  // namespace carkit
