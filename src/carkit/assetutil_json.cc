#include "carkit/assetutil_json.h"

#include "carkit/rendition_digest.h"
#include "carkit/rendition_names.h"
#include "carkit/text_format.h"

#include <algorithm>
#include <span>
#include <string>
#include <utility>
#include <vector>

#if defined(CARKIT_HAS_NLOHMANN_JSON) && CARKIT_HAS_NLOHMANN_JSON
#    include <nlohmann/json.hpp>
#endif

namespace carkit {
namespace {

#if defined(CARKIT_HAS_NLOHMANN_JSON) && CARKIT_HAS_NLOHMANN_JSON
    using Json = nlohmann::json;

    static constexpr double kDumpToolVersion = 804.3;

    struct OptionalText final {
        bool present = false;
        std::string text;
    };

    struct Entry final {
        OptionalText asset_type;
        OptionalText name;
        OptionalText rendition_name;
        Json fields = Json::object();
    };


    static std::string key_format_name(RenditionAttribute attribute)
    {
        const uint32_t tag = static_cast<uint32_t>(attribute);
        std::string s      = "kCRTheme";
        const std::string_view name = rendition_attribute_name(tag);
        if (name.empty()) {
            s.append("Unknown");
            s.append(std::to_string(tag));
        } else {
            s.append(name);
        }
        s.append("Name");
        return s;
    }


    static Json header_object(const CatalogModel& model,
                              const AssetutilJsonOptions& options)
    {
        const CarHeader& h             = model.header();
        const CarExtendedMetadata& ext = model.extended_metadata();
        Json obj                       = Json::object();

        if (!model.appearances().empty()) {
            Json appearances = Json::object();
            for (const AppearanceEntry& a : model.appearances()) {
                appearances[a.name] = a.id;
            }
            obj["Appearances"] = std::move(appearances);
        }
        obj["AssetStorageVersion"] = h.version;
        obj["Authoring Tool"]      = ext.authoring_tool;
        obj["CoreUIVersion"]       = h.core_ui_version;
        obj["DumpToolVersion"]     = kDumpToolVersion;
        Json key_format            = Json::array();
        for (RenditionAttribute a : model.key_format().attributes) {
            key_format.push_back(key_format_name(a));
        }
        obj["Key Format"]      = std::move(key_format);
        obj["MainVersion"]     = h.main_version;
        obj["Platform"]        = ext.deployment_platform;
        obj["PlatformVersion"] = ext.deployment_platform_version;
        obj["SchemaVersion"]   = h.schema_version;
        obj["StorageVersion"]  = h.storage_version;
        if (!ext.thinning_arguments.empty()) {
            obj["ThinningParameters"] = ext.thinning_arguments;
        }
        obj["Timestamp"] = (h.storage_timestamp != 0U) ? h.storage_timestamp
                                                       : options.file_mtime;
        return obj;
    }


    static bool is_bitmap_payload(const RenditionValue& v)
    {
        return v.payload_kind == RenditionPayloadKind::Bitmap;
    }


    static Entry rendition_entry(const CatalogModel& model,
                                 const RenditionEntry& r,
                                 const AssetutilJsonOptions& options,
                                 AssetutilJsonResult* result)
    {
        const RenditionValue& v = r.value;
        const RenditionKey& k   = r.key;
        const bool image        = is_image_layout(v.layout);
        const bool data_layout  = v.layout
                                 == static_cast<uint16_t>(
                                     RenditionLayout::Data);
        Entry e;
        Json& obj = e.fields;

        uint16_t attr = 0;
        if (k.find_attribute(RenditionAttribute::Appearance, &attr)
            && attr > 0) {
            const std::string_view name = model.appearance_name(attr);
            if (!name.empty()) {
                obj["Appearance"] = std::string(name);
            }
        }

        const std::string_view asset_type = asset_type_name(v.layout);
        if (!asset_type.empty()) {
            obj["AssetType"]     = std::string(asset_type);
            e.asset_type.present = true;
            e.asset_type.text    = std::string(asset_type);
        }

        std::string_view color_model;
        if (image) {
            obj["BitsPerComponent"] = 8;
            color_model             = color_model_name(v.color_space);
            if (!color_model.empty()) {
                obj["ColorModel"] = std::string(color_model);
            }
        }

        if (v.payload_kind == RenditionPayloadKind::Color) {
            obj["Color components"] = v.color_components;
        }

        if (is_bitmap_payload(v)
            || v.payload_kind == RenditionPayloadKind::Color) {
            obj["Colorspace"] = (color_model == "Monochrome") ? "gray gamma 22"
                                                              : "srgb";
        }

        if (is_bitmap_payload(v)) {
            const std::string_view c = compression_name(
                static_cast<uint32_t>(v.compression));
            if (!c.empty()) {
                obj["Compression"] = std::string(c);
            }
        } else if (v.payload_kind == RenditionPayloadKind::RawData
                   && data_layout) {
            obj["Compression"] = "uncompressed";
        }

        if (v.payload_kind == RenditionPayloadKind::RawData && data_layout) {
            obj["Data Length"] = v.data.size();
        }

        if (image) {
            const std::string_view enc = pixel_format_name(v.pixel_format);
            if (!enc.empty()) {
                obj["Encoding"] = std::string(enc);
            } else {
                std::string fourcc;
                append_fourcc(v.pixel_format, &fourcc);
                obj["Encoding"] = std::move(fourcc);
            }
        }

        if (k.find_attribute(RenditionAttribute::Idiom, &attr)) {
            const std::string_view idiom = idiom_name(attr);
            if (!idiom.empty()) {
                obj["Idiom"] = std::string(idiom);
            }
        }

        if (const FacetEntry* facet = model.facet_for(r)) {
            obj["Name"]    = facet->name;
            e.name.present = true;
            e.name.text    = facet->name;
        }
        if (k.find_attribute(RenditionAttribute::Identifier, &attr)) {
            obj["NameIdentifier"] = attr;
        }

        if (image) {
            obj["Opaque"] = v.is_opaque();

            const bool have_width  = v.width != 0U || v.has_slice_size;
            const bool have_height = v.height != 0U || v.has_slice_size;
            if (have_height) {
                obj["PixelHeight"] = (v.height != 0U) ? v.height
                                                      : v.slice_height;
            }
            if (have_width) {
                obj["PixelWidth"] = (v.width != 0U) ? v.width : v.slice_width;
            }
            obj["RenditionName"]     = v.name;
            e.rendition_name.present = true;
            e.rendition_name.text    = v.name;
        }

        obj["Scale"] = (v.scale_factor == 0U) ? 1U : v.scale_factor / 100U;

        if (options.include_digests
            && result->status != AssetutilJsonStatus::DigestUnavailable) {
            RenditionDigest digest {};
            const DigestStatus ds = compute_rendition_digest(v.record,
                                                             &digest);
            if (ds == DigestStatus::Ok) {
                std::string hex;
                append_hex_bytes(std::as_bytes(std::span<const uint8_t>(
                                     digest.data(), digest.size())),
                                 0, &hex);
                obj["SHA1Digest"] = std::move(hex);
            } else if (ds == DigestStatus::Unsupported) {
                result->status = AssetutilJsonStatus::DigestUnavailable;
            } else if (result->status == AssetutilJsonStatus::Ok) {
                result->status = AssetutilJsonStatus::DigestFailed;
            }
        }

        obj["SizeOnDisk"] = static_cast<uint64_t>(kCsiHeaderSize)
                            + v.tlv_length + v.payload_length;

        if (v.payload_kind == RenditionPayloadKind::Multisize) {
            Json sizes = Json::array();
            for (const MultisizeEntry& m : v.multisize) {
                std::string s = std::to_string(m.width);
                s.push_back('x');
                s.append(std::to_string(m.height));
                s.append(" index:");
                s.append(std::to_string(m.index));
                s.append(" idiom:");
                const std::string_view title = idiom_title(m.idiom);
                if (title.empty()) {
                    s.append(std::to_string(m.idiom));
                } else {
                    s.append(title);
                }
                sizes.push_back(std::move(s));
            }
            obj["Sizes"] = std::move(sizes);
        }

        if (k.find_attribute(RenditionAttribute::State, &attr)) {
            const std::string_view state = state_name(attr);
            if (!state.empty()) {
                obj["State"] = std::string(state);
            }
        }

        if (image) {
            const bool palette = is_bitmap_payload(v)
                                 && v.compression
                                        == CompressionType::PaletteImg;
            if (palette || v.is_opaque()) {
                const std::string_view mode = template_mode_name(
                    v.template_mode());
                if (!mode.empty()) {
                    obj["Template Mode"] = std::string(mode);
                }
            }
        }

        if (data_layout) {
            obj["UTI"] = v.has_uti ? v.uti : std::string("UTI-Unknown");
        }

        if (k.find_attribute(RenditionAttribute::Value, &attr)) {
            const std::string_view value = value_name(attr);
            if (!value.empty()) {
                obj["Value"] = std::string(value);
            }
        }
        return e;
    }


    // Absent sorts before present.
    static int compare_optional(const OptionalText& a, const OptionalText& b)
    {
        if (a.present != b.present) {
            return a.present ? 1 : -1;
        }
        return a.text.compare(b.text);
    }


    static bool entry_less(const Entry& a, const Entry& b)
    {
        int c = compare_optional(a.asset_type, b.asset_type);
        if (c != 0) {
            return c < 0;
        }
        c = compare_optional(a.name, b.name);
        if (c != 0) {
            return c < 0;
        }
        return compare_optional(a.rendition_name, b.rendition_name) < 0;
    }
#endif

}  // namespace


AssetutilJsonResult
format_assetutil_json(const CatalogModel& model, std::string* out,
                      const AssetutilJsonOptions& options) noexcept
{
    AssetutilJsonResult result;
    if (!out) {
        return result;
    }
#if defined(CARKIT_HAS_NLOHMANN_JSON) && CARKIT_HAS_NLOHMANN_JSON
    if (options.include_digests && !digest_available()) {
        result.status = AssetutilJsonStatus::DigestUnavailable;
    }

    std::vector<Entry> entries;
    entries.reserve(model.renditions().size());
    for (const RenditionEntry& r : model.renditions()) {
        entries.push_back(rendition_entry(model, r, options, &result));
    }
    std::stable_sort(entries.begin(), entries.end(), entry_less);

    Json doc = Json::array();
    doc.push_back(header_object(model, options));
    for (Entry& e : entries) {
        doc.push_back(std::move(e.fields));
    }
    out->append(doc.dump(2, ' ', false, Json::error_handler_t::replace));
    out->push_back('\n');
    result.entries = static_cast<uint32_t>(entries.size());
#else
    (void)model;
    (void)options;
    result.status = AssetutilJsonStatus::JsonUnavailable;
#endif
    return result;
}

}  // namespace carkit
