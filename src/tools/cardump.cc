#include "carkit/bom_store.h"
#include "carkit/bom_tree.h"
#include "carkit/build_info.h"
#include "carkit/car_catalog.h"
#include "carkit/mapped_file.h"
#include "carkit/rendition_names.h"
#include "carkit/resource_policy.h"
#include "carkit/status_names.h"
#include "carkit/text_format.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace carkit {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file.car> [file.car...]\n"
            "\n"
            "Dumps the container and catalog structure of compiled asset\n"
            "catalogs.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print carkit build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --blocks               List every block of the container\n"
            "  --trees                Print tree statistics for each variable\n"
            "  --max-bytes N          Max bytes printed per string (default: 256)\n"
            "  --max-file-bytes N     File mapping cap in bytes (default: 0=unlimited)\n",
            argv0 ? argv0 : "cardump");
    }


    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || !*s || !out) {
            return false;
        }
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (!end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static std::string escaped(std::string_view s, uint32_t max_bytes)
    {
        std::string out;
        (void)append_console_escaped_ascii(s, max_bytes, &out);
        return out;
    }


    static std::string attribute_label(RenditionAttribute a)
    {
        const uint32_t tag          = static_cast<uint32_t>(a);
        const std::string_view name = rendition_attribute_name(tag);
        if (name.empty()) {
            return "attr" + std::to_string(tag);
        }
        return std::string(name);
    }


    static std::string attribute_list(std::span<const AttributeValue> attrs)
    {
        std::string out;
        for (size_t i = 0; i < attrs.size(); ++i) {
            if (i != 0) {
                out.push_back(',');
            }
            out.append(attribute_label(attrs[i].attribute));
            out.push_back('=');
            out.append(std::to_string(attrs[i].value));
        }
        return out;
    }


    static const char* payload_kind_name(RenditionPayloadKind kind)
    {
        switch (kind) {
        case RenditionPayloadKind::None: return "none";
        case RenditionPayloadKind::Bitmap: return "bitmap";
        case RenditionPayloadKind::RawData: return "raw_data";
        case RenditionPayloadKind::Color: return "color";
        case RenditionPayloadKind::Multisize: return "multisize";
        case RenditionPayloadKind::Unknown: return "unknown";
        }
        return "unknown";
    }


    static void dump_blocks(const BomStore& store)
    {
        for (const BomBlock& b : store.blocks()) {
            if (b.offset == 0U && b.length == 0U) {
                continue;
            }
            std::printf("  block %u offset=%u length=%u%s\n", b.id, b.offset,
                        b.length, b.derived_length ? " derived" : "");
        }
    }


    static void dump_trees(const BomStore& store)
    {
        for (const BomVar& v : store.vars()) {
            BomTreeHeader th;
            if (read_tree_header(store, v.block, &th) != TreeStatus::Ok) {
                continue;
            }
            // Entry counts only; keys are not interpreted here.
            std::vector<TreeEntry> entries;
            TreeWalkOptions opts;
            opts.key_kind        = TreeRefKind::Inline;
            opts.value_kind      = TreeRefKind::Inline;
            opts.check_key_order = false;
            const TreeWalkResult wr = collect_tree(store, v.block, &entries,
                                                   opts);
            std::printf("  tree %s version=%u root=%u block_size=%u "
                        "paths=%u walk=%s entries=%u nodes=%u depth=%u\n",
                        escaped(v.name, 64).c_str(), th.version, th.root_block,
                        th.block_size, th.path_count,
                        std::string(tree_status_name(wr.status)).c_str(),
                        wr.entries, wr.nodes, wr.max_depth);
        }
    }


    static void dump_catalog(const CatalogModel& model, uint32_t max_bytes)
    {
        const CarHeader& h = model.header();
        std::string uuid;
        append_hex_bytes(std::as_bytes(std::span<const uint8_t>(h.uuid)), 0,
                         &uuid);
        std::printf("carheader coreui=%u storage=%u timestamp=%u "
                    "renditions=%u schema=%u color_space=%u "
                    "key_semantics=%u uuid=%s\n",
                    h.core_ui_version, h.storage_version, h.storage_timestamp,
                    h.rendition_count, h.schema_version, h.color_space_id,
                    h.key_semantics, uuid.c_str());
        std::printf("  main_version=\"%s\"\n",
                    escaped(h.main_version, max_bytes).c_str());
        std::printf("  version=\"%s\"\n", escaped(h.version, max_bytes).c_str());

        const CarExtendedMetadata& ext = model.extended_metadata();
        if (ext.present) {
            std::printf("extended_metadata platform=\"%s\" "
                        "platform_version=\"%s\"\n",
                        escaped(ext.deployment_platform, max_bytes).c_str(),
                        escaped(ext.deployment_platform_version, max_bytes)
                            .c_str());
            std::printf("  authoring_tool=\"%s\"\n",
                        escaped(ext.authoring_tool, max_bytes).c_str());
            if (!ext.thinning_arguments.empty()) {
                std::printf("  thinning=\"%s\"\n",
                            escaped(ext.thinning_arguments, max_bytes).c_str());
            }
        }

        const KeyFormat& kf = model.key_format();
        std::string attrs;
        for (size_t i = 0; i < kf.attributes.size(); ++i) {
            if (i != 0) {
                attrs.push_back(',');
            }
            attrs.append(attribute_label(kf.attributes[i]));
        }
        std::printf("keyformat version=%u width=%u attributes=%s\n",
                    kf.version, kf.key_width(), attrs.c_str());

        for (const AppearanceEntry& a : model.appearances()) {
            std::printf("appearance id=%u name=\"%s\"\n", a.id,
                        escaped(a.name, max_bytes).c_str());
        }

        const std::span<const FacetEntry> facets = model.facets();
        std::printf("facets=%zu\n", facets.size());
        for (size_t i = 0; i < facets.size(); ++i) {
            const FacetEntry& f = facets[i];
            std::printf("  [%zu] name=\"%s\" hotspot=%u,%u attrs=%s\n", i,
                        escaped(f.name, max_bytes).c_str(), f.hotspot_x,
                        f.hotspot_y, attribute_list(f.attributes).c_str());
        }

        const std::span<const RenditionEntry> renditions = model.renditions();
        std::printf("renditions=%zu\n", renditions.size());
        for (size_t i = 0; i < renditions.size(); ++i) {
            const RenditionEntry& r  = renditions[i];
            const RenditionValue& v  = r.value;
            const FacetEntry* facet  = model.facet_for(r);
            std::string format;
            append_fourcc(v.pixel_format, &format);
            std::string layout(layout_name(v.layout));
            if (layout.empty()) {
                layout = std::to_string(v.layout);
            }
            std::printf("  [%zu] facet=\"%s\" key=%s\n", i,
                        facet ? escaped(facet->name, max_bytes).c_str()
                              : "<orphan>",
                        attribute_list(r.key.attributes).c_str());
            std::printf("       name=\"%s\" layout=%s format=%s size=%ux%u "
                        "scale=%u flags=0x%X csi=%s\n",
                        escaped(v.name, max_bytes).c_str(), layout.c_str(),
                        format.c_str(), v.width, v.height, v.scale_factor,
                        v.flags,
                        std::string(rendition_header_status_name(
                                        v.header_status))
                            .c_str());
            std::string compression(compression_name(
                static_cast<uint32_t>(v.compression)));
            if (compression.empty()) {
                compression = std::to_string(
                    static_cast<uint32_t>(v.compression));
            }
            std::printf("       payload=%s bytes=%zu compression=%s "
                        "chunks=%zu tlvs=%zu\n",
                        payload_kind_name(v.payload_kind), v.payload.size(),
                        v.payload_kind == RenditionPayloadKind::Bitmap
                            ? compression.c_str()
                            : "-",
                        v.chunks.size(), v.properties.size());
        }

        for (const CatalogWarning& w : model.warnings()) {
            std::printf("warning %s index=%u block=%u\n",
                        std::string(catalog_warning_kind_name(w.kind)).c_str(),
                        w.index, w.block);
        }
    }

}  // namespace
}  // namespace carkit


int
main(int argc, char** argv)
{
    using namespace carkit;

    bool show_build_info = true;
    bool show_blocks     = false;
    bool show_trees      = false;
    uint64_t max_bytes   = 256;
    CarResourcePolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--blocks") == 0) {
            show_blocks = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--trees") == 0) {
            show_trees = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_bytes)
                || max_bytes > 0xffffffffULL) {
                std::fprintf(stderr, "invalid --max-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    if (first_path >= argc) {
        usage(argv[0]);
        return 2;
    }
    if (show_build_info) {
        print_build_info_header();
    }

    bool any_failed = false;
    for (int i = first_path; i < argc; ++i) {
        const char* path = argv[i];
        if (!path || !*path) {
            continue;
        }
        MappedFile mapped;
        const MappedFileStatus st = mapped.open(path, policy.max_file_bytes);
        if (st != MappedFileStatus::Ok) {
            std::fprintf(stderr, "cardump: %s: %s\n", path,
                         std::string(mapped_file_status_name(st)).c_str());
            any_failed = true;
            continue;
        }

        CatalogDecodeOptions options;
        apply_resource_policy(policy, &options);

        std::printf("== %s\n", path);
        BomStore store;
        const BomParseResult br = parse_bom(mapped.bytes(), store,
                                            options.bom);
        if (br.status != BomStatus::Ok) {
            std::fprintf(stderr, "cardump: %s: %s\n", path,
                         std::string(bom_status_name(br.status)).c_str());
            any_failed = true;
            continue;
        }
        std::printf("bom version=%u blocks=%u vars=%u null_blocks=%u\n",
                    store.header().version, br.blocks, br.vars,
                    br.null_blocks);
        for (const BomVar& v : store.vars()) {
            std::printf("  var %s block=%u size=%zu\n",
                        escaped(v.name, 64).c_str(), v.block,
                        store.block_bytes(v.block).size());
        }
        if (show_blocks) {
            dump_blocks(store);
        }
        if (show_trees) {
            dump_trees(store);
        }

        CatalogModel model;
        const CatalogDecodeResult cr = decode_catalog(store, &model, options);
        if (cr.status != CatalogStatus::Ok) {
            std::fprintf(stderr, "cardump: %s: %s block=%u\n", path,
                         std::string(catalog_status_name(cr.status)).c_str(),
                         cr.failed_block);
            any_failed = true;
            continue;
        }
        dump_catalog(model, static_cast<uint32_t>(max_bytes));
    }
    return any_failed ? 1 : 0;
}
