#include "carkit/assetutil_json.h"
#include "carkit/build_info.h"
#include "carkit/car_catalog.h"
#include "carkit/mapped_file.h"
#include "carkit/resource_policy.h"
#include "carkit/status_names.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

namespace carkit {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file.car>\n"
            "\n"
            "Prints an `assetutil --info` style JSON description of a compiled\n"
            "asset catalog.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print carkit build info\n"
            "  --no-digests           Omit SHA1Digest\n"
            "  --warnings             Print catalog warnings to stderr\n"
            "  --max-file-bytes N     File mapping cap in bytes (default: 0=unlimited)\n"
            "  --max-renditions N     Max renditions decoded\n",
            argv0 ? argv0 : "carinfo");
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


    static void print_warnings(const char* path, const CatalogModel& model)
    {
        for (const CatalogWarning& w : model.warnings()) {
            std::string line(catalog_warning_kind_name(w.kind));
            if (w.kind == CatalogWarningKind::MalformedRendition) {
                line.push_back(':');
                line.append(rendition_header_status_name(w.header_status));
            }
            std::fprintf(stderr, "carinfo: %s: warning %s index=%u block=%u\n",
                         path, line.c_str(), w.index, w.block);
        }
    }

}  // namespace
}  // namespace carkit


int
main(int argc, char** argv)
{
    using namespace carkit;

    bool digests       = true;
    bool show_warnings = false;
    CarResourcePolicy policy;

    const char* path = nullptr;
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
        if (std::strcmp(arg, "--no-digests") == 0) {
            digests = false;
            continue;
        }
        if (std::strcmp(arg, "--warnings") == 0) {
            show_warnings = true;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &policy.max_file_bytes)) {
                std::fprintf(stderr, "invalid --max-file-bytes value\n");
                return 2;
            }
            i += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-renditions") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v) || v == 0U
                || v > 0xffffffffULL) {
                std::fprintf(stderr, "invalid --max-renditions value\n");
                return 2;
            }
            policy.catalog_limits.max_renditions = static_cast<uint32_t>(v);
            i += 1;
            continue;
        }
        if (arg[0] == '-' && arg[1] != '\0') {
            std::fprintf(stderr, "carinfo: unknown option %s\n", arg);
            return 2;
        }
        if (path) {
            usage(argv[0]);
            return 2;
        }
        path = arg;
    }
    if (!path) {
        usage(argv[0]);
        return 2;
    }

    MappedFile mapped;
    const MappedFileStatus st = mapped.open(path, policy.max_file_bytes);
    if (st != MappedFileStatus::Ok) {
        std::fprintf(stderr, "carinfo: %s: %s\n", path,
                     std::string(mapped_file_status_name(st)).c_str());
        return 1;
    }

    CatalogDecodeOptions options;
    apply_resource_policy(policy, &options);
    CatalogModel model;
    const CatalogDecodeResult cr = parse_catalog(mapped.bytes(), &model,
                                                 options);
    if (cr.status != CatalogStatus::Ok) {
        std::fprintf(stderr, "carinfo: %s: %s\n", path,
                     std::string(catalog_status_name(cr.status)).c_str());
        return 1;
    }
    if (show_warnings) {
        print_warnings(path, model);
    }

    AssetutilJsonOptions json_options;
    json_options.file_mtime      = mapped.mtime();
    json_options.include_digests = digests;
    std::string json;
    const AssetutilJsonResult jr = format_assetutil_json(model, &json,
                                                         json_options);
    if (jr.status == AssetutilJsonStatus::JsonUnavailable) {
        std::fprintf(stderr, "carinfo: %s: built without nlohmann_json; "
                             "JSON output is unavailable\n",
                     path);
        return 1;
    }
    if (jr.status == AssetutilJsonStatus::DigestUnavailable) {
        std::fprintf(stderr, "carinfo: %s: built without OpenSSL; "
                             "SHA1Digest omitted\n",
                     path);
    } else if (jr.status == AssetutilJsonStatus::DigestFailed) {
        std::fprintf(stderr, "carinfo: %s: digest_failed\n", path);
    }
    if (std::fwrite(json.data(), 1, json.size(), stdout) != json.size()) {
        std::fprintf(stderr, "carinfo: %s: write failed\n", path);
        return 1;
    }
    return 0;
}
