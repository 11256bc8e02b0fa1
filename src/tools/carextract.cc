#include "carkit/build_info.h"
#include "carkit/car_catalog.h"
#include "carkit/mapped_file.h"
#include "carkit/rendition_decode.h"
#include "carkit/resource_policy.h"
#include "carkit/standard_image_codec.h"
#include "carkit/status_names.h"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace carkit {
namespace {

    static void usage(const char* argv0)
    {
        std::printf(
            "Usage: %s [options] <file.car> [file.car...]\n"
            "\n"
            "Extracts the renditions of compiled asset catalogs.\n"
            "Bitmaps are written as PNG; embedded images and data assets are\n"
            "written as stored.\n"
            "\n"
            "Options:\n"
            "  --help                 Show this help\n"
            "  --version              Print carkit build info\n"
            "  --no-build-info        Hide build info header\n"
            "  --out-dir <dir>        Output directory (default: current)\n"
            "  --force                Overwrite existing files\n"
            "  --raw                  Write payload bytes without decoding\n"
            "  --strict               Stop at the first rendition that fails\n"
            "  --jobs N               Decode on N threads (default: 1)\n"
            "  --max-file-bytes N     File mapping cap in bytes (default: 0=unlimited)\n"
            "  --max-pixels N         Per-rendition pixel cap\n",
            argv0 ? argv0 : "carextract");
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


    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xffffffffULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }


    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n%s\n", line1.c_str(), line2.c_str());
    }


    static bool file_exists(const std::string& path)
    {
        std::FILE* f = std::fopen(path.c_str(), "rb");
        if (!f) {
            return false;
        }
        std::fclose(f);
        return true;
    }


    static bool write_file_bytes(const std::string& path,
                                 std::span<const std::byte> bytes)
    {
        std::FILE* f = std::fopen(path.c_str(), "wb");
        if (!f) {
            return false;
        }
        size_t written = 0;
        if (!bytes.empty()) {
            written = std::fwrite(bytes.data(), 1, bytes.size(), f);
        }
        const bool closed = std::fclose(f) == 0;
        return closed && written == bytes.size();
    }


    static std::string join_path(const std::string& dir,
                                 const std::string& name)
    {
        if (dir.empty()) {
            return name;
        }
        if (dir.back() == '/') {
            return dir + name;
        }
        return dir + "/" + name;
    }


    static std::string sanitize_filename(std::string_view in)
    {
        std::string s(in);
        for (char& ch : s) {
            const unsigned char c = static_cast<unsigned char>(ch);
            if (std::isalnum(c) == 0 && c != '.' && c != '_' && c != '-'
                && c != '@') {
                ch = '_';
            }
        }
        if (s.empty() || s == "." || s == "..") {
            return "rendition";
        }
        return s;
    }


    static std::string strip_extension(const std::string& name)
    {
        const size_t dot = name.find_last_of('.');
        if (dot == std::string::npos || dot == 0) {
            return name;
        }
        return name.substr(0, dot);
    }


    static const char* embedded_extension(EmbeddedFormat f)
    {
        switch (f) {
        case EmbeddedFormat::Png: return ".png";
        case EmbeddedFormat::Jpeg: return ".jpg";
        case EmbeddedFormat::Heif: return ".heic";
        case EmbeddedFormat::Gif: return ".gif";
        case EmbeddedFormat::Pdf: return ".pdf";
        case EmbeddedFormat::None: return ".bin";
        }
        return ".bin";
    }


    enum class PlanKind : uint8_t {
        Skip,
        Raw,
        PassThrough,
        Png,
    };

    struct Job final {
        uint32_t index = 0;
        PlanKind kind  = PlanKind::Skip;
        std::string out_file;
    };

    struct JobResult final {
        bool failed = false;
        bool done   = false;
        std::string message;
    };

    struct ExtractContext final {
        const CatalogModel* model = nullptr;
        RenditionDecodeOptions decode_options;
        bool force  = false;
        bool strict = false;
        std::atomic<bool> stop { false };
    };


    static std::string base_name_for(const CatalogModel& model,
                                     const RenditionEntry& r, uint32_t index)
    {
        if (!r.value.name.empty()) {
            return sanitize_filename(strip_extension(r.value.name));
        }
        if (const FacetEntry* facet = model.facet_for(r)) {
            return sanitize_filename(facet->name);
        }
        return "orphan_" + std::to_string(index);
    }


    static std::vector<Job> plan_jobs(const CatalogModel& model,
                                      const std::string& out_dir, bool raw)
    {
        std::vector<Job> jobs;
        std::set<std::string> used;
        const std::span<const RenditionEntry> all = model.renditions();
        for (uint32_t i = 0; i < all.size(); ++i) {
            const RenditionEntry& r = all[i];
            Job job;
            job.index = i;

            const char* ext = ".png";
            if (raw) {
                job.kind = r.value.payload.empty() ? PlanKind::Skip
                                                   : PlanKind::Raw;
                ext      = ".bin";
            } else if (r.value.payload_kind == RenditionPayloadKind::RawData) {
                const std::span<const std::byte> data = rendition_raw_data(
                    r.value);
                const EmbeddedFormat f = sniff_embedded_format(data);
                const bool data_asset
                    = r.value.layout
                      == static_cast<uint16_t>(RenditionLayout::Data);
                if (data_asset || f != EmbeddedFormat::None) {
                    job.kind = PlanKind::PassThrough;
                    ext      = embedded_extension(f);
                }
            } else if (r.value.payload_kind == RenditionPayloadKind::Bitmap
                       && stb_codec_available()) {
                job.kind = PlanKind::Png;
            }
            if (job.kind == PlanKind::Skip) {
                jobs.push_back(std::move(job));
                continue;
            }

            const std::string base = base_name_for(model, r, i);
            std::string name       = base + ext;
            for (uint32_t n = 2; used.count(name) != 0U; ++n) {
                name = base + "_" + std::to_string(n) + ext;
            }
            used.insert(name);
            job.out_file = join_path(out_dir, name);
            jobs.push_back(std::move(job));
        }
        return jobs;
    }


    static JobResult run_job(ExtractContext& ctx, const Job& job)
    {
        JobResult res;
        const RenditionEntry& r = ctx.model->renditions()[job.index];
        if (job.kind == PlanKind::Skip) {
            res.message = "skip";
            return res;
        }
        if (!ctx.force && file_exists(job.out_file)) {
            res.failed  = true;
            res.message = "exists: " + job.out_file + " (use --force)";
            return res;
        }

        std::vector<std::byte> encoded;
        std::span<const std::byte> out_bytes;
        if (job.kind == PlanKind::Raw) {
            out_bytes = r.value.payload;
        } else if (job.kind == PlanKind::PassThrough) {
            out_bytes = rendition_raw_data(r.value);
        } else {
            DecodedImage img;
            const RenditionDecodeResult dr
                = decode_rendition(r.value, &img, ctx.decode_options);
            if (dr.status != RenditionDecodeStatus::Ok
                && dr.status != RenditionDecodeStatus::DimensionMismatch) {
                res.failed  = true;
                res.message = std::string("decode=")
                              + std::string(
                                  rendition_decode_status_name(dr.status));
                return res;
            }
            DecodedImage rgba;
            const RenditionDecodeStatus cs = convert_to_rgba8(img, &rgba);
            if (cs != RenditionDecodeStatus::Ok) {
                res.failed  = true;
                res.message = std::string("convert=")
                              + std::string(rendition_decode_status_name(cs));
                return res;
            }
            const CodecStatus es = encode_png_rgba8(
                rgba.width, rgba.height,
                std::span<const std::byte>(rgba.pixels.data(),
                                           rgba.pixels.size()),
                &encoded);
            if (es != CodecStatus::Ok) {
                res.failed  = true;
                res.message = std::string("png=")
                              + std::string(codec_status_name(es));
                return res;
            }
            out_bytes = std::span<const std::byte>(encoded.data(),
                                                   encoded.size());
            if (dr.status == RenditionDecodeStatus::DimensionMismatch) {
                res.message = "dimension_mismatch ";
            }
        }

        if (!write_file_bytes(job.out_file, out_bytes)) {
            res.failed  = true;
            res.message = "write failed: " + job.out_file;
            return res;
        }
        res.done = true;
        res.message += "-> " + job.out_file;
        return res;
    }


    static void run_worker(ExtractContext& ctx, const std::vector<Job>& jobs,
                           std::vector<JobResult>* results, uint32_t first,
                           uint32_t step)
    {
        for (size_t i = first; i < jobs.size(); i += step) {
            if (ctx.stop.load(std::memory_order_relaxed)) {
                return;
            }
            (*results)[i] = run_job(ctx, jobs[i]);
            if (ctx.strict && (*results)[i].failed) {
                ctx.stop.store(true, std::memory_order_relaxed);
            }
        }
    }

}  // namespace
}  // namespace carkit


int
main(int argc, char** argv)
{
    using namespace carkit;

    bool show_build_info = true;
    bool force           = false;
    bool raw             = false;
    bool strict          = false;
    uint32_t jobs_count  = 1;
    std::string out_dir;
    CarResourcePolicy policy;
    uint64_t max_pixels = policy.decode_limits.max_pixels;

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
        if (std::strcmp(arg, "--out-dir") == 0 && i + 1 < argc) {
            out_dir = argv[i + 1];
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--force") == 0) {
            force = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--raw") == 0) {
            raw = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--strict") == 0) {
            strict = true;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--jobs") == 0 && i + 1 < argc) {
            if (!parse_u32_arg(argv[i + 1], &jobs_count) || jobs_count == 0U
                || jobs_count > 256U) {
                std::fprintf(stderr, "invalid --jobs value\n");
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
        if (std::strcmp(arg, "--max-pixels") == 0 && i + 1 < argc) {
            if (!parse_u64_arg(argv[i + 1], &max_pixels)
                || max_pixels == 0U) {
                std::fprintf(stderr, "invalid --max-pixels value\n");
                return 2;
            }
            i += 1;
            first_path += 2;
            continue;
        }
        break;
    }

    std::vector<std::string> input_paths;
    for (int i = first_path; i < argc; ++i) {
        if (argv[i] && argv[i][0] != '\0') {
            input_paths.emplace_back(argv[i]);
        }
    }
    if (input_paths.empty()) {
        usage(argv[0]);
        return 2;
    }
    policy.decode_limits.max_pixels = max_pixels;

    if (show_build_info) {
        print_build_info_header();
    }
    if (!raw && !stb_codec_available()) {
        std::fprintf(stderr,
                     "carextract: built without stb; bitmaps are skipped "
                     "(use --raw)\n");
    }

    const StbImageCodec codec(max_pixels);
    bool any_failed = false;
    for (const std::string& input : input_paths) {
        const char* path = input.c_str();

        MappedFile mapped;
        const MappedFileStatus st = mapped.open(path, policy.max_file_bytes);
        if (st != MappedFileStatus::Ok) {
            std::fprintf(stderr, "carextract: %s: %s\n", path,
                         std::string(mapped_file_status_name(st)).c_str());
            any_failed = true;
            if (strict) {
                break;
            }
            continue;
        }

        CatalogDecodeOptions catalog_options;
        apply_resource_policy(policy, &catalog_options);
        CatalogModel model;
        const CatalogDecodeResult cr = parse_catalog(mapped.bytes(), &model,
                                                     catalog_options);
        if (cr.status != CatalogStatus::Ok) {
            std::fprintf(stderr, "carextract: %s: %s\n", path,
                         std::string(catalog_status_name(cr.status)).c_str());
            any_failed = true;
            if (strict) {
                break;
            }
            continue;
        }

        ExtractContext ctx;
        ctx.model  = &model;
        ctx.force  = force;
        ctx.strict = strict;
        ctx.decode_options.codec = &codec;
        apply_resource_policy(policy, &ctx.decode_options);

        const std::vector<Job> jobs = plan_jobs(model, out_dir, raw);
        std::vector<JobResult> results(jobs.size());
        const uint32_t workers = (jobs_count < jobs.size())
                                     ? jobs_count
                                     : static_cast<uint32_t>(jobs.size());
        if (workers <= 1U) {
            run_worker(ctx, jobs, &results, 0, 1);
        } else {
            std::vector<std::thread> threads;
            threads.reserve(workers);
            for (uint32_t w = 0; w < workers; ++w) {
                threads.emplace_back(run_worker, std::ref(ctx),
                                     std::cref(jobs), &results, w, workers);
            }
            for (std::thread& t : threads) {
                t.join();
            }
        }

        std::printf("== %s\n", path);
        std::printf("  renditions=%u orphans=%u duplicates=%u warnings=%u "
                    "unreferenced_blocks=%u\n",
                    cr.renditions, cr.orphans, cr.duplicates, cr.warnings,
                    cr.unreferenced_blocks);
        uint32_t exported = 0;
        uint32_t failed   = 0;
        for (size_t i = 0; i < jobs.size(); ++i) {
            const JobResult& res = results[i];
            if (res.message.empty()) {
                continue;
            }
            if (res.failed) {
                std::fprintf(stderr, "  [%u] %s\n", jobs[i].index,
                             res.message.c_str());
                failed += 1;
            } else if (res.done) {
                std::printf("  [%u] %s\n", jobs[i].index, res.message.c_str());
                exported += 1;
            }
        }
        std::printf("  exported=%u failed=%u\n", exported, failed);
        if (failed != 0U) {
            any_failed = true;
            if (strict) {
                break;
            }
        }
    }

    return any_failed ? 1 : 0;
}
