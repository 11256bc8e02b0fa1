#include "carkit/assetutil_json.h"
#include "carkit/car_catalog.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <string>

namespace carkit {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static bool
within(std::span<const std::byte> outer,
       std::span<const std::byte> inner) noexcept
{
    if (inner.empty()) {
        return true;
    }
    return inner.data() >= outer.data()
           && inner.data() + inner.size() <= outer.data() + outer.size();
}

}  // namespace carkit

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace carkit;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    CatalogDecodeOptions options;
    options.bom.limits.max_blocks    = 1U << 16;
    options.tree_limits.max_nodes    = 1U << 12;
    options.tree_limits.max_entries  = 1U << 14;
    options.limits.max_renditions    = 1U << 12;

    CatalogModel model;
    const CatalogDecodeResult res = parse_catalog(bytes, &model, options);
    if (res.status != CatalogStatus::Ok) {
        if (!model.renditions().empty() || !model.facets().empty()) {
            fuzz_trap();
        }
        return 0;
    }
    if (res.renditions != model.renditions().size()) {
        fuzz_trap();
    }
    for (const RenditionEntry& r : model.renditions()) {
        const RenditionValue& v = r.value;
        if (!within(bytes, v.record) || !within(v.record, v.payload)
            || !within(v.record, v.data) || !within(v.record, v.tlv)) {
            fuzz_trap();
        }
        for (const std::span<const std::byte>& c : v.chunks) {
            if (!within(v.record, c)) {
                fuzz_trap();
            }
        }
        if (r.key.raw.size() != model.key_format().key_width()) {
            fuzz_trap();
        }
        if (r.key.facet_index != kNoFacet
            && r.key.facet_index >= model.facets().size()) {
            fuzz_trap();
        }
    }

    AssetutilJsonOptions json_options;
    json_options.include_digests = false;
    std::string json;
    (void)format_assetutil_json(model, &json, json_options);
    return 0;
}
