#include "carkit/bom_store.h"
#include "carkit/bom_tree.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

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


static void
verify_blocks(const BomStore& store) noexcept
{
    const uint64_t size = static_cast<uint64_t>(store.bytes().size());
    for (const BomBlock& b : store.blocks()) {
        if (!store.resolves(b.id)) {
            continue;
        }
        if (static_cast<uint64_t>(b.offset) + b.length > size) {
            fuzz_trap();
        }
        if (store.block_bytes(b.id).size() != b.length) {
            fuzz_trap();
        }
    }
}

}  // namespace carkit

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace carkit;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    BomParseOptions options;
    options.limits.max_blocks = 1U << 16;
    BomStore store;
    const BomParseResult res = parse_bom(bytes, store, options);
    if (res.status != BomStatus::Ok) {
        if (store.block_count() != 0U) {
            fuzz_trap();
        }
        return 0;
    }
    verify_blocks(store);

    // Walk every named object as a tree, both with block and inline keys.
    TreeWalkOptions walk;
    walk.limits.max_nodes   = 1U << 12;
    walk.limits.max_entries = 1U << 14;
    for (const BomVar& v : store.vars()) {
        std::vector<TreeEntry> entries;
        const TreeWalkResult r = collect_tree(store, v.block, &entries, walk);
        if (r.status == TreeStatus::Ok && entries.size() != r.entries) {
            fuzz_trap();
        }
        if (!entries.empty()) {
            TreeEntry found;
            (void)find_tree_entry(store, v.block, entries.front().key, &found,
                                  walk);
        }

        TreeWalkOptions inline_keys = walk;
        inline_keys.key_kind        = TreeRefKind::Inline;
        inline_keys.check_key_order = false;
        entries.clear();
        (void)collect_tree(store, v.block, &entries, inline_keys);
    }
    return 0;
}
