#include "carkit/bom_tree.h"

#include "byte_read_internal.h"

#include <cstring>
#include <utility>

namespace carkit {
namespace {

    using detail::match_tag;
    using detail::read_u16be;
    using detail::read_u32be;

    // Tree header: "tree" + 4 x u32 + u8.
    static constexpr uint32_t kTreeHeaderSize = 21;
    // Path node: u16 is_leaf, u16 count, u32 forward, u32 backward.
    static constexpr uint32_t kNodeHeaderSize = 12;

    struct WalkState final {
        const BomStore* store          = nullptr;
        const TreeWalkOptions* options = nullptr;
        TreeVisitor* visitor           = nullptr;
        std::vector<uint8_t> visited;
        TreeWalkResult result;

        bool have_last = false;
        std::span<const std::byte> last_key;
        uint32_t last_key_ref = 0;
        bool stopped          = false;
    };


    static bool fail(WalkState* s, TreeStatus status, BlockId block) noexcept
    {
        s->result.status       = status;
        s->result.failed_block = block;
        return false;
    }


    static bool resolve_ref(const BomStore& store, TreeRefKind kind,
                            uint32_t ref,
                            std::span<const std::byte>* out) noexcept
    {
        if (kind == TreeRefKind::Inline) {
            *out = {};
            return true;
        }
        if (!store.resolves(ref)) {
            return false;
        }
        *out = store.block_bytes(ref);
        return true;
    }


    static int compare_refs(const TreeWalkOptions& opt, uint32_t a_ref,
                            std::span<const std::byte> a, uint32_t b_ref,
                            std::span<const std::byte> b) noexcept
    {
        if (opt.key_kind == TreeRefKind::Inline) {
            if (a_ref < b_ref) {
                return -1;
            }
            return (a_ref > b_ref) ? 1 : 0;
        }
        return compare_tree_keys(a, b, opt.key_order);
    }


    static bool check_separators(WalkState* s, BlockId block,
                                 const TreeNode& node) noexcept
    {
        const TreeRefKind kind = s->options->key_kind;
        std::span<const std::byte> prev;
        for (size_t i = 0; i < node.entries.size(); ++i) {
            std::span<const std::byte> cur;
            if (!resolve_ref(*s->store, kind, node.entries[i].index1, &cur)) {
                return fail(s, TreeStatus::MalformedTree, block);
            }
            if (i > 0
                && compare_refs(*s->options, node.entries[i - 1].index1, prev,
                                node.entries[i].index1, cur)
                       >= 0) {
                return fail(s, TreeStatus::MalformedTree, block);
            }
            prev = cur;
        }
        return true;
    }


    static bool walk_node(WalkState* s, BlockId block, uint32_t depth) noexcept
    {
        const TreeWalkOptions& opt = *s->options;
        if (depth > opt.limits.max_depth) {
            return fail(s, TreeStatus::MalformedTree, block);
        }
        if (block >= s->visited.size()) {
            return fail(s, TreeStatus::MalformedTree, block);
        }
        if (s->visited[block] != 0U) {
            return fail(s, TreeStatus::CyclicTree, block);
        }
        s->visited[block] = 1U;
        s->visitor->on_node(block);

        s->result.nodes += 1;
        if (s->result.nodes > opt.limits.max_nodes) {
            return fail(s, TreeStatus::LimitExceeded, block);
        }
        if (depth > s->result.max_depth) {
            s->result.max_depth = depth;
        }

        TreeNode node;
        const TreeStatus st = decode_tree_node(*s->store, block, &node);
        if (st != TreeStatus::Ok) {
            return fail(s, st, block);
        }

        if (!node.is_leaf) {
            if (opt.check_key_order && !check_separators(s, block, node)) {
                return false;
            }
            for (const TreeNodeEntry& e : node.entries) {
                if (!walk_node(s, e.index0, depth + 1)) {
                    return false;
                }
                if (s->stopped) {
                    return true;
                }
            }
            return true;
        }

        for (const TreeNodeEntry& e : node.entries) {
            TreeEntry entry;
            entry.key_ref   = e.index1;
            entry.value_ref = e.index0;
            if (!resolve_ref(*s->store, opt.key_kind, entry.key_ref,
                             &entry.key)
                || !resolve_ref(*s->store, opt.value_kind, entry.value_ref,
                                &entry.value)) {
                return fail(s, TreeStatus::MalformedTree, block);
            }

            if (opt.check_key_order && s->have_last
                && compare_refs(opt, s->last_key_ref, s->last_key,
                                entry.key_ref, entry.key)
                       >= 0) {
                return fail(s, TreeStatus::MalformedTree, block);
            }
            s->have_last    = true;
            s->last_key     = entry.key;
            s->last_key_ref = entry.key_ref;

            s->result.entries += 1;
            if (s->result.entries > opt.limits.max_entries) {
                return fail(s, TreeStatus::LimitExceeded, block);
            }
            if (!s->visitor->on_entry(entry)) {
                s->stopped = true;
                return true;
            }
        }
        return true;
    }


    class CollectVisitor final : public TreeVisitor {
    public:
        explicit CollectVisitor(std::vector<TreeEntry>* out) noexcept
            : out_(out)
        {
        }

        bool on_entry(const TreeEntry& entry) override
        {
            out_->push_back(entry);
            return true;
        }

    private:
        std::vector<TreeEntry>* out_ = nullptr;
    };


    class MarkVisitor final : public TreeVisitor {
    public:
        MarkVisitor(const BomStore& store, std::vector<uint8_t>* marks) noexcept
            : store_(store)
            , marks_(marks)
        {
        }

        bool on_entry(const TreeEntry& entry) override
        {
            mark(entry.key_ref);
            mark(entry.value_ref);
            return true;
        }

        void on_node(BlockId block) override { mark(block); }

    private:
        void mark(uint32_t ref) noexcept
        {
            if (store_.resolves(ref) && ref < marks_->size()) {
                (*marks_)[ref] = 1U;
            }
        }

        const BomStore& store_;
        std::vector<uint8_t>* marks_ = nullptr;
    };

}  // namespace


int
compare_tree_keys(std::span<const std::byte> a,
                  std::span<const std::byte> b) noexcept
{
    const size_t n = (a.size() < b.size()) ? a.size() : b.size();
    if (n != 0) {
        const int c = std::memcmp(a.data(), b.data(), n);
        if (c != 0) {
            return (c < 0) ? -1 : 1;
        }
    }
    if (a.size() == b.size()) {
        return 0;
    }
    return (a.size() < b.size()) ? -1 : 1;
}


int
compare_tree_keys(std::span<const std::byte> a, std::span<const std::byte> b,
                  TreeKeyOrder order) noexcept
{
    if (order == TreeKeyOrder::Bytewise) {
        return compare_tree_keys(a, b);
    }
    const size_t n = (a.size() < b.size()) ? a.size() : b.size();
    for (size_t i = 0; i < n; i += 2) {
        uint32_t wa = static_cast<uint8_t>(a[i]);
        uint32_t wb = static_cast<uint8_t>(b[i]);
        if (i + 1 < a.size()) {
            wa |= static_cast<uint32_t>(static_cast<uint8_t>(a[i + 1])) << 8;
        }
        if (i + 1 < b.size()) {
            wb |= static_cast<uint32_t>(static_cast<uint8_t>(b[i + 1])) << 8;
        }
        if (wa != wb) {
            return (wa < wb) ? -1 : 1;
        }
    }
    if (a.size() == b.size()) {
        return 0;
    }
    return (a.size() < b.size()) ? -1 : 1;
}


TreeStatus
read_tree_header(const BomStore& store, BlockId tree_block,
                 BomTreeHeader* out) noexcept
{
    if (!out) {
        return TreeStatus::MalformedTree;
    }
    const std::span<const std::byte> b = store.block_bytes(tree_block);
    if (b.size() < kTreeHeaderSize || !match_tag(b, 0, "tree")) {
        return TreeStatus::MalformedTree;
    }
    BomTreeHeader h;
    (void)read_u32be(b, 4, &h.version);
    (void)read_u32be(b, 8, &h.root_block);
    (void)read_u32be(b, 12, &h.block_size);
    (void)read_u32be(b, 16, &h.path_count);
    h.unknown = detail::u8(b[20]);
    *out      = h;
    return TreeStatus::Ok;
}


TreeStatus
decode_tree_node(const BomStore& store, BlockId node_block,
                 TreeNode* out) noexcept
{
    if (!out) {
        return TreeStatus::MalformedTree;
    }
    if (!store.resolves(node_block)) {
        return TreeStatus::MalformedTree;
    }
    const std::span<const std::byte> b = store.block_bytes(node_block);
    uint16_t is_leaf = 0;
    uint16_t count   = 0;
    TreeNode node;
    if (!read_u16be(b, 0, &is_leaf) || !read_u16be(b, 2, &count)
        || !read_u32be(b, 4, &node.forward)
        || !read_u32be(b, 8, &node.backward)) {
        return TreeStatus::MalformedTree;
    }
    const uint64_t need = kNodeHeaderSize + static_cast<uint64_t>(count) * 8ULL;
    if (need > b.size()) {
        return TreeStatus::MalformedTree;
    }
    node.is_leaf = (is_leaf != 0U);
    node.entries.resize(count);
    for (uint32_t i = 0; i < count; ++i) {
        const uint64_t rec = kNodeHeaderSize + static_cast<uint64_t>(i) * 8ULL;
        (void)read_u32be(b, rec + 0, &node.entries[i].index0);
        (void)read_u32be(b, rec + 4, &node.entries[i].index1);
    }
    *out = std::move(node);
    return TreeStatus::Ok;
}


TreeWalkResult
walk_tree(const BomStore& store, BlockId tree_block, TreeVisitor& visitor,
          const TreeWalkOptions& options) noexcept
{
    WalkState s;
    BomTreeHeader header;
    const TreeStatus hs = read_tree_header(store, tree_block, &header);
    if (hs != TreeStatus::Ok) {
        s.result.status       = hs;
        s.result.failed_block = tree_block;
        return s.result;
    }

    s.store   = &store;
    s.options = &options;
    s.visitor = &visitor;
    s.visited.assign(store.block_count(), 0U);
    (void)walk_node(&s, header.root_block, 0);
    return s.result;
}


TreeWalkResult
collect_tree(const BomStore& store, BlockId tree_block,
             std::vector<TreeEntry>* out,
             const TreeWalkOptions& options) noexcept
{
    if (!out) {
        TreeWalkResult r;
        r.status = TreeStatus::MalformedTree;
        return r;
    }
    CollectVisitor visitor(out);
    return walk_tree(store, tree_block, visitor, options);
}


TreeWalkResult
mark_tree_blocks(const BomStore& store, BlockId tree_block,
                 std::vector<uint8_t>* marks,
                 const TreeWalkOptions& options) noexcept
{
    if (!marks || marks->size() != store.block_count()) {
        TreeWalkResult r;
        r.status       = TreeStatus::MalformedTree;
        r.failed_block = tree_block;
        return r;
    }
    if (store.resolves(tree_block)) {
        (*marks)[tree_block] = 1U;
    }
    MarkVisitor visitor(store, marks);
    return walk_tree(store, tree_block, visitor, options);
}


TreeStatus
find_tree_entry(const BomStore& store, BlockId tree_block,
                std::span<const std::byte> key, TreeEntry* out,
                const TreeWalkOptions& options) noexcept
{
    if (!out || options.key_kind != TreeRefKind::Block) {
        return TreeStatus::MalformedTree;
    }
    BomTreeHeader header;
    const TreeStatus hs = read_tree_header(store, tree_block, &header);
    if (hs != TreeStatus::Ok) {
        return hs;
    }

    std::vector<uint8_t> visited(store.block_count(), 0U);
    BlockId block = header.root_block;
    for (uint32_t depth = 0;; ++depth) {
        if (depth > options.limits.max_depth || block >= visited.size()) {
            return TreeStatus::MalformedTree;
        }
        if (visited[block] != 0U) {
            return TreeStatus::CyclicTree;
        }
        visited[block] = 1U;

        TreeNode node;
        const TreeStatus st = decode_tree_node(store, block, &node);
        if (st != TreeStatus::Ok) {
            return st;
        }
        if (node.entries.empty()) {
            return TreeStatus::NotFound;
        }

        // Last entry whose key is <= the target.
        size_t lo    = 0;
        size_t hi    = node.entries.size();
        bool matched = false;
        while (lo < hi) {
            const size_t mid = lo + (hi - lo) / 2;
            const std::span<const std::byte> k
                = store.block_bytes(node.entries[mid].index1);
            if (!store.resolves(node.entries[mid].index1)) {
                return TreeStatus::MalformedTree;
            }
            const int c = compare_tree_keys(k, key, options.key_order);
            if (c == 0) {
                lo      = mid;
                matched = true;
                break;
            }
            if (c < 0) {
                lo = mid + 1;
            } else {
                hi = mid;
            }
        }

        if (node.is_leaf) {
            if (!matched) {
                return TreeStatus::NotFound;
            }
            const TreeNodeEntry& e = node.entries[lo];
            TreeEntry entry;
            entry.key_ref   = e.index1;
            entry.value_ref = e.index0;
            entry.key       = store.block_bytes(e.index1);
            if (options.value_kind == TreeRefKind::Block) {
                if (!store.resolves(e.index0)) {
                    return TreeStatus::MalformedTree;
                }
                entry.value = store.block_bytes(e.index0);
            }
            *out = entry;
            return TreeStatus::Ok;
        }

        // Separators are lower bounds; keys before the first separator can
        // only live in the first child.
        const size_t child = matched ? lo : ((lo == 0) ? 0 : lo - 1);
        block              = node.entries[child].index0;
    }
}

}  // namespace carkit
