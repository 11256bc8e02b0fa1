#pragma once

#include "carkit/bom_store.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

/**
 * \file bom_tree.h
 * \brief B-tree walker for BOM `tree` objects (ordered key -> value maps).
 */

namespace carkit {

/// Tree walk/lookup result status.
enum class TreeStatus : uint8_t {
    Ok,
    /// Point lookup did not find the key.
    NotFound,
    /// A node or reference does not resolve, has a bad layout, or keys are
    /// out of order.
    MalformedTree,
    /// A node block was reached twice during one traversal.
    CyclicTree,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Contents of a tree header object (magic `tree`).
struct BomTreeHeader final {
    uint32_t version    = 0;
    BlockId root_block  = kInvalidBlockId;
    uint32_t block_size = 0;
    uint32_t path_count = 0;
    uint8_t unknown     = 0;
};

/// One `(index0, index1)` record of a path node.
struct TreeNodeEntry final {
    /// Leaf: value reference. Internal: child node block.
    uint32_t index0 = 0;
    /// Leaf: key reference. Internal: separator key reference.
    uint32_t index1 = 0;
};

/// A decoded path node.
struct TreeNode final {
    bool is_leaf      = false;
    uint32_t forward  = 0;
    uint32_t backward = 0;
    std::vector<TreeNodeEntry> entries;
};

/// How a key or value reference in a leaf record is interpreted.
enum class TreeRefKind : uint8_t {
    /// The reference is a block id; the bytes are that block's contents.
    Block,
    /// The reference is the value itself (no bytes are resolved).
    Inline,
};

/// How block keys are ordered.
enum class TreeKeyOrder : uint8_t {
    /// Byte-lexicographic; a shorter prefix sorts first.
    Bytewise,
    /// Sequences of little-endian u16 words compared numerically, word by
    /// word (rendition keys with 2-byte attributes).
    Uint16Le,
};

/**
 * \brief One enumerated key/value pair.
 *
 * Spans borrow from the \ref BomStore buffer. For \ref TreeRefKind::Inline
 * references the span is empty and only the raw reference is meaningful.
 */
struct TreeEntry final {
    uint32_t key_ref   = 0;
    uint32_t value_ref = 0;
    std::span<const std::byte> key;
    std::span<const std::byte> value;
};

/// Resource limits for tree traversal.
struct TreeWalkLimits final {
    uint32_t max_depth   = 32;
    uint32_t max_nodes   = 1U << 20;
    uint32_t max_entries = 1U << 22;
};

/// Options for \ref walk_tree and \ref find_tree_entry.
struct TreeWalkOptions final {
    TreeRefKind key_kind   = TreeRefKind::Block;
    TreeRefKind value_kind = TreeRefKind::Block;
    /// Require strictly increasing keys (per \ref key_order for block keys,
    /// numeric for inline keys) within nodes and across the enumeration.
    bool check_key_order = true;
    TreeKeyOrder key_order = TreeKeyOrder::Bytewise;
    TreeWalkLimits limits;
};

struct TreeWalkResult final {
    TreeStatus status  = TreeStatus::Ok;
    uint32_t entries   = 0;
    uint32_t nodes     = 0;
    uint32_t max_depth = 0;
    /// Block where the walk failed (\ref kInvalidBlockId if none).
    BlockId failed_block = kInvalidBlockId;
};

/// Receives entries from \ref walk_tree in key order.
class TreeVisitor {
public:
    virtual ~TreeVisitor() = default;
    /// Return false to stop the walk early (the result stays Ok).
    virtual bool on_entry(const TreeEntry& entry) = 0;
    /// Called once per path node block before its entries.
    virtual void on_node(BlockId) {}
};

/// Reads the tree header stored in \p tree_block.
TreeStatus
read_tree_header(const BomStore& store, BlockId tree_block,
                 BomTreeHeader* out) noexcept;

/// Decodes one path node block. This is the primitive shared by walks and
/// lookups.
TreeStatus
decode_tree_node(const BomStore& store, BlockId node_block,
                 TreeNode* out) noexcept;

/**
 * \brief Enumerates all leaf entries of the tree in \p tree_block in order.
 *
 * Internal nodes are descended left to right. Each node block may be visited
 * once per walk; a second visit fails with \ref TreeStatus::CyclicTree. The
 * walk keeps no state between calls, so re-walking yields the same sequence.
 */
TreeWalkResult
walk_tree(const BomStore& store, BlockId tree_block, TreeVisitor& visitor,
          const TreeWalkOptions& options = TreeWalkOptions {}) noexcept;

/// Convenience wrapper around \ref walk_tree that appends entries to \p out.
TreeWalkResult
collect_tree(const BomStore& store, BlockId tree_block,
             std::vector<TreeEntry>* out,
             const TreeWalkOptions& options = TreeWalkOptions {}) noexcept;

/**
 * \brief Marks every block the tree in \p tree_block reaches.
 *
 * Sets `(*marks)[id]` for the tree header, each path node and each leaf key
 * and value reference that resolves to a block. Inline references that
 * happen to name a block are marked too. \p marks must hold
 * \ref BomStore::block_count entries. On failure the blocks reached so far
 * stay marked.
 */
TreeWalkResult
mark_tree_blocks(const BomStore& store, BlockId tree_block,
                 std::vector<uint8_t>* marks,
                 const TreeWalkOptions& options = TreeWalkOptions {}) noexcept;

/**
 * \brief Finds \p key in the tree by binary search over separator keys.
 *
 * Requires \ref TreeRefKind::Block keys. Returns \ref TreeStatus::NotFound when
 * the key is absent.
 */
TreeStatus
find_tree_entry(const BomStore& store, BlockId tree_block,
                std::span<const std::byte> key, TreeEntry* out,
                const TreeWalkOptions& options = TreeWalkOptions {}) noexcept;

/// Byte-lexicographic three-way comparison (shorter prefix sorts first).
int
compare_tree_keys(std::span<const std::byte> a,
                  std::span<const std::byte> b) noexcept;

/// Three-way comparison under \p order. A trailing odd byte of a
/// \ref TreeKeyOrder::Uint16Le key compares as one word.
int
compare_tree_keys(std::span<const std::byte> a, std::span<const std::byte> b,
                  TreeKeyOrder order) noexcept;

}  // namespace carkit
