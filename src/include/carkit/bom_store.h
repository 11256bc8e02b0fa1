#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file bom_store.h
 * \brief Reader for the BOM ("BOMStore") block container used by `.car` files.
 */

namespace carkit {

using BlockId = uint32_t;

static constexpr BlockId kInvalidBlockId = 0xffffffffU;

/// BOM parse result status.
enum class BomStatus : uint8_t {
    Ok,
    /// Fewer bytes than the fixed-size header.
    TruncatedHeader,
    /// The bytes do not start with the `BOMStore` tag.
    BadMagic,
    /// A table or block would read past the end of the buffer.
    PointerOutOfBounds,
    /// Resource limits were exceeded.
    LimitExceeded,
};

/// Fixed-size header at offset 0 (all fields big-endian).
struct BomHeader final {
    uint32_t version         = 0;
    uint32_t nonnull_blocks  = 0;
    uint32_t index_offset    = 0;
    uint32_t index_length    = 0;
    uint32_t vars_offset     = 0;
    uint32_t vars_length     = 0;
};

static constexpr uint32_t kBomHeaderSize = 32;

/**
 * \brief One record of the block pointer table.
 *
 * \ref offset and \ref length address bytes of the buffer passed to
 * \ref parse_bom. Null records (offset 0, length 0) are kept so that block ids
 * stay equal to table indices, but they never resolve.
 */
struct BomBlock final {
    BlockId id      = kInvalidBlockId;
    uint32_t offset = 0;
    uint32_t length = 0;
    /// True when the table stored a zero length and the length was derived
    /// from the gap to the next block.
    bool derived_length = false;
};

/// A named entry point (e.g. `CARHEADER`, `RENDITIONS`).
struct BomVar final {
    BlockId block = kInvalidBlockId;
    std::string name;
};

/// Resource limits applied while reading the block and variable tables.
struct BomParseLimits final {
    uint32_t max_blocks = 1U << 22;
    uint32_t max_vars   = 1U << 12;
};

/// Options for \ref parse_bom.
struct BomParseOptions final {
    /// Derive lengths of non-null records that store a zero length.
    bool derive_lengths = true;
    BomParseLimits limits;
};

struct BomParseResult final {
    BomStatus status = BomStatus::Ok;
    uint32_t blocks  = 0;
    uint32_t vars    = 0;
    /// Records with offset and length both zero (never resolve).
    uint32_t null_blocks = 0;
};

/**
 * \brief Parsed BOM container: header, block index and variable table.
 *
 * The store borrows the byte buffer passed to \ref parse_bom; the buffer must
 * outlive the store and every span returned from it. Objects reference each
 * other by \ref BlockId only.
 */
class BomStore final {
public:
    BomStore() = default;

    const BomHeader& header() const noexcept;
    std::span<const std::byte> bytes() const noexcept;

    uint32_t block_count() const noexcept;
    std::span<const BomBlock> blocks() const noexcept;
    /// Returns the record for \p id, or nullptr when out of range.
    const BomBlock* block(BlockId id) const noexcept;
    /// True when \p id names a non-null, in-bounds block.
    bool resolves(BlockId id) const noexcept;
    /// Returns the bytes of \p id, or an empty span when it does not resolve.
    std::span<const std::byte> block_bytes(BlockId id) const noexcept;

    std::span<const BomVar> vars() const noexcept;
    /// Returns the block of the first variable named \p name.
    BlockId find_var(std::string_view name) const noexcept;
    /// Returns how many variables are named \p name.
    uint32_t count_vars(std::string_view name) const noexcept;

private:
    friend BomParseResult parse_bom(std::span<const std::byte> bytes,
                                    BomStore& out,
                                    const BomParseOptions& options) noexcept;

    std::span<const std::byte> bytes_;
    BomHeader header_;
    std::vector<BomBlock> blocks_;
    std::vector<BomVar> vars_;
};

/**
 * \brief Parses the BOM header, block table and variable table.
 *
 * Block contents are not interpreted. On failure \p out is left empty.
 */
BomParseResult
parse_bom(std::span<const std::byte> bytes, BomStore& out,
          const BomParseOptions& options = BomParseOptions {}) noexcept;

}  // namespace carkit
