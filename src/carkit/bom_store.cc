#include "carkit/bom_store.h"

#include "byte_read_internal.h"

#include <algorithm>
#include <utility>

namespace carkit {
namespace {

    using detail::in_bounds;
    using detail::read_u32be;
    using detail::u8;

    static bool is_null_record(const BomBlock& b) noexcept
    {
        return b.offset == 0 && b.length == 0;
    }


    // Fills zero lengths of non-null records from the gap to the next block
    // start (in offset order) or the end of the buffer.
    static void derive_missing_lengths(std::vector<BomBlock>* blocks,
                                       uint64_t buffer_size)
    {
        std::vector<uint32_t> order;
        order.reserve(blocks->size());
        for (uint32_t i = 0; i < blocks->size(); ++i) {
            if (!is_null_record((*blocks)[i])) {
                order.push_back(i);
            }
        }
        std::sort(order.begin(), order.end(),
                  [blocks](uint32_t a, uint32_t b) {
                      return (*blocks)[a].offset < (*blocks)[b].offset;
                  });

        for (size_t i = 0; i < order.size(); ++i) {
            BomBlock& b = (*blocks)[order[i]];
            if (b.length != 0) {
                continue;
            }
            uint64_t end = buffer_size;
            for (size_t j = i + 1; j < order.size(); ++j) {
                const uint32_t next = (*blocks)[order[j]].offset;
                if (next > b.offset) {
                    end = next;
                    break;
                }
            }
            if (end <= b.offset) {
                continue;
            }
            const uint64_t gap = end - b.offset;
            b.length           = (gap > 0xFFFFFFFFULL)
                                     ? 0xFFFFFFFFU
                                     : static_cast<uint32_t>(gap);
            b.derived_length   = true;
        }
    }

}  // namespace


const BomHeader&
BomStore::header() const noexcept
{
    return header_;
}


std::span<const std::byte>
BomStore::bytes() const noexcept
{
    return bytes_;
}


uint32_t
BomStore::block_count() const noexcept
{
    return static_cast<uint32_t>(blocks_.size());
}


std::span<const BomBlock>
BomStore::blocks() const noexcept
{
    return std::span<const BomBlock>(blocks_.data(), blocks_.size());
}


const BomBlock*
BomStore::block(BlockId id) const noexcept
{
    if (id >= blocks_.size()) {
        return nullptr;
    }
    return &blocks_[id];
}


bool
BomStore::resolves(BlockId id) const noexcept
{
    const BomBlock* b = block(id);
    if (!b || is_null_record(*b)) {
        return false;
    }
    return in_bounds(bytes_, b->offset, b->length);
}


std::span<const std::byte>
BomStore::block_bytes(BlockId id) const noexcept
{
    if (!resolves(id)) {
        return {};
    }
    const BomBlock& b = blocks_[id];
    return bytes_.subspan(b.offset, b.length);
}


std::span<const BomVar>
BomStore::vars() const noexcept
{
    return std::span<const BomVar>(vars_.data(), vars_.size());
}


BlockId
BomStore::find_var(std::string_view name) const noexcept
{
    for (const BomVar& v : vars_) {
        if (v.name == name) {
            return v.block;
        }
    }
    return kInvalidBlockId;
}


uint32_t
BomStore::count_vars(std::string_view name) const noexcept
{
    uint32_t n = 0;
    for (const BomVar& v : vars_) {
        if (v.name == name) {
            n += 1;
        }
    }
    return n;
}


BomParseResult
parse_bom(std::span<const std::byte> bytes, BomStore& out,
          const BomParseOptions& options) noexcept
{
    BomParseResult result;
    out = BomStore {};

    if (bytes.size() < kBomHeaderSize) {
        result.status = BomStatus::TruncatedHeader;
        return result;
    }
    static constexpr char kMagic[] = "BOMStore";
    for (size_t i = 0; i < 8; ++i) {
        if (u8(bytes[i]) != static_cast<uint8_t>(kMagic[i])) {
            result.status = BomStatus::BadMagic;
            return result;
        }
    }

    BomHeader header;
    (void)read_u32be(bytes, 8, &header.version);
    (void)read_u32be(bytes, 12, &header.nonnull_blocks);
    (void)read_u32be(bytes, 16, &header.index_offset);
    (void)read_u32be(bytes, 20, &header.index_length);
    (void)read_u32be(bytes, 24, &header.vars_offset);
    (void)read_u32be(bytes, 28, &header.vars_length);

    // Block table.
    uint32_t count = 0;
    if (!read_u32be(bytes, header.index_offset, &count)) {
        result.status = BomStatus::PointerOutOfBounds;
        return result;
    }
    if (count > options.limits.max_blocks) {
        result.status = BomStatus::LimitExceeded;
        return result;
    }
    const uint64_t table_bytes = 4ULL + static_cast<uint64_t>(count) * 8ULL;
    if (!in_bounds(bytes, header.index_offset, table_bytes)) {
        result.status = BomStatus::PointerOutOfBounds;
        return result;
    }

    std::vector<BomBlock> blocks;
    blocks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const uint64_t rec = static_cast<uint64_t>(header.index_offset) + 4ULL
                             + static_cast<uint64_t>(i) * 8ULL;
        BomBlock b;
        b.id = i;
        (void)read_u32be(bytes, rec + 0, &b.offset);
        (void)read_u32be(bytes, rec + 4, &b.length);
        blocks.push_back(b);
    }

    if (options.derive_lengths) {
        derive_missing_lengths(&blocks, bytes.size());
    }

    uint32_t null_blocks = 0;
    for (const BomBlock& b : blocks) {
        if (is_null_record(b)) {
            null_blocks += 1;
            continue;
        }
        if (!in_bounds(bytes, b.offset, b.length)) {
            result.status = BomStatus::PointerOutOfBounds;
            return result;
        }
    }

    // Variable table.
    uint32_t var_count = 0;
    if (!read_u32be(bytes, header.vars_offset, &var_count)) {
        result.status = BomStatus::PointerOutOfBounds;
        return result;
    }
    if (var_count > options.limits.max_vars) {
        result.status = BomStatus::LimitExceeded;
        return result;
    }

    std::vector<BomVar> vars;
    vars.reserve(var_count);
    uint64_t p = static_cast<uint64_t>(header.vars_offset) + 4ULL;
    for (uint32_t i = 0; i < var_count; ++i) {
        BomVar v;
        if (!read_u32be(bytes, p, &v.block) || !in_bounds(bytes, p + 4, 1)) {
            result.status = BomStatus::PointerOutOfBounds;
            return result;
        }
        const uint8_t name_len = u8(bytes[p + 4]);
        if (!in_bounds(bytes, p + 5, name_len)) {
            result.status = BomStatus::PointerOutOfBounds;
            return result;
        }
        v.name.assign(reinterpret_cast<const char*>(bytes.data() + p + 5),
                      name_len);
        vars.push_back(std::move(v));
        p += 5ULL + name_len;
    }

    out.bytes_  = bytes;
    out.header_ = header;
    out.blocks_ = std::move(blocks);
    out.vars_   = std::move(vars);

    result.blocks  = count;
    result.vars    = var_count;
    result.null_blocks = null_blocks;
    return result;
}

}  // namespace carkit
