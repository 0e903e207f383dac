// include/layerstore/layer/disk_btree.h
#pragma once

#include "block_io.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace layerstore {
namespace layer {

/*
 * On-disk node layout (one PAGE_SZ block, all integers big-endian):
 *
 *   [0]     level        0 for leaves
 *   [1]     marker       BTREE_NODE_MARKER
 *   [2..4)  count        number of entries
 *   [4..8)  crc32        zlib crc32 over bytes [8, PAGE_SZ)
 *   [8..)   count * (key[key_size] || value:u64)
 *
 * In an internal node, each entry maps the first key of a child to the
 * child's block number, relative to the start of the index region.
 */
static constexpr uint8_t BTREE_NODE_MARKER = 0xB7;
static constexpr size_t BTREE_NODE_HEADER_SIZE = 8;
static constexpr size_t BTREE_MAX_DEPTH = 32;

enum class VisitDirection {
    Forwards,
    Backwards
};

/**
 * @class DiskBtreeBuilder
 * @brief Builds a B-tree bottom-up from keys appended in strictly increasing
 * order. Full nodes are written out as soon as they are complete, so memory
 * use is one partial node per level.
 */
class DiskBtreeBuilder {
public:
    explicit DiskBtreeBuilder(size_t key_size);

    DiskBtreeBuilder(const DiskBtreeBuilder&) = delete;
    DiskBtreeBuilder& operator=(const DiskBtreeBuilder&) = delete;

    // Throws INVALID_KEY if key is not greater than the previous key.
    void append(const uint8_t* key, uint64_t value);

    // Flushes the partial nodes and returns the root block number together
    // with all node blocks. The builder cannot be used afterwards.
    std::pair<uint32_t, BlockBuf> finish();

    size_t keySize() const { return key_size_; }
    size_t maxEntriesPerNode() const { return max_entries_; }
    uint64_t numEntries() const { return num_entries_; }

private:
    struct NodeBuf {
        uint8_t level = 0;
        uint16_t count = 0;
        std::vector<uint8_t> entries;
    };

    void pushToLevel(size_t level, const uint8_t* key, uint64_t value);
    uint32_t flushNode(size_t level);

    size_t key_size_;
    size_t entry_size_;
    size_t max_entries_;
    std::vector<NodeBuf> levels_;
    BlockBuf buf_;
    std::vector<uint8_t> last_key_;
    uint64_t num_entries_ = 0;
    bool finished_ = false;
};

/**
 * @class DiskBtreeReader
 * @brief Read-only access to a finished tree. Stateless apart from the block
 * reader it borrows; safe to use from several threads.
 */
class DiskBtreeReader {
public:
    // Return false to stop the traversal.
    using Visitor = std::function<bool(const uint8_t* key, uint64_t value)>;

    DiskBtreeReader(uint32_t start_blk, uint32_t root_blk, const BlockReader& reader, size_t key_size);

    std::optional<uint64_t> get(const uint8_t* key) const;

    // Forwards visits every key >= search_key in ascending order; Backwards
    // every key <= search_key in descending order. Returns false if the
    // visitor stopped the traversal early.
    bool visit(const uint8_t* search_key, VisitDirection dir, const Visitor& visitor) const;

    // Prints every node, one line per entry.
    void dump(std::ostream& out) const;

private:
    struct NodeView {
        BlockLease block;
        uint8_t level = 0;
        uint16_t count = 0;
        size_t key_size = 0;

        const uint8_t* keyAt(size_t i) const;
        uint64_t valueAt(size_t i) const;
    };

    NodeView readNode(uint32_t blknum) const;
    size_t lowerBound(const NodeView& node, const uint8_t* key) const;
    size_t upperBound(const NodeView& node, const uint8_t* key) const;
    uint32_t childBlk(const NodeView& parent, size_t idx, uint32_t parent_blk) const;
    bool visitNode(uint32_t blknum, const uint8_t* search_key, VisitDirection dir,
                   const Visitor& visitor, size_t depth) const;
    void dumpNode(uint32_t blknum, std::ostream& out, size_t depth) const;

    uint32_t start_blk_;
    uint32_t root_blk_;
    const BlockReader& reader_;
    size_t key_size_;
};

} // namespace layer
} // namespace layerstore
