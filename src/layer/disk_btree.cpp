// src/layer/disk_btree.cpp
#include "layerstore/layer/disk_btree.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <string>

namespace layerstore {
namespace layer {

namespace {
    uint32_t nodeChecksum(const uint8_t* block) {
        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, block + BTREE_NODE_HEADER_SIZE, static_cast<uInt>(PAGE_SZ - BTREE_NODE_HEADER_SIZE));
        return static_cast<uint32_t>(crc);
    }

    storage::StorageError nodeCorruption(const std::string& what, uint32_t blknum) {
        return storage::StorageError(storage::ErrorCode::BTREE_NODE_CORRUPTION, "Corrupt index node: " + what)
            .withContext("blknum", std::to_string(blknum));
    }
} // end anonymous namespace

// --- DiskBtreeBuilder ---

DiskBtreeBuilder::DiskBtreeBuilder(size_t key_size)
    : key_size_(key_size),
      entry_size_(key_size + sizeof(uint64_t)),
      max_entries_(0) {
    if (key_size_ == 0 || entry_size_ * 2 > PAGE_SZ - BTREE_NODE_HEADER_SIZE) {
        throw storage::StorageError(storage::ErrorCode::BTREE_KEY_TOO_LARGE, "Index key size must allow two entries per node.")
            .withContext("key_size", std::to_string(key_size_));
    }
    max_entries_ = std::min<size_t>((PAGE_SZ - BTREE_NODE_HEADER_SIZE) / entry_size_, UINT16_MAX);
    levels_.emplace_back();
}

void DiskBtreeBuilder::append(const uint8_t* key, uint64_t value) {
    if (finished_) {
        throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "append() on a finished index builder.");
    }
    if (!last_key_.empty() && std::memcmp(key, last_key_.data(), key_size_) <= 0) {
        throw storage::StorageError(storage::ErrorCode::INVALID_KEY, "Index keys must be appended in strictly increasing order.")
            .withContext("last_key", hex_dump_bytes(last_key_.data(), key_size_))
            .withContext("new_key", hex_dump_bytes(key, key_size_));
    }

    pushToLevel(0, key, value);
    last_key_.assign(key, key + key_size_);
    num_entries_++;
}

void DiskBtreeBuilder::pushToLevel(size_t level, const uint8_t* key, uint64_t value) {
    if (level == levels_.size()) {
        if (level >= BTREE_MAX_DEPTH) {
            throw storage::StorageError(storage::ErrorCode::BTREE_HEIGHT_EXCEEDED, "Index tree grew too tall.");
        }
        NodeBuf node;
        node.level = static_cast<uint8_t>(level);
        levels_.push_back(std::move(node));
    }

    if (levels_[level].count == max_entries_) {
        // The full node's first key becomes its separator in the parent.
        std::vector<uint8_t> first_key(levels_[level].entries.begin(),
                                       levels_[level].entries.begin() + key_size_);
        uint32_t blknum = flushNode(level);
        pushToLevel(level + 1, first_key.data(), blknum);
    }

    NodeBuf& node = levels_[level];
    node.entries.insert(node.entries.end(), key, key + key_size_);
    uint8_t value_buf[8];
    putU64BE(value_buf, value);
    node.entries.insert(node.entries.end(), value_buf, value_buf + sizeof(value_buf));
    node.count++;
}

uint32_t DiskBtreeBuilder::flushNode(size_t level) {
    NodeBuf& node = levels_[level];

    Block block{};
    block[0] = node.level;
    block[1] = BTREE_NODE_MARKER;
    putU16BE(block.data() + 2, node.count);
    if (!node.entries.empty()) {
        std::memcpy(block.data() + BTREE_NODE_HEADER_SIZE, node.entries.data(), node.entries.size());
    }
    putU32BE(block.data() + 4, nodeChecksum(block.data()));

    uint32_t blknum = buf_.writeBlk(block);
    LOG_TRACE("[DiskBtreeBuilder] Wrote level ", static_cast<int>(node.level), " node with ",
              node.count, " entries at blk ", blknum);

    node.entries.clear();
    node.count = 0;
    return blknum;
}

std::pair<uint32_t, BlockBuf> DiskBtreeBuilder::finish() {
    if (finished_) {
        throw storage::StorageError(storage::ErrorCode::INTERNAL_ERROR, "finish() called twice on index builder.");
    }
    finished_ = true;

    // Flush bottom-up. Pushing a separator into the parent may itself fill
    // the parent and add a level, which the loop bound picks up.
    uint32_t root_blk = 0;
    for (size_t level = 0; level < levels_.size(); ++level) {
        if (level + 1 == levels_.size()) {
            root_blk = flushNode(level);
            break;
        }
        if (levels_[level].count == 0) {
            continue;
        }
        std::vector<uint8_t> first_key(levels_[level].entries.begin(),
                                       levels_[level].entries.begin() + key_size_);
        uint32_t blknum = flushNode(level);
        pushToLevel(level + 1, first_key.data(), blknum);
    }

    return {root_blk, std::move(buf_)};
}

// --- DiskBtreeReader ---

const uint8_t* DiskBtreeReader::NodeView::keyAt(size_t i) const {
    return block->data() + BTREE_NODE_HEADER_SIZE + i * (key_size + sizeof(uint64_t));
}

uint64_t DiskBtreeReader::NodeView::valueAt(size_t i) const {
    return getU64BE(keyAt(i) + key_size);
}

DiskBtreeReader::DiskBtreeReader(uint32_t start_blk, uint32_t root_blk, const BlockReader& reader, size_t key_size)
    : start_blk_(start_blk), root_blk_(root_blk), reader_(reader), key_size_(key_size) {
}

DiskBtreeReader::NodeView DiskBtreeReader::readNode(uint32_t blknum) const {
    NodeView node;
    node.block = reader_.readBlk(start_blk_ + blknum);
    node.key_size = key_size_;

    const uint8_t* data = node.block->data();
    if (data[1] != BTREE_NODE_MARKER) {
        throw nodeCorruption("bad node marker", blknum);
    }
    uint32_t stored_crc = getU32BE(data + 4);
    uint32_t actual_crc = nodeChecksum(data);
    if (stored_crc != actual_crc) {
        throw nodeCorruption("checksum mismatch", blknum)
            .withContext("stored_crc", std::to_string(stored_crc))
            .withContext("actual_crc", std::to_string(actual_crc));
    }

    node.level = data[0];
    node.count = getU16BE(data + 2);
    if (node.count * (key_size_ + sizeof(uint64_t)) > PAGE_SZ - BTREE_NODE_HEADER_SIZE) {
        throw nodeCorruption("entry count exceeds node capacity", blknum)
            .withContext("count", std::to_string(node.count));
    }
    if (node.level > 0 && node.count == 0) {
        throw nodeCorruption("empty internal node", blknum);
    }
    return node;
}

size_t DiskBtreeReader::lowerBound(const NodeView& node, const uint8_t* key) const {
    size_t lo = 0, hi = node.count;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (std::memcmp(node.keyAt(mid), key, key_size_) < 0) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return lo;
}

size_t DiskBtreeReader::upperBound(const NodeView& node, const uint8_t* key) const {
    size_t lo = 0, hi = node.count;
    while (lo < hi) {
        size_t mid = lo + (hi - lo) / 2;
        if (std::memcmp(node.keyAt(mid), key, key_size_) <= 0) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return lo;
}

uint32_t DiskBtreeReader::childBlk(const NodeView& parent, size_t idx, uint32_t parent_blk) const {
    uint64_t child = parent.valueAt(idx);
    if (child > UINT32_MAX) {
        throw nodeCorruption("child pointer out of range", parent_blk)
            .withContext("child", std::to_string(child));
    }
    return static_cast<uint32_t>(child);
}

std::optional<uint64_t> DiskBtreeReader::get(const uint8_t* key) const {
    uint32_t blknum = root_blk_;
    int expected_level = -1;

    for (size_t depth = 0; depth < BTREE_MAX_DEPTH; ++depth) {
        NodeView node = readNode(blknum);
        if (expected_level >= 0 && node.level != expected_level) {
            throw nodeCorruption("unexpected node level", blknum)
                .withContext("level", std::to_string(node.level))
                .withContext("expected_level", std::to_string(expected_level));
        }

        if (node.level == 0) {
            size_t idx = lowerBound(node, key);
            if (idx < node.count && std::memcmp(node.keyAt(idx), key, key_size_) == 0) {
                return node.valueAt(idx);
            }
            return std::nullopt;
        }

        // Descend into the last child whose first key is <= key.
        size_t idx = upperBound(node, key);
        if (idx == 0) {
            return std::nullopt;
        }
        uint32_t next = childBlk(node, idx - 1, blknum);
        expected_level = node.level - 1;
        blknum = next;
    }
    throw storage::StorageError(storage::ErrorCode::BTREE_HEIGHT_EXCEEDED, "Index lookup exceeded maximum depth.");
}

bool DiskBtreeReader::visit(const uint8_t* search_key, VisitDirection dir, const Visitor& visitor) const {
    return visitNode(root_blk_, search_key, dir, visitor, 0);
}

bool DiskBtreeReader::visitNode(uint32_t blknum, const uint8_t* search_key, VisitDirection dir,
                                const Visitor& visitor, size_t depth) const {
    if (depth >= BTREE_MAX_DEPTH) {
        throw storage::StorageError(storage::ErrorCode::BTREE_HEIGHT_EXCEEDED, "Index traversal exceeded maximum depth.");
    }
    NodeView node = readNode(blknum);

    if (node.level == 0) {
        if (dir == VisitDirection::Forwards) {
            for (size_t i = lowerBound(node, search_key); i < node.count; ++i) {
                if (!visitor(node.keyAt(i), node.valueAt(i))) return false;
            }
        } else {
            for (size_t i = upperBound(node, search_key); i > 0; --i) {
                if (!visitor(node.keyAt(i - 1), node.valueAt(i - 1))) return false;
            }
        }
        return true;
    }

    size_t idx = upperBound(node, search_key);
    if (dir == VisitDirection::Forwards) {
        // The child covering search_key may hold keys >= search_key too.
        for (size_t i = (idx == 0 ? 0 : idx - 1); i < node.count; ++i) {
            if (!visitNode(childBlk(node, i, blknum), search_key, dir, visitor, depth + 1)) return false;
        }
    } else {
        for (size_t i = idx; i > 0; --i) {
            if (!visitNode(childBlk(node, i - 1, blknum), search_key, dir, visitor, depth + 1)) return false;
        }
    }
    return true;
}

void DiskBtreeReader::dump(std::ostream& out) const {
    dumpNode(root_blk_, out, 0);
}

void DiskBtreeReader::dumpNode(uint32_t blknum, std::ostream& out, size_t depth) const {
    if (depth >= BTREE_MAX_DEPTH) {
        throw storage::StorageError(storage::ErrorCode::BTREE_HEIGHT_EXCEEDED, "Index dump exceeded maximum depth.");
    }
    NodeView node = readNode(blknum);
    const std::string indent(depth * 2, ' ');

    out << indent << "blk " << blknum << ": level " << static_cast<int>(node.level)
        << ", " << node.count << " entries" << std::endl;
    for (size_t i = 0; i < node.count; ++i) {
        out << indent << "  " << hex_dump_bytes(node.keyAt(i), key_size_)
            << (node.level == 0 ? " value " : " child ") << node.valueAt(i) << std::endl;
    }
    if (node.level > 0) {
        for (size_t i = 0; i < node.count; ++i) {
            dumpNode(childBlk(node, i, blknum), out, depth + 1);
        }
    }
}

} // namespace layer
} // namespace layerstore
