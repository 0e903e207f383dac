// include/layerstore/layer/block_io.h
#pragma once

#include "../types.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cstdint>

namespace layerstore {
namespace layer {

using BlockLease = std::shared_ptr<const Block>;

/**
 * @class BlockReader
 * @brief Random access to the fixed-size blocks of a layer file (or of an
 * in-memory stand-in for one). Implementations must be safe to call from
 * several threads at once.
 */
class BlockReader {
public:
    virtual ~BlockReader() = default;

    // Throws storage::StorageError if the block cannot be read in full.
    virtual BlockLease readBlk(uint32_t blknum) const = 0;
};

/**
 * @class FileBlockReader
 * @brief BlockReader over a file opened read-only.
 */
class FileBlockReader : public BlockReader {
public:
    // Throws FILE_NOT_FOUND if the file does not exist, IO_READ_ERROR if it
    // exists but cannot be opened.
    explicit FileBlockReader(const std::string& path);
    ~FileBlockReader() override;

    FileBlockReader(const FileBlockReader&) = delete;
    FileBlockReader& operator=(const FileBlockReader&) = delete;

    BlockLease readBlk(uint32_t blknum) const override;

    const std::string& path() const { return path_; }
    uint64_t fileSize() const { return file_size_; }

private:
    std::string path_;
    mutable std::ifstream file_;
    mutable std::mutex file_mutex_;
    uint64_t file_size_ = 0;
};

/**
 * @class BlockBuf
 * @brief Append-only list of blocks held in memory. The index builder writes
 * its nodes here before they are copied into the layer file.
 */
class BlockBuf : public BlockReader {
public:
    BlockBuf() = default;

    // Returns the block number of the appended block.
    uint32_t writeBlk(const Block& block);

    BlockLease readBlk(uint32_t blknum) const override;

    const std::vector<BlockLease>& blocks() const { return blocks_; }
    size_t size() const { return blocks_.size(); }

private:
    std::vector<BlockLease> blocks_;
};

/**
 * @class BlockCursor
 * @brief Byte-addressed reads on top of a BlockReader. Keeps the most recently
 * read block so sequential small reads don't refetch it. One cursor per thread.
 */
class BlockCursor {
public:
    explicit BlockCursor(const BlockReader& reader) : reader_(reader) {}

    // Copies len bytes starting at byte offset into out.
    void readExact(uint64_t offset, uint8_t* out, size_t len);

private:
    const BlockLease& fetch(uint32_t blknum);

    const BlockReader& reader_;
    uint32_t cached_blknum_ = 0;
    BlockLease cached_block_;
};

} // namespace layer
} // namespace layerstore
