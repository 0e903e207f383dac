// src/layer/block_io.cpp
#include "layerstore/layer/block_io.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace layerstore {
namespace layer {

// --- FileBlockReader ---

FileBlockReader::FileBlockReader(const std::string& path) : path_(path) {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw storage::StorageError::fileNotFound(path_)
            .withDetails("Layer file does not exist.");
    }

    file_.open(path_, std::ios::in | std::ios::binary);
    if (!file_.is_open()) {
        throw storage::StorageError::ioError("open for reading", path_);
    }

    file_.seekg(0, std::ios::end);
    std::streamoff size = file_.tellg();
    if (!file_ || size < 0) {
        throw storage::StorageError(storage::ErrorCode::IO_SEEK_ERROR, "Failed to determine file size.")
            .withFilePath(path_);
    }
    file_size_ = static_cast<uint64_t>(size);
    file_.seekg(0, std::ios::beg);
    LOG_TRACE("[FileBlockReader] Opened ", path_, " (", file_size_, " bytes)");
}

FileBlockReader::~FileBlockReader() {
    std::lock_guard<std::mutex> lock(file_mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

BlockLease FileBlockReader::readBlk(uint32_t blknum) const {
    const uint64_t offset = static_cast<uint64_t>(blknum) * PAGE_SZ;
    auto block = std::make_shared<Block>();

    std::lock_guard<std::mutex> lock(file_mutex_);
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_) {
        file_.clear();
        throw storage::StorageError(storage::ErrorCode::IO_SEEK_ERROR, "Failed to seek to block.")
            .withFilePath(path_)
            .withContext("blknum", std::to_string(blknum))
            .withContext("offset", std::to_string(offset));
    }

    file_.read(reinterpret_cast<char*>(block->data()), PAGE_SZ);
    std::streamsize bytes_read = file_.gcount();
    if (bytes_read != static_cast<std::streamsize>(PAGE_SZ)) {
        file_.clear();
        throw storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Short read of block.")
            .withFilePath(path_)
            .withContext("blknum", std::to_string(blknum))
            .withContext("offset", std::to_string(offset))
            .withContext("bytes_read", std::to_string(bytes_read))
            .withContext("file_size", std::to_string(file_size_));
    }
    return block;
}

// --- BlockBuf ---

uint32_t BlockBuf::writeBlk(const Block& block) {
    auto blknum = static_cast<uint32_t>(blocks_.size());
    blocks_.push_back(std::make_shared<const Block>(block));
    return blknum;
}

BlockLease BlockBuf::readBlk(uint32_t blknum) const {
    if (blknum >= blocks_.size()) {
        throw storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Block number past end of buffer.")
            .withContext("blknum", std::to_string(blknum))
            .withContext("num_blocks", std::to_string(blocks_.size()));
    }
    return blocks_[blknum];
}

// --- BlockCursor ---

const BlockLease& BlockCursor::fetch(uint32_t blknum) {
    if (!cached_block_ || cached_blknum_ != blknum) {
        cached_block_ = reader_.readBlk(blknum);
        cached_blknum_ = blknum;
    }
    return cached_block_;
}

void BlockCursor::readExact(uint64_t offset, uint8_t* out, size_t len) {
    while (len > 0) {
        auto blknum = static_cast<uint32_t>(offset / PAGE_SZ);
        size_t off_in_blk = static_cast<size_t>(offset % PAGE_SZ);
        size_t n = std::min(len, PAGE_SZ - off_in_blk);

        const BlockLease& block = fetch(blknum);
        std::memcpy(out, block->data() + off_in_blk, n);

        out += n;
        offset += n;
        len -= n;
    }
}

} // namespace layer
} // namespace layerstore
