// include/layerstore/layer/blob_io.h
#pragma once

#include "block_io.h"
#include "../types.h"

#include <fstream>
#include <string>
#include <cstdint>

namespace layerstore {
namespace layer {

// Blob header: lengths below 0x80 take one byte. Longer ones take four
// big-endian bytes with the top bit set, so the length is capped at 2^31-1.
static constexpr size_t BLOB_SHORT_LEN_LIMIT = 0x80;
static constexpr uint32_t BLOB_MAX_LEN = 0x7FFFFFFF;

/**
 * @class BlobWriter
 * @brief Appends length-prefixed blobs to a file opened for writing.
 *
 * The stream must already be positioned at start_offset; the writer then
 * tracks the logical end offset itself.
 */
class BlobWriter {
public:
    BlobWriter(std::ofstream file, uint64_t start_offset, std::string path);

    BlobWriter(const BlobWriter&) = delete;
    BlobWriter& operator=(const BlobWriter&) = delete;

    // Returns the byte offset at which the blob (its header) starts.
    uint64_t writeBlob(const uint8_t* data, size_t len);

    // Byte offset one past the last blob written.
    uint64_t size() const { return offset_; }

    std::ofstream& file() { return file_; }
    const std::string& path() const { return path_; }

private:
    void writeAll(const uint8_t* data, size_t len);

    std::ofstream file_;
    uint64_t offset_;
    std::string path_;
};

// Reads the blob whose header starts at byte offset.
// Throws STORAGE_CORRUPTION on a malformed header.
Bytes readBlob(BlockCursor& cursor, uint64_t offset);

} // namespace layer
} // namespace layerstore
