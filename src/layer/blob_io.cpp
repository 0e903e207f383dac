// src/layer/blob_io.cpp
#include "layerstore/layer/blob_io.h"
#include "layerstore/storage_error/error_utils.h"

#include <algorithm>
#include <utility>

namespace layerstore {
namespace layer {

BlobWriter::BlobWriter(std::ofstream file, uint64_t start_offset, std::string path)
    : file_(std::move(file)), offset_(start_offset), path_(std::move(path)) {
}

void BlobWriter::writeAll(const uint8_t* data, size_t len) {
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!file_) {
        throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to write blob data.")
            .withFilePath(path_)
            .withContext("offset", std::to_string(offset_))
            .withContext("len", std::to_string(len));
    }
    offset_ += len;
}

uint64_t BlobWriter::writeBlob(const uint8_t* data, size_t len) {
    if (len > BLOB_MAX_LEN) {
        throw storage::StorageError(storage::ErrorCode::INVALID_VALUE, "Blob too large.")
            .withFilePath(path_)
            .withContext("len", std::to_string(len));
    }

    const uint64_t blob_offset = offset_;
    if (len < BLOB_SHORT_LEN_LIMIT) {
        uint8_t header = static_cast<uint8_t>(len);
        writeAll(&header, 1);
    } else {
        uint8_t header[4];
        putU32BE(header, static_cast<uint32_t>(len) | 0x80000000U);
        writeAll(header, sizeof(header));
    }
    if (len > 0) {
        writeAll(data, len);
    }
    return blob_offset;
}

Bytes readBlob(BlockCursor& cursor, uint64_t offset) {
    uint8_t first = 0;
    cursor.readExact(offset, &first, 1);

    uint64_t body_offset;
    size_t len;
    if ((first & 0x80) == 0) {
        len = first;
        body_offset = offset + 1;
    } else {
        uint8_t header[4];
        cursor.readExact(offset, header, sizeof(header));
        header[0] &= 0x7F;
        len = getU32BE(header);
        body_offset = offset + 4;
        if (len < BLOB_SHORT_LEN_LIMIT) {
            // A writer never uses the long form for short blobs.
            throw storage::StorageError::corruption("Long blob header encodes a short length.")
                .withContext("offset", std::to_string(offset))
                .withContext("len", std::to_string(len));
        }
    }

    // The length comes from disk. Grow the buffer one block at a time so a
    // corrupt header fails on the short read instead of the allocation.
    Bytes buf;
    size_t done = 0;
    while (done < len) {
        const size_t n = std::min(len - done, PAGE_SZ);
        buf.resize(done + n);
        cursor.readExact(body_offset + done, buf.data() + done, n);
        done += n;
    }
    return buf;
}

} // namespace layer
} // namespace layerstore
