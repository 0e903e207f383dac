// include/layerstore/compression_utils.h
#pragma once

#include "types.h"

#include <vector>
#include <cstdint>
#include <cstddef>

// zstd's context types, kept out of the public headers.
struct ZSTD_CCtx_s;
struct ZSTD_DCtx_s;

namespace layerstore {

/**
 * @class ZstdCompressor
 * @brief Owns a zstd compression context. Not thread-safe; one per writer.
 */
class ZstdCompressor {
public:
    // level: 0 for default, zstd offers levels 1-22 (and negative fast levels).
    explicit ZstdCompressor(int level = 0);
    ~ZstdCompressor();

    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;
    ZstdCompressor(ZstdCompressor&& other) noexcept;
    ZstdCompressor& operator=(ZstdCompressor&& other) noexcept;

    // Produces a single frame that records its content size.
    // Throws storage::StorageError(COMPRESSION_ERROR) on failure.
    std::vector<uint8_t> compress(const uint8_t* data, size_t size);

    int level() const { return level_; }

private:
    ZSTD_CCtx_s* cctx_;
    int level_;
};

/**
 * @class ZstdDecompressor
 * @brief Owns a zstd decompression context. Stateless with respect to data
 * (no dictionary); cheap enough to create per lookup.
 */
class ZstdDecompressor {
public:
    ZstdDecompressor();
    ~ZstdDecompressor();

    ZstdDecompressor(const ZstdDecompressor&) = delete;
    ZstdDecompressor& operator=(const ZstdDecompressor&) = delete;

    // Decompresses one or more frames. The output size is taken from the frame
    // header when recorded, otherwise the input is streamed; no size hint is
    // needed. Throws storage::StorageError(COMPRESSION_ERROR) on failure.
    std::vector<uint8_t> decompress(const uint8_t* data, size_t size);

private:
    std::vector<uint8_t> decompressStreaming(const uint8_t* data, size_t size);

    ZSTD_DCtx_s* dctx_;
};

} // namespace layerstore
