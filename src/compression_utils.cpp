// src/compression_utils.cpp
#include "layerstore/compression_utils.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <zstd.h>
#include <string>
#include <utility>

namespace layerstore {

namespace {
    // Sanity bound on a single decompressed value; a larger declared size means
    // the frame header is garbage.
    constexpr unsigned long long MAX_DECOMPRESSED_SIZE = 1ULL << 31;

    storage::StorageError zstdError(const std::string& op, size_t code) {
        return STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, op + " failed")
            .withDetails(ZSTD_getErrorName(code));
    }
} // end anonymous namespace

// --- ZstdCompressor ---

ZstdCompressor::ZstdCompressor(int level)
    : cctx_(ZSTD_createCCtx()), level_(level == 0 ? ZSTD_CLEVEL_DEFAULT : level) {
    if (!cctx_) {
        throw STORAGE_ERROR(storage::ErrorCode::OUT_OF_MEMORY, "ZSTD_createCCtx failed");
    }
}

ZstdCompressor::~ZstdCompressor() {
    ZSTD_freeCCtx(cctx_);
}

ZstdCompressor::ZstdCompressor(ZstdCompressor&& other) noexcept
    : cctx_(other.cctx_), level_(other.level_) {
    other.cctx_ = nullptr;
}

ZstdCompressor& ZstdCompressor::operator=(ZstdCompressor&& other) noexcept {
    if (this != &other) {
        ZSTD_freeCCtx(cctx_);
        cctx_ = other.cctx_;
        level_ = other.level_;
        other.cctx_ = nullptr;
    }
    return *this;
}

std::vector<uint8_t> ZstdCompressor::compress(const uint8_t* data, size_t size) {
    size_t const bound = ZSTD_compressBound(size);
    std::vector<uint8_t> out(bound);

    LOG_TRACE("[ZstdCompressor::compress] Uncompressed size: ", size, ", Level: ", level_);
    size_t const c_size = ZSTD_compressCCtx(cctx_, out.data(), bound, data, size, level_);
    if (ZSTD_isError(c_size)) {
        LOG_ERROR("[ZstdCompressor::compress] ZSTD_compressCCtx failed: ", ZSTD_getErrorName(c_size));
        throw zstdError("ZSTD_compressCCtx", c_size);
    }
    out.resize(c_size);
    return out;
}

// --- ZstdDecompressor ---

ZstdDecompressor::ZstdDecompressor() : dctx_(ZSTD_createDCtx()) {
    if (!dctx_) {
        throw STORAGE_ERROR(storage::ErrorCode::OUT_OF_MEMORY, "ZSTD_createDCtx failed");
    }
}

ZstdDecompressor::~ZstdDecompressor() {
    ZSTD_freeDCtx(dctx_);
}

std::vector<uint8_t> ZstdDecompressor::decompress(const uint8_t* data, size_t size) {
    unsigned long long const content_size = ZSTD_getFrameContentSize(data, size);
    if (content_size == ZSTD_CONTENTSIZE_ERROR) {
        throw STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Input is not a zstd frame")
            .withContext("compressed_size", std::to_string(size));
    }
    if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
        return decompressStreaming(data, size);
    }
    if (content_size > MAX_DECOMPRESSED_SIZE) {
        throw STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Declared frame content size is implausible")
            .withContext("content_size", std::to_string(content_size));
    }

    std::vector<uint8_t> out(static_cast<size_t>(content_size));
    size_t const d_size = ZSTD_decompressDCtx(dctx_, out.data(), out.size(), data, size);
    if (ZSTD_isError(d_size)) {
        LOG_ERROR("[ZstdDecompressor::decompress] ZSTD_decompressDCtx failed: ", ZSTD_getErrorName(d_size));
        throw zstdError("ZSTD_decompressDCtx", d_size);
    }
    if (d_size != out.size()) {
        throw STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Decompressed size does not match frame header")
            .withContext("expected", std::to_string(out.size()))
            .withContext("actual", std::to_string(d_size));
    }
    return out;
}

std::vector<uint8_t> ZstdDecompressor::decompressStreaming(const uint8_t* data, size_t size) {
    size_t const reset = ZSTD_DCtx_reset(dctx_, ZSTD_reset_session_only);
    if (ZSTD_isError(reset)) {
        throw zstdError("ZSTD_DCtx_reset", reset);
    }

    std::vector<uint8_t> out;
    std::vector<uint8_t> chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer input{data, size, 0};
    size_t last_ret = 0;

    while (input.pos < input.size) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        last_ret = ZSTD_decompressStream(dctx_, &output, &input);
        if (ZSTD_isError(last_ret)) {
            throw zstdError("ZSTD_decompressStream", last_ret);
        }
        out.insert(out.end(), chunk.data(), chunk.data() + output.pos);
        if (out.size() > MAX_DECOMPRESSED_SIZE) {
            throw STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Decompressed stream exceeds size limit");
        }
    }
    // Flush whatever the decoder still buffers once all input is consumed.
    while (last_ret != 0) {
        ZSTD_outBuffer output{chunk.data(), chunk.size(), 0};
        last_ret = ZSTD_decompressStream(dctx_, &output, &input);
        if (ZSTD_isError(last_ret)) {
            throw zstdError("ZSTD_decompressStream", last_ret);
        }
        if (output.pos == 0) {
            throw STORAGE_ERROR(storage::ErrorCode::COMPRESSION_ERROR, "Truncated zstd frame");
        }
        out.insert(out.end(), chunk.data(), chunk.data() + output.pos);
    }
    return out;
}

} // namespace layerstore
