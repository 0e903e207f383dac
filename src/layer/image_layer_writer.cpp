// src/layer/image_layer_writer.cpp
#include "layerstore/layer/image_layer.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace layerstore {
namespace layer {

ImageLayerWriter::ImageLayerWriter(LayerStoreConfigPtr conf,
                                   const TimelineId& timeline_id,
                                   const TenantId& tenant_id,
                                   const KeyRange& key_range,
                                   Lsn lsn)
    : conf_(std::move(conf)),
      timeline_id_(timeline_id),
      tenant_id_(tenant_id),
      key_range_(key_range),
      lsn_(lsn),
      tree_(KEY_SIZE) {
    if (!conf_) {
        throw STORAGE_ERROR(storage::ErrorCode::STORAGE_NOT_INITIALIZED, "ImageLayerWriter requires a config.");
    }

    const fs::path timeline_dir = conf_->timelinePath(timeline_id_, tenant_id_);
    path_ = timeline_dir / ImageFileName{key_range_, lsn_}.toString();

    if (conf_->image_compression == CompressionType::ZSTD) {
        compressor_.emplace(conf_->image_compression_level);
    }

    std::error_code ec;
    fs::create_directories(timeline_dir, ec);
    if (ec) {
        throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to create timeline directory.")
            .withFilePath(timeline_dir.string())
            .withDetails(ec.message());
    }

    std::ofstream file(path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to create layer file.")
            .withFilePath(path_.string());
    }
    // Leave block 0 for the summary; it is written last.
    file.seekp(static_cast<std::streamoff>(PAGE_SZ), std::ios::beg);
    if (!file) {
        file.close();
        fs::remove(path_, ec);
        throw storage::StorageError(storage::ErrorCode::IO_SEEK_ERROR, "Failed to seek past summary block.")
            .withFilePath(path_.string());
    }
    blob_writer_ = std::make_unique<BlobWriter>(std::move(file), PAGE_SZ, path_.string());

    LOG_INFO("[ImageLayerWriter] New image layer ", path_);
}

ImageLayerWriter::~ImageLayerWriter() {
    if (finished_) {
        return;
    }
    if (blob_writer_ && blob_writer_->file().is_open()) {
        blob_writer_->file().close();
    }
    std::error_code ec;
    if (fs::remove(path_, ec)) {
        LOG_WARN("[ImageLayerWriter] Removed unfinished layer file ", path_);
    } else if (ec) {
        LOG_ERROR("[ImageLayerWriter] Failed to remove unfinished layer file ", path_, ": ", ec.message());
    }
}

void ImageLayerWriter::ensureWritable() const {
    if (finished_ || poisoned_) {
        throw storage::StorageError(storage::ErrorCode::LAYER_WRITER_CLOSED,
                                    finished_ ? "Layer writer already finished." : "Layer writer failed earlier.")
            .withFilePath(path_.string());
    }
}

void ImageLayerWriter::putImage(const Key& key, const uint8_t* img, size_t len) {
    ensureWritable();

    if (!key_range_.contains(key)) {
        poisoned_ = true;
        throw storage::StorageError(storage::ErrorCode::LAYER_KEY_OUT_OF_RANGE, "Key outside the layer's key range.")
            .withFilePath(path_.string())
            .withContext("key", key.toString())
            .withContext("key_range", key_range_.start.toString() + "-" + key_range_.end.toString());
    }

    try {
        const uint8_t* content = img;
        size_t content_len = len;
        bool compressed = false;

        std::vector<uint8_t> compressed_buf;
        if (compressor_) {
            compressed_buf = compressor_->compress(img, len);
            // Only keep it if it actually saved space.
            if (compressed_buf.size() < len) {
                content = compressed_buf.data();
                content_len = compressed_buf.size();
                compressed = true;
            }
        }

        const uint64_t off = blob_writer_->writeBlob(content, content_len);
        const BlobRef ref = BlobRef::make(off, compressed);

        const auto keybuf = key.toBytes();
        tree_.append(keybuf.data(), ref.raw());
    } catch (...) {
        poisoned_ = true;
        throw;
    }
}

std::unique_ptr<ImageLayer> ImageLayerWriter::finish() {
    ensureWritable();

    try {
        const uint32_t index_start_blk =
            static_cast<uint32_t>((blob_writer_->size() + PAGE_SZ - 1) / PAGE_SZ);

        std::ofstream& file = blob_writer_->file();
        file.seekp(static_cast<std::streamoff>(index_start_blk) * PAGE_SZ, std::ios::beg);
        if (!file) {
            throw storage::StorageError(storage::ErrorCode::IO_SEEK_ERROR, "Failed to seek to index start.")
                .withFilePath(path_.string())
                .withContext("index_start_blk", std::to_string(index_start_blk));
        }

        auto [index_root_blk, block_buf] = tree_.finish();
        for (const BlockLease& blk : block_buf.blocks()) {
            file.write(reinterpret_cast<const char*>(blk->data()), static_cast<std::streamsize>(blk->size()));
            if (!file) {
                throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to write index block.")
                    .withFilePath(path_.string());
            }
        }

        Summary summary;
        summary.tenant_id = tenant_id_;
        summary.timeline_id = timeline_id_;
        summary.key_range = key_range_;
        summary.lsn = lsn_;
        summary.index_start_blk = index_start_blk;
        summary.index_root_blk = index_root_blk;

        const auto summary_buf = summary.serialize();
        file.seekp(0, std::ios::beg);
        file.write(reinterpret_cast<const char*>(summary_buf.data()), static_cast<std::streamsize>(summary_buf.size()));
        if (!file) {
            throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to write summary.")
                .withFilePath(path_.string());
        }

        file.flush();
        if (!file) {
            throw storage::StorageError(storage::ErrorCode::IO_FLUSH_ERROR, "Failed to flush layer file.")
                .withFilePath(path_.string());
        }
        file.close();
        if (file.fail()) {
            throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to close layer file.")
                .withFilePath(path_.string());
        }

        LOG_DEBUG(1, "[ImageLayerWriter] Finished ", path_, ": ", tree_.numEntries(), " values, ",
                  block_buf.size(), " index blocks, ", summary.toString());
    } catch (...) {
        poisoned_ = true;
        throw;
    }

    finished_ = true;

    // The handle starts unloaded; the summary is re-read and checked on first use.
    auto layer = std::unique_ptr<ImageLayer>(new ImageLayer(PathOrConf::fromConf(conf_),
                                                            tenant_id_,
                                                            timeline_id_,
                                                            key_range_,
                                                            lsn_));
    LOG_TRACE("[ImageLayerWriter] Created image layer ", layer->path());
    return layer;
}

} // namespace layer
} // namespace layerstore
