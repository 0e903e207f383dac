// include/layerstore/layer/image_layer.h
#pragma once

/*
 * An image layer is a snapshot of a key range at one particular LSN. It holds
 * an image of every key-value pair in its range; a key that falls into the
 * range but is not in the layer does not exist at that LSN.
 *
 * File layout (block = PAGE_SZ bytes):
 *
 *   block 0                     Summary
 *   block 1 .. index_start-1    values: length-prefixed blobs, in key order,
 *                               each zstd-compressed or raw
 *   block index_start .. EOF    index: B-tree from key to BlobRef, root at
 *                               index_root_blk within the index region
 *
 * Image layers do not use a compression dictionary.
 */

#include "storage_layer.h"
#include "filename.h"
#include "block_io.h"
#include "blob_io.h"
#include "disk_btree.h"
#include "../types.h"
#include "../config.h"
#include "../compression_utils.h"

#include <array>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace layerstore {
namespace layer {

/**
 * @struct Summary
 * @brief Fixed-layout header stored at the start of block 0.
 *
 * Serialized big-endian in declaration order (88 bytes).
 */
struct Summary {
    uint16_t magic = IMAGE_FILE_MAGIC;
    uint16_t format_version = STORAGE_FORMAT_VERSION;

    TenantId tenant_id;
    TimelineId timeline_id;
    KeyRange key_range;
    Lsn lsn = 0;

    // Block number where the index part of the file begins.
    uint32_t index_start_blk = 0;
    // Block within the index where the B-tree root is stored.
    uint32_t index_root_blk = 0;

    static constexpr size_t SERIALIZED_SIZE = 2 + 2 + ZId::SIZE * 2 + KEY_SIZE * 2 + 8 + 4 + 4;

    std::array<uint8_t, SERIALIZED_SIZE> serialize() const;

    // Throws IO_READ_ERROR if len < SERIALIZED_SIZE. Does not validate fields.
    static Summary deserialize(const uint8_t* buf, size_t len);

    std::string toString() const;

    bool operator==(const Summary& other) const;
    bool operator!=(const Summary& other) const { return !(*this == other); }
};

/**
 * @class BlobRef
 * @brief Reference to a value blob: byte position in the upper 63 bits, the
 * low bit set when the blob is compressed.
 */
class BlobRef {
public:
    static constexpr uint64_t COMPRESSED_FLAG = 1;

    explicit BlobRef(uint64_t raw) : raw_(raw) {}

    static BlobRef make(uint64_t pos, bool compressed) {
        uint64_t raw = pos << 1;
        if (compressed) {
            raw |= COMPRESSED_FLAG;
        }
        return BlobRef(raw);
    }

    uint64_t pos() const { return raw_ >> 1; }
    bool compressed() const { return (raw_ & COMPRESSED_FLAG) != 0; }
    uint64_t raw() const { return raw_; }

private:
    uint64_t raw_;
};

/**
 * @brief Lazily loaded part of an ImageLayer, guarded by its shared_mutex.
 */
struct ImageLayerInner {
    // If false, the summary has not been read and validated yet.
    bool loaded = false;

    // Copied from the summary
    uint32_t index_start_blk = 0;
    uint32_t index_root_blk = 0;

    // Reader for the file. Null until first loaded. Shared so iterators can
    // outlive a reset of the handle.
    std::shared_ptr<FileBlockReader> file;
};

/**
 * @class ImageLayer
 * @brief In-memory handle for one image layer file.
 *
 * Cheap to construct: nothing is read until the first query, which opens the
 * file and validates its summary. Any number of threads may query one handle
 * concurrently.
 */
class ImageLayer : public Layer {
    friend class ImageLayerWriter;

public:
    struct IndexLocation {
        uint32_t index_start_blk = 0;
        uint32_t index_root_blk = 0;

        bool operator==(const IndexLocation& other) const {
            return index_start_blk == other.index_start_blk && index_root_blk == other.index_root_blk;
        }
    };

    // A layer file found in a timeline directory. Its summary must match
    // this identity exactly when loaded.
    ImageLayer(LayerStoreConfigPtr conf,
               const TimelineId& timeline_id,
               const TenantId& tenant_id,
               const ImageFileName& fname);

    // A layer file at an arbitrary path, identity taken from its summary.
    // Used by inspection tooling; a file name that disagrees with the
    // summary is only warned about.
    static std::unique_ptr<ImageLayer> newForPath(const std::filesystem::path& path);

    ImageLayer(const ImageLayer&) = delete;
    ImageLayer& operator=(const ImageLayer&) = delete;

    // --- Layer interface ---
    TenantId getTenantId() const override { return tenant_id_; }
    TimelineId getTimelineId() const override { return timeline_id_; }
    KeyRange getKeyRange() const override { return key_range_; }
    LsnRange getLsnRange() const override { return LsnRange{lsn_, lsn_ + 1}; }
    std::filesystem::path filename() const override;
    std::optional<std::filesystem::path> localPath() const override { return path(); }

    ValueReconstructResult getValueReconstructData(const Key& key,
                                                   const LsnRange& lsn_range,
                                                   ValueReconstructState& state) const override;

    std::unique_ptr<LayerIterator> iter() const override;

    // Removes the file and drops the open handle; later reads fail with
    // FILE_NOT_FOUND.
    void deleteLayerFile() override;

    bool isIncremental() const override { return false; }
    bool isInMemory() const override { return false; }

    void dump(bool verbose, std::ostream& out) const override;

    // --- ImageLayer specific ---
    Lsn getLsn() const { return lsn_; }
    LayerOrigin origin() const { return path_or_conf_.origin; }

    // Path to the layer file.
    std::filesystem::path path() const;

    // Loads the layer if needed.
    IndexLocation indexLocation() const;

    // Does not trigger a load.
    bool isLoaded() const;

private:
    ImageLayer(PathOrConf path_or_conf,
               const TenantId& tenant_id,
               const TimelineId& timeline_id,
               const KeyRange& key_range,
               Lsn lsn);

    static std::filesystem::path pathFor(const PathOrConf& path_or_conf,
                                         const TimelineId& timeline_id,
                                         const TenantId& tenant_id,
                                         const ImageFileName& fname);

    ImageFileName layerName() const;
    Summary expectedSummary() const;

    // Opens the file and reads the summary unless already done. Returns with
    // the inner state locked in shared mode and loaded.
    std::shared_lock<std::shared_mutex> load() const;
    void loadInner(ImageLayerInner& inner) const;

    PathOrConf path_or_conf_;
    TenantId tenant_id_;
    TimelineId timeline_id_;
    KeyRange key_range_;

    // This layer holds an image of all keys in its range as of this LSN.
    Lsn lsn_;

    mutable std::shared_mutex inner_mutex_;
    mutable ImageLayerInner inner_;
};

/**
 * @class ImageLayerWriter
 * @brief Builds a new image layer file.
 *
 * Usage:
 *   1. Construct the writer.
 *   2. Call putImage() for every key-value pair in the key range, in
 *      increasing key order.
 *   3. Call finish() to get the ImageLayer handle.
 *
 * A key outside the declared range, or any I/O failure, closes the writer:
 * every later call throws LAYER_WRITER_CLOSED. A writer destroyed before a
 * successful finish() removes its partial file.
 */
class ImageLayerWriter {
public:
    // Creates (or truncates) the layer file in the timeline directory.
    ImageLayerWriter(LayerStoreConfigPtr conf,
                     const TimelineId& timeline_id,
                     const TenantId& tenant_id,
                     const KeyRange& key_range,
                     Lsn lsn);
    ~ImageLayerWriter();

    ImageLayerWriter(const ImageLayerWriter&) = delete;
    ImageLayerWriter& operator=(const ImageLayerWriter&) = delete;

    // Keys must be strictly increasing across calls.
    void putImage(const Key& key, const uint8_t* img, size_t len);
    void putImage(const Key& key, const Bytes& img) { putImage(key, img.data(), img.size()); }

    // Writes the index and the summary and hands back an unloaded layer.
    std::unique_ptr<ImageLayer> finish();

    const std::filesystem::path& path() const { return path_; }
    uint64_t numValues() const { return tree_.numEntries(); }
    bool isFinished() const { return finished_; }
    bool isClosed() const { return finished_ || poisoned_; }

private:
    void ensureWritable() const;

    LayerStoreConfigPtr conf_;
    std::filesystem::path path_;
    TimelineId timeline_id_;
    TenantId tenant_id_;
    KeyRange key_range_;
    Lsn lsn_;

    std::unique_ptr<BlobWriter> blob_writer_;
    DiskBtreeBuilder tree_;
    std::optional<ZstdCompressor> compressor_;

    bool finished_ = false;
    bool poisoned_ = false;
};

} // namespace layer
} // namespace layerstore
