// src/layer/image_layer.cpp
#include "layerstore/layer/image_layer.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <algorithm>
#include <cassert>
#include <sstream>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace layerstore {
namespace layer {

namespace {
    // Scans the index once up front and reads each value only when the
    // cursor reaches it. Holds its own reference to the file, so it stays
    // valid even if the layer handle is reset or destroyed.
    class ImageLayerIterator : public LayerIterator {
    public:
        ImageLayerIterator(std::shared_ptr<FileBlockReader> file,
                           Lsn lsn,
                           std::vector<std::pair<Key, BlobRef>> refs)
            : file_(std::move(file)), cursor_(*file_), lsn_(lsn), refs_(std::move(refs)) {
            advance(); // Prime the first entry
        }

        const std::optional<LayerEntry>& peek() const override { return current_; }

        bool advance() override {
            if (next_idx_ >= refs_.size()) {
                current_.reset();
                return false;
            }
            const auto& [key, ref] = refs_[next_idx_++];

            Bytes value;
            try {
                value = readBlob(cursor_, ref.pos());
                if (ref.compressed()) {
                    value = decompressor_.decompress(value.data(), value.size());
                }
            } catch (storage::StorageError& e) {
                e.withFilePath(file_->path())
                    .withContext("key", key.toString())
                    .withContext("offset", std::to_string(ref.pos()));
                throw;
            }
            current_ = LayerEntry{key, lsn_, std::move(value)};
            return true;
        }

    private:
        std::shared_ptr<FileBlockReader> file_;
        BlockCursor cursor_;
        ZstdDecompressor decompressor_;
        Lsn lsn_;
        std::vector<std::pair<Key, BlobRef>> refs_;
        size_t next_idx_ = 0;
        std::optional<LayerEntry> current_;
    };
} // end anonymous namespace

// --- Summary ---

std::array<uint8_t, Summary::SERIALIZED_SIZE> Summary::serialize() const {
    std::array<uint8_t, SERIALIZED_SIZE> buf{};
    uint8_t* p = buf.data();

    putU16BE(p, magic);
    p += 2;
    putU16BE(p, format_version);
    p += 2;
    std::copy(tenant_id.bytes().begin(), tenant_id.bytes().end(), p);
    p += ZId::SIZE;
    std::copy(timeline_id.bytes().begin(), timeline_id.bytes().end(), p);
    p += ZId::SIZE;
    key_range.start.writeToByteSlice(p);
    p += KEY_SIZE;
    key_range.end.writeToByteSlice(p);
    p += KEY_SIZE;
    putU64BE(p, lsn);
    p += 8;
    putU32BE(p, index_start_blk);
    p += 4;
    putU32BE(p, index_root_blk);
    return buf;
}

Summary Summary::deserialize(const uint8_t* buf, size_t len) {
    if (len < SERIALIZED_SIZE) {
        throw storage::StorageError(storage::ErrorCode::IO_READ_ERROR, "Summary block is truncated.")
            .withContext("expected_len", std::to_string(SERIALIZED_SIZE))
            .withContext("actual_len", std::to_string(len));
    }

    Summary s;
    const uint8_t* p = buf;
    s.magic = getU16BE(p);
    p += 2;
    s.format_version = getU16BE(p);
    p += 2;

    std::array<uint8_t, ZId::SIZE> id{};
    std::copy(p, p + ZId::SIZE, id.begin());
    s.tenant_id = TenantId(id);
    p += ZId::SIZE;
    std::copy(p, p + ZId::SIZE, id.begin());
    s.timeline_id = TimelineId(id);
    p += ZId::SIZE;

    s.key_range.start = Key::fromSlice(p);
    p += KEY_SIZE;
    s.key_range.end = Key::fromSlice(p);
    p += KEY_SIZE;
    s.lsn = getU64BE(p);
    p += 8;
    s.index_start_blk = getU32BE(p);
    p += 4;
    s.index_root_blk = getU32BE(p);
    return s;
}

std::string Summary::toString() const {
    std::ostringstream oss;
    oss << "Summary { magic: 0x" << std::hex << magic << std::dec
        << ", format_version: " << format_version
        << ", tenant_id: " << tenant_id
        << ", timeline_id: " << timeline_id
        << ", key_range: " << key_range.start << ".." << key_range.end
        << ", lsn: " << lsnToString(lsn)
        << ", index_start_blk: " << index_start_blk
        << ", index_root_blk: " << index_root_blk << " }";
    return oss.str();
}

bool Summary::operator==(const Summary& other) const {
    return magic == other.magic &&
           format_version == other.format_version &&
           tenant_id == other.tenant_id &&
           timeline_id == other.timeline_id &&
           key_range == other.key_range &&
           lsn == other.lsn &&
           index_start_blk == other.index_start_blk &&
           index_root_blk == other.index_root_blk;
}

// --- ImageLayer ---

ImageLayer::ImageLayer(LayerStoreConfigPtr conf,
                       const TimelineId& timeline_id,
                       const TenantId& tenant_id,
                       const ImageFileName& fname)
    : ImageLayer(PathOrConf::fromConf(std::move(conf)), tenant_id, timeline_id, fname.key_range, fname.lsn) {
}

ImageLayer::ImageLayer(PathOrConf path_or_conf,
                       const TenantId& tenant_id,
                       const TimelineId& timeline_id,
                       const KeyRange& key_range,
                       Lsn lsn)
    : path_or_conf_(std::move(path_or_conf)),
      tenant_id_(tenant_id),
      timeline_id_(timeline_id),
      key_range_(key_range),
      lsn_(lsn) {
    if (path_or_conf_.origin == LayerOrigin::FromConfig && !path_or_conf_.conf) {
        throw STORAGE_ERROR(storage::ErrorCode::STORAGE_NOT_INITIALIZED, "ImageLayer requires a config.");
    }
}

std::unique_ptr<ImageLayer> ImageLayer::newForPath(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw storage::StorageError::fileNotFound(path.string());
    }
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        throw storage::StorageError::ioError("open layer file", path.string());
    }

    std::vector<uint8_t> buf(PAGE_SZ);
    in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    const size_t got = static_cast<size_t>(in.gcount());

    Summary summary;
    try {
        summary = Summary::deserialize(buf.data(), got);
    } catch (storage::StorageError& e) {
        e.withFilePath(path.string());
        throw;
    }

    LOG_TRACE("[ImageLayer] Opening by path ", path, ": ", summary.toString());
    return std::unique_ptr<ImageLayer>(new ImageLayer(PathOrConf::fromPath(path),
                                                      summary.tenant_id,
                                                      summary.timeline_id,
                                                      summary.key_range,
                                                      summary.lsn));
}

fs::path ImageLayer::pathFor(const PathOrConf& path_or_conf,
                             const TimelineId& timeline_id,
                             const TenantId& tenant_id,
                             const ImageFileName& fname) {
    switch (path_or_conf.origin) {
        case LayerOrigin::FromPath:
            return path_or_conf.path;
        case LayerOrigin::FromConfig:
            return path_or_conf.conf->timelinePath(timeline_id, tenant_id) / fname.toString();
    }
    throw STORAGE_ERROR(storage::ErrorCode::INTERNAL_ERROR, "Unknown layer origin.");
}

ImageFileName ImageLayer::layerName() const {
    return ImageFileName{key_range_, lsn_};
}

fs::path ImageLayer::filename() const {
    return fs::path(layerName().toString());
}

fs::path ImageLayer::path() const {
    return pathFor(path_or_conf_, timeline_id_, tenant_id_, layerName());
}

Summary ImageLayer::expectedSummary() const {
    Summary s;
    s.tenant_id = tenant_id_;
    s.timeline_id = timeline_id_;
    s.key_range = key_range_;
    s.lsn = lsn_;
    return s;
}

std::shared_lock<std::shared_mutex> ImageLayer::load() const {
    for (;;) {
        // Quick exit if already loaded
        std::shared_lock<std::shared_mutex> read_guard(inner_mutex_);
        if (inner_.loaded) {
            return read_guard;
        }
        read_guard.unlock();

        {
            std::unique_lock<std::shared_mutex> write_guard(inner_mutex_);
            // Another thread may have loaded it while we waited.
            if (!inner_.loaded) {
                try {
                    loadInner(inner_);
                } catch (storage::StorageError& e) {
                    e.withContext("layer", path().string());
                    LOG_ERROR("[ImageLayer] Failed to load ", path(), ": ", e.toString());
                    throw;
                }
            }
        }
        // A unique_lock cannot be downgraded; loop to retake it shared. The
        // layer may have been reset in between, in which case we load again.
    }
}

void ImageLayer::loadInner(ImageLayerInner& inner) const {
    const fs::path file_path = path();

    // Open the file if it's not open already.
    if (!inner.file) {
        inner.file = std::make_shared<FileBlockReader>(file_path.string());
    }

    BlockLease summary_blk = inner.file->readBlk(0);
    Summary actual = Summary::deserialize(summary_blk->data(), summary_blk->size());

    if (actual.magic != IMAGE_FILE_MAGIC) {
        std::ostringstream oss;
        oss << "0x" << std::hex << actual.magic;
        throw storage::StorageError(storage::ErrorCode::INVALID_DATA_FORMAT, "Not an image layer file.")
            .withFilePath(file_path.string())
            .withContext("magic", oss.str());
    }
    if (actual.format_version != STORAGE_FORMAT_VERSION) {
        throw storage::StorageError(storage::ErrorCode::STORAGE_VERSION_MISMATCH, "Unsupported layer file format version.")
            .withFilePath(file_path.string())
            .withContext("expected", std::to_string(STORAGE_FORMAT_VERSION))
            .withContext("actual", std::to_string(actual.format_version));
    }

    switch (path_or_conf_.origin) {
        case LayerOrigin::FromConfig: {
            Summary expected = expectedSummary();
            // The index location is only known from the file itself.
            expected.index_start_blk = actual.index_start_blk;
            expected.index_root_blk = actual.index_root_blk;
            if (actual != expected) {
                throw storage::StorageError(storage::ErrorCode::LAYER_SUMMARY_MISMATCH,
                                            "Layer file summary does not match the layer.")
                    .withFilePath(file_path.string())
                    .withContext("actual", actual.toString())
                    .withContext("expected", expected.toString());
            }
            break;
        }
        case LayerOrigin::FromPath: {
            const std::string actual_filename = file_path.filename().string();
            const std::string expected_filename = filename().string();
            if (actual_filename != expected_filename) {
                LOG_WARN("[ImageLayer] Filename ", actual_filename, " does not match what is expected from in-file summary");
                LOG_WARN("[ImageLayer] actual: ", actual_filename, " expected: ", expected_filename);
            }
            break;
        }
    }

    inner.index_start_blk = actual.index_start_blk;
    inner.index_root_blk = actual.index_root_blk;
    inner.loaded = true;
    LOG_TRACE("[ImageLayer] Loaded ", file_path, " index_start_blk=", inner.index_start_blk,
              " index_root_blk=", inner.index_root_blk);
}

bool ImageLayer::isLoaded() const {
    std::shared_lock<std::shared_mutex> guard(inner_mutex_);
    return inner_.loaded;
}

ImageLayer::IndexLocation ImageLayer::indexLocation() const {
    auto guard = load();
    return IndexLocation{inner_.index_start_blk, inner_.index_root_blk};
}

ValueReconstructResult ImageLayer::getValueReconstructData(const Key& key,
                                                           const LsnRange& lsn_range,
                                                           ValueReconstructState& state) const {
    assert(key_range_.contains(key));
    assert(lsn_range.start >= lsn_);
    assert(lsn_range.end >= lsn_);

    auto guard = load();

    const FileBlockReader& file = *inner_.file;
    DiskBtreeReader tree(inner_.index_start_blk, inner_.index_root_blk, file, KEY_SIZE);

    const auto keybuf = key.toBytes();
    std::optional<uint64_t> value = tree.get(keybuf.data());
    if (!value) {
        return ValueReconstructResult::Missing;
    }

    const BlobRef ref(*value);
    Bytes blob;
    try {
        BlockCursor cursor(file);
        blob = readBlob(cursor, ref.pos());
        if (ref.compressed()) {
            ZstdDecompressor decompressor;
            blob = decompressor.decompress(blob.data(), blob.size());
        }
    } catch (storage::StorageError& e) {
        e.withContext("operation", "read value from data file")
            .withFilePath(file.path())
            .withContext("key", key.toString())
            .withContext("offset", std::to_string(ref.pos()));
        throw;
    }

    state.img = std::make_pair(lsn_, std::move(blob));
    return ValueReconstructResult::Complete;
}

std::unique_ptr<LayerIterator> ImageLayer::iter() const {
    auto guard = load();

    DiskBtreeReader tree(inner_.index_start_blk, inner_.index_root_blk, *inner_.file, KEY_SIZE);
    std::vector<std::pair<Key, BlobRef>> refs;
    const auto start = Key::MIN.toBytes();
    tree.visit(start.data(), VisitDirection::Forwards, [&refs](const uint8_t* key, uint64_t value) {
        refs.emplace_back(Key::fromSlice(key), BlobRef(value));
        return true;
    });

    return std::make_unique<ImageLayerIterator>(inner_.file, lsn_, std::move(refs));
}

void ImageLayer::deleteLayerFile() {
    std::unique_lock<std::shared_mutex> write_guard(inner_mutex_);
    const fs::path file_path = path();

    std::error_code ec;
    const bool removed = fs::remove(file_path, ec);
    if (ec) {
        throw storage::StorageError(storage::ErrorCode::IO_WRITE_ERROR, "Failed to delete layer file.")
            .withFilePath(file_path.string())
            .withDetails(ec.message());
    }
    if (!removed) {
        throw storage::StorageError::fileNotFound(file_path.string())
            .withDetails("Layer file was already gone.");
    }

    // Drop the open handle so nothing reads through the unlinked file.
    inner_ = ImageLayerInner{};
    LOG_INFO("[ImageLayer] Deleted layer file ", file_path);
}

void ImageLayer::dump(bool verbose, std::ostream& out) const {
    out << "----- image layer for ten " << tenant_id_
        << " tli " << timeline_id_
        << " key " << key_range_.start << "-" << key_range_.end
        << " at " << lsnToString(lsn_) << " ----" << std::endl;

    if (!verbose) {
        return;
    }

    auto guard = load();
    DiskBtreeReader tree(inner_.index_start_blk, inner_.index_root_blk, *inner_.file, KEY_SIZE);
    tree.dump(out);

    const auto start = Key::MIN.toBytes();
    tree.visit(start.data(), VisitDirection::Forwards, [&out](const uint8_t* key, uint64_t value) {
        const BlobRef ref(value);
        out << "key: " << Key::fromSlice(key) << " offset " << ref.pos();
        if (ref.compressed()) {
            out << " (compressed)";
        }
        out << std::endl;
        return true;
    });
}

} // namespace layer
} // namespace layerstore
