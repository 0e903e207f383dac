// include/layerstore/layer/storage_layer.h
#pragma once

#include "../types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <utility>
#include <vector>

namespace layerstore {
namespace layer {

/**
 * @brief Data collected while reconstructing one key's value across layers.
 *
 * Layers are consulted from newest to oldest. Delta layers push WAL records;
 * the first layer that holds a full image sets `img` and ends the search.
 */
struct ValueReconstructState {
    std::vector<std::pair<Lsn, Bytes>> records;
    std::optional<std::pair<Lsn, Bytes>> img;
};

enum class ValueReconstructResult {
    Continue, // Keep going with older layers
    Complete, // Nothing more is needed
    Missing   // The key does not exist at the requested LSN in this layer's range
};

// One stored version of a key, as produced by a full scan.
struct LayerEntry {
    Key key;
    Lsn lsn = 0;
    Bytes value;
};

/**
 * @class LayerIterator
 * @brief Cursor over a layer's entries in key order. peek() is empty once
 * the end is reached.
 */
class LayerIterator {
public:
    virtual ~LayerIterator() = default;

    virtual const std::optional<LayerEntry>& peek() const = 0;

    // Moves to the next entry. Returns false at the end.
    virtual bool advance() = 0;
};

/**
 * @class Layer
 * @brief Interface the layer map and the reconstruction code use to treat
 * image and delta layers uniformly.
 */
class Layer {
public:
    virtual ~Layer() = default;

    virtual TenantId getTenantId() const = 0;
    virtual TimelineId getTimelineId() const = 0;

    virtual KeyRange getKeyRange() const = 0;
    // End bound is exclusive.
    virtual LsnRange getLsnRange() const = 0;

    // File name of the layer, without directory.
    virtual std::filesystem::path filename() const = 0;
    // Full path, if the layer is backed by a file.
    virtual std::optional<std::filesystem::path> localPath() const = 0;

    /**
     * @brief Collects what this layer knows about `key` into `state`.
     *
     * @param key Must lie within getKeyRange().
     * @param lsn_range LSNs of interest. Both bounds must be at or after the
     *                  start of getLsnRange().
     */
    virtual ValueReconstructResult getValueReconstructData(const Key& key,
                                                           const LsnRange& lsn_range,
                                                           ValueReconstructState& state) const = 0;

    // Iterates over all (key, lsn, value) entries in key order.
    virtual std::unique_ptr<LayerIterator> iter() const = 0;

    // Removes the backing file.
    virtual void deleteLayerFile() = 0;

    // True if the layer only holds changes on top of an older layer.
    virtual bool isIncremental() const = 0;
    virtual bool isInMemory() const = 0;

    virtual void dump(bool verbose, std::ostream& out) const = 0;
};

} // namespace layer
} // namespace layerstore
