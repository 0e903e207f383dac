// include/layerstore/layer/filename.h
#pragma once

#include "../types.h"
#include "../config.h"
#include "../storage_error/result.h"

#include <filesystem>
#include <ostream>
#include <string>

namespace layerstore {
namespace layer {

/**
 * @brief Name of an image layer file: <key_start>-<key_end>__<lsn>
 *
 * Keys are 36 uppercase hex digits, the LSN 16. Example:
 *   000000067F000032BE0000400000000070B6-000000067F000032BE0000400000000080B6__00000000346BC568
 */
struct ImageFileName {
    KeyRange key_range;
    Lsn lsn = 0;

    std::string toString() const;

    // Fails with INVALID_DATA_FORMAT for anything that is not an image layer name.
    static storage::Result<ImageFileName> parse(const std::string& fname);

    bool operator==(const ImageFileName& other) const {
        return key_range == other.key_range && lsn == other.lsn;
    }
    bool operator!=(const ImageFileName& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const ImageFileName& fname);

// How a layer handle came to exist, which decides how strictly its file is
// checked when loaded.
enum class LayerOrigin {
    FromConfig, // Found in a timeline directory; the name is trusted
    FromPath    // Opened by explicit path for inspection; the name is not
};

struct PathOrConf {
    LayerOrigin origin = LayerOrigin::FromConfig;
    LayerStoreConfigPtr conf;        // Set for FromConfig
    std::filesystem::path path;      // Set for FromPath

    static PathOrConf fromConf(LayerStoreConfigPtr conf) {
        PathOrConf p;
        p.origin = LayerOrigin::FromConfig;
        p.conf = std::move(conf);
        return p;
    }
    static PathOrConf fromPath(std::filesystem::path path) {
        PathOrConf p;
        p.origin = LayerOrigin::FromPath;
        p.path = std::move(path);
        return p;
    }
};

} // namespace layer
} // namespace layerstore
