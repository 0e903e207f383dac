// src/layer/filename.cpp
#include "layerstore/layer/filename.h"
#include "layerstore/storage_error/error_utils.h"

#include <iomanip>
#include <sstream>

namespace layerstore {
namespace layer {

namespace {
    constexpr size_t LSN_HEX_LEN = 16;

    storage::StorageError badName(const std::string& fname, const std::string& why) {
        return storage::StorageError(storage::ErrorCode::INVALID_DATA_FORMAT, "Not an image layer file name: " + why)
            .withContext("fname", fname);
    }

    bool isHexDigit(char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    }
} // end anonymous namespace

std::string ImageFileName::toString() const {
    std::ostringstream oss;
    oss << key_range.start.toString() << "-" << key_range.end.toString() << "__"
        << std::uppercase << std::hex << std::setfill('0') << std::setw(LSN_HEX_LEN) << lsn;
    return oss.str();
}

storage::Result<ImageFileName> ImageFileName::parse(const std::string& fname) {
    const size_t sep = fname.find("__");
    if (sep == std::string::npos) {
        return badName(fname, "missing '__' separator");
    }
    const std::string key_part = fname.substr(0, sep);
    const std::string lsn_part = fname.substr(sep + 2);

    const size_t dash = key_part.find('-');
    if (dash == std::string::npos) {
        return badName(fname, "missing '-' between keys");
    }
    auto key_start = Key::fromHex(key_part.substr(0, dash));
    auto key_end = Key::fromHex(key_part.substr(dash + 1));
    if (!key_start || !key_end) {
        return badName(fname, "malformed key");
    }

    if (lsn_part.size() != LSN_HEX_LEN) {
        return badName(fname, "malformed LSN");
    }
    for (char c : lsn_part) {
        if (!isHexDigit(c)) {
            return badName(fname, "malformed LSN");
        }
    }

    ImageFileName name;
    name.key_range = KeyRange{*key_start, *key_end};
    name.lsn = std::stoull(lsn_part, nullptr, 16);

    if (name.key_range.empty()) {
        return badName(fname, "empty key range");
    }
    return name;
}

std::ostream& operator<<(std::ostream& os, const ImageFileName& fname) {
    return os << fname.toString();
}

} // namespace layer
} // namespace layerstore
