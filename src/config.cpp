// src/config.cpp
#include "layerstore/config.h"
#include "layerstore/debug_utils.h"
#include "layerstore/storage_error/error_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace layerstore {

fs::path LayerStoreConfig::tenantPath(const TenantId& tenant_id) const {
    return workdir / "tenants" / tenant_id.toString();
}

fs::path LayerStoreConfig::timelinePath(const TimelineId& timeline_id, const TenantId& tenant_id) const {
    return tenantPath(tenant_id) / "timelines" / timeline_id.toString();
}

storage::Status LayerStoreConfig::validate() const {
    if (workdir.empty()) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "workdir must not be empty.");
    }
    if (image_compression == CompressionType::ZSTD &&
        (image_compression_level < -7 || image_compression_level > 22)) {
        return STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "image_compression_level out of range.")
            .withContext("image_compression_level", std::to_string(image_compression_level));
    }
    return {};
}

json LayerStoreConfig::toJson() const {
    json j;
    j["workdir"] = workdir.string();
    j["image_compression"] = std::string(magic_enum::enum_name(image_compression));
    j["image_compression_level"] = image_compression_level;
    return j;
}

LayerStoreConfig LayerStoreConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Configuration root must be a JSON object.");
    }

    LayerStoreConfig conf;
    try {
        conf.workdir = j.at("workdir").get<std::string>();
        if (j.contains("image_compression")) {
            const std::string name = j.at("image_compression").get<std::string>();
            auto parsed = magic_enum::enum_cast<CompressionType>(name);
            if (!parsed.has_value()) {
                throw STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Unknown image_compression '" + name + "'.")
                    .withSuggestedAction("Use one of: NONE, ZSTD");
            }
            conf.image_compression = *parsed;
        }
        if (j.contains("image_compression_level")) {
            conf.image_compression_level = j.at("image_compression_level").get<int>();
        }
    } catch (const json::exception& e) {
        throw STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Malformed configuration.")
            .withDetails(e.what());
    }

    storage::Status status = conf.validate();
    if (!status) {
        throw std::move(status).error();
    }
    return conf;
}

LayerStoreConfig LayerStoreConfig::fromJsonFile(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw storage::StorageError::fileNotFound(path.string())
            .withDetails("Cannot open configuration file.");
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw STORAGE_ERROR(storage::ErrorCode::INVALID_CONFIGURATION, "Configuration file is not valid JSON.")
            .withFilePath(path.string())
            .withDetails(e.what());
    }

    LOG_INFO("[LayerStoreConfig] Loaded configuration from ", path.string());
    return fromJson(j);
}

} // namespace layerstore
