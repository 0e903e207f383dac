// include/layerstore/config.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace layerstore {

/**
 * @struct LayerStoreConfig
 * @brief Process-wide settings shared by every layer reader and writer.
 *
 * Layer files of a timeline live in
 * <workdir>/tenants/<tenant_id>/timelines/<timeline_id>/.
 */
struct LayerStoreConfig {
    std::filesystem::path workdir;
    CompressionType image_compression = CompressionType::ZSTD;
    int image_compression_level = 0; // 0 selects zstd's default level

    std::filesystem::path tenantPath(const TenantId& tenant_id) const;
    std::filesystem::path timelinePath(const TimelineId& timeline_id, const TenantId& tenant_id) const;

    storage::Status validate() const;

    nlohmann::json toJson() const;

    // Both throw storage::StorageError(INVALID_CONFIGURATION) on malformed input.
    static LayerStoreConfig fromJson(const nlohmann::json& j);
    static LayerStoreConfig fromJsonFile(const std::filesystem::path& path);
};

using LayerStoreConfigPtr = std::shared_ptr<const LayerStoreConfig>;

} // namespace layerstore
