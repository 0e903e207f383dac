// src/test/config.test.cpp
#include "gtest/gtest.h"
#include "layerstore/config.h"
#include "layerstore/storage_error/error_utils.h"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace layerstore;

TEST(LayerStoreConfigTest, TimelinePathLayout) {
    LayerStoreConfig conf;
    conf.workdir = "/data/pageserver";
    auto tenant = *TenantId::fromHex("0123456789abcdef0123456789abcdef");
    auto timeline = *TimelineId::fromHex("fedcba9876543210fedcba9876543210");

    EXPECT_EQ(conf.timelinePath(timeline, tenant),
              fs::path("/data/pageserver/tenants/0123456789abcdef0123456789abcdef/timelines/fedcba9876543210fedcba9876543210"));
}

TEST(LayerStoreConfigTest, JsonRoundTrip) {
    LayerStoreConfig conf;
    conf.workdir = "/tmp/layers";
    conf.image_compression = CompressionType::NONE;
    conf.image_compression_level = 7;

    LayerStoreConfig parsed = LayerStoreConfig::fromJson(conf.toJson());
    EXPECT_EQ(parsed.workdir, conf.workdir);
    EXPECT_EQ(parsed.image_compression, CompressionType::NONE);
    EXPECT_EQ(parsed.image_compression_level, 7);
    EXPECT_EQ(conf.toJson()["image_compression"], "NONE");
}

TEST(LayerStoreConfigTest, DefaultsApplyToOmittedFields) {
    LayerStoreConfig parsed = LayerStoreConfig::fromJson(nlohmann::json{{"workdir", "/w"}});
    EXPECT_EQ(parsed.image_compression, CompressionType::ZSTD);
    EXPECT_EQ(parsed.image_compression_level, 0);
}

TEST(LayerStoreConfigTest, RejectsInvalidInput) {
    const std::vector<nlohmann::json> bad = {
        nlohmann::json::array(),
        nlohmann::json{{"image_compression", "ZSTD"}},                      // no workdir
        nlohmann::json{{"workdir", ""}},
        nlohmann::json{{"workdir", "/w"}, {"image_compression", "LZMA"}},
        nlohmann::json{{"workdir", "/w"}, {"image_compression_level", 99}},
        nlohmann::json{{"workdir", 12}},
    };
    for (const auto& j : bad) {
        try {
            LayerStoreConfig::fromJson(j);
            FAIL() << "Expected StorageError for " << j.dump();
        } catch (const storage::StorageError& e) {
            EXPECT_EQ(e.code, storage::ErrorCode::INVALID_CONFIGURATION) << j.dump();
        }
    }
}

TEST(LayerStoreConfigTest, LoadsFromFile) {
    const std::string path = "./test_config_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand()) + ".json";
    {
        std::ofstream out(path);
        out << R"({"workdir": "/srv/layers", "image_compression": "ZSTD", "image_compression_level": 3})";
    }
    LayerStoreConfig conf = LayerStoreConfig::fromJsonFile(path);
    EXPECT_EQ(conf.workdir, fs::path("/srv/layers"));
    EXPECT_EQ(conf.image_compression_level, 3);
    fs::remove(path);

    EXPECT_THROW(LayerStoreConfig::fromJsonFile(path), storage::StorageError);
}

TEST(LayerStoreConfigTest, ValidateReportsStatus) {
    LayerStoreConfig conf;
    storage::Status status = conf.validate();
    ASSERT_FALSE(status.isOk());
    EXPECT_EQ(status.error().code, storage::ErrorCode::INVALID_CONFIGURATION);

    conf.workdir = "/w";
    EXPECT_TRUE(conf.validate().isOk());
}
