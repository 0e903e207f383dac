// src/test/filename.test.cpp
#include "gtest/gtest.h"
#include "layerstore/layer/filename.h"
#include "layerstore/storage_error/error_utils.h"

using namespace layerstore;
using namespace layerstore::layer;

TEST(ImageFileNameTest, FormatsKeysAndLsn) {
    ImageFileName name;
    name.key_range = KeyRange{*Key::fromHex("000000067F000032BE0000400000000070B6"),
                              *Key::fromHex("000000067F000032BE0000400000000080B6")};
    name.lsn = 0x346BC568;

    EXPECT_EQ(name.toString(),
              "000000067F000032BE0000400000000070B6-000000067F000032BE0000400000000080B6__00000000346BC568");
}

TEST(ImageFileNameTest, ParseRoundTrip) {
    ImageFileName name{KeyRange{Key::MIN.add(5), Key::MAX}, 0xFEDCBA9876543210ULL};
    auto parsed = ImageFileName::parse(name.toString());
    ASSERT_TRUE(parsed.isOk()) << parsed.error().toString();
    EXPECT_EQ(parsed.value(), name);
}

TEST(ImageFileNameTest, RejectsMalformedNames) {
    const std::string good_keys = "000000067F000032BE0000400000000070B6-000000067F000032BE0000400000000080B6";
    const std::vector<std::string> bad = {
        "",
        "ephemeral-1",
        good_keys,                                      // no LSN
        good_keys + "__346BC568",                       // LSN too short
        good_keys + "__00000000346BC56G",               // LSN not hex
        "000000067F000032BE0000400000000070B6__00000000346BC568", // single key
        "000000067F000032BE0000400000000080B6-000000067F000032BE0000400000000070B6__00000000346BC568", // reversed range
        // A delta layer name carries an LSN range, not a single LSN.
        good_keys + "__0000000000000001-0000000000000002",
    };
    for (const auto& fname : bad) {
        auto parsed = ImageFileName::parse(fname);
        ASSERT_FALSE(parsed.isOk()) << fname;
        EXPECT_EQ(parsed.error().code, storage::ErrorCode::INVALID_DATA_FORMAT) << fname;
    }
}
