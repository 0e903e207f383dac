// src/test/types.test.cpp
#include "gtest/gtest.h"
#include "layerstore/types.h"

#include <cstring>
#include <set>

using namespace layerstore;

TEST(KeyTest, EncodingIsBigEndianFieldByField) {
    Key key{0x01, 0x02030405, 0x06070809, 0x0A0B0C0D, 0x0E, 0x0F101112};
    auto buf = key.toBytes();
    const uint8_t expected[KEY_SIZE] = {
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09,
        0x0A, 0x0B, 0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11, 0x12,
    };
    EXPECT_EQ(0, std::memcmp(buf.data(), expected, KEY_SIZE));
    EXPECT_EQ(key, Key::fromSlice(buf.data()));
}

TEST(KeyTest, FieldOrderMatchesByteOrder) {
    // Pairs chosen so a naive little-endian comparison would disagree.
    const Key a{0, 0, 0, 0x100, 0, 0};
    const Key b{0, 0, 0, 0x001, 0, 0xFFFFFFFF};
    EXPECT_LT(b, a);
    auto ab = a.toBytes();
    auto bb = b.toBytes();
    EXPECT_GT(std::memcmp(ab.data(), bb.data(), KEY_SIZE), 0);
}

TEST(KeyTest, NextCarriesAcrossFields) {
    Key key{0, 0, 0, 0, 0xFF, 0xFFFFFFFF};
    Key next = key.next();
    EXPECT_EQ(next, (Key{0, 0, 0, 1, 0, 0}));
    EXPECT_LT(key, next);
}

TEST(KeyTest, NextOfMaxWrapsToMin) {
    EXPECT_EQ(Key::MAX.next(), Key::MIN);
}

TEST(KeyTest, AddMatchesRepeatedNext) {
    Key base{0, 0, 0, 0, 0, 0xFFFFFFF0};
    Key stepped = base;
    for (int i = 0; i < 40; ++i) {
        stepped = stepped.next();
    }
    EXPECT_EQ(base.add(40), stepped);
}

TEST(KeyTest, HexRoundTripAndRejects) {
    Key key{0x00, 0x0000067F, 0x000032BE, 0x00004000, 0x00, 0x000070B6};
    EXPECT_EQ(key.toString(), "000000067F000032BE0000400000000070B6");
    EXPECT_EQ(Key::fromHex(key.toString()), key);
    EXPECT_EQ(Key::fromHex("000000067f000032be0000400000000070b6"), key);

    EXPECT_FALSE(Key::fromHex("").has_value());
    EXPECT_FALSE(Key::fromHex("000000067F000032BE0000400000000070B").has_value());
    EXPECT_FALSE(Key::fromHex("000000067F000032BE0000400000000070BZ").has_value());
}

TEST(RangeTest, HalfOpen) {
    KeyRange range{Key::MIN.add(10), Key::MIN.add(20)};
    EXPECT_TRUE(range.contains(Key::MIN.add(10)));
    EXPECT_TRUE(range.contains(Key::MIN.add(19)));
    EXPECT_FALSE(range.contains(Key::MIN.add(20)));
    EXPECT_FALSE(range.contains(Key::MIN.add(9)));
    EXPECT_FALSE(range.empty());
    EXPECT_TRUE((KeyRange{Key::MIN.add(5), Key::MIN.add(5)}).empty());

    LsnRange lsns{42, 43};
    EXPECT_TRUE(lsns.contains(42));
    EXPECT_FALSE(lsns.contains(43));
}

TEST(LsnTest, PrintsHighAndLowHalves) {
    EXPECT_EQ(lsnToString(0), "0/0");
    EXPECT_EQ(lsnToString(0x16B5A50), "0/16B5A50");
    EXPECT_EQ(lsnToString(0x100000001ULL), "1/1");
}

TEST(ZIdTest, HexRoundTrip) {
    TenantId tenant = TenantId::generate();
    std::string hex = tenant.toString();
    EXPECT_EQ(hex.size(), 32u);
    auto parsed = TenantId::fromHex(hex);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, tenant);

    EXPECT_FALSE(TimelineId::fromHex("not-hex").has_value());
    EXPECT_EQ(TimelineId().toString(), std::string(32, '0'));
}

TEST(ZIdTest, GeneratedIdsAreDistinct) {
    std::set<std::string> seen;
    for (int i = 0; i < 64; ++i) {
        seen.insert(TimelineId::generate().toString());
    }
    EXPECT_EQ(seen.size(), 64u);
}
