// src/types.cpp
#include "layerstore/types.h"

#include <cstring>
#include <sstream>
#include <iomanip>
#include <random>
#include <mutex>
#include <tuple>

namespace layerstore {

namespace {
    int hexDigitValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Decodes exactly out_len bytes from 2*out_len hex digits.
    bool decodeHex(const std::string& hex, uint8_t* out, size_t out_len) {
        if (hex.size() != out_len * 2) return false;
        for (size_t i = 0; i < out_len; ++i) {
            int hi = hexDigitValue(hex[2 * i]);
            int lo = hexDigitValue(hex[2 * i + 1]);
            if (hi < 0 || lo < 0) return false;
            out[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return true;
    }
} // end anonymous namespace

std::string lsnToString(Lsn lsn) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << (lsn >> 32) << "/" << (lsn & 0xFFFFFFFFULL);
    return oss.str();
}

// --- Key ---

const Key Key::MIN = Key{};
const Key Key::MAX = Key{0xFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFFFFFFFF, 0xFF, 0xFFFFFFFF};

Key Key::next() const {
    return add(1);
}

Key Key::add(uint32_t x) const {
    Key key = *this;

    // Ripple the carry through the fields from least to most significant,
    // respecting each field's width.
    uint64_t r = static_cast<uint64_t>(key.field6) + x;
    key.field6 = static_cast<uint32_t>(r);
    uint64_t carry = r >> 32;
    if (carry == 0) return key;

    r = static_cast<uint64_t>(key.field5) + carry;
    key.field5 = static_cast<uint8_t>(r);
    carry = r >> 8;
    if (carry == 0) return key;

    r = static_cast<uint64_t>(key.field4) + carry;
    key.field4 = static_cast<uint32_t>(r);
    carry = r >> 32;
    if (carry == 0) return key;

    r = static_cast<uint64_t>(key.field3) + carry;
    key.field3 = static_cast<uint32_t>(r);
    carry = r >> 32;
    if (carry == 0) return key;

    r = static_cast<uint64_t>(key.field2) + carry;
    key.field2 = static_cast<uint32_t>(r);
    carry = r >> 32;
    if (carry == 0) return key;

    key.field1 = static_cast<uint8_t>(key.field1 + carry);
    return key;
}

void Key::writeToByteSlice(uint8_t* buf) const {
    buf[0] = field1;
    putU32BE(buf + 1, field2);
    putU32BE(buf + 5, field3);
    putU32BE(buf + 9, field4);
    buf[13] = field5;
    putU32BE(buf + 14, field6);
}

Key Key::fromSlice(const uint8_t* buf) {
    Key key;
    key.field1 = buf[0];
    key.field2 = getU32BE(buf + 1);
    key.field3 = getU32BE(buf + 5);
    key.field4 = getU32BE(buf + 9);
    key.field5 = buf[13];
    key.field6 = getU32BE(buf + 14);
    return key;
}

std::array<uint8_t, KEY_SIZE> Key::toBytes() const {
    std::array<uint8_t, KEY_SIZE> buf{};
    writeToByteSlice(buf.data());
    return buf;
}

std::string Key::toString() const {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<unsigned>(field1)
        << std::setw(8) << field2
        << std::setw(8) << field3
        << std::setw(8) << field4
        << std::setw(2) << static_cast<unsigned>(field5)
        << std::setw(8) << field6;
    return oss.str();
}

std::optional<Key> Key::fromHex(const std::string& hex) {
    std::array<uint8_t, KEY_SIZE> buf{};
    if (!decodeHex(hex, buf.data(), buf.size())) {
        return std::nullopt;
    }
    return Key::fromSlice(buf.data());
}

bool Key::operator==(const Key& other) const {
    return std::tie(field1, field2, field3, field4, field5, field6) ==
           std::tie(other.field1, other.field2, other.field3, other.field4, other.field5, other.field6);
}

bool Key::operator<(const Key& other) const {
    return std::tie(field1, field2, field3, field4, field5, field6) <
           std::tie(other.field1, other.field2, other.field3, other.field4, other.field5, other.field6);
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    return os << key.toString();
}

// --- ZId ---

std::string ZId::toString() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (uint8_t b : bytes_) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::optional<std::array<uint8_t, ZId::SIZE>> ZId::parseHex(const std::string& hex) {
    std::array<uint8_t, SIZE> bytes{};
    if (!decodeHex(hex, bytes.data(), bytes.size())) {
        return std::nullopt;
    }
    return bytes;
}

std::array<uint8_t, ZId::SIZE> ZId::randomBytes() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, SIZE> bytes{};
    std::lock_guard<std::mutex> lock(rng_mutex);
    for (size_t i = 0; i < SIZE; i += 8) {
        uint64_t r = rng();
        std::memcpy(bytes.data() + i, &r, 8);
    }
    return bytes;
}

std::optional<TenantId> TenantId::fromHex(const std::string& hex) {
    auto bytes = parseHex(hex);
    if (!bytes) return std::nullopt;
    return TenantId(*bytes);
}

std::optional<TimelineId> TimelineId::fromHex(const std::string& hex) {
    auto bytes = parseHex(hex);
    if (!bytes) return std::nullopt;
    return TimelineId(*bytes);
}

std::ostream& operator<<(std::ostream& os, const ZId& id) {
    return os << id.toString();
}

} // namespace layerstore
