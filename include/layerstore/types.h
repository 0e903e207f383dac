// include/layerstore/types.h
#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>
#include <ostream>
#include <optional>

namespace layerstore {

// --- Foundational Data Types ---
using Bytes = std::vector<uint8_t>;

using Lsn = uint64_t; // Log Sequence Number
static constexpr Lsn INVALID_LSN = 0;

// "HI/LO" hex rendering of an LSN, e.g. 0/16B5A50
std::string lsnToString(Lsn lsn);

// --- Process-wide Format Constants ---
static constexpr size_t PAGE_SZ = 8192;            // Block size for all layer file I/O
static constexpr uint16_t IMAGE_FILE_MAGIC = 0x5A60;
static constexpr uint16_t STORAGE_FORMAT_VERSION = 3;
static constexpr size_t KEY_SIZE = 18;             // Encoded width of a Key

using Block = std::array<uint8_t, PAGE_SZ>;

// --- Compression Enum ---
enum class CompressionType : uint8_t {
    NONE = 0,
    ZSTD = 1,
};

/**
 * @brief Fixed-width key of the page store.
 *
 * Encoded big-endian field by field, so comparing two keys field-wise gives
 * the same order as comparing their encodings byte-wise.
 */
struct Key {
    uint8_t field1 = 0;
    uint32_t field2 = 0;
    uint32_t field3 = 0;
    uint32_t field4 = 0;
    uint8_t field5 = 0;
    uint32_t field6 = 0;

    static const Key MIN;
    static const Key MAX;

    // Next key in byte order. Key::MAX wraps to Key::MIN.
    Key next() const;
    Key add(uint32_t x) const;

    void writeToByteSlice(uint8_t* buf) const;
    static Key fromSlice(const uint8_t* buf);
    std::array<uint8_t, KEY_SIZE> toBytes() const;

    // 36 uppercase hex digits
    std::string toString() const;
    static std::optional<Key> fromHex(const std::string& hex);

    bool operator==(const Key& other) const;
    bool operator!=(const Key& other) const { return !(*this == other); }
    bool operator<(const Key& other) const;
    bool operator<=(const Key& other) const { return !(other < *this); }
    bool operator>(const Key& other) const { return other < *this; }
    bool operator>=(const Key& other) const { return !(*this < other); }
};

std::ostream& operator<<(std::ostream& os, const Key& key);

/**
 * @brief Half-open interval [start, end).
 */
template <typename T>
struct Range {
    T start;
    T end;

    bool contains(const T& v) const { return start <= v && v < end; }
    bool empty() const { return !(start < end); }
    bool operator==(const Range& other) const { return start == other.start && end == other.end; }
    bool operator!=(const Range& other) const { return !(*this == other); }
};

using KeyRange = Range<Key>;
using LsnRange = Range<Lsn>;

/**
 * @brief 16-byte identifier, rendered as 32 lowercase hex digits.
 */
class ZId {
public:
    static constexpr size_t SIZE = 16;

    ZId() { bytes_.fill(0); }
    explicit ZId(const std::array<uint8_t, SIZE>& bytes) : bytes_(bytes) {}

    const std::array<uint8_t, SIZE>& bytes() const { return bytes_; }
    std::string toString() const;

    bool operator==(const ZId& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ZId& other) const { return bytes_ != other.bytes_; }
    bool operator<(const ZId& other) const { return bytes_ < other.bytes_; }

protected:
    static std::optional<std::array<uint8_t, SIZE>> parseHex(const std::string& hex);
    static std::array<uint8_t, SIZE> randomBytes();

private:
    std::array<uint8_t, SIZE> bytes_;
};

class TenantId : public ZId {
public:
    using ZId::ZId;
    static TenantId generate() { return TenantId(randomBytes()); }
    static std::optional<TenantId> fromHex(const std::string& hex);
};

class TimelineId : public ZId {
public:
    using ZId::ZId;
    static TimelineId generate() { return TimelineId(randomBytes()); }
    static std::optional<TimelineId> fromHex(const std::string& hex);
};

std::ostream& operator<<(std::ostream& os, const ZId& id);

// --- Big-endian helpers for on-disk structures ---
inline void putU16BE(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}
inline void putU32BE(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = static_cast<uint8_t>(v >> (24 - i * 8));
}
inline void putU64BE(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) p[i] = static_cast<uint8_t>(v >> (56 - i * 8));
}
inline uint16_t getU16BE(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}
inline uint32_t getU32BE(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) v = (v << 8) | p[i];
    return v;
}
inline uint64_t getU64BE(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

} // namespace layerstore
