// src/test/blob_io.test.cpp
#include "gtest/gtest.h"
#include "layerstore/layer/blob_io.h"
#include "layerstore/storage_error/error_utils.h"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;
using namespace layerstore;
using namespace layerstore::layer;

class BlobIoTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = "./test_data_blob_io_" + std::to_string(time(nullptr)) + "_" + std::to_string(rand());
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir, ec);
        if (ec) {
            std::cerr << "Warning: Could not clean up test directory " << test_dir << ": " << ec.message() << std::endl;
        }
    }

    static Bytes pattern(size_t len, uint8_t seed) {
        Bytes b(len);
        for (size_t i = 0; i < len; ++i) {
            b[i] = static_cast<uint8_t>(seed + i * 7);
        }
        return b;
    }

    // Writes blobs starting at start_offset and pads the file to whole blocks.
    std::string writeBlobs(const std::vector<Bytes>& blobs, uint64_t start_offset, std::vector<uint64_t>& offsets) {
        const std::string path = test_dir + "/blobs";
        std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
        file.seekp(static_cast<std::streamoff>(start_offset));
        BlobWriter writer(std::move(file), start_offset, path);
        for (const Bytes& b : blobs) {
            offsets.push_back(writer.writeBlob(b.data(), b.size()));
        }
        const uint64_t padded = (writer.size() + PAGE_SZ - 1) / PAGE_SZ * PAGE_SZ;
        if (padded > writer.size()) {
            Bytes zeros(padded - writer.size(), 0);
            writer.file().write(reinterpret_cast<const char*>(zeros.data()), static_cast<std::streamsize>(zeros.size()));
        }
        writer.file().close();
        return path;
    }
};

TEST_F(BlobIoTest, HeaderWidthDependsOnLength) {
    std::vector<Bytes> blobs = {pattern(0, 1), pattern(1, 2), pattern(127, 3), pattern(128, 4), pattern(300, 5)};
    std::vector<uint64_t> offsets;
    writeBlobs(blobs, PAGE_SZ, offsets);

    ASSERT_EQ(offsets.size(), blobs.size());
    EXPECT_EQ(offsets[0], PAGE_SZ);
    EXPECT_EQ(offsets[1], offsets[0] + 1 + 0);
    EXPECT_EQ(offsets[2], offsets[1] + 1 + 1);
    EXPECT_EQ(offsets[3], offsets[2] + 1 + 127);
    EXPECT_EQ(offsets[4], offsets[3] + 4 + 128);
}

TEST_F(BlobIoTest, ReadsBackBlobsSpanningBlocks) {
    // The third blob straddles the boundary between blocks 1 and 2; the
    // fourth covers more than a whole block.
    std::vector<Bytes> blobs = {pattern(100, 1), pattern(PAGE_SZ - 200, 2), pattern(500, 3), pattern(3 * PAGE_SZ, 4), pattern(5, 5)};
    std::vector<uint64_t> offsets;
    const std::string path = writeBlobs(blobs, PAGE_SZ, offsets);

    FileBlockReader reader(path);
    BlockCursor cursor(reader);
    for (size_t i = 0; i < blobs.size(); ++i) {
        EXPECT_EQ(readBlob(cursor, offsets[i]), blobs[i]) << "blob " << i;
    }
    // Out of order reads go through the same cursor.
    EXPECT_EQ(readBlob(cursor, offsets[1]), blobs[1]);
    EXPECT_EQ(readBlob(cursor, offsets[0]), blobs[0]);
}

TEST_F(BlobIoTest, LongHeaderWithShortLengthIsCorruption) {
    Block block{};
    // Long form header claiming 5 bytes.
    putU32BE(block.data(), 0x80000005U);
    BlockBuf buf;
    buf.writeBlk(block);

    BlockCursor cursor(buf);
    try {
        readBlob(cursor, 0);
        FAIL() << "Expected StorageError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::STORAGE_CORRUPTION);
    }
}

TEST_F(BlobIoTest, BlobPastEndOfFileFailsToRead) {
    std::vector<uint64_t> offsets;
    const std::string path = writeBlobs({pattern(10, 1)}, PAGE_SZ, offsets);

    // Rewrite the header so the blob claims to run past the end of the file.
    {
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        uint8_t header[4];
        putU32BE(header, 0x80000000U | static_cast<uint32_t>(4 * PAGE_SZ));
        f.seekp(static_cast<std::streamoff>(offsets[0]));
        f.write(reinterpret_cast<const char*>(header), sizeof(header));
    }

    FileBlockReader reader(path);
    BlockCursor cursor(reader);
    try {
        readBlob(cursor, offsets[0]);
        FAIL() << "Expected StorageError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::IO_READ_ERROR);
        EXPECT_EQ(e.file_path.value_or(""), path);
    }
}

TEST_F(BlobIoTest, HugeLengthFailsOnReadNotAllocation) {
    std::vector<uint64_t> offsets;
    const std::string path = writeBlobs({pattern(10, 1)}, PAGE_SZ, offsets);

    // Largest length the header can encode, far beyond the file.
    {
        std::fstream f(path, std::ios::in | std::ios::out | std::ios::binary);
        uint8_t header[4];
        putU32BE(header, 0xFFFFFFFFU);
        f.seekp(static_cast<std::streamoff>(offsets[0]));
        f.write(reinterpret_cast<const char*>(header), sizeof(header));
    }

    FileBlockReader reader(path);
    BlockCursor cursor(reader);
    try {
        readBlob(cursor, offsets[0]);
        FAIL() << "Expected StorageError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::IO_READ_ERROR);
        EXPECT_EQ(e.file_path.value_or(""), path);
        EXPECT_EQ(e.context.at("blknum"), "2");
    }
}

TEST_F(BlobIoTest, MissingFileIsReported) {
    try {
        FileBlockReader reader(test_dir + "/does-not-exist");
        FAIL() << "Expected StorageError";
    } catch (const storage::StorageError& e) {
        EXPECT_EQ(e.code, storage::ErrorCode::FILE_NOT_FOUND);
    }
}
