#include <gtest/gtest.h>
#include "upload/ChunkReader.hpp"
#include "upload/errors.hpp"
#include "testFiles.hpp"

#include <fstream>

using namespace cn::upload;
using namespace cn::test;

class ChunkReaderTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(ChunkReaderTest, SlicesIntoOrderedParts) {
    const auto p = dir.fileWith("clip.mp3", "abcdefghij");
    ChunkReader reader(p, 10, 4);
    EXPECT_EQ(reader.partCount(), 3u);

    auto c1 = reader.next();
    ASSERT_TRUE(c1);
    EXPECT_EQ(c1->partNumber, 1u);
    EXPECT_EQ(c1->offset, 0u);
    EXPECT_EQ(c1->bytes, "abcd");

    auto c2 = reader.next();
    ASSERT_TRUE(c2);
    EXPECT_EQ(c2->partNumber, 2u);
    EXPECT_EQ(c2->offset, 4u);
    EXPECT_EQ(c2->bytes, "efgh");

    auto c3 = reader.next();
    ASSERT_TRUE(c3);
    EXPECT_EQ(c3->partNumber, 3u);
    EXPECT_EQ(c3->offset, 8u);
    EXPECT_EQ(c3->bytes, "ij");

    EXPECT_TRUE(reader.done());
    EXPECT_EQ(reader.offset(), 10u);
    EXPECT_FALSE(reader.next());
}

TEST_F(ChunkReaderTest, ExactMultipleHasNoEmptyTrailingPart) {
    const auto p = dir.fileWith("clip.wav", "12345678");
    ChunkReader reader(p, 8, 4);
    EXPECT_EQ(reader.partCount(), 2u);
    ASSERT_TRUE(reader.next());
    ASSERT_TRUE(reader.next());
    EXPECT_FALSE(reader.next());
}

TEST_F(ChunkReaderTest, EmptyFileYieldsNothing) {
    const auto p = dir.fileWith("empty.m4a", "");
    ChunkReader reader(p, 0, 1);
    EXPECT_EQ(reader.partCount(), 0u);
    EXPECT_TRUE(reader.done());
    EXPECT_FALSE(reader.next());
}

TEST_F(ChunkReaderTest, ZeroPartSizeIsRejected) {
    const auto p = dir.fileWith("clip.mp3", "abc");
    EXPECT_THROW(ChunkReader(p, 3, 0), std::invalid_argument);
}

TEST_F(ChunkReaderTest, MissingFileIsIoError) {
    EXPECT_THROW(ChunkReader(dir.path() / "gone.mp3", 10, 4), IoError);
}

TEST_F(ChunkReaderTest, ShrunkFileIsIoError) {
    const auto p = dir.fileWith("clip.mp3", "abcdef");
    ChunkReader reader(p, 10, 4);
    ASSERT_TRUE(reader.next());
    EXPECT_THROW((void)reader.next(), IoError);
}

TEST_F(ChunkReaderTest, GrownFileIsIoError) {
    const auto p = dir.fileWith("clip.mp3", "abcdefghijkl");
    ChunkReader reader(p, 10, 4);
    ASSERT_TRUE(reader.next());
    ASSERT_TRUE(reader.next());
    EXPECT_THROW((void)reader.next(), IoError);
}

TEST_F(ChunkReaderTest, LargeSparseFileCountsParts) {
    const auto p = dir.sizedFile("long.mp4", 200 * MiB);
    ChunkReader reader(p, 200 * MiB, 50 * MiB);
    EXPECT_EQ(reader.partCount(), 4u);

    unsigned int seen = 0;
    uint64_t total = 0;
    while (auto chunk = reader.next()) {
        ++seen;
        EXPECT_EQ(chunk->partNumber, seen);
        EXPECT_EQ(chunk->bytes.size(), 50 * MiB);
        total += chunk->bytes.size();
    }
    EXPECT_EQ(seen, 4u);
    EXPECT_EQ(total, 200 * MiB);
}
