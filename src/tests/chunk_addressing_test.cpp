#include <gtest/gtest.h>
#include "store/chunk_addressing.hpp"
#include "store/store_error.hpp"

using namespace docpipe::store;

TEST(ChunkAddressingTest, ChunkCountRoundsUp) {
  EXPECT_EQ(chunk_count(0, 10), 0u);
  EXPECT_EQ(chunk_count(1, 10), 1u);
  EXPECT_EQ(chunk_count(10, 10), 1u);
  EXPECT_EQ(chunk_count(11, 10), 2u);
  EXPECT_EQ(chunk_count(25000, 10000), 3u);
}

TEST(ChunkAddressingTest, ZeroChunkSizeIsRejected) {
  EXPECT_THROW(chunk_count(10, 0), InvalidArgumentError);
  EXPECT_THROW(chunk_range(0, 10, 0), InvalidArgumentError);
  EXPECT_THROW(character_boundaries("abc", 0), InvalidArgumentError);
}

TEST(ChunkAddressingTest, RangesTileTheContent) {
  const std::size_t length = 25000;
  const std::size_t size = 10000;

  std::size_t expected_begin = 0;
  for (std::size_t i = 0; i < chunk_count(length, size); ++i) {
    const ChunkRange range = chunk_range(i, length, size);
    EXPECT_EQ(range.begin, expected_begin);
    EXPECT_GT(range.size(), 0u);
    expected_begin = range.end;
  }
  EXPECT_EQ(expected_begin, length);

  EXPECT_EQ(chunk_range(2, length, size).size(), 5000u);
}

TEST(ChunkAddressingTest, RangeBeyondLastChunkThrows) {
  EXPECT_THROW(chunk_range(3, 25000, 10000), OutOfRangeError);
  EXPECT_THROW(chunk_range(0, 0, 10), OutOfRangeError);
}

TEST(ChunkAddressingTest, StartOffsetsNormaliseToOwningChunk) {
  EXPECT_EQ(offset_to_index(0, 10000), 0u);
  EXPECT_EQ(offset_to_index(9999, 10000), 0u);
  EXPECT_EQ(offset_to_index(10000, 10000), 1u);

  EXPECT_EQ(normalize_request(20000, 25000, 10000), 2u);
  EXPECT_EQ(normalize_request(24999, 25000, 10000), 2u);
  EXPECT_THROW(normalize_request(25000, 25000, 10000), OutOfRangeError);
  EXPECT_THROW(normalize_request(0, 0, 10000), OutOfRangeError);
}

TEST(ChunkAddressingTest, CharactersAreCodePoints) {
  EXPECT_EQ(character_count(""), 0u);
  EXPECT_EQ(character_count("abc"), 3u);
  // "hé€" : 1 + 2 + 3 bytes
  EXPECT_EQ(character_count("h\xC3\xA9\xE2\x82\xAC"), 3u);
  // Leading continuation byte belongs to the first character
  EXPECT_EQ(character_count("\x80" "a"), 2u);
}

TEST(ChunkAddressingTest, BoundariesNeverSplitMultibyteSequences) {
  const std::string text = "a\xC3\xA9" "b\xE2\x82\xAC" "c";  // a é b € c
  const auto boundaries = character_boundaries(text, 2);

  ASSERT_EQ(boundaries.size(), 4u);
  EXPECT_EQ(boundaries[0], 0u);
  EXPECT_EQ(boundaries[1], 3u);   // "aé"
  EXPECT_EQ(boundaries[2], 7u);   // "b€"
  EXPECT_EQ(boundaries[3], text.size());
}

TEST(ChunkAddressingTest, EmptyTextHasSingleBoundary) {
  const auto boundaries = character_boundaries("", 5);
  ASSERT_EQ(boundaries.size(), 1u);
  EXPECT_EQ(boundaries[0], 0u);
}
