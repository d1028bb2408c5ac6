#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "ragline_core/chunking/chunker.hpp"

namespace ragline_core {

class ChunkerTest : public ::testing::Test {
 protected:
  // "w0 w1 ... w{count-1}"
  std::string numbered_words(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
      if (i > 0) {
        text += ' ';
      }
      text += "w" + std::to_string(i);
    }
    return text;
  }
};

TEST_F(ChunkerTest, ChunkText_EmptyText_ReturnsNoChunks) {
  EXPECT_TRUE(chunk_text("", 4, 1, "doc.txt").empty());
  EXPECT_TRUE(chunk_text("   \n\t  ", 4, 1, "doc.txt").empty());
}

TEST_F(ChunkerTest, ChunkText_FewerWordsThanWindow_ReturnsSingleChunk) {
  // Act
  auto chunks = chunk_text("alpha beta gamma", 10, 2, "doc.txt");

  // Assert
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "alpha beta gamma");
  EXPECT_EQ(metadata_int(chunks[0].metadata, kMetaStartWord), 0);
}

TEST_F(ChunkerTest, ChunkText_OverlappingWindows_AdvanceByStep) {
  // Arrange: 10 words, window 4, overlap 1 -> starts at 0, 3, 6
  const std::string text = numbered_words(10);

  // Act
  auto chunks = chunk_text(text, 4, 1, "doc.txt");

  // Assert
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "w0 w1 w2 w3");
  EXPECT_EQ(chunks[1].content, "w3 w4 w5 w6");
  EXPECT_EQ(chunks[2].content, "w6 w7 w8 w9");
  EXPECT_EQ(metadata_int(chunks[0].metadata, kMetaStartWord), 0);
  EXPECT_EQ(metadata_int(chunks[1].metadata, kMetaStartWord), 3);
  EXPECT_EQ(metadata_int(chunks[2].metadata, kMetaStartWord), 6);
}

TEST_F(ChunkerTest, ChunkText_LastWindowReachesEnd_StopsWithoutTrailingChunk) {
  // 7 words, window 4, overlap 1: the second window already covers w6
  auto chunks = chunk_text(numbered_words(7), 4, 1, "doc.txt");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[1].content, "w3 w4 w5 w6");
}

TEST_F(ChunkerTest, ChunkText_ShortFinalWindow_IsKept) {
  auto chunks = chunk_text(numbered_words(5), 3, 0, "doc.txt");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content, "w0 w1 w2");
  EXPECT_EQ(chunks[1].content, "w3 w4");
}

TEST_F(ChunkerTest, ChunkText_DroppingOverlapRebuildsOriginalWords) {
  // Arrange
  const int word_count = 53;
  const size_t overlap = 3;
  const std::string text = numbered_words(word_count);

  // Act
  auto chunks = chunk_text(text, 8, overlap, "doc.txt");

  // Assert: first chunk whole, then every later chunk without its first `overlap` words
  std::vector<std::string> rebuilt;
  for (size_t c = 0; c < chunks.size(); ++c) {
    std::istringstream words(chunks[c].content);
    std::string word;
    size_t index = 0;
    while (words >> word) {
      if (c == 0 || index >= overlap) {
        rebuilt.push_back(word);
      }
      ++index;
    }
  }
  std::vector<std::string> original;
  std::istringstream original_words(text);
  std::string word;
  while (original_words >> word) {
    original.push_back(word);
  }
  EXPECT_EQ(rebuilt, original);
}

TEST_F(ChunkerTest, ChunkText_CollapsesWhitespace) {
  auto chunks = chunk_text("alpha   beta\n\tgamma  ", 10, 0, "doc.txt");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "alpha beta gamma");
}

TEST_F(ChunkerTest, ChunkText_RecordsSourceAndPage) {
  auto chunks = chunk_text(numbered_words(6), 4, 1, "manual.md", 7);

  ASSERT_FALSE(chunks.empty());
  for (const auto &chunk : chunks) {
    EXPECT_EQ(metadata_string(chunk.metadata, kMetaSourceDocument), "manual.md");
    EXPECT_EQ(metadata_int(chunk.metadata, kMetaPage), 7);
  }
}

TEST_F(ChunkerTest, ChunkText_InvalidWindow_Throws) {
  EXPECT_THROW(chunk_text("a b c", 0, 0, "doc.txt"), ChunkerError);
  EXPECT_THROW(chunk_text("a b c", 4, 4, "doc.txt"), ChunkerError);
  EXPECT_THROW(chunk_text("a b c", 4, 9, "doc.txt"), ChunkerError);
}

TEST_F(ChunkerTest, Constructor_InvalidOptions_Throws) {
  ChunkingOptions options;
  options.max_words = 10;
  options.overlap_words = 10;

  EXPECT_THROW(Chunker{options}, ChunkerError);
}

TEST_F(ChunkerTest, Chunk_UsesConfiguredOptions) {
  // Arrange
  ChunkingOptions options;
  options.max_words = 5;
  options.overlap_words = 2;
  Chunker chunker(options);

  // Act
  auto chunks = chunker.chunk(numbered_words(11), "doc.txt", 2);

  // Assert: starts at 0, 3, 6
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[2].content, "w6 w7 w8 w9 w10");
  EXPECT_EQ(metadata_int(chunks[2].metadata, kMetaPage), 2);
}

TEST_F(ChunkerTest, Chunker_DefaultOptions) {
  Chunker chunker;
  EXPECT_EQ(chunker.options().max_words, ChunkingOptions::DEFAULT_MAX_WORDS);
  EXPECT_EQ(chunker.options().overlap_words, ChunkingOptions::DEFAULT_OVERLAP_WORDS);
}

}  // namespace ragline_core
