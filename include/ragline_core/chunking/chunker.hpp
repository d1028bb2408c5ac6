#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

class ChunkerError : public std::exception {
 public:
  explicit ChunkerError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ChunkingOptions {
  static constexpr size_t DEFAULT_MAX_WORDS = 512;
  static constexpr size_t DEFAULT_OVERLAP_WORDS = 50;

  size_t max_words = DEFAULT_MAX_WORDS;
  size_t overlap_words = DEFAULT_OVERLAP_WORDS;
};

/**
 * @brief Splits text into overlapping windows of whitespace-separated words.
 *
 * Windows hold at most @p max_words words and each one starts
 * max_words - overlap_words words after the previous one. The last window may
 * be shorter. Every candidate records source_document, page and the 0-based
 * offset of its first word (start_word).
 *
 * @throw ChunkerError if max_words is 0 or overlap_words >= max_words.
 * @return An empty vector for empty or whitespace-only text.
 */
std::vector<ChunkCandidate> chunk_text(const std::string &text,
                                       size_t max_words,
                                       size_t overlap_words,
                                       const std::string &source_document,
                                       int page = 1);

class Chunker {
 public:
  explicit Chunker(ChunkingOptions options = {});

  std::vector<ChunkCandidate> chunk(const std::string &text,
                                    const std::string &source_document,
                                    int page = 1) const;

  const ChunkingOptions &options() const {
    return options_;
  }

 private:
  ChunkingOptions options_;
};

}  // namespace ragline_core
