#include "ragline_core/chunking/chunker.hpp"

#include <algorithm>
#include <sstream>

namespace ragline_core {

namespace {

void validate_window(size_t max_words, size_t overlap_words) {
  if (max_words == 0) {
    throw ChunkerError("max_words must be greater than 0");
  }
  // A step of zero words would never advance the window
  if (overlap_words >= max_words) {
    throw ChunkerError("overlap_words (" + std::to_string(overlap_words) +
                       ") must be smaller than max_words (" + std::to_string(max_words) + ")");
  }
}

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(std::move(word));
  }
  return words;
}

}  // namespace

std::vector<ChunkCandidate> chunk_text(const std::string &text,
                                       size_t max_words,
                                       size_t overlap_words,
                                       const std::string &source_document,
                                       int page) {
  validate_window(max_words, overlap_words);

  const std::vector<std::string> words = split_words(text);
  std::vector<ChunkCandidate> chunks;
  if (words.empty()) {
    return chunks;
  }

  const size_t step = max_words - overlap_words;
  size_t start = 0;
  while (start < words.size()) {
    const size_t end = std::min(start + max_words, words.size());

    std::string content;
    for (size_t i = start; i < end; ++i) {
      if (i > start) {
        content += ' ';
      }
      content += words[i];
    }

    ChunkCandidate candidate;
    candidate.content = std::move(content);
    candidate.metadata[kMetaSourceDocument] = source_document;
    candidate.metadata[kMetaPage] = page;
    candidate.metadata[kMetaStartWord] = static_cast<int>(start);
    chunks.push_back(std::move(candidate));

    if (end >= words.size()) {
      break;
    }
    start += step;
  }

  return chunks;
}

Chunker::Chunker(ChunkingOptions options) : options_(options) {
  validate_window(options_.max_words, options_.overlap_words);
}

std::vector<ChunkCandidate> Chunker::chunk(const std::string &text,
                                           const std::string &source_document,
                                           int page) const {
  return chunk_text(text, options_.max_words, options_.overlap_words, source_document, page);
}

}  // namespace ragline_core
