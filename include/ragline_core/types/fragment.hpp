#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ragline_core {

// Metadata values are either text or integers (page numbers, word offsets).
using MetadataValue = std::variant<std::string, int>;
using FragmentMetadata = std::map<std::string, MetadataValue>;

// Well-known metadata keys written by the chunker
inline constexpr const char *kMetaSourceDocument = "source_document";
inline constexpr const char *kMetaPage = "page";
inline constexpr const char *kMetaStartWord = "start_word";

// A chunk of text produced by the chunker, before it has an id or an embedding.
struct ChunkCandidate {
  std::string content;
  FragmentMetadata metadata;
};

/*
A fragment is a bounded slice of document text plus its retrieval metadata.
The knowledge base id is copied onto every fragment at ingestion time so the
vector index can filter by scope without asking the document store.
*/
struct Fragment {
  std::string id;
  std::string document_id;
  std::string knowledge_base_id;
  std::string content;
  FragmentMetadata metadata;
  std::optional<std::vector<float>> embedding;

  std::string source_document() const;
  std::optional<int> page() const;
};

struct FragmentSearchResult {
  Fragment fragment;
  float distance;
};

std::optional<std::string> metadata_string(const FragmentMetadata &metadata, const std::string &key);
std::optional<int> metadata_int(const FragmentMetadata &metadata, const std::string &key);

}  // namespace ragline_core
