#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "ragline_core/chunking/chunker.hpp"
#include "ragline_core/db/fragment_store.hpp"
#include "ragline_core/db/knowledge_base_store.hpp"
#include "ragline_core/extractors/content_extractor_factory.hpp"
#include "ragline_core/llm/language_model.hpp"
#include "ragline_core/services/scope_locks.hpp"
#include "ragline_core/services/service_errors.hpp"
#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

class DocumentServiceError : public std::exception {
 public:
  explicit DocumentServiceError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class DocumentService
 * @brief Ingests documents into a knowledge base and removes them again.
 *
 * Ingestion is synchronous: extract, chunk every page, embed every fragment,
 * persist the fragments, then add them to the vector index. The document row
 * is PROCESSING while this runs, INDEXED afterwards, and ERROR if any step
 * fails. A failed ingestion leaves no fragments behind in the store or index.
 * Each ingestion holds its knowledge base's shared scope lock, so a concurrent
 * KnowledgeBaseService::remove waits for it to finish.
 */
class DocumentService {
 public:
  DocumentService(std::shared_ptr<KnowledgeBaseStore> knowledge_base_store,
                  std::shared_ptr<FragmentStore> fragment_store,
                  std::shared_ptr<VectorIndex> vector_index,
                  std::shared_ptr<LanguageModel> language_model,
                  std::shared_ptr<ContentExtractorFactory> extractor_factory,
                  std::shared_ptr<ScopeLocks> scope_locks,
                  ChunkingOptions chunking_options = {});

  DocumentService(const DocumentService &) = delete;
  DocumentService &operator=(const DocumentService &) = delete;

  Document ingest_file(const std::string &knowledge_base_id, const std::filesystem::path &file_path);

  // The filename picks the extractor and becomes the fragments' source_document
  Document ingest_text(const std::string &knowledge_base_id,
                       const std::string &filename,
                       const std::string &content);

  void delete_document(const std::string &knowledge_base_id, const std::string &document_id);

  /**
   * @brief Marks documents left PENDING or PROCESSING by an earlier run as ERROR.
   *
   * Any fragments such a document already stored are dropped from the store
   * and the index. Call once at start-up, before serving requests.
   * @return The number of documents marked as failed.
   */
  size_t recover_interrupted_ingestions();

  std::vector<Document> list_documents(const std::string &knowledge_base_id);
  Document get_document(const std::string &knowledge_base_id, const std::string &document_id);

 private:
  void require_knowledge_base(const std::string &knowledge_base_id);
  Document ingest(const std::string &knowledge_base_id,
                  const std::string &filename,
                  const ExtractedDocument &extracted);
  std::vector<Fragment> build_fragments(const Document &document,
                                        const ExtractedDocument &extracted);
  void discard_failed_ingestion(const Document &document,
                                bool fragments_saved,
                                const std::string &reason);

  std::shared_ptr<KnowledgeBaseStore> knowledge_base_store_;
  std::shared_ptr<FragmentStore> fragment_store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<LanguageModel> language_model_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  std::shared_ptr<ScopeLocks> scope_locks_;
  Chunker chunker_;
};

}  // namespace ragline_core
