#include "ragline_core/services/document_service.hpp"

#include <chrono>
#include <iostream>
#include <shared_mutex>

#include "ragline_core/utils/id_generator.hpp"

namespace ragline_core {

DocumentService::DocumentService(std::shared_ptr<KnowledgeBaseStore> knowledge_base_store,
                                 std::shared_ptr<FragmentStore> fragment_store,
                                 std::shared_ptr<VectorIndex> vector_index,
                                 std::shared_ptr<LanguageModel> language_model,
                                 std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                 std::shared_ptr<ScopeLocks> scope_locks,
                                 ChunkingOptions chunking_options)
    : knowledge_base_store_(std::move(knowledge_base_store)),
      fragment_store_(std::move(fragment_store)),
      vector_index_(std::move(vector_index)),
      language_model_(std::move(language_model)),
      extractor_factory_(std::move(extractor_factory)),
      scope_locks_(std::move(scope_locks)),
      chunker_(chunking_options) {}

void DocumentService::require_knowledge_base(const std::string &knowledge_base_id) {
  if (!knowledge_base_store_->knowledge_base_exists(knowledge_base_id)) {
    throw NotFoundError("Knowledge base not found: " + knowledge_base_id);
  }
}

Document DocumentService::ingest_file(const std::string &knowledge_base_id,
                                      const std::filesystem::path &file_path) {
  require_knowledge_base(knowledge_base_id);
  if (!std::filesystem::is_regular_file(file_path)) {
    throw ValidationError("File not found: " + file_path.string());
  }

  const ContentExtractor &extractor = extractor_factory_->get_extractor_for(file_path);
  ExtractedDocument extracted;
  try {
    extracted = extractor.extract(file_path);
  } catch (const ContentExtractorError &e) {
    throw DocumentServiceError(e.what());
  }
  return ingest(knowledge_base_id, file_path.filename().string(), extracted);
}

Document DocumentService::ingest_text(const std::string &knowledge_base_id,
                                      const std::string &filename,
                                      const std::string &content) {
  require_knowledge_base(knowledge_base_id);
  if (filename.empty()) {
    throw ValidationError("filename is required");
  }

  const ContentExtractor &extractor = extractor_factory_->get_extractor_for(filename);
  ExtractedDocument extracted;
  try {
    extracted = extractor.extract_text(filename, content);
  } catch (const ContentExtractorError &e) {
    throw DocumentServiceError(e.what());
  }
  return ingest(knowledge_base_id, filename, extracted);
}

std::vector<Fragment> DocumentService::build_fragments(const Document &document,
                                                       const ExtractedDocument &extracted) {
  std::vector<Fragment> fragments;
  for (const auto &page : extracted.pages) {
    for (auto &candidate : chunker_.chunk(page.content, page.source_document, page.page_number)) {
      Fragment fragment;
      fragment.id = generate_uuid();
      fragment.document_id = document.id;
      fragment.knowledge_base_id = document.knowledge_base_id;
      fragment.content = std::move(candidate.content);
      fragment.metadata = std::move(candidate.metadata);
      fragments.push_back(std::move(fragment));
    }
  }

  for (auto &fragment : fragments) {
    fragment.embedding = language_model_->embed(fragment.content);
  }
  return fragments;
}

void DocumentService::discard_failed_ingestion(const Document &document,
                                               bool fragments_saved,
                                               const std::string &reason) {
  if (fragments_saved) {
    try {
      vector_index_->delete_by_document(document.id);
    } catch (const std::exception &e) {
      std::cerr << "[DocumentService] Could not drop vectors of " << document.id << ": "
                << e.what() << std::endl;
    }
    try {
      fragment_store_->delete_by_document(document.id);
    } catch (const std::exception &e) {
      std::cerr << "[DocumentService] Could not drop fragments of " << document.id << ": "
                << e.what() << std::endl;
    }
  }
  try {
    knowledge_base_store_->update_document_status(document.id, DocumentStatus::ERROR, 0, reason);
  } catch (const std::exception &e) {
    std::cerr << "[DocumentService] Could not mark " << document.id << " as failed: " << e.what()
              << std::endl;
  }
}

Document DocumentService::ingest(const std::string &knowledge_base_id,
                                 const std::string &filename,
                                 const ExtractedDocument &extracted) {
  std::shared_ptr<std::shared_mutex> scope_lock = scope_locks_->lock_for(knowledge_base_id);
  std::shared_lock<std::shared_mutex> lock(*scope_lock);
  // The knowledge base may have been removed while this call waited for the lock
  require_knowledge_base(knowledge_base_id);

  Document document;
  document.id = generate_uuid();
  document.knowledge_base_id = knowledge_base_id;
  document.filename = filename;
  document.content_hash = extracted.content_hash;
  document.status = DocumentStatus::PROCESSING;
  document.uploaded_at = std::chrono::system_clock::now();
  knowledge_base_store_->save_document(document);

  std::cout << "[DocumentService] Ingesting " << filename << " (" << extracted.pages.size()
            << " pages) into " << knowledge_base_id << std::endl;

  bool fragments_saved = false;
  try {
    std::vector<Fragment> fragments = build_fragments(document, extracted);

    fragment_store_->save_fragments(fragments);
    fragments_saved = true;
    vector_index_->store(fragments);

    document.status = DocumentStatus::INDEXED;
    document.chunks_count = static_cast<int>(fragments.size());
    knowledge_base_store_->update_document_status(document.id, document.status,
                                                   document.chunks_count);
    knowledge_base_store_->touch_knowledge_base(knowledge_base_id);
  } catch (const std::exception &e) {
    std::cerr << "[DocumentService] Ingestion of " << filename << " failed: " << e.what()
              << std::endl;
    discard_failed_ingestion(document, fragments_saved, e.what());
    throw DocumentServiceError("Failed to ingest " + filename + ": " + e.what());
  }

  std::cout << "[DocumentService] Indexed " << document.chunks_count << " fragments from "
            << filename << std::endl;
  return document;
}

void DocumentService::delete_document(const std::string &knowledge_base_id,
                                      const std::string &document_id) {
  // Checks ownership as well as existence
  get_document(knowledge_base_id, document_id);

  vector_index_->delete_by_document(document_id);
  fragment_store_->delete_by_document(document_id);
  knowledge_base_store_->delete_document(document_id);
  knowledge_base_store_->touch_knowledge_base(knowledge_base_id);
}

size_t DocumentService::recover_interrupted_ingestions() {
  const std::vector<std::string> interrupted =
      knowledge_base_store_->fail_unfinished_documents("Ingestion was interrupted");
  for (const auto &document_id : interrupted) {
    vector_index_->delete_by_document(document_id);
    fragment_store_->delete_by_document(document_id);
  }
  if (!interrupted.empty()) {
    std::cout << "[DocumentService] Marked " << interrupted.size()
              << " interrupted ingestions as failed" << std::endl;
  }
  return interrupted.size();
}

std::vector<Document> DocumentService::list_documents(const std::string &knowledge_base_id) {
  require_knowledge_base(knowledge_base_id);
  return knowledge_base_store_->list_documents(knowledge_base_id);
}

Document DocumentService::get_document(const std::string &knowledge_base_id,
                                       const std::string &document_id) {
  require_knowledge_base(knowledge_base_id);
  std::optional<Document> document = knowledge_base_store_->get_document(document_id);
  if (!document || document->knowledge_base_id != knowledge_base_id) {
    throw NotFoundError("Document not found: " + document_id);
  }
  return *document;
}

}  // namespace ragline_core
