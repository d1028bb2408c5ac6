#include "ragline_core/services/knowledge_base_service.hpp"

#include <chrono>
#include <iostream>
#include <mutex>

#include "ragline_core/utils/id_generator.hpp"

namespace ragline_core {

namespace {

std::string trim(const std::string &text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

}  // namespace

KnowledgeBaseService::KnowledgeBaseService(
    std::shared_ptr<KnowledgeBaseStore> knowledge_base_store,
    std::shared_ptr<FragmentStore> fragment_store,
    std::shared_ptr<VectorIndex> vector_index,
    std::shared_ptr<ScopeLocks> scope_locks)
    : knowledge_base_store_(std::move(knowledge_base_store)),
      fragment_store_(std::move(fragment_store)),
      vector_index_(std::move(vector_index)),
      scope_locks_(std::move(scope_locks)) {}

KnowledgeBase KnowledgeBaseService::create(const std::string &name,
                                           const std::optional<std::string> &description) {
  const std::string trimmed = trim(name);
  if (trimmed.empty()) {
    throw ValidationError("Knowledge base name is required");
  }

  KnowledgeBase knowledge_base;
  knowledge_base.id = generate_uuid();
  knowledge_base.name = trimmed;
  knowledge_base.description = description;
  knowledge_base.created_at = std::chrono::system_clock::now();
  knowledge_base.updated_at = knowledge_base.created_at;
  knowledge_base_store_->create_knowledge_base(knowledge_base);

  std::cout << "[KnowledgeBaseService] Created knowledge base '" << trimmed << "' ("
            << knowledge_base.id << ")" << std::endl;
  return knowledge_base;
}

KnowledgeBase KnowledgeBaseService::get(const std::string &id) {
  std::optional<KnowledgeBase> knowledge_base = knowledge_base_store_->get_knowledge_base(id);
  if (!knowledge_base) {
    throw NotFoundError("Knowledge base not found: " + id);
  }
  return *knowledge_base;
}

std::vector<KnowledgeBase> KnowledgeBaseService::list() {
  return knowledge_base_store_->list_knowledge_bases();
}

void KnowledgeBaseService::remove(const std::string &id) {
  std::shared_ptr<std::shared_mutex> scope_lock = scope_locks_->lock_for(id);
  std::unique_lock<std::shared_mutex> lock(*scope_lock);
  if (!knowledge_base_store_->knowledge_base_exists(id)) {
    throw NotFoundError("Knowledge base not found: " + id);
  }

  vector_index_->delete_by_scope(id);
  const int removed = fragment_store_->delete_by_knowledge_base(id);
  knowledge_base_store_->delete_knowledge_base(id);

  std::cout << "[KnowledgeBaseService] Deleted knowledge base " << id << " with " << removed
            << " fragments" << std::endl;
}

}  // namespace ragline_core
