#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ragline_core/db/fragment_store.hpp"
#include "ragline_core/db/knowledge_base_store.hpp"
#include "ragline_core/services/scope_locks.hpp"
#include "ragline_core/services/service_errors.hpp"
#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

class KnowledgeBaseService {
 public:
  KnowledgeBaseService(std::shared_ptr<KnowledgeBaseStore> knowledge_base_store,
                       std::shared_ptr<FragmentStore> fragment_store,
                       std::shared_ptr<VectorIndex> vector_index,
                       std::shared_ptr<ScopeLocks> scope_locks);

  KnowledgeBaseService(const KnowledgeBaseService &) = delete;
  KnowledgeBaseService &operator=(const KnowledgeBaseService &) = delete;

  // Name is trimmed and must not be empty
  KnowledgeBase create(const std::string &name,
                       const std::optional<std::string> &description = std::nullopt);

  KnowledgeBase get(const std::string &id);
  std::vector<KnowledgeBase> list();

  // Waits for in-flight ingestion into the knowledge base, then drops its
  // vectors and rows
  void remove(const std::string &id);

 private:
  std::shared_ptr<KnowledgeBaseStore> knowledge_base_store_;
  std::shared_ptr<FragmentStore> fragment_store_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<ScopeLocks> scope_locks_;
};

}  // namespace ragline_core
