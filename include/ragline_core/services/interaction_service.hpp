#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ragline_core/db/interaction_store.hpp"
#include "ragline_core/db/knowledge_base_store.hpp"
#include "ragline_core/services/service_errors.hpp"

namespace ragline_core {

struct DashboardStats {
  int total_interactions = 0;
  int answered_count = 0;
  int unknown_count = 0;
  int error_count = 0;
  int knowledge_base_count = 0;
  int document_count = 0;
};

// Read side of the interaction log
class InteractionService {
 public:
  static constexpr int MAX_LIST_LIMIT = 500;

  InteractionService(std::shared_ptr<InteractionStore> interaction_store,
                     std::shared_ptr<KnowledgeBaseStore> knowledge_base_store);

  InteractionService(const InteractionService &) = delete;
  InteractionService &operator=(const InteractionService &) = delete;

  std::vector<Interaction> list(const std::optional<std::string> &knowledge_base_id,
                                int limit = InteractionStore::DEFAULT_LIST_LIMIT,
                                int offset = 0);

  Interaction get(const std::string &id);

  DashboardStats dashboard_stats();

 private:
  std::shared_ptr<InteractionStore> interaction_store_;
  std::shared_ptr<KnowledgeBaseStore> knowledge_base_store_;
};

}  // namespace ragline_core
