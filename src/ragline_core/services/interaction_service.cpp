#include "ragline_core/services/interaction_service.hpp"

namespace ragline_core {

InteractionService::InteractionService(std::shared_ptr<InteractionStore> interaction_store,
                                       std::shared_ptr<KnowledgeBaseStore> knowledge_base_store)
    : interaction_store_(std::move(interaction_store)),
      knowledge_base_store_(std::move(knowledge_base_store)) {}

std::vector<Interaction> InteractionService::list(
    const std::optional<std::string> &knowledge_base_id, int limit, int offset) {
  if (limit <= 0 || limit > MAX_LIST_LIMIT) {
    throw ValidationError("limit must be between 1 and " + std::to_string(MAX_LIST_LIMIT));
  }
  if (offset < 0) {
    throw ValidationError("offset must not be negative");
  }
  return interaction_store_->list(knowledge_base_id, limit, offset);
}

Interaction InteractionService::get(const std::string &id) {
  std::optional<Interaction> interaction = interaction_store_->get(id);
  if (!interaction) {
    throw NotFoundError("Interaction not found: " + id);
  }
  return *interaction;
}

DashboardStats InteractionService::dashboard_stats() {
  const auto counts = interaction_store_->count_by_status();

  DashboardStats stats;
  auto count_of = [&](InteractionStatus status) {
    auto it = counts.find(status);
    return it == counts.end() ? 0 : it->second;
  };
  stats.answered_count = count_of(InteractionStatus::ANSWERED);
  stats.unknown_count = count_of(InteractionStatus::UNKNOWN);
  stats.error_count = count_of(InteractionStatus::ERROR);
  stats.total_interactions = stats.answered_count + stats.unknown_count + stats.error_count;
  stats.knowledge_base_count = knowledge_base_store_->count_knowledge_bases();
  stats.document_count = knowledge_base_store_->count_documents();
  return stats;
}

}  // namespace ragline_core
