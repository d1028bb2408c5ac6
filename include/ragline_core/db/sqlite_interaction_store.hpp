#pragma once

#include "ragline_core/db/database_manager.hpp"
#include "ragline_core/db/interaction_store.hpp"

namespace ragline_core {

class SqliteInteractionStore : public InteractionStore {
 public:
  explicit SqliteInteractionStore(DatabaseManager &db_manager);

  SqliteInteractionStore(const SqliteInteractionStore &) = delete;
  SqliteInteractionStore &operator=(const SqliteInteractionStore &) = delete;

  void save(const Interaction &interaction) override;
  std::optional<Interaction> get(const std::string &id) override;
  std::vector<Interaction> list(const std::optional<std::string> &knowledge_base_id,
                                int limit = DEFAULT_LIST_LIMIT,
                                int offset = 0) override;
  std::map<InteractionStatus, int> count_by_status(
      const std::optional<std::string> &knowledge_base_id = std::nullopt) override;

 private:
  DatabaseManager &db_manager_;
};

}  // namespace ragline_core
