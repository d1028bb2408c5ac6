#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ragline_core/types/interaction.hpp"

namespace ragline_core {

class InteractionStoreError : public std::exception {
 public:
  explicit InteractionStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class InteractionStore
 * @brief Append-only audit log of query executions.
 *
 * Records are never updated or deleted through this interface.
 */
class InteractionStore {
 public:
  static constexpr int DEFAULT_LIST_LIMIT = 50;

  virtual ~InteractionStore() = default;

  virtual void save(const Interaction &interaction) = 0;
  virtual std::optional<Interaction> get(const std::string &id) = 0;

  // Most recent first, optionally restricted to one knowledge base
  virtual std::vector<Interaction> list(const std::optional<std::string> &knowledge_base_id,
                                        int limit = DEFAULT_LIST_LIMIT,
                                        int offset = 0) = 0;

  virtual std::map<InteractionStatus, int> count_by_status(
      const std::optional<std::string> &knowledge_base_id = std::nullopt) = 0;
};

}  // namespace ragline_core
