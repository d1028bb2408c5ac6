#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ragline_core/db/database_manager.hpp"
#include "ragline_core/types/knowledge_base.hpp"

namespace ragline_core {

class KnowledgeBaseStoreError : public std::exception {
 public:
  explicit KnowledgeBaseStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class KnowledgeBaseStore
 * @brief Rows of the knowledge_bases and documents tables.
 *
 * Deleting a knowledge base cascades to its documents, and through them to
 * their fragments. Interactions are kept as history.
 */
class KnowledgeBaseStore {
 public:
  explicit KnowledgeBaseStore(DatabaseManager &db_manager);

  KnowledgeBaseStore(const KnowledgeBaseStore &) = delete;
  KnowledgeBaseStore &operator=(const KnowledgeBaseStore &) = delete;

  // Knowledge bases
  void create_knowledge_base(const KnowledgeBase &knowledge_base);
  std::optional<KnowledgeBase> get_knowledge_base(const std::string &id);
  std::vector<KnowledgeBase> list_knowledge_bases();
  bool knowledge_base_exists(const std::string &id);
  bool delete_knowledge_base(const std::string &id);
  void touch_knowledge_base(const std::string &id);
  int count_knowledge_bases();

  // Documents
  void save_document(const Document &document);
  std::optional<Document> get_document(const std::string &id);
  std::vector<Document> list_documents(const std::string &knowledge_base_id);
  void update_document_status(const std::string &id,
                              DocumentStatus status,
                              int chunks_count,
                              const std::optional<std::string> &error_message = std::nullopt);
  bool delete_document(const std::string &id);
  // Marks every PENDING or PROCESSING document as ERROR and returns their ids
  std::vector<std::string> fail_unfinished_documents(const std::string &error_message);
  int count_documents(const std::optional<std::string> &knowledge_base_id = std::nullopt);

 private:
  DatabaseManager &db_manager_;
};

}  // namespace ragline_core
