#pragma once

#include <string>
#include <vector>

#include "ragline_core/db/database_manager.hpp"
#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

class FragmentStoreError : public std::exception {
 public:
  explicit FragmentStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class FragmentStore
 * @brief Durable copy of indexed fragments, used to rebuild the vector index at startup.
 *
 * Content is stored zstd-compressed, embeddings as raw float32 blobs and
 * metadata as a JSON object. Fragments load back in (document, position) order.
 */
class FragmentStore {
 public:
  explicit FragmentStore(DatabaseManager &db_manager);

  FragmentStore(const FragmentStore &) = delete;
  FragmentStore &operator=(const FragmentStore &) = delete;

  // All fragments are written in one transaction; the batch order is kept as the position
  void save_fragments(const std::vector<Fragment> &fragments);

  std::vector<Fragment> load_all();
  std::vector<Fragment> load_by_knowledge_base(const std::string &knowledge_base_id);
  std::vector<Fragment> load_by_document(const std::string &document_id);

  int delete_by_document(const std::string &document_id);
  int delete_by_knowledge_base(const std::string &knowledge_base_id);

  int count(const std::string &knowledge_base_id);

 private:
  std::vector<Fragment> load_where(const std::string &where_clause, const std::string &value);

  DatabaseManager &db_manager_;
};

}  // namespace ragline_core
