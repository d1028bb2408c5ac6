#pragma once

#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

// Exhaustive-search index held entirely in memory. Used for tests and small
// deployments.
class InMemoryVectorIndex : public VectorIndex {
 public:
  explicit InMemoryVectorIndex(size_t dimension);

  void store(const std::vector<Fragment> &fragments) override;
  std::vector<FragmentSearchResult> search(const std::vector<float> &query_vector,
                                           const std::string &scope_id,
                                           int top_k) const override;
  void delete_by_document(const std::string &document_id) override;
  void delete_by_scope(const std::string &scope_id) override;

  size_t size() const override;
  uint64_t generation() const override;

 private:
  template <typename Predicate>
  void rebuild_without(Predicate should_remove);

  std::vector<Fragment> entries_;
  std::atomic<uint64_t> generation_{0};

  // Serializes writers; readers only take entries_mutex_
  std::mutex writer_mutex_;
  mutable std::shared_mutex entries_mutex_;
};

}  // namespace ragline_core
