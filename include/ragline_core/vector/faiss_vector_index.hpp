#pragma once

#include <faiss/IndexFlat.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

/**
 * @class FaissVectorIndex
 * @brief Vector index backed by a faiss IndexFlatL2.
 *
 * faiss positions are implicit (0..ntotal-1), so fragments_ is kept in the same
 * order as the vectors in the faiss index. faiss has no point deletion here:
 * deletes build a new snapshot from the surviving fragments and swap it in.
 */
class FaissVectorIndex : public VectorIndex {
 public:
  // Candidates fetched per requested result before the scope filter is applied
  static constexpr int OVERFETCH_FACTOR = 3;

  explicit FaissVectorIndex(size_t dimension);
  ~FaissVectorIndex() override;

  void store(const std::vector<Fragment> &fragments) override;
  std::vector<FragmentSearchResult> search(const std::vector<float> &query_vector,
                                           const std::string &scope_id,
                                           int top_k) const override;
  void delete_by_document(const std::string &document_id) override;
  void delete_by_scope(const std::string &scope_id) override;

  size_t size() const override;
  uint64_t generation() const override;

 private:
  struct Snapshot {
    std::unique_ptr<faiss::IndexFlatL2> index;
    std::vector<Fragment> fragments;
  };

  std::unique_ptr<Snapshot> build_snapshot(std::vector<Fragment> fragments) const;
  void append_to_snapshot(Snapshot &snapshot, const std::vector<Fragment> &fragments) const;

  template <typename Predicate>
  void rebuild_without(Predicate should_remove);

  std::unique_ptr<Snapshot> active_;
  std::atomic<uint64_t> generation_{0};

  std::mutex writer_mutex_;
  mutable std::shared_mutex snapshot_mutex_;
};

}  // namespace ragline_core
