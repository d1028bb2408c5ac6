#include "ragline_core/vector/in_memory_vector_index.hpp"

#include <algorithm>

namespace ragline_core {

InMemoryVectorIndex::InMemoryVectorIndex(size_t dimension) : VectorIndex(dimension) {}

void InMemoryVectorIndex::store(const std::vector<Fragment> &fragments) {
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);
  validate_batch(fragments);

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  for (const auto &fragment : fragments) {
    if (!fragment.embedding) {
      continue;
    }
    entries_.push_back(fragment);
  }
}

std::vector<FragmentSearchResult> InMemoryVectorIndex::search(
    const std::vector<float> &query_vector, const std::string &scope_id, int top_k) const {
  validate_dimension(query_vector, "Query vector");
  if (top_k <= 0) {
    return {};
  }

  std::shared_lock<std::shared_mutex> lock(entries_mutex_);

  // (distance, position) pairs so ties keep insertion order
  std::vector<std::pair<float, size_t>> candidates;
  candidates.reserve(entries_.size());
  for (size_t i = 0; i < entries_.size(); ++i) {
    const Fragment &entry = entries_[i];
    if (entry.knowledge_base_id != scope_id) {
      continue;
    }
    candidates.emplace_back(
        squared_l2_distance(query_vector.data(), entry.embedding->data(), dimension()), i);
  }

  const size_t count = std::min(static_cast<size_t>(top_k), candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + count, candidates.end());

  std::vector<FragmentSearchResult> results;
  results.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    results.push_back({entries_[candidates[i].second], candidates[i].first});
  }
  return results;
}

template <typename Predicate>
void InMemoryVectorIndex::rebuild_without(Predicate should_remove) {
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);

  // Only writers modify entries_, so reading it here under the writer lock is safe
  std::vector<Fragment> survivors;
  survivors.reserve(entries_.size());
  for (const auto &entry : entries_) {
    if (!should_remove(entry)) {
      survivors.push_back(entry);
    }
  }

  std::unique_lock<std::shared_mutex> lock(entries_mutex_);
  entries_.swap(survivors);
  ++generation_;
}

void InMemoryVectorIndex::delete_by_document(const std::string &document_id) {
  rebuild_without([&](const Fragment &f) { return f.document_id == document_id; });
}

void InMemoryVectorIndex::delete_by_scope(const std::string &scope_id) {
  rebuild_without([&](const Fragment &f) { return f.knowledge_base_id == scope_id; });
}

size_t InMemoryVectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(entries_mutex_);
  return entries_.size();
}

uint64_t InMemoryVectorIndex::generation() const {
  return generation_.load();
}

}  // namespace ragline_core
