#include "ragline_core/vector/faiss_vector_index.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <iostream>

namespace ragline_core {

FaissVectorIndex::FaissVectorIndex(size_t dimension)
    : VectorIndex(dimension), active_(build_snapshot({})) {}

FaissVectorIndex::~FaissVectorIndex() = default;

std::unique_ptr<FaissVectorIndex::Snapshot> FaissVectorIndex::build_snapshot(
    std::vector<Fragment> fragments) const {
  auto snapshot = std::make_unique<Snapshot>();
  snapshot->index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension()));
  append_to_snapshot(*snapshot, fragments);
  return snapshot;
}

void FaissVectorIndex::append_to_snapshot(Snapshot &snapshot,
                                          const std::vector<Fragment> &fragments) const {
  std::vector<float> vectors_flat;
  std::vector<const Fragment *> added;
  for (const auto &fragment : fragments) {
    if (!fragment.embedding) {
      continue;
    }
    vectors_flat.insert(vectors_flat.end(), fragment.embedding->begin(), fragment.embedding->end());
    added.push_back(&fragment);
  }
  if (added.empty()) {
    return;
  }

  try {
    snapshot.index->add(static_cast<faiss::idx_t>(added.size()), vectors_flat.data());
  } catch (const faiss::FaissException &e) {
    throw VectorIndexError("Failed to add vectors to faiss index: " + std::string(e.what()));
  }
  // Positions in fragments must match faiss labels
  for (const Fragment *fragment : added) {
    snapshot.fragments.push_back(*fragment);
  }
}

void FaissVectorIndex::store(const std::vector<Fragment> &fragments) {
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);
  validate_batch(fragments);

  // IndexFlatL2::add appends in place, so readers are held off for the duration
  std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
  append_to_snapshot(*active_, fragments);
}

std::vector<FragmentSearchResult> FaissVectorIndex::search(const std::vector<float> &query_vector,
                                                           const std::string &scope_id,
                                                           int top_k) const {
  validate_dimension(query_vector, "Query vector");
  if (top_k <= 0) {
    return {};
  }

  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  const Snapshot &snapshot = *active_;
  const faiss::idx_t total = snapshot.index->ntotal;
  if (total == 0) {
    return {};
  }

  // Over-fetch and filter by scope; widen the window until enough hits survive
  // the filter or every stored vector has been considered.
  faiss::idx_t fetch = std::min<faiss::idx_t>(static_cast<faiss::idx_t>(top_k) * OVERFETCH_FACTOR, total);
  std::vector<FragmentSearchResult> results;
  while (true) {
    std::vector<float> distances(fetch);
    std::vector<faiss::idx_t> labels(fetch);
    try {
      snapshot.index->search(1, query_vector.data(), fetch, distances.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      throw VectorIndexError("faiss search failed: " + std::string(e.what()));
    }

    results.clear();
    for (faiss::idx_t i = 0; i < fetch; ++i) {
      const faiss::idx_t label = labels[i];
      if (label < 0 || static_cast<size_t>(label) >= snapshot.fragments.size()) {
        continue;
      }
      const Fragment &fragment = snapshot.fragments[static_cast<size_t>(label)];
      if (fragment.knowledge_base_id != scope_id) {
        continue;
      }
      results.push_back({fragment, distances[i]});
      if (results.size() >= static_cast<size_t>(top_k)) {
        break;
      }
    }

    if (results.size() >= static_cast<size_t>(top_k) || fetch >= total) {
      break;
    }
    fetch = std::min<faiss::idx_t>(fetch * 2, total);
  }

  return results;
}

template <typename Predicate>
void FaissVectorIndex::rebuild_without(Predicate should_remove) {
  std::lock_guard<std::mutex> writer_lock(writer_mutex_);

  std::vector<Fragment> survivors;
  survivors.reserve(active_->fragments.size());
  for (const auto &fragment : active_->fragments) {
    if (!should_remove(fragment)) {
      survivors.push_back(fragment);
    }
  }

  // Built without blocking readers; they keep searching the old snapshot
  std::unique_ptr<Snapshot> rebuilt = build_snapshot(std::move(survivors));

  {
    std::unique_lock<std::shared_mutex> lock(snapshot_mutex_);
    active_.swap(rebuilt);
    ++generation_;
  }
  std::cout << "[FaissVectorIndex] Rebuilt index with " << active_->index->ntotal
            << " vectors (generation " << generation_.load() << ")" << std::endl;
}

void FaissVectorIndex::delete_by_document(const std::string &document_id) {
  rebuild_without([&](const Fragment &f) { return f.document_id == document_id; });
}

void FaissVectorIndex::delete_by_scope(const std::string &scope_id) {
  rebuild_without([&](const Fragment &f) { return f.knowledge_base_id == scope_id; });
}

size_t FaissVectorIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(snapshot_mutex_);
  return static_cast<size_t>(active_->index->ntotal);
}

uint64_t FaissVectorIndex::generation() const {
  return generation_.load();
}

}  // namespace ragline_core
