#include "ragline_core/vector/vector_index_factory.hpp"

#include <iostream>

#include "ragline_core/vector/faiss_vector_index.hpp"
#include "ragline_core/vector/in_memory_vector_index.hpp"

namespace ragline_core {

std::shared_ptr<VectorIndex> create_vector_index(const std::string &kind, size_t dimension) {
  if (kind == "faiss") {
    return std::make_shared<FaissVectorIndex>(dimension);
  }
  if (kind == "memory") {
    return std::make_shared<InMemoryVectorIndex>(dimension);
  }
  throw VectorIndexError("Unknown vector index kind: " + kind);
}

size_t restore_vector_index(VectorIndex &index, FragmentStore &fragment_store) {
  std::vector<Fragment> fragments = fragment_store.load_all();
  if (fragments.empty()) {
    return 0;
  }

  try {
    index.store(fragments);
  } catch (const VectorIndexError &e) {
    throw VectorIndexError(
        "Stored fragments do not match the configured embedding dimension; re-ingest documents "
        "after changing the embedding model (" +
        std::string(e.what()) + ")");
  }
  std::cout << "[VectorIndex] Restored " << index.size() << " vectors from storage" << std::endl;
  return index.size();
}

}  // namespace ragline_core
