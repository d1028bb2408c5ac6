#pragma once

#include <memory>
#include <string>

#include "ragline_core/db/fragment_store.hpp"
#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

// kind is "faiss" or "memory"
std::shared_ptr<VectorIndex> create_vector_index(const std::string &kind, size_t dimension);

// Loads every persisted fragment into an empty index; returns the number stored
size_t restore_vector_index(VectorIndex &index, FragmentStore &fragment_store);

}  // namespace ragline_core
