#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class VectorIndex
 * @brief Similarity search over fragment embeddings, partitioned by knowledge base.
 *
 * Every implementation ranks by squared Euclidean distance and uses one fixed
 * dimension chosen at construction. Searches may run concurrently; store and
 * delete operations exclude each other and never expose a partially rebuilt
 * index to a concurrent search.
 */
class VectorIndex {
 public:
  explicit VectorIndex(size_t dimension);
  virtual ~VectorIndex() = default;

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  /**
   * @brief Appends fragments that carry an embedding.
   *
   * Fragments without an embedding are skipped. Storing the same fragment id
   * twice keeps both entries.
   *
   * @throw VectorIndexError if any embedding has the wrong dimension; nothing
   *        from the batch is stored in that case.
   */
  virtual void store(const std::vector<Fragment> &fragments) = 0;

  /**
   * @brief Returns up to top_k fragments of scope_id, nearest first.
   * @throw VectorIndexError if the query vector has the wrong dimension.
   */
  virtual std::vector<FragmentSearchResult> search(const std::vector<float> &query_vector,
                                                   const std::string &scope_id,
                                                   int top_k) const = 0;

  virtual void delete_by_document(const std::string &document_id) = 0;
  virtual void delete_by_scope(const std::string &scope_id) = 0;

  // Number of stored vectors across all scopes
  virtual size_t size() const = 0;

  // Incremented every time the index is rebuilt by a delete
  virtual uint64_t generation() const = 0;

  size_t dimension() const {
    return dimension_;
  }

 protected:
  void validate_dimension(const std::vector<float> &vector, const std::string &context) const;
  void validate_batch(const std::vector<Fragment> &fragments) const;

 private:
  size_t dimension_;
};

float squared_l2_distance(const float *a, const float *b, size_t dimension);

}  // namespace ragline_core
