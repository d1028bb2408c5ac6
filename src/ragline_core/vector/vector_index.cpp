#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

VectorIndex::VectorIndex(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw VectorIndexError("Vector index dimension must be greater than 0");
  }
}

void VectorIndex::validate_dimension(const std::vector<float> &vector,
                                     const std::string &context) const {
  if (vector.size() != dimension_) {
    throw VectorIndexError(context + " dimension mismatch. Expected " +
                           std::to_string(dimension_) + ", got " +
                           std::to_string(vector.size()));
  }
}

void VectorIndex::validate_batch(const std::vector<Fragment> &fragments) const {
  for (const auto &fragment : fragments) {
    if (fragment.embedding) {
      validate_dimension(*fragment.embedding, "Fragment " + fragment.id + " embedding");
    }
  }
}

float squared_l2_distance(const float *a, const float *b, size_t dimension) {
  float sum = 0.0f;
  for (size_t i = 0; i < dimension; ++i) {
    const float diff = a[i] - b[i];
    sum += diff * diff;
  }
  return sum;
}

}  // namespace ragline_core
