#pragma once
#include "vector.hpp"
#include <cstdint>
#include <vector>

namespace slidesearch {

struct Neighbor {
    size_t position;   // row in the index, i.e. position in the corpus
    float score;       // inner product with the query
};

// Exact inner-product index over a contiguous row-major matrix.
// Callers normalize vectors first so the score is cosine similarity.
// Immutable once built; concurrent search() calls are safe.
class VectorIndex {
public:
    // An empty index. search() on it throws EmptyIndexError.
    VectorIndex() = default;

    // Copies vectors in order. Throws EmptyCorpusError for no vectors and
    // DimensionMismatchError if the lengths differ (or are zero).
    static VectorIndex build(const std::vector<Embedding>& vectors);

    // Top min(k, size()) rows by descending score, clamped to [-1, 1]; equal
    // scores keep the lower position first. Throws std::invalid_argument for k == 0,
    // EmptyIndexError on an empty index and DimensionMismatchError when the
    // query length differs from dimensions().
    std::vector<Neighbor> search(const Embedding& query, size_t k) const;

    size_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    uint32_t dimensions() const { return dim_; }

    // Copy of the stored row at position.
    Embedding vector(size_t position) const;

private:
    std::vector<float> data_;   // [v0[0..dim-1], v1[0..dim-1], ...]
    uint32_t dim_ = 0;
    size_t count_ = 0;
};

} // namespace slidesearch
