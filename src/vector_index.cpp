#include "vector_index.hpp"
#include "errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace slidesearch {

VectorIndex VectorIndex::build(const std::vector<Embedding>& vectors) {
    if (vectors.empty()) {
        throw EmptyCorpusError("cannot build an index over zero vectors");
    }

    const size_t dim = vectors.front().size();
    if (dim == 0) {
        throw DimensionMismatchError("vector 0 has zero dimensions");
    }
    for (size_t i = 1; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim) {
            throw DimensionMismatchError(
                "vector " + std::to_string(i) + " has " +
                std::to_string(vectors[i].size()) + " dimensions, expected " +
                std::to_string(dim));
        }
    }

    VectorIndex index;
    index.dim_ = static_cast<uint32_t>(dim);
    index.count_ = vectors.size();
    index.data_.reserve(dim * vectors.size());
    for (const auto& v : vectors) {
        index.data_.insert(index.data_.end(), v.begin(), v.end());
    }
    return index;
}

std::vector<Neighbor> VectorIndex::search(const Embedding& query, size_t k) const {
    if (k == 0) {
        throw std::invalid_argument("k must be at least 1");
    }
    if (count_ == 0) {
        throw EmptyIndexError("index holds no vectors");
    }
    if (query.size() != dim_) {
        throw DimensionMismatchError(
            "query has " + std::to_string(query.size()) +
            " dimensions, index has " + std::to_string(dim_));
    }

    std::vector<Neighbor> scored;
    scored.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        double s = inner_product(query.data(), data_.data() + i * dim_, dim_);
        scored.push_back({i, static_cast<float>(std::clamp(s, -1.0, 1.0))});
    }

    // partial_sort: only order the top-K rows
    k = std::min(k, count_);
    std::partial_sort(scored.begin(), scored.begin() + static_cast<ptrdiff_t>(k), scored.end(),
                      [](const Neighbor& a, const Neighbor& b) {
                          if (a.score != b.score) return a.score > b.score;
                          return a.position < b.position;
                      });
    scored.resize(k);
    return scored;
}

Embedding VectorIndex::vector(size_t position) const {
    if (position >= count_) {
        throw std::out_of_range("index position " + std::to_string(position) +
                                " out of range");
    }
    auto begin = data_.begin() + static_cast<ptrdiff_t>(position * dim_);
    return Embedding(begin, begin + dim_);
}

} // namespace slidesearch
