#pragma once
#include <vector>
#include <string>
#include <cstddef>

namespace slidesearch {

using Embedding = std::vector<float>;

// Dot product of two equal-length float arrays, accumulated in double.
double inner_product(const float* a, const float* b, size_t n);

// Cosine similarity between two float vectors. Returns 0.0 if either is
// empty, zero-magnitude, or the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

// Scale to unit L2 norm in place. Zero vectors are left unchanged.
void l2_normalize(Embedding& vec);

double l2_norm(const Embedding& vec);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector. Returns an empty
// vector if the size is not a multiple of sizeof(float).
Embedding deserialize_vector(const std::string& data);

} // namespace slidesearch
