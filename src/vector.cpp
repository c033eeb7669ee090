#include "vector.hpp"
#include <cmath>
#include <cstring>

namespace slidesearch {

double inner_product(const float* a, const float* b, size_t n) {
    double dot = 0.0;
    for (size_t i = 0; i < n; i++) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return dot;
}

double l2_norm(const Embedding& vec) {
    return std::sqrt(inner_product(vec.data(), vec.data(), vec.size()));
}

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double norm_a = l2_norm(a);
    double norm_b = l2_norm(b);
    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    return inner_product(a.data(), b.data(), a.size()) / (norm_a * norm_b);
}

void l2_normalize(Embedding& vec) {
    double norm = l2_norm(vec);
    if (norm == 0.0) return;
    for (auto& v : vec) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace slidesearch
