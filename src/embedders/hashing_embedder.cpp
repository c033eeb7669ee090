#include "hashing_embedder.hpp"
#include "../util.hpp"
#include <stdexcept>

namespace slidesearch {

HashingEmbedder::HashingEmbedder(uint32_t dimensions) : dimensions_(dimensions) {
    if (dimensions_ == 0) {
        throw std::invalid_argument("HashingEmbedder requires at least one dimension");
    }
}

std::string HashingEmbedder::model_id() const {
    return "hashing:fnv1a-" + std::to_string(dimensions_);
}

Embedding HashingEmbedder::embed_text(const std::string& text) const {
    Embedding vec(dimensions_, 0.0f);
    for (const auto& token : tokenize(text)) {
        uint64_t h = fnv1a_64(token);
        size_t bucket = static_cast<size_t>(h % dimensions_);
        // top bit picks the sign so colliding tokens tend to cancel
        vec[bucket] += (h >> 63) ? -1.0f : 1.0f;
    }
    return vec;
}

std::vector<Embedding> HashingEmbedder::embed_batch(const std::vector<std::string>& texts) {
    require_embeddable(texts);

    std::vector<Embedding> result;
    result.reserve(texts.size());
    for (const auto& text : texts) {
        result.push_back(embed_text(text));
    }
    return result;
}

} // namespace slidesearch
