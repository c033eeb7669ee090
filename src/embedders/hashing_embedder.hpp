#pragma once
#include "../embedder.hpp"
#include "../util.hpp"
#include <string>

namespace slidesearch {

// Offline bag-of-words embedder (hashing trick). Each lowercase
// alphanumeric token is hashed with 64-bit FNV-1a into one of `dimensions`
// buckets with a hash-derived sign. Output depends only on the text, so it
// is stable across runs, platforms and threads. Vectors are not normalized.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(uint32_t dimensions = 384);

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_; }
    std::string embedder_name() const override { return "hashing"; }
    std::string model_id() const override;

    Embedding embed_text(const std::string& text) const;

private:
    uint32_t dimensions_;
};

} // namespace slidesearch
