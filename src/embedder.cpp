#include "embedder.hpp"
#include "embedders/hashing_embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedders/reliable.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace slidesearch {

Embedding Embedder::embed_one(const std::string& text) {
    auto vectors = embed_batch({text});
    if (vectors.size() != 1) {
        throw EmbeddingError(embedder_name() + " returned " +
                             std::to_string(vectors.size()) + " vectors for one text");
    }
    return std::move(vectors.front());
}

void require_embeddable(const std::vector<std::string>& texts) {
    if (texts.empty()) {
        throw EmbeddingError("nothing to embed", false);
    }
    for (size_t i = 0; i < texts.size(); ++i) {
        if (trim(texts[i]).empty()) {
            throw EmbeddingError("text " + std::to_string(i) + " is empty", false);
        }
    }
}

void check_embedding_batch(const std::vector<Embedding>& vectors, size_t expected,
                           const std::string& source) {
    if (vectors.size() != expected) {
        throw EmbeddingError(source + " returned " + std::to_string(vectors.size()) +
                             " embeddings for " + std::to_string(expected) + " texts");
    }
    const size_t dim = vectors.empty() ? 0 : vectors.front().size();
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].empty() || vectors[i].size() != dim) {
            throw EmbeddingError(source + " returned a malformed embedding at position " +
                                 std::to_string(i));
        }
    }
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http) {
    const auto& emb = config.embeddings;
    const std::string& provider = emb.provider;
    long timeout = static_cast<long>(emb.timeout_seconds);

    std::string base_url = emb.base_url;
    if (base_url.empty()) base_url = config.base_url_for(provider);

    std::unique_ptr<Embedder> inner;
    std::string key = emb.api_key;
    if (key.empty()) key = config.api_key_for(provider);

    if (provider == "openai") {
        if (key.empty()) {
            throw std::invalid_argument("OpenAI embeddings configured but no API key found");
        }
        inner = create_openai_embedder(key, http, base_url, emb.model, timeout);
    } else if (provider == "compatible") {
        if (base_url.empty()) {
            throw std::invalid_argument("compatible embeddings require a base_url");
        }
        inner = create_compatible_embedder(key, http, base_url, emb.model, timeout);
    } else if (provider == "ollama") {
        inner = create_ollama_embedder(http, base_url, emb.model, timeout);
    } else if (provider == "hashing") {
        if (emb.dimensions == 0) {
            throw std::invalid_argument("hashing embedder requires dimensions > 0");
        }
        inner = std::make_unique<HashingEmbedder>(emb.dimensions);
    } else {
        throw std::invalid_argument("Unknown embedding provider: " + provider);
    }

    std::cerr << "[embedder] Using " << inner->model_id() << "\n";
    return std::make_unique<ReliableEmbedder>(std::move(inner), emb.max_attempts,
                                              emb.initial_backoff_ms);
}

} // namespace slidesearch
