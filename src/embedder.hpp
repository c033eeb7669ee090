#pragma once
#include "vector.hpp"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace slidesearch {

class HttpClient; // forward declare
struct Config;    // forward declare

// Abstract embedding provider interface. Implementations must be
// deterministic and, when used for parallel index builds, thread-safe.
class Embedder {
public:
    virtual ~Embedder() = default;

    // One vector per input text, same order. Throws EmbeddingError if any
    // text is blank or the model call fails; never drops an item.
    virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) = 0;

    // Equivalent to embed_batch({text})[0].
    Embedding embed_one(const std::string& text);

    // Dimensionality of the embedding vectors (provider default until the
    // first response arrives)
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;

    // Identifies the vector space, e.g. "ollama:all-minilm". Vectors with
    // different ids are not comparable.
    virtual std::string model_id() const = 0;
};

// Throws a non-transient EmbeddingError if texts is empty or any entry is
// blank after trimming.
void require_embeddable(const std::vector<std::string>& texts);

// Throws EmbeddingError unless vectors has exactly `expected` entries, all of
// one non-zero dimension. `source` names the embedder in the message.
void check_embedding_batch(const std::vector<Embedding>& vectors, size_t expected,
                           const std::string& source);

// Create the embedder selected by config.embeddings.provider, wrapped in a
// ReliableEmbedder. Throws std::invalid_argument for an unknown provider or
// missing credentials. `http` must outlive the returned embedder.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http);

} // namespace slidesearch
