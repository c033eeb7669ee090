#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <atomic>
#include <string>

namespace slidesearch {

// Unified HTTP-based embedder. Supports OpenAI-compatible and Ollama APIs
// by parameterizing the endpoint, auth and response layout. Both APIs take
// the whole batch in one request.
class HttpEmbedder : public Embedder {
public:
    enum class Api { OpenAI, Ollama };

    struct Config {
        std::string name;           // e.g. "openai", "ollama"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        Api api = Api::OpenAI;
        uint32_t default_dims = 0;  // fallback until first response
        long timeout_seconds = 30;
    };

    HttpEmbedder(Config config, HttpClient& http);

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_.load(); }
    std::string embedder_name() const override { return config_.name; }
    std::string model_id() const override { return config_.name + ":" + config_.model; }

private:
    std::vector<Embedding> parse_response(const std::string& body, size_t expected) const;

    Config config_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds);

// OpenAI wire format against a self-hosted server (e.g. a sentence-transformers
// service exposing /v1/embeddings).
std::unique_ptr<Embedder> create_compatible_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds);

} // namespace slidesearch
