#include "http_embedder.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace slidesearch {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

// 408/429/5xx are worth retrying; other errors (bad key, unknown model) are not.
static bool is_transient_status(long status) {
    return status == 408 || status == 429 || status >= 500;
}

std::vector<Embedding> HttpEmbedder::embed_batch(const std::vector<std::string>& texts) {
    require_embeddable(texts);

    nlohmann::json body = {
        {"model", config_.model},
        {"input", texts}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(config_.base_url + config_.endpoint, body.dump(), headers,
                               config_.timeout_seconds);
    if (response.status_code == 0) {
        throw EmbeddingError(config_.name + " request failed: " + response.error);
    }
    if (response.status_code != 200) {
        throw EmbeddingError(config_.name + " returned HTTP " +
                             std::to_string(response.status_code) + ": " +
                             truncate_for_log(response.body, 200),
                             is_transient_status(response.status_code));
    }

    auto vectors = parse_response(response.body, texts.size());
    check_embedding_batch(vectors, texts.size(), config_.name);
    dimensions_.store(static_cast<uint32_t>(vectors.front().size()));
    return vectors;
}

static Embedding floats_from_json(const nlohmann::json& arr) {
    Embedding vec;
    vec.reserve(arr.size());
    for (const auto& val : arr) {
        vec.push_back(val.get<float>());
    }
    return vec;
}

std::vector<Embedding> HttpEmbedder::parse_response(const std::string& body,
                                                    size_t expected) const {
    try {
        auto j = nlohmann::json::parse(body);
        std::vector<Embedding> result;

        if (config_.api == Api::Ollama) {
            for (const auto& arr : j.at("embeddings")) {
                result.push_back(floats_from_json(arr));
            }
            return result;
        }

        // OpenAI: data[i] carries its input position in "index"
        const auto& data = j.at("data");
        result.resize(data.size());
        for (size_t i = 0; i < data.size(); ++i) {
            const auto& item = data[i];
            size_t pos = item.value("index", i);
            if (pos >= data.size() || !result[pos].empty()) {
                throw EmbeddingError(config_.name + " returned an out-of-order embedding index " +
                                     std::to_string(pos));
            }
            result[pos] = floats_from_json(item.at("embedding"));
        }
        if (result.size() != expected) {
            throw EmbeddingError(config_.name + " returned " + std::to_string(result.size()) +
                                 " embeddings for " + std::to_string(expected) + " texts");
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw EmbeddingError(config_.name + " returned an unreadable response: " + e.what());
    }
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.api = HttpEmbedder::Api::OpenAI;
    cfg.default_dims = 1536;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_compatible_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model, long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "compatible";
    cfg.api_key = api_key;
    cfg.base_url = base_url;
    cfg.model = model.empty() ? "all-MiniLM-L6-v2" : model;
    cfg.endpoint = "/embeddings";
    cfg.api = HttpEmbedder::Api::OpenAI;
    cfg.default_dims = 384;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "all-minilm" : model;
    cfg.endpoint = "/api/embed";
    cfg.api = HttpEmbedder::Api::Ollama;
    cfg.default_dims = 384;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace slidesearch
