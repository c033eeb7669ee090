#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace slidesearch {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

struct EmbeddingConfig {
    std::string provider = "ollama";   // openai, compatible, ollama, hashing
    std::string model;                 // empty = provider default
    std::string base_url;              // empty = provider default
    std::string api_key;               // empty = providers[provider].api_key
    uint32_t dimensions = 384;         // hashing embedder only
    uint32_t timeout_seconds = 30;     // per HTTP request
    uint32_t batch_size = 32;
    uint32_t workers = 1;              // parallel batches during index build
    uint32_t max_attempts = 3;
    uint32_t initial_backoff_ms = 500;
};

struct CorpusConfig {
    std::string backend = "json";      // json, sqlite
    std::string path;                  // empty = text_output/slide_summaries.json
};

struct IndexConfig {
    std::string path;                  // empty = text_output/slide_index.db
};

struct SearchConfig {
    uint32_t top_k = 3;
    std::string pdf_dir = "pdf_output";
};

struct Config {
    EmbeddingConfig embeddings;
    CorpusConfig corpus;
    IndexConfig index;
    SearchConfig search;

    std::unordered_map<std::string, ProviderEntry> providers;

    // Load from ~/.slidesearch/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Get API key for a provider name
    std::string api_key_for(const std::string& provider) const;

    // Get base URL for a provider name (empty = use provider default)
    std::string base_url_for(const std::string& provider) const;

    // Resolved paths (defaults applied, ~ expanded)
    std::string corpus_path() const;
    std::string index_path() const;
};

} // namespace slidesearch
