#include "config.hpp"
#include "util.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace slidesearch {

static const char* const kDefaultCorpusPath = "text_output/slide_summaries.json";
static const char* const kDefaultIndexPath = "text_output/slide_index.db";

nlohmann::json Config::defaults_json() {
    return {
        {"embeddings", {
            {"provider", "ollama"},
            {"model", ""},
            {"base_url", ""},
            {"api_key", ""},
            {"dimensions", 384},
            {"timeout_seconds", 30},
            {"batch_size", 32},
            {"workers", 1},
            {"max_attempts", 3},
            {"initial_backoff_ms", 500}
        }},
        {"providers", {
            {"openai", {{"api_key", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}},
            {"compatible", {{"api_key", ""}, {"base_url", ""}}}
        }},
        {"corpus", {
            {"backend", "json"},
            {"path", ""}
        }},
        {"index", {
            {"path", ""}
        }},
        {"search", {
            {"top_k", 3},
            {"pdf_dir", "pdf_output"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* name, std::string& out) {
    if (obj.contains(name) && obj[name].is_string())
        out = obj[name].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* name, uint32_t& out) {
    if (obj.contains(name) && obj[name].is_number_integer() &&
        obj[name].get<int64_t>() >= 0 && obj[name].get<uint64_t>() <= UINT32_MAX)
        out = obj[name].get<uint32_t>();
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.slidesearch/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", cfg.embeddings.provider);
        read_string(e, "model", cfg.embeddings.model);
        read_string(e, "base_url", cfg.embeddings.base_url);
        read_string(e, "api_key", cfg.embeddings.api_key);
        read_uint(e, "dimensions", cfg.embeddings.dimensions);
        read_uint(e, "timeout_seconds", cfg.embeddings.timeout_seconds);
        read_uint(e, "batch_size", cfg.embeddings.batch_size);
        read_uint(e, "workers", cfg.embeddings.workers);
        read_uint(e, "max_attempts", cfg.embeddings.max_attempts);
        read_uint(e, "initial_backoff_ms", cfg.embeddings.initial_backoff_ms);
    }

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("corpus") && j["corpus"].is_object()) {
        read_string(j["corpus"], "backend", cfg.corpus.backend);
        read_string(j["corpus"], "path", cfg.corpus.path);
    }

    if (j.contains("index") && j["index"].is_object()) {
        read_string(j["index"], "path", cfg.index.path);
    }

    if (j.contains("search") && j["search"].is_object()) {
        read_uint(j["search"], "top_k", cfg.search.top_k);
        read_string(j["search"], "pdf_dir", cfg.search.pdf_dir);
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("OPENAI_API_KEY"))
        cfg.providers["openai"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        cfg.providers["ollama"].base_url = v;
    if (const char* v = std::getenv("COMPATIBLE_BASE_URL"))
        cfg.providers["compatible"].base_url = v;
    if (const char* v = std::getenv("SLIDESEARCH_EMBEDDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("SLIDESEARCH_MODEL"))
        cfg.embeddings.model = v;

    return cfg;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

std::string Config::corpus_path() const {
    return expand_home(corpus.path.empty() ? kDefaultCorpusPath : corpus.path);
}

std::string Config::index_path() const {
    return expand_home(index.path.empty() ? kDefaultIndexPath : index.path);
}

} // namespace slidesearch
