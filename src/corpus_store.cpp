#include "corpus_store.hpp"
#include "config.hpp"
#include "stores/json_store.hpp"
#include "stores/sqlite_store.hpp"
#include <stdexcept>

namespace slidesearch {

std::unique_ptr<CorpusStore> create_corpus_store(const Config& config) {
    const std::string& backend = config.corpus.backend;
    std::string path = config.corpus_path();

    if (backend == "json") {
        return std::make_unique<JsonCorpusStore>(path);
    }
    if (backend == "sqlite") {
        return std::make_unique<SqliteCorpusStore>(path);
    }
    throw std::invalid_argument("Unknown corpus backend: " + backend);
}

} // namespace slidesearch
