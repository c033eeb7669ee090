#pragma once
#include "slide.hpp"
#include <memory>
#include <string>

namespace slidesearch {

struct Config; // forward declaration

// Abstract storage backend for slide summaries. Backends only move records
// in and out; validation is shared (validate_corpus) so every backend
// rejects the same malformed input.
class CorpusStore {
public:
    virtual ~CorpusStore() = default;

    virtual std::string backend_name() const = 0;

    // Read and validate the full corpus. Fails fast: a single malformed or
    // duplicate record aborts the whole load.
    virtual Corpus load() = 0;

    // Replace the stored corpus.
    virtual void save(const Corpus& corpus) = 0;
};

// Create the backend named by config.corpus.backend at config.corpus_path().
// Throws std::invalid_argument for an unknown backend name.
std::unique_ptr<CorpusStore> create_corpus_store(const Config& config);

} // namespace slidesearch
