#include "query_engine.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>

namespace slidesearch {

std::vector<Embedding> embed_corpus(Embedder& embedder,
                                    const std::vector<std::string>& texts,
                                    const BuildOptions& options) {
    const size_t batch_size = std::max<size_t>(options.batch_size, 1);
    const size_t workers = std::max<size_t>(options.workers, 1);
    const size_t n_batches = (texts.size() + batch_size - 1) / batch_size;

    auto run_batch = [&](size_t b) {
        size_t begin = b * batch_size;
        size_t end = std::min(begin + batch_size, texts.size());
        std::vector<std::string> slice(texts.begin() + static_cast<ptrdiff_t>(begin),
                                       texts.begin() + static_cast<ptrdiff_t>(end));
        try {
            auto out = embedder.embed_batch(slice);
            if (out.size() != slice.size()) {
                throw IndexBuildError(embedder.embedder_name() + " returned " +
                                      std::to_string(out.size()) + " vectors for " +
                                      std::to_string(slice.size()) + " slides");
            }
            check_embedding_batch(out, slice.size(), embedder.embedder_name());
            return out;
        } catch (const SearchError& e) {
            std::cerr << "[engine] Batch " << (b + 1) << "/" << n_batches
                      << " (slides " << begin << "-" << (end - 1) << ", starting \""
                      << truncate_for_log(slice.front(), 60) << "\") failed: "
                      << e.what() << "\n";
            throw;
        }
    };

    // Each batch lands in its own slot, so completion order never matters.
    std::vector<std::vector<Embedding>> batches(n_batches);
    for (size_t wave = 0; wave < n_batches; wave += workers) {
        size_t wave_end = std::min(wave + workers, n_batches);
        if (wave_end - wave == 1) {
            batches[wave] = run_batch(wave);
            continue;
        }
        std::vector<std::future<std::vector<Embedding>>> pending;
        pending.reserve(wave_end - wave);
        for (size_t b = wave; b < wave_end; ++b) {
            pending.push_back(std::async(std::launch::async, run_batch, b));
        }
        for (size_t b = wave; b < wave_end; ++b) {
            batches[b] = pending[b - wave].get();
        }
    }

    std::vector<Embedding> vectors;
    vectors.reserve(texts.size());
    for (auto& batch : batches) {
        for (auto& v : batch) {
            l2_normalize(v);
            vectors.push_back(std::move(v));
        }
    }
    return vectors;
}

std::shared_ptr<const IndexSnapshot> build_snapshot(const Corpus& corpus,
                                                    Embedder& embedder,
                                                    const BuildOptions& options) {
    if (corpus.empty()) {
        throw EmptyCorpusError("cannot build an index over an empty corpus");
    }

    auto vectors = embed_corpus(embedder, corpus.texts(), options);
    auto snapshot = make_snapshot(corpus, vectors, embedder.model_id());
    std::cerr << "[engine] Indexed " << snapshot->index.size() << " slides ("
              << snapshot->index.dimensions() << " dims, " << snapshot->embedder_id
              << ")\n";
    return snapshot;
}

QueryEngine::QueryEngine(Embedder& embedder, BuildOptions options)
    : embedder_(embedder), options_(options) {}

void QueryEngine::rebuild(const Corpus& corpus) {
    install(build_snapshot(corpus, embedder_, options_));
}

void QueryEngine::install(std::shared_ptr<const IndexSnapshot> snapshot) {
    if (!snapshot) {
        throw std::invalid_argument("QueryEngine::install requires a snapshot");
    }
    if (snapshot->embedder_id != embedder_.model_id()) {
        throw IndexBuildError("index was built with " + snapshot->embedder_id +
                              " but the configured embedder is " + embedder_.model_id() +
                              "; rebuild the index");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_ = std::move(snapshot);
}

bool QueryEngine::install_or_rebuild(std::shared_ptr<const IndexSnapshot> saved,
                                     const Corpus& corpus) {
    if (saved) {
        if (saved->embedder_id != embedder_.model_id()) {
            std::cerr << "[engine] Saved index was built with " << saved->embedder_id
                      << ", rebuilding with " << embedder_.model_id() << "\n";
        } else if (corpus_fingerprint(saved->corpus) != corpus_fingerprint(corpus)) {
            std::cerr << "[engine] Saved index is out of date with the summaries, rebuilding\n";
        } else {
            install(std::move(saved));
            return true;
        }
    }
    rebuild(corpus);
    return false;
}

std::shared_ptr<const IndexSnapshot> QueryEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::vector<SearchResult> QueryEngine::query(const std::string& text, uint32_t top_k) const {
    if (trim(text).empty()) {
        throw EmptyQueryError("query text is empty");
    }
    if (top_k == 0) {
        throw std::invalid_argument("top_k must be at least 1");
    }

    auto snap = snapshot();
    if (!snap || snap->index.empty()) {
        throw EmptyIndexError("no index has been built");
    }

    Embedding q = embedder_.embed_one(text);
    l2_normalize(q);

    auto neighbors = snap->index.search(q, top_k);

    std::vector<SearchResult> results;
    results.reserve(neighbors.size());
    uint32_t rank = 1;
    for (const auto& n : neighbors) {
        results.push_back({snap->corpus[n.position], n.score, rank++});
    }
    return results;
}

} // namespace slidesearch
