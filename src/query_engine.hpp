#pragma once
#include "embedder.hpp"
#include "snapshot.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace slidesearch {

struct SearchResult {
    SlideRecord record;
    float score = 0.0f;
    uint32_t rank = 0;    // 1-based
};

struct BuildOptions {
    size_t batch_size = 32;
    size_t workers = 1;   // >1 embeds that many batches concurrently
};

// Embed texts in batches of options.batch_size and L2-normalize every
// vector. Output order matches input order for any worker count. A failing
// batch fails the whole call.
std::vector<Embedding> embed_corpus(Embedder& embedder,
                                    const std::vector<std::string>& texts,
                                    const BuildOptions& options);

// Embed the corpus and build a fresh snapshot. Throws EmptyCorpusError for
// an empty corpus and IndexBuildError if the embedder output does not line
// up with the corpus.
std::shared_ptr<const IndexSnapshot> build_snapshot(const Corpus& corpus,
                                                    Embedder& embedder,
                                                    const BuildOptions& options = {});

// Answers queries against the current snapshot. The snapshot is replaced
// wholesale by rebuild()/install(); queries already running keep the
// snapshot they started with. Safe to query from several threads.
class QueryEngine {
public:
    // `embedder` must outlive the engine.
    explicit QueryEngine(Embedder& embedder, BuildOptions options = {});

    // Build a new snapshot off to the side, then swap it in.
    void rebuild(const Corpus& corpus);

    // Swap in a prebuilt or loaded snapshot. Throws IndexBuildError if it
    // was built by a different model than this engine's embedder.
    void install(std::shared_ptr<const IndexSnapshot> snapshot);

    // Install `saved` when it was built from exactly `corpus` by this
    // engine's embedder, otherwise rebuild from `corpus`. A null `saved`
    // also rebuilds. Returns true when the saved snapshot was kept.
    bool install_or_rebuild(std::shared_ptr<const IndexSnapshot> saved, const Corpus& corpus);

    // Current snapshot, or nullptr before the first rebuild/install.
    std::shared_ptr<const IndexSnapshot> snapshot() const;

    // Top min(top_k, corpus size) records by cosine similarity to text.
    // Throws EmptyQueryError for blank text, EmptyIndexError when no
    // snapshot is installed, EmbeddingError if the query cannot be embedded.
    std::vector<SearchResult> query(const std::string& text, uint32_t top_k = 3) const;

private:
    Embedder& embedder_;
    BuildOptions options_;
    mutable std::mutex mutex_;
    std::shared_ptr<const IndexSnapshot> snapshot_;
};

} // namespace slidesearch
