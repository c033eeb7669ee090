#include "snapshot.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdio>

namespace slidesearch {

std::shared_ptr<const IndexSnapshot> make_snapshot(Corpus corpus,
                                                   const std::vector<Embedding>& vectors,
                                                   std::string embedder_id) {
    if (corpus.empty()) {
        throw EmptyCorpusError("cannot build an index over an empty corpus");
    }
    if (vectors.size() != corpus.size()) {
        throw IndexBuildError("got " + std::to_string(vectors.size()) +
                              " embeddings for " + std::to_string(corpus.size()) +
                              " slides");
    }

    auto snapshot = std::make_shared<IndexSnapshot>();
    snapshot->index = VectorIndex::build(vectors);
    snapshot->corpus = std::move(corpus);
    snapshot->embedder_id = std::move(embedder_id);
    return snapshot;
}

std::string corpus_fingerprint(const Corpus& corpus) {
    std::string material;
    for (const auto& r : corpus.records()) {
        material += r.presentation_id;
        material += '\0';
        material += std::to_string(r.slide_index);
        material += '\0';
        material += r.summary_text;
        material += '\0';
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx",
                  static_cast<unsigned long long>(fnv1a_64(material)));
    return buf;
}

} // namespace slidesearch
