#pragma once
#include "slide.hpp"
#include "vector_index.hpp"
#include <memory>
#include <string>
#include <vector>

namespace slidesearch {

// A corpus paired with the index built from it. Row i of the index is the
// embedding of corpus[i]. Snapshots are immutable and shared between the
// engine and in-flight queries through shared_ptr<const IndexSnapshot>.
struct IndexSnapshot {
    Corpus corpus;
    VectorIndex index;
    std::string embedder_id;   // model that produced the vectors
};

// Pair a corpus with its (already normalized) vectors. Throws
// EmptyCorpusError for an empty corpus, IndexBuildError when the vector
// count does not match the corpus, and DimensionMismatchError for ragged
// vectors.
std::shared_ptr<const IndexSnapshot> make_snapshot(Corpus corpus,
                                                   const std::vector<Embedding>& vectors,
                                                   std::string embedder_id);

// Hex FNV-1a digest over every record in order. Equal corpora give equal
// fingerprints; any edit, reorder, insertion or removal changes it.
std::string corpus_fingerprint(const Corpus& corpus);

} // namespace slidesearch
