#pragma once
#include "../corpus_store.hpp"
#include <string>

namespace slidesearch {

// Slide summaries in a JSON file. Reads both the summarizer's layout
//   {"deck.pptx": ["summary of slide 0", "summary of slide 1"]}
// and an explicit record array
//   [{"presentation_id": "deck.pptx", "slide_index": 0, "summary_text": "..."}]
// Always writes the record array.
class JsonCorpusStore : public CorpusStore {
public:
    explicit JsonCorpusStore(const std::string& path);

    std::string backend_name() const override { return "json"; }

    Corpus load() override;
    void save(const Corpus& corpus) override;

    // Parse a JSON document in either layout. Exposed for tests and for
    // callers that already hold the file contents.
    static Corpus parse(const std::string& json_str);

    static std::string serialize(const Corpus& corpus);

private:
    std::string path_;
};

} // namespace slidesearch
