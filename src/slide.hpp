#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace slidesearch {

struct SlideRecord {
    std::string presentation_id;
    uint32_t slide_index = 0;
    std::string summary_text;
};

inline bool same_key(const SlideRecord& a, const SlideRecord& b) {
    return a.presentation_id == b.presentation_id && a.slide_index == b.slide_index;
}

// "deck.pptx#3" style label used in log and error messages
std::string record_label(const SlideRecord& record);

// Ordered, validated collection of slide records. Position in the corpus is
// the position of the record's embedding in the vector index.
class Corpus {
public:
    Corpus() = default;

    // Validates every record (see validate_corpus) and takes ownership.
    explicit Corpus(std::vector<SlideRecord> records);

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    const SlideRecord& operator[](size_t position) const { return records_[position]; }
    const SlideRecord& at(size_t position) const { return records_.at(position); }

    const std::vector<SlideRecord>& records() const { return records_; }

    std::vector<std::string> texts() const;

private:
    std::vector<SlideRecord> records_;
};

// Throws MalformedRecordError for an empty presentation_id or a summary that
// is blank after trimming; DuplicateKeyError when (presentation_id,
// slide_index) repeats.
void validate_corpus(const std::vector<SlideRecord>& records);

} // namespace slidesearch
