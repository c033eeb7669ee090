#include "slide.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <set>
#include <utility>

namespace slidesearch {

std::string record_label(const SlideRecord& record) {
    return record.presentation_id + "#" + std::to_string(record.slide_index);
}

Corpus::Corpus(std::vector<SlideRecord> records) {
    validate_corpus(records);
    records_ = std::move(records);
}

std::vector<std::string> Corpus::texts() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.summary_text);
    return out;
}

void validate_corpus(const std::vector<SlideRecord>& records) {
    std::set<std::pair<std::string, uint32_t>> seen;

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& r = records[i];
        if (r.presentation_id.empty()) {
            throw MalformedRecordError("record " + std::to_string(i) +
                                       ": missing presentation_id");
        }
        if (trim(r.summary_text).empty()) {
            throw MalformedRecordError("record " + record_label(r) +
                                       ": summary_text is empty");
        }
        if (!seen.emplace(r.presentation_id, r.slide_index).second) {
            throw DuplicateKeyError("duplicate slide " + record_label(r));
        }
    }
}

} // namespace slidesearch
