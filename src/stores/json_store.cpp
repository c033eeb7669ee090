#include "json_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace slidesearch {

// ordered_json keeps presentations in file order, which fixes corpus order.
using ordered_json = nlohmann::ordered_json;

JsonCorpusStore::JsonCorpusStore(const std::string& path) : path_(path) {}

static std::vector<SlideRecord> records_from_summary_map(const ordered_json& j) {
    std::vector<SlideRecord> records;
    for (auto& [presentation, slides] : j.items()) {
        if (!slides.is_array()) {
            throw MalformedRecordError("presentation '" + presentation +
                                       "': expected an array of slide summaries");
        }
        uint32_t index = 0;
        for (const auto& summary : slides) {
            if (!summary.is_string()) {
                throw MalformedRecordError("presentation '" + presentation + "' slide " +
                                           std::to_string(index) +
                                           ": summary_text must be a string");
            }
            records.push_back({presentation, index, summary.get<std::string>()});
            ++index;
        }
    }
    return records;
}

static SlideRecord record_from_json(const ordered_json& item, size_t position) {
    std::string where = "record " + std::to_string(position);
    if (!item.is_object()) {
        throw MalformedRecordError(where + ": expected an object");
    }

    auto pid = item.find("presentation_id");
    if (pid == item.end() || !pid->is_string()) {
        throw MalformedRecordError(where + ": missing presentation_id");
    }
    auto idx = item.find("slide_index");
    if (idx == item.end() || !idx->is_number_integer() || idx->get<int64_t>() < 0 ||
        idx->get<uint64_t>() > UINT32_MAX) {
        throw MalformedRecordError(where + ": missing or out-of-range slide_index");
    }
    auto text = item.find("summary_text");
    if (text == item.end() || !text->is_string()) {
        throw MalformedRecordError(where + ": missing summary_text");
    }

    SlideRecord record;
    record.presentation_id = pid->get<std::string>();
    record.slide_index = idx->get<uint32_t>();
    record.summary_text = text->get<std::string>();
    return record;
}

Corpus JsonCorpusStore::parse(const std::string& json_str) {
    ordered_json j;
    try {
        j = ordered_json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedRecordError(std::string("summaries are not valid JSON: ") + e.what());
    }

    std::vector<SlideRecord> records;
    if (j.is_object()) {
        records = records_from_summary_map(j);
    } else if (j.is_array()) {
        records.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            records.push_back(record_from_json(j[i], i));
        }
    } else {
        throw MalformedRecordError("summaries must be a JSON object or array");
    }
    return Corpus(std::move(records));
}

std::string JsonCorpusStore::serialize(const Corpus& corpus) {
    ordered_json j = ordered_json::array();
    for (const auto& r : corpus.records()) {
        j.push_back({
            {"presentation_id", r.presentation_id},
            {"slide_index", r.slide_index},
            {"summary_text", r.summary_text}
        });
    }
    return j.dump(2);
}

Corpus JsonCorpusStore::load() {
    std::ifstream file(path_);
    if (!file.is_open()) {
        throw CorpusIoError("cannot open summaries file: " + path_);
    }
    std::stringstream buf;
    buf << file.rdbuf();

    Corpus corpus = parse(buf.str());
    std::cerr << "[store] Loaded " << corpus.size() << " slide summaries from "
              << path_ << "\n";
    return corpus;
}

void JsonCorpusStore::save(const Corpus& corpus) {
    if (!atomic_write_file(path_, serialize(corpus) + "\n")) {
        throw CorpusIoError("cannot write summaries file: " + path_);
    }
}

} // namespace slidesearch
