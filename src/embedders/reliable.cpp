#include "reliable.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace slidesearch {

ReliableEmbedder::ReliableEmbedder(std::unique_ptr<Embedder> inner,
                                   uint32_t max_attempts,
                                   uint32_t initial_backoff_ms)
    : inner_(std::move(inner))
    , max_attempts_(max_attempts)
    , initial_backoff_ms_(initial_backoff_ms)
    , sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    if (!inner_) {
        throw std::invalid_argument("ReliableEmbedder requires an embedder");
    }
    if (max_attempts_ == 0) {
        throw std::invalid_argument("ReliableEmbedder requires at least one attempt");
    }
}

std::vector<Embedding> ReliableEmbedder::embed_batch(const std::vector<std::string>& texts) {
    std::string last_error;
    uint64_t backoff = std::min<uint64_t>(initial_backoff_ms_, kMaxBackoffMs);

    for (uint32_t attempt = 1; attempt <= max_attempts_; ++attempt) {
        try {
            return inner_->embed_batch(texts);
        } catch (const EmbeddingError& e) {
            if (!e.transient()) throw;
            last_error = e.what();
            std::cerr << "[reliable] Embedder " << inner_->embedder_name()
                      << " attempt " << attempt << "/" << max_attempts_
                      << " failed: " << last_error << '\n';
        }
        if (attempt < max_attempts_ && backoff > 0) {
            sleep_(std::chrono::milliseconds(backoff));
            backoff = std::min(backoff * 2, kMaxBackoffMs);
        }
    }
    throw EmbeddingError("embedding failed after " + std::to_string(max_attempts_) +
                         " attempts. Last error: " + last_error,
                         false);
}

} // namespace slidesearch
