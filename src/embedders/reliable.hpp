#pragma once
#include "../embedder.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace slidesearch {

// Wraps an embedder with retry logic. Transient EmbeddingErrors are retried
// up to max_attempts with exponential backoff (capped at kMaxBackoffMs); the
// last error is rethrown once attempts run out. There is no fallback to another embedder because
// vectors from different models cannot share an index.
class ReliableEmbedder : public Embedder {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    static constexpr uint64_t kMaxBackoffMs = 30000;

    explicit ReliableEmbedder(std::unique_ptr<Embedder> inner,
                              uint32_t max_attempts = 3,
                              uint32_t initial_backoff_ms = 500);

    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;

    uint32_t dimensions() const override { return inner_->dimensions(); }
    std::string embedder_name() const override { return inner_->embedder_name(); }
    std::string model_id() const override { return inner_->model_id(); }

    // Replace std::this_thread::sleep_for (tests)
    void set_sleep(SleepFn sleep) { sleep_ = std::move(sleep); }

private:
    std::unique_ptr<Embedder> inner_;
    uint32_t max_attempts_;
    uint32_t initial_backoff_ms_;
    SleepFn sleep_;
};

} // namespace slidesearch
