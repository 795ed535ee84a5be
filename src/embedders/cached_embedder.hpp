#pragma once
#include "../embedder.hpp"
#include <memory>
#include <string>

namespace curbench {

// Decorator that memoizes vectors in a Cache, keyed by provider, model and text.
class CachedEmbedder : public Embedder {
public:
    CachedEmbedder(std::unique_ptr<Embedder> inner, Cache& cache, uint32_t ttl_seconds);

    Embedding embed(const std::string& text, const CancelToken* cancel = nullptr) override;
    uint32_t dimensions() const override { return inner_->dimensions(); }
    std::string embedder_name() const override { return inner_->embedder_name(); }
    std::string model_name() const override { return inner_->model_name(); }

    std::string cache_key(const std::string& text) const;

private:
    std::unique_ptr<Embedder> inner_;
    Cache& cache_;
    uint32_t ttl_;
};

} // namespace curbench
