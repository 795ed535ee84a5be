#include "cached_embedder.hpp"
#include "../cache.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace curbench {

CachedEmbedder::CachedEmbedder(std::unique_ptr<Embedder> inner, Cache& cache,
                               uint32_t ttl_seconds)
    : inner_(std::move(inner)), cache_(cache), ttl_(ttl_seconds) {}

std::string CachedEmbedder::cache_key(const std::string& text) const {
    return make_cache_key("embeddings", {inner_->embedder_name(), inner_->model_name(), text});
}

Embedding CachedEmbedder::embed(const std::string& text, const CancelToken* cancel) {
    std::string key = cache_key(text);

    if (auto cached = cache_.get(key)) {
        try {
            auto j = nlohmann::json::parse(*cached);
            auto vec = j.get<Embedding>();
            if (!vec.empty()) return vec;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[embedder] Discarding unreadable cached embedding: " << e.what() << "\n";
        }
    }

    Embedding vec = inner_->embed(text, cancel);
    cache_.set(key, nlohmann::json(vec).dump(), ttl_);
    return vec;
}

} // namespace curbench
