#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "embedders/cached_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace curbench {

static std::unique_ptr<Embedder> create_provider_embedder(const Config& config,
                                                          HttpClient& http) {
    const auto& emb = config.embeddings;
    long timeout = static_cast<long>(emb.timeout_seconds);

    if (emb.provider == "openai") {
        if (emb.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(emb.api_key, http, emb.base_url, emb.model, timeout);
    }

    if (emb.provider == "ollama") {
        return create_ollama_embedder(http, emb.base_url, emb.model, timeout);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << emb.provider << "\n";
    return nullptr;
}

std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http,
                                          Cache* cache) {
    auto inner = create_provider_embedder(config, http);
    if (!inner || !cache) return inner;
    return std::make_unique<CachedEmbedder>(std::move(inner), *cache,
                                            config.cache.embedding_ttl);
}

} // namespace curbench
