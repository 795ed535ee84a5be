#pragma once
#include "similarity.hpp"
#include <string>
#include <memory>
#include <cstdint>

namespace curbench {

class HttpClient;  // forward declare
class CancelToken; // forward declare
class Cache;       // forward declare
struct Config;     // forward declare

// Abstract embedding provider interface
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text.
    // Throws EmbedError on provider failure, timeout or cancellation.
    virtual Embedding embed(const std::string& text,
                            const CancelToken* cancel = nullptr) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;

    // Model identifier; vectors from different models are not comparable.
    virtual std::string model_name() const = 0;
};

// Create an embedder from config. Returns nullptr if the configured provider
// is not recognized or lacks credentials. When `cache` is non-null the
// embedder is wrapped so repeated texts skip the provider.
std::unique_ptr<Embedder> create_embedder(const Config& config, HttpClient& http,
                                          Cache* cache = nullptr);

} // namespace curbench
