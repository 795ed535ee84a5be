#include "http_embedder.hpp"
#include "../cancel.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>

namespace curbench {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEmbedder::embed(const std::string& text, const CancelToken* cancel) {
    if (cancel && cancel->cancelled()) {
        throw EmbedError(cancel->expired() ? EmbedError::Kind::Timeout
                                           : EmbedError::Kind::Cancelled,
                         config_.name + " embedding aborted before request");
    }

    nlohmann::json body = {
        {"model", config_.model},
        {"input", text}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(config_.base_url + config_.endpoint, body.dump(), headers,
                               config_.timeout_seconds, cancel);

    if (response.status_code == 0) {
        if (cancel && cancel->expired()) {
            throw EmbedError(EmbedError::Kind::Timeout, config_.name + " embedding timed out");
        }
        if (cancel && cancel->cancelled()) {
            throw EmbedError(EmbedError::Kind::Cancelled, config_.name + " embedding cancelled");
        }
        throw EmbedError(EmbedError::Kind::Transport,
                         config_.name + " embedding request failed: no response from " +
                         config_.base_url);
    }
    if (response.status_code == 429) {
        throw EmbedError(EmbedError::Kind::RateLimited,
                         config_.name + " embedding rate limited (HTTP 429)", 429);
    }
    if (response.status_code != 200) {
        throw EmbedError(EmbedError::Kind::HttpStatus,
                         config_.name + " embedding API error (HTTP " +
                         std::to_string(response.status_code) + "): " + response.body,
                         response.status_code);
    }

    Embedding result;
    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(config_.response_path));
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
    } catch (const nlohmann::json::exception& e) {
        throw EmbedError(EmbedError::Kind::MalformedResponse,
                         config_.name + " embedding response malformed: " + e.what(),
                         response.status_code);
    }
    if (result.empty()) {
        throw EmbedError(EmbedError::Kind::MalformedResponse,
                         config_.name + " embedding response contained an empty vector",
                         response.status_code);
    }

    dimensions_ = static_cast<uint32_t>(result.size());
    return result;
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.response_path = "/data/0/embedding";
    cfg.default_dims = 1536;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model,
    long timeout_seconds) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.response_path = "/embeddings/0";
    cfg.default_dims = 768;
    cfg.timeout_seconds = timeout_seconds;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace curbench
