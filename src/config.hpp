#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace curbench {

struct EmbeddingConfig {
    std::string provider = "openai";   // "openai" | "ollama"
    std::string api_key;
    std::string base_url;              // empty = provider default
    std::string model;                 // empty = provider default
    uint32_t timeout_seconds = 30;
    uint32_t max_concurrency = 8;      // parallel requests per fan-out
};

struct RetrievalConfig {
    double min_similarity = 0.75;
    uint32_t limit = 10;
    double recency_weight = 0.0;
    uint32_t min_credibility = 0;      // 0 = no credibility floor
    bool include_undated = false;      // admit entries with no publication date
    uint32_t max_age_years = 5;
};

struct BenchmarkConfig {
    double coverage_threshold = 0.7;   // best match must exceed this to count as covered
    double gap_threshold = 0.6;        // competitor topic below this is a gap
    double strength_threshold = 0.5;   // generated topic below this is a strength
    double high_severity_below = 0.3;
    double medium_severity_below = 0.5;
    double default_program_hours = 120.0;
};

struct CacheConfig {
    bool enabled = false;
    std::string path;                  // empty = ~/.curbench/cache.json
    uint32_t search_ttl = 3600;        // 1 hour
    uint32_t embedding_ttl = 604800;   // 7 days
    uint32_t max_entries = 1000;
};

struct StorageConfig {
    std::string corpus_backend = "sqlite"; // "sqlite" | "memory"
    std::string corpus_path;           // empty = <data_dir>/corpus.db
    std::string competitors_path;      // empty = <data_dir>/competitors.db
};

struct Config {
    std::string data_dir = "~/.curbench";

    EmbeddingConfig embeddings;
    RetrievalConfig retrieval;
    BenchmarkConfig benchmark;
    CacheConfig cache;
    StorageConfig storage;

    // Load from ~/.curbench/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply a parsed config document onto this struct (unknown keys ignored).
    void apply_json(const nlohmann::json& j);

    // Resolved paths (~ expanded, data_dir fallbacks applied)
    std::string corpus_path() const;
    std::string competitors_path() const;
    std::string cache_path() const;
};

} // namespace curbench
