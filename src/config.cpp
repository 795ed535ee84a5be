#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace curbench {

nlohmann::json Config::defaults_json() {
    return {
        {"data_dir", "~/.curbench"},
        {"embeddings", {
            {"provider", "openai"},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""},
            {"timeout_seconds", 30},
            {"max_concurrency", 8}
        }},
        {"retrieval", {
            {"min_similarity", 0.75},
            {"limit", 10},
            {"recency_weight", 0.0},
            {"min_credibility", 0},
            {"include_undated", false},
            {"max_age_years", 5}
        }},
        {"benchmark", {
            {"coverage_threshold", 0.7},
            {"gap_threshold", 0.6},
            {"strength_threshold", 0.5},
            {"high_severity_below", 0.3},
            {"medium_severity_below", 0.5},
            {"default_program_hours", 120}
        }},
        {"cache", {
            {"enabled", false},
            {"search_ttl", 3600},
            {"embedding_ttl", 604800},
            {"max_entries", 1000}
        }},
        {"storage", {
            {"corpus_backend", "sqlite"},
            {"corpus_path", ""},
            {"competitors_path", ""}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean()) out = obj[key].get<bool>();
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) return;

    read_string(j, "data_dir", data_dir);

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        read_string(e, "provider", embeddings.provider);
        read_string(e, "api_key", embeddings.api_key);
        read_string(e, "base_url", embeddings.base_url);
        read_string(e, "model", embeddings.model);
        read_uint(e, "timeout_seconds", embeddings.timeout_seconds);
        read_uint(e, "max_concurrency", embeddings.max_concurrency);
    }

    if (j.contains("retrieval") && j["retrieval"].is_object()) {
        auto& r = j["retrieval"];
        read_double(r, "min_similarity", retrieval.min_similarity);
        read_uint(r, "limit", retrieval.limit);
        read_double(r, "recency_weight", retrieval.recency_weight);
        read_uint(r, "min_credibility", retrieval.min_credibility);
        read_bool(r, "include_undated", retrieval.include_undated);
        read_uint(r, "max_age_years", retrieval.max_age_years);
    }

    if (j.contains("benchmark") && j["benchmark"].is_object()) {
        auto& b = j["benchmark"];
        read_double(b, "coverage_threshold", benchmark.coverage_threshold);
        read_double(b, "gap_threshold", benchmark.gap_threshold);
        read_double(b, "strength_threshold", benchmark.strength_threshold);
        read_double(b, "high_severity_below", benchmark.high_severity_below);
        read_double(b, "medium_severity_below", benchmark.medium_severity_below);
        read_double(b, "default_program_hours", benchmark.default_program_hours);
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        read_bool(c, "enabled", cache.enabled);
        read_string(c, "path", cache.path);
        read_uint(c, "search_ttl", cache.search_ttl);
        read_uint(c, "embedding_ttl", cache.embedding_ttl);
        read_uint(c, "max_entries", cache.max_entries);
    }

    if (j.contains("storage") && j["storage"].is_object()) {
        auto& s = j["storage"];
        read_string(s, "corpus_backend", storage.corpus_backend);
        read_string(s, "corpus_path", storage.corpus_path);
        read_string(s, "competitors_path", storage.competitors_path);
    }
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.curbench/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    cfg.apply_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("CURBENCH_DATA_DIR"))
        cfg.data_dir = v;
    if (const char* v = std::getenv("CURBENCH_EMBEDDING_PROVIDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("CURBENCH_EMBEDDING_MODEL"))
        cfg.embeddings.model = v;
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        if (cfg.embeddings.provider == "openai")
            cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama")
            cfg.embeddings.base_url = v;
    }

    return cfg;
}

static std::string in_data_dir(const std::string& data_dir, const std::string& name) {
    std::string dir = expand_home(data_dir);
    if (!dir.empty() && dir.back() == '/') dir.pop_back();
    return dir + "/" + name;
}

std::string Config::corpus_path() const {
    if (!storage.corpus_path.empty()) return expand_home(storage.corpus_path);
    return in_data_dir(data_dir, "corpus.db");
}

std::string Config::competitors_path() const {
    if (!storage.competitors_path.empty()) return expand_home(storage.competitors_path);
    return in_data_dir(data_dir, "competitors.db");
}

std::string Config::cache_path() const {
    if (!cache.path.empty()) return expand_home(cache.path);
    return in_data_dir(data_dir, "cache.json");
}

} // namespace curbench
