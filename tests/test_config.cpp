#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace curbench;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.embeddings.provider == "openai");
    REQUIRE(cfg.embeddings.max_concurrency == 8);
    REQUIRE(cfg.retrieval.min_similarity == 0.75);
    REQUIRE(cfg.retrieval.limit == 10);
    REQUIRE(cfg.retrieval.recency_weight == 0.0);
    REQUIRE_FALSE(cfg.retrieval.include_undated);
    REQUIRE(cfg.retrieval.max_age_years == 5);
    REQUIRE(cfg.benchmark.coverage_threshold == 0.7);
    REQUIRE(cfg.benchmark.gap_threshold == 0.6);
    REQUIRE(cfg.benchmark.strength_threshold == 0.5);
    REQUIRE(cfg.benchmark.default_program_hours == 120.0);
    REQUIRE_FALSE(cfg.cache.enabled);
    REQUIRE(cfg.storage.corpus_backend == "sqlite");
}

TEST_CASE("Config::defaults_json: applies to an identical struct", "[config]") {
    Config cfg;
    cfg.apply_json(Config::defaults_json());
    Config fresh;
    REQUIRE(cfg.retrieval.limit == fresh.retrieval.limit);
    REQUIRE(cfg.benchmark.high_severity_below == fresh.benchmark.high_severity_below);
    REQUIRE(cfg.cache.search_ttl == fresh.cache.search_ttl);
    REQUIRE(cfg.storage.corpus_backend == fresh.storage.corpus_backend);
}

// ── apply_json ───────────────────────────────────────────────────

TEST_CASE("Config::apply_json: reads every section", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "data_dir": "/srv/curbench",
        "embeddings": {"provider": "ollama", "model": "nomic-embed-text", "max_concurrency": 2},
        "retrieval": {"min_similarity": 0.5, "limit": 3, "include_undated": true},
        "benchmark": {"gap_threshold": 0.65},
        "cache": {"enabled": true, "max_entries": 10},
        "storage": {"corpus_backend": "memory"}
    })"));

    REQUIRE(cfg.data_dir == "/srv/curbench");
    REQUIRE(cfg.embeddings.provider == "ollama");
    REQUIRE(cfg.embeddings.model == "nomic-embed-text");
    REQUIRE(cfg.embeddings.max_concurrency == 2);
    REQUIRE(cfg.retrieval.min_similarity == 0.5);
    REQUIRE(cfg.retrieval.limit == 3);
    REQUIRE(cfg.retrieval.include_undated);
    REQUIRE(cfg.benchmark.gap_threshold == 0.65);
    REQUIRE(cfg.cache.enabled);
    REQUIRE(cfg.cache.max_entries == 10);
    REQUIRE(cfg.storage.corpus_backend == "memory");
}

TEST_CASE("Config::apply_json: wrong types keep defaults", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "retrieval": {"limit": "ten", "min_similarity": "high"},
        "cache": {"enabled": "yes"}
    })"));
    REQUIRE(cfg.retrieval.limit == 10);
    REQUIRE(cfg.retrieval.min_similarity == 0.75);
    REQUIRE_FALSE(cfg.cache.enabled);
}

TEST_CASE("Config::apply_json: non-object is ignored", "[config]") {
    Config cfg;
    cfg.apply_json(nlohmann::json::array({1, 2, 3}));
    REQUIRE(cfg.embeddings.provider == "openai");
}

// ── Resolved paths ───────────────────────────────────────────────

TEST_CASE("Config: paths default into data_dir", "[config]") {
    Config cfg;
    cfg.data_dir = "/srv/curbench/";
    REQUIRE(cfg.corpus_path() == "/srv/curbench/corpus.db");
    REQUIRE(cfg.competitors_path() == "/srv/curbench/competitors.db");
    REQUIRE(cfg.cache_path() == "/srv/curbench/cache.json");
}

TEST_CASE("Config: explicit paths win", "[config]") {
    Config cfg;
    cfg.storage.corpus_path = "/data/c.db";
    cfg.storage.competitors_path = "/data/k.db";
    cfg.cache.path = "/data/cache.json";
    REQUIRE(cfg.corpus_path() == "/data/c.db");
    REQUIRE(cfg.competitors_path() == "/data/k.db");
    REQUIRE(cfg.cache_path() == "/data/cache.json");
}

// ── Config::load ────────────────────────────────────────────────

static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "curbench_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("CURBENCH_DATA_DIR");
        unsetenv("CURBENCH_EMBEDDING_PROVIDER");
        unsetenv("CURBENCH_EMBEDDING_MODEL");
        unsetenv("OPENAI_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.curbench/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.curbench");
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "embeddings": {"provider": "openai", "api_key": "sk-file", "model": "text-embedding-3-large"},
        "retrieval": {"limit": 25, "recency_weight": 0.3}
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.api_key == "sk-file");
    REQUIRE(cfg.embeddings.model == "text-embedding-3-large");
    REQUIRE(cfg.retrieval.limit == 25);
    REQUIRE(cfg.retrieval.recency_weight == 0.3);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"embeddings": {"provider": "openai", "api_key": "from-file"}})");
    setenv("OPENAI_API_KEY", "from-env", 1);
    setenv("CURBENCH_DATA_DIR", "/tmp/curbench-env", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.api_key == "from-env");
    REQUIRE(cfg.data_dir == "/tmp/curbench-env");

    unsetenv("OPENAI_API_KEY");
    unsetenv("CURBENCH_DATA_DIR");
}

TEST_CASE("Config::load: OLLAMA_BASE_URL applies only to ollama", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    setenv("OLLAMA_BASE_URL", "http://gpu:11434", 1);

    Config openai_cfg = Config::load();
    REQUIRE(openai_cfg.embeddings.base_url.empty());

    setenv("CURBENCH_EMBEDDING_PROVIDER", "ollama", 1);
    Config ollama_cfg = Config::load();
    REQUIRE(ollama_cfg.embeddings.provider == "ollama");
    REQUIRE(ollama_cfg.embeddings.base_url == "http://gpu:11434");

    unsetenv("OLLAMA_BASE_URL");
    unsetenv("CURBENCH_EMBEDDING_PROVIDER");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.embeddings.provider == "openai");
    REQUIRE(cfg.retrieval.limit == 10);
}

TEST_CASE("Config::load: creates default config when missing", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config::load();
    REQUIRE(std::filesystem::exists(g.config_path()));

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["embeddings"]["provider"] == "openai");
    REQUIRE(j["retrieval"]["min_similarity"] == 0.75);
    REQUIRE(j["benchmark"]["coverage_threshold"] == 0.7);
    REQUIRE(j["storage"]["corpus_backend"] == "sqlite");
}

TEST_CASE("Config::load: migrates existing config with missing keys", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"retrieval": {"limit": 4}})");

    Config cfg = Config::load();
    REQUIRE(cfg.retrieval.limit == 4);

    std::ifstream f(g.config_path());
    nlohmann::json j = nlohmann::json::parse(f);
    REQUIRE(j["retrieval"]["limit"] == 4);
    REQUIRE(j["retrieval"].contains("min_similarity"));
    REQUIRE(j.contains("benchmark"));
    REQUIRE(j.contains("cache"));
}

TEST_CASE("Config::load: does not rewrite complete config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    nlohmann::json full = Config::defaults_json();
    full["retrieval"]["limit"] = 7;
    g.write_config(full.dump(4) + "\n");

    std::string before;
    {
        std::ifstream f(g.config_path());
        before.assign(std::istreambuf_iterator<char>(f),
                      std::istreambuf_iterator<char>());
    }

    Config cfg = Config::load();
    REQUIRE(cfg.retrieval.limit == 7);

    std::string after;
    {
        std::ifstream f(g.config_path());
        after.assign(std::istreambuf_iterator<char>(f),
                     std::istreambuf_iterator<char>());
    }
    REQUIRE(before == after);
}
