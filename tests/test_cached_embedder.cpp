#include <catch2/catch.hpp>
#include "embedders/cached_embedder.hpp"
#include "cache.hpp"
#include "embedders/http_embedder.hpp"
#include "mock_embedder.hpp"
#include "mock_http_client.hpp"
#include <map>

using namespace curbench;

namespace {

class MapCache : public Cache {
public:
    std::map<std::string, std::string> values;
    std::map<std::string, uint32_t> ttls;

    std::optional<std::string> get(const std::string& key) override {
        auto it = values.find(key);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    void set(const std::string& key, const std::string& value, uint32_t ttl) override {
        values[key] = value;
        ttls[key] = ttl;
    }
};

} // namespace

TEST_CASE("CachedEmbedder: second call is served from cache", "[cached_embedder]") {
    MapCache cache;
    auto inner = std::make_unique<MockEmbedder>();
    auto* mock = inner.get();
    mock->table["deep learning"] = {0.1f, 0.2f, 0.3f};

    CachedEmbedder emb(std::move(inner), cache, 600);
    auto first = emb.embed("deep learning");
    auto second = emb.embed("deep learning");

    REQUIRE(first == second);
    REQUIRE(second == Embedding{0.1f, 0.2f, 0.3f});
    REQUIRE(mock->call_count.load() == 1);
    REQUIRE(cache.ttls[emb.cache_key("deep learning")] == 600);
}

TEST_CASE("CachedEmbedder: distinct texts miss", "[cached_embedder]") {
    MapCache cache;
    auto inner = std::make_unique<MockEmbedder>();
    auto* mock = inner.get();

    CachedEmbedder emb(std::move(inner), cache, 600);
    emb.embed("a");
    emb.embed("b");

    REQUIRE(mock->call_count.load() == 2);
    REQUIRE(cache.values.size() == 2);
    REQUIRE(emb.cache_key("a") != emb.cache_key("b"));
}

TEST_CASE("CachedEmbedder: unreadable cached value falls through", "[cached_embedder]") {
    MapCache cache;
    auto inner = std::make_unique<MockEmbedder>();
    auto* mock = inner.get();
    mock->table["x"] = {1.0f, 0.0f, 0.0f};

    CachedEmbedder emb(std::move(inner), cache, 600);
    cache.values[emb.cache_key("x")] = "garbage";

    REQUIRE(emb.embed("x") == Embedding{1.0f, 0.0f, 0.0f});
    REQUIRE(mock->call_count.load() == 1);
    REQUIRE(cache.values[emb.cache_key("x")] == "[1.0,0.0,0.0]");
}

TEST_CASE("CachedEmbedder: failures are not cached", "[cached_embedder]") {
    MapCache cache;
    auto inner = std::make_unique<MockEmbedder>();
    inner->failing.insert("bad");

    CachedEmbedder emb(std::move(inner), cache, 600);
    REQUIRE_THROWS_AS(emb.embed("bad"), EmbedError);
    REQUIRE(cache.values.empty());
}

TEST_CASE("CachedEmbedder: forwards name, model and dimensions", "[cached_embedder]") {
    MapCache cache;
    CachedEmbedder emb(std::make_unique<MockEmbedder>(), cache, 600);
    REQUIRE(emb.embedder_name() == "mock");
    REQUIRE(emb.model_name() == "mock-small");
    REQUIRE(emb.dimensions() == 3);
}

// ── Model isolation ──────────────────────────────────────────

TEST_CASE("CachedEmbedder: the model is part of the key", "[cached_embedder]") {
    MapCache cache;
    auto small = std::make_unique<MockEmbedder>();
    auto large = std::make_unique<MockEmbedder>();
    large->model = "mock-large";

    CachedEmbedder a(std::move(small), cache, 600);
    CachedEmbedder b(std::move(large), cache, 600);
    REQUIRE(a.cache_key("x") != b.cache_key("x"));
}

TEST_CASE("CachedEmbedder: models sharing a cache get their own vectors", "[cached_embedder]") {
    MapCache cache;
    MockHttpClient http;

    CachedEmbedder small(create_openai_embedder("k", http, "", "text-embedding-3-small"),
                         cache, 600);
    CachedEmbedder large(create_openai_embedder("k", http, "", "text-embedding-3-large"),
                         cache, 600);

    http.next_response = {200, R"({"data":[{"embedding":[0.1,0.2,0.3]}]})"};
    REQUIRE(small.embed("pedagogy").size() == 3);

    http.next_response = {200, R"({"data":[{"embedding":[0.1,0.2,0.3,0.4]}]})"};
    REQUIRE(large.embed("pedagogy").size() == 4);
    REQUIRE(http.call_count == 2);
    REQUIRE(cache.values.size() == 2);

    // Both are now warm and still distinct.
    REQUIRE(small.embed("pedagogy").size() == 3);
    REQUIRE(large.embed("pedagogy").size() == 4);
    REQUIRE(http.call_count == 2);
}
