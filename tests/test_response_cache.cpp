#include <catch2/catch.hpp>
#include "store/response_cache.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <chrono>
#include <unistd.h>

using namespace curbench;

static std::string cache_test_path() {
    return "/tmp/curbench_test_cache_" + std::to_string(getpid()) + ".json";
}

// Removes the cache file once the cache itself (which flushes on
// destruction) is gone.
struct CacheFileGuard {
    std::string path;
    ~CacheFileGuard() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + ".tmp");
    }
};

struct CacheFixture {
    CacheFileGuard guard{cache_test_path()};
    ResponseCache cache{guard.path, 3600, 100};
};

// ── Keys ─────────────────────────────────────────────────────

TEST_CASE("make_cache_key: namespaced and deterministic", "[cache]") {
    auto a = make_cache_key("search", {"search", "neural networks", "{}"});
    auto b = make_cache_key("search", {"search", "neural networks", "{}"});
    REQUIRE(a == b);
    REQUIRE(a.rfind("search:", 0) == 0);
    REQUIRE(a.size() == std::string("search:").size() + 16);
}

TEST_CASE("make_cache_key: any field change alters the key", "[cache]") {
    auto base = make_cache_key("search", {"search", "q", "{}"});
    REQUIRE(make_cache_key("search", {"ranked", "q", "{}"}) != base);
    REQUIRE(make_cache_key("search", {"search", "q2", "{}"}) != base);
    REQUIRE(make_cache_key("embeddings", {"search", "q", "{}"}) != base);
}

// ── Basic get/set ────────────────────────────────────────────

TEST_CASE("ResponseCache: miss on empty cache", "[cache]") {
    CacheFixture f;
    REQUIRE_FALSE(f.cache.get("k").has_value());
}

TEST_CASE("ResponseCache: hit after set", "[cache]") {
    CacheFixture f;
    f.cache.set("k", "value", 0);

    auto result = f.cache.get("k");
    REQUIRE(result.has_value());
    REQUIRE(result.value_or("") == "value");
}

TEST_CASE("ResponseCache: set overwrites", "[cache]") {
    CacheFixture f;
    f.cache.set("k", "one", 0);
    f.cache.set("k", "two", 0);
    REQUIRE(f.cache.get("k").value_or("") == "two");
    REQUIRE(f.cache.size() == 1);
}

// ── Size tracking ────────────────────────────────────────────

TEST_CASE("ResponseCache: clear empties cache", "[cache]") {
    CacheFixture f;
    f.cache.set("a", "1", 0);
    f.cache.set("b", "2", 0);
    REQUIRE(f.cache.size() == 2);

    f.cache.clear();
    REQUIRE(f.cache.size() == 0);
    REQUIRE_FALSE(f.cache.get("a").has_value());
}

// ── LRU eviction ─────────────────────────────────────────────

TEST_CASE("ResponseCache: LRU eviction at max_entries", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_lru"};
    ResponseCache cache(guard.path, 3600, 3);

    cache.set("q1", "r1", 0);
    cache.set("q2", "r2", 0);
    cache.set("q3", "r3", 0);
    REQUIRE(cache.size() == 3);

    cache.set("q4", "r4", 0);
    REQUIRE(cache.size() == 3);

    int found = 0;
    for (const char* k : {"q1", "q2", "q3", "q4"}) {
        if (cache.get(k).has_value()) found++;
    }
    REQUIRE(found == 3);
}

// ── TTL expiry ───────────────────────────────────────────────

TEST_CASE("ResponseCache: per-entry TTL expiry", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_ttl"};
    ResponseCache cache(guard.path, 3600, 100);

    cache.set("short", "r", 1);
    cache.set("long", "r", 0);
    REQUIRE(cache.get("short").has_value());

    std::this_thread::sleep_for(std::chrono::seconds(2));

    REQUIRE_FALSE(cache.get("short").has_value());
    REQUIRE(cache.get("long").has_value());
}

// ── Persistence ──────────────────────────────────────────────

TEST_CASE("ResponseCache: persists across instances", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_persist"};

    {
        ResponseCache cache(guard.path, 3600, 100);
        cache.set("k", "persisted", 0);
    }

    {
        ResponseCache cache(guard.path, 3600, 100);
        REQUIRE(cache.get("k").value_or("") == "persisted");
    }
}

TEST_CASE("ResponseCache: writes are batched until flush", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_batch"};
    ResponseCache cache(guard.path, 3600, 100);

    cache.set("k", "v", 0);
    REQUIRE_FALSE(std::filesystem::exists(guard.path));

    cache.flush();
    REQUIRE(std::filesystem::exists(guard.path));

    ResponseCache reader(guard.path, 3600, 100);
    REQUIRE(reader.get("k").value_or("") == "v");
}

TEST_CASE("ResponseCache: a full batch is written without flush", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_full"};
    ResponseCache cache(guard.path, 3600, 100);

    for (uint32_t i = 0; i + 1 < ResponseCache::kFlushEvery; ++i) {
        cache.set("k" + std::to_string(i), "v", 0);
    }
    REQUIRE_FALSE(std::filesystem::exists(guard.path));

    cache.set("last", "v", 0);
    REQUIRE(std::filesystem::exists(guard.path));

    ResponseCache reader(guard.path, 3600, 100);
    REQUIRE(reader.size() == ResponseCache::kFlushEvery);
}

TEST_CASE("ResponseCache: corrupt file starts empty", "[cache]") {
    CacheFileGuard guard{cache_test_path() + "_corrupt"};
    {
        std::ofstream out(guard.path);
        out << "{{{ not json";
    }

    ResponseCache cache(guard.path, 3600, 100);
    REQUIRE(cache.size() == 0);
    cache.set("k", "v", 0);
    REQUIRE(cache.get("k").has_value());
}
