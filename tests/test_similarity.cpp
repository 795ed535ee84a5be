#include <catch2/catch.hpp>
#include "similarity.hpp"
#include "errors.hpp"
#include <cmath>

using namespace curbench;

static constexpr int64_t kNow = 1735689600; // 2025-01-01T00:00:00Z

// ── Cosine similarity ────────────────────────────────────────

TEST_CASE("cosine_similarity: identical vectors", "[similarity]") {
    Embedding a = {0.3f, -1.2f, 4.0f};
    REQUIRE(std::abs(cosine_similarity(a, a) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: orthogonal vectors", "[similarity]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    Embedding b = {0.0f, 1.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b)) < 1e-6);
}

TEST_CASE("cosine_similarity: opposite vectors", "[similarity]") {
    Embedding a = {1.0f, 2.0f, 3.0f};
    Embedding b = {-1.0f, -2.0f, -3.0f};
    REQUIRE(std::abs(cosine_similarity(a, b) + 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: symmetric", "[similarity]") {
    Embedding a = {1.0f, 2.0f, 3.0f};
    Embedding b = {0.5f, -0.25f, 2.0f};
    REQUIRE(cosine_similarity(a, b) == cosine_similarity(b, a));
}

TEST_CASE("cosine_similarity: zero vector returns 0", "[similarity]") {
    Embedding a = {0.0f, 0.0f, 0.0f};
    Embedding b = {1.0f, 2.0f, 3.0f};
    REQUIRE(cosine_similarity(a, b) == 0.0);
    REQUIRE(cosine_similarity(b, a) == 0.0);
}

TEST_CASE("cosine_similarity: empty vectors return 0", "[similarity]") {
    REQUIRE(cosine_similarity({}, {}) == 0.0);
}

TEST_CASE("cosine_similarity: mismatched lengths throw", "[similarity]") {
    Embedding a = {1.0f, 2.0f};
    Embedding b = {1.0f, 2.0f, 3.0f};
    REQUIRE_THROWS_AS(cosine_similarity(a, b), DimensionMismatch);
}

TEST_CASE("cosine_similarity: 60 degree angle", "[similarity]") {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {0.5f, 0.866025f};
    REQUIRE(std::abs(cosine_similarity(a, b) - 0.5) < 1e-4);
}

// ── Recency ─────────────────────────────────────────────────

TEST_CASE("recency_score: unknown date is neutral", "[similarity]") {
    REQUIRE(recency_score(std::nullopt, kNow) == 0.5);
}

TEST_CASE("recency_score: published now scores 1", "[similarity]") {
    REQUIRE(recency_score(kNow, kNow) == 1.0);
}

TEST_CASE("recency_score: five years old scores 0", "[similarity]") {
    REQUIRE(recency_score(kNow - 5 * kSecondsPerYear, kNow) == 0.0);
    REQUIRE(recency_score(kNow - 9 * kSecondsPerYear, kNow) == 0.0);
}

TEST_CASE("recency_score: decays linearly", "[similarity]") {
    REQUIRE(std::abs(recency_score(kNow - kSecondsPerYear, kNow) - 0.8) < 1e-9);
    REQUIRE(std::abs(recency_score(kNow - 2 * kSecondsPerYear, kNow) - 0.6) < 1e-9);
}

TEST_CASE("recency_score: future dates clamp to 1", "[similarity]") {
    REQUIRE(recency_score(kNow + kSecondsPerYear, kNow) == 1.0);
}

TEST_CASE("within_recency_window: boundary and absent date", "[similarity]") {
    REQUIRE(within_recency_window(kNow - 5 * kSecondsPerYear, kNow, 5));
    REQUIRE_FALSE(within_recency_window(kNow - 5 * kSecondsPerYear - 1, kNow, 5));
    REQUIRE_FALSE(within_recency_window(std::nullopt, kNow, 5));
}

// ── Blends ──────────────────────────────────────────────────

TEST_CASE("composite_score: 0.6/0.3/0.1 weighting", "[similarity]") {
    REQUIRE(std::abs(composite_score(1.0, 100, 1.0) - 1.0) < 1e-9);
    REQUIRE(std::abs(composite_score(0.8, 50, 0.5) - (0.48 + 0.15 + 0.05)) < 1e-9);
}

TEST_CASE("recency_weighted_score: weight 0 keeps similarity", "[similarity]") {
    REQUIRE(recency_weighted_score(0.9, 0.1, 0.0) == 0.9);
}

TEST_CASE("recency_weighted_score: linear blend", "[similarity]") {
    REQUIRE(std::abs(recency_weighted_score(0.9, 0.5, 0.2) - 0.82) < 1e-9);
}

// ── best_match ──────────────────────────────────────────────

TEST_CASE("best_match: picks the highest similarity", "[similarity]") {
    Embedding v = {1.0f, 0.0f};
    std::vector<Embedding> candidates = {{0.0f, 1.0f}, {1.0f, 0.1f}, {1.0f, 1.0f}};
    double best = best_match(v, candidates);
    REQUIRE(best == cosine_similarity(v, candidates[1]));
}

TEST_CASE("best_match: negative similarity floors at 0", "[similarity]") {
    Embedding v = {1.0f, 0.0f};
    std::vector<Embedding> candidates = {{-1.0f, 0.0f}};
    REQUIRE(best_match(v, candidates) == 0.0);
}

TEST_CASE("best_match: no candidates is 0", "[similarity]") {
    REQUIRE(best_match({1.0f, 0.0f}, {}) == 0.0);
}

TEST_CASE("best_match: skips and counts mismatched dimensions", "[similarity]") {
    Embedding v = {1.0f, 0.0f};
    std::vector<Embedding> candidates = {{1.0f, 0.0f, 0.0f}, {0.0f, 1.0f}};
    uint32_t skipped = 0;
    REQUIRE(best_match(v, candidates, &skipped) == 0.0);
    REQUIRE(skipped == 1);
}

// ── Vector blobs ────────────────────────────────────────────

TEST_CASE("serialize_vector: preserves floats exactly", "[similarity]") {
    Embedding v = {0.1f, -2.5f, 3.14159f};
    REQUIRE(deserialize_vector(serialize_vector(v)) == v);
}

TEST_CASE("deserialize_vector: rejects truncated data", "[similarity]") {
    REQUIRE(deserialize_vector("abc").empty());
    REQUIRE(deserialize_vector("").empty());
}
