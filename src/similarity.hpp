#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

using Embedding = std::vector<float>;

// Recency decays over 365-day years.
constexpr int64_t kSecondsPerYear = 365LL * 24 * 60 * 60;
constexpr double kRecencyHorizonYears = 5.0;

// Cosine similarity between two float vectors, in [-1, 1].
// Throws DimensionMismatch when lengths differ.
// Returns 0.0 when either vector is empty or has zero magnitude.
double cosine_similarity(const Embedding& a, const Embedding& b);

// Linear recency score: 1.0 for a publication at `now`, 0.0 at five years old.
// Unknown date scores a neutral 0.5. Future dates clamp to 1.0.
double recency_score(std::optional<int64_t> publication_date, int64_t now);

// True if the publication date is no more than `max_age_years` before `now`.
// An absent date is never within the window.
bool within_recency_window(std::optional<int64_t> publication_date, int64_t now,
                           uint32_t max_age_years);

// Ranked blend: 60% similarity, 30% credibility (0-100 scaled to 0-1), 10% recency.
double composite_score(double similarity, int credibility_score, double recency);

// Recency blend: similarity * (1 - weight) + recency * weight.
double recency_weighted_score(double similarity, double recency, double weight);

// Best cosine similarity of `v` against `candidates`, floored at 0 so a
// negative similarity counts as no match. Candidates whose dimension differs
// from `v` are skipped; the number skipped is added to *skipped when non-null.
double best_match(const Embedding& v, const std::vector<Embedding>& candidates,
                  uint32_t* skipped = nullptr);

// Serialize a float vector to a binary string (for DB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
Embedding deserialize_vector(const std::string& data);

} // namespace curbench
