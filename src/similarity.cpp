#include "similarity.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>

namespace curbench {

double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) throw DimensionMismatch(a.size(), b.size());
    if (a.empty()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); i++) {
        dot    += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);

    if (norm_a == 0.0 || norm_b == 0.0) return 0.0;

    double sim = dot / (norm_a * norm_b);
    return std::max(-1.0, std::min(1.0, sim));
}

double recency_score(std::optional<int64_t> publication_date, int64_t now) {
    if (!publication_date) return 0.5;

    double age_years = static_cast<double>(now - *publication_date) /
                       static_cast<double>(kSecondsPerYear);
    if (age_years < 0.0) return 1.0;
    return std::max(0.0, 1.0 - age_years / kRecencyHorizonYears);
}

bool within_recency_window(std::optional<int64_t> publication_date, int64_t now,
                           uint32_t max_age_years) {
    if (!publication_date) return false;
    return now - *publication_date <= static_cast<int64_t>(max_age_years) * kSecondsPerYear;
}

double composite_score(double similarity, int credibility_score, double recency) {
    return similarity * 0.6 + (static_cast<double>(credibility_score) / 100.0) * 0.3 +
           recency * 0.1;
}

double recency_weighted_score(double similarity, double recency, double weight) {
    return similarity * (1.0 - weight) + recency * weight;
}

double best_match(const Embedding& v, const std::vector<Embedding>& candidates,
                  uint32_t* skipped) {
    double best = 0.0;
    for (const auto& c : candidates) {
        if (c.size() != v.size()) {
            if (skipped) ++*skipped;
            continue;
        }
        best = std::max(best, cosine_similarity(v, c));
    }
    return best;
}

std::string serialize_vector(const Embedding& vec) {
    if (vec.empty()) return {};

    std::string data(sizeof(float) * vec.size(), '\0');
    std::memcpy(data.data(), vec.data(), sizeof(float) * vec.size());
    return data;
}

Embedding deserialize_vector(const std::string& data) {
    if (data.empty() || data.size() % sizeof(float) != 0) return {};

    Embedding vec(data.size() / sizeof(float));
    std::memcpy(vec.data(), data.data(), data.size());
    return vec;
}

} // namespace curbench
