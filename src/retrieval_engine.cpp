#include "retrieval_engine.hpp"
#include "cache.hpp"
#include "cancel.hpp"
#include "embedder.hpp"
#include "errors.hpp"
#include "fanout.hpp"
#include "similarity.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace curbench {

RetrievalOptions RetrievalOptions::from_config(const RetrievalConfig& cfg) {
    RetrievalOptions opts;
    opts.min_similarity = cfg.min_similarity;
    opts.limit = cfg.limit;
    opts.recency_weight = cfg.recency_weight;
    opts.include_undated = cfg.include_undated;
    if (cfg.min_credibility > 0) {
        opts.min_credibility = static_cast<int>(cfg.min_credibility);
    }
    return opts;
}

void validate_options(const RetrievalOptions& options) {
    if (!(options.min_similarity >= 0.0 && options.min_similarity <= 1.0)) {
        throw InvalidQuery("min_similarity must be within [0, 1]");
    }
    if (!(options.recency_weight >= 0.0 && options.recency_weight <= 1.0)) {
        throw InvalidQuery("recency_weight must be within [0, 1]");
    }
    if (options.limit == 0) {
        throw InvalidQuery("limit must be greater than zero");
    }
    if (options.min_credibility &&
        (*options.min_credibility < 0 || *options.min_credibility > 100)) {
        throw InvalidQuery("min_credibility must be within [0, 100]");
    }
}

std::vector<std::string> generate_query_variations(const std::string& query) {
    return {
        query,
        "What are the key concepts related to " + query + "?",
        "Explain " + query + " in detail"
    };
}

std::string canonical_options(const RetrievalOptions& options) {
    std::vector<std::string> domains = options.domains;
    std::sort(domains.begin(), domains.end());
    domains.erase(std::unique(domains.begin(), domains.end()), domains.end());

    nlohmann::json j = {
        {"domains", domains},
        {"min_similarity", options.min_similarity},
        {"limit", options.limit},
        {"recency_weight", options.recency_weight},
        {"include_undated", options.include_undated}
    };
    j["min_credibility"] = options.min_credibility ? nlohmann::json(*options.min_credibility)
                                                   : nlohmann::json(nullptr);
    return j.dump();
}

nlohmann::json results_to_json(const std::vector<RetrievalResult>& results,
                               bool include_vector) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back({
            {"entry", entry_to_json(r.entry, include_vector)},
            {"similarity_score", r.similarity_score},
            {"rank", r.rank}
        });
    }
    return arr;
}

RetrievalEngine::RetrievalEngine(CorpusStore& corpus, Embedder& embedder,
                                 const Config& config, Cache* cache)
    : corpus_(corpus)
    , embedder_(embedder)
    , cache_(cache)
    , config_(config.retrieval)
    , cache_ttl_(config.cache.search_ttl)
    , max_concurrency_(config.embeddings.max_concurrency)
    , clock_([] { return static_cast<int64_t>(epoch_seconds()); })
{}

// Ordering helpers: higher score first, ties by ascending id.
static bool by_score_then_id(const RetrievalResult& a, const RetrievalResult& b) {
    if (a.similarity_score != b.similarity_score) return a.similarity_score > b.similarity_score;
    return a.entry.id < b.entry.id;
}

static void assign_ranks(std::vector<RetrievalResult>& results) {
    for (size_t i = 0; i < results.size(); ++i) {
        results[i].rank = static_cast<uint32_t>(i + 1);
    }
}

// Candidate count for a widened sub-search; saturates instead of wrapping.
static uint32_t widened_limit(uint32_t limit) {
    constexpr uint32_t max = std::numeric_limits<uint32_t>::max();
    return limit > max / 2 ? max : limit * 2;
}

// Query term frequency per hundred characters of content.
static double term_frequency_score(const std::string& content,
                                   const std::vector<std::string>& terms) {
    if (content.empty()) return 0.0;
    std::string lowered = to_lower(content);
    uint32_t matches = 0;
    for (const auto& t : terms) matches += count_occurrences(lowered, t);
    return static_cast<double>(matches) / (static_cast<double>(lowered.size()) / 100.0);
}

bool RetrievalEngine::admitted(const EmbeddedEntry& entry, int64_t now,
                               const RetrievalOptions& options) const {
    if (entry.is_foundational) return true;
    if (!entry.publication_date) return options.include_undated;
    return within_recency_window(entry.publication_date, now, config_.max_age_years);
}

// Cached results hold ids and scores only; entries are re-read from the
// corpus. A cached id that is no longer stored makes the lookup a miss.
std::optional<std::vector<RetrievalResult>> RetrievalEngine::cache_lookup(const std::string& key) {
    if (!cache_) return std::nullopt;
    auto hit = cache_->get(key);
    if (!hit) return std::nullopt;

    std::vector<RetrievalResult> results;
    try {
        auto j = nlohmann::json::parse(*hit);
        if (!j.is_array()) return std::nullopt;
        for (const auto& item : j) {
            auto stored = corpus_.get(item.at("id").get<std::string>());
            if (!stored) return std::nullopt;
            results.push_back(RetrievalResult{std::move(*stored),
                                              item.at("score").get<double>(),
                                              item.at("rank").get<uint32_t>()});
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[retrieval] Ignoring unreadable cache entry: " << e.what() << "\n";
        return std::nullopt;
    }
    return results;
}

void RetrievalEngine::cache_store(const std::string& key,
                                  const std::vector<RetrievalResult>& results) {
    if (!cache_) return;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : results) {
        arr.push_back({{"id", r.entry.id}, {"score", r.similarity_score}, {"rank", r.rank}});
    }
    cache_->set(key, arr.dump(), cache_ttl_);
}

std::vector<RetrievalResult> RetrievalEngine::search(const std::string& query,
                                                     const RetrievalOptions& options,
                                                     const CancelToken* cancel) {
    validate_options(options);

    std::string key = make_cache_key("search", {"search", query, canonical_options(options)});
    if (auto cached = cache_lookup(key)) return *cached;

    auto results = run_search(query, options, cancel);
    cache_store(key, results);
    return results;
}

std::vector<RetrievalResult> RetrievalEngine::run_search(const std::string& query,
                                                         const RetrievalOptions& options,
                                                         const CancelToken* cancel) {
    Embedding query_vec;
    try {
        query_vec = embedder_.embed(query, cancel);
    } catch (const EmbedError&) {
        throw RetrievalFailed("search", query, std::current_exception());
    }

    EntryFilter filter;
    filter.domains = options.domains;
    filter.min_credibility = options.min_credibility;
    auto entries = corpus_.query(filter);

    int64_t now = clock_();
    uint32_t skipped = 0;
    std::vector<RetrievalResult> results;

    for (auto& entry : entries) {
        if (entry.vector.size() != query_vec.size()) {
            skipped++;
            continue;
        }
        double sim = cosine_similarity(entry.vector, query_vec);
        if (sim < options.min_similarity) continue;
        if (!admitted(entry, now, options)) continue;
        results.push_back(RetrievalResult{std::move(entry), sim, 0});
    }

    if (skipped > 0) {
        std::cerr << "[retrieval] Skipped " << skipped
                  << " entries whose dimension differs from the query (" << query_vec.size()
                  << ")\n";
    }

    // Credibility first, then similarity.
    std::sort(results.begin(), results.end(),
              [](const RetrievalResult& a, const RetrievalResult& b) {
                  if (a.entry.credibility_score != b.entry.credibility_score)
                      return a.entry.credibility_score > b.entry.credibility_score;
                  if (a.similarity_score != b.similarity_score)
                      return a.similarity_score > b.similarity_score;
                  return a.entry.id < b.entry.id;
              });

    if (options.recency_weight > 0.0) {
        for (auto& r : results) {
            double recency = recency_score(r.entry.publication_date, now);
            r.similarity_score = recency_weighted_score(r.similarity_score, recency,
                                                        options.recency_weight);
        }
        std::stable_sort(results.begin(), results.end(), by_score_then_id);
    }

    if (results.size() > options.limit) results.resize(options.limit);
    assign_ranks(results);
    return results;
}

std::vector<RetrievalResult> RetrievalEngine::multi_query_search(
    const std::vector<std::string>& variants, const RetrievalOptions& options) {
    if (variants.empty()) {
        throw InvalidQuery("at least one query variant is required");
    }
    validate_options(options);

    if (variants.size() == 1) return search(variants.front(), options);

    std::vector<std::string> key_fields = {"multi_query_search", canonical_options(options)};
    key_fields.insert(key_fields.end(), variants.begin(), variants.end());
    std::string key = make_cache_key("search", key_fields);
    if (auto cached = cache_lookup(key)) return *cached;

    RetrievalOptions per_variant = options;
    per_variant.limit = widened_limit(options.limit);

    CancelToken cancel;
    std::vector<std::vector<RetrievalResult>> variant_results(variants.size());
    auto failure = run_all(variants.size(), max_concurrency_, cancel, [&](size_t i) {
        variant_results[i] = search(variants[i], per_variant, &cancel);
    });
    if (failure) {
        // Embedding failures are reported against the variant; store and
        // validation errors propagate as they are.
        try {
            std::rethrow_exception(failure->error);
        } catch (const RetrievalFailed&) {
            throw RetrievalFailed("multi_query_search", variants[failure->index],
                                  failure->error);
        }
    }

    // First occurrence of an id wins, in variant order.
    std::vector<RetrievalResult> merged;
    std::unordered_set<std::string> seen;
    for (auto& list : variant_results) {
        for (auto& r : list) {
            if (seen.insert(r.entry.id).second) merged.push_back(std::move(r));
        }
    }

    std::stable_sort(merged.begin(), merged.end(), by_score_then_id);
    if (merged.size() > options.limit) merged.resize(options.limit);
    assign_ranks(merged);

    cache_store(key, merged);
    return merged;
}

std::vector<RetrievalResult> RetrievalEngine::expanded_search(
    const std::string& query, const RetrievalOptions& options) {
    return multi_query_search(generate_query_variations(query), options);
}

std::vector<RetrievalResult> RetrievalEngine::search_with_ranking(
    const std::string& query, const RetrievalOptions& options) {
    validate_options(options);

    RetrievalOptions raw = options;
    raw.recency_weight = 0.0;
    auto results = search(query, raw);

    int64_t now = clock_();
    for (auto& r : results) {
        double recency = recency_score(r.entry.publication_date, now);
        r.similarity_score = composite_score(r.similarity_score, r.entry.credibility_score,
                                             recency);
    }
    std::stable_sort(results.begin(), results.end(), by_score_then_id);
    assign_ranks(results);
    return results;
}

std::vector<RetrievalResult> RetrievalEngine::hybrid_search(
    const std::string& query, const RetrievalOptions& options) {
    static constexpr double kSemanticWeight = 0.7;
    static constexpr double kKeywordWeight = 0.3;
    static constexpr double kRerankScoreWeight = 0.7;
    static constexpr double kRerankTermWeight = 0.3;

    validate_options(options);

    std::string key = make_cache_key("search", {"hybrid_search", query, canonical_options(options)});
    if (auto cached = cache_lookup(key)) return *cached;

    RetrievalOptions wide = options;
    wide.limit = widened_limit(options.limit);
    auto semantic = search(query, wide);

    EntryFilter filter;
    filter.domains = options.domains;
    filter.min_credibility = options.min_credibility;
    auto keyword = corpus_.keyword_query(query, filter, wide.limit);

    std::vector<RetrievalResult> merged;
    std::unordered_map<std::string, size_t> position;
    for (auto& r : semantic) {
        r.similarity_score *= kSemanticWeight;
        position[r.entry.id] = merged.size();
        merged.push_back(std::move(r));
    }

    int64_t now = clock_();
    for (auto& hit : keyword) {
        if (!admitted(hit.entry, now, options)) continue;
        auto it = position.find(hit.entry.id);
        if (it != position.end()) {
            merged[it->second].similarity_score += hit.score * kKeywordWeight;
        } else {
            position[hit.entry.id] = merged.size();
            merged.push_back(RetrievalResult{std::move(hit.entry), hit.score * kKeywordWeight, 0});
        }
    }

    // Re-rank with whitespace-separated query terms.
    std::vector<std::string> terms;
    for (const auto& t : split_any(to_lower(query), " \t\n")) {
        if (!t.empty()) terms.push_back(t);
    }
    for (auto& r : merged) {
        r.similarity_score = r.similarity_score * kRerankScoreWeight +
                             term_frequency_score(r.entry.content, terms) * kRerankTermWeight;
    }

    std::stable_sort(merged.begin(), merged.end(), by_score_then_id);
    if (merged.size() > options.limit) merged.resize(options.limit);
    assign_ranks(merged);

    cache_store(key, merged);
    return merged;
}

CorpusStats RetrievalEngine::stats() {
    return corpus_.stats();
}

} // namespace curbench
