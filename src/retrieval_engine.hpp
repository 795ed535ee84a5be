#pragma once
#include "corpus.hpp"
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

class Embedder;    // forward declare
class Cache;       // forward declare
class CancelToken; // forward declare

struct RetrievalOptions {
    std::vector<std::string> domains;      // empty = any domain
    std::optional<int> min_credibility;
    double min_similarity = 0.75;
    uint32_t limit = 10;
    double recency_weight = 0.0;           // 0 = no reweighting
    bool include_undated = false;          // admit entries with no publication date

    static RetrievalOptions from_config(const RetrievalConfig& cfg);
};

struct RetrievalResult {
    EmbeddedEntry entry;
    double similarity_score = 0.0;
    uint32_t rank = 0;                     // 1-based
};

// Throws InvalidQuery when an option is out of range.
void validate_options(const RetrievalOptions& options);

// The query followed by two rephrasings, for multi-query retrieval.
std::vector<std::string> generate_query_variations(const std::string& query);

// Canonical, order-stable rendering of the options (used for cache keys).
std::string canonical_options(const RetrievalOptions& options);

nlohmann::json results_to_json(const std::vector<RetrievalResult>& results,
                               bool include_vector = true);

class RetrievalEngine {
public:
    using Clock = std::function<int64_t()>;

    // `cache` may be null; results are identical with or without it.
    RetrievalEngine(CorpusStore& corpus, Embedder& embedder, const Config& config,
                    Cache* cache = nullptr);

    // Nearest corpus entries to `query` above the similarity floor.
    // Throws InvalidQuery, or RetrievalFailed when the query cannot be embedded.
    std::vector<RetrievalResult> search(const std::string& query,
                                        const RetrievalOptions& options,
                                        const CancelToken* cancel = nullptr);

    // Search every variant concurrently and merge, first occurrence of an id
    // winning. Fails as a whole if any variant fails: an embedding failure as
    // RetrievalFailed naming the variant, a store failure unchanged.
    std::vector<RetrievalResult> multi_query_search(const std::vector<std::string>& variants,
                                                    const RetrievalOptions& options);

    // multi_query_search over generate_query_variations(query).
    std::vector<RetrievalResult> expanded_search(const std::string& query,
                                                 const RetrievalOptions& options);

    // `search` rescored by the 0.6/0.3/0.1 composite. The composite replaces
    // recency reweighting: it always starts from the raw cosine.
    std::vector<RetrievalResult> search_with_ranking(const std::string& query,
                                                     const RetrievalOptions& options);

    // Semantic and keyword recall merged 0.7/0.3, each fetching limit*2
    // candidates, then re-ranked 70/30 with query term frequency.
    std::vector<RetrievalResult> hybrid_search(const std::string& query,
                                               const RetrievalOptions& options);

    CorpusStats stats();

    // Options populated from the retrieval config section.
    RetrievalOptions default_options() const { return RetrievalOptions::from_config(config_); }

    // Override "now" (epoch seconds) for recency computations.
    void set_clock(Clock clock) { clock_ = std::move(clock); }

private:
    std::vector<RetrievalResult> run_search(const std::string& query,
                                            const RetrievalOptions& options,
                                            const CancelToken* cancel);
    bool admitted(const EmbeddedEntry& entry, int64_t now,
                  const RetrievalOptions& options) const;
    std::optional<std::vector<RetrievalResult>> cache_lookup(const std::string& key);
    void cache_store(const std::string& key, const std::vector<RetrievalResult>& results);

    CorpusStore& corpus_;
    Embedder& embedder_;
    Cache* cache_;
    RetrievalConfig config_;
    uint32_t cache_ttl_;
    uint32_t max_concurrency_;
    Clock clock_;
};

} // namespace curbench
