#pragma once
#include "similarity.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace curbench {

struct Config; // forward declare

// A corpus document chunk with its embedding. Immutable once stored.
struct EmbeddedEntry {
    std::string id;
    std::string content;
    Embedding vector;
    std::string domain;
    int credibility_score = 0;                 // 0-100
    std::optional<int64_t> publication_date;   // epoch seconds, nullopt = unknown
    std::vector<std::string> tags;
    bool is_foundational = false;              // exempt from recency admission

    std::string title;
    std::string source_url;
    std::string source_type;                   // "pdf" | "docx" | "url" | "manual"
    uint32_t chunk_index = 0;
    uint32_t total_chunks = 1;
};

// Metadata predicate pushed down to the store.
struct EntryFilter {
    std::vector<std::string> domains;          // empty = any domain
    std::optional<int> min_credibility;
};

// A full-text match. `score` is relative to the best match of the same query,
// so it lies in (0, 1].
struct KeywordHit {
    EmbeddedEntry entry;
    double score = 0.0;
};

struct CorpusStats {
    uint32_t total_documents = 0;
    long average_credibility = 0;
    std::map<std::string, uint32_t> domain_distribution;
};

// Abstract corpus backend
class CorpusStore {
public:
    virtual ~CorpusStore() = default;

    virtual std::string backend_name() const = 0;

    // Entries passing the metadata filter, ordered by id.
    virtual std::vector<EmbeddedEntry> query(const EntryFilter& filter) = 0;

    virtual std::optional<EmbeddedEntry> get(const std::string& id) = 0;

    // Entries passing the filter whose title or content mention any keyword
    // of `text`, best match first (ties by id), at most `limit`.
    virtual std::vector<KeywordHit> keyword_query(const std::string& text,
                                                  const EntryFilter& filter,
                                                  uint32_t limit) = 0;

    // Insert entries (ids generated when empty). Returns the stored ids in input order.
    // An existing id is replaced.
    virtual std::vector<std::string> insert(const std::vector<EmbeddedEntry>& entries) = 0;

    // Returns the number of entries removed.
    virtual uint32_t delete_by_ids(const std::vector<std::string>& ids) = 0;
    virtual uint32_t delete_where(const std::function<bool(const EmbeddedEntry&)>& predicate) = 0;

    virtual uint32_t count() = 0;
    virtual CorpusStats stats() = 0;
};

// True when the entry's metadata passes the filter.
bool entry_matches(const EmbeddedEntry& entry, const EntryFilter& filter);

// Lowercased alphanumeric tokens of at least two characters, deduplicated.
std::vector<std::string> keyword_terms(const std::string& text);

// Non-overlapping occurrences of `needle` in `haystack`.
uint32_t count_occurrences(const std::string& haystack, const std::string& needle);

// Scale scores so the best is 1, sort best first (ties by id) and truncate.
void normalize_keyword_hits(std::vector<KeywordHit>& hits, uint32_t limit);

// Aggregate stats over a set of entries.
CorpusStats compute_stats(const std::vector<EmbeddedEntry>& entries);

// JSON conversions. publication_date is accepted as "YYYY-MM-DD", a full ISO
// timestamp or epoch seconds, and written as "YYYY-MM-DD".
// Throws std::invalid_argument on an unparseable date.
EmbeddedEntry entry_from_json(const nlohmann::json& item);
nlohmann::json entry_to_json(const EmbeddedEntry& entry, bool include_vector = true);
nlohmann::json stats_to_json(const CorpusStats& stats);

// Create the configured corpus backend ("sqlite" or "memory").
// Returns nullptr for an unknown backend.
std::unique_ptr<CorpusStore> create_corpus_store(const Config& config);

} // namespace curbench
