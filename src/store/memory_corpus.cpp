#include "memory_corpus.hpp"
#include "../util.hpp"

namespace curbench {

MemoryCorpus::MemoryCorpus(const std::vector<EmbeddedEntry>& entries) {
    insert(entries);
}

std::vector<EmbeddedEntry> MemoryCorpus::query(const EntryFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EmbeddedEntry> results;
    for (const auto& [id, entry] : entries_) {
        if (entry_matches(entry, filter)) results.push_back(entry);
    }
    return results;
}

std::optional<EmbeddedEntry> MemoryCorpus::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

// Keyword score is the total term count over title and content.
std::vector<KeywordHit> MemoryCorpus::keyword_query(const std::string& text,
                                                    const EntryFilter& filter,
                                                    uint32_t limit) {
    auto terms = keyword_terms(text);
    if (terms.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<KeywordHit> hits;
    for (const auto& [id, entry] : entries_) {
        if (!entry_matches(entry, filter)) continue;
        std::string haystack = to_lower(entry.title + " " + entry.content);
        uint32_t matches = 0;
        for (const auto& t : terms) matches += count_occurrences(haystack, t);
        if (matches > 0) hits.push_back({entry, static_cast<double>(matches)});
    }
    normalize_keyword_hits(hits, limit);
    return hits;
}

std::vector<std::string> MemoryCorpus::insert(const std::vector<EmbeddedEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entries.size());
    for (auto entry : entries) {
        if (entry.id.empty()) entry.id = generate_id();
        ids.push_back(entry.id);
        entries_[entry.id] = std::move(entry);
    }
    return ids;
}

uint32_t MemoryCorpus::delete_by_ids(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (const auto& id : ids) {
        removed += static_cast<uint32_t>(entries_.erase(id));
    }
    return removed;
}

uint32_t MemoryCorpus::delete_where(const std::function<bool(const EmbeddedEntry&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (predicate(it->second)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

uint32_t MemoryCorpus::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

CorpusStats MemoryCorpus::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EmbeddedEntry> all;
    all.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) all.push_back(entry);
    return compute_stats(all);
}

} // namespace curbench
