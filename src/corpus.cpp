#include "corpus.hpp"
#include "config.hpp"
#include "store/memory_corpus.hpp"
#include "store/sqlite_corpus.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace curbench {

bool entry_matches(const EmbeddedEntry& entry, const EntryFilter& filter) {
    if (!filter.domains.empty() &&
        std::find(filter.domains.begin(), filter.domains.end(), entry.domain) ==
            filter.domains.end()) {
        return false;
    }
    if (filter.min_credibility && entry.credibility_score < *filter.min_credibility) {
        return false;
    }
    return true;
}

std::vector<std::string> keyword_terms(const std::string& text) {
    std::vector<std::string> terms;
    std::string token;
    auto flush = [&] {
        if (token.size() >= 2 &&
            std::find(terms.begin(), terms.end(), token) == terms.end()) {
            terms.push_back(token);
        }
        token.clear();
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

uint32_t count_occurrences(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return 0;
    uint32_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        n++;
    }
    return n;
}

void normalize_keyword_hits(std::vector<KeywordHit>& hits, uint32_t limit) {
    std::sort(hits.begin(), hits.end(), [](const KeywordHit& a, const KeywordHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.entry.id < b.entry.id;
    });
    if (hits.size() > limit) hits.resize(limit);
    if (hits.empty() || hits.front().score <= 0.0) return;

    double best = hits.front().score;
    for (auto& h : hits) h.score /= best;
}

CorpusStats compute_stats(const std::vector<EmbeddedEntry>& entries) {
    CorpusStats stats;
    stats.total_documents = static_cast<uint32_t>(entries.size());
    if (entries.empty()) return stats;

    double total = 0.0;
    for (const auto& e : entries) {
        total += e.credibility_score;
        stats.domain_distribution[e.domain]++;
    }
    stats.average_credibility = round_half_up(total / static_cast<double>(entries.size()));
    return stats;
}

static int clamp_credibility(int score) {
    return std::clamp(score, 0, 100);
}

EmbeddedEntry entry_from_json(const nlohmann::json& item) {
    EmbeddedEntry entry;
    entry.id = item.value("id", "");
    entry.content = item.value("content", "");
    entry.domain = item.value("domain", "");
    entry.credibility_score = clamp_credibility(item.value("credibility_score", 0));
    entry.is_foundational = item.value("is_foundational", false);
    entry.title = item.value("title", "");
    entry.source_url = item.value("source_url", "");
    entry.source_type = item.value("source_type", "manual");
    entry.chunk_index = item.value("chunk_index", uint32_t{0});
    entry.total_chunks = item.value("total_chunks", uint32_t{1});

    if (item.contains("vector") && item["vector"].is_array()) {
        entry.vector = item["vector"].get<Embedding>();
    }
    if (item.contains("tags") && item["tags"].is_array()) {
        for (const auto& tag : item["tags"]) {
            if (tag.is_string()) entry.tags.push_back(tag.get<std::string>());
        }
    }

    if (item.contains("publication_date") && !item["publication_date"].is_null()) {
        const auto& d = item["publication_date"];
        if (d.is_number_integer()) {
            entry.publication_date = d.get<int64_t>();
        } else if (d.is_string()) {
            int64_t epoch = 0;
            if (!parse_date(d.get<std::string>(), epoch)) {
                throw std::invalid_argument("invalid publication_date: " + d.get<std::string>());
            }
            entry.publication_date = epoch;
        } else {
            throw std::invalid_argument("invalid publication_date for entry " + entry.id);
        }
    }
    return entry;
}

nlohmann::json entry_to_json(const EmbeddedEntry& entry, bool include_vector) {
    nlohmann::json item = {
        {"id", entry.id},
        {"content", entry.content},
        {"domain", entry.domain},
        {"credibility_score", entry.credibility_score},
        {"tags", entry.tags},
        {"is_foundational", entry.is_foundational},
        {"title", entry.title},
        {"source_url", entry.source_url},
        {"source_type", entry.source_type},
        {"chunk_index", entry.chunk_index},
        {"total_chunks", entry.total_chunks}
    };
    if (entry.publication_date) {
        item["publication_date"] = format_date(*entry.publication_date);
    } else {
        item["publication_date"] = nullptr;
    }
    if (include_vector) {
        item["vector"] = entry.vector;
    }
    return item;
}

nlohmann::json stats_to_json(const CorpusStats& stats) {
    nlohmann::json dist = nlohmann::json::object();
    for (const auto& [domain, n] : stats.domain_distribution) {
        dist[domain] = n;
    }
    return {
        {"total_documents", stats.total_documents},
        {"average_credibility", stats.average_credibility},
        {"domain_distribution", dist}
    };
}

std::unique_ptr<CorpusStore> create_corpus_store(const Config& config) {
    const auto& backend = config.storage.corpus_backend;
    if (backend == "sqlite") {
        return std::make_unique<SqliteCorpus>(config.corpus_path());
    }
    if (backend == "memory") {
        return std::make_unique<MemoryCorpus>();
    }
    std::cerr << "[corpus] Unknown corpus backend: " << backend << "\n";
    return nullptr;
}

} // namespace curbench
