#pragma once
#include "../corpus.hpp"
#include <map>
#include <mutex>

namespace curbench {

// Process-local corpus, kept ordered by id.
class MemoryCorpus : public CorpusStore {
public:
    MemoryCorpus() = default;
    explicit MemoryCorpus(const std::vector<EmbeddedEntry>& entries);

    std::string backend_name() const override { return "memory"; }

    std::vector<EmbeddedEntry> query(const EntryFilter& filter) override;
    std::optional<EmbeddedEntry> get(const std::string& id) override;
    std::vector<KeywordHit> keyword_query(const std::string& text, const EntryFilter& filter,
                                          uint32_t limit) override;
    std::vector<std::string> insert(const std::vector<EmbeddedEntry>& entries) override;
    uint32_t delete_by_ids(const std::vector<std::string>& ids) override;
    uint32_t delete_where(const std::function<bool(const EmbeddedEntry&)>& predicate) override;
    uint32_t count() override;
    CorpusStats stats() override;

private:
    std::map<std::string, EmbeddedEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace curbench
