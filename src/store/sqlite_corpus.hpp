#pragma once
#include "../corpus.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace curbench {

class SqliteCorpus : public CorpusStore {
public:
    explicit SqliteCorpus(const std::string& path);
    ~SqliteCorpus() override;

    // Non-copyable
    SqliteCorpus(const SqliteCorpus&) = delete;
    SqliteCorpus& operator=(const SqliteCorpus&) = delete;

    std::string backend_name() const override { return "sqlite"; }

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
    void init_schema();
    bool table_exists(const char* name);
    uint32_t delete_ids_locked(const std::vector<std::string>& ids);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace curbench
