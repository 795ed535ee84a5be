#pragma once
#include "../competitor.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace curbench {

// SQLite-backed competitor programs; topics and structure stored as JSON text.
class CompetitorDb : public CompetitorStore {
public:
    explicit CompetitorDb(const std::string& path);
    ~CompetitorDb() override;

    // Non-copyable
    CompetitorDb(const CompetitorDb&) = delete;
    CompetitorDb& operator=(const CompetitorDb&) = delete;

    std::vector<CompetitorProgram> list() override;
    std::optional<CompetitorProgram> get(const std::string& id) override;
    CompetitorProgram insert(const CompetitorProgram& program) override;
    std::vector<CompetitorProgram> import_programs(
        const std::vector<CompetitorProgram>& programs) override;
    bool remove(const std::string& id) override;

private:
    void init_schema();
    CompetitorProgram insert_locked(const CompetitorProgram& program);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace curbench
