#include "competitor_db.hpp"
#include "sqlite_common.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

namespace curbench {

static constexpr const char* kOwner = "competitors";

CompetitorDb::CompetitorDb(const std::string& path) : path_(path) {
    db_ = open_database(path_, kOwner);
    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

CompetitorDb::~CompetitorDb() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void CompetitorDb::init_schema() {
    exec_or_throw(db_,
        "CREATE TABLE IF NOT EXISTS competitor_programs ("
        "  id               TEXT PRIMARY KEY,"
        "  institution_name TEXT NOT NULL,"
        "  program_name     TEXT NOT NULL,"
        "  level            TEXT,"
        "  topics           TEXT NOT NULL DEFAULT '[]',"
        "  structure        TEXT NOT NULL DEFAULT '{}',"
        "  created_at       INTEGER NOT NULL"
        ");", kOwner);
}

// Columns: id, institution_name, program_name, level, topics, structure, created_at
static CompetitorProgram program_from_stmt(sqlite3_stmt* stmt) {
    CompetitorProgram p;
    p.id = column_string(stmt, 0);
    p.institution_name = column_string(stmt, 1);
    p.program_name = column_string(stmt, 2);
    if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
        p.level = column_string(stmt, 3);
    }

    try {
        auto topics = nlohmann::json::parse(column_string(stmt, 4));
        for (const auto& t : topics) p.topics.push_back(topic_from_json(t));
        p.structure = structure_from_json(nlohmann::json::parse(column_string(stmt, 5)));
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(std::string(kOwner) + ": corrupt JSON in program " + p.id + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw StoreError(std::string(kOwner) + ": corrupt topic in program " + p.id + ": " + e.what());
    }

    p.created_at = sqlite3_column_int64(stmt, 6);
    return p;
}

static std::vector<CompetitorProgram> collect_programs(sqlite3* db, StmtGuard& g) {
    std::vector<CompetitorProgram> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(program_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string(kOwner) + ": query failed: " + sqlite3_errmsg(db));
    }
    return results;
}

std::vector<CompetitorProgram> CompetitorDb::list() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_,
        "SELECT id, institution_name, program_name, level, topics, structure, created_at"
        " FROM competitor_programs ORDER BY created_at DESC, rowid DESC;", g, kOwner);
    return collect_programs(db_, g);
}

std::optional<CompetitorProgram> CompetitorDb::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_,
        "SELECT id, institution_name, program_name, level, topics, structure, created_at"
        " FROM competitor_programs WHERE id = ?;", g, kOwner);
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    auto rows = collect_programs(db_, g);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

CompetitorProgram CompetitorDb::insert_locked(const CompetitorProgram& program) {
    CompetitorProgram stored = program;
    if (stored.id.empty()) stored.id = generate_id();
    if (stored.created_at == 0) stored.created_at = static_cast<int64_t>(epoch_seconds());

    nlohmann::json topics = nlohmann::json::array();
    for (const auto& t : stored.topics) topics.push_back(topic_to_json(t));
    std::string topics_text = topics.dump();
    std::string structure_text = structure_to_json(stored.structure).dump();

    StmtGuard g;
    prepare_or_throw(db_,
        "INSERT OR REPLACE INTO competitor_programs"
        " (id, institution_name, program_name, level, topics, structure, created_at)"
        " VALUES (?, ?, ?, ?, ?, ?, ?);", g, kOwner);
    sqlite3_bind_text(g.stmt, 1, stored.id.c_str(),               -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 2, stored.institution_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 3, stored.program_name.c_str(),     -1, SQLITE_TRANSIENT);
    if (stored.level) {
        sqlite3_bind_text(g.stmt, 4, stored.level->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(g.stmt, 4);
    }
    sqlite3_bind_text(g.stmt, 5, topics_text.c_str(),    -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(g.stmt, 6, structure_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(g.stmt, 7, stored.created_at);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string(kOwner) + ": insert failed for " +
                         stored.institution_name + ": " + sqlite3_errmsg(db_));
    }
    return stored;
}

CompetitorProgram CompetitorDb::insert(const CompetitorProgram& program) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_locked(program);
}

std::vector<CompetitorProgram> CompetitorDb::import_programs(
    const std::vector<CompetitorProgram>& programs) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<CompetitorProgram> imported;
    imported.reserve(programs.size());

    Transaction tx(db_, kOwner);
    for (const auto& p : programs) {
        imported.push_back(insert_locked(p));
    }
    tx.commit();
    return imported;
}

bool CompetitorDb::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_, "DELETE FROM competitor_programs WHERE id = ?;", g, kOwner);
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw StoreError(std::string(kOwner) + ": delete failed for " + id + ": " +
                         sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

} // namespace curbench
