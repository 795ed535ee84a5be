#include "sqlite_corpus.hpp"
#include "sqlite_common.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace curbench {

static constexpr const char* kOwner = "corpus";

static constexpr const char* kSelectColumns =
    "SELECT id, content, vector, domain, credibility, publication_date, tags,"
    " is_foundational, title, source_url, source_type, chunk_index, total_chunks"
    " FROM entries";

// Same columns as kSelectColumns, joined with the FTS index; column 13 is the score.
static constexpr const char* kKeywordColumns =
    "SELECT e.id, e.content, e.vector, e.domain, e.credibility, e.publication_date, e.tags,"
    " e.is_foundational, e.title, e.source_url, e.source_type, e.chunk_index, e.total_chunks,"
    " -bm25(entries_fts) AS score"
    " FROM entries_fts JOIN entries AS e ON entries_fts.rowid = e.rowid"
    " WHERE entries_fts MATCH ?";

// Metadata filter as SQL clauses on columns qualified by `prefix`.
static std::vector<std::string> filter_clauses(const EntryFilter& filter, const std::string& prefix) {
    std::vector<std::string> clauses;
    if (!filter.domains.empty()) {
        std::string in = prefix + "domain IN (";
        for (size_t i = 0; i < filter.domains.size(); ++i) {
            in += (i == 0) ? "?" : ", ?";
        }
        clauses.push_back(in + ")");
    }
    if (filter.min_credibility) {
        clauses.push_back(prefix + "credibility >= ?");
    }
    return clauses;
}

// Bind the values of filter_clauses() starting at `col`. Returns the next free column.
static int bind_filter(sqlite3_stmt* stmt, const EntryFilter& filter, int col) {
    for (const auto& d : filter.domains) {
        sqlite3_bind_text(stmt, col++, d.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (filter.min_credibility) {
        sqlite3_bind_int(stmt, col++, *filter.min_credibility);
    }
    return col;
}

SqliteCorpus::SqliteCorpus(const std::string& path) : path_(path) {
    db_ = open_database(path_, kOwner);
    try {
        init_schema();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCorpus::~SqliteCorpus() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteCorpus::init_schema() {
    exec_or_throw(db_,
        "CREATE TABLE IF NOT EXISTS entries ("
        "  id               TEXT PRIMARY KEY,"
        "  content          TEXT NOT NULL,"
        "  vector           BLOB,"
        "  domain           TEXT NOT NULL,"
        "  credibility      INTEGER NOT NULL,"
        "  publication_date INTEGER,"
        "  tags             TEXT NOT NULL DEFAULT '[]',"
        "  is_foundational  INTEGER NOT NULL DEFAULT 0,"
        "  title            TEXT NOT NULL DEFAULT '',"
        "  source_url       TEXT NOT NULL DEFAULT '',"
        "  source_type      TEXT NOT NULL DEFAULT 'manual',"
        "  chunk_index      INTEGER NOT NULL DEFAULT 0,"
        "  total_chunks     INTEGER NOT NULL DEFAULT 1"
        ");", kOwner);
    exec_or_throw(db_,
        "CREATE INDEX IF NOT EXISTS entries_domain ON entries(domain);", kOwner);

    bool had_fts = table_exists("entries_fts");

    // FTS5 index over title and content, kept in sync by triggers
    exec_or_throw(db_,
        "CREATE VIRTUAL TABLE IF NOT EXISTS entries_fts "
        "USING fts5(title, content, content=entries, content_rowid=rowid);", kOwner);
    exec_or_throw(db_,
        "CREATE TRIGGER IF NOT EXISTS entries_ai AFTER INSERT ON entries BEGIN"
        "  INSERT INTO entries_fts(rowid, title, content)"
        "  VALUES (new.rowid, new.title, new.content);"
        "END;", kOwner);
    exec_or_throw(db_,
        "CREATE TRIGGER IF NOT EXISTS entries_ad AFTER DELETE ON entries BEGIN"
        "  INSERT INTO entries_fts(entries_fts, rowid, title, content)"
        "  VALUES ('delete', old.rowid, old.title, old.content);"
        "END;", kOwner);
    exec_or_throw(db_,
        "CREATE TRIGGER IF NOT EXISTS entries_au AFTER UPDATE ON entries BEGIN"
        "  INSERT INTO entries_fts(entries_fts, rowid, title, content)"
        "  VALUES ('delete', old.rowid, old.title, old.content);"
        "  INSERT INTO entries_fts(rowid, title, content)"
        "  VALUES (new.rowid, new.title, new.content);"
        "END;", kOwner);

    // Databases created before the index existed need it populated once.
    if (!had_fts) {
        exec_or_throw(db_, "INSERT INTO entries_fts(entries_fts) VALUES('rebuild');", kOwner);
    }
}

bool SqliteCorpus::table_exists(const char* name) {
    StmtGuard g;
    prepare_or_throw(db_, "SELECT 1 FROM sqlite_master WHERE name = ?;", g, kOwner);
    sqlite3_bind_text(g.stmt, 1, name, -1, SQLITE_TRANSIENT);
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

// Read a full entry from a statement selecting kSelectColumns.
static EmbeddedEntry entry_from_stmt(sqlite3_stmt* stmt) {
    EmbeddedEntry entry;
    entry.id      = column_string(stmt, 0);
    entry.content = column_string(stmt, 1);

    const void* blob = sqlite3_column_blob(stmt, 2);
    int bytes = sqlite3_column_bytes(stmt, 2);
    if (blob && bytes > 0) {
        entry.vector = deserialize_vector(
            std::string(static_cast<const char*>(blob), static_cast<size_t>(bytes)));
    }

    entry.domain = column_string(stmt, 3);
    entry.credibility_score = sqlite3_column_int(stmt, 4);
    if (sqlite3_column_type(stmt, 5) != SQLITE_NULL) {
        entry.publication_date = sqlite3_column_int64(stmt, 5);
    }

    std::string tags = column_string(stmt, 6);
    if (!tags.empty()) {
        try {
            auto j = nlohmann::json::parse(tags);
            for (const auto& t : j) {
                if (t.is_string()) entry.tags.push_back(t.get<std::string>());
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[corpus] Unreadable tags on entry " << entry.id << ": " << e.what() << "\n";
        }
    }

    entry.is_foundational = sqlite3_column_int(stmt, 7) != 0;
    entry.title        = column_string(stmt, 8);
    entry.source_url   = column_string(stmt, 9);
    entry.source_type  = column_string(stmt, 10);
    entry.chunk_index  = static_cast<uint32_t>(sqlite3_column_int(stmt, 11));
    entry.total_chunks = static_cast<uint32_t>(sqlite3_column_int(stmt, 12));
    return entry;
}

static std::vector<EmbeddedEntry> collect_rows(sqlite3* db, StmtGuard& g) {
    std::vector<EmbeddedEntry> results;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        results.push_back(entry_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string(kOwner) + ": query failed: " + sqlite3_errmsg(db));
    }
    return results;
}

std::vector<EmbeddedEntry> SqliteCorpus::query(const EntryFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = kSelectColumns;
    auto clauses = filter_clauses(filter, "");
    for (size_t i = 0; i < clauses.size(); ++i) {
        sql += (i == 0) ? " WHERE " : " AND ";
        sql += clauses[i];
    }
    sql += " ORDER BY id;";

    StmtGuard g;
    prepare_or_throw(db_, sql.c_str(), g, kOwner);
    bind_filter(g.stmt, filter, 1);
    return collect_rows(db_, g);
}

std::vector<KeywordHit> SqliteCorpus::keyword_query(const std::string& text,
                                                    const EntryFilter& filter,
                                                    uint32_t limit) {
    // OR-join the terms so any matching keyword produces a hit
    // (FTS5 defaults to implicit AND).
    std::string match;
    for (const auto& term : keyword_terms(text)) {
        if (!match.empty()) match += " OR ";
        match += term;
    }
    if (match.empty()) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = kKeywordColumns;
    for (const auto& clause : filter_clauses(filter, "e.")) {
        sql += " AND " + clause;
    }
    sql += " ORDER BY bm25(entries_fts), e.id LIMIT ?;";

    StmtGuard g;
    prepare_or_throw(db_, sql.c_str(), g, kOwner);
    sqlite3_bind_text(g.stmt, 1, match.c_str(), -1, SQLITE_TRANSIENT);
    int col = bind_filter(g.stmt, filter, 2);
    sqlite3_bind_int64(g.stmt, col, static_cast<sqlite3_int64>(limit));

    std::vector<KeywordHit> hits;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        hits.push_back({entry_from_stmt(g.stmt), sqlite3_column_double(g.stmt, 13)});
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw StoreError(std::string(kOwner) + ": keyword query failed: " + sqlite3_errmsg(db_));
    }
    normalize_keyword_hits(hits, limit);
    return hits;
}

std::optional<EmbeddedEntry> SqliteCorpus::get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string(kSelectColumns) + " WHERE id = ?;";
    StmtGuard g;
    prepare_or_throw(db_, sql.c_str(), g, kOwner);
    sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

    auto rows = collect_rows(db_, g);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<std::string> SqliteCorpus::insert(const std::vector<EmbeddedEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Replacing is delete + insert so the FTS delete trigger fires.
    const char* delete_sql = "DELETE FROM entries WHERE id = ?;";
    const char* sql =
        "INSERT INTO entries (id, content, vector, domain, credibility,"
        " publication_date, tags, is_foundational, title, source_url, source_type,"
        " chunk_index, total_chunks)"
        " VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";

    std::vector<std::string> ids;
    ids.reserve(entries.size());

    Transaction tx(db_, kOwner);
    for (const auto& e : entries) {
        std::string id = e.id.empty() ? generate_id() : e.id;
        std::string blob = serialize_vector(e.vector);
        std::string tags = nlohmann::json(e.tags).dump();

        {
            StmtGuard d;
            prepare_or_throw(db_, delete_sql, d, kOwner);
            sqlite3_bind_text(d.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
            if (sqlite3_step(d.stmt) != SQLITE_DONE) {
                throw StoreError(std::string(kOwner) + ": replace failed for " + id + ": " +
                                 sqlite3_errmsg(db_));
            }
        }

        StmtGuard g;
        prepare_or_throw(db_, sql, g, kOwner);
        sqlite3_bind_text(g.stmt, 1, id.c_str(),        -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, e.content.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_blob(g.stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 4, e.domain.c_str(),  -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(g.stmt, 5, e.credibility_score);
        if (e.publication_date) {
            sqlite3_bind_int64(g.stmt, 6, *e.publication_date);
        } else {
            sqlite3_bind_null(g.stmt, 6);
        }
        sqlite3_bind_text(g.stmt, 7, tags.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(g.stmt, 8, e.is_foundational ? 1 : 0);
        sqlite3_bind_text(g.stmt, 9, e.title.c_str(),        -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 10, e.source_url.c_str(),  -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 11, e.source_type.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int(g.stmt, 12, static_cast<int>(e.chunk_index));
        sqlite3_bind_int(g.stmt, 13, static_cast<int>(e.total_chunks));

        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw StoreError(std::string(kOwner) + ": insert failed for " + id + ": " +
                             sqlite3_errmsg(db_));
        }
        ids.push_back(std::move(id));
    }
    tx.commit();
    return ids;
}

uint32_t SqliteCorpus::delete_ids_locked(const std::vector<std::string>& ids) {
    uint32_t removed = 0;
    Transaction tx(db_, kOwner);
    for (const auto& id : ids) {
        StmtGuard g;
        prepare_or_throw(db_, "DELETE FROM entries WHERE id = ?;", g, kOwner);
        sqlite3_bind_text(g.stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            throw StoreError(std::string(kOwner) + ": delete failed for " + id + ": " +
                             sqlite3_errmsg(db_));
        }
        removed += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    tx.commit();
    return removed;
}

uint32_t SqliteCorpus::delete_by_ids(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);
    return delete_ids_locked(ids);
}

uint32_t SqliteCorpus::delete_where(const std::function<bool(const EmbeddedEntry&)>& predicate) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string(kSelectColumns) + ";";
    StmtGuard g;
    prepare_or_throw(db_, sql.c_str(), g, kOwner);

    std::vector<std::string> doomed;
    for (const auto& entry : collect_rows(db_, g)) {
        if (predicate(entry)) doomed.push_back(entry.id);
    }
    if (doomed.empty()) return 0;
    return delete_ids_locked(doomed);
}

uint32_t SqliteCorpus::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_, "SELECT COUNT(*) FROM entries;", g, kOwner);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) {
        throw StoreError(std::string(kOwner) + ": count failed: " + sqlite3_errmsg(db_));
    }
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

CorpusStats SqliteCorpus::stats() {
    std::lock_guard<std::mutex> lock(mutex_);

    CorpusStats stats;
    {
        StmtGuard g;
        prepare_or_throw(db_, "SELECT COUNT(*), AVG(credibility) FROM entries;", g, kOwner);
        if (sqlite3_step(g.stmt) != SQLITE_ROW) {
            throw StoreError(std::string(kOwner) + ": stats failed: " + sqlite3_errmsg(db_));
        }
        stats.total_documents = static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
        if (stats.total_documents > 0) {
            stats.average_credibility = round_half_up(sqlite3_column_double(g.stmt, 1));
        }
    }
    {
        StmtGuard g;
        prepare_or_throw(db_, "SELECT domain, COUNT(*) FROM entries GROUP BY domain;", g, kOwner);
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            stats.domain_distribution[column_string(g.stmt, 0)] =
                static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 1));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw StoreError(std::string(kOwner) + ": stats failed: " + sqlite3_errmsg(db_));
        }
    }
    return stats;
}

} // namespace curbench
