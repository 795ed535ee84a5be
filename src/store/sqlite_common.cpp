#include "sqlite_common.hpp"
#include "../errors.hpp"
#include <filesystem>
#include <iostream>

namespace curbench {

sqlite3* open_database(const std::string& path, const char* owner) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "unknown error";
        if (db) sqlite3_close(db);
        throw StoreError(std::string(owner) + ": failed to open database " + path + ": " + err);
    }

    sqlite3_exec(db, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    return db;
}

void exec_or_throw(sqlite3* db, const char* sql, const char* owner) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw StoreError(std::string(owner) + ": " + msg);
    }
}

void prepare_or_throw(sqlite3* db, const char* sql, StmtGuard& g, const char* owner) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw StoreError(std::string(owner) + ": prepare failed: " + sqlite3_errmsg(db));
    }
}

std::string column_string(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

Transaction::Transaction(sqlite3* db, const char* owner) : db_(db), owner_(owner) {
    exec_or_throw(db_, "BEGIN;", owner_);
}

Transaction::~Transaction() {
    if (!done_) {
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            std::cerr << "[" << owner_ << "] Rollback failed: " << sqlite3_errmsg(db_) << "\n";
        }
    }
}

void Transaction::commit() {
    exec_or_throw(db_, "COMMIT;", owner_);
    done_ = true;
}

} // namespace curbench
