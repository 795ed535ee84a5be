#pragma once
#include <sqlite3.h>
#include <string>

namespace curbench {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Open (creating parent directories) and apply the shared pragmas.
// Throws StoreError on failure.
sqlite3* open_database(const std::string& path, const char* owner);

// Run a statement with no result rows. Throws StoreError on failure.
void exec_or_throw(sqlite3* db, const char* sql, const char* owner);

// Prepare into the guard. Throws StoreError on failure.
void prepare_or_throw(sqlite3* db, const char* sql, StmtGuard& g, const char* owner);

// Column text as std::string ("" for NULL).
std::string column_string(sqlite3_stmt* stmt, int col);

// BEGIN ... COMMIT scope; rolls back when destroyed without commit().
class Transaction {
public:
    Transaction(sqlite3* db, const char* owner);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* db_;
    const char* owner_;
    bool done_ = false;
};

} // namespace curbench
