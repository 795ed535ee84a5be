#include <catch2/catch.hpp>
#include "store/sqlite_corpus.hpp"
#include "errors.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <filesystem>
#include <unistd.h>

using namespace curbench;

static std::string sqlite_test_path() {
    return "/tmp/curbench_test_corpus_" + std::to_string(getpid()) + ".db";
}

static void remove_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

struct SqliteFixture {
    std::string path = sqlite_test_path();
    SqliteCorpus corpus{path};

    ~SqliteFixture() { remove_db(path); }
};

static EmbeddedEntry make_entry(const std::string& id, const std::string& domain, int credibility) {
    EmbeddedEntry e;
    e.id = id;
    e.content = "content of " + id;
    e.vector = {0.25f, -0.5f, 1.0f};
    e.domain = domain;
    e.credibility_score = credibility;
    return e;
}

// ── Insert and get ───────────────────────────────────────────

TEST_CASE("SqliteCorpus: insert and get round-trips every field", "[sqlite_corpus]") {
    SqliteFixture f;

    EmbeddedEntry e = make_entry("doc-1", "ml", 85);
    e.publication_date = 1704067200;
    e.tags = {"optimisation", "calculus"};
    e.is_foundational = true;
    e.title = "Optimisation notes";
    e.source_url = "https://example.org/opt.pdf";
    e.source_type = "pdf";
    e.chunk_index = 2;
    e.total_chunks = 5;
    f.corpus.insert({e});

    auto got = f.corpus.get("doc-1");
    REQUIRE(got.has_value());
    auto g = got.value_or(EmbeddedEntry{});
    REQUIRE(g.content == e.content);
    REQUIRE(g.vector == e.vector);
    REQUIRE(g.domain == "ml");
    REQUIRE(g.credibility_score == 85);
    REQUIRE(g.publication_date.value_or(0) == 1704067200);
    REQUIRE(g.tags == e.tags);
    REQUIRE(g.is_foundational);
    REQUIRE(g.title == e.title);
    REQUIRE(g.source_url == e.source_url);
    REQUIRE(g.source_type == "pdf");
    REQUIRE(g.chunk_index == 2);
    REQUIRE(g.total_chunks == 5);
}

TEST_CASE("SqliteCorpus: absent date stays absent", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("a", "ml", 50)});
    auto got = f.corpus.get("a");
    REQUIRE(got.has_value());
    REQUIRE_FALSE(got.value_or(EmbeddedEntry{}).publication_date.has_value());
}

TEST_CASE("SqliteCorpus: get missing returns nullopt", "[sqlite_corpus]") {
    SqliteFixture f;
    REQUIRE_FALSE(f.corpus.get("nope").has_value());
}

TEST_CASE("SqliteCorpus: generated ids and replace", "[sqlite_corpus]") {
    SqliteFixture f;
    auto ids = f.corpus.insert({make_entry("", "ml", 50)});
    REQUIRE(ids.size() == 1);
    REQUIRE_FALSE(ids[0].empty());

    auto e = make_entry(ids[0], "ml", 77);
    f.corpus.insert({e});
    REQUIRE(f.corpus.count() == 1);
    REQUIRE(f.corpus.get(ids[0]).value_or(EmbeddedEntry{}).credibility_score == 77);
}

// ── Query filters ────────────────────────────────────────────

TEST_CASE("SqliteCorpus: query ordered by id with filters", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("c", "ml", 90), make_entry("a", "ml", 40),
                     make_entry("b", "security", 70), make_entry("d", "databases", 95)});

    auto all = f.corpus.query({});
    REQUIRE(all.size() == 4);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[3].id == "d");

    EntryFilter by_domain;
    by_domain.domains = {"ml", "security"};
    auto rows = f.corpus.query(by_domain);
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].id == "a");
    REQUIRE(rows[1].id == "b");
    REQUIRE(rows[2].id == "c");

    EntryFilter combined;
    combined.domains = {"ml"};
    combined.min_credibility = 50;
    auto strict = f.corpus.query(combined);
    REQUIRE(strict.size() == 1);
    REQUIRE(strict[0].id == "c");
}

// ── Deletion ─────────────────────────────────────────────────

TEST_CASE("SqliteCorpus: delete_by_ids and delete_where", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("a", "ml", 20), make_entry("b", "ml", 80),
                     make_entry("c", "security", 10), make_entry("d", "security", 60)});

    REQUIRE(f.corpus.delete_by_ids({"a", "zzz"}) == 1);
    REQUIRE(f.corpus.count() == 3);

    auto removed = f.corpus.delete_where([](const EmbeddedEntry& e) {
        return e.domain == "security";
    });
    REQUIRE(removed == 2);
    REQUIRE(f.corpus.count() == 1);
    REQUIRE(f.corpus.get("b").has_value());
}

TEST_CASE("SqliteCorpus: delete_where matching nothing", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("a", "ml", 20)});
    REQUIRE(f.corpus.delete_where([](const EmbeddedEntry&) { return false; }) == 0);
    REQUIRE(f.corpus.count() == 1);
}

// ── Stats ────────────────────────────────────────────────────

TEST_CASE("SqliteCorpus: stats", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("a", "ml", 80), make_entry("b", "ml", 81),
                     make_entry("c", "security", 90)});
    auto stats = f.corpus.stats();
    REQUIRE(stats.total_documents == 3);
    REQUIRE(stats.average_credibility == 84);
    REQUIRE(stats.domain_distribution.at("ml") == 2);
    REQUIRE(stats.domain_distribution.at("security") == 1);
}

// ── Keyword recall ───────────────────────────────────────────

static std::vector<std::string> hit_ids(const std::vector<KeywordHit>& hits) {
    std::vector<std::string> ids;
    for (const auto& h : hits) ids.push_back(h.entry.id);
    return ids;
}

TEST_CASE("SqliteCorpus: keyword_query matches title or content", "[sqlite_corpus]") {
    SqliteFixture f;
    auto body = make_entry("body", "ml", 50);
    body.content = "neural networks learn representations with neural layers";
    auto titled = make_entry("titled", "ml", 50);
    titled.title = "Neural networks";
    titled.content = "an introduction";
    auto other = make_entry("other", "ml", 50);
    other.content = "gradient descent";
    f.corpus.insert({body, titled, other});

    auto hits = f.corpus.keyword_query("Neural networks?", EntryFilter{}, 10);
    REQUIRE(hits.size() == 2);
    auto ids = hit_ids(hits);
    std::sort(ids.begin(), ids.end());
    REQUIRE(ids == std::vector<std::string>{"body", "titled"});

    REQUIRE(hits[0].score == 1.0);
    REQUIRE(hits[1].score > 0.0);
    REQUIRE(hits[1].score <= 1.0);
    REQUIRE(hits[0].entry.vector == body.vector);
}

TEST_CASE("SqliteCorpus: keyword_query applies filters and limit", "[sqlite_corpus]") {
    SqliteFixture f;
    auto a = make_entry("a", "ml", 90);
    a.content = "curriculum design";
    auto b = make_entry("b", "security", 90);
    b.content = "curriculum review";
    auto c = make_entry("c", "ml", 20);
    c.content = "curriculum mapping";
    f.corpus.insert({a, b, c});

    EntryFilter filter;
    filter.domains = {"ml"};
    filter.min_credibility = 50;
    REQUIRE(hit_ids(f.corpus.keyword_query("curriculum", filter, 10)) ==
            std::vector<std::string>{"a"});

    REQUIRE(f.corpus.keyword_query("curriculum", EntryFilter{}, 2).size() == 2);
}

TEST_CASE("SqliteCorpus: keyword index follows replace and delete", "[sqlite_corpus]") {
    SqliteFixture f;
    auto e = make_entry("doc", "ml", 50);
    e.content = "alpha";
    f.corpus.insert({e});
    REQUIRE(f.corpus.keyword_query("alpha", EntryFilter{}, 10).size() == 1);

    e.content = "bravo";
    f.corpus.insert({e});
    REQUIRE(f.corpus.keyword_query("alpha", EntryFilter{}, 10).empty());
    REQUIRE(f.corpus.keyword_query("bravo", EntryFilter{}, 10).size() == 1);

    f.corpus.delete_by_ids({"doc"});
    REQUIRE(f.corpus.keyword_query("bravo", EntryFilter{}, 10).empty());
}

TEST_CASE("SqliteCorpus: keyword_query without usable terms", "[sqlite_corpus]") {
    SqliteFixture f;
    f.corpus.insert({make_entry("a", "ml", 50)});
    REQUIRE(f.corpus.keyword_query("a ? !", EntryFilter{}, 10).empty());
}

TEST_CASE("SqliteCorpus: keyword index is built for existing rows", "[sqlite_corpus]") {
    std::string path = sqlite_test_path() + "_legacy";
    {
        sqlite3* db = nullptr;
        REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
        const char* sql =
            "CREATE TABLE entries ("
            "  id TEXT PRIMARY KEY, content TEXT NOT NULL, vector BLOB,"
            "  domain TEXT NOT NULL, credibility INTEGER NOT NULL, publication_date INTEGER,"
            "  tags TEXT NOT NULL DEFAULT '[]', is_foundational INTEGER NOT NULL DEFAULT 0,"
            "  title TEXT NOT NULL DEFAULT '', source_url TEXT NOT NULL DEFAULT '',"
            "  source_type TEXT NOT NULL DEFAULT 'manual',"
            "  chunk_index INTEGER NOT NULL DEFAULT 0, total_chunks INTEGER NOT NULL DEFAULT 1);"
            "INSERT INTO entries (id, content, domain, credibility)"
            "  VALUES ('old', 'assessment rubrics', 'education', 70);";
        REQUIRE(sqlite3_exec(db, sql, nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(db);
    }
    {
        SqliteCorpus corpus(path);
        REQUIRE(hit_ids(corpus.keyword_query("rubrics", EntryFilter{}, 10)) ==
                std::vector<std::string>{"old"});
    }
    remove_db(path);
}

// ── Persistence and failure ──────────────────────────────────

TEST_CASE("SqliteCorpus: persists across instances", "[sqlite_corpus]") {
    std::string path = sqlite_test_path() + "_persist";
    {
        SqliteCorpus corpus(path);
        corpus.insert({make_entry("kept", "ml", 50)});
    }
    {
        SqliteCorpus corpus(path);
        REQUIRE(corpus.count() == 1);
        REQUIRE(corpus.get("kept").has_value());
    }
    remove_db(path);
}

TEST_CASE("SqliteCorpus: unopenable path throws StoreError", "[sqlite_corpus]") {
    REQUIRE_THROWS_AS(SqliteCorpus("/dev/null/corpus.db"), StoreError);
}
