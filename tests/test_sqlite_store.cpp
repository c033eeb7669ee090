#include <catch2/catch.hpp>
#include "stores/sqlite_store.hpp"
#include "embedders/hashing_embedder.hpp"
#include "errors.hpp"
#include "query_engine.hpp"
#include <filesystem>
#include <sqlite3.h>
#include <unistd.h>

using namespace slidesearch;

static std::string sqlite_test_path(const std::string& tag) {
    return "/tmp/slidesearch_test_" + tag + "_" + std::to_string(getpid()) + ".db";
}

static void remove_db(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
    std::filesystem::remove(path + "-journal");
}

static Corpus sample_corpus() {
    return Corpus({
        {"deckA", 0, "Intro to quarterly revenue"},
        {"deckA", 1, "Risk factors overview"},
        {"deckB", 0, "Revenue growth by region"},
    });
}

// Run raw SQL against a store file (for corrupting it in tests)
static void exec_raw(const std::string& path, const std::string& sql) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    sqlite3_close(db);
    REQUIRE(rc == SQLITE_OK);
}

// ── SqliteCorpusStore ────────────────────────────────────────────

struct CorpusStoreFixture {
    std::string path = sqlite_test_path("corpus");

    ~CorpusStoreFixture() { remove_db(path); }
};

TEST_CASE("SqliteCorpusStore: empty database loads an empty corpus", "[sqlite_store]") {
    CorpusStoreFixture f;
    SqliteCorpusStore store(f.path);
    REQUIRE(store.backend_name() == "sqlite");
    REQUIRE(store.load().empty());
}

TEST_CASE("SqliteCorpusStore: save then load keeps order", "[sqlite_store]") {
    CorpusStoreFixture f;
    auto corpus = sample_corpus();
    {
        SqliteCorpusStore store(f.path);
        store.save(corpus);
    }

    SqliteCorpusStore reopened(f.path);
    auto loaded = reopened.load();
    REQUIRE(loaded.size() == 3);
    for (size_t i = 0; i < corpus.size(); ++i) {
        REQUIRE(same_key(loaded[i], corpus[i]));
        REQUIRE(loaded[i].summary_text == corpus[i].summary_text);
    }
}

TEST_CASE("SqliteCorpusStore: save replaces the previous corpus", "[sqlite_store]") {
    CorpusStoreFixture f;
    SqliteCorpusStore store(f.path);
    store.save(sample_corpus());
    store.save(Corpus({{"deckC", 0, "Only slide"}}));

    auto loaded = store.load();
    REQUIRE(loaded.size() == 1);
    REQUIRE(loaded[0].presentation_id == "deckC");
}

TEST_CASE("SqliteCorpusStore: invalid stored rows fail the whole load", "[sqlite_store]") {
    CorpusStoreFixture f;
    {
        SqliteCorpusStore store(f.path);
        store.save(sample_corpus());
    }

    SECTION("duplicate key") {
        exec_raw(f.path, "INSERT INTO slides VALUES (9, 'deckA', 1, 'again');");
        SqliteCorpusStore store(f.path);
        REQUIRE_THROWS_AS(store.load(), DuplicateKeyError);
    }
    SECTION("blank summary") {
        exec_raw(f.path, "UPDATE slides SET summary_text = '  ' WHERE position = 1;");
        SqliteCorpusStore store(f.path);
        REQUIRE_THROWS_AS(store.load(), MalformedRecordError);
    }
    SECTION("negative slide index") {
        exec_raw(f.path, "UPDATE slides SET slide_index = -3 WHERE position = 0;");
        SqliteCorpusStore store(f.path);
        REQUIRE_THROWS_AS(store.load(), MalformedRecordError);
    }
}

TEST_CASE("SqliteCorpusStore: unopenable path is an I/O error", "[sqlite_store]") {
    REQUIRE_THROWS_AS(SqliteCorpusStore("/proc/slidesearch/none.db"), CorpusIoError);
}

// ── IndexSnapshotStore ───────────────────────────────────────────

struct SnapshotStoreFixture {
    std::string path = sqlite_test_path("index");
    HashingEmbedder embedder{64};

    ~SnapshotStoreFixture() { remove_db(path); }
};

TEST_CASE("IndexSnapshotStore: nothing saved loads nullptr", "[sqlite_store]") {
    SnapshotStoreFixture f;
    IndexSnapshotStore store(f.path);
    REQUIRE(store.load() == nullptr);
}

TEST_CASE("IndexSnapshotStore: round trip preserves records and vectors", "[sqlite_store]") {
    SnapshotStoreFixture f;
    auto snapshot = build_snapshot(sample_corpus(), f.embedder);
    {
        IndexSnapshotStore store(f.path);
        store.save(*snapshot);
    }

    IndexSnapshotStore store(f.path);
    auto loaded = store.load();
    REQUIRE(loaded != nullptr);
    REQUIRE(loaded->embedder_id == snapshot->embedder_id);
    REQUIRE(loaded->corpus.size() == snapshot->corpus.size());
    REQUIRE(loaded->index.dimensions() == snapshot->index.dimensions());
    for (size_t i = 0; i < snapshot->corpus.size(); ++i) {
        REQUIRE(same_key(loaded->corpus[i], snapshot->corpus[i]));
        REQUIRE(loaded->index.vector(i) == snapshot->index.vector(i));
    }
}

TEST_CASE("IndexSnapshotStore: loaded snapshot answers like the saved one", "[sqlite_store]") {
    SnapshotStoreFixture f;
    QueryEngine built(f.embedder);
    built.rebuild(sample_corpus());
    {
        IndexSnapshotStore store(f.path);
        store.save(*built.snapshot());
    }

    QueryEngine restored(f.embedder);
    IndexSnapshotStore store(f.path);
    restored.install(store.load());

    for (const char* q : {"revenue trends", "regional revenue growth", "risk"}) {
        auto a = built.query(q, 3);
        auto b = restored.query(q, 3);
        REQUIRE(a.size() == b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            REQUIRE(same_key(a[i].record, b[i].record));
            REQUIRE(a[i].score == b[i].score);
            REQUIRE(a[i].rank == b[i].rank);
        }
    }
}

TEST_CASE("IndexSnapshotStore: index saved from other summaries is not served", "[sqlite_store]") {
    SnapshotStoreFixture f;
    {
        IndexSnapshotStore store(f.path);
        store.save(*build_snapshot(Corpus({{"old.pptx", 0, "Revenue recap"}}), f.embedder),
                   "/data/a.json");
    }

    IndexSnapshotStore store(f.path);
    auto saved = store.load();
    REQUIRE(saved != nullptr);

    QueryEngine engine(f.embedder);
    REQUIRE_FALSE(engine.install_or_rebuild(saved, Corpus({{"new.pptx", 0, "Revenue outlook"}})));
    auto results = engine.query("revenue", 3);
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].record.presentation_id == "new.pptx");
}

TEST_CASE("IndexSnapshotStore: save replaces the previous snapshot", "[sqlite_store]") {
    SnapshotStoreFixture f;
    IndexSnapshotStore store(f.path);
    store.save(*build_snapshot(sample_corpus(), f.embedder));
    store.save(*build_snapshot(Corpus({{"deckC", 0, "Hiring plan"}}), f.embedder));

    auto loaded = store.load();
    REQUIRE(loaded != nullptr);
    REQUIRE(loaded->corpus.size() == 1);
    REQUIRE(loaded->corpus[0].presentation_id == "deckC");
}

TEST_CASE("IndexSnapshotStore: corrupted data is an index build error", "[sqlite_store]") {
    SnapshotStoreFixture f;
    {
        IndexSnapshotStore store(f.path);
        store.save(*build_snapshot(sample_corpus(), f.embedder));
    }

    SECTION("count mismatch") {
        exec_raw(f.path, "DELETE FROM index_slides WHERE position = 2;");
    }
    SECTION("mixed dimensions") {
        exec_raw(f.path, "UPDATE index_slides SET embedding = zeroblob(8) WHERE position = 1;");
    }
    SECTION("truncated blob") {
        exec_raw(f.path, "UPDATE index_slides SET embedding = zeroblob(7) WHERE position = 0;");
    }
    SECTION("duplicate record") {
        exec_raw(f.path, "UPDATE index_slides SET slide_index = 0 WHERE position = 1;");
    }
    SECTION("summary edited behind the fingerprint") {
        exec_raw(f.path, "UPDATE index_slides SET summary_text = 'Tampered' WHERE position = 1;");
    }
    SECTION("malformed count") {
        exec_raw(f.path, "UPDATE index_meta SET value = 'three' WHERE key = 'count';");
    }

    IndexSnapshotStore store(f.path);
    REQUIRE_THROWS_AS(store.load(), IndexBuildError);
}

TEST_CASE("IndexSnapshotStore: failing metadata read is an I/O error", "[sqlite_store]") {
    SnapshotStoreFixture f;
    {
        IndexSnapshotStore store(f.path);
        store.save(*build_snapshot(sample_corpus(), f.embedder));
    }
    // a view whose rows fail to evaluate, so stepping errors instead of finishing
    exec_raw(f.path, "DROP TABLE index_meta;"
                     "CREATE VIEW index_meta AS SELECT 'embedder_id' AS key,"
                     " abs(-9223372036854775807 - 1) AS value;");

    IndexSnapshotStore store(f.path);
    REQUIRE_THROWS_AS(store.load(), CorpusIoError);
}
