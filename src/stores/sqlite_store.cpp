#include "sqlite_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <cstdint>
#include <map>

namespace slidesearch {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();
    void commit();

private:
    sqlite3* db_;
    bool done_ = false;
};

static std::string db_error(sqlite3* db) {
    return db ? sqlite3_errmsg(db) : "unknown error";
}

static void exec_sql(sqlite3* db, const char* sql, const std::string& context) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : db_error(db);
        sqlite3_free(err);
        throw CorpusIoError(context + ": " + msg);
    }
}

static void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw CorpusIoError(std::string("sqlite prepare failed: ") + db_error(db));
    }
}

static void step_done(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw CorpusIoError(std::string("sqlite write failed: ") + db_error(db));
    }
}

Transaction::Transaction(sqlite3* db) : db_(db) {
    exec_sql(db_, "BEGIN IMMEDIATE;", "begin transaction");
}

Transaction::~Transaction() {
    if (!done_) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit() {
    exec_sql(db_, "COMMIT;", "commit transaction");
    done_ = true;
}

static sqlite3* open_database(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw CorpusIoError("cannot create " + parent.string() + ": " + ec.message());
        }
    }

    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string err = db_error(db);
        if (db) sqlite3_close(db);
        throw CorpusIoError("failed to open database " + path + ": " + err);
    }
    sqlite3_busy_timeout(db, 5000);
    return db;
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

// Columns 0-2: presentation_id, slide_index, summary_text
static SlideRecord record_from_stmt(sqlite3_stmt* stmt) {
    if (sqlite3_column_type(stmt, 0) == SQLITE_NULL ||
        sqlite3_column_type(stmt, 1) != SQLITE_INTEGER ||
        sqlite3_column_type(stmt, 2) == SQLITE_NULL) {
        throw MalformedRecordError("stored slide row is missing a field");
    }
    sqlite3_int64 index = sqlite3_column_int64(stmt, 1);
    if (index < 0 || index > static_cast<sqlite3_int64>(UINT32_MAX)) {
        throw MalformedRecordError("stored slide_index " + std::to_string(index) +
                                   " is out of range");
    }

    SlideRecord record;
    record.presentation_id = column_text(stmt, 0);
    record.slide_index = static_cast<uint32_t>(index);
    record.summary_text = column_text(stmt, 2);
    return record;
}

static void bind_record(sqlite3_stmt* stmt, sqlite3_int64 position, const SlideRecord& r) {
    sqlite3_bind_int64(stmt, 1, position);
    sqlite3_bind_text(stmt, 2, r.presentation_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(r.slide_index));
    sqlite3_bind_text(stmt, 4, r.summary_text.c_str(), -1, SQLITE_TRANSIENT);
}

// ── SqliteCorpusStore ─────────────────────────────────────────

SqliteCorpusStore::SqliteCorpusStore(const std::string& path) : path_(path) {
    db_ = open_database(path_);
    try {
        exec_sql(db_,
                 "CREATE TABLE IF NOT EXISTS slides ("
                 "  position        INTEGER PRIMARY KEY,"
                 "  presentation_id TEXT NOT NULL,"
                 "  slide_index     INTEGER NOT NULL,"
                 "  summary_text    TEXT NOT NULL"
                 ");",
                 "create slides table");
    } catch (const CorpusIoError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteCorpusStore::~SqliteCorpusStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Corpus SqliteCorpusStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_, "SELECT presentation_id, slide_index, summary_text "
                 "FROM slides ORDER BY position;", g);

    std::vector<SlideRecord> records;
    int rc = sqlite3_step(g.stmt);
    while (rc == SQLITE_ROW) {
        records.push_back(record_from_stmt(g.stmt));
        rc = sqlite3_step(g.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw CorpusIoError("reading " + path_ + " failed: " + db_error(db_));
    }

    Corpus corpus(std::move(records));
    std::cerr << "[store] Loaded " << corpus.size() << " slides from " << path_ << "\n";
    return corpus;
}

void SqliteCorpusStore::save(const Corpus& corpus) {
    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(db_);
    exec_sql(db_, "DELETE FROM slides;", "clear slides");

    StmtGuard g;
    prepare(db_, "INSERT INTO slides (position, presentation_id, slide_index, summary_text) "
                 "VALUES (?, ?, ?, ?);", g);
    for (size_t i = 0; i < corpus.size(); ++i) {
        bind_record(g.stmt, static_cast<sqlite3_int64>(i), corpus[i]);
        step_done(db_, g);
        sqlite3_reset(g.stmt);
    }
    tx.commit();
}

// ── IndexSnapshotStore ────────────────────────────────────────

IndexSnapshotStore::IndexSnapshotStore(const std::string& path) : path_(path) {
    db_ = open_database(path_);
    try {
        exec_sql(db_,
                 "CREATE TABLE IF NOT EXISTS index_meta ("
                 "  key   TEXT PRIMARY KEY,"
                 "  value TEXT NOT NULL"
                 ");",
                 "create index_meta table");
        exec_sql(db_,
                 "CREATE TABLE IF NOT EXISTS index_slides ("
                 "  position        INTEGER PRIMARY KEY,"
                 "  presentation_id TEXT NOT NULL,"
                 "  slide_index     INTEGER NOT NULL,"
                 "  summary_text    TEXT NOT NULL,"
                 "  embedding       BLOB NOT NULL"
                 ");",
                 "create index_slides table");
    } catch (const CorpusIoError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

IndexSnapshotStore::~IndexSnapshotStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void IndexSnapshotStore::save(const IndexSnapshot& snapshot,
                              const std::string& corpus_source) {
    if (snapshot.corpus.size() != snapshot.index.size()) {
        throw IndexBuildError("snapshot holds " + std::to_string(snapshot.corpus.size()) +
                              " slides but " + std::to_string(snapshot.index.size()) +
                              " vectors");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Transaction tx(db_);
    exec_sql(db_, "DELETE FROM index_slides;", "clear index_slides");
    exec_sql(db_, "DELETE FROM index_meta;", "clear index_meta");

    {
        StmtGuard g;
        prepare(db_, "INSERT INTO index_meta (key, value) VALUES (?, ?);", g);
        const std::pair<std::string, std::string> meta[] = {
            {"embedder_id", snapshot.embedder_id},
            {"dimensions", std::to_string(snapshot.index.dimensions())},
            {"count", std::to_string(snapshot.index.size())},
            {"corpus_fingerprint", corpus_fingerprint(snapshot.corpus)},
            {"corpus_source", corpus_source},
            {"saved_at", timestamp_now()},
        };
        for (const auto& [key, value] : meta) {
            sqlite3_bind_text(g.stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
            step_done(db_, g);
            sqlite3_reset(g.stmt);
        }
    }

    StmtGuard g;
    prepare(db_, "INSERT INTO index_slides "
                 "(position, presentation_id, slide_index, summary_text, embedding) "
                 "VALUES (?, ?, ?, ?, ?);", g);
    for (size_t i = 0; i < snapshot.corpus.size(); ++i) {
        bind_record(g.stmt, static_cast<sqlite3_int64>(i), snapshot.corpus[i]);
        std::string blob = serialize_vector(snapshot.index.vector(i));
        sqlite3_bind_blob(g.stmt, 5, blob.data(), static_cast<int>(blob.size()),
                          SQLITE_TRANSIENT);
        step_done(db_, g);
        sqlite3_reset(g.stmt);
    }
    tx.commit();

    std::cerr << "[store] Saved index of " << snapshot.corpus.size() << " slides to "
              << path_ << "\n";
}

static uint64_t parse_meta_number(const std::map<std::string, std::string>& meta,
                                  const std::string& key) {
    auto it = meta.find(key);
    if (it == meta.end()) {
        throw IndexBuildError("stored index is missing '" + key + "'");
    }
    try {
        size_t used = 0;
        unsigned long long value = std::stoull(it->second, &used);
        if (used != it->second.size()) throw std::invalid_argument(it->second);
        return value;
    } catch (const std::exception&) {
        throw IndexBuildError("stored index has a malformed '" + key + "': " + it->second);
    }
}

std::shared_ptr<const IndexSnapshot> IndexSnapshotStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, std::string> meta;
    {
        StmtGuard g;
        prepare(db_, "SELECT key, value FROM index_meta;", g);
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            meta[column_text(g.stmt, 0)] = column_text(g.stmt, 1);
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw CorpusIoError("reading " + path_ + " failed: " + db_error(db_));
        }
    }
    if (meta.find("embedder_id") == meta.end()) {
        return nullptr;
    }

    const uint64_t expected_count = parse_meta_number(meta, "count");
    const uint64_t dims = parse_meta_number(meta, "dimensions");

    std::vector<SlideRecord> records;
    std::vector<Embedding> vectors;
    {
        StmtGuard g;
        prepare(db_, "SELECT presentation_id, slide_index, summary_text, embedding "
                     "FROM index_slides ORDER BY position;", g);
        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            SlideRecord record;
            try {
                record = record_from_stmt(g.stmt);
            } catch (const MalformedRecordError& e) {
                throw IndexBuildError(std::string("stored index is corrupt: ") + e.what());
            }

            const void* blob = sqlite3_column_blob(g.stmt, 3);
            int len = sqlite3_column_bytes(g.stmt, 3);
            Embedding vec;
            if (blob && len > 0) {
                vec = deserialize_vector(std::string(static_cast<const char*>(blob),
                                                     static_cast<size_t>(len)));
            }
            if (vec.size() != dims) {
                throw IndexBuildError("stored embedding for " + record_label(record) +
                                      " has " + std::to_string(vec.size()) +
                                      " dimensions, expected " + std::to_string(dims));
            }
            records.push_back(std::move(record));
            vectors.push_back(std::move(vec));
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw CorpusIoError("reading " + path_ + " failed: " + db_error(db_));
        }
    }

    if (records.size() != expected_count) {
        throw IndexBuildError("stored index lists " + std::to_string(expected_count) +
                              " slides but holds " + std::to_string(records.size()));
    }

    std::shared_ptr<const IndexSnapshot> snapshot;
    try {
        snapshot = make_snapshot(Corpus(std::move(records)), vectors, meta["embedder_id"]);
    } catch (const IndexBuildError&) {
        throw;
    } catch (const SearchError& e) {
        throw IndexBuildError(std::string("stored index is corrupt: ") + e.what());
    }

    auto fp = meta.find("corpus_fingerprint");
    if (fp != meta.end() && fp->second != corpus_fingerprint(snapshot->corpus)) {
        throw IndexBuildError("stored index rows do not match its fingerprint " + fp->second);
    }

    std::cerr << "[store] Loaded index of " << snapshot->corpus.size() << " slides ("
              << snapshot->embedder_id << ") from " << path_;
    auto source = meta.find("corpus_source");
    if (source != meta.end() && !source->second.empty()) {
        std::cerr << ", built from " << source->second;
    }
    std::cerr << "\n";
    return snapshot;
}

} // namespace slidesearch
