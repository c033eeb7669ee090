#pragma once
#include "../corpus_store.hpp"
#include "../snapshot.hpp"
#include <memory>
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace slidesearch {

// Slide summaries in a SQLite file, one row per slide in corpus order.
class SqliteCorpusStore : public CorpusStore {
public:
    explicit SqliteCorpusStore(const std::string& path);
    ~SqliteCorpusStore() override;

    // Non-copyable
    SqliteCorpusStore(const SqliteCorpusStore&) = delete;
    SqliteCorpusStore& operator=(const SqliteCorpusStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    Corpus load() override;

    // Replaces every stored slide in one transaction.
    void save(const Corpus& corpus) override;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

// Persists a built index so queries can start without re-embedding the
// corpus. Holds at most one snapshot; save() replaces it.
class IndexSnapshotStore {
public:
    explicit IndexSnapshotStore(const std::string& path);
    ~IndexSnapshotStore();

    IndexSnapshotStore(const IndexSnapshotStore&) = delete;
    IndexSnapshotStore& operator=(const IndexSnapshotStore&) = delete;

    // `corpus_source` names the summaries the snapshot was built from and is
    // stored next to the corpus fingerprint.
    void save(const IndexSnapshot& snapshot, const std::string& corpus_source = "");

    // nullptr when nothing has been saved yet. Throws IndexBuildError when
    // the stored rows do not form a valid snapshot or no longer match the
    // stored fingerprint, CorpusIoError when the file cannot be read.
    std::shared_ptr<const IndexSnapshot> load();

    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

} // namespace slidesearch
