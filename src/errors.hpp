#pragma once
#include <stdexcept>
#include <string>

namespace slidesearch {

// Base of every failure raised by the search engine. Catch this to
// distinguish engine errors from programming errors (std::invalid_argument).
class SearchError : public std::runtime_error {
public:
    explicit SearchError(const std::string& what) : std::runtime_error(what) {}
};

// A summary record is missing a field or has an empty summary.
class MalformedRecordError : public SearchError {
public:
    explicit MalformedRecordError(const std::string& what) : SearchError(what) {}
};

// Two records share (presentation_id, slide_index).
class DuplicateKeyError : public SearchError {
public:
    explicit DuplicateKeyError(const std::string& what) : SearchError(what) {}
};

class EmptyCorpusError : public SearchError {
public:
    explicit EmptyCorpusError(const std::string& what) : SearchError(what) {}
};

class DimensionMismatchError : public SearchError {
public:
    explicit DimensionMismatchError(const std::string& what) : SearchError(what) {}
};

class EmptyIndexError : public SearchError {
public:
    explicit EmptyIndexError(const std::string& what) : SearchError(what) {}
};

class EmptyQueryError : public SearchError {
public:
    explicit EmptyQueryError(const std::string& what) : SearchError(what) {}
};

// Transient: the embedding model failed or timed out. Callers may retry.
class EmbeddingError : public SearchError {
public:
    explicit EmbeddingError(const std::string& what, bool transient = true)
        : SearchError(what), transient_(transient) {}

    // False for failures a retry cannot fix (e.g. empty input text).
    bool transient() const { return transient_; }

private:
    bool transient_;
};

// Fatal: the index cannot be built or loaded from its source.
class IndexBuildError : public SearchError {
public:
    explicit IndexBuildError(const std::string& what) : SearchError(what) {}
};

// Storage backend could not be read or written.
class CorpusIoError : public SearchError {
public:
    explicit CorpusIoError(const std::string& what) : SearchError(what) {}
};

} // namespace slidesearch
