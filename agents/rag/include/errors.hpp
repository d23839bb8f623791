#pragma once
#include "types.hpp"
#include <stdexcept>
#include <string>
#include <utility>

// A document could not be searched, fetched, downloaded or text-extracted.
struct SourceUnavailable : std::runtime_error {
    explicit SourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Ingestion finished without a single usable chunk.
struct EmptyCorpus : std::runtime_error {
    EmptyCorpus(const std::string& what, IngestSummary summary)
        : std::runtime_error(what), summary(std::move(summary)) {}
    IngestSummary summary;
};

// A question was asked with no index, or an index holding zero chunks.
struct RetrievalEmpty : std::runtime_error {
    explicit RetrievalEmpty(const std::string& what) : std::runtime_error(what) {}
};

// An HTTP collaborator did not answer within its timeout.
struct ServiceTimeout : std::runtime_error {
    explicit ServiceTimeout(const std::string& what) : std::runtime_error(what) {}
};

// The generative model raised while tokenizing or generating.
class GenerationFailure : public std::runtime_error {
public:
    GenerationFailure(const std::string& what, bool retryable)
        : std::runtime_error(what), retryable_(retryable) {}
    bool retryable() const { return retryable_; }

private:
    bool retryable_;
};
