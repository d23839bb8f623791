#pragma once
#include "answer.hpp"
#include "chunker.hpp"
#include "services.hpp"
#include "types.hpp"
#include "vector_index.hpp"
#include <memory>
#include <mutex>
#include <string>

struct PipelineOptions {
    ChunkOptions chunking;
    int embed_batch_size{32};
    int max_context_tokens{1024};
    AnswerOptions answer;
};

/**
 * Ingest-then-ask orchestration over injected collaborators.
 *
 * ingest() always discards the previous corpus first and publishes the new
 * snapshot only once its index is complete. An ask() that runs while an
 * ingest is in progress therefore sees no corpus and throws RetrievalEmpty;
 * it never sees a partial one. ask() works on whichever snapshot was
 * published when it started. Ingests are serialized against each other.
 */
class RagPipeline {
public:
    RagPipeline(DocumentSource& source, Embedder& embedder, GenerativeModel& model, PipelineOptions opts = {});

    void reset_corpus();

    // Throws EmptyCorpus when nothing usable was ingested, SourceUnavailable
    // when the search itself fails.
    IngestSummary ingest(const std::string& topic, int max_documents);

    // Throws RetrievalEmpty before a successful ingest, GenerationFailure when
    // the model fails.
    Answer ask(const std::string& question, int top_k = 5);

    void load_snapshot(std::shared_ptr<const CorpusSnapshot> snapshot);
    std::shared_ptr<const CorpusSnapshot> snapshot() const;

    const PipelineOptions& options() const { return opts_; }

private:
    void publish(std::shared_ptr<const CorpusSnapshot> snapshot);

    DocumentSource& source_;
    Embedder& embedder_;
    GenerativeModel& model_;
    PipelineOptions opts_;
    AnswerGenerator generator_;

    mutable std::mutex snapshot_mtx_;
    std::shared_ptr<const CorpusSnapshot> snapshot_;
    std::mutex ingest_mtx_;
};
