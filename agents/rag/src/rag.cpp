#include "../include/rag.hpp"
#include "../include/context.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/retriever.hpp"
#include <chrono>

namespace {
long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}
}

RagPipeline::RagPipeline(DocumentSource& source, Embedder& embedder, GenerativeModel& model, PipelineOptions opts)
    : source_(source), embedder_(embedder), model_(model), opts_(std::move(opts)), generator_(model_, opts_.answer) {}

void RagPipeline::reset_corpus() {
    publish(nullptr);
}

void RagPipeline::publish(std::shared_ptr<const CorpusSnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(snapshot_mtx_);
    snapshot_ = std::move(snapshot);
}

void RagPipeline::load_snapshot(std::shared_ptr<const CorpusSnapshot> snapshot) {
    std::lock_guard<std::mutex> lock(ingest_mtx_);
    publish(std::move(snapshot));
}

std::shared_ptr<const CorpusSnapshot> RagPipeline::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mtx_);
    return snapshot_;
}

IngestSummary RagPipeline::ingest(const std::string& topic, int max_documents) {
    std::lock_guard<std::mutex> lock(ingest_mtx_);
    reset_corpus();
    auto t0 = std::chrono::steady_clock::now();

    std::vector<DocumentRef> refs;
    try {
        refs = source_.search(topic, max_documents);
    } catch (const SourceUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailable("search for '" + topic + "' failed: " + e.what());
    }
    log_info("ingest", "Found " + std::to_string(refs.size()) + " document(s) for '" + topic + "'.");

    auto snap = std::make_shared<CorpusSnapshot>();
    snap->embed_model = embedder_.model();
    IngestSummary summary;
    for (auto& ref : refs) {
        ++summary.attempted;
        std::shared_ptr<const Paper> paper;
        try {
            paper = std::make_shared<const Paper>(source_.fetch(ref));
        } catch (const std::exception& e) {
            ++summary.failed;
            summary.failures.push_back({ref.id, ref.title, e.what()});
            log_warn("ingest", "[" + std::to_string(summary.attempted) + "/" + std::to_string(refs.size()) +
                               "] skipping '" + ref.title + "': " + e.what());
            continue;
        }
        ++summary.succeeded;
        auto chunks = chunk_paper(paper, opts_.chunking);
        log_info("ingest", "[" + std::to_string(summary.attempted) + "/" + std::to_string(refs.size()) + "] '" +
                           ref.title + "': " + std::to_string(chunks.size()) + " chunk(s).");
        if (chunks.empty()) continue;
        snap->papers.push_back(paper);
        for (auto& c : chunks) snap->chunks.push_back(std::move(c));
    }
    summary.chunks = (int)snap->chunks.size();

    if (snap->chunks.empty()) {
        log_warn("ingest", "No usable chunks from " + std::to_string(summary.attempted) + " document(s).");
        throw EmptyCorpus("ingestion of '" + topic + "' produced no usable chunks", summary);
    }

    snap->index = build_index(snap->chunks, embedder_, opts_.embed_batch_size);
    publish(snap);
    log_info("ingest", "Ingestion complete. Succeeded: " + std::to_string(summary.succeeded) + "/" +
                       std::to_string(summary.attempted) + ", Chunks: " + std::to_string(summary.chunks) +
                       ", Elapsed: " + std::to_string(elapsed_ms(t0)) + " ms.");
    return summary;
}

Answer RagPipeline::ask(const std::string& question, int top_k) {
    auto snap = snapshot();
    Retriever retriever(embedder_, snap);
    auto t0 = std::chrono::steady_clock::now();
    auto hits = retriever.retrieve(question, top_k);
    log_debug("ask", "Retrieved " + std::to_string(hits.size()) + " chunk(s) in " + std::to_string(elapsed_ms(t0)) + " ms.");

    std::vector<Chunk> candidates;
    candidates.reserve(hits.size());
    for (auto& h : hits) candidates.push_back(h.chunk);

    TokenCounter count = [this](const std::string& text) {
        try {
            return model_.token_count(text);
        } catch (const ServiceTimeout& e) {
            throw GenerationFailure(std::string("tokenization timed out: ") + e.what(), true);
        } catch (const std::exception& e) {
            throw GenerationFailure(std::string("tokenization failed: ") + e.what(), false);
        }
    };
    auto ctx = assemble_context(candidates, opts_.max_context_tokens, count);
    log_info("ask", "Context: " + std::to_string(ctx.entries.size()) + " source(s), " + std::to_string(ctx.tokens) +
                    " token(s)" + (ctx.stop == StopReason::TokenBudget ? ", stopped at token budget." : "."));
    if (ctx.entries.empty()) log_warn("ask", "No candidate fits the context budget; answering without sources.");

    auto a_t0 = std::chrono::steady_clock::now();
    auto extracted = generator_.answer(question, ctx.text);
    log_info("ask", "Answer generated in " + std::to_string(elapsed_ms(a_t0)) + " ms.");

    Answer out;
    out.text = answer_text(extracted);
    out.delimiter_found = delimiter_found(extracted);
    out.citations = citations_for(ctx);
    out.context_tokens = ctx.tokens;
    return out;
}
