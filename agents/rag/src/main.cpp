#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/llama_server.hpp"
#include "../include/log.hpp"
#include "../include/ollama.hpp"
#include "../include/pdf_text.hpp"
#include "../include/rag.hpp"
#include "../include/semantic_scholar.hpp"
#include "../include/store.hpp"
#include "../include/util.hpp"
#include <filesystem>
#include <iostream>

static void usage() {
    std::cerr << "paperqa usage:\n"
              << "  ingest --topic \"...\" [--max-docs N] [--db <dbfile>] [--source s2|dir] [--dir <path>]\n"
              << "         [--ollama <url>] [--embed-model <name>]\n"
              << "  ask --question \"...\" [--top-k N] [--db <dbfile>] [--max-context-tokens N] [--llm-url <url>]\n"
              << "  sources --topic \"...\" [--max-docs N] [--source s2|dir] [--dir <path>]\n";
}

struct UsageError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

static std::string flag_value(int argc, char** argv, int& i) {
    if (i + 1 >= argc) throw UsageError(std::string("missing value for ") + argv[i]);
    return argv[++i];
}

static void open_db_dir(const std::string& db) {
    auto parent = std::filesystem::path(db).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

static int cmd_ingest(AppConfig cfg, int argc, char** argv) {
    std::string topic;
    int max_docs = cfg.max_documents;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--topic") topic = flag_value(argc, argv, i);
        else if (a == "--max-docs") max_docs = parse_int_setting("--max-docs", flag_value(argc, argv, i));
        else if (a == "--db") cfg.db_path = flag_value(argc, argv, i);
        else if (a == "--source") cfg.source.kind = flag_value(argc, argv, i);
        else if (a == "--dir") { cfg.source.dir = flag_value(argc, argv, i); cfg.source.kind = "dir"; }
        else if (a == "--ollama") cfg.embed.ollama_url = flag_value(argc, argv, i);
        else if (a == "--embed-model") cfg.embed.embed_model = flag_value(argc, argv, i);
        else throw UsageError("unknown flag for ingest: " + a);
    }
    if (trim(topic).empty()) throw UsageError("ingest needs --topic");

    PopplerTextExtractor extractor;
    auto source = make_document_source(cfg.source, extractor);
    OllamaEmbedder embedder(cfg.embed);
    LlamaServerModel model(cfg.llm);
    RagPipeline pipeline(*source, embedder, model, pipeline_options(cfg));

    open_db_dir(cfg.db_path);
    CorpusStore store(cfg.db_path);
    IngestSummary summary;
    try {
        summary = pipeline.ingest(topic, max_docs);
    } catch (const std::exception&) {
        // a failed ingest still discards the previous corpus
        store.reset();
        throw;
    }
    store.save(*pipeline.snapshot());

    std::cout << "[OK] Ingested " << summary.succeeded << "/" << summary.attempted << " document(s), "
              << summary.chunks << " chunk(s) into " << cfg.db_path << "\n";
    for (auto& f : summary.failures) {
        std::cout << "  skipped " << f.id << " (" << f.title << "): " << f.reason << "\n";
    }
    return 0;
}

static int cmd_ask(AppConfig cfg, int argc, char** argv) {
    std::string question;
    int top_k = cfg.top_k;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--question") question = flag_value(argc, argv, i);
        else if (a == "--top-k") top_k = parse_int_setting("--top-k", flag_value(argc, argv, i));
        else if (a == "--db") cfg.db_path = flag_value(argc, argv, i);
        else if (a == "--max-context-tokens")
            cfg.max_context_tokens = parse_int_setting("--max-context-tokens", flag_value(argc, argv, i));
        else if (a == "--llm-url") cfg.llm.server_url = flag_value(argc, argv, i);
        else if (a == "--ollama") cfg.embed.ollama_url = flag_value(argc, argv, i);
        else if (a == "--embed-model") cfg.embed.embed_model = flag_value(argc, argv, i);
        else throw UsageError("unknown flag for ask: " + a);
    }
    if (trim(question).empty()) throw UsageError("ask needs --question");
    if (top_k <= 0) throw UsageError("--top-k must be positive");

    if (!std::filesystem::exists(cfg.db_path)) throw RetrievalEmpty("no corpus at " + cfg.db_path + "; run ingest first");
    CorpusStore store(cfg.db_path);
    auto snap = store.load();
    if (!snap) throw RetrievalEmpty("corpus at " + cfg.db_path + " is empty; run ingest first");
    if (snap->embed_model != cfg.embed.embed_model) {
        log_warn("paperqa", "corpus was embedded with '" + snap->embed_model + "' but '" + cfg.embed.embed_model +
                            "' is configured; retrieval quality will suffer.");
    }

    // ask never searches, so the source is never contacted
    PopplerTextExtractor extractor;
    SemanticScholarSource source(cfg.source.s2_url, cfg.source.s2_api_key, extractor, cfg.source.timeout_ms);
    OllamaEmbedder embedder(cfg.embed);
    LlamaServerModel model(cfg.llm);
    RagPipeline pipeline(source, embedder, model, pipeline_options(cfg));
    pipeline.load_snapshot(snap);

    auto answer = pipeline.ask(question, top_k);
    std::cout << "\n==== Answer ====\n\n" << answer.text << "\n\n";
    std::cout << "==== Sources ====\n";
    for (auto& c : answer.citations) {
        std::cout << "[" << c.number << "] " << c.title;
        if (!c.authors.empty()) {
            std::cout << " - " << c.authors.front() << (c.authors.size() > 1 ? " et al." : "");
        }
        std::cout << " (" << c.publication_id << ")";
        if (!c.url.empty()) std::cout << " " << c.url;
        std::cout << "\n";
    }
    if (!answer.delimiter_found) log_warn("paperqa", "model output had no answer delimiter; showing raw output.");
    return 0;
}

static int cmd_sources(AppConfig cfg, int argc, char** argv) {
    std::string topic;
    int max_docs = cfg.max_documents;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--topic") topic = flag_value(argc, argv, i);
        else if (a == "--max-docs") max_docs = parse_int_setting("--max-docs", flag_value(argc, argv, i));
        else if (a == "--source") cfg.source.kind = flag_value(argc, argv, i);
        else if (a == "--dir") { cfg.source.dir = flag_value(argc, argv, i); cfg.source.kind = "dir"; }
        else throw UsageError("unknown flag for sources: " + a);
    }
    if (trim(topic).empty()) throw UsageError("sources needs --topic");

    PopplerTextExtractor extractor;
    auto source = make_document_source(cfg.source, extractor);
    auto refs = source->search(topic, max_docs);
    int i = 1;
    for (auto& r : refs) {
        std::cout << "[" << i++ << "] " << r.id << "  " << (r.has_full_text ? "full-text" : "no-full-text") << "  "
                  << r.title << "\n";
    }
    if (refs.empty()) std::cout << "No documents found.\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    std::string cmd = argv[1];
    try {
        auto cfg = load_config_from_env();
        set_log_level(parse_log_level(cfg.log_level));
        if (cmd == "ingest") return cmd_ingest(cfg, argc, argv);
        if (cmd == "ask") return cmd_ask(cfg, argc, argv);
        if (cmd == "sources") return cmd_sources(cfg, argc, argv);
        usage();
        return 2;
    } catch (const UsageError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        usage();
        return 2;
    } catch (const EmptyCorpus& e) {
        std::cerr << "[ERROR] " << e.what() << " (" << e.summary.failed << "/" << e.summary.attempted
                  << " document(s) failed)\n";
        for (auto& f : e.summary.failures) std::cerr << "  " << f.id << ": " << f.reason << "\n";
        return 3;
    } catch (const RetrievalEmpty& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 3;
    } catch (const GenerationFailure& e) {
        std::cerr << "[ERROR] " << e.what() << (e.retryable() ? " (retryable)" : "") << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
