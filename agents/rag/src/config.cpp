#include "../include/config.hpp"
#include "../include/directory_source.hpp"
#include "../include/semantic_scholar.hpp"
#include "../include/util.hpp"
#include <stdexcept>

TruncationSide parse_truncation_side(const std::string& value) {
    auto v = to_lower(trim(value));
    if (v == "tail" || v == "keep_tail") return TruncationSide::KeepTail;
    if (v == "head" || v == "keep_head") return TruncationSide::KeepHead;
    throw std::invalid_argument("invalid truncation side: '" + value + "' (expected head or tail)");
}

AppConfig load_config_from_env() {
    AppConfig c;
    c.db_path = getenv_or("RAG_DB_PATH", c.db_path);
    c.log_level = getenv_or("RAG_LOG_LEVEL", c.log_level);
    c.max_context_tokens = getenv_int_or("RAG_MAX_CONTEXT_TOKENS", c.max_context_tokens);
    c.api_port = getenv_int_or("RAG_API_PORT", c.api_port);

    c.embed.ollama_url = getenv_or("OLLAMA_URL", c.embed.ollama_url);
    c.embed.embed_model = getenv_or("RAG_EMBED_MODEL", c.embed.embed_model);
    c.embed.timeout_ms = getenv_int_or("RAG_EMBED_TIMEOUT_MS", c.embed.timeout_ms);
    c.embed.batch_size = getenv_int_or("RAG_EMBED_BATCH", c.embed.batch_size);

    c.llm.server_url = getenv_or("LLM_SERVER_URL", c.llm.server_url);
    c.llm.timeout_ms = getenv_int_or("RAG_LLM_TIMEOUT_MS", c.llm.timeout_ms);
    c.llm.max_new_tokens = getenv_int_or("RAG_MAX_NEW_TOKENS", c.llm.max_new_tokens);
    c.llm.max_input_tokens = getenv_int_or("RAG_MAX_INPUT_TOKENS", c.llm.max_input_tokens);
    c.llm.temperature = getenv_float_or("RAG_TEMPERATURE", c.llm.temperature);
    c.llm.sampling = getenv_bool_or("RAG_SAMPLING", c.llm.sampling);
    auto side = getenv_or("RAG_TRUNCATE", "");
    if (!side.empty()) c.llm.truncation = parse_truncation_side(side);

    c.source.kind = getenv_or("RAG_SOURCE", c.source.kind);
    c.source.s2_url = getenv_or("S2_API_URL", c.source.s2_url);
    c.source.s2_api_key = getenv_or("S2_API_KEY", "");
    c.source.dir = getenv_or("RAG_SOURCE_DIR", "");
    c.source.timeout_ms = getenv_int_or("RAG_SOURCE_TIMEOUT_MS", c.source.timeout_ms);
    return c;
}

PipelineOptions pipeline_options(const AppConfig& cfg) {
    PipelineOptions o;
    o.embed_batch_size = cfg.embed.batch_size;
    o.max_context_tokens = cfg.max_context_tokens;
    o.answer.max_new_tokens = cfg.llm.max_new_tokens;
    o.answer.max_input_tokens = cfg.llm.max_input_tokens;
    o.answer.temperature = cfg.llm.temperature;
    o.answer.sampling = cfg.llm.sampling;
    o.answer.truncation = cfg.llm.truncation;
    return o;
}

std::unique_ptr<DocumentSource> make_document_source(const SourceConfig& cfg, TextExtractor& extractor) {
    if (cfg.kind == "s2") {
        return std::make_unique<SemanticScholarSource>(cfg.s2_url, cfg.s2_api_key, extractor, cfg.timeout_ms);
    }
    if (cfg.kind == "dir") {
        if (cfg.dir.empty()) throw std::invalid_argument("directory source needs a directory (--dir or RAG_SOURCE_DIR)");
        return std::make_unique<DirectorySource>(cfg.dir, extractor);
    }
    throw std::invalid_argument("unknown document source: '" + cfg.kind + "' (expected s2 or dir)");
}
