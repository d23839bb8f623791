#pragma once
#include "rag.hpp"
#include "services.hpp"
#include <memory>
#include <string>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"nomic-embed-text"};
    int timeout_ms{120000};
    int batch_size{32};
};

struct LlmConfig {
    std::string server_url{"http://localhost:8080"}; // llama.cpp server
    int timeout_ms{240000};
    int max_new_tokens{256};
    int max_input_tokens{2048};
    float temperature{0.7f};
    bool sampling{true};
    TruncationSide truncation{TruncationSide::KeepTail};
};

struct SourceConfig {
    std::string kind{"s2"}; // s2 | dir
    std::string s2_url{"https://api.semanticscholar.org"};
    std::string s2_api_key;
    std::string dir;
    int timeout_ms{60000};
};

struct AppConfig {
    std::string db_path{"./data/paperqa.db"};
    EmbedConfig embed;
    LlmConfig llm;
    SourceConfig source;
    int max_context_tokens{1024};
    int top_k{5};
    int max_documents{10};
    int api_port{7100};
    std::string log_level{"info"};
};

// Defaults overridden by RAG_* / OLLAMA_URL / LLM_SERVER_URL / S2_* variables.
// Malformed values throw std::invalid_argument naming the variable.
AppConfig load_config_from_env();

TruncationSide parse_truncation_side(const std::string& value);
PipelineOptions pipeline_options(const AppConfig& cfg);

// Builds the document source named by cfg.source.kind; the extractor must
// outlive the returned source.
std::unique_ptr<DocumentSource> make_document_source(const SourceConfig& cfg, TextExtractor& extractor);
