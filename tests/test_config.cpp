#include "fakes.hpp"
#include "../agents/rag/include/config.hpp"
#include "../agents/rag/include/directory_source.hpp"
#include "../agents/rag/include/semantic_scholar.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

namespace {
struct EnvGuard {
    explicit EnvGuard(const char* key, const char* value) : key_(key) { setenv(key, value, 1); }
    ~EnvGuard() { unsetenv(key_); }
    const char* key_;
};

struct NullExtractor : TextExtractor {
    std::string extract_text(const std::string& bytes) override { return bytes; }
};
}

TEST(Config, Defaults) {
    auto c = load_config_from_env();
    EXPECT_EQ(c.embed.embed_model, "nomic-embed-text");
    EXPECT_EQ(c.max_context_tokens, 1024);
    EXPECT_EQ(c.llm.max_new_tokens, 256);
    EXPECT_EQ(c.llm.max_input_tokens, 2048);
    EXPECT_FLOAT_EQ(c.llm.temperature, 0.7f);
    EXPECT_TRUE(c.llm.sampling);
    EXPECT_EQ(c.llm.truncation, TruncationSide::KeepTail);
}

TEST(Config, EnvironmentOverrides) {
    EnvGuard a("RAG_MAX_CONTEXT_TOKENS", "512");
    EnvGuard b("RAG_SAMPLING", "off");
    EnvGuard c("RAG_TRUNCATE", "head");
    EnvGuard d("RAG_EMBED_MODEL", "bge-m3");
    auto cfg = load_config_from_env();
    EXPECT_EQ(cfg.max_context_tokens, 512);
    EXPECT_FALSE(cfg.llm.sampling);
    EXPECT_EQ(cfg.llm.truncation, TruncationSide::KeepHead);
    EXPECT_EQ(cfg.embed.embed_model, "bge-m3");

    auto opts = pipeline_options(cfg);
    EXPECT_EQ(opts.max_context_tokens, 512);
    EXPECT_FALSE(opts.answer.sampling);
}

TEST(Config, MalformedValuesThrow) {
    {
        EnvGuard g("RAG_MAX_NEW_TOKENS", "lots");
        EXPECT_THROW(load_config_from_env(), std::invalid_argument);
    }
    {
        EnvGuard g("RAG_SAMPLING", "maybe");
        EXPECT_THROW(load_config_from_env(), std::invalid_argument);
    }
    EXPECT_THROW(parse_truncation_side("middle"), std::invalid_argument);
}

TEST(Config, DocumentSourceKinds) {
    NullExtractor extractor;
    SourceConfig s;
    EXPECT_TRUE(dynamic_cast<SemanticScholarSource*>(make_document_source(s, extractor).get()));
    s.kind = "dir";
    EXPECT_THROW(make_document_source(s, extractor), std::invalid_argument);
    s.dir = "/tmp";
    EXPECT_TRUE(dynamic_cast<DirectorySource*>(make_document_source(s, extractor).get()));
    s.kind = "arxiv";
    EXPECT_THROW(make_document_source(s, extractor), std::invalid_argument);
}
