#include "../agents/rag/include/errors.hpp"
#include "../agents/rag/include/llama_server.hpp"
#include "../agents/rag/include/ollama.hpp"
#include "../agents/rag/include/semantic_scholar.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST(OllamaClient, EmbedRequestCarriesModelAndBatch) {
    auto j = json::parse(make_embed_request("nomic-embed-text", {"a", "b"}));
    EXPECT_EQ(j["model"], "nomic-embed-text");
    EXPECT_EQ(j["input"].size(), 2u);
}

TEST(OllamaClient, ParsesEmbeddings) {
    auto v = parse_embed_response(R"({"model":"m","embeddings":[[0.1,0.2],[0.3,0.4]]})", 2);
    ASSERT_EQ(v.size(), 2u);
    EXPECT_FLOAT_EQ(v[1][0], 0.3f);
}

TEST(OllamaClient, RejectsWrongCountOrDimension) {
    EXPECT_THROW(parse_embed_response(R"({"embeddings":[[0.1,0.2]]})", 2), std::runtime_error);
    EXPECT_THROW(parse_embed_response(R"({"embeddings":[[0.1,0.2],[0.3]]})", 2), std::runtime_error);
    EXPECT_THROW(parse_embed_response(R"({"error":"model not found"})", 1), std::runtime_error);
}

TEST(LlamaServerClient, CompletionRequestHonorsSampling) {
    GenerationParams p;
    p.max_new_tokens = 64;
    p.temperature = 0.5f;
    auto sampled = json::parse(make_completion_request("hi", p));
    EXPECT_EQ(sampled["n_predict"], 64);
    EXPECT_FLOAT_EQ(sampled["temperature"].get<float>(), 0.5f);
    EXPECT_FALSE(sampled.contains("top_k"));

    p.sampling = false;
    auto greedy = json::parse(make_completion_request("hi", p));
    EXPECT_FLOAT_EQ(greedy["temperature"].get<float>(), 0.0f);
    EXPECT_EQ(greedy["top_k"], 1);
}

TEST(LlamaServerClient, ParsesTokensAndContent) {
    EXPECT_EQ(parse_tokenize_response(R"({"tokens":[1,2,3]})"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(parse_completion_response(R"({"content":" done","stop":true})"), " done");
    EXPECT_THROW(parse_completion_response(R"({"error":"x"})"), std::runtime_error);
}

TEST(SemanticScholarClient, SearchMarksFullTextOnlyForOpenPdfs) {
    auto refs = parse_search_response(R"({"total":3,"data":[
        {"paperId":"a","title":"A","isOpenAccess":true,"openAccessPdf":{"url":"https://x/a.pdf"}},
        {"paperId":"b","title":"B","isOpenAccess":false,"openAccessPdf":null},
        {"paperId":"c","title":"C","isOpenAccess":null,"openAccessPdf":{"url":"https://x/c.pdf"}},
        {"title":"no id"}
    ]})");
    ASSERT_EQ(refs.size(), 3u);
    EXPECT_TRUE(refs[0].has_full_text);
    EXPECT_EQ(refs[0].location, "https://x/a.pdf");
    EXPECT_FALSE(refs[1].has_full_text);
    EXPECT_TRUE(refs[2].has_full_text);
}

TEST(SemanticScholarClient, SearchWithoutDataIsEmpty) {
    EXPECT_TRUE(parse_search_response(R"({"total":0,"offset":0})").empty());
}

TEST(SemanticScholarClient, BatchPicksPublicationId) {
    auto d = parse_batch_response(R"([
        {"paperId":"a","title":"A","authors":[{"name":"X"},{"name":"Y"}],"externalIds":{"DOI":"10.1/a","ArXiv":"1"},"year":2020},
        {"paperId":"b","title":"B","externalIds":{"ArXiv":"2101.00001"}},
        {"paperId":"c","title":"C"},
        null
    ])");
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d[0]->publication_id, "10.1/a");
    EXPECT_EQ(d[0]->authors, (std::vector<std::string>{"X", "Y"}));
    EXPECT_EQ(d[0]->year, 2020);
    EXPECT_EQ(d[1]->publication_id, "arXiv:2101.00001");
    EXPECT_EQ(d[2]->publication_id, "c");
    EXPECT_FALSE(d[3].has_value());
}

TEST(SemanticScholarClient, FetchWithoutFullTextIsSourceUnavailable) {
    struct NoExtractor : TextExtractor {
        std::string extract_text(const std::string&) override { return {}; }
    } extractor;
    SemanticScholarSource s2("http://127.0.0.1:1", "", extractor, 1000);
    DocumentRef ref;
    ref.id = "x";
    EXPECT_THROW(s2.fetch(ref), SourceUnavailable);
}
