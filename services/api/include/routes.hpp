#pragma once
#include "../../../agents/rag/include/rag.hpp"
#include "../../../agents/rag/include/store.hpp"
#include <mutex>
#include <string>

struct ApiResponse {
    int status{200};
    std::string body;
};

struct ApiDefaults {
    int max_documents{10};
    int top_k{5};
};

// Request dispatch for the HTTP front end, independent of the server library.
// Ingest, reset and the corpus save that follows an ingest are serialized;
// asks run against the published snapshot. store may be null.
class ApiService {
public:
    ApiService(RagPipeline& pipeline, CorpusStore* store, ApiDefaults defaults = {});

    ApiResponse handle(const std::string& method, const std::string& path, const std::string& body);

private:
    ApiResponse ingest(const std::string& body);
    ApiResponse ask(const std::string& body);
    ApiResponse reset();
    ApiResponse status() const;

    RagPipeline& pipeline_;
    CorpusStore* store_;
    ApiDefaults defaults_;
    std::mutex write_mtx_;
};
