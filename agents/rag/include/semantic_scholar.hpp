#pragma once
#include "services.hpp"
#include <optional>
#include <string>
#include <vector>

// Per-paper metadata from the Graph API batch endpoint.
struct PaperDetails {
    std::string id;
    std::string title;
    std::vector<std::string> authors;
    std::string publication_id;
    std::string url;
    int year{0};
    std::string pdf_url;
};

// Literature search over the Semantic Scholar Graph API, open-access PDFs only
// for full text.
class SemanticScholarSource : public DocumentSource {
public:
    SemanticScholarSource(std::string base_url, std::string api_key, TextExtractor& extractor, int timeout_ms = 60000);

    std::vector<DocumentRef> search(const std::string& query, int limit) override;
    Paper fetch(const DocumentRef& ref) override;

    std::vector<std::optional<PaperDetails>> fetch_details(const std::vector<std::string>& ids);
    std::string download(const std::string& url);

private:
    std::vector<std::string> headers() const;

    std::string base_;
    std::string api_key_;
    TextExtractor& extractor_;
    int timeout_ms_;
};

std::vector<DocumentRef> parse_search_response(const std::string& body);
// Entries the API could not resolve come back as nullopt.
std::vector<std::optional<PaperDetails>> parse_batch_response(const std::string& body);
