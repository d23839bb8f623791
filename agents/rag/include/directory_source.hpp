#pragma once
#include "services.hpp"
#include <filesystem>
#include <map>
#include <string>
#include <vector>

// Offline source over a folder of .txt, .md and .pdf files. search() ranks
// files by how often the query terms occur in their name and text.
class DirectorySource : public DocumentSource {
public:
    DirectorySource(std::filesystem::path root, TextExtractor& extractor);

    std::vector<DocumentRef> search(const std::string& query, int limit) override;
    Paper fetch(const DocumentRef& ref) override;

private:
    std::string load_text(const std::filesystem::path& p, const std::string& sha);

    std::filesystem::path root_;
    TextExtractor& extractor_;
    std::map<std::string, std::string> text_cache_; // "location@sha1" -> text
};

int count_term_hits(const std::string& haystack_lower, const std::vector<std::string>& terms_lower);
