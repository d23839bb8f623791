#pragma once
#include <memory>
#include <string>
#include <vector>

struct DocumentRef {
    std::string id;           // source-assigned identifier
    std::string title;
    bool has_full_text{false};
    std::string location;     // PDF URL or local path the content is fetched from
};

struct Paper {
    DocumentRef ref;
    std::string text;
    std::vector<std::string> authors;
    std::string publication_id; // DOI, ArXiv id, or the source id when neither exists
    std::string url;
    int year{0};
};

// A contiguous span of one paper's text. The paper pointer is provenance only.
struct Chunk {
    std::string text;
    int index{0}; // position among the chunks of its paper
    std::shared_ptr<const Paper> paper;

    const std::string& source_id() const;
    const std::string& title() const;
};

struct IngestFailure {
    std::string id;
    std::string title;
    std::string reason;
};

struct IngestSummary {
    int attempted{0};
    int succeeded{0};
    int failed{0};
    int chunks{0};
    std::vector<IngestFailure> failures;
};

struct Citation {
    int number{0}; // the [n] tag used in the context
    std::string source_id;
    std::string title;
    std::vector<std::string> authors;
    std::string publication_id;
    std::string url;
};

struct Answer {
    std::string text;
    std::vector<Citation> citations;
    int context_tokens{0};
    bool delimiter_found{false};
};
