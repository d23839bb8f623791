#include "../include/pdf_text.hpp"
#include "../include/errors.hpp"
#include <poppler-document.h>
#include <poppler-page.h>
#include <memory>
#include <vector>

std::string PopplerTextExtractor::extract_text(const std::string& bytes) {
    if (bytes.empty()) throw SourceUnavailable("empty PDF");
    // poppler keeps a pointer to the buffer for the document's lifetime.
    std::vector<char> data(bytes.begin(), bytes.end());
    std::unique_ptr<poppler::document> doc(poppler::document::load_from_raw_data(data.data(), (int)data.size()));
    if (!doc) throw SourceUnavailable("poppler failed to open PDF");
    if (doc->is_locked()) throw SourceUnavailable("PDF is password protected");

    std::string text;
    for (int i = 0; i < doc->pages(); ++i) {
        std::unique_ptr<poppler::page> page(doc->create_page(i));
        if (!page) continue;
        auto ba = page->text().to_utf8();
        if (!text.empty()) text += "\n\n";
        text.append(ba.begin(), ba.end());
    }
    return text;
}
