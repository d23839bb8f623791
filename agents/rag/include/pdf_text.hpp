#pragma once
#include "services.hpp"
#include <string>

// Text layer of an in-memory PDF via poppler-cpp; pages are separated by a
// blank line. Throws SourceUnavailable for unreadable or locked documents.
class PopplerTextExtractor : public TextExtractor {
public:
    std::string extract_text(const std::string& bytes) override;
};
