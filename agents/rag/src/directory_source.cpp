#include "../include/directory_source.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>

namespace fs = std::filesystem;

int count_term_hits(const std::string& haystack_lower, const std::vector<std::string>& terms_lower) {
    int hits = 0;
    for (auto& t : terms_lower) {
        if (t.empty()) continue;
        for (size_t pos = haystack_lower.find(t); pos != std::string::npos; pos = haystack_lower.find(t, pos + t.size())) {
            ++hits;
        }
    }
    return hits;
}

DirectorySource::DirectorySource(fs::path root, TextExtractor& extractor)
    : root_(std::move(root)), extractor_(extractor) {}

std::string DirectorySource::load_text(const fs::path& p, const std::string& sha) {
    auto key = p.string() + "@" + sha;
    auto it = text_cache_.find(key);
    if (it != text_cache_.end()) return it->second;
    std::string text = to_lower(p.extension().string()) == ".pdf" ? extractor_.extract_text(read_text_file(p))
                                                                  : read_text_file(p);
    text_cache_[key] = text;
    return text;
}

std::vector<DocumentRef> DirectorySource::search(const std::string& query, int limit) {
    if (limit <= 0) return {};
    if (!fs::is_directory(root_)) throw SourceUnavailable("not a directory: " + root_.string());

    // texts read by the previous search may be stale by now
    text_cache_.clear();
    auto terms = split_words(to_lower(query));
    auto paths = list_files(root_, {".txt", ".md", ".pdf"}, {".git", "build", "node_modules"});

    struct Scored { DocumentRef ref; int score; };
    std::vector<Scored> scored;
    for (auto& p : paths) {
        int score = 0;
        std::string sha;
        try {
            sha = sha1_file(p);
        } catch (const std::exception& e) {
            log_warn("dir", "cannot read " + p.string() + ": " + e.what());
            continue;
        }
        if (!terms.empty()) {
            std::string text;
            try {
                text = load_text(p, sha);
            } catch (const std::exception& e) {
                log_warn("dir", "cannot read " + p.string() + ": " + e.what());
                continue;
            }
            score = count_term_hits(to_lower(p.filename().string()) + "\n" + to_lower(text), terms);
            if (score == 0) continue;
        }
        DocumentRef ref;
        ref.id = sha;
        ref.title = p.stem().string();
        ref.has_full_text = true;
        ref.location = p.string();
        scored.push_back({std::move(ref), score});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b){ return a.score > b.score; });

    std::vector<DocumentRef> out;
    for (auto& s : scored) {
        if ((int)out.size() >= limit) break;
        out.push_back(std::move(s.ref));
    }
    return out;
}

Paper DirectorySource::fetch(const DocumentRef& ref) {
    fs::path p(ref.location);
    if (!fs::is_regular_file(p)) throw SourceUnavailable("missing file: " + ref.location);
    Paper paper;
    paper.ref = ref;
    try {
        paper.text = load_text(p, sha1_file(p));
    } catch (const SourceUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailable(ref.location + ": " + e.what());
    }
    if (trim(paper.text).empty()) throw SourceUnavailable("no text in " + ref.location);
    paper.publication_id = ref.id;
    paper.url = "file://" + fs::absolute(p).string();
    return paper;
}
