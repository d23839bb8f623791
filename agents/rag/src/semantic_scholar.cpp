#include "../include/semantic_scholar.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace {
const char* kSearchFields = "paperId,title,isOpenAccess,openAccessPdf";
const char* kDetailFields = "paperId,title,authors,externalIds,url,year,openAccessPdf";

std::string string_or_empty(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return {};
    return j[key].get<std::string>();
}

std::string pdf_url_of(const json& j) {
    if (!j.contains("openAccessPdf") || !j["openAccessPdf"].is_object()) return {};
    return string_or_empty(j["openAccessPdf"], "url");
}
}

std::vector<DocumentRef> parse_search_response(const std::string& body) {
    auto data = json::parse(body);
    std::vector<DocumentRef> out;
    if (!data.contains("data") || !data["data"].is_array()) return out;
    for (auto& p : data["data"]) {
        DocumentRef ref;
        ref.id = string_or_empty(p, "paperId");
        if (ref.id.empty()) continue;
        ref.title = string_or_empty(p, "title");
        ref.location = pdf_url_of(p);
        bool open_access = !p.contains("isOpenAccess") || !p["isOpenAccess"].is_boolean() ||
                           p["isOpenAccess"].get<bool>();
        ref.has_full_text = !ref.location.empty() && open_access;
        out.push_back(std::move(ref));
    }
    return out;
}

std::vector<std::optional<PaperDetails>> parse_batch_response(const std::string& body) {
    auto data = json::parse(body);
    if (!data.is_array()) throw std::runtime_error("paper batch response is not an array");
    std::vector<std::optional<PaperDetails>> out;
    for (auto& p : data) {
        if (!p.is_object()) {
            out.push_back(std::nullopt);
            continue;
        }
        PaperDetails d;
        d.id = string_or_empty(p, "paperId");
        d.title = string_or_empty(p, "title");
        d.url = string_or_empty(p, "url");
        d.pdf_url = pdf_url_of(p);
        if (p.contains("year") && p["year"].is_number_integer()) d.year = p["year"].get<int>();
        if (p.contains("authors") && p["authors"].is_array()) {
            for (auto& a : p["authors"]) {
                auto name = string_or_empty(a, "name");
                if (!name.empty()) d.authors.push_back(name);
            }
        }
        if (p.contains("externalIds") && p["externalIds"].is_object()) {
            auto& ext = p["externalIds"];
            d.publication_id = string_or_empty(ext, "DOI");
            if (d.publication_id.empty()) {
                auto arxiv = string_or_empty(ext, "ArXiv");
                if (!arxiv.empty()) d.publication_id = "arXiv:" + arxiv;
            }
        }
        if (d.publication_id.empty()) d.publication_id = d.id;
        out.push_back(std::move(d));
    }
    return out;
}

SemanticScholarSource::SemanticScholarSource(std::string base_url, std::string api_key, TextExtractor& extractor,
                                             int timeout_ms)
    : base_(std::move(base_url)), api_key_(std::move(api_key)), extractor_(extractor), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

std::vector<std::string> SemanticScholarSource::headers() const {
    if (api_key_.empty()) return {};
    return {"x-api-key: " + api_key_};
}

std::vector<DocumentRef> SemanticScholarSource::search(const std::string& query, int limit) {
    if (limit <= 0) return {};
    std::string url = base_ + "/graph/v1/paper/search?query=" + url_encode(query) +
                      "&limit=" + std::to_string(limit) + "&fields=" + kSearchFields;
    auto r = http_get(url, timeout_ms_, headers());
    if (r.status < 200 || r.status >= 300) {
        throw SourceUnavailable("paper search failed: status " + std::to_string(r.status));
    }
    auto refs = parse_search_response(r.body);
    if ((int)refs.size() > limit) refs.resize((size_t)limit);
    return refs;
}

std::vector<std::optional<PaperDetails>> SemanticScholarSource::fetch_details(const std::vector<std::string>& ids) {
    json body = {{"ids", ids}};
    auto r = http_post_json(base_ + "/graph/v1/paper/batch?fields=" + kDetailFields, body.dump(), timeout_ms_, headers());
    if (r.status < 200 || r.status >= 300) {
        throw SourceUnavailable("paper details failed: status " + std::to_string(r.status));
    }
    return parse_batch_response(r.body);
}

std::string SemanticScholarSource::download(const std::string& url) {
    auto r = http_get(url, timeout_ms_);
    if (r.status < 200 || r.status >= 300) {
        throw SourceUnavailable("download of " + url + " failed: status " + std::to_string(r.status));
    }
    if (r.body.empty()) throw SourceUnavailable("download of " + url + " returned no data");
    return r.body;
}

Paper SemanticScholarSource::fetch(const DocumentRef& ref) {
    if (!ref.has_full_text || ref.location.empty()) {
        throw SourceUnavailable("no open-access full text for " + ref.id);
    }
    try {
        auto details = fetch_details({ref.id});
        Paper paper;
        paper.ref = ref;
        if (!details.empty() && details.front()) {
            auto& d = *details.front();
            paper.authors = d.authors;
            paper.publication_id = d.publication_id;
            paper.url = d.url;
            paper.year = d.year;
            if (paper.ref.title.empty()) paper.ref.title = d.title;
        } else {
            log_warn("s2", "no details for " + ref.id + ", citing it by id only");
            paper.publication_id = ref.id;
        }
        log_debug("s2", "downloading " + ref.location);
        paper.text = extractor_.extract_text(download(ref.location));
        if (trim(paper.text).empty()) throw SourceUnavailable("no text extracted from " + ref.location);
        return paper;
    } catch (const SourceUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailable(ref.id + ": " + e.what());
    }
}
