#include "../include/routes.hpp"
#include "../../../agents/rag/include/errors.hpp"
#include "../../../agents/rag/include/log.hpp"
#include <nlohmann/json.hpp>
#include <limits>

using json = nlohmann::json;

static json summary_json(const IngestSummary& s) {
    json failures = json::array();
    for (auto& f : s.failures) failures.push_back({{"id", f.id}, {"title", f.title}, {"reason", f.reason}});
    return {
        {"attempted", s.attempted},
        {"succeeded", s.succeeded},
        {"failed", s.failed},
        {"chunks", s.chunks},
        {"failures", failures}
    };
}

static json answer_json(const Answer& a) {
    json cites = json::array();
    for (auto& c : a.citations) {
        cites.push_back({
            {"number", c.number},
            {"source_id", c.source_id},
            {"title", c.title},
            {"authors", c.authors},
            {"publication_id", c.publication_id},
            {"url", c.url}
        });
    }
    return {
        {"answer", a.text},
        {"citations", cites},
        {"context_tokens", a.context_tokens},
        {"delimiter_found", a.delimiter_found}
    };
}

static ApiResponse error_response(int status, const std::string& msg) {
    return {status, json({{"error", msg}}).dump()};
}

static json parse_object(const std::string& body) {
    auto j = json::parse(body.empty() ? std::string("{}") : body);
    if (!j.is_object()) throw std::invalid_argument("request body must be a JSON object");
    return j;
}

static std::string required_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw std::invalid_argument(std::string("'") + key + "' (non-empty string) required");
    }
    return j[key].get<std::string>();
}

static int positive_int_or(const json& j, const char* key, int def) {
    if (!j.contains(key) || j[key].is_null()) return def;
    const auto& v = j[key];
    bool ok = v.is_number_unsigned() ? v.get<unsigned long long>() <= (unsigned long long)std::numeric_limits<int>::max()
                                     : v.is_number_integer() && v.get<long long>() > 0 &&
                                           v.get<long long>() <= std::numeric_limits<int>::max();
    if (!ok || v.get<long long>() <= 0) {
        throw std::invalid_argument(std::string("'") + key + "' must be a positive integer");
    }
    return static_cast<int>(v.get<long long>());
}

ApiService::ApiService(RagPipeline& pipeline, CorpusStore* store, ApiDefaults defaults)
    : pipeline_(pipeline), store_(store), defaults_(defaults) {}

ApiResponse ApiService::handle(const std::string& method, const std::string& path, const std::string& body) {
    try {
        if (method == "POST" && path == "/ingest") return ingest(body);
        if (method == "POST" && path == "/ask") return ask(body);
        if (method == "POST" && path == "/reset") return reset();
        if (method == "GET" && path == "/status") return status();
        return error_response(404, "not found");
    } catch (const json::exception& e) {
        return error_response(400, std::string("bad request: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const RetrievalEmpty& e) {
        return error_response(409, e.what());
    } catch (const EmptyCorpus& e) {
        return {422, json({{"error", e.what()}, {"summary", summary_json(e.summary)}}).dump()};
    } catch (const GenerationFailure& e) {
        log_error("api", std::string("generation failed: ") + e.what());
        return error_response(e.retryable() ? 504 : 502, e.what());
    } catch (const ServiceTimeout& e) {
        return error_response(504, e.what());
    } catch (const SourceUnavailable& e) {
        return error_response(502, e.what());
    } catch (const std::exception& e) {
        log_error("api", method + " " + path + ": " + e.what());
        return error_response(500, e.what());
    }
}

ApiResponse ApiService::ingest(const std::string& body) {
    auto j = parse_object(body);
    auto topic = required_string(j, "topic");
    int max_docs = positive_int_or(j, "max_documents", defaults_.max_documents);

    std::lock_guard<std::mutex> lock(write_mtx_);
    IngestSummary summary;
    try {
        summary = pipeline_.ingest(topic, max_docs);
    } catch (const std::exception&) {
        // the pipeline has already dropped the old corpus
        if (store_) store_->reset();
        throw;
    }
    if (store_) store_->save(*pipeline_.snapshot());
    return {200, summary_json(summary).dump()};
}

ApiResponse ApiService::ask(const std::string& body) {
    auto j = parse_object(body);
    auto question = required_string(j, "question");
    int top_k = positive_int_or(j, "top_k", defaults_.top_k);
    return {200, answer_json(pipeline_.ask(question, top_k)).dump()};
}

ApiResponse ApiService::reset() {
    std::lock_guard<std::mutex> lock(write_mtx_);
    pipeline_.reset_corpus();
    if (store_) store_->reset();
    return {200, json({{"ok", true}}).dump()};
}

ApiResponse ApiService::status() const {
    auto snap = pipeline_.snapshot();
    json out = {
        {"papers", snap ? snap->papers.size() : 0},
        {"chunks", snap ? snap->chunks.size() : 0},
        {"dimension", snap && snap->index ? snap->index->dim() : 0},
        {"embed_model", snap ? snap->embed_model : std::string()}
    };
    return {200, out.dump()};
}
