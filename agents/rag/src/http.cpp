#include "../include/http.hpp"
#include "../include/errors.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    struct curl_slist* headers{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (h) curl_easy_cleanup(h);
    }
    void add_header(const std::string& line) { headers = curl_slist_append(headers, line.c_str()); }
};

HttpResponse perform(CurlHandle& c, const std::string& url, long timeout_ms) {
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    if (c.headers) curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, c.headers);
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_FOLLOWLOCATION, 1L);

    CURLcode code = curl_easy_perform(c.h);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        throw ServiceTimeout("request to " + url + " timed out after " + std::to_string(timeout_ms) + " ms");
    }
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms,
                            const std::vector<std::string>& headers) {
    CurlHandle c;
    c.add_header("Content-Type: application/json");
    for (auto& h : headers) c.add_header(h);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    return perform(c, url, timeout_ms);
}

HttpResponse http_get(const std::string& url, long timeout_ms, const std::vector<std::string>& headers) {
    CurlHandle c;
    for (auto& h : headers) c.add_header(h);
    curl_easy_setopt(c.h, CURLOPT_HTTPGET, 1L);
    return perform(c, url, timeout_ms);
}

void ensure_ok(const HttpResponse& r, const std::string& what) {
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error(what + " failed: status " + std::to_string(r.status));
    }
}

std::string url_encode(const std::string& s) {
    CurlHandle c;
    char* out = curl_easy_escape(c.h, s.c_str(), (int)s.size());
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string encoded(out);
    curl_free(out);
    return encoded;
}
