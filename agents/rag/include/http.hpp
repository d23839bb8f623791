#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Extra headers are given as "Name: value". Both calls throw ServiceTimeout when
// the timeout elapses and std::runtime_error on any other transport failure.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::vector<std::string>& headers = {});
HttpResponse http_get(const std::string& url, long timeout_ms = 30000,
                      const std::vector<std::string>& headers = {});

// Throws std::runtime_error("<what> failed: status N") for a non-2xx response.
void ensure_ok(const HttpResponse& r, const std::string& what);

std::string url_encode(const std::string& s);
