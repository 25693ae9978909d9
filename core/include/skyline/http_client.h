#pragma once

#include <string>
#include <utility>
#include <vector>

namespace skyline {

class CancelToken;

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    int timeout_ms{30000};
};

struct HttpResponse {
    int status{0};
    std::string body;
    std::string error; // transport failure (curl exit, timeout, cancel)
};

// Perform one HTTP request through the curl binary, sandboxed via
// proc_run_capture. The request body travels on curl's stdin.
// Returns false on transport failure (res->error set); any HTTP status,
// including 4xx/5xx, is a successful transport.
bool http_request(const HttpRequest& req, const CancelToken* cancel, HttpResponse* res);

// Reason phrase for a status code ("" when unknown).
std::string http_status_text(int status);

} // namespace skyline
