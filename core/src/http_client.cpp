#include "skyline/http_client.h"
#include "skyline/proc.h"

#include <cstdlib>

namespace skyline {

namespace {

bool has_crlf(const std::string& s) {
    return s.find('\r') != std::string::npos || s.find('\n') != std::string::npos;
}

bool valid_method(const std::string& m) {
    if (m.empty() || m.size() > 16) return false;
    for (char c : m) {
        if (!(c >= 'A' && c <= 'Z')) return false;
    }
    return true;
}

} // namespace

bool http_request(const HttpRequest& req, const CancelToken* cancel, HttpResponse* res) {
    if (!res) return false;
    *res = HttpResponse{};

    if (!(req.url.rfind("http://", 0) == 0 || req.url.rfind("https://", 0) == 0)) {
        res->error = "only http/https allowed";
        return false;
    }
    if (!valid_method(req.method)) {
        res->error = "invalid method: " + req.method;
        return false;
    }

    int timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : 30000;
    // curl gets the budget in whole seconds, rounded up; proc enforces a
    // slightly longer hard bound in case curl ignores it
    int max_time = (timeout_ms + 999) / 1000;

    std::vector<std::string> argv = {
        "curl",
        "-sS",
        "--globoff",
        "--proto", "=http,https",
        "--max-redirs", "0",
        "--max-time", std::to_string(max_time),
        "-X", req.method,
        "-w", "\n%{http_code}",
    };
    for (const auto& h : req.headers) {
        if (h.first.empty() || has_crlf(h.first) || has_crlf(h.second) ||
            h.first.find(':') != std::string::npos) {
            res->error = "invalid header: " + h.first;
            return false;
        }
        argv.push_back("-H");
        argv.push_back(h.first + ": " + h.second);
    }
    if (!req.body.empty()) {
        argv.push_back("--data-binary");
        argv.push_back("@-");
    }
    argv.push_back("--");
    argv.push_back(req.url);

    ProcLimits lim;
    lim.timeout_ms = timeout_ms + 1000;
    lim.cancel = cancel;

    ProcResult pr;
    if (!proc_run_capture(argv, "", req.body, lim, &pr)) {
        res->error = "curl failed to start: " + pr.error;
        return false;
    }
    if (pr.cancelled) {
        res->error = "request cancelled";
        return false;
    }
    if (pr.timed_out) {
        res->error = "request timed out";
        return false;
    }
    if (pr.exit_code == 127) {
        res->error = "curl not found";
        return false;
    }
    if (pr.exit_code != 0) {
        std::string msg = pr.err;
        while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
        if (msg.empty()) msg = "curl exit " + std::to_string(pr.exit_code);
        res->error = msg;
        return false;
    }
    if (pr.output_truncated) {
        res->error = "response too large";
        return false;
    }

    // -w appended "\n<status>" after the body
    auto nl = pr.out.rfind('\n');
    if (nl == std::string::npos) {
        res->error = "malformed curl output";
        return false;
    }
    int status = std::atoi(pr.out.c_str() + nl + 1);
    if (status <= 0) {
        res->error = "no HTTP response";
        return false;
    }
    res->status = status;
    res->body = pr.out.substr(0, nl);
    return true;
}

std::string http_status_text(int status) {
    switch (status) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 415: return "Unsupported Media Type";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

} // namespace skyline
