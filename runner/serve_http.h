#pragma once

// Minimal HTTP/1.1 helpers for the serve command (one request per connection).

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/time.h>
#include <unistd.h>

#include "skyline/http_client.h"
#include "skyline/serialization.h"
#include "skyline/types.h"

namespace skyline {

// Bounded recv/send so a stalled client cannot pin a connection thread.
inline void set_socket_timeouts(int fd, int timeout_sec = 10) {
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

inline std::string ascii_lower(std::string s) {
    for (char& c : s) if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    return s;
}

// Calls fn(lowercased name, value) for each header line after the request
// line. Stops early when fn returns false.
inline void for_each_header(const std::string& head,
                            const std::function<bool(const std::string&, const std::string&)>& fn) {
    std::istringstream iss(head);
    std::string line;
    std::getline(iss, line); // request line
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        auto colon = line.find(':');
        if (line.empty() || colon == std::string::npos) continue;
        size_t v = line.find_first_not_of(" \t", colon + 1);
        if (!fn(ascii_lower(line.substr(0, colon)), v == std::string::npos ? "" : line.substr(v))) return;
    }
}

inline std::string header_value_ci(const std::string& head, const std::string& key_lower) {
    std::string out;
    for_each_header(head, [&](const std::string& k, const std::string& v) {
        if (k != key_lower) return true;
        out = v;
        return false;
    });
    return out;
}

enum class ReadStatus { Ok, Closed, TooLarge, Malformed };

// Reads the head (capped at 64 KiB) and a Content-Length body of at most
// max_body bytes. Chunked bodies and repeated Content-Length are refused.
inline ReadStatus read_http_request(int fd, std::string& head, std::string& body, size_t max_body) {
    head.clear();
    body.clear();
    char buf[8192];
    std::string data;
    size_t head_end;

    while ((head_end = data.find("\r\n\r\n")) == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return ReadStatus::Closed;
        data.append(buf, (size_t)n);
        if (data.size() > 64 * 1024) return ReadStatus::TooLarge;
    }
    head = data.substr(0, head_end + 4);

    size_t content_length = 0;
    int length_headers = 0;
    bool bad = false;
    for_each_header(head, [&](const std::string& k, const std::string& v) {
        if (k == "transfer-encoding") {
            bad = true;
        } else if (k == "content-length") {
            length_headers++;
            try {
                content_length = (size_t)std::stoull(v);
            } catch (const std::exception&) {
                bad = true;
            }
        }
        return !bad;
    });
    if (bad || length_headers > 1) return ReadStatus::Malformed;
    if (content_length > max_body) return ReadStatus::TooLarge;

    body = data.substr(head_end + 4);
    while (body.size() < content_length) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return ReadStatus::Closed;
        body.append(buf, (size_t)n);
    }
    body.resize(content_length);
    return ReadStatus::Ok;
}

inline void send_json(int fd, int code, const std::string& json) {
    std::string reason = http_status_text(code);
    std::string out = "HTTP/1.1 " + std::to_string(code) + " " + (reason.empty() ? "Unknown" : reason) + "\r\n" +
                      "Content-Type: application/json\r\n" +
                      "Content-Length: " + std::to_string(json.size()) + "\r\n" +
                      "Connection: close\r\n\r\n" + json;
    size_t sent = 0;
    while (sent < out.size()) {
        ssize_t n = ::send(fd, out.data() + sent, out.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += (size_t)n;
    }
}

// Comparison time does not depend on where the inputs differ.
inline bool constant_time_eq(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); i++) diff |= (unsigned char)(a[i] ^ b[i]);
    return diff == 0;
}

// X-Api-Token: <t> or Authorization: Bearer <t>. An empty expected token
// disables the check.
inline bool api_token_ok(const std::string& head, const std::string& expected_token) {
    if (expected_token.empty()) return true;
    std::string x = header_value_ci(head, "x-api-token");
    if (!x.empty() && constant_time_eq(x, expected_token)) return true;
    std::string auth = header_value_ci(head, "authorization");
    const std::string bearer = "Bearer ";
    return auth.rfind(bearer, 0) == 0 && constant_time_eq(auth.substr(bearer.size()), expected_token);
}

inline std::string error_json(const std::string& msg) {
    return "{\"ok\":false,\"error\":" + json_quote(msg) + "}";
}

struct ExecuteReply {
    int status{500};
    std::string json;
};

// Decode an /execute body, run it and encode the reply. A bad body is 400;
// any failure before the script produces a result is 500.
inline ExecuteReply handle_execute(const std::string& body,
                                   const std::function<ExecutionResult(const ExecutionRequest&)>& run) {
    ExecuteReply out;
    ExecutionRequest req;
    std::string err;
    if (!execution_request_from_json(body, &req, &err)) {
        out.status = 400;
        out.json = error_json(err);
        return out;
    }
    try {
        ExecutionResult r = run(req);
        std::cerr << "[exec] exit=" << r.exit_code
                  << " time=" << r.execution_time_seconds << "s"
                  << " tools=" << r.tools_called.size();
        if (!r.error.empty()) std::cerr << " error=" << r.error;
        std::cerr << "\n";
        out.status = 200;
        out.json = execution_result_to_json(r);
    } catch (const ExecError& e) {
        std::cerr << "[exec] setup failure: " << e.what() << "\n";
        out.status = 500;
        out.json = error_json(e.what());
    } catch (const std::exception& e) {
        std::cerr << "[exec] internal failure: " << e.what() << "\n";
        out.status = 500;
        out.json = error_json(std::string("internal error: ") + e.what());
    }
    return out;
}

} // namespace skyline
