#include "test_common.h"
#include "skyline/cancel.h"
#include "skyline/dispatch.h"
#include "skyline/executor.h"
#include "skyline/http_client.h"
#include "skyline/json_mini.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace skyline;

namespace {

struct Seen {
    std::string method;
    std::string path;
    std::string headers;
    std::string body;
};

// Minimal one-request-per-connection HTTP server on 127.0.0.1.
class LoopbackServer {
public:
    LoopbackServer() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) die("socket");
        int one = 1;
        (void)setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) != 0) die("bind");
        if (::listen(fd_, 16) != 0) die("listen");
        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, (sockaddr*)&addr, &len) != 0) die("getsockname");
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { loop(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
        ::close(fd_);
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    Seen last() {
        std::lock_guard<std::mutex> lk(mu_);
        return last_;
    }

private:
    void loop() {
        while (!stop_) {
            pollfd p{fd_, POLLIN, 0};
            if (::poll(&p, 1, 100) <= 0) continue;
            int c = ::accept(fd_, nullptr, nullptr);
            if (c < 0) continue;
            handle(c);
            ::close(c);
        }
    }

    static bool read_request(int c, Seen* out) {
        std::string buf;
        char tmp[4096];
        size_t header_end = std::string::npos;
        while (header_end == std::string::npos) {
            ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
            if (n <= 0) return false;
            buf.append(tmp, (size_t)n);
            header_end = buf.find("\r\n\r\n");
        }
        std::string head = buf.substr(0, header_end);
        size_t sp1 = head.find(' ');
        size_t sp2 = head.find(' ', sp1 + 1);
        out->method = head.substr(0, sp1);
        out->path = head.substr(sp1 + 1, sp2 - sp1 - 1);
        out->headers = head;

        size_t content_length = 0;
        std::string lower = head;
        for (char& ch : lower) ch = (char)std::tolower((unsigned char)ch);
        size_t cl = lower.find("content-length:");
        if (cl != std::string::npos) content_length = (size_t)std::atol(lower.c_str() + cl + 15);

        std::string body = buf.substr(header_end + 4);
        while (body.size() < content_length) {
            ssize_t n = ::recv(c, tmp, sizeof(tmp), 0);
            if (n <= 0) return false;
            body.append(tmp, (size_t)n);
        }
        out->body = body;
        return true;
    }

    static void respond(int c, int status, const std::string& reason, const std::string& body) {
        std::string resp = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n" +
                           "Content-Type: application/json\r\n" +
                           "Content-Length: " + std::to_string(body.size()) + "\r\n" +
                           "Connection: close\r\n\r\n" + body;
        size_t off = 0;
        while (off < resp.size()) {
            ssize_t n = ::send(c, resp.data() + off, resp.size() - off, MSG_NOSIGNAL);
            if (n <= 0) return;
            off += (size_t)n;
        }
    }

    void handle(int c) {
        Seen req;
        if (!read_request(c, &req)) return;
        {
            std::lock_guard<std::mutex> lk(mu_);
            last_ = req;
        }

        if (req.path == "/text") {
            respond(c, 200, "OK", "hello world");
        } else if (req.path == "/json") {
            respond(c, 200, "OK", "{\"a\":1,\"b\":[true,null]}");
        } else if (req.path == "/echo") {
            respond(c, 201, "Created", req.method + ":" + req.body);
        } else if (req.path == "/slow") {
            std::this_thread::sleep_for(std::chrono::milliseconds(2500));
            respond(c, 200, "OK", "late");
        } else if (req.path == "/internal/call-tool") {
            auto doc = json_mini::parse(req.body);
            auto tool = json_mini::get_string(doc.root, "toolName").value_or("");
            auto args = json_mini::get_raw(doc.root, "args").value_or("null");
            if (tool == "svc__bad") {
                respond(c, 200, "OK", "{\"error\":\"bad input\"}");
            } else if (tool == "svc__garbage") {
                respond(c, 502, "Bad Gateway", "<html>upstream</html>");
            } else if (tool == "svc__nodata") {
                respond(c, 200, "OK", "{}");
            } else {
                respond(c, 200, "OK", "{\"data\":{\"tool\":\"" + tool + "\",\"args\":" + args + "}}");
            }
        } else if (req.path == "/internal/search-tools") {
            auto doc = json_mini::parse(req.body);
            auto query = json_mini::get_string(doc.root, "query").value_or("");
            auto detail = json_mini::get_string(doc.root, "detail").value_or("");
            if (query == "fail") {
                respond(c, 500, "Internal Server Error", "{\"error\":\"index down\"}");
            } else {
                respond(c, 200, "OK", "[{\"name\":\"svc__op\",\"detail\":\"" + detail + "\"}]");
            }
        } else {
            respond(c, 404, "Not Found", "{\"error\":\"no route\"}");
        }
    }

    int fd_{-1};
    int port_{0};
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::mutex mu_;
    Seen last_;
};

ExecutionRequest js(const std::string& code) {
    ExecutionRequest r;
    r.code = code;
    r.language = "javascript";
    r.timeout_seconds = 20;
    return r;
}

} // namespace

int main() {
    // loopback traffic must not go through a proxy
    for (const char* v : {"http_proxy", "https_proxy", "HTTP_PROXY", "HTTPS_PROXY", "ALL_PROXY", "all_proxy"}) {
        unsetenv(v);
    }

    LoopbackServer srv;
    CancelToken root;

    // Plain client
    {
        HttpRequest req;
        req.url = srv.url("/text");
        HttpResponse resp;
        expect_true(http_request(req, &root, &resp), "GET /text: " + resp.error);
        expect_eq_ll(resp.status, 200, "GET status");
        expect_eq_str(resp.body, "hello world", "GET body");

        HttpRequest post;
        post.method = "POST";
        post.url = srv.url("/echo");
        post.body = "line1\nline2";
        post.headers.emplace_back("X-Test", "yes");
        expect_true(http_request(post, &root, &resp), "POST /echo: " + resp.error);
        expect_eq_ll(resp.status, 201, "POST status");
        expect_eq_str(resp.body, "POST:line1\nline2", "POST body round trip");
        expect_true(contains(srv.last().headers, "X-Test: yes"), "custom header sent");

        HttpRequest missing;
        missing.url = srv.url("/missing");
        expect_true(http_request(missing, &root, &resp), "404 is a response");
        expect_eq_ll(resp.status, 404, "404 status");
    }

    // Client-side validation
    {
        HttpResponse resp;
        HttpRequest bad_scheme;
        bad_scheme.url = "file:///etc/passwd";
        expect_true(!http_request(bad_scheme, &root, &resp), "file scheme rejected");

        HttpRequest bad_method;
        bad_method.url = srv.url("/text");
        bad_method.method = "GET /x";
        expect_true(!http_request(bad_method, &root, &resp), "bad method rejected");

        HttpRequest bad_header;
        bad_header.url = srv.url("/text");
        bad_header.headers.emplace_back("X-A", "v\r\nX-Injected: 1");
        expect_true(!http_request(bad_header, &root, &resp), "header injection rejected");
        expect_true(contains(resp.error, "invalid header"), "header error");

        CancelToken cancelled;
        cancelled.cancel();
        HttpRequest req;
        req.url = srv.url("/text");
        expect_true(!http_request(req, &cancelled, &resp), "cancelled request fails");
        expect_eq_str(resp.error, "request cancelled", "cancel error");

        HttpRequest refused;
        refused.url = "http://127.0.0.1:1/";
        expect_true(!http_request(refused, &root, &resp), "refused connection fails");
        expect_true(!resp.error.empty(), "refused error text");

        HttpRequest slow;
        slow.url = srv.url("/slow");
        slow.timeout_ms = 1000;
        auto t0 = std::chrono::steady_clock::now();
        expect_true(!http_request(slow, &root, &resp), "slow request fails");
        double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        expect_true(wall < 2.4, "slow request bounded");
    }

    expect_eq_str(http_status_text(200), "OK", "status text 200");
    expect_eq_str(http_status_text(404), "Not Found", "status text 404");
    expect_eq_str(http_status_text(799), "", "status text unknown");

    // HTTP dispatcher
    {
        HttpDispatcher d(srv.url("/internal/call-tool"), "", 5000);
        expect_eq_str(d.search_endpoint(), srv.url("/internal/search-tools"), "derived search endpoint");

        auto ok = d.call_tool(root, "svc__op", "{\"x\":1}");
        expect_true(ok.ok, "call ok: " + ok.error);
        expect_eq_str(ok.data_json, "{\"tool\":\"svc__op\",\"args\":{\"x\":1}}", "call data");
        expect_eq_str(srv.last().path, "/internal/call-tool", "call path");
        expect_true(contains(srv.last().headers, "Content-Type: application/json"), "call content type");

        auto bad = d.call_tool(root, "svc__bad", "{}");
        expect_true(!bad.ok, "tool error fails");
        expect_eq_str(bad.error, "tool error: bad input", "tool error mapping");

        auto garbage = d.call_tool(root, "svc__garbage", "{}");
        expect_true(!garbage.ok, "non-JSON fails");
        expect_true(garbage.error.rfind("parse response: ", 0) == 0, "parse error prefix: " + garbage.error);

        auto nodata = d.call_tool(root, "svc__nodata", "{}");
        expect_true(nodata.ok, "missing data ok");
        expect_eq_str(nodata.data_json, "null", "missing data is null");

        auto found = d.search_tools(root, "op", "full");
        expect_true(found.ok, "search ok: " + found.error);
        expect_eq_str(found.data_json, "[{\"name\":\"svc__op\",\"detail\":\"full\"}]", "search data");

        auto failed = d.search_tools(root, "fail", "full");
        expect_true(!failed.ok, "search HTTP error fails");
        expect_eq_str(failed.error, "search tools: HTTP 500", "search HTTP error");

        HttpDispatcher down("http://127.0.0.1:1/internal/call-tool", "", 2000);
        auto unreachable = down.call_tool(root, "svc__op", "{}");
        expect_true(!unreachable.ok, "unreachable fails");
        expect_true(unreachable.error.rfind("call tool: ", 0) == 0, "unreachable prefix: " + unreachable.error);

        expect_eq_str(derive_search_endpoint("http://h:1/internal/call-tool"), "http://h:1/internal/search-tools",
                      "derive");
        expect_eq_str(derive_search_endpoint("http://h:1/tools"), "http://h:1/tools", "derive passthrough");
        HttpDispatcher dflt("", "", 1000);
        expect_eq_str(dflt.call_endpoint(), kDefaultCallToolEndpoint, "default call endpoint");
    }

    // Scripts using fetch and the HTTP dispatcher end to end
    {
        auto ws = make_temp_dir("http");
        ExecutorOptions opts;
        opts.workspace_dir = ws.string();
        opts.fetch_timeout_ms = 5000;
        Executor ex(opts, std::make_shared<HttpDispatcher>(srv.url("/internal/call-tool"), "", 5000));

        auto r = ex.execute(root, js(
            "const a = fetch('" + srv.url("/json") + "');\n"
            "const j = a.json();\n"
            "console.log(a.ok, a.status, a.statusText, j.a, j.b.length);\n"
            "const b = fetch('" + srv.url("/echo") + "', {method: 'put', body: 'payload', headers: {'X-Test': 'js'}});\n"
            "console.log(b.status, b.text());\n"
            "const c = fetch('" + srv.url("/nothing") + "');\n"
            "console.log(c.ok, c.status, c.statusText);\n"
            "try { fetch('" + srv.url("/text") + "').json(); } catch (e) { console.log(e.message.startsWith('invalid JSON response')); }\n"));
        expect_eq_ll(r.exit_code, 0, "fetch script exit: " + r.error);
        expect_eq_str(r.stdout_text,
                      "true 200 OK 1 2\n"
                      "201 PUT:payload\n"
                      "false 404 Not Found\n"
                      "true\n",
                      "fetch script output");
        expect_true(contains(srv.last().headers, "GET /text"), "last request");

        auto r2 = ex.execute(root, js(
            "const v = await callTool('svc__op', {n: 5});\n"
            "console.log(v.tool, v.args.n);\n"
            "const s = await searchTools('op');\n"
            "console.log(s[0].detail);\n"
            "await callTool('svc__bad', {});\n"));
        expect_eq_ll(r2.exit_code, 1, "dispatch script exit");
        expect_eq_str(r2.stdout_text, "svc__op 5\nname-and-description\n", "dispatch script output");
        expect_true(contains(r2.error, "tool error: bad input"), "dispatch script error: " + r2.error);
        const std::vector<std::string> want = {"svc__op", "svc__bad"};
        expect_true(r2.tools_called == want, "dispatch script trace");

        auto r3 = ex.execute(root, js("fetch('http://127.0.0.1:1/')"));
        expect_eq_ll(r3.exit_code, 1, "unreachable fetch exit");
        expect_true(contains(r3.error, "fetch failed"), "unreachable fetch error: " + r3.error);

        std::filesystem::remove_all(ws);
    }

    std::cerr << "test_http: ALL PASSED" << std::endl;
    return 0;
}
