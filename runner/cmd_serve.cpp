#include "cmd_serve.h"
#include "runner_utils.h"
#include "serve_http.h"

#include "skyline/cancel.h"
#include "skyline/config.h"
#include "skyline/serialization.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <thread>

#include <poll.h>

using namespace skyline;

namespace {

std::atomic<bool> g_running{true};

void on_signal(int) { g_running.store(false); }

} // namespace

int cmd_serve(int argc, char** argv) {
    // Ignore SIGPIPE: writing to disconnected clients should not crash the server
    ::signal(SIGPIPE, SIG_IGN);
    ::signal(SIGINT, on_signal);
    ::signal(SIGTERM, on_signal);

    std::string host = "127.0.0.1";
    int port = 8190;
    std::string workspace;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--host" && i + 1 < argc) { host = argv[++i]; continue; }
        if (a == "--port" && i + 1 < argc) { port = std::atoi(argv[++i]); continue; }
        if (a == "--workspace" && i + 1 < argc) { workspace = argv[++i]; continue; }
    }

    const size_t max_body_bytes = (size_t)getenv_i64("SKYLINE_SERVE_MAX_BODY_BYTES", 2 * 1024 * 1024);
    const std::string api_token = getenv_str("SKYLINE_API_TOKEN", "");
    std::shared_ptr<Executor> exec = make_executor_from_env(workspace, "");

    int sfd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sfd < 0) { std::cerr << "socket failed\n"; return 2; }
    {
        int one = 1;
        ::setsockopt(sfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
        std::cerr << "bad host\n";
        ::close(sfd);
        return 2;
    }
    if (::bind(sfd, (sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "bind failed\n";
        ::close(sfd);
        return 2;
    }
    if (::listen(sfd, 64) < 0) {
        std::cerr << "listen failed\n";
        ::close(sfd);
        return 2;
    }

    constexpr int max_http_conns = 32;
    std::atomic<int> active_conns{0};
    // parent of every request's token; cancelled on shutdown
    CancelToken server_cancel;

    std::cerr << "[serve] http://" << host << ":" << port
              << " workspace=" << exec->options().workspace_dir
              << " profile=" << profile_name(detect_profile())
              << (api_token.empty() ? "" : " auth=token") << "\n";

    while (g_running.load()) {
        struct pollfd pfd;
        pfd.fd = sfd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 200) <= 0) continue;

        sockaddr_in caddr{}; socklen_t clen = sizeof(caddr);
        int cfd = ::accept(sfd, (sockaddr*)&caddr, &clen);
        if (cfd < 0) continue;
        if (active_conns.load() >= max_http_conns) {
            send_json(cfd, 503, error_json("too many connections"));
            ::close(cfd);
            continue;
        }
        active_conns.fetch_add(1);
        set_socket_timeouts(cfd, 10); // 10s per-connection timeout (Slowloris defense)

        std::thread([exec, cfd, max_body_bytes, api_token, &active_conns, &server_cancel]() {
            struct ConnGuard {
                std::atomic<int>& c;
                int fd;
                ~ConnGuard() { ::close(fd); c.fetch_sub(1); }
            } cg{active_conns, cfd};

            std::string head, body;
            ReadStatus rs = read_http_request(cfd, head, body, max_body_bytes);
            if (rs == ReadStatus::Closed) return;
            if (rs == ReadStatus::TooLarge) { send_json(cfd, 413, error_json("request too large")); return; }
            if (rs == ReadStatus::Malformed) { send_json(cfd, 400, error_json("malformed request")); return; }

            std::istringstream iss(head);
            std::string method, path, ver;
            iss >> method >> path >> ver;

            if (method == "GET" && path == "/health") {
                send_json(cfd, 200, "{\"ok\":true}");
                return;
            }
            if (path != "/execute") {
                send_json(cfd, 404, error_json("not found"));
                return;
            }
            if (method != "POST") {
                send_json(cfd, 405, error_json("method not allowed"));
                return;
            }
            if (!api_token_ok(head, api_token)) {
                send_json(cfd, 401, error_json("unauthorized"));
                return;
            }

            CancelToken cancel(&server_cancel);
            ExecuteReply reply = handle_execute(body, [&](const ExecutionRequest& req) {
                return exec->execute(cancel, req);
            });
            send_json(cfd, reply.status, reply.json);
        }).detach();
    }

    std::cerr << "[serve] shutting down\n";
    ::close(sfd);
    server_cancel.cancel();
    while (active_conns.load() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return 0;
}
