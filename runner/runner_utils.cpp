#include "runner_utils.h"

#include "skyline/config.h"
#include "skyline/dispatch.h"
#include "skyline/log.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace skyline {

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::string slurp_stdin(size_t max_bytes) {
    std::string out;
    char rbuf[8192];
    while (std::cin.read(rbuf, sizeof(rbuf)) || std::cin.gcount()) {
        out.append(rbuf, (size_t)std::cin.gcount());
        if (out.size() > max_bytes) throw std::runtime_error("stdin exceeds limit");
    }
    return out;
}

std::unique_ptr<Executor> make_executor_from_env(const std::string& workspace_override,
                                                 const std::string& call_endpoint_override) {
    ExecutorOptions opts = executor_options_from_env();
    if (!workspace_override.empty()) opts.workspace_dir = workspace_override;

    DispatchEndpoints ep = dispatch_endpoints_from_env();
    if (!call_endpoint_override.empty()) {
        ep.call_tool = call_endpoint_override;
        ep.search_tools = getenv_str("SKYLINE_SEARCH_TOOLS_ENDPOINT", derive_search_endpoint(ep.call_tool));
    }

    auto dispatcher = std::make_shared<HttpDispatcher>(ep.call_tool, ep.search_tools, ep.timeout_ms);
    auto exec = std::make_unique<Executor>(std::move(opts), dispatcher);

    std::string log_path = getenv_str("SKYLINE_EXEC_LOG", "");
    if (!log_path.empty()) {
        auto log = std::make_shared<ExecutionLog>(log_path);
        if (log->ok()) {
            exec->set_log(log);
        } else {
            std::cerr << "[WARN] cannot open exec log: " << log_path << "\n";
        }
    }
    return exec;
}

} // namespace skyline
