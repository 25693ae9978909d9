#pragma once

#include <quickjs.h>

#include <string>
#include <vector>

namespace skyline {

class CancelToken;
class ToolDispatcher;

// Fixed for the lifetime of an executor; shared read-only by every run.
struct BridgeBindings {
    ToolDispatcher* dispatcher{nullptr};
    std::vector<std::string> fetch_prefixes{
        "http://localhost", "https://localhost", "http://127.0.0.1", "https://127.0.0.1"};
    int fetch_timeout_ms{30000};
};

// Per-VM capability state. Reached from native callbacks through the
// context opaque pointer, so it must outlive the VM it is installed in.
struct BridgeState {
    const BridgeBindings* bindings{nullptr};
    const CancelToken* cancel{nullptr}; // execution-scoped
    std::vector<std::string> interfaces; // snapshot taken when the run starts

    std::string stdout_text;
    std::string stderr_text;
    std::vector<std::string> tools_called;
};

// Install console, __callTool, __searchTools, fetch, __interfaces and the
// script-facing helpers into ctx's global object. Throws ExecError.
void install_bridge(JSContext* ctx, BridgeState* state);

// True when url's scheme and host equal one of prefixes ("http://localhost").
// The authority may carry a numeric port but no userinfo, and the URL may not
// contain whitespace, backslashes or curl glob characters.
bool fetch_url_allowed(const std::vector<std::string>& prefixes, const std::string& url);

} // namespace skyline
