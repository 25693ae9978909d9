#include "skyline/config.h"
#include "skyline/dispatch.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace skyline {

Profile detect_profile() {
    const char* env = std::getenv("SKYLINE_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("SKYLINE_VM_MEMORY_MB",         "256",     NO_OVERWRITE);
            setenv("SKYLINE_VM_STACK_KB",          "1024",    NO_OVERWRITE);
            setenv("SKYLINE_HTTP_TIMEOUT_MS",      "30000",   NO_OVERWRITE);
            setenv("SKYLINE_SERVE_MAX_BODY_BYTES", "2097152", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("SKYLINE_VM_MEMORY_MB",         "128",     NO_OVERWRITE);
            setenv("SKYLINE_VM_STACK_KB",          "512",     NO_OVERWRITE);
            setenv("SKYLINE_HTTP_TIMEOUT_MS",      "15000",   NO_OVERWRITE);
            setenv("SKYLINE_SERVE_MAX_BODY_BYTES", "1048576", NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* key, int defv) {
    if (const char* v = std::getenv(key)) {
        try { return std::stoi(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* v = std::getenv(key)) {
        try { return (int64_t)std::stoll(v); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

std::string getenv_str(const char* key, const std::string& defv) {
    const char* v = std::getenv(key);
    if (!v || !*v) return defv;
    return v;
}

static std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == ',') {
            out.push_back(trim_ws(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(trim_ws(cur));
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string& x) { return x.empty(); }), out.end());
    return out;
}

ExecutorOptions executor_options_from_env() {
    ExecutorOptions o;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    std::string def_ws = ec ? std::string("/tmp/skyline-workspace") : (tmp / "skyline-workspace").string();
    o.workspace_dir = getenv_str("SKYLINE_WORKSPACE_DIR", def_ws);
    o.interfaces = split_csv(getenv_str("SKYLINE_INTERFACES", ""));

    int64_t mem_mb = getenv_i64("SKYLINE_VM_MEMORY_MB", 256);
    int64_t stack_kb = getenv_i64("SKYLINE_VM_STACK_KB", 1024);
    // zero disables the QuickJS limit; negative values fall back to defaults
    o.vm_limits.memory_limit_bytes = (size_t)(mem_mb >= 0 ? mem_mb : 256) * 1024u * 1024u;
    o.vm_limits.max_stack_bytes = (size_t)(stack_kb >= 0 ? stack_kb : 1024) * 1024u;

    int http_ms = getenv_int("SKYLINE_HTTP_TIMEOUT_MS", 30000);
    o.fetch_timeout_ms = http_ms > 0 ? http_ms : 30000;
    return o;
}

DispatchEndpoints dispatch_endpoints_from_env() {
    DispatchEndpoints e;
    e.call_tool = getenv_str("SKYLINE_CALL_TOOL_ENDPOINT", kDefaultCallToolEndpoint);
    e.search_tools = getenv_str("SKYLINE_SEARCH_TOOLS_ENDPOINT", derive_search_endpoint(e.call_tool));
    int http_ms = getenv_int("SKYLINE_HTTP_TIMEOUT_MS", 30000);
    e.timeout_ms = http_ms > 0 ? http_ms : 30000;
    return e;
}

} // namespace skyline
