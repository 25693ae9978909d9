#pragma once

#include "skyline/executor.h"

#include <cstdint>
#include <string>
#include <vector>

namespace skyline {

enum class Profile { DEV, PROD };

// Detect profile from SKYLINE_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: generous VM limits and HTTP timeouts
// PROD: tighter memory/stack limits, shorter HTTP timeouts, smaller request bodies
void apply_profile_defaults(Profile p);

int getenv_int(const char* key, int defv);
int64_t getenv_i64(const char* key, int64_t defv);
std::string getenv_str(const char* key, const std::string& defv);

// Comma separated list, entries trimmed, empties dropped.
std::vector<std::string> split_csv(const std::string& s);

// SKYLINE_WORKSPACE_DIR, SKYLINE_INTERFACES, SKYLINE_VM_MEMORY_MB,
// SKYLINE_VM_STACK_KB, SKYLINE_HTTP_TIMEOUT_MS
ExecutorOptions executor_options_from_env();

struct DispatchEndpoints {
    std::string call_tool;
    std::string search_tools;
    int timeout_ms{30000};
};

// SKYLINE_CALL_TOOL_ENDPOINT, SKYLINE_SEARCH_TOOLS_ENDPOINT, SKYLINE_HTTP_TIMEOUT_MS
DispatchEndpoints dispatch_endpoints_from_env();

} // namespace skyline
