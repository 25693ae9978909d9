#pragma once

#include "skyline/executor.h"

#include <memory>
#include <string>

namespace skyline {

std::string slurp(const std::string& path);
std::string slurp_stdin(size_t max_bytes);

// Executor wired from the environment: options, HttpDispatcher endpoints
// (call_endpoint overrides SKYLINE_CALL_TOOL_ENDPOINT when non-empty) and
// the optional SKYLINE_EXEC_LOG audit log.
std::unique_ptr<Executor> make_executor_from_env(const std::string& workspace_override,
                                                 const std::string& call_endpoint_override);

} // namespace skyline
