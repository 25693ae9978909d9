#pragma once

#include <map>
#include <string>

namespace skyline {

// service namespace -> (relative file name -> source)
using ServiceFiles = std::map<std::string, std::map<std::string, std::string>>;

// Source of the shared mcp/client.js module. It re-exports the bridge
// helpers so generated wrappers can import them.
std::string client_module_source();

// Materialize a workspace: <dir>/mcp/<service>/<file> for every entry plus
// <dir>/mcp/client.js. Service and file names must be relative and stay
// inside their service directory. Returns error string (empty = ok).
std::string setup_workspace(const std::string& dir, const ServiceFiles& services);

} // namespace skyline
