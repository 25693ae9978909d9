#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace skyline {

struct BundledModule {
    std::string name;              // workspace-relative path, e.g. "mcp/github/index.js"
    std::vector<uint8_t> bytecode; // JS_WriteObject(JS_WRITE_OBJ_BYTECODE) output
};

// Self-contained compiled unit: every module reachable from the entry,
// dependencies before dependents. Nothing is read from disk at run time.
struct Bundle {
    std::string entry;
    std::vector<BundledModule> modules;
    // lexically normalized specifier path -> resolved module name
    std::map<std::string, std::string> aliases;

    const BundledModule* find(const std::string& name) const;
};

// Wrap raw script source into the entry module: leading static imports stay
// at module top level, the rest runs inside an immediately invoked async
// arrow function that the module awaits, so the module's evaluation promise
// settles with the script.
std::string wrap_script(const std::string& code);

// Literal dynamic import specifiers (import('./x.js')) found in code.
std::vector<std::string> find_dynamic_imports(const std::string& code);

// Join a relative specifier onto the importing module's directory and
// normalize lexically. Returns "" for bare/absolute specifiers or paths that
// climb above the workspace root.
std::string join_specifier(const std::string& base_module, const std::string& specifier);

// Compiles workspace modules into a Bundle using a throwaway QuickJS runtime.
class Bundler {
public:
    explicit Bundler(std::string workspace_dir);

    // entry_name is the workspace-relative file written by the caller;
    // extra_entries are additional specifiers (relative to the entry) to
    // compile as well. On failure returns false with *err set.
    bool bundle(const std::string& entry_name,
                const std::vector<std::string>& extra_entries,
                Bundle* out,
                std::string* err) const;

    const std::string& workspace_dir() const { return workspace_dir_; }

private:
    std::string workspace_dir_;
};

} // namespace skyline
