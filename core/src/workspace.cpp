#include "skyline/workspace.h"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace skyline {

std::string client_module_source() {
    return
        "// Shared client for generated tool wrappers.\n"
        "export async function callMCPTool(name, args) {\n"
        "  return globalThis.__callTool(name, JSON.stringify(args === undefined ? {} : args));\n"
        "}\n"
        "\n"
        "export async function searchTools(query, detail) {\n"
        "  return globalThis.__searchTools(query, detail);\n"
        "}\n"
        "\n"
        "export const callTool = callMCPTool;\n";
}

// A single path component-safe relative path: no absolute root, no "..".
static bool safe_relative(const std::string& p) {
    if (p.empty()) return false;
    fs::path path(p);
    if (path.is_absolute() || path.has_root_name()) return false;
    for (const auto& part : path.lexically_normal()) {
        if (part == "..") return false;
    }
    return path.lexically_normal() != ".";
}

static std::string write_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) return "mkdir " + path.parent_path().string() + ": " + ec.message();
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return "open " + path.string() + " failed";
    f.write(content.data(), (std::streamsize)content.size());
    f.close();
    if (!f) return "write " + path.string() + " failed";
    return "";
}

std::string setup_workspace(const std::string& dir, const ServiceFiles& services) {
    if (dir.empty()) return "empty workspace dir";
    fs::path mcp = fs::path(dir) / "mcp";

    for (const auto& svc : services) {
        if (!safe_relative(svc.first) || svc.first.find('/') != std::string::npos) {
            return "invalid service name: " + svc.first;
        }
        for (const auto& file : svc.second) {
            if (!safe_relative(file.first)) return "invalid file name: " + svc.first + "/" + file.first;
            auto err = write_file(mcp / svc.first / fs::path(file.first).lexically_normal(), file.second);
            if (!err.empty()) return err;
        }
    }
    return write_file(mcp / "client.js", client_module_source());
}

} // namespace skyline
