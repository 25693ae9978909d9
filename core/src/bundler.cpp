#include "skyline/bundler.h"
#include "skyline/qjs_util.h"

#include <quickjs.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace skyline {

const BundledModule* Bundle::find(const std::string& name) const {
    for (const auto& m : modules) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

namespace {

constexpr size_t npos = std::string::npos;

size_t skip_trivia(const std::string& s, size_t i) {
    while (i < s.size()) {
        char c = s[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            i++;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
            size_t nl = s.find('\n', i);
            i = nl == npos ? s.size() : nl + 1;
            continue;
        }
        if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
            size_t e = s.find("*/", i + 2);
            i = e == npos ? s.size() : e + 2;
            continue;
        }
        break;
    }
    return i;
}

bool is_ident_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '$';
}

// If a static import declaration starts at i, returns the index just past
// it (including a trailing ';'), otherwise npos. import() and import.meta
// are expressions and do not match.
size_t match_static_import(const std::string& s, size_t i) {
    if (s.compare(i, 6, "import") != 0) return npos;
    size_t k = i + 6;
    if (k < s.size() && is_ident_char(s[k])) return npos;
    k = skip_trivia(s, k);
    if (k >= s.size() || s[k] == '(' || s[k] == '.') return npos;

    while (k < s.size()) {
        char c = s[k];
        if (c == '\'' || c == '"') {
            size_t e = k + 1;
            while (e < s.size() && s[e] != c) {
                if (s[e] == '\n') return npos;
                if (s[e] == '\\') e++;
                e++;
            }
            if (e >= s.size()) return npos;
            size_t end = e + 1;
            size_t t = end;
            while (t < s.size() && (s[t] == ' ' || s[t] == '\t')) t++;
            if (t < s.size() && s[t] == ';') return t + 1;
            return end;
        }
        if (c == '/' && k + 1 < s.size() && (s[k + 1] == '/' || s[k + 1] == '*')) {
            k = skip_trivia(s, k);
            continue;
        }
        if (c == ';') return npos;
        k++;
    }
    return npos;
}

bool path_within(const fs::path& root, const fs::path& p) {
    auto q = p.begin();
    for (auto r = root.begin(); r != root.end(); ++r, ++q) {
        if (q == p.end() || *r != *q) return false;
    }
    return true;
}

struct CompileSession {
    fs::path root; // canonical workspace root
    Bundle* bundle{nullptr};
    std::string error; // first resolution failure, preferred over the JS exception text
};

bool read_file(const fs::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

// Resolve a specifier imported from base to a workspace-relative module
// name. Returns "" with *err set on failure.
std::string resolve_module(CompileSession& s, const std::string& base, const std::string& spec,
                           std::string* err) {
    std::string joined = join_specifier(base, spec);
    if (joined.empty()) {
        *err = "cannot resolve '" + spec + "' from '" + base +
               "': only relative imports inside the workspace are allowed";
        return "";
    }

    auto it = s.bundle->aliases.find(joined);
    if (it != s.bundle->aliases.end()) return it->second;

    const std::string candidates[] = {joined, joined + ".js", joined + ".mjs", joined + "/index.js"};
    for (const auto& cand : candidates) {
        std::error_code ec;
        fs::path p = s.root / cand;
        if (!fs::is_regular_file(p, ec)) continue;
        fs::path real = fs::weakly_canonical(p, ec);
        if (ec || !path_within(s.root, real)) {
            *err = "import '" + spec + "' escapes the workspace";
            return "";
        }
        s.bundle->aliases[joined] = cand;
        return cand;
    }
    *err = "module not found: '" + spec + "' (imported from '" + base + "')";
    return "";
}

// Compile one module from disk. Dependencies are resolved (and appended to
// the bundle) by QuickJS before this returns. The caller owns the value.
JSValue compile_module(JSContext* ctx, CompileSession& s, const std::string& name) {
    std::string src;
    if (!read_file(s.root / name, &src)) {
        if (s.error.empty()) s.error = "cannot read module: " + name;
        return JS_ThrowReferenceError(ctx, "cannot read module: %s", name.c_str());
    }
    JSValue func = JS_Eval(ctx, src.c_str(), src.size(), name.c_str(),
                           JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);
    if (JS_IsException(func)) return func;

    size_t len = 0;
    uint8_t* buf = JS_WriteObject(ctx, &len, func, JS_WRITE_OBJ_BYTECODE);
    if (!buf) {
        JS_FreeValue(ctx, func);
        return JS_EXCEPTION;
    }
    BundledModule mod;
    mod.name = name;
    mod.bytecode.assign(buf, buf + len);
    js_free(ctx, buf);
    s.bundle->modules.push_back(std::move(mod));
    return func;
}

char* compile_normalize(JSContext* ctx, const char* base, const char* spec, void* opaque) {
    auto* s = static_cast<CompileSession*>(opaque);
    std::string err;
    std::string name = resolve_module(*s, base, spec, &err);
    if (name.empty()) {
        if (s->error.empty()) s->error = err;
        JS_ThrowReferenceError(ctx, "%s", err.c_str());
        return nullptr;
    }
    return js_strdup(ctx, name.c_str());
}

JSModuleDef* compile_load(JSContext* ctx, const char* name, void* opaque) {
    auto* s = static_cast<CompileSession*>(opaque);
    JSValue func = compile_module(ctx, *s, name);
    if (JS_IsException(func)) return nullptr;
    // the module stays referenced by the context
    auto* m = static_cast<JSModuleDef*>(JS_VALUE_GET_PTR(func));
    JS_FreeValue(ctx, func);
    return m;
}

struct CompileRuntime {
    JSRuntime* rt{nullptr};
    JSContext* ctx{nullptr};

    CompileRuntime() {
        rt = JS_NewRuntime();
        if (rt) ctx = JS_NewContext(rt);
    }
    ~CompileRuntime() {
        if (ctx) JS_FreeContext(ctx);
        if (rt) JS_FreeRuntime(rt);
    }
    CompileRuntime(const CompileRuntime&) = delete;
    CompileRuntime& operator=(const CompileRuntime&) = delete;
};

} // namespace

std::string wrap_script(const std::string& code) {
    size_t hoist_end = 0;
    size_t pos = 0;
    while (true) {
        size_t k = skip_trivia(code, pos);
        if (k >= code.size()) break;
        size_t e = match_static_import(code, k);
        if (e == npos) break;
        pos = hoist_end = e;
    }

    std::string out;
    out.reserve(code.size() + 256);
    out.append(code, 0, hoist_end);
    out += "\nawait (async () => {\n";
    out.append(code, hoist_end, npos);
    out += "\n})();\n";
    return out;
}

std::vector<std::string> find_dynamic_imports(const std::string& code) {
    static const std::regex re(R"(\bimport\s*\(\s*(['"])([^'"\n]+)\1\s*\))");
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(code.begin(), code.end(), re); it != std::sregex_iterator(); ++it) {
        std::string spec = (*it)[2].str();
        bool seen = false;
        for (const auto& x : out) {
            if (x == spec) { seen = true; break; }
        }
        if (!seen) out.push_back(spec);
    }
    return out;
}

std::string join_specifier(const std::string& base_module, const std::string& specifier) {
    if (!(specifier.rfind("./", 0) == 0 || specifier.rfind("../", 0) == 0)) return "";
    fs::path joined = (fs::path(base_module).parent_path() / specifier).lexically_normal();
    std::string out = joined.generic_string();
    while (!out.empty() && out.back() == '/') out.pop_back();
    if (out.empty() || out == "." || out == ".." || out.rfind("../", 0) == 0) return "";
    return out;
}

Bundler::Bundler(std::string workspace_dir) : workspace_dir_(std::move(workspace_dir)) {}

bool Bundler::bundle(const std::string& entry_name,
                     const std::vector<std::string>& extra_entries,
                     Bundle* out,
                     std::string* err) const {
    if (!out || !err) return false;
    *out = Bundle{};
    out->entry = entry_name;

    std::error_code ec;
    fs::path root = fs::canonical(workspace_dir_, ec);
    if (ec) {
        *err = "workspace not accessible: " + workspace_dir_ + ": " + ec.message();
        return false;
    }

    CompileRuntime crt;
    if (!crt.ctx) {
        *err = "cannot allocate compile runtime";
        return false;
    }

    CompileSession session;
    session.root = root;
    session.bundle = out;
    JS_SetModuleLoaderFunc(crt.rt, compile_normalize, compile_load, &session);

    JSValue entry = compile_module(crt.ctx, session, entry_name);
    if (JS_IsException(entry)) {
        std::string msg = qjs::take_exception(crt.ctx, true);
        *err = session.error.empty() ? msg : session.error;
        return false;
    }
    JS_FreeValue(crt.ctx, entry);

    for (const auto& spec : extra_entries) {
        std::string rerr;
        std::string name = resolve_module(session, entry_name, spec, &rerr);
        // unresolvable literals fail at run time, if they are ever reached
        if (name.empty() || out->find(name)) continue;
        JSValue mod = compile_module(crt.ctx, session, name);
        if (JS_IsException(mod)) {
            std::string msg = qjs::take_exception(crt.ctx, true);
            *err = session.error.empty() ? msg : session.error;
            return false;
        }
        JS_FreeValue(crt.ctx, mod);
    }
    return true;
}

} // namespace skyline
