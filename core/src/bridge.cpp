#include "skyline/bridge.h"
#include "skyline/cancel.h"
#include "skyline/dispatch.h"
#include "skyline/http_client.h"
#include "skyline/json_mini.h"
#include "skyline/qjs_util.h"
#include "skyline/types.h"

#include <cstdint>
#include <exception>

namespace skyline {

namespace {

// Script-facing layer over the native capabilities. Natives that only the
// prelude needs are captured and removed from the global object.
const char* kPrelude = R"JS(
(function (g) {
  'use strict';
  var write = g.__consoleWrite;
  var nativeFetch = g.__fetch;
  delete g.__consoleWrite;
  delete g.__fetch;

  function fmt(v) {
    if (typeof v === 'string') return v;
    if (v === undefined) return 'undefined';
    if (v === null) return 'null';
    if (v instanceof Error) return String(v);
    try {
      var s = JSON.stringify(v);
      if (s !== undefined) return s;
    } catch (e) {}
    try { return String(v); } catch (e) { return Object.prototype.toString.call(v); }
  }
  function line(args) {
    var parts = [];
    for (var i = 0; i < args.length; i++) parts.push(fmt(args[i]));
    return parts.join(' ');
  }
  g.console = {
    log: function () { write(1, line(arguments)); },
    warn: function () { write(2, line(arguments)); },
    error: function () { write(2, line(arguments)); }
  };

  g.fetch = function fetch(url, opts) {
    opts = opts || {};
    var headers = [];
    if (opts.headers) {
      Object.keys(opts.headers).forEach(function (k) {
        headers.push(String(k), String(opts.headers[k]));
      });
    }
    var method = opts.method === undefined ? 'GET' : String(opts.method);
    var body = opts.body === undefined || opts.body === null ? '' : String(opts.body);
    var r = nativeFetch(String(url), method, body, headers);
    var text = r.body;
    return {
      ok: r.status >= 200 && r.status < 300,
      status: r.status,
      statusText: r.statusText,
      text: function () { return text; },
      json: function () {
        try {
          return JSON.parse(text);
        } catch (e) {
          throw new Error('invalid JSON response: ' + e.message);
        }
      }
    };
  };

  g.__callMCPTool = g.__callTool;
  g.callTool = async function callTool(name, args) {
    return g.__callTool(String(name), JSON.stringify(args === undefined ? {} : args));
  };
  g.callMCPTool = g.callTool;
  g.searchTools = async function searchTools(query, detail) {
    return g.__searchTools(String(query), detail);
  };
  g.getToolInterface = async function getToolInterface(name) {
    var matches = g.__searchTools(String(name), 'full');
    if (Array.isArray(matches) && matches.length > 0 && matches[0] &&
        typeof matches[0].interface === 'string') {
      return matches[0].interface;
    }
    return '';
  };
  g.__getToolInterface = g.getToolInterface;

  Object.freeze(g.__interfaces);
})(globalThis);
)JS";

BridgeState* state_of(JSContext* ctx) {
    return static_cast<BridgeState*>(JS_GetContextOpaque(ctx));
}

// String(argv[i]); false leaves the conversion's exception pending.
bool arg_string(JSContext* ctx, int argc, JSValueConst* argv, int i, std::string* out) {
    if (i >= argc) {
        *out = "undefined";
        return true;
    }
    return qjs::to_std_string_checked(ctx, argv[i], out);
}

std::string upper_ascii(std::string s) {
    for (char& c : s) if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    return s;
}

// Decode a dispatcher JSON payload into a script value.
JSValue parse_payload(JSContext* ctx, const std::string& json) {
    if (json.empty()) return JS_UNDEFINED;
    return JS_ParseJSON(ctx, json.c_str(), json.size(), "<dispatch>");
}

JSValue js_console_write(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    BridgeState* st = state_of(ctx);
    int stream = 1;
    if (argc > 0 && JS_ToInt32(ctx, &stream, argv[0]) < 0) return JS_EXCEPTION;
    std::string text;
    if (!arg_string(ctx, argc, argv, 1, &text)) return JS_EXCEPTION;
    std::string& sink = stream == 2 ? st->stderr_text : st->stdout_text;
    sink += text;
    sink += '\n';
    return JS_UNDEFINED;
}

JSValue js_call_tool(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    BridgeState* st = state_of(ctx);
    std::string name, args_json;
    if (!arg_string(ctx, argc, argv, 0, &name)) return JS_EXCEPTION;
    st->tools_called.push_back(name);

    if (!arg_string(ctx, argc, argv, 1, &args_json)) return JS_EXCEPTION;
    std::string perr;
    auto doc = json_mini::parse(args_json, &perr);
    if (!json_mini::is_object(doc)) {
        if (perr.empty()) perr = "expected a JSON object";
        return qjs::throw_error(ctx, "invalid args JSON: " + perr);
    }

    ToolDispatcher* d = st->bindings ? st->bindings->dispatcher : nullptr;
    if (!d) return qjs::throw_error(ctx, "no tool dispatcher configured");

    DispatchResult r;
    try {
        r = d->call_tool(*st->cancel, name, json_mini::to_string(doc.root));
    } catch (const std::exception& e) {
        return qjs::throw_error(ctx, std::string("tool dispatch failed: ") + e.what());
    }
    if (!r.ok) return qjs::throw_error(ctx, r.error);
    return parse_payload(ctx, r.data_json);
}

JSValue js_search_tools(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    BridgeState* st = state_of(ctx);
    std::string query;
    if (!arg_string(ctx, argc, argv, 0, &query)) return JS_EXCEPTION;
    std::string detail = kDefaultSearchDetail;
    if (argc > 1 && !JS_IsUndefined(argv[1]) && !arg_string(ctx, argc, argv, 1, &detail)) return JS_EXCEPTION;

    ToolDispatcher* d = st->bindings ? st->bindings->dispatcher : nullptr;
    if (!d) return qjs::throw_error(ctx, "no tool dispatcher configured");

    DispatchResult r;
    try {
        r = d->search_tools(*st->cancel, query, detail);
    } catch (const std::exception& e) {
        return qjs::throw_error(ctx, std::string("tool search failed: ") + e.what());
    }
    if (!r.ok) return qjs::throw_error(ctx, r.error);
    return parse_payload(ctx, r.data_json);
}

// __fetch(url, method, body, [name, value, ...])
JSValue js_fetch(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    BridgeState* st = state_of(ctx);
    std::string url;
    if (!arg_string(ctx, argc, argv, 0, &url)) return JS_EXCEPTION;
    if (!st->bindings || !fetch_url_allowed(st->bindings->fetch_prefixes, url)) {
        return qjs::throw_error(ctx, "fetch restricted to localhost, got: " + url);
    }

    HttpRequest req;
    req.url = url;
    req.method = "GET";
    if (argc > 1) {
        if (!arg_string(ctx, argc, argv, 1, &req.method)) return JS_EXCEPTION;
        req.method = upper_ascii(req.method);
    }
    if (argc > 2 && !arg_string(ctx, argc, argv, 2, &req.body)) return JS_EXCEPTION;
    req.timeout_ms = st->bindings->fetch_timeout_ms;

    if (argc > 3 && JS_IsObject(argv[3])) {
        JSValue len_v = JS_GetPropertyStr(ctx, argv[3], "length");
        uint32_t n = 0;
        int rc = JS_ToUint32(ctx, &n, len_v);
        JS_FreeValue(ctx, len_v);
        if (rc < 0) return JS_EXCEPTION;
        for (uint32_t i = 0; i + 1 < n; i += 2) {
            JSValue k = JS_GetPropertyUint32(ctx, argv[3], i);
            JSValue v = JS_GetPropertyUint32(ctx, argv[3], i + 1);
            std::string name, value;
            bool ok = qjs::to_std_string_checked(ctx, k, &name) && qjs::to_std_string_checked(ctx, v, &value);
            JS_FreeValue(ctx, k);
            JS_FreeValue(ctx, v);
            if (!ok) return JS_EXCEPTION;
            req.headers.emplace_back(name, value);
        }
    }

    HttpResponse resp;
    if (!http_request(req, st->cancel, &resp)) {
        return qjs::throw_error(ctx, "fetch failed: " + resp.error);
    }

    JSValue obj = JS_NewObject(ctx);
    if (JS_IsException(obj)) return obj;
    JS_SetPropertyStr(ctx, obj, "status", JS_NewInt32(ctx, resp.status));
    std::string status_text = http_status_text(resp.status);
    JS_SetPropertyStr(ctx, obj, "statusText", JS_NewStringLen(ctx, status_text.data(), status_text.size()));
    JS_SetPropertyStr(ctx, obj, "body", JS_NewStringLen(ctx, resp.body.data(), resp.body.size()));
    return obj;
}

void set_global_fn(JSContext* ctx, JSValueConst global, const char* name, JSCFunction* fn, int length) {
    JSValue f = JS_NewCFunction(ctx, fn, name, length);
    if (JS_IsException(f) || JS_SetPropertyStr(ctx, global, name, f) < 0) {
        throw ExecError(std::string("bridge install failed: ") + name + ": " + qjs::take_exception(ctx));
    }
}

} // namespace

// "scheme://host" of an absolute http(s) URL. Fails on userinfo, a
// malformed port, or anything curl would treat specially.
static bool url_origin(const std::string& url, std::string* origin) {
    for (char c : url) {
        unsigned char u = (unsigned char)c;
        if (u <= 0x20 || u == 0x7f || c == '\\' || c == '{' || c == '}' || c == '[' || c == ']') return false;
    }
    size_t sep = url.find("://");
    if (sep == std::string::npos) return false;
    std::string scheme = url.substr(0, sep);
    if (scheme != "http" && scheme != "https") return false;

    size_t start = sep + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (authority.find('@') != std::string::npos) return false;

    std::string host = authority;
    size_t colon = authority.find(':');
    if (colon != std::string::npos) {
        host = authority.substr(0, colon);
        std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5) return false;
        for (char c : port) if (c < '0' || c > '9') return false;
    }
    if (host.empty()) return false;
    *origin = scheme + "://" + host;
    return true;
}

bool fetch_url_allowed(const std::vector<std::string>& prefixes, const std::string& url) {
    std::string origin;
    if (!url_origin(url, &origin)) return false;
    for (const auto& p : prefixes) {
        if (origin == p) return true;
    }
    return false;
}

void install_bridge(JSContext* ctx, BridgeState* state) {
    if (!ctx || !state || !state->cancel) throw ExecError("bridge install failed: missing state");
    JS_SetContextOpaque(ctx, state);

    JSValue global = JS_GetGlobalObject(ctx);
    try {
        set_global_fn(ctx, global, "__consoleWrite", js_console_write, 2);
        set_global_fn(ctx, global, "__callTool", js_call_tool, 2);
        set_global_fn(ctx, global, "__searchTools", js_search_tools, 2);
        set_global_fn(ctx, global, "__fetch", js_fetch, 4);

        JSValue arr = JS_NewArray(ctx);
        if (JS_IsException(arr)) throw ExecError("bridge install failed: __interfaces");
        for (uint32_t i = 0; i < state->interfaces.size(); i++) {
            const std::string& s = state->interfaces[i];
            if (JS_SetPropertyUint32(ctx, arr, i, JS_NewStringLen(ctx, s.data(), s.size())) < 0) {
                JS_FreeValue(ctx, arr);
                throw ExecError("bridge install failed: __interfaces: " + qjs::take_exception(ctx));
            }
        }
        // non-writable, non-configurable; the prelude freezes the array itself
        if (JS_DefinePropertyValueStr(ctx, global, "__interfaces", arr, JS_PROP_ENUMERABLE) < 0) {
            throw ExecError("bridge install failed: __interfaces: " + qjs::take_exception(ctx));
        }
    } catch (...) {
        JS_FreeValue(ctx, global);
        throw;
    }
    JS_FreeValue(ctx, global);

    std::string prelude = kPrelude;
    JSValue r = JS_Eval(ctx, prelude.c_str(), prelude.size(), "<bridge>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(r)) {
        throw ExecError("bridge install failed: " + qjs::take_exception(ctx));
    }
    JS_FreeValue(ctx, r);
}

} // namespace skyline
