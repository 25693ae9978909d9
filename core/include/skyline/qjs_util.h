#pragma once

// Small helpers shared by the bundler, the VM and the bridge for moving
// values and errors across the QuickJS boundary.

#include <quickjs.h>

#include <string>

namespace skyline::qjs {

// String(v). Never leaves an exception pending.
inline std::string to_std_string(JSContext* ctx, JSValueConst v) {
    size_t len = 0;
    const char* s = JS_ToCStringLen(ctx, &len, v);
    if (!s) {
        JSValue ex = JS_GetException(ctx);
        JS_FreeValue(ctx, ex);
        return "[unprintable value]";
    }
    std::string out(s, len);
    JS_FreeCString(ctx, s);
    return out;
}

// String(v) into *out. On failure returns false and leaves the exception
// pending, so a native can return JS_EXCEPTION.
inline bool to_std_string_checked(JSContext* ctx, JSValueConst v, std::string* out) {
    size_t len = 0;
    const char* s = JS_ToCStringLen(ctx, &len, v);
    if (!s) return false;
    out->assign(s, len);
    JS_FreeCString(ctx, s);
    return true;
}

// First "at ..." frame of an error's stack, trimmed, or "".
inline std::string first_frame(JSContext* ctx, JSValueConst ex) {
    if (!JS_IsObject(ex)) return "";
    JSValue stack = JS_GetPropertyStr(ctx, ex, "stack");
    std::string out;
    if (JS_IsString(stack)) {
        std::string s = to_std_string(ctx, stack);
        size_t i = 0;
        while (i < s.size()) {
            size_t nl = s.find('\n', i);
            std::string line = s.substr(i, nl == std::string::npos ? std::string::npos : nl - i);
            size_t b = line.find_first_not_of(" \t");
            if (b != std::string::npos) {
                out = line.substr(b);
                break;
            }
            if (nl == std::string::npos) break;
            i = nl + 1;
        }
    } else if (JS_IsException(stack)) {
        JSValue e2 = JS_GetException(ctx);
        JS_FreeValue(ctx, e2);
    }
    JS_FreeValue(ctx, stack);
    return out;
}

// Takes the pending exception and renders it as String(e), optionally
// followed by its innermost stack frame.
inline std::string take_exception(JSContext* ctx, bool with_location = false) {
    JSValue ex = JS_GetException(ctx);
    std::string msg = to_std_string(ctx, ex);
    if (with_location) {
        std::string at = first_frame(ctx, ex);
        if (!at.empty()) msg += " (" + at + ")";
    }
    JS_FreeValue(ctx, ex);
    return msg;
}

// Throws a plain Error carrying msg. Always returns JS_EXCEPTION.
inline JSValue throw_error(JSContext* ctx, const std::string& msg) {
    JSValue err = JS_NewError(ctx);
    if (JS_IsException(err)) return err;
    JS_DefinePropertyValueStr(ctx, err, "message",
                              JS_NewStringLen(ctx, msg.data(), msg.size()),
                              JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE);
    return JS_Throw(ctx, err);
}

} // namespace skyline::qjs
