#pragma once

// json_mini.h
//
// Small JSON helpers over json-c for the host side of the engine
// (wire envelopes, dispatch responses, configuration files). Values that
// cross into the VM are converted by QuickJS itself.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace skyline::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: the whole input must be one JSON value. On failure the
// returned Doc is empty and *err (if given) holds the tokener message.
// Note: a literal `null` parses to an empty Doc with no error.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "out of memory";
        return Doc{};
    }
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(),
        static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(json_tokener_get_parse_end(tok));
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) *err = json_tokener_error_desc(jerr);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') continue;
        if (obj) json_object_put(obj);
        if (err) *err = "trailing data after JSON value";
        return Doc{};
    }
    return Doc{obj};
}

inline bool is_object(const Doc& d) {
    return d && json_object_is_type(d.root, json_type_object);
}

inline bool is_array(const Doc& d) {
    return d && json_object_is_type(d.root, json_type_array);
}

inline std::string to_string(json_object* v) {
    if (!v) return "null";
    return json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
}

inline std::optional<std::string> get_string(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

inline std::optional<int64_t> get_int(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

// Serialized form of o[key], or nullopt when the key is absent. A present
// key holding JSON null yields "null".
inline std::optional<std::string> get_raw(json_object* o, const char* key) {
    if (!o || !json_object_is_type(o, json_type_object)) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v)) return std::nullopt;
    return to_string(v);
}

inline std::vector<std::string> get_array_strings(json_object* o, const char* key) {
    std::vector<std::string> out;
    if (!o || !json_object_is_type(o, json_type_object)) return out;
    json_object* arr = nullptr;
    if (!json_object_object_get_ex(o, key, &arr)) return out;
    if (!json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

// Escape a string for embedding inside a JSON string literal (no surrounding quotes).
inline std::string json_escape(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '\\': oss << "\\\\"; break;
            case '"':  oss << "\\\""; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)(unsigned char)c);
                    oss << buf;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace skyline::json_mini
