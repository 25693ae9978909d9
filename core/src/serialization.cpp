#include "skyline/serialization.h"
#include "skyline/json_mini.h"

#include <cmath>

namespace skyline {

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(o);
    return out;
}

static json_object* new_string(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

json_object* execution_result_to_json_obj(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "stdout", new_string(r.stdout_text));
    json_object_object_add(o, "stderr", new_string(r.stderr_text));
    json_object_object_add(o, "exitCode", json_object_new_int(r.exit_code));
    json_object_object_add(o, "executionTime", json_object_new_double(r.execution_time_seconds));
    json_object* tools = json_object_new_array();
    for (const auto& t : r.tools_called) json_object_array_add(tools, new_string(t));
    json_object_object_add(o, "toolsCalled", tools);
    if (!r.error.empty()) json_object_object_add(o, "error", new_string(r.error));
    return o;
}

std::string execution_result_to_json(const ExecutionResult& r) {
    json_object* o = execution_result_to_json_obj(r);
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

bool execution_request_from_json(json_object* o, ExecutionRequest* out, std::string* err) {
    if (!out) return false;
    if (!o || !json_object_is_type(o, json_type_object)) {
        if (err) *err = "request must be a JSON object";
        return false;
    }
    ExecutionRequest r;

    auto code = json_mini::get_string(o, "code");
    if (!code) {
        if (err) *err = "missing or non-string field: code";
        return false;
    }
    r.code = *code;

    json_object* v = nullptr;
    if (json_object_object_get_ex(o, "language", &v) && v) {
        if (!json_object_is_type(v, json_type_string)) {
            if (err) *err = "language must be a string";
            return false;
        }
        r.language = json_object_get_string(v);
    }

    if (json_object_object_get_ex(o, "timeout", &v) && v) {
        if (json_object_is_type(v, json_type_int)) {
            int64_t t = json_object_get_int64(v);
            r.timeout_seconds = t > 86400 ? 86400 : (t < 0 ? 0 : (int)t);
        } else if (json_object_is_type(v, json_type_double)) {
            double d = json_object_get_double(v);
            if (!std::isfinite(d)) {
                if (err) *err = "timeout must be a number";
                return false;
            }
            r.timeout_seconds = d > 86400.0 ? 86400 : (d < 0.0 ? 0 : (int)d);
        } else {
            if (err) *err = "timeout must be a number";
            return false;
        }
    }

    *out = std::move(r);
    return true;
}

bool execution_request_from_json(const std::string& json, ExecutionRequest* out, std::string* err) {
    std::string perr;
    auto doc = json_mini::parse(json, &perr);
    if (!doc) {
        if (err) *err = perr.empty() ? "empty request" : "invalid JSON: " + perr;
        return false;
    }
    return execution_request_from_json(doc.root, out, err);
}

std::string execution_request_to_json(const ExecutionRequest& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "code", new_string(r.code));
    if (!r.language.empty()) json_object_object_add(o, "language", new_string(r.language));
    if (r.timeout_seconds > 0) json_object_object_add(o, "timeout", json_object_new_int(r.timeout_seconds));
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

bool service_files_from_json(const std::string& json, ServiceFiles* out, std::string* err) {
    if (!out) return false;
    std::string perr;
    auto doc = json_mini::parse(json, &perr);
    if (!json_mini::is_object(doc)) {
        if (err) *err = perr.empty() ? "services must be a JSON object" : "invalid JSON: " + perr;
        return false;
    }
    ServiceFiles files;
    json_object_object_foreach(doc.root, svc, files_obj) {
        if (!files_obj || !json_object_is_type(files_obj, json_type_object)) {
            if (err) *err = std::string("service entry must be an object: ") + svc;
            return false;
        }
        auto& dst = files[svc];
        json_object_object_foreach(files_obj, fname, src) {
            if (!src || !json_object_is_type(src, json_type_string)) {
                if (err) *err = std::string("file content must be a string: ") + svc + "/" + fname;
                return false;
            }
            dst[fname] = std::string(json_object_get_string(src), (size_t)json_object_get_string_len(src));
        }
    }
    *out = std::move(files);
    return true;
}

} // namespace skyline
