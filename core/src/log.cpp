#include "skyline/log.h"
#include "skyline/json_mini.h"

#include <json-c/json.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <map>

namespace skyline {

// 2026-01-31T12:00:00.123Z
static std::string utc_timestamp_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t secs = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    int ms = (int)(duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buf;
}

// Compact JSON with object keys in byte order at every depth. Scalars use
// json-c's own encoding.
static void append_canonical(json_object* v, std::string& out) {
    if (json_object_is_type(v, json_type_object)) {
        std::map<std::string, json_object*> sorted;
        json_object_object_foreach(v, key, val) sorted.emplace(key, val);
        out += '{';
        bool first = true;
        for (const auto& kv : sorted) {
            if (!first) out += ',';
            first = false;
            out += '"';
            out += json_mini::json_escape(kv.first);
            out += "\":";
            append_canonical(kv.second, out);
        }
        out += '}';
    } else if (json_object_is_type(v, json_type_array)) {
        out += '[';
        const size_t n = json_object_array_length(v);
        for (size_t i = 0; i < n; i++) {
            if (i) out += ',';
            append_canonical(json_object_array_get_idx(v, i), out);
        }
        out += ']';
    } else {
        out += json_mini::to_string(v);
    }
}

std::string canonicalize_json(const std::string& raw) {
    std::string err;
    json_mini::Doc doc = json_mini::parse(raw, &err);
    if (!doc) return err.empty() ? std::string("null") : raw;
    std::string out;
    append_canonical(doc.root, out);
    return out;
}

ExecutionLog::ExecutionLog(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {}

void ExecutionLog::event(const std::string& exec_id, const std::string& name, const std::string& payload_json) {
    json_mini::Doc line(json_object_new_object());
    json_object_object_add(line.root, "event", json_object_new_string(name.c_str()));
    json_object_object_add(line.root, "exec_id", json_object_new_string(exec_id.c_str()));

    // a payload that is not JSON is kept as a string
    std::string perr;
    json_mini::Doc payload = json_mini::parse(payload_json, &perr);
    json_object* p = perr.empty() ? payload.root : json_object_new_string(payload_json.c_str());
    payload.root = nullptr;
    json_object_object_add(line.root, "payload", p);
    json_object_object_add(line.root, "ts", json_object_new_string(utc_timestamp_ms().c_str()));

    std::string text;
    append_canonical(line.root, text);
    text += '\n';

    std::lock_guard<std::mutex> lk(mu_);
    if (!out_.is_open()) return;
    out_ << text;
    out_.flush();
}

} // namespace skyline
