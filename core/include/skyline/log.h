#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace skyline {

// Canonical JSON: parse then re-serialize with sorted object keys.
// Returns input unchanged if parsing fails (best-effort).
std::string canonicalize_json(const std::string& raw);

// Append-only JSONL audit log of executions. One canonical JSON object per
// line: {"event","exec_id","payload","ts"}. Safe to share between threads.
class ExecutionLog {
public:
    explicit ExecutionLog(const std::string& path);

    bool ok() const { return out_.is_open(); }
    void event(const std::string& exec_id, const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mu_;
    std::ofstream out_;
};

} // namespace skyline
