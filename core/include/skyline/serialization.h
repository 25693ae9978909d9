#pragma once

#include "skyline/types.h"
#include "skyline/workspace.h"

#include <json-c/json.h>

#include <string>

namespace skyline {

std::string json_quote(const std::string& s);

// --- ExecutionResult ---
// {"stdout","stderr","exitCode","executionTime","toolsCalled","error"?}
// error is omitted when empty; toolsCalled is always an array.

json_object* execution_result_to_json_obj(const ExecutionResult& r);
std::string execution_result_to_json(const ExecutionResult& r);

// --- ExecutionRequest ---
// {"code": string (required), "language"?: string, "timeout"?: integer seconds}

bool execution_request_from_json(json_object* o, ExecutionRequest* out, std::string* err);
bool execution_request_from_json(const std::string& json, ExecutionRequest* out, std::string* err);
std::string execution_request_to_json(const ExecutionRequest& r);

// --- Workspace service map ---
// {"<service>": {"<file>": "<source>", ...}, ...}

bool service_files_from_json(const std::string& json, ServiceFiles* out, std::string* err);

} // namespace skyline
