#include "skyline/dispatch.h"
#include "skyline/http_client.h"
#include "skyline/json_mini.h"

#include <utility>

namespace skyline {

DirectDispatcher::DirectDispatcher(CallFn call, SearchFn search)
    : call_(std::move(call)), search_(std::move(search)) {}

DispatchResult DirectDispatcher::call_tool(const CancelToken& cancel, const std::string& tool,
                                           const std::string& args_json) {
    if (!call_) return DispatchResult::failure("no tool dispatcher configured");
    return call_(cancel, tool, args_json);
}

DispatchResult DirectDispatcher::search_tools(const CancelToken& cancel, const std::string& query,
                                              const std::string& detail) {
    if (!search_) return DispatchResult::failure("tool search not configured");
    return search_(cancel, query, detail);
}

HttpDispatcher::HttpDispatcher(std::string call_endpoint, std::string search_endpoint, int timeout_ms)
    : call_endpoint_(std::move(call_endpoint)),
      search_endpoint_(std::move(search_endpoint)),
      timeout_ms_(timeout_ms) {
    if (call_endpoint_.empty()) call_endpoint_ = kDefaultCallToolEndpoint;
    if (search_endpoint_.empty()) search_endpoint_ = derive_search_endpoint(call_endpoint_);
}

static bool post_json(const std::string& url, const std::string& body, int timeout_ms,
                      const CancelToken& cancel, HttpResponse* resp) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = body;
    req.timeout_ms = timeout_ms;
    return http_request(req, &cancel, resp);
}

DispatchResult HttpDispatcher::call_tool(const CancelToken& cancel, const std::string& tool,
                                         const std::string& args_json) {
    std::string body = "{\"toolName\":\"" + json_mini::json_escape(tool) + "\",\"args\":" +
                       (args_json.empty() ? std::string("{}") : args_json) + "}";

    HttpResponse resp;
    if (!post_json(call_endpoint_, body, timeout_ms_, cancel, &resp)) {
        return DispatchResult::failure("call tool: " + resp.error);
    }

    std::string perr;
    auto doc = json_mini::parse(resp.body, &perr);
    if (!json_mini::is_object(doc)) {
        if (perr.empty()) perr = "expected JSON object (HTTP " + std::to_string(resp.status) + ")";
        return DispatchResult::failure("parse response: " + perr);
    }
    auto err = json_mini::get_string(doc.root, "error");
    if (err && !err->empty()) {
        return DispatchResult::failure("tool error: " + *err);
    }
    return DispatchResult::success(json_mini::get_raw(doc.root, "data").value_or("null"));
}

DispatchResult HttpDispatcher::search_tools(const CancelToken& cancel, const std::string& query,
                                            const std::string& detail) {
    std::string body = "{\"query\":\"" + json_mini::json_escape(query) + "\",\"detail\":\"" +
                       json_mini::json_escape(detail) + "\"}";

    HttpResponse resp;
    if (!post_json(search_endpoint_, body, timeout_ms_, cancel, &resp)) {
        return DispatchResult::failure("search tools: " + resp.error);
    }
    if (resp.status >= 400) {
        return DispatchResult::failure("search tools: HTTP " + std::to_string(resp.status));
    }

    std::string perr;
    auto doc = json_mini::parse(resp.body, &perr);
    if (!json_mini::is_array(doc)) {
        if (perr.empty()) perr = "expected JSON array";
        return DispatchResult::failure("parse response: " + perr);
    }
    return DispatchResult::success(json_mini::to_string(doc.root));
}

std::string derive_search_endpoint(const std::string& call_endpoint) {
    static const std::string kCall = "/internal/call-tool";
    static const std::string kSearch = "/internal/search-tools";
    std::string out = call_endpoint;
    auto p = out.find(kCall);
    if (p != std::string::npos) out.replace(p, kCall.size(), kSearch);
    return out;
}

} // namespace skyline
