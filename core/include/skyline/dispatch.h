#pragma once

#include <functional>
#include <string>
#include <utility>

namespace skyline {

class CancelToken;

inline constexpr const char* kDefaultCallToolEndpoint = "http://localhost:8191/internal/call-tool";
inline constexpr const char* kDefaultSearchDetail = "name-and-description";

// Outcome of one dispatch. On success data_json holds the JSON-encoded
// result value; otherwise error holds the failure message.
struct DispatchResult {
    bool ok{false};
    std::string data_json;
    std::string error;

    static DispatchResult success(std::string json) {
        DispatchResult r;
        r.ok = true;
        r.data_json = std::move(json);
        return r;
    }
    static DispatchResult failure(std::string msg) {
        DispatchResult r;
        r.error = std::move(msg);
        return r;
    }
};

// Target that actually performs tool calls and catalog searches on behalf
// of a script. Implementations must be safe to call from several
// executions at once.
class ToolDispatcher {
public:
    virtual ~ToolDispatcher() = default;

    // args_json is always a JSON object.
    virtual DispatchResult call_tool(const CancelToken& cancel,
                                     const std::string& tool,
                                     const std::string& args_json) = 0;

    // On success data_json is a JSON array of matches.
    virtual DispatchResult search_tools(const CancelToken& cancel,
                                        const std::string& query,
                                        const std::string& detail) = 0;
};

// In-process dispatch through host callbacks.
class DirectDispatcher : public ToolDispatcher {
public:
    using CallFn = std::function<DispatchResult(const CancelToken&, const std::string& tool, const std::string& args_json)>;
    using SearchFn = std::function<DispatchResult(const CancelToken&, const std::string& query, const std::string& detail)>;

    explicit DirectDispatcher(CallFn call, SearchFn search = nullptr);

    DispatchResult call_tool(const CancelToken& cancel, const std::string& tool,
                             const std::string& args_json) override;
    DispatchResult search_tools(const CancelToken& cancel, const std::string& query,
                                const std::string& detail) override;

private:
    CallFn call_;
    SearchFn search_;
};

// Dispatch by POSTing JSON to two fixed internal endpoints.
class HttpDispatcher : public ToolDispatcher {
public:
    HttpDispatcher(std::string call_endpoint, std::string search_endpoint, int timeout_ms);

    DispatchResult call_tool(const CancelToken& cancel, const std::string& tool,
                             const std::string& args_json) override;
    DispatchResult search_tools(const CancelToken& cancel, const std::string& query,
                                const std::string& detail) override;

    const std::string& call_endpoint() const { return call_endpoint_; }
    const std::string& search_endpoint() const { return search_endpoint_; }

private:
    std::string call_endpoint_;
    std::string search_endpoint_;
    int timeout_ms_;
};

// ".../internal/call-tool" -> ".../internal/search-tools". Endpoints that do
// not contain the call-tool path are returned unchanged.
std::string derive_search_endpoint(const std::string& call_endpoint);

} // namespace skyline
