#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace skyline {

// The one scripting language the engine accepts. An empty language string
// selects it as well.
inline constexpr const char* kLanguageJavaScript = "javascript";

inline constexpr int kDefaultTimeoutSeconds = 30;

// Exit codes reported in ExecutionResult
inline constexpr int kExitOk = 0;
inline constexpr int kExitError = 1;
inline constexpr int kExitTimeout = 124;

// Reason attached to a VM interrupt raised by the timeout supervisor.
inline constexpr const char* kTimeoutSentinel = "execution timeout";
inline constexpr const char* kCancelledReason = "execution cancelled";

struct ExecutionRequest {
    std::string code;
    std::string language;    // "javascript" or ""
    int timeout_seconds{0};  // <= 0 selects kDefaultTimeoutSeconds
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code{kExitOk};
    double execution_time_seconds{0.0}; // VM phase only
    std::vector<std::string> tools_called;
    std::string error;
};

// Engine-infrastructure failure: the run could not even be attempted
// (workspace not writable, VM allocation failed, ...). Script failures are
// never reported this way.
class ExecError : public std::runtime_error {
public:
    explicit ExecError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace skyline
