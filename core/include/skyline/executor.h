#pragma once

#include "skyline/bridge.h"
#include "skyline/cancel.h"
#include "skyline/types.h"
#include "skyline/vm.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace skyline {

class ExecutionLog;
class ToolDispatcher;

struct ExecutorOptions {
    std::string workspace_dir;
    std::vector<std::string> interfaces;
    VmLimits vm_limits;
    int fetch_timeout_ms{30000};
};

// Transient entry script inside the workspace. The file is created with a
// random name (exclusive create) and removed by remove() or, failing that,
// the destructor.
class EntryFile {
public:
    // Throws ExecError when the file cannot be created or written.
    EntryFile(const std::string& workspace_dir, const std::string& contents);
    ~EntryFile();

    EntryFile(const EntryFile&) = delete;
    EntryFile& operator=(const EntryFile&) = delete;

    // Workspace-relative file name.
    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }

    // Returns error string (empty = ok). Idempotent.
    std::string remove();

private:
    std::string name_;
    std::string path_;
    bool removed_{false};
};

// Map a VM outcome plus the bridge's buffers to the final result.
ExecutionResult collect_result(const VmOutcome& outcome, BridgeState&& state,
                               double execution_time_seconds, int timeout_seconds);

class Executor {
public:
    Executor(ExecutorOptions opts, std::shared_ptr<ToolDispatcher> dispatcher);

    // Replace the service namespaces exposed as __interfaces. Runs already
    // in flight keep the list they started with.
    void set_interfaces(std::vector<std::string> interfaces);
    std::vector<std::string> interfaces() const;

    void set_log(std::shared_ptr<ExecutionLog> log) { log_ = std::move(log); }

    // Synchronous and reentrant. Script failures are reported in the result;
    // throws ExecError only when the run could not be attempted.
    ExecutionResult execute(const CancelToken& cancel, const ExecutionRequest& req) const;

    const ExecutorOptions& options() const { return opts_; }

private:
    ExecutionResult run_vm(const CancelToken& cancel, const Bundle& bundle, int timeout_seconds) const;

    ExecutorOptions opts_;
    std::shared_ptr<ToolDispatcher> dispatcher_;
    BridgeBindings bindings_;
    std::shared_ptr<ExecutionLog> log_;

    mutable std::mutex mu_;
    std::vector<std::string> interfaces_;
};

} // namespace skyline
