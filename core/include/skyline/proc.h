#pragma once

#include <string>
#include <vector>

namespace skyline {

class CancelToken;

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{4 * 1024 * 1024};
    size_t stderr_max_bytes{64 * 1024};

    int rlimit_cpu_sec{30};         // CPU time seconds
    size_t rlimit_as_mb{1024};      // virtual memory MB
    size_t rlimit_fsize_mb{1};      // max file size MB
    int rlimit_nofile{64};          // max open fds

    bool no_new_privs{true};

    // Polled while the child runs; when it reports cancelled the process
    // group is killed and ProcResult::cancelled is set.
    const CancelToken* cancel{nullptr};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string out;    // child stdout
    std::string err;    // child stderr
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is resolved via PATH), feed stdin_data on its
// stdin, capture stdout and stderr separately, enforce timeout, rlimits and
// cancellation (POSIX best-effort). Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::string& stdin_data,
                      const ProcLimits& lim,
                      ProcResult* res);

} // namespace skyline
