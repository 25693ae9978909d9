#include "skyline/executor.h"
#include "skyline/bundler.h"
#include "skyline/dispatch.h"
#include "skyline/log.h"
#include "skyline/serialization.h"
#include "skyline/timeout.h"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <new>
#include <filesystem>
#include <random>
#include <sstream>
#include <iomanip>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace skyline {

static std::string random_hex(size_t words) {
    thread_local std::mt19937_64 rng([] {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::random_device rd;
        uint64_t r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
        return t ^ r;
    }());
    std::ostringstream oss;
    for (size_t i = 0; i < words; i++) {
        oss << std::hex << std::setw(16) << std::setfill('0') << rng();
    }
    return oss.str();
}

// ---- EntryFile ----

EntryFile::EntryFile(const std::string& workspace_dir, const std::string& contents) {
    for (int attempt = 0; attempt < 16; attempt++) {
        std::string name = "__entry_" + random_hex(2) + ".js";
        std::string path = (fs::path(workspace_dir) / name).string();
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0) {
            if (errno == EEXIST) continue;
            throw ExecError("create entry file " + path + ": " + std::strerror(errno));
        }

        size_t off = 0;
        while (off < contents.size()) {
            ssize_t n = ::write(fd, contents.data() + off, contents.size() - off);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) {
                std::string why = std::strerror(errno);
                ::close(fd);
                (void)::unlink(path.c_str());
                throw ExecError("write entry file " + path + ": " + why);
            }
            off += (size_t)n;
        }
        if (::close(fd) != 0) {
            std::string why = std::strerror(errno);
            (void)::unlink(path.c_str());
            throw ExecError("close entry file " + path + ": " + why);
        }
        name_ = std::move(name);
        path_ = std::move(path);
        return;
    }
    throw ExecError("create entry file: no free name in " + workspace_dir);
}

EntryFile::~EntryFile() {
    if (!removed_ && !path_.empty()) (void)::unlink(path_.c_str());
}

std::string EntryFile::remove() {
    if (removed_) return "";
    removed_ = true;
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        return "remove entry file " + path_ + ": " + std::strerror(errno);
    }
    return "";
}

// ---- Result collection ----

ExecutionResult collect_result(const VmOutcome& outcome, BridgeState&& state,
                               double execution_time_seconds, int timeout_seconds) {
    ExecutionResult r;
    r.stdout_text = std::move(state.stdout_text);
    r.stderr_text = std::move(state.stderr_text);
    r.tools_called = std::move(state.tools_called);
    r.execution_time_seconds = execution_time_seconds;

    switch (outcome.state) {
        case VmState::Completed:
            r.exit_code = kExitOk;
            break;
        case VmState::Interrupted:
            if (outcome.message == kTimeoutSentinel) {
                r.exit_code = kExitTimeout;
                r.error = "execution timeout after " + std::to_string(timeout_seconds) + "s";
            } else {
                r.exit_code = kExitError;
                r.error = outcome.message.empty() ? kCancelledReason : outcome.message;
            }
            break;
        case VmState::Raised:
            r.exit_code = kExitError;
            r.error = outcome.message.empty() ? "script raised an error" : outcome.message;
            break;
    }
    return r;
}

// ---- Executor ----

Executor::Executor(ExecutorOptions opts, std::shared_ptr<ToolDispatcher> dispatcher)
    : opts_(std::move(opts)), dispatcher_(std::move(dispatcher)) {
    bindings_.dispatcher = dispatcher_.get();
    bindings_.fetch_timeout_ms = opts_.fetch_timeout_ms;
    interfaces_ = opts_.interfaces;
}

void Executor::set_interfaces(std::vector<std::string> interfaces) {
    std::lock_guard<std::mutex> lk(mu_);
    interfaces_ = std::move(interfaces);
}

std::vector<std::string> Executor::interfaces() const {
    std::lock_guard<std::mutex> lk(mu_);
    return interfaces_;
}

ExecutionResult Executor::run_vm(const CancelToken& cancel, const Bundle& bundle, int timeout_seconds) const {
    CancelToken run_cancel(&cancel);

    BridgeState state;
    state.bindings = &bindings_;
    state.cancel = &run_cancel;
    state.interfaces = interfaces();

    auto start = std::chrono::steady_clock::now();
    VmOutcome outcome;
    try {
        IsolatedVm vm(opts_.vm_limits, &cancel);
        install_bridge(vm.context(), &state);

        TimeoutSupervisor supervisor(std::chrono::seconds(timeout_seconds), [&vm, &run_cancel] {
            vm.interrupt(kTimeoutSentinel);
            run_cancel.cancel();
        });
        outcome = vm.run(bundle);
        supervisor.stop();
    } catch (const std::system_error& e) {
        // thread or mutex creation for the supervisor
        throw ExecError(std::string("vm setup: ") + e.what());
    } catch (const std::bad_alloc&) {
        throw ExecError("vm setup: out of memory");
    }
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    return collect_result(outcome, std::move(state), secs, timeout_seconds);
}

ExecutionResult Executor::execute(const CancelToken& cancel, const ExecutionRequest& req) const {
    const int timeout = req.timeout_seconds > 0 ? req.timeout_seconds : kDefaultTimeoutSeconds;
    const std::string exec_id = random_hex(1);

    if (log_) {
        log_->event(exec_id, "execute.start",
                    "{\"language\":" + json_quote(req.language) +
                    ",\"timeout\":" + std::to_string(timeout) +
                    ",\"code_bytes\":" + std::to_string(req.code.size()) + "}");
    }
    auto done = [&](ExecutionResult r) {
        if (log_) {
            std::string tools = "[";
            for (size_t i = 0; i < r.tools_called.size(); i++) {
                if (i) tools += ",";
                tools += json_quote(r.tools_called[i]);
            }
            tools += "]";
            log_->event(exec_id, "execute.done",
                        "{\"exitCode\":" + std::to_string(r.exit_code) +
                        ",\"executionTime\":" + std::to_string(r.execution_time_seconds) +
                        ",\"toolsCalled\":" + tools +
                        ",\"error\":" + json_quote(r.error) + "}");
        }
        return r;
    };

    if (!req.language.empty() && req.language != kLanguageJavaScript) {
        ExecutionResult r;
        r.exit_code = kExitError;
        r.error = "unsupported language: " + req.language;
        return done(std::move(r));
    }

    std::error_code ec;
    fs::create_directories(opts_.workspace_dir, ec);
    if (ec) throw ExecError("workspace " + opts_.workspace_dir + ": " + ec.message());

    Bundle bundle;
    std::string bundle_err;
    bool bundled = false;
    {
        EntryFile entry(opts_.workspace_dir, wrap_script(req.code));
        Bundler bundler(opts_.workspace_dir);
        bundled = bundler.bundle(entry.name(), find_dynamic_imports(req.code), &bundle, &bundle_err);
        std::string rm_err = entry.remove();
        if (!rm_err.empty()) throw ExecError(rm_err);
    }
    if (!bundled) {
        ExecutionResult r;
        r.exit_code = kExitError;
        r.error = "transpile error: " + bundle_err;
        return done(std::move(r));
    }

    return done(run_vm(cancel, bundle, timeout));
}

} // namespace skyline
