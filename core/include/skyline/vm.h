#pragma once

#include "skyline/bundler.h"

#include <quickjs.h>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

namespace skyline {

class CancelToken;

enum class VmState {
    Completed,   // ran to the end without raising
    Raised,      // uncaught error reached the top
    Interrupted, // forced stop; message is the interrupt reason
};

struct VmOutcome {
    VmState state{VmState::Completed};
    std::string message;
};

struct VmLimits {
    size_t memory_limit_bytes{256u * 1024u * 1024u};
    size_t max_stack_bytes{1024u * 1024u};
};

// One QuickJS runtime + context, used for exactly one run and then
// discarded. Modules load only from the bundle handed to run().
//
// Thread-safety: run() and the context belong to the creating thread;
// interrupt() may be called from any thread.
class IsolatedVm {
public:
    // caller_cancel (optional) is polled by the interrupt handler; when it
    // fires the VM stops with kCancelledReason. Throws ExecError when the
    // runtime cannot be allocated.
    IsolatedVm(const VmLimits& limits, const CancelToken* caller_cancel);
    ~IsolatedVm();

    IsolatedVm(const IsolatedVm&) = delete;
    IsolatedVm& operator=(const IsolatedVm&) = delete;

    JSContext* context() const { return ctx_; }

    // Request a stop at the next interrupt checkpoint. The first reason wins.
    void interrupt(const std::string& reason);
    bool interrupted() const { return interrupt_requested_.load(std::memory_order_acquire); }

    // Evaluate the bundle's entry module and drain the job queue.
    VmOutcome run(const Bundle& bundle);

private:
    static int interrupt_handler(JSRuntime* rt, void* opaque);
    static char* normalize_module(JSContext* ctx, const char* base, const char* spec, void* opaque);
    static JSModuleDef* load_module(JSContext* ctx, const char* name, void* opaque);

    std::string interrupt_reason() const;

    JSRuntime* rt_{nullptr};
    JSContext* ctx_{nullptr};
    const CancelToken* caller_cancel_{nullptr};

    std::atomic<bool> interrupt_requested_{false};
    mutable std::mutex reason_mu_;
    std::string reason_;

    const Bundle* bundle_{nullptr};
};

} // namespace skyline
