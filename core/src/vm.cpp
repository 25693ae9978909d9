#include "skyline/vm.h"
#include "skyline/cancel.h"
#include "skyline/qjs_util.h"
#include "skyline/types.h"

namespace skyline {

IsolatedVm::IsolatedVm(const VmLimits& limits, const CancelToken* caller_cancel)
    : caller_cancel_(caller_cancel) {
    rt_ = JS_NewRuntime();
    if (!rt_) throw ExecError("cannot allocate VM runtime");
    JS_SetRuntimeOpaque(rt_, this);
    if (limits.memory_limit_bytes > 0) JS_SetMemoryLimit(rt_, limits.memory_limit_bytes);
    if (limits.max_stack_bytes > 0) JS_SetMaxStackSize(rt_, limits.max_stack_bytes);
    // Atomics.wait must not park the only thread
    JS_SetCanBlock(rt_, false);
    JS_SetInterruptHandler(rt_, &IsolatedVm::interrupt_handler, this);
    JS_SetModuleLoaderFunc(rt_, &IsolatedVm::normalize_module, &IsolatedVm::load_module, this);

    ctx_ = JS_NewContext(rt_);
    if (!ctx_) {
        JS_FreeRuntime(rt_);
        rt_ = nullptr;
        throw ExecError("cannot allocate VM context");
    }
}

IsolatedVm::~IsolatedVm() {
    if (ctx_) JS_FreeContext(ctx_);
    if (rt_) JS_FreeRuntime(rt_);
}

void IsolatedVm::interrupt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lk(reason_mu_);
        if (interrupt_requested_.load(std::memory_order_acquire)) return;
        reason_ = reason;
    }
    interrupt_requested_.store(true, std::memory_order_release);
}

std::string IsolatedVm::interrupt_reason() const {
    std::lock_guard<std::mutex> lk(reason_mu_);
    return reason_;
}

int IsolatedVm::interrupt_handler(JSRuntime*, void* opaque) {
    auto* vm = static_cast<IsolatedVm*>(opaque);
    if (vm->interrupted()) return 1;
    if (vm->caller_cancel_ && vm->caller_cancel_->cancelled()) {
        vm->interrupt(kCancelledReason);
        return 1;
    }
    return 0;
}

char* IsolatedVm::normalize_module(JSContext* ctx, const char* base, const char* spec, void* opaque) {
    auto* vm = static_cast<IsolatedVm*>(opaque);
    std::string joined = join_specifier(base, spec);
    if (joined.empty() || !vm->bundle_) {
        JS_ThrowReferenceError(ctx, "module not found in bundle: %s", spec);
        return nullptr;
    }
    auto it = vm->bundle_->aliases.find(joined);
    const std::string& name = it != vm->bundle_->aliases.end() ? it->second : joined;
    return js_strdup(ctx, name.c_str());
}

JSModuleDef* IsolatedVm::load_module(JSContext* ctx, const char* name, void* opaque) {
    auto* vm = static_cast<IsolatedVm*>(opaque);
    const BundledModule* mod = vm->bundle_ ? vm->bundle_->find(name) : nullptr;
    if (!mod) {
        JS_ThrowReferenceError(ctx, "module not found in bundle: %s", name);
        return nullptr;
    }
    JSValue obj = JS_ReadObject(ctx, mod->bytecode.data(), mod->bytecode.size(), JS_READ_OBJ_BYTECODE);
    if (JS_IsException(obj)) return nullptr;
    if (JS_VALUE_GET_TAG(obj) != JS_TAG_MODULE) {
        JS_FreeValue(ctx, obj);
        JS_ThrowReferenceError(ctx, "bundle entry is not a module: %s", name);
        return nullptr;
    }
    auto* m = static_cast<JSModuleDef*>(JS_VALUE_GET_PTR(obj));
    JS_FreeValue(ctx, obj);
    return m;
}

VmOutcome IsolatedVm::run(const Bundle& bundle) {
    bundle_ = &bundle;
    VmOutcome out;
    // the module's evaluation promise fulfilled: the script body returned
    bool fulfilled = false;

    auto finish = [&](VmOutcome o) {
        if (interrupted() && !(fulfilled && o.state == VmState::Completed)) {
            o.state = VmState::Interrupted;
            o.message = interrupt_reason();
        }
        return o;
    };
    auto raised = [&](std::string msg) {
        VmOutcome o;
        o.state = VmState::Raised;
        o.message = std::move(msg);
        return finish(std::move(o));
    };

    const BundledModule* entry = bundle.find(bundle.entry);
    if (!entry) return raised("module not found in bundle: " + bundle.entry);

    JSValue obj = JS_ReadObject(ctx_, entry->bytecode.data(), entry->bytecode.size(), JS_READ_OBJ_BYTECODE);
    if (JS_IsException(obj)) return raised(qjs::take_exception(ctx_));
    if (JS_ResolveModule(ctx_, obj) < 0) {
        JS_FreeValue(ctx_, obj);
        return raised(qjs::take_exception(ctx_));
    }

    // JS_EvalFunction takes ownership of obj
    JSValue result = JS_EvalFunction(ctx_, obj);
    if (JS_IsException(result)) return raised(qjs::take_exception(ctx_));

    std::string job_error;
    while (!interrupted()) {
        JSContext* job_ctx = nullptr;
        int r = JS_ExecutePendingJob(rt_, &job_ctx);
        if (r == 0) break;
        if (r < 0) {
            std::string msg = qjs::take_exception(job_ctx ? job_ctx : ctx_);
            if (job_error.empty()) job_error = msg;
        }
    }

    // A pending promise with an empty job queue never settles; it counts as
    // completed unless a job failed.
    bool rejected = false;
    std::string module_error;
    switch (JS_PromiseState(ctx_, result)) {
    case JS_PROMISE_FULFILLED:
        fulfilled = true;
        break;
    case JS_PROMISE_REJECTED: {
        rejected = true;
        JSValue reason = JS_PromiseResult(ctx_, result);
        module_error = qjs::to_std_string(ctx_, reason);
        JS_FreeValue(ctx_, reason);
        break;
    }
    default:
        break;
    }
    JS_FreeValue(ctx_, result);

    if (rejected) return raised(module_error);
    if (!job_error.empty() && !fulfilled) return raised(job_error);
    return finish(out);
}

} // namespace skyline
