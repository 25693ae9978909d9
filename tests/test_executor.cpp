#include "test_common.h"
#include "skyline/cancel.h"
#include "skyline/dispatch.h"
#include "skyline/executor.h"
#include "skyline/log.h"
#include "skyline/workspace.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

using namespace skyline;
namespace fs = std::filesystem;

namespace {

struct StubCalls {
    std::mutex mu;
    std::vector<std::string> args;
    std::vector<std::string> details;
};

std::shared_ptr<ToolDispatcher> make_stub(StubCalls* calls) {
    return std::make_shared<DirectDispatcher>(
        [calls](const CancelToken&, const std::string& tool, const std::string& args_json) {
            {
                std::lock_guard<std::mutex> lk(calls->mu);
                calls->args.push_back(args_json);
            }
            if (tool == "svc__bad") return DispatchResult::failure("tool error: bad input");
            if (tool == "svc__echo") return DispatchResult::success(args_json);
            return DispatchResult::success("{\"y\":2}");
        },
        [calls](const CancelToken&, const std::string& query, const std::string& detail) {
            {
                std::lock_guard<std::mutex> lk(calls->mu);
                calls->details.push_back(detail);
            }
            if (query == "none") return DispatchResult::success("[]");
            return DispatchResult::success(
                "[{\"name\":\"svc__op\",\"description\":\"does op\",\"interface\":\"op(x: number): {y: number}\"}]");
        });
}

ExecutionRequest js(const std::string& code, int timeout = 10) {
    ExecutionRequest r;
    r.code = code;
    r.language = "javascript";
    r.timeout_seconds = timeout;
    return r;
}

size_t count_entry_files(const fs::path& ws) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(ws)) {
        if (e.path().filename().string().rfind("__entry_", 0) == 0) n++;
    }
    return n;
}

} // namespace

int main() {
    auto ws = make_temp_dir("executor");
    StubCalls calls;
    ExecutorOptions opts;
    opts.workspace_dir = ws.string();
    opts.interfaces = {"github", "slack"};
    Executor ex(opts, make_stub(&calls));
    CancelToken root;

    // Console output and a stubbed tool call
    {
        auto r = ex.execute(root, js("console.log(\"hi\"); await callTool(\"svc__op\", {x:1})"));
        expect_eq_ll(r.exit_code, 0, "hello exit");
        expect_eq_str(r.stdout_text, "hi\n", "hello stdout");
        expect_eq_str(r.error, "", "hello error");
        expect_eq_ll((long long)r.tools_called.size(), 1, "hello tools");
        expect_eq_str(r.tools_called[0], "svc__op", "hello tool name");
        expect_eq_str(calls.args.back(), "{\"x\":1}", "args reach dispatcher");
        expect_true(r.execution_time_seconds >= 0.0, "timing recorded");
    }

    // Result values come back decoded
    {
        auto r = ex.execute(root, js(
            "const a = await callTool('svc__op', {x:1});\n"
            "const b = await callMCPTool('svc__echo', {s:'q', n:[1,2]});\n"
            "console.log(a.y, b.s, b.n.length);\n"));
        expect_eq_ll(r.exit_code, 0, "decode exit: " + r.error);
        expect_eq_str(r.stdout_text, "2 q 2\n", "decoded values");
    }

    // Console formatting and streams
    {
        auto r = ex.execute(root, js(
            "console.log('a', 1, {b:2}, [1,'x'], null, undefined, true);\n"
            "console.warn('w');\n"
            "console.error(new Error('e1'));\n"
            "console.log();\n"));
        expect_eq_ll(r.exit_code, 0, "console exit");
        expect_eq_str(r.stdout_text, "a 1 {\"b\":2} [1,\"x\"] null undefined true\n\n", "console stdout");
        expect_eq_str(r.stderr_text, "w\nError: e1\n", "console stderr");
    }

    // Disallowed fetch raises at top level
    {
        auto r = ex.execute(root, js("fetch(\"http://evil.example.com\")"));
        expect_eq_ll(r.exit_code, 1, "evil fetch exit");
        expect_true(contains(r.error, "restricted to localhost"), "evil fetch error: " + r.error);

        auto r2 = ex.execute(root, js("await fetch('http://localhost.evil.com/x')"));
        expect_eq_ll(r2.exit_code, 1, "lookalike host exit");
        expect_true(contains(r2.error, "restricted to localhost"), "lookalike host error: " + r2.error);

        auto r3 = ex.execute(root, js(
            "try { fetch('https://example.org/'); } catch (e) { console.log('caught: ' + e.message); }"));
        expect_eq_ll(r3.exit_code, 0, "caught fetch exit");
        expect_eq_str(r3.stdout_text, "caught: fetch restricted to localhost, got: https://example.org/\n",
                      "caught fetch message");
    }

    // Infinite loop hits the timeout
    {
        auto t0 = std::chrono::steady_clock::now();
        auto r = ex.execute(root, js("while(true){}", 1));
        double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        expect_eq_ll(r.exit_code, 124, "timeout exit");
        expect_true(contains(r.error, "1s"), "timeout mentions duration: " + r.error);
        expect_true(r.execution_time_seconds >= 0.9, "timeout ran about 1s");
        expect_true(wall < 6.0, "timeout returned promptly");
    }

    // Timeout after an await
    {
        auto r = ex.execute(root, js("console.log('start'); await callTool('svc__op', {}); for(;;){}", 1));
        expect_eq_ll(r.exit_code, 124, "async timeout exit");
        expect_eq_str(r.stdout_text, "start\n", "output kept on timeout");
        expect_eq_ll((long long)r.tools_called.size(), 1, "tools kept on timeout");
    }

    // A script that throws the sentinel text itself is an ordinary error
    {
        auto r = ex.execute(root, js("throw new Error('execution timeout')"));
        expect_eq_ll(r.exit_code, 1, "user sentinel exit");
        expect_true(contains(r.error, "execution timeout"), "user sentinel message");
    }

    // Runtime errors keep the output produced before them
    {
        auto r = ex.execute(root, js("console.log('before'); throw new Error('boom');"));
        expect_eq_ll(r.exit_code, 1, "throw exit");
        expect_eq_str(r.stdout_text, "before\n", "throw stdout");
        expect_true(contains(r.error, "boom"), "throw error: " + r.error);

        auto r2 = ex.execute(root, js("await Promise.reject(new TypeError('nope'))"));
        expect_eq_ll(r2.exit_code, 1, "rejection exit");
        expect_true(contains(r2.error, "TypeError: nope"), "rejection error: " + r2.error);

        auto r3 = ex.execute(root, js("undefinedFunction()"));
        expect_eq_ll(r3.exit_code, 1, "reference error exit");
        expect_true(contains(r3.error, "ReferenceError"), "reference error: " + r3.error);
    }

    // Only the script's own outcome decides success
    {
        auto r = ex.execute(root, js(
            "console.log(typeof __skylineSettle, typeof globalThis.__skylineSettle);\n"
            "try { __skylineSettle(true); } catch (e) {}\n"
            "throw new Error('boom');\n"));
        expect_eq_ll(r.exit_code, 1, "forged completion exit");
        expect_eq_str(r.stdout_text, "undefined undefined\n", "no completion hook in scope");
        expect_true(contains(r.error, "boom"), "forged completion error: " + r.error);

        auto r2 = ex.execute(root, js(
            "await Promise.resolve();\n"
            "throw new RangeError('late');\n"));
        expect_eq_ll(r2.exit_code, 1, "late throw exit");
        expect_true(contains(r2.error, "RangeError: late"), "late throw error: " + r2.error);
    }

    // Userinfo and glob URLs are refused before any request
    {
        auto r = ex.execute(root, js("await fetch('http://localhost:x@evil.example.com/steal')"));
        expect_eq_ll(r.exit_code, 1, "userinfo fetch exit");
        expect_true(contains(r.error, "restricted to localhost"), "userinfo fetch error: " + r.error);

        auto r2 = ex.execute(root, js("await fetch('http://127.0.0.1/[1-3]')"));
        expect_eq_ll(r2.exit_code, 1, "glob fetch exit");
        expect_true(contains(r2.error, "restricted to localhost"), "glob fetch error: " + r2.error);
    }

    // toolsCalled records every call, failed ones included, in order
    {
        auto r = ex.execute(root, js(
            "await callTool('svc__a', {});\n"
            "try { await callTool('svc__bad', {}); } catch (e) { console.log(e.message); }\n"
            "await callTool('svc__a', {});\n"
            "try { __callTool('svc__raw', '[1]'); } catch (e) { console.log(e.message); }\n"
            "await callTool('svc__b', {});\n"));
        expect_eq_ll(r.exit_code, 0, "trace exit: " + r.error);
        const std::vector<std::string> want = {"svc__a", "svc__bad", "svc__a", "svc__raw", "svc__b"};
        expect_true(r.tools_called == want, "trace order and duplicates");
        expect_true(contains(r.stdout_text, "tool error: bad input\n"), "tool failure message");
        expect_true(contains(r.stdout_text, "invalid args JSON"), "invalid args message");
    }

    // Uncaught tool failure
    {
        auto r = ex.execute(root, js("await callTool('svc__bad', {})"));
        expect_eq_ll(r.exit_code, 1, "uncaught tool failure exit");
        expect_true(contains(r.error, "tool error: bad input"), "uncaught tool failure: " + r.error);
        expect_eq_ll((long long)r.tools_called.size(), 1, "failed call traced");
    }

    // Tool search
    {
        calls.details.clear();
        auto r = ex.execute(root, js(
            "const m = await searchTools('op');\n"
            "console.log(m[0].name);\n"
            "console.log(await getToolInterface('svc__op'));\n"
            "console.log(JSON.stringify(await getToolInterface('none')));\n"
            "await searchTools('op', 'name-only');\n"));
        expect_eq_ll(r.exit_code, 0, "search exit: " + r.error);
        expect_eq_str(r.stdout_text, "svc__op\nop(x: number): {y: number}\n\"\"\n", "search output");
        expect_eq_ll((long long)calls.details.size(), 4, "search calls");
        expect_eq_str(calls.details[0], kDefaultSearchDetail, "default detail");
        expect_eq_str(calls.details[1], "full", "interface lookup detail");
        expect_eq_str(calls.details[3], "name-only", "explicit detail");
        expect_true(r.tools_called.empty(), "search is not a tool call");
    }

    // Service namespaces are visible and frozen
    {
        auto r = ex.execute(root, js(
            "console.log(JSON.stringify(__interfaces));\n"
            "try { __interfaces.push('x'); } catch (e) { console.log('frozen'); }\n"
            "console.log(__interfaces.length);\n"));
        expect_eq_ll(r.exit_code, 0, "interfaces exit: " + r.error);
        expect_eq_str(r.stdout_text, "[\"github\",\"slack\"]\nfrozen\n2\n", "interfaces output");

        ex.set_interfaces({"jira"});
        auto r2 = ex.execute(root, js("console.log(__interfaces.join(','))"));
        expect_eq_str(r2.stdout_text, "jira\n", "interfaces replaced");
        ex.set_interfaces(opts.interfaces);
    }

    // Unsupported language and bundling failures never start the VM
    {
        ExecutionRequest req = js("print 'x'");
        req.language = "python";
        auto r = ex.execute(root, req);
        expect_eq_ll(r.exit_code, 1, "language exit");
        expect_eq_str(r.error, "unsupported language: python", "language error");
        expect_eq_ll((long long)(r.execution_time_seconds * 1000), 0, "language: no VM time");

        auto r2 = ex.execute(root, js("const = ;"));
        expect_eq_ll(r2.exit_code, 1, "syntax exit");
        expect_true(r2.error.rfind("transpile error: ", 0) == 0, "syntax error prefix: " + r2.error);

        auto r3 = ex.execute(root, js("import { x } from './nowhere.js';\nconsole.log(x);"));
        expect_eq_ll(r3.exit_code, 1, "missing import exit");
        expect_true(r3.error.rfind("transpile error: ", 0) == 0, "missing import prefix: " + r3.error);
        expect_true(r3.stdout_text.empty(), "missing import: no output");

        ExecutionRequest req4 = js("console.log('default')");
        req4.language = "";
        auto r4 = ex.execute(root, req4);
        expect_eq_ll(r4.exit_code, 0, "empty language selects javascript");
    }

    // Workspace service modules import through the shared client
    {
        ServiceFiles svc;
        svc["svc"]["index.js"] =
            "import { callMCPTool } from '../client.js';\n"
            "export * from './ops.js';\n";
        svc["svc"]["ops.js"] =
            "import { callMCPTool } from '../client.js';\n"
            "export const op = (args) => callMCPTool('svc__op', args);\n";
        expect_eq_str(setup_workspace(ws.string(), svc), "", "setup workspace");

        auto r = ex.execute(root, js(
            "import { op } from './mcp/svc/index.js';\n"
            "import * as svc from './mcp/svc';\n"
            "const r = await op({x: 1});\n"
            "console.log(r.y, typeof svc.op);\n"));
        expect_eq_ll(r.exit_code, 0, "workspace import exit: " + r.error);
        expect_eq_str(r.stdout_text, "2 function\n", "workspace import output");
        expect_eq_ll((long long)r.tools_called.size(), 1, "workspace import traced");

        auto r2 = ex.execute(root, js(
            "const m = await import('./mcp/svc/ops.js');\n"
            "console.log((await m.op({})).y);\n"));
        expect_eq_ll(r2.exit_code, 0, "dynamic import exit: " + r2.error);
        expect_eq_str(r2.stdout_text, "2\n", "dynamic import output");
    }

    // No transient files remain
    expect_eq_ll((long long)count_entry_files(ws), 0, "entry files removed");

    // Same script, same stub: same result
    {
        const char* code = "for (let i = 0; i < 3; i++) { console.log(i); await callTool('svc__op', {i}); }";
        auto a = ex.execute(root, js(code));
        auto b = ex.execute(root, js(code));
        expect_eq_str(a.stdout_text, b.stdout_text, "idempotent stdout");
        expect_true(a.tools_called == b.tools_called, "idempotent tools");
        expect_eq_ll(a.exit_code, b.exit_code, "idempotent exit");
    }

    // Concurrent executions are isolated
    {
        std::vector<ExecutionResult> results(4);
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; t++) {
            threads.emplace_back([&, t] {
                std::string id = "t" + std::to_string(t);
                results[t] = ex.execute(root, js(
                    "for (let i = 0; i < 20; i++) { console.log('" + id + "'); await callTool('" + id +
                    "__op', {}); }"));
            });
        }
        for (auto& th : threads) th.join();
        for (int t = 0; t < 4; t++) {
            std::string id = "t" + std::to_string(t);
            std::string want;
            for (int i = 0; i < 20; i++) want += id + "\n";
            expect_eq_ll(results[t].exit_code, 0, "concurrent exit " + id);
            expect_eq_str(results[t].stdout_text, want, "concurrent stdout " + id);
            expect_eq_ll((long long)results[t].tools_called.size(), 20, "concurrent tools " + id);
            for (const auto& name : results[t].tools_called) {
                expect_eq_str(name, id + "__op", "concurrent tool name " + id);
            }
        }
        expect_eq_ll((long long)count_entry_files(ws), 0, "concurrent entry files removed");
    }

    // Caller cancellation stops a running script
    {
        CancelToken caller;
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            caller.cancel();
        });
        auto t0 = std::chrono::steady_clock::now();
        auto r = ex.execute(caller, js("console.log('spin'); while(true){}", 20));
        double wall = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        canceller.join();
        expect_eq_ll(r.exit_code, 1, "cancel exit");
        expect_eq_str(r.error, kCancelledReason, "cancel error");
        expect_eq_str(r.stdout_text, "spin\n", "cancel keeps output");
        expect_true(wall < 10.0, "cancel returned promptly");
    }

    // Memory limit surfaces as a script error
    {
        ExecutorOptions small = opts;
        small.vm_limits.memory_limit_bytes = 16u * 1024u * 1024u;
        Executor tight(small, make_stub(&calls));
        auto r = tight.execute(root, js("const a = []; while (true) a.push('x'.repeat(1024) + a.length);", 20));
        expect_eq_ll(r.exit_code, 1, "memory limit exit");
        expect_true(!r.error.empty(), "memory limit error");
    }

    // Execution log
    {
        auto log_path = ws / "exec.log";
        auto log = std::make_shared<ExecutionLog>(log_path.string());
        expect_true(log->ok(), "log open");
        ex.set_log(log);
        (void)ex.execute(root, js("await callTool('svc__op', {})"));
        ex.set_log(nullptr);

        std::ifstream f(log_path);
        std::string l1, l2, extra;
        std::getline(f, l1);
        std::getline(f, l2);
        expect_true(contains(l1, "\"event\":\"execute.start\""), "log start: " + l1);
        expect_true(contains(l2, "\"event\":\"execute.done\""), "log done: " + l2);
        expect_true(contains(l2, "\"toolsCalled\":[\"svc__op\"]"), "log tools: " + l2);
        expect_true(!std::getline(f, extra), "two log lines");
    }

    // A dispatcher without search support
    {
        Executor bare(opts, std::make_shared<DirectDispatcher>(
            [](const CancelToken&, const std::string&, const std::string&) {
                return DispatchResult::success("null");
            }));
        auto r = bare.execute(root, js("console.log(await callTool('x__y', {})); await searchTools('q');"));
        expect_eq_ll(r.exit_code, 1, "no search exit");
        expect_eq_str(r.stdout_text, "null\n", "null result");
        expect_true(contains(r.error, "tool search not configured"), "no search error: " + r.error);
    }

    fs::remove_all(ws);
    std::cerr << "test_executor: ALL PASSED" << std::endl;
    return 0;
}
