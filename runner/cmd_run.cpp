#include "cmd_run.h"
#include "runner_utils.h"

#include "skyline/cancel.h"
#include "skyline/config.h"
#include "skyline/serialization.h"
#include "skyline/workspace.h"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace skyline;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: skyline_cli run <script|-> [--workspace DIR] [--timeout N] [--language L] [--endpoint URL]\n";
        return 2;
    }
    const std::string script = argv[2];
    std::string workspace, endpoint;
    ExecutionRequest req;

    for (int i = 3; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--workspace" && i + 1 < argc) { workspace = argv[++i]; continue; }
        if (a == "--timeout" && i + 1 < argc) { req.timeout_seconds = std::atoi(argv[++i]); continue; }
        if (a == "--language" && i + 1 < argc) { req.language = argv[++i]; continue; }
        if (a == "--endpoint" && i + 1 < argc) { endpoint = argv[++i]; continue; }
        std::cerr << "unknown option: " << a << "\n";
        return 2;
    }

    try {
        req.code = script == "-" ? slurp_stdin(16u * 1024u * 1024u) : slurp(script);
    } catch (const std::exception& e) {
        std::cerr << "[run] " << e.what() << "\n";
        return 2;
    }

    auto exec = make_executor_from_env(workspace, endpoint);
    CancelToken cancel;
    try {
        ExecutionResult r = exec->execute(cancel, req);
        std::cout << execution_result_to_json(r) << "\n";
        return r.exit_code;
    } catch (const ExecError& e) {
        std::cerr << "[run] setup failure: " << e.what() << "\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[run] internal failure: " << e.what() << "\n";
        return 3;
    }
}

int cmd_setup(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: skyline_cli setup <workspace> <services.json>\n";
        return 2;
    }
    std::string json;
    try {
        json = slurp(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "[setup] " << e.what() << "\n";
        return 2;
    }

    ServiceFiles files;
    std::string err;
    if (!service_files_from_json(json, &files, &err)) {
        std::cerr << "[setup] " << err << "\n";
        return 2;
    }
    err = setup_workspace(argv[2], files);
    if (!err.empty()) {
        std::cerr << "[setup] " << err << "\n";
        return 1;
    }
    std::cerr << "[setup] wrote " << files.size() << " service(s) to " << argv[2] << "\n";
    return 0;
}
