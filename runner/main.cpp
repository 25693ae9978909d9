#include "cmd_run.h"
#include "cmd_serve.h"

#include "skyline/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "skyline_cli <run|serve|setup> ...\n";
        return 2;
    }
    // before any thread exists
    skyline::apply_profile_defaults(skyline::detect_profile());

    std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "setup") return cmd_setup(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
