#pragma once

// skyline_cli run <script|-> [--workspace DIR] [--timeout N] [--language L] [--endpoint URL]
int cmd_run(int argc, char** argv);

// skyline_cli setup <workspace> <services.json>
int cmd_setup(int argc, char** argv);
