#pragma once

// skyline_cli serve [--host H] [--port P] [--workspace DIR]
int cmd_serve(int argc, char** argv);
