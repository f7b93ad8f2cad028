#pragma once

namespace sharecost::cli
{
    /** Parse argv and run the selected subcommand; returns the process exit code */
    int run(int argc, char *argv[]);
}
