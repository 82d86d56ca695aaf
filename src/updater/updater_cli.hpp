#pragma once

#include "updater/swap_engine.hpp"

#include <string>

struct UpdaterOptions {
    SwapPlan plan;
    std::string log_file;   // empty = <old-exe>.updater.log
    std::string log_level = "info";
    bool show_help = false;
};

struct UpdaterArgsResult {
    bool success = false;
    UpdaterOptions options;
    std::string error;
};

class UpdaterCLI {
public:
    /// Parse argv, run the swap and return the process exit code
    static int run(int argc, char* argv[]);

    static UpdaterArgsResult parse(int argc, char* argv[]);

    /// Run an already configured engine and map the outcome to an exit code
    static int execute(SwapEngine& engine);

    static std::string usage();
};
