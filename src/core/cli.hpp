#pragma once

#include "core/config.hpp"
#include "core/install_context.hpp"
#include "core/orchestrator.hpp"

#include <iostream>
#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -1 if no subcommand (caller should launch TUI).
    static int run(int argc, char* argv[]);

    /// Value of "--updated-to <version>" anywhere in argv, empty if absent
    static std::string updated_to_arg(int argc, char* argv[]);

    /// Look up the latest release and print it next to current_version.
    /// 0 when the lookup worked (newer or not), 1 when it failed.
    static int cmd_check(const AppConfig& config, const std::string& current_version);

    /// Check, ask for consent unless assume_yes, download, hand off to the updater.
    /// Returns only when nothing was installed (or the exit hook returns).
    static int cmd_update(const AppConfig& config,
                          const InstallContext& context,
                          const std::string& current_version,
                          bool assume_yes,
                          std::istream& in = std::cin,
                          OrchestratorHooks hooks = {});

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_updated(const std::string& version);
};
