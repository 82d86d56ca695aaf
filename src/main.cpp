#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "app.hpp"

#include <spdlog/spdlog.h>

static void setup_logging(const Config& config, bool console) {
    LogOptions log;
    log.logger_name = "selfupdate";
    log.level = config.data().logging.level;
    log.file_path = config.data().logging.file.empty()
        ? Config::default_log_path()
        : Config::expand_home(config.data().logging.file);
    log.console = console;
    init_logging(log);
}

int main(int argc, char* argv[]) {
    Config config;
    config.load();

    // Subcommands log to stderr as well; the TUI owns the terminal
    bool has_subcommand = argc >= 2;
    setup_logging(config, has_subcommand);

    int cli_result = CLI::run(argc, argv);
    if (cli_result != -1) {
        // handled by CLI (help, version, check, update, or error)
        flush_logging();
        return cli_result;
    }

    if (has_subcommand) {
        // TUI after a relaunch: keep stderr quiet from here on
        setup_logging(config, false);
    }

    std::string notice;
    std::string updated_to = CLI::updated_to_arg(argc, argv);
    if (!updated_to.empty()) {
        notice = "Updated to version " + updated_to;
    }

    // No subcommand → launch TUI
    App app(config, notice);
    app.run();
    flush_logging();
    return 0;
}
