#include "core/cli.hpp"
#include "core/release_client.hpp"
#include "core/version.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <iostream>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → launch TUI

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "--updated-to") == 0) {
        if (argc < 3) {
            std::cerr << "Usage: selfupdate --updated-to <version>\n";
            return 1;
        }
        return cmd_updated(argv[2]);
    }
    if (std::strcmp(cmd, "check") == 0) {
        Config config;
        config.load();
        return cmd_check(config.data(), APP_VERSION);
    }
    if (std::strcmp(cmd, "update") == 0) {
        bool assume_yes = false;
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], "--yes") == 0 || std::strcmp(argv[i], "-y") == 0) {
                assume_yes = true;
            } else {
                std::cerr << "Unknown option for update: " << argv[i] << "\n";
                return 1;
            }
        }
        Config config;
        config.load();
        return cmd_update(config.data(), InstallContext::resolve(), APP_VERSION, assume_yes);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'selfupdate help' for usage.\n";
    return 1;
}

std::string CLI::updated_to_arg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--updated-to") == 0) {
            return argv[i + 1];
        }
    }
    return "";
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "selfupdate — terminal application that keeps itself up to date\n"
        "\n"
        "Usage:\n"
        "  selfupdate                  Launch TUI (default)\n"
        "  selfupdate check            Show current and latest version\n"
        "  selfupdate update [--yes]   Download and install the latest version\n"
        "  selfupdate version          Show version\n"
        "  selfupdate help             Show this help\n"
        "\n"
        "Configuration: " << Config::config_path() << "\n"
        "\n"
        "Keyboard shortcuts (TUI mode):\n"
        "  U           Check for updates\n"
        "  D / N       Download the available update / not now\n"
        "  C           Cancel the download\n"
        "  I           Install and restart\n"
        "  R / X       Retry / dismiss after a failure\n"
        "  Q           Quit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "selfupdate " << APP_VERSION << "\n";
    return 0;
}

// ── --updated-to ────────────────────────────────────────────

int CLI::cmd_updated(const std::string& version) {
    spdlog::info("[CLI] Started after update to {}", version);
    // Relaunched without a terminal: record it and stop here
    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
        std::cout << "Updated to version " << version << "\n";
        return 0;
    }
    return -1;
}

// ── check ───────────────────────────────────────────────────

int CLI::cmd_check(const AppConfig& config, const std::string& current_version) {
    auto opts = OrchestratorOptions::from_config(config);
    ReleaseClient client(opts.endpoint, opts.asset_suffix, opts.user_agent);

    std::cout << "Current version: " << current_version << "\n";

    auto result = client.fetch_latest_release(opts.lookup_timeout);
    if (!result.success) {
        std::cerr << "Update check failed: " << result.message << "\n";
        return 1;
    }

    const auto& release = result.release;
    std::cout << "Latest version:  " << release.version;
    if (!release.published_at.empty()) {
        std::cout << " (" << release.published_at << ")";
    }
    std::cout << "\n";

    if (is_newer_version(current_version, release.version)) {
        std::cout << "Update available: " << release.asset_name << " ("
                  << release.asset_size_bytes << " bytes)\n";
        std::cout << "Run 'selfupdate update' to install it.\n";
    } else {
        std::cout << "You are running the latest version.\n";
    }
    return 0;
}

// ── update ──────────────────────────────────────────────────

int CLI::cmd_update(const AppConfig& config,
                    const InstallContext& context,
                    const std::string& current_version,
                    bool assume_yes,
                    std::istream& in,
                    OrchestratorHooks hooks) {
    OrchestratorCallbacks callbacks;
    callbacks.on_progress = [](const DownloadSnapshot& snap) {
        if (snap.phase != DownloadPhase::Downloading) return;
        int pct = snap.percent();
        if (pct >= 0) {
            std::cout << "\rDownloading... " << pct << "%" << std::flush;
        } else {
            std::cout << "\rDownloading... " << snap.bytes_received / 1024 << " KiB" << std::flush;
        }
    };

    UpdateOrchestrator orchestrator(OrchestratorOptions::from_config(config), context,
                                    current_version, std::move(callbacks), std::move(hooks));

    if (!orchestrator.updates_supported()) {
        std::cerr << orchestrator.status_message() << "\n";
        return 1;
    }

    std::cout << "Checking for updates...\n";
    if (!orchestrator.check_now()) {
        std::cerr << "An update check is already running.\n";
        return 1;
    }
    while (!orchestrator.wait_until_settled(std::chrono::seconds(1))) {}

    if (orchestrator.state() != UpdateState::Available) {
        auto outcome = orchestrator.last_check_outcome();
        if (outcome == ErrorKind::AlreadyUpToDate) {
            std::cout << "You are running the latest version (" << current_version << ").\n";
            return 0;
        }
        std::cerr << "Update check failed: " << error_user_message(outcome) << "\n";
        return 1;
    }

    auto release = orchestrator.release();
    std::cout << "Update available: " << current_version << " -> " << release.version << "\n";
    if (!release.changelog.empty()) {
        std::cout << "\n" << release.changelog << "\n\n";
    }

    if (!assume_yes) {
        std::cout << "Download and install now? [y/N] " << std::flush;
        std::string answer;
        std::getline(in, answer);
        if (answer != "y" && answer != "Y" && answer != "yes") {
            orchestrator.decline();
            std::cout << "Update skipped.\n";
            return 0;
        }
    }

    if (!orchestrator.confirm_download()) {
        std::cerr << "Could not start the download.\n";
        return 1;
    }
    while (!orchestrator.wait_until_settled(std::chrono::seconds(1))) {}
    std::cout << "\n";

    if (orchestrator.state() != UpdateState::ReadyToInstall) {
        std::cerr << "Update failed: " << error_user_message(orchestrator.failure()) << "\n";
        return 1;
    }

    std::cout << "Installing " << release.version << " and restarting...\n";
    if (!orchestrator.install()) {
        std::cerr << "Update failed: " << error_user_message(orchestrator.failure()) << "\n";
        return 1;
    }
    return 0;
}
