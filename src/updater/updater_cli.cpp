#include "updater/updater_cli.hpp"
#include "core/logging.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

// ── Argument parsing ────────────────────────────────────────

static bool parse_number(const char* text, long& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno != 0 || *end != '\0' || value < 0) return false;
    out = value;
    return true;
}

std::string UpdaterCLI::usage() {
    return
        "selfupdate-updater: replace a stopped selfupdate binary with a staged one\n"
        "\n"
        "Usage:\n"
        "  selfupdate-updater --old-pid <pid> --old-exe <path> --new-exe <path> [options]\n"
        "\n"
        "Options:\n"
        "  --staging-dir <path>      Directory to delete once done\n"
        "  --updated-to <version>    Passed on to the relaunched binary\n"
        "  --wait-timeout-ms <n>     How long to wait for --old-pid (default 10000)\n"
        "  --poll-interval-ms <n>    Liveness poll interval (default 200)\n"
        "  --confirm-ms <n>          Relaunch confirmation window (default 500)\n"
        "  --log-file <path>         Log file (default <old-exe>.updater.log)\n"
        "  --log-level <level>       trace|debug|info|warn|error (default info)\n"
        "  --help                    Show this help\n"
        "\n"
        "Exit codes:\n"
        "  0 success, 1 invalid arguments, 2 timeout, 3 backup failure,\n"
        "  4 swap failure, 5 verify failure, 6 relaunch failure,\n"
        "  7 rollback failed (manual reinstall required)\n";
}

UpdaterArgsResult UpdaterCLI::parse(int argc, char* argv[]) {
    UpdaterArgsResult result;
    auto& opts = result.options;
    auto& plan = opts.plan;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.show_help = true;
            result.success = true;
            return result;
        }

        if (i + 1 >= argc) {
            result.error = std::string("Missing value for ") + arg;
            return result;
        }
        const char* value = argv[++i];
        long number = 0;

        if (std::strcmp(arg, "--old-pid") == 0) {
            if (!parse_number(value, number) || number <= 0) {
                result.error = std::string("Invalid --old-pid: ") + value;
                return result;
            }
            plan.old_pid = static_cast<pid_t>(number);
        } else if (std::strcmp(arg, "--old-exe") == 0) {
            plan.old_exe = value;
        } else if (std::strcmp(arg, "--new-exe") == 0) {
            plan.new_exe = value;
        } else if (std::strcmp(arg, "--staging-dir") == 0) {
            plan.staging_dir = value;
        } else if (std::strcmp(arg, "--updated-to") == 0) {
            plan.updated_to = value;
        } else if (std::strcmp(arg, "--wait-timeout-ms") == 0) {
            if (!parse_number(value, number)) {
                result.error = std::string("Invalid --wait-timeout-ms: ") + value;
                return result;
            }
            plan.wait_timeout = std::chrono::milliseconds(number);
        } else if (std::strcmp(arg, "--poll-interval-ms") == 0) {
            if (!parse_number(value, number) || number == 0) {
                result.error = std::string("Invalid --poll-interval-ms: ") + value;
                return result;
            }
            plan.poll_interval = std::chrono::milliseconds(number);
        } else if (std::strcmp(arg, "--confirm-ms") == 0) {
            if (!parse_number(value, number)) {
                result.error = std::string("Invalid --confirm-ms: ") + value;
                return result;
            }
            plan.confirm_window = std::chrono::milliseconds(number);
        } else if (std::strcmp(arg, "--log-file") == 0) {
            opts.log_file = value;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            opts.log_level = value;
        } else {
            result.error = std::string("Unknown option: ") + arg;
            return result;
        }
    }

    if (plan.old_pid <= 0 || plan.old_exe.empty() || plan.new_exe.empty()) {
        result.error = "--old-pid, --old-exe and --new-exe are required";
        return result;
    }
    if (plan.old_exe == plan.new_exe) {
        result.error = "--old-exe and --new-exe must differ";
        return result;
    }

    result.success = true;
    return result;
}

// ── Run ─────────────────────────────────────────────────────

int UpdaterCLI::execute(SwapEngine& engine) {
    StepResult r = engine.run();
    if (r.success) {
        return static_cast<int>(UpdaterExitCode::Success);
    }

    if (r.error == ErrorKind::RollbackFailed) {
        spdlog::critical("[Updater] {}: {}", error_user_message(r.error), r.message);
    } else {
        spdlog::error("[Updater] Update failed ({}): {}", error_kind_name(r.error), r.message);
    }
    return static_cast<int>(exit_code_for(r.error));
}

int UpdaterCLI::run(int argc, char* argv[]) {
    auto parsed = parse(argc, argv);
    if (!parsed.success) {
        std::cerr << parsed.error << "\n\n" << usage();
        return static_cast<int>(UpdaterExitCode::InvalidArguments);
    }
    if (parsed.options.show_help) {
        std::cout << usage();
        return 0;
    }

    const auto& opts = parsed.options;
    LogOptions log;
    log.logger_name = "selfupdate-updater";
    log.level = opts.log_level;
    log.file_path = opts.log_file.empty() ? opts.plan.old_exe + ".updater.log" : opts.log_file;
    init_logging(log);

    SwapEngine engine(opts.plan);
    int code = execute(engine);
    spdlog::info("[Updater] Exiting with status {}", code);
    flush_logging();
    return code;
}
