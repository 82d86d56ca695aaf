#pragma once

#include "core/archive_fetcher.hpp"
#include "core/errors.hpp"
#include "core/install_context.hpp"
#include "core/process.hpp"
#include "core/release_client.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct AppConfig;

enum class UpdateState {
    Idle,
    Checking,
    Available,
    Downloading,
    ReadyToInstall,
    HandingOff,
    Failed
};

const char* update_state_name(UpdateState state);

/// True for the edges of the update state machine
bool is_allowed_transition(UpdateState from, UpdateState to);

struct OrchestratorOptions {
    std::string endpoint;
    std::string asset_suffix;
    std::string user_agent = "selfupdate";
    std::chrono::milliseconds lookup_timeout{2000};
    int connect_timeout_ms = 10000;
    int read_timeout_ms = 30000;
    std::chrono::milliseconds check_interval{std::chrono::hours(24)};  // 0 = no timer
    std::chrono::milliseconds handoff_grace{1000};
    std::chrono::milliseconds progress_interval{250};
    bool verify_checksum = true;
    /// Files the release archive must contain; empty = just the executable
    std::vector<std::string> expected_files;
    int updater_wait_timeout_ms = 10000;
    int updater_poll_interval_ms = 200;
    std::string updater_log_file;   // empty = updater default

    static OrchestratorOptions from_config(const AppConfig& config);
};

/// Invoked from background threads; hosts marshal to their UI thread.
struct OrchestratorCallbacks {
    std::function<void(UpdateState, ErrorKind)> on_state_change;
    std::function<void(const DownloadSnapshot&)> on_progress;
};

/// Process-level side effects, replaceable in tests
struct OrchestratorHooks {
    std::function<SpawnResult(const std::string&, const std::vector<std::string>&)> launch_updater;
    std::function<void(int)> exit_process;
};

/// Drives check -> consent -> download -> hand-off.
/// All public operations return immediately except install(), which sleeps
/// for the hand-off grace period before calling the exit hook.
class UpdateOrchestrator {
public:
    UpdateOrchestrator(OrchestratorOptions options,
                       InstallContext context,
                       std::string current_version,
                       OrchestratorCallbacks callbacks = {},
                       OrchestratorHooks hooks = {});
    ~UpdateOrchestrator();

    UpdateOrchestrator(const UpdateOrchestrator&) = delete;
    UpdateOrchestrator& operator=(const UpdateOrchestrator&) = delete;

    /// Idle -> Checking. False while another check runs or when not Idle.
    bool check_now();

    /// Check now, then every check_interval until shutdown()
    void start_periodic_checks();

    /// Available -> Downloading. The only way a download is started.
    bool confirm_download();

    /// Ask a running download to stop; it ends in Failed(Cancelled)
    void cancel_download();

    /// Available -> Idle
    bool decline();

    /// Failed -> Idle
    bool dismiss();

    /// Failed -> Idle, then check again and download without asking
    bool retry();

    /// ReadyToInstall -> HandingOff, launch the updater and exit
    bool install();

    /// Stop timers, cancel downloads and join every background thread
    void shutdown();

    /// Block until no check or download is running. False on timeout.
    bool wait_until_settled(std::chrono::milliseconds timeout) const;

    UpdateState state() const;
    ErrorKind failure() const;
    std::string failure_message() const;
    /// Outcome of the most recent completed check (None when an update was found)
    ErrorKind last_check_outcome() const;
    ReleaseInfo release() const;
    DownloadSnapshot progress() const;
    std::string staged_executable() const;
    const std::string& current_version() const;
    bool updates_supported() const;
    const InstallContext& context() const;

    /// One line for banners and the CLI
    std::string status_message() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
