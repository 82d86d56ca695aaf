#pragma once

#include "core/errors.hpp"
#include "core/install_context.hpp"
#include "core/process.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

struct SwapPlan {
    pid_t old_pid = -1;
    std::string old_exe;
    std::string new_exe;
    std::string staging_dir;     // removed after success or rollback; may be empty
    std::string updated_to;      // forwarded to the relaunched binary
    std::chrono::milliseconds wait_timeout{10000};
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds confirm_window{500};
};

struct StepResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string message;
};

/// The destructive half of an update: wait, back up, swap, verify, relaunch.
/// Single-threaded; each step can also be driven on its own from tests.
class SwapEngine {
public:
    using Launcher = std::function<SpawnResult(const std::string&, const std::vector<std::string>&)>;
    using StartConfirmer = std::function<bool(pid_t, std::chrono::milliseconds)>;

    explicit SwapEngine(SwapPlan plan);

    void set_launcher(Launcher launcher) { launcher_ = std::move(launcher); }
    void set_start_confirmer(StartConfirmer confirmer) { confirmer_ = std::move(confirmer); }

    /// Every step in order, rolling back on failure after the backup exists
    StepResult run();

    /// Heal an interrupted earlier run. No record = no-op.
    StepResult preflight_rollback();
    StepResult wait_for_exit();
    StepResult backup();
    StepResult swap();
    StepResult verify() const;
    StepResult relaunch();

    /// Copy whatever else the release shipped (the updater itself, data
    /// files) from the staged payload into the install directory. Runs after
    /// a confirmed relaunch; failures are logged and skipped. Returns the
    /// number of files installed.
    int install_companions();

    /// Restore the backup over old_exe, then drop backup and record.
    /// On failure the record stays for the next run.
    StepResult rollback();

    /// Drop backup, record and staging directory after a confirmed relaunch
    void cleanup();

    const SwapPlan& plan() const { return plan_; }
    const InstallContext& context() const { return context_; }

private:
    SwapPlan plan_;
    InstallContext context_;
    Launcher launcher_;
    StartConfirmer confirmer_;

    StepResult restore(const std::string& backup_path, const std::string& original_path,
                       const std::string& record_path);
    StepResult fail_after_backup(ErrorKind kind, const std::string& message);
    void relaunch_restored();
    void remove_staging();
};
