#include "updater/swap_engine.hpp"
#include "updater/backup_record.hpp"
#include "updater/durable_io.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

static StepResult step_ok() {
    StepResult r;
    r.success = true;
    return r;
}

static StepResult step_fail(ErrorKind kind, const std::string& message) {
    StepResult r;
    r.error = kind;
    r.message = message;
    return r;
}

SwapEngine::SwapEngine(SwapPlan plan)
    : plan_(std::move(plan)),
      context_(InstallContext::for_executable(plan_.old_exe)),
      launcher_([](const std::string& path, const std::vector<std::string>& args) {
          return spawn_detached(path, args);
      }),
      confirmer_([](pid_t pid, std::chrono::milliseconds window) {
          return confirm_started(pid, window);
      }) {}

// ── Full run ────────────────────────────────────────────────

StepResult SwapEngine::run() {
    spdlog::info("[Updater] Replacing {} with {} (waiting on pid {})",
                 plan_.old_exe, plan_.new_exe, plan_.old_pid);

    StepResult r = preflight_rollback();
    if (!r.success) return r;

    r = wait_for_exit();
    if (!r.success) {
        remove_staging();
        return r;
    }

    r = backup();
    if (!r.success) {
        remove_staging();
        return r;
    }

    r = swap();
    if (!r.success) return fail_after_backup(r.error, r.message);

    r = verify();
    if (!r.success) return fail_after_backup(r.error, r.message);

    r = relaunch();
    if (!r.success) return fail_after_backup(r.error, r.message);

    install_companions();
    cleanup();
    spdlog::info("[Updater] Update to {} complete",
                 plan_.updated_to.empty() ? std::string("new version") : plan_.updated_to);
    return step_ok();
}

StepResult SwapEngine::fail_after_backup(ErrorKind kind, const std::string& message) {
    spdlog::error("[Updater] {} ({}), rolling back", message, error_kind_name(kind));

    StepResult rb = rollback();
    if (!rb.success) {
        return rb;
    }
    remove_staging();
    relaunch_restored();
    return step_fail(kind, message);
}

// ── 1. Pre-flight rollback ──────────────────────────────────

StepResult SwapEngine::preflight_rollback() {
    const auto& record_path = context_.backup_record_path;
    if (!BackupRecord::exists(record_path)) {
        return step_ok();
    }

    spdlog::warn("[Updater] Found {} from an interrupted update, restoring", record_path);

    BackupRecord record;
    std::string error;
    if (!BackupRecord::load(record_path, record, error)) {
        // Unreadable record: nothing trustworthy to restore from
        spdlog::warn("[Updater] Discarding backup record: {}", error);
        if (!BackupRecord::remove(record_path, error)) {
            return step_fail(ErrorKind::RollbackFailed, error);
        }
        return step_ok();
    }

    std::error_code ec;
    if (!fs::is_regular_file(record.backup_path, ec)) {
        spdlog::warn("[Updater] Backup {} is gone, discarding record", record.backup_path);
        if (!BackupRecord::remove(record_path, error)) {
            return step_fail(ErrorKind::RollbackFailed, error);
        }
        return step_ok();
    }

    return restore(record.backup_path, record.original_path, record_path);
}

// ── 2. Wait for the old process ─────────────────────────────

StepResult SwapEngine::wait_for_exit() {
    spdlog::info("[Updater] Waiting for pid {} to exit (timeout {} ms)",
                 plan_.old_pid, plan_.wait_timeout.count());

    if (!wait_for_process_exit(plan_.old_pid, plan_.wait_timeout, plan_.poll_interval)) {
        return step_fail(ErrorKind::Timeout,
                         "Process " + std::to_string(plan_.old_pid) + " did not exit in time");
    }
    spdlog::info("[Updater] Process {} has exited", plan_.old_pid);
    return step_ok();
}

// ── 3. Backup ───────────────────────────────────────────────

StepResult SwapEngine::backup() {
    const auto& backup_path = context_.backup_executable_path;
    std::string error;
    std::error_code ec;

    if (!fs::is_regular_file(plan_.old_exe, ec)) {
        return step_fail(ErrorKind::BackupFailure, plan_.old_exe + " is not a regular file");
    }

    if (!durable_copy(plan_.old_exe, backup_path, error)) {
        fs::remove(backup_path, ec);
        return step_fail(ErrorKind::BackupFailure, "Backup failed: " + error);
    }

    BackupRecord record;
    record.original_path = plan_.old_exe;
    record.backup_path = backup_path;
    record.timestamp_utc = BackupRecord::now_utc();
    if (!record.write(context_.backup_record_path, error)) {
        fs::remove(backup_path, ec);
        return step_fail(ErrorKind::BackupFailure, "Writing backup record failed: " + error);
    }

    spdlog::info("[Updater] Backed up {} to {}", plan_.old_exe, backup_path);
    return step_ok();
}

// ── 4. Swap ─────────────────────────────────────────────────

StepResult SwapEngine::swap() {
    std::error_code ec;
    if (!fs::is_regular_file(plan_.new_exe, ec)) {
        return step_fail(ErrorKind::SwapFailure, plan_.new_exe + " is not a regular file");
    }

    fs::permissions(plan_.new_exe,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return step_fail(ErrorKind::SwapFailure, "chmod +x " + plan_.new_exe + ": " + ec.message());
    }

    if (::rename(plan_.new_exe.c_str(), plan_.old_exe.c_str()) == 0) {
        if (!fsync_directory(context_.executable_directory())) {
            spdlog::warn("[Updater] Could not fsync {}", context_.executable_directory());
        }
        spdlog::info("[Updater] Swapped in {}", plan_.old_exe);
        return step_ok();
    }

    int rename_errno = errno;
    if (rename_errno != EXDEV) {
        return step_fail(ErrorKind::SwapFailure,
                         "rename " + plan_.new_exe + " -> " + plan_.old_exe + ": " +
                         std::strerror(rename_errno));
    }

    // Staged file lives on another filesystem: copy next to the target, then rename
    spdlog::info("[Updater] {} is on another filesystem, copying first", plan_.new_exe);
    std::string error;
    if (!durable_copy(plan_.new_exe, plan_.old_exe, error)) {
        return step_fail(ErrorKind::SwapFailure, "Cross-device swap failed: " + error);
    }
    fs::remove(plan_.new_exe, ec);
    spdlog::info("[Updater] Swapped in {}", plan_.old_exe);
    return step_ok();
}

// ── 5. Verify ───────────────────────────────────────────────

StepResult SwapEngine::verify() const {
    std::error_code ec;
    const auto& path = plan_.old_exe;

    if (!fs::exists(path, ec)) {
        return step_fail(ErrorKind::VerifyFailure, path + " is missing after swap");
    }
    if (!fs::is_regular_file(path, ec)) {
        return step_fail(ErrorKind::VerifyFailure, path + " is not a regular file");
    }
    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        return step_fail(ErrorKind::VerifyFailure, path + " is empty");
    }
    if (::access(path.c_str(), X_OK) != 0) {
        return step_fail(ErrorKind::VerifyFailure, path + " is not executable");
    }
    return step_ok();
}

// ── 6. Relaunch ─────────────────────────────────────────────

StepResult SwapEngine::relaunch() {
    std::vector<std::string> args;
    if (!plan_.updated_to.empty()) {
        args = {"--updated-to", plan_.updated_to};
    }

    SpawnResult spawn = launcher_(plan_.old_exe, args);
    if (!spawn.success) {
        return step_fail(ErrorKind::RelaunchFailure, "Relaunch failed: " + spawn.error);
    }
    if (!confirmer_(spawn.pid, plan_.confirm_window)) {
        return step_fail(ErrorKind::RelaunchFailure,
                         "Relaunched process " + std::to_string(spawn.pid) + " exited with an error");
    }
    spdlog::info("[Updater] Relaunched {} (pid {})", plan_.old_exe, spawn.pid);
    return step_ok();
}

void SwapEngine::relaunch_restored() {
    SpawnResult spawn = launcher_(plan_.old_exe, {});
    if (spawn.success) {
        spdlog::info("[Updater] Restarted previous version (pid {})", spawn.pid);
    } else {
        spdlog::warn("[Updater] Could not restart previous version: {}", spawn.error);
    }
}

// ── Companion files ─────────────────────────────────────────

int SwapEngine::install_companions() {
    if (plan_.staging_dir.empty()) return 0;

    std::error_code ec;
    fs::path payload = fs::path(plan_.new_exe).parent_path();
    fs::path staging = fs::weakly_canonical(plan_.staging_dir, ec);
    if (ec) return 0;
    fs::path payload_canonical = fs::weakly_canonical(payload, ec);
    if (ec) return 0;

    // Only files shipped inside the staging directory are ever installed
    auto inside = payload_canonical.lexically_relative(staging);
    if (inside.empty() || *inside.begin() == ".." || !fs::is_directory(payload_canonical, ec)) {
        return 0;
    }

    fs::path install_dir = context_.executable_directory();
    int installed = 0;
    for (auto it = fs::recursive_directory_iterator(payload_canonical, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || !it->is_regular_file(entry_ec)) continue;

        fs::path target = install_dir / it->path().lexically_relative(payload_canonical);
        fs::create_directories(target.parent_path(), entry_ec);

        std::string error;
        if (entry_ec || !durable_copy(it->path().string(), target.string(), error)) {
            spdlog::warn("[Updater] Could not install {}: {}", target.string(),
                         entry_ec ? entry_ec.message() : error);
            continue;
        }
        spdlog::info("[Updater] Installed {}", target.string());
        ++installed;
    }
    if (ec) {
        spdlog::warn("[Updater] Listing {} failed: {}", payload_canonical.string(), ec.message());
    }
    return installed;
}

// ── Rollback ────────────────────────────────────────────────

StepResult SwapEngine::rollback() {
    return restore(context_.backup_executable_path, plan_.old_exe, context_.backup_record_path);
}

StepResult SwapEngine::restore(const std::string& backup_path, const std::string& original_path,
                               const std::string& record_path) {
    std::string error;
    std::error_code ec;

    if (!fs::is_regular_file(backup_path, ec) || ::access(backup_path.c_str(), R_OK) != 0) {
        spdlog::critical("[Updater] Backup {} is unreadable, manual reinstall required", backup_path);
        return step_fail(ErrorKind::RollbackFailed, "Backup " + backup_path + " is unreadable");
    }

    if (!durable_copy(backup_path, original_path, error)) {
        spdlog::critical("[Updater] Restoring {} failed ({}), manual reinstall required",
                         original_path, error);
        return step_fail(ErrorKind::RollbackFailed, "Restore failed: " + error);
    }

    // Original is good again; the backup and record have served their purpose
    fs::remove(backup_path, ec);
    if (ec) {
        spdlog::warn("[Updater] Could not remove {}: {}", backup_path, ec.message());
    }
    if (!BackupRecord::remove(record_path, error)) {
        spdlog::warn("[Updater] {}", error);
    }

    spdlog::info("[Updater] Restored {} from {}", original_path, backup_path);
    return step_ok();
}

// ── 7. Cleanup ──────────────────────────────────────────────

void SwapEngine::cleanup() {
    std::error_code ec;
    std::string error;

    fs::remove(context_.backup_executable_path, ec);
    if (ec) {
        spdlog::warn("[Updater] Could not remove {}: {}", context_.backup_executable_path, ec.message());
    }
    if (!BackupRecord::remove(context_.backup_record_path, error)) {
        spdlog::warn("[Updater] {}", error);
    }
    remove_staging();
}

void SwapEngine::remove_staging() {
    if (plan_.staging_dir.empty()) return;

    // Never let a bad argument take the install directory with it
    std::error_code ec;
    fs::path staging = fs::weakly_canonical(plan_.staging_dir, ec);
    if (ec) {
        spdlog::warn("[Updater] Cannot resolve staging directory {}: {}", plan_.staging_dir, ec.message());
        return;
    }
    fs::path exe = fs::weakly_canonical(plan_.old_exe, ec);
    if (ec) exe = plan_.old_exe;
    auto rel = exe.lexically_relative(staging);
    if (staging == exe.parent_path() || staging == staging.root_path() ||
        (!rel.empty() && *rel.begin() != "..")) {
        spdlog::warn("[Updater] Refusing to remove staging directory {}", plan_.staging_dir);
        return;
    }

    fs::remove_all(staging, ec);
    if (ec) {
        spdlog::warn("[Updater] Could not remove {}: {}", staging.string(), ec.message());
    }
}
