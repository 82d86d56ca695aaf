#include "core/orchestrator.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/version.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <thread>

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

namespace fs = std::filesystem;

const char* update_state_name(UpdateState state) {
    switch (state) {
        case UpdateState::Idle:           return "Idle";
        case UpdateState::Checking:       return "Checking";
        case UpdateState::Available:      return "Available";
        case UpdateState::Downloading:    return "Downloading";
        case UpdateState::ReadyToInstall: return "ReadyToInstall";
        case UpdateState::HandingOff:     return "HandingOff";
        case UpdateState::Failed:         return "Failed";
    }
    return "Unknown";
}

bool is_allowed_transition(UpdateState from, UpdateState to) {
    switch (from) {
        case UpdateState::Idle:
            return to == UpdateState::Checking;
        case UpdateState::Checking:
            return to == UpdateState::Available || to == UpdateState::Idle;
        case UpdateState::Available:
            return to == UpdateState::Downloading || to == UpdateState::Idle;
        case UpdateState::Downloading:
            return to == UpdateState::ReadyToInstall || to == UpdateState::Failed;
        case UpdateState::ReadyToInstall:
            return to == UpdateState::HandingOff || to == UpdateState::Failed;
        case UpdateState::HandingOff:
            return false;
        case UpdateState::Failed:
            return to == UpdateState::Idle;
    }
    return false;
}

OrchestratorOptions OrchestratorOptions::from_config(const AppConfig& config) {
    OrchestratorOptions opts;
    const auto& u = config.update;
    opts.endpoint = u.endpoint;
    opts.asset_suffix = u.asset_suffix.empty() ? Config::default_asset_suffix() : u.asset_suffix;
    opts.user_agent = std::string("selfupdate/") + APP_VERSION;
    opts.lookup_timeout = std::chrono::milliseconds(u.lookup_timeout_ms);
    opts.connect_timeout_ms = u.connect_timeout_ms;
    opts.read_timeout_ms = u.read_timeout_ms;
    opts.check_interval = std::chrono::hours(u.check_interval_hours);
    opts.handoff_grace = std::chrono::milliseconds(u.handoff_grace_ms);
    opts.verify_checksum = u.verify_checksum;
    opts.expected_files = u.expected_files;
    opts.updater_wait_timeout_ms = config.updater.wait_timeout_ms;
    opts.updater_poll_interval_ms = config.updater.poll_interval_ms;
    return opts;
}

// ════════════════════════════════════════════════════════════════
// Impl
// ════════════════════════════════════════════════════════════════

struct UpdateOrchestrator::Impl {
    OrchestratorOptions options;
    InstallContext context;
    std::string current_version;
    OrchestratorCallbacks callbacks;
    OrchestratorHooks hooks;
    bool supported = false;

    std::atomic<UpdateState> state{UpdateState::Idle};

    // Guards everything below up to the thread handles
    mutable std::mutex mutex;
    mutable std::condition_variable settled_cv;
    ReleaseInfo release;
    ErrorKind failure = ErrorKind::None;
    std::string failure_message;
    ErrorKind last_check = ErrorKind::None;
    std::string staged_executable;
    int active_jobs = 0;

    DownloadProgress progress;
    std::atomic<bool> cancel_flag{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> installing{false};

    std::mutex threads_mutex;
    std::thread check_thread;
    std::thread download_thread;
    std::thread timer_thread;

    std::mutex timer_mutex;
    std::condition_variable timer_cv;

    static void reap(std::thread& t) {
        if (!t.joinable()) return;
        // A callback running on this very thread re-entered us
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }

    bool transition(UpdateState from, UpdateState to,
                    ErrorKind error = ErrorKind::None,
                    const std::string& message = "") {
        if (!is_allowed_transition(from, to)) {
            spdlog::warn("[Orchestrator] Rejected transition {} -> {}",
                         update_state_name(from), update_state_name(to));
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            UpdateState expected = from;
            if (!state.compare_exchange_strong(expected, to)) {
                spdlog::warn("[Orchestrator] Rejected transition {} -> {} (state is {})",
                             update_state_name(from), update_state_name(to),
                             update_state_name(expected));
                return false;
            }
            if (to == UpdateState::Failed) {
                failure = error;
                failure_message = message;
            } else if (to == UpdateState::Idle) {
                failure = ErrorKind::None;
                failure_message.clear();
            }
        }
        settled_cv.notify_all();

        if (to == UpdateState::Failed) {
            spdlog::warn("[Orchestrator] {} -> Failed ({}): {}",
                         update_state_name(from), error_kind_name(error), message);
        } else {
            spdlog::info("[Orchestrator] {} -> {}", update_state_name(from), update_state_name(to));
        }

        if (callbacks.on_state_change) {
            callbacks.on_state_change(to, to == UpdateState::Failed ? error : ErrorKind::None);
        }
        return true;
    }

    /// Replace the thread in slot with a new one running fn.
    /// Refused once shutdown() has begun.
    bool launch(std::thread& slot, std::function<void()> fn) {
        std::thread previous;
        {
            std::lock_guard<std::mutex> lock(threads_mutex);
            if (stopping.load()) return false;
            previous = std::move(slot);
        }
        reap(previous);

        std::lock_guard<std::mutex> lock(threads_mutex);
        if (stopping.load()) return false;
        slot = std::thread(std::move(fn));
        return true;
    }

    bool start_job(std::thread& slot, std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++active_jobs;
        }
        auto body = [this, job = std::move(job)]() {
            job();
            {
                std::lock_guard<std::mutex> lock(mutex);
                --active_jobs;
            }
            settled_cv.notify_all();
        };
        if (launch(slot, std::move(body))) {
            return true;
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            --active_jobs;
        }
        settled_cv.notify_all();
        return false;
    }

    // ── Check ───────────────────────────────────────────────

    bool start_check(bool auto_download, bool reuse_release = false) {
        if (!supported || stopping.load()) return false;
        if (!transition(UpdateState::Idle, UpdateState::Checking)) return false;

        auto job = [this, auto_download, reuse_release]() {
            if (reuse_release) {
                offer_cached_release();
            } else {
                run_check(auto_download);
            }
        };
        if (!start_job(check_thread, std::move(job))) {
            transition(UpdateState::Checking, UpdateState::Idle);
            return false;
        }
        return true;
    }

    void run_check(bool auto_download) {
        ReleaseClient client(options.endpoint, options.asset_suffix, options.user_agent);
        LookupResult result = client.fetch_latest_release(options.lookup_timeout);

        ErrorKind outcome = ErrorKind::None;
        if (stopping.load()) {
            outcome = ErrorKind::Cancelled;
        } else if (!result.success) {
            outcome = result.error;
            if (result.error == ErrorKind::NetworkError || result.error == ErrorKind::Timeout) {
                spdlog::debug("[Orchestrator] Update check failed: {}", result.message);
            } else {
                spdlog::warn("[Orchestrator] Update check failed ({}): {}",
                             error_kind_name(result.error), result.message);
            }
        } else {
            auto cmp = compare_versions(current_version, result.release.version);
            if (!cmp.valid) {
                outcome = ErrorKind::InvalidVersion;
                spdlog::warn("[Orchestrator] Cannot compare '{}' with '{}'",
                             current_version, result.release.version);
            } else if (cmp.order != VersionOrder::Less) {
                outcome = ErrorKind::AlreadyUpToDate;
                spdlog::info("[Orchestrator] Up to date ({}, latest {})",
                             current_version, result.release.version);
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            last_check = outcome;
            if (outcome == ErrorKind::None) {
                release = result.release;
            }
        }

        if (outcome != ErrorKind::None) {
            transition(UpdateState::Checking, UpdateState::Idle);
            return;
        }

        spdlog::info("[Orchestrator] Update available: {} -> {}",
                     current_version, result.release.version);
        if (transition(UpdateState::Checking, UpdateState::Available) && auto_download) {
            start_download();
        }
    }

    /// Retry path: the release the user consented to is offered again
    /// without a lookup and downloaded straight away.
    void offer_cached_release() {
        std::string version;
        {
            std::lock_guard<std::mutex> lock(mutex);
            version = release.version;
        }
        if (stopping.load()) {
            transition(UpdateState::Checking, UpdateState::Idle);
            return;
        }
        spdlog::info("[Orchestrator] Retrying download of {}", version);
        if (transition(UpdateState::Checking, UpdateState::Available)) {
            start_download();
        }
    }

    bool has_cached_release() const {
        std::lock_guard<std::mutex> lock(mutex);
        return !release.asset_url.empty();
    }

    // ── Download ────────────────────────────────────────────

    bool start_download() {
        if (!supported || stopping.load()) return false;
        if (state.load() != UpdateState::Available) return false;
        // Reset before entering Downloading so an early cancel is not lost
        cancel_flag.store(false);
        progress.reset();
        if (!transition(UpdateState::Available, UpdateState::Downloading)) return false;

        if (!start_job(download_thread, [this]() { run_download(); })) {
            transition(UpdateState::Downloading, UpdateState::Failed,
                       ErrorKind::Cancelled, "Shutting down");
            return false;
        }
        return true;
    }

    FetcherOptions fetcher_options() const {
        FetcherOptions fo;
        fo.executable_name = context.executable_name();
        fo.expected_files = options.expected_files;
        if (fo.expected_files.empty()) {
            fo.expected_files.push_back(fo.executable_name);
        }
        fo.connect_timeout_ms = options.connect_timeout_ms;
        fo.read_timeout_ms = options.read_timeout_ms;
        fo.user_agent = options.user_agent;
        return fo;
    }

    void emit_progress() {
        if (callbacks.on_progress) {
            callbacks.on_progress(progress.snapshot());
        }
    }

    void run_download() {
        ReleaseInfo target;
        {
            std::lock_guard<std::mutex> lock(mutex);
            target = release;
        }

        ArchiveFetcher fetcher(fetcher_options());

        std::string expected_sha256;
        if (options.verify_checksum && !target.checksum_url.empty()) {
            expected_sha256 = ArchiveFetcher::parse_checksum(fetcher.fetch_text(target.checksum_url));
            if (expected_sha256.empty()) {
                spdlog::warn("[Orchestrator] Checksum sidecar unavailable, continuing without it");
            }
        }

        // Progress sampler
        std::mutex sampler_mutex;
        std::condition_variable sampler_cv;
        bool sampler_done = false;
        std::thread sampler([&]() {
            std::unique_lock<std::mutex> lock(sampler_mutex);
            while (!sampler_cv.wait_for(lock, options.progress_interval,
                                        [&]() { return sampler_done; })) {
                lock.unlock();
                emit_progress();
                lock.lock();
            }
        });

        FetchResult result = fetcher.download(target.asset_url, context.staging_directory,
                                              &progress, &cancel_flag, expected_sha256);

        {
            std::lock_guard<std::mutex> lock(sampler_mutex);
            sampler_done = true;
        }
        sampler_cv.notify_all();
        sampler.join();
        emit_progress();

        if (!result.success) {
            transition(UpdateState::Downloading, UpdateState::Failed, result.error, result.message);
            return;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            staged_executable = result.extracted_path;
        }
        transition(UpdateState::Downloading, UpdateState::ReadyToInstall);
    }

    // ── Install ─────────────────────────────────────────────

    std::vector<std::string> updater_args(const std::string& staged, const std::string& version) const {
        std::vector<std::string> args = {
            "--old-pid", std::to_string(current_pid()),
            "--old-exe", context.current_executable_path,
            "--new-exe", staged,
            "--staging-dir", context.staging_directory,
            "--updated-to", version,
            "--wait-timeout-ms", std::to_string(options.updater_wait_timeout_ms),
            "--poll-interval-ms", std::to_string(options.updater_poll_interval_ms),
        };
        if (!options.updater_log_file.empty()) {
            args.push_back("--log-file");
            args.push_back(options.updater_log_file);
        }
        return args;
    }

    /// A release that ships its own updater installs with it; the staged
    /// copy then refreshes the installed one. Otherwise use the installed one.
    std::string updater_for(const std::string& staged) const {
        fs::path candidate = fs::path(staged).parent_path() / InstallContext::kUpdaterName;
        std::error_code ec;
        if (!fs::is_regular_file(candidate, ec)) {
            return context.updater_executable_path;
        }
        fs::permissions(candidate,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add, ec);
        if (ec) {
            spdlog::warn("[Orchestrator] Staged updater {} not executable ({}), using installed one",
                         candidate.string(), ec.message());
            return context.updater_executable_path;
        }
        return candidate.string();
    }

    void remove_staging() {
        std::error_code ec;
        fs::remove_all(context.staging_directory, ec);
        if (ec) {
            spdlog::warn("[Orchestrator] Could not remove {}: {}", context.staging_directory, ec.message());
        }
    }

    // ── Periodic checks ─────────────────────────────────────

    void timer_loop() {
        start_check(false);
        if (options.check_interval.count() <= 0) return;

        std::unique_lock<std::mutex> lock(timer_mutex);
        while (!stopping.load()) {
            if (timer_cv.wait_for(lock, options.check_interval, [this]() { return stopping.load(); })) {
                break;
            }
            lock.unlock();
            if (state.load() == UpdateState::Idle) {
                start_check(false);
            }
            lock.lock();
        }
    }
};

// ════════════════════════════════════════════════════════════════
// UpdateOrchestrator
// ════════════════════════════════════════════════════════════════

UpdateOrchestrator::UpdateOrchestrator(OrchestratorOptions options,
                                       InstallContext context,
                                       std::string current_version,
                                       OrchestratorCallbacks callbacks,
                                       OrchestratorHooks hooks)
    : impl_(std::make_unique<Impl>()) {
    impl_->options = std::move(options);
    impl_->context = std::move(context);
    impl_->current_version = std::move(current_version);
    impl_->callbacks = std::move(callbacks);
    impl_->hooks = std::move(hooks);
    impl_->supported = impl_->context.is_packaged && !impl_->context.current_executable_path.empty();

    auto& grace = impl_->options.handoff_grace;
    grace = std::clamp(grace, std::chrono::milliseconds(0),
                       std::chrono::milliseconds(Config::kMaxHandoffGraceMs));
    if (impl_->options.progress_interval.count() <= 0) {
        impl_->options.progress_interval = std::chrono::milliseconds(250);
    }

    if (!impl_->hooks.launch_updater) {
        impl_->hooks.launch_updater = [](const std::string& path, const std::vector<std::string>& args) {
            return spawn_detached(path, args);
        };
    }
    if (!impl_->hooks.exit_process) {
        impl_->hooks.exit_process = [](int code) {
            flush_logging();
            std::_Exit(code);
        };
    }

    if (!impl_->supported) {
        spdlog::info("[Orchestrator] Source-mode run ({}), self-update disabled",
                     impl_->context.current_executable_path);
    }
}

UpdateOrchestrator::~UpdateOrchestrator() {
    shutdown();
}

bool UpdateOrchestrator::check_now() {
    return impl_->start_check(false);
}

void UpdateOrchestrator::start_periodic_checks() {
    if (!impl_->supported) return;
    std::lock_guard<std::mutex> lock(impl_->threads_mutex);
    if (impl_->stopping.load() || impl_->timer_thread.joinable()) return;
    impl_->timer_thread = std::thread([this]() { impl_->timer_loop(); });
}

bool UpdateOrchestrator::confirm_download() {
    return impl_->start_download();
}

void UpdateOrchestrator::cancel_download() {
    if (impl_->state.load() != UpdateState::Downloading) return;
    spdlog::info("[Orchestrator] Cancelling download");
    impl_->cancel_flag.store(true);
}

bool UpdateOrchestrator::decline() {
    if (!impl_->supported) return false;
    return impl_->transition(UpdateState::Available, UpdateState::Idle);
}

bool UpdateOrchestrator::dismiss() {
    if (!impl_->supported) return false;
    return impl_->transition(UpdateState::Failed, UpdateState::Idle);
}

bool UpdateOrchestrator::retry() {
    if (!impl_->supported || impl_->stopping.load()) return false;
    bool cached = impl_->has_cached_release();
    if (!impl_->transition(UpdateState::Failed, UpdateState::Idle)) return false;
    return impl_->start_check(true, cached);
}

bool UpdateOrchestrator::install() {
    if (!impl_->supported) return false;

    bool expected = false;
    if (!impl_->installing.compare_exchange_strong(expected, true)) return false;
    if (impl_->state.load() != UpdateState::ReadyToInstall) {
        impl_->installing.store(false);
        return false;
    }

    std::string staged;
    std::string version;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        staged = impl_->staged_executable;
        version = impl_->release.version;
    }

    std::string updater = impl_->updater_for(staged);
    spdlog::info("[Orchestrator] Launching {} to install {}", updater, version);
    flush_logging();

    SpawnResult spawn = impl_->hooks.launch_updater(updater, impl_->updater_args(staged, version));
    if (!spawn.success) {
        impl_->remove_staging();
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->staged_executable.clear();
        }
        impl_->transition(UpdateState::ReadyToInstall, UpdateState::Failed,
                          ErrorKind::LaunchFailure, spawn.error);
        impl_->installing.store(false);
        return false;
    }

    impl_->transition(UpdateState::ReadyToInstall, UpdateState::HandingOff);
    spdlog::info("[Orchestrator] Updater running (pid {}), exiting in {} ms",
                 spawn.pid, impl_->options.handoff_grace.count());
    flush_logging();

    std::this_thread::sleep_for(impl_->options.handoff_grace);
    impl_->hooks.exit_process(0);
    return true;
}

void UpdateOrchestrator::shutdown() {
    std::thread check;
    std::thread download;
    std::thread timer;
    {
        std::lock_guard<std::mutex> lock(impl_->threads_mutex);
        impl_->stopping.store(true);
        check = std::move(impl_->check_thread);
        download = std::move(impl_->download_thread);
        timer = std::move(impl_->timer_thread);
    }
    impl_->cancel_flag.store(true);
    {
        std::lock_guard<std::mutex> lock(impl_->timer_mutex);
    }
    impl_->timer_cv.notify_all();

    Impl::reap(timer);
    Impl::reap(check);
    Impl::reap(download);
}

bool UpdateOrchestrator::wait_until_settled(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    return impl_->settled_cv.wait_for(lock, timeout, [this]() { return impl_->active_jobs == 0; });
}

UpdateState UpdateOrchestrator::state() const {
    return impl_->state.load();
}

ErrorKind UpdateOrchestrator::failure() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->failure;
}

std::string UpdateOrchestrator::failure_message() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->failure_message;
}

ErrorKind UpdateOrchestrator::last_check_outcome() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->last_check;
}

ReleaseInfo UpdateOrchestrator::release() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->release;
}

DownloadSnapshot UpdateOrchestrator::progress() const {
    return impl_->progress.snapshot();
}

std::string UpdateOrchestrator::staged_executable() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->staged_executable;
}

const std::string& UpdateOrchestrator::current_version() const {
    return impl_->current_version;
}

bool UpdateOrchestrator::updates_supported() const {
    return impl_->supported;
}

const InstallContext& UpdateOrchestrator::context() const {
    return impl_->context;
}

std::string UpdateOrchestrator::status_message() const {
    if (!impl_->supported) {
        return error_user_message(ErrorKind::NotSupported);
    }

    std::string latest;
    ErrorKind last_check;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        latest = impl_->release.version;
        last_check = impl_->last_check;
    }

    switch (impl_->state.load()) {
        case UpdateState::Idle:
            if (last_check == ErrorKind::AlreadyUpToDate) {
                return "Up to date (" + impl_->current_version + ")";
            }
            return "Version " + impl_->current_version;
        case UpdateState::Checking:
            return "Checking for updates...";
        case UpdateState::Available:
            return "Update available: " + impl_->current_version + " -> " + latest;
        case UpdateState::Downloading: {
            auto snap = impl_->progress.snapshot();
            int pct = snap.percent();
            if (snap.phase == DownloadPhase::Extracting) {
                return "Unpacking " + latest + "...";
            }
            if (pct >= 0) {
                return "Downloading " + latest + " (" + std::to_string(pct) + "%)";
            }
            return "Downloading " + latest + " (" + std::to_string(snap.bytes_received / 1024) + " KiB)";
        }
        case UpdateState::ReadyToInstall:
            return "Update " + latest + " ready to install";
        case UpdateState::HandingOff:
            return "Installing update " + latest + "...";
        case UpdateState::Failed:
            return error_user_message(failure());
    }
    return "";
}
