#include <gtest/gtest.h>
#include "core/orchestrator.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <functional>
#include <mutex>

using namespace std::chrono_literals;

static const std::string kSuffix = "-linux-x86_64.tar.gz";

// ── Transition table ────────────────────────────────────────

TEST(UpdateStateTest, AllowedEdges) {
    using S = UpdateState;
    EXPECT_TRUE(is_allowed_transition(S::Idle, S::Checking));
    EXPECT_TRUE(is_allowed_transition(S::Checking, S::Available));
    EXPECT_TRUE(is_allowed_transition(S::Checking, S::Idle));
    EXPECT_TRUE(is_allowed_transition(S::Available, S::Downloading));
    EXPECT_TRUE(is_allowed_transition(S::Available, S::Idle));
    EXPECT_TRUE(is_allowed_transition(S::Downloading, S::ReadyToInstall));
    EXPECT_TRUE(is_allowed_transition(S::Downloading, S::Failed));
    EXPECT_TRUE(is_allowed_transition(S::ReadyToInstall, S::HandingOff));
    EXPECT_TRUE(is_allowed_transition(S::ReadyToInstall, S::Failed));
    EXPECT_TRUE(is_allowed_transition(S::Failed, S::Idle));
}

TEST(UpdateStateTest, ForbiddenEdges) {
    using S = UpdateState;
    EXPECT_FALSE(is_allowed_transition(S::Idle, S::Downloading));
    EXPECT_FALSE(is_allowed_transition(S::Checking, S::Downloading));
    EXPECT_FALSE(is_allowed_transition(S::Checking, S::Failed));
    EXPECT_FALSE(is_allowed_transition(S::Available, S::ReadyToInstall));
    EXPECT_FALSE(is_allowed_transition(S::Downloading, S::Idle));
    EXPECT_FALSE(is_allowed_transition(S::Failed, S::Checking));
    for (auto to : {S::Idle, S::Checking, S::Available, S::Downloading,
                    S::ReadyToInstall, S::HandingOff, S::Failed}) {
        EXPECT_FALSE(is_allowed_transition(S::HandingOff, to)) << update_state_name(to);
    }
}

// ── Orchestrator against a local release server ─────────────

/// Thread-safe log of everything the orchestrator reported
struct Recorder {
    std::mutex mutex;
    std::vector<UpdateState> states;
    std::vector<ErrorKind> errors;
    std::vector<DownloadSnapshot> progress;
    std::string launched_path;
    std::vector<std::string> launched_args;
    int launches = 0;
    int exit_code = -1;

    std::vector<UpdateState> state_log() {
        std::lock_guard<std::mutex> lock(mutex);
        return states;
    }
};

class OrchestratorTest : public ::testing::Test {
protected:
    std::string dir;
    std::string exe;
    std::string archive;
    LocalServer srv;
    Recorder rec;
    std::atomic<int> asset_requests{0};
    std::unique_ptr<UpdateOrchestrator> orch;
    std::function<void(UpdateState)> on_state;

    void SetUp() override {
        dir = unique_temp_dir("orch");
        exe = dir + "/selfupdate";
        write_file(exe, fake_executable("v1.2.0"), true);
        write_file(dir + "/" + InstallContext::kPackagedMarker, "");
        archive = build_archive(dir + "/build", {{"selfupdate", fake_executable("v1.3.0")}});
        ASSERT_FALSE(archive.empty());
    }

    void TearDown() override {
        orch.reset();
        fs::remove_all(dir);
    }

    void serve_release(const std::string& tag, const std::string& sidecar_url = "") {
        std::string json = release_json(tag, "selfupdate" + kSuffix, srv.url("/dl/a.tar.gz"),
                                        static_cast<int64_t>(archive.size()), sidecar_url);
        srv.server().Get("/releases/latest", [json](const httplib::Request&, httplib::Response& res) {
            res.set_content(json, "application/json");
        });
    }

    void serve_asset() {
        srv.server().Get("/dl/a.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
            ++asset_requests;
            res.set_content(archive, "application/octet-stream");
        });
    }

    OrchestratorOptions options() {
        OrchestratorOptions o;
        o.endpoint = srv.url("/releases/latest");
        o.asset_suffix = kSuffix;
        o.user_agent = "selfupdate-test";
        o.lookup_timeout = 2000ms;
        o.connect_timeout_ms = 2000;
        o.read_timeout_ms = 2000;
        o.check_interval = 0ms;
        o.handoff_grace = 0ms;
        o.progress_interval = 20ms;
        o.updater_wait_timeout_ms = 3000;
        o.updater_poll_interval_ms = 50;
        return o;
    }

    void make(const std::string& version, bool launch_ok = true,
              OrchestratorOptions opts = OrchestratorOptions()) {
        if (opts.endpoint.empty()) opts = options();

        OrchestratorCallbacks cb;
        cb.on_state_change = [this](UpdateState s, ErrorKind e) {
            {
                std::lock_guard<std::mutex> lock(rec.mutex);
                rec.states.push_back(s);
                rec.errors.push_back(e);
            }
            if (on_state) on_state(s);
        };
        cb.on_progress = [this](const DownloadSnapshot& snap) {
            std::lock_guard<std::mutex> lock(rec.mutex);
            rec.progress.push_back(snap);
        };

        OrchestratorHooks hooks;
        hooks.launch_updater = [this, launch_ok](const std::string& path,
                                                 const std::vector<std::string>& args) {
            std::lock_guard<std::mutex> lock(rec.mutex);
            rec.launches++;
            rec.launched_path = path;
            rec.launched_args = args;
            SpawnResult r;
            if (launch_ok) {
                r.success = true;
                r.pid = 4242;
            } else {
                r.error = "exec failed: No such file or directory";
            }
            return r;
        };
        hooks.exit_process = [this](int code) {
            std::lock_guard<std::mutex> lock(rec.mutex);
            rec.exit_code = code;
        };

        orch = std::make_unique<UpdateOrchestrator>(opts, InstallContext::for_executable(exe),
                                                    version, cb, hooks);
    }

    void check_to_available() {
        ASSERT_TRUE(orch->check_now());
        ASSERT_TRUE(orch->wait_until_settled(5s));
        ASSERT_EQ(orch->state(), UpdateState::Available);
    }

    void download_to_ready() {
        check_to_available();
        ASSERT_TRUE(orch->confirm_download());
        ASSERT_TRUE(orch->wait_until_settled(10s));
        ASSERT_EQ(orch->state(), UpdateState::ReadyToInstall) << orch->failure_message();
    }
};

TEST_F(OrchestratorTest, SourceModeIsNoOp) {
    fs::remove(dir + "/" + InstallContext::kPackagedMarker);
    serve_release("v1.3.0");
    make("1.2.0");

    EXPECT_FALSE(orch->updates_supported());
    EXPECT_FALSE(orch->check_now());
    EXPECT_FALSE(orch->confirm_download());
    EXPECT_FALSE(orch->install());
    EXPECT_FALSE(orch->retry());
    orch->start_periodic_checks();
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_EQ(orch->status_message(), "Updates not supported in this installation mode.");
    EXPECT_TRUE(rec.state_log().empty());
}

TEST_F(OrchestratorTest, OlderReleaseIsUpToDate) {
    serve_release("v1.0.0");
    make("1.2.0");

    ASSERT_TRUE(orch->check_now());
    ASSERT_TRUE(orch->wait_until_settled(5s));
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_EQ(orch->last_check_outcome(), ErrorKind::AlreadyUpToDate);
    EXPECT_EQ(orch->failure(), ErrorKind::None);
    EXPECT_EQ(rec.state_log(), (std::vector<UpdateState>{UpdateState::Checking, UpdateState::Idle}));
}

TEST_F(OrchestratorTest, EqualReleaseIsUpToDate) {
    serve_release("v1.2.0");
    make("1.2.0");

    ASSERT_TRUE(orch->check_now());
    ASSERT_TRUE(orch->wait_until_settled(5s));
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_EQ(orch->last_check_outcome(), ErrorKind::AlreadyUpToDate);
    EXPECT_EQ(orch->status_message(), "Up to date (1.2.0)");
}

TEST_F(OrchestratorTest, UnreachableServerReturnsToIdleQuietly) {
    auto opts = options();
    opts.endpoint = "http://127.0.0.1:1/releases/latest";
    opts.lookup_timeout = 500ms;
    make("1.2.0", true, opts);

    ASSERT_TRUE(orch->check_now());
    ASSERT_TRUE(orch->wait_until_settled(5s));
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_EQ(orch->last_check_outcome(), ErrorKind::NetworkError);
    EXPECT_EQ(orch->failure(), ErrorKind::None);
}

TEST_F(OrchestratorTest, NewerReleaseWaitsForConsent) {
    serve_release("v1.3.0");
    serve_asset();
    make("1.2.0");

    check_to_available();
    EXPECT_EQ(orch->release().version, "1.3.0");
    EXPECT_EQ(orch->last_check_outcome(), ErrorKind::None);
    EXPECT_EQ(orch->status_message(), "Update available: 1.2.0 -> 1.3.0");

    std::this_thread::sleep_for(200ms);
    EXPECT_EQ(orch->state(), UpdateState::Available);
    EXPECT_EQ(asset_requests.load(), 0);
}

TEST_F(OrchestratorTest, OverlappingCheckIsRejected) {
    srv.server().Get("/releases/latest", [this](const httplib::Request&, httplib::Response& res) {
        for (int i = 0; i < 10 && !srv.stopping(); ++i) std::this_thread::sleep_for(30ms);
        res.set_content(release_json("v1.0.0", "selfupdate" + kSuffix, "http://x/a", 1),
                        "application/json");
    });
    make("1.2.0");

    ASSERT_TRUE(orch->check_now());
    EXPECT_EQ(orch->state(), UpdateState::Checking);
    EXPECT_FALSE(orch->check_now());
    ASSERT_TRUE(orch->wait_until_settled(5s));
    EXPECT_EQ(orch->state(), UpdateState::Idle);
}

TEST_F(OrchestratorTest, DeclineReturnsToIdle) {
    serve_release("v1.3.0");
    serve_asset();
    make("1.2.0");

    check_to_available();
    EXPECT_TRUE(orch->decline());
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_FALSE(orch->confirm_download());
    EXPECT_FALSE(orch->decline());
    EXPECT_EQ(asset_requests.load(), 0);
}

TEST_F(OrchestratorTest, FullFlowHandsOffToUpdater) {
    serve_release("v1.3.0");
    serve_asset();
    make("1.2.0");

    download_to_ready();
    auto ctx = orch->context();
    std::string staged = orch->staged_executable();
    EXPECT_EQ(staged, ctx.staging_directory + "/payload/selfupdate");
    EXPECT_EQ(read_file(staged), fake_executable("v1.3.0"));
    EXPECT_EQ(orch->progress().bytes_received, static_cast<int64_t>(archive.size()));
    EXPECT_EQ(orch->progress().phase, DownloadPhase::Done);

    // Nothing outside staging was touched
    EXPECT_EQ(read_file(exe), fake_executable("v1.2.0"));
    EXPECT_FALSE(fs::exists(ctx.backup_executable_path));
    EXPECT_FALSE(fs::exists(ctx.backup_record_path));

    EXPECT_TRUE(orch->install());
    EXPECT_EQ(orch->state(), UpdateState::HandingOff);
    EXPECT_FALSE(orch->install());

    std::lock_guard<std::mutex> lock(rec.mutex);
    EXPECT_EQ(rec.launches, 1);
    EXPECT_EQ(rec.exit_code, 0);
    EXPECT_EQ(rec.launched_path, dir + "/selfupdate-updater");

    auto arg_after = [&](const std::string& flag) {
        auto it = std::find(rec.launched_args.begin(), rec.launched_args.end(), flag);
        if (it == rec.launched_args.end() || it + 1 == rec.launched_args.end()) return std::string();
        return *(it + 1);
    };
    EXPECT_EQ(arg_after("--old-pid"), std::to_string(::getpid()));
    EXPECT_EQ(arg_after("--old-exe"), exe);
    EXPECT_EQ(arg_after("--new-exe"), staged);
    EXPECT_EQ(arg_after("--staging-dir"), ctx.staging_directory);
    EXPECT_EQ(arg_after("--updated-to"), "1.3.0");
    EXPECT_EQ(arg_after("--wait-timeout-ms"), "3000");
    EXPECT_EQ(arg_after("--poll-interval-ms"), "50");

    EXPECT_EQ(rec.states, (std::vector<UpdateState>{
        UpdateState::Checking, UpdateState::Available, UpdateState::Downloading,
        UpdateState::ReadyToInstall, UpdateState::HandingOff}));
    ASSERT_FALSE(rec.progress.empty());
    EXPECT_EQ(rec.progress.back().phase, DownloadPhase::Done);
}

TEST_F(OrchestratorTest, LaunchFailureRemovesStaging) {
    serve_release("v1.3.0");
    serve_asset();
    make("1.2.0", false);

    download_to_ready();
    std::string staging = orch->context().staging_directory;
    ASSERT_TRUE(fs::exists(staging));

    EXPECT_FALSE(orch->install());
    EXPECT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_EQ(orch->failure(), ErrorKind::LaunchFailure);
    EXPECT_FALSE(fs::exists(staging));
    EXPECT_EQ(read_file(exe), fake_executable("v1.2.0"));

    std::lock_guard<std::mutex> lock(rec.mutex);
    EXPECT_EQ(rec.exit_code, -1);
}

TEST_F(OrchestratorTest, DropThenRetryStartsFromZero) {
    std::string payload(200 * 1024, '\0');
    for (size_t i = 0; i < payload.size(); ++i) payload[i] = static_cast<char>((i * 7919) ^ (i >> 3));
    archive = build_archive(dir + "/build", {{"selfupdate", payload}});
    serve_release("v1.3.0");

    srv.server().Get("/dl/a.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
        int attempt = ++asset_requests;
        std::string body = archive;
        size_t cut = attempt == 1 ? body.size() * 4 / 10 : body.size();
        res.set_content_provider(body.size(), "application/octet-stream",
            [body, cut](size_t offset, size_t length, httplib::DataSink& sink) {
                if (offset >= cut) return false;
                size_t n = std::min({length, cut - offset, static_cast<size_t>(8192)});
                sink.write(body.data() + offset, n);
                return true;
            });
    });
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(orch->wait_until_settled(10s));
    ASSERT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_EQ(orch->failure(), ErrorKind::NetworkError);
    EXPECT_EQ(orch->status_message(),
              "Could not reach the update server. Check your connection and retry.");
    EXPECT_FALSE(fs::exists(orch->context().staging_directory));

    ASSERT_TRUE(orch->retry());
    ASSERT_TRUE(wait_for([&]() { return orch->state() == UpdateState::ReadyToInstall ||
                                        orch->state() == UpdateState::Failed; }));
    ASSERT_TRUE(orch->wait_until_settled(10s));
    ASSERT_EQ(orch->state(), UpdateState::ReadyToInstall) << orch->failure_message();
    EXPECT_EQ(orch->failure(), ErrorKind::None);
    EXPECT_EQ(asset_requests.load(), 2);
    // Counted from zero again, not resumed on top of the first attempt
    EXPECT_EQ(orch->progress().bytes_received, static_cast<int64_t>(archive.size()));
}

TEST_F(OrchestratorTest, RetryDownloadsWithoutSecondLookup) {
    std::atomic<int> lookups{0};
    std::string json = release_json("v1.3.0", "selfupdate" + kSuffix, srv.url("/dl/a.tar.gz"),
                                    static_cast<int64_t>(archive.size()));
    // Only the first lookup succeeds; the server is unreachable afterwards
    srv.server().Get("/releases/latest", [&lookups, json](const httplib::Request&, httplib::Response& res) {
        if (++lookups == 1) {
            res.set_content(json, "application/json");
        } else {
            res.status = 503;
        }
    });
    srv.server().Get("/dl/a.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
        if (++asset_requests == 1) {
            res.status = 503;
            return;
        }
        res.set_content(archive, "application/octet-stream");
    });
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(orch->wait_until_settled(10s));
    ASSERT_EQ(orch->state(), UpdateState::Failed);

    ASSERT_TRUE(orch->retry());
    ASSERT_TRUE(wait_for([&]() { return orch->state() == UpdateState::ReadyToInstall ||
                                        orch->state() == UpdateState::Failed; }));
    ASSERT_TRUE(orch->wait_until_settled(10s));
    EXPECT_EQ(orch->state(), UpdateState::ReadyToInstall) << orch->failure_message();
    EXPECT_EQ(lookups.load(), 1);
    EXPECT_EQ(asset_requests.load(), 2);
    EXPECT_EQ(orch->release().version, "1.3.0");

    auto states = rec.state_log();
    ASSERT_GE(states.size(), 5u);
    std::vector<UpdateState> tail(states.end() - 5, states.end());
    EXPECT_EQ(tail, (std::vector<UpdateState>{UpdateState::Idle, UpdateState::Checking,
                                              UpdateState::Available, UpdateState::Downloading,
                                              UpdateState::ReadyToInstall}));
}

TEST_F(OrchestratorTest, CancelOnEnteringDownloadIsHonoured) {
    serve_release("v1.3.0");
    serve_asset();
    on_state = [this](UpdateState s) {
        if (s == UpdateState::Downloading) orch->cancel_download();
    };
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(orch->wait_until_settled(10s));
    EXPECT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_EQ(orch->failure(), ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(orch->context().staging_directory));
}

TEST_F(OrchestratorTest, CancelEndsInCancelled) {
    serve_release("v1.3.0");
    const size_t total = 8 * 1024 * 1024;
    srv.server().Get("/dl/a.tar.gz", [this, total](const httplib::Request&, httplib::Response& res) {
        res.set_content_provider(total, "application/octet-stream",
            [this](size_t, size_t length, httplib::DataSink& sink) {
                if (srv.stopping()) return false;
                static const std::string chunk(1024, 'x');
                std::this_thread::sleep_for(5ms);
                return sink.write(chunk.data(), std::min(length, chunk.size()));
            });
    });
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(wait_for([&]() { return orch->progress().bytes_received > 0; }));
    orch->cancel_download();
    ASSERT_TRUE(orch->wait_until_settled(10s));

    EXPECT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_EQ(orch->failure(), ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(orch->context().staging_directory));

    EXPECT_TRUE(orch->dismiss());
    EXPECT_EQ(orch->state(), UpdateState::Idle);
    EXPECT_EQ(orch->failure(), ErrorKind::None);
}

TEST_F(OrchestratorTest, ChecksumMismatchIsVerifyFailure) {
    serve_release("v1.3.0", srv.url("/dl/a.tar.gz.sha256"));
    serve_asset();
    srv.server().Get("/dl/a.tar.gz.sha256", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(std::string(64, 'f') + "  selfupdate" + kSuffix + "\n", "text/plain");
    });
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(orch->wait_until_settled(10s));
    EXPECT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_EQ(orch->failure(), ErrorKind::VerifyFailure);
}

TEST_F(OrchestratorTest, MissingSidecarStillDownloads) {
    serve_release("v1.3.0", srv.url("/dl/missing.sha256"));
    serve_asset();
    make("1.2.0");

    download_to_ready();
}

TEST_F(OrchestratorTest, PeriodicCheckRunsImmediately) {
    serve_release("v1.3.0");
    make("1.2.0");

    orch->start_periodic_checks();
    ASSERT_TRUE(wait_for([&]() { return orch->state() == UpdateState::Available; }));
    EXPECT_EQ(orch->release().version, "1.3.0");
}

TEST_F(OrchestratorTest, ShutdownStopsDownload) {
    serve_release("v1.3.0");
    srv.server().Get("/dl/a.tar.gz", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content_provider(64 * 1024 * 1024, "application/octet-stream",
            [this](size_t, size_t length, httplib::DataSink& sink) {
                if (srv.stopping()) return false;
                static const std::string chunk(1024, 'x');
                std::this_thread::sleep_for(5ms);
                return sink.write(chunk.data(), std::min(length, chunk.size()));
            });
    });
    make("1.2.0");

    check_to_available();
    ASSERT_TRUE(orch->confirm_download());
    ASSERT_TRUE(wait_for([&]() { return orch->progress().bytes_received > 0; }));

    auto start = std::chrono::steady_clock::now();
    orch->shutdown();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_EQ(orch->state(), UpdateState::Failed);
    EXPECT_FALSE(orch->check_now());
    EXPECT_FALSE(fs::exists(orch->context().staging_directory));
}
