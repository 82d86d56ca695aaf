#include "app.hpp"
#include "core/config.hpp"
#include "core/install_context.hpp"
#include "core/orchestrator.hpp"
#include "ui/update_banner.hpp"

#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component.hpp>
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>

#ifndef APP_VERSION
#define APP_VERSION "0.0.0"
#endif

using namespace ftxui;

struct App::Impl {
    AppConfig config;
    InstallContext context;
    UpdateBanner banner;
    std::unique_ptr<UpdateOrchestrator> orchestrator;

    ScreenInteractive screen = ScreenInteractive::FullscreenAlternateScreen();

    void init_orchestrator() {
        OrchestratorCallbacks cb;

        // Both run on orchestrator threads: copy into the banner, then wake the UI loop
        cb.on_state_change = [this](UpdateState state, ErrorKind error) {
            if (orchestrator) {
                banner.set_versions(orchestrator->current_version(), orchestrator->release().version);
            }
            banner.set_state(state, error);
            if (state != UpdateState::Idle) {
                banner.set_notice("");
            }
            screen.Post(Event::Custom);
        };
        cb.on_progress = [this](const DownloadSnapshot& snapshot) {
            banner.set_progress(snapshot);
            screen.Post(Event::Custom);
        };

        OrchestratorHooks hooks;
        hooks.exit_process = [this](int /*code*/) {
            // Leave the alternate screen before the process goes away
            screen.Exit();
        };

        orchestrator = std::make_unique<UpdateOrchestrator>(
            OrchestratorOptions::from_config(config), context, APP_VERSION,
            std::move(cb), std::move(hooks));

        banner.set_supported(orchestrator->updates_supported());
        banner.set_versions(APP_VERSION, "");
    }

    bool handle_key(const Event& event) {
        if (!event.is_character()) return false;
        const std::string c = event.character();

        if (c == "q" || c == "Q") {
            screen.Exit();
            return true;
        }
        if (c == "u" || c == "U") {
            orchestrator->check_now();
            return true;
        }
        if (c == "d" || c == "D") {
            orchestrator->confirm_download();
            return true;
        }
        if (c == "n" || c == "N") {
            orchestrator->decline();
            return true;
        }
        if (c == "c" || c == "C") {
            orchestrator->cancel_download();
            return true;
        }
        if (c == "i" || c == "I") {
            orchestrator->install();
            return true;
        }
        if (c == "r" || c == "R") {
            orchestrator->retry();
            return true;
        }
        if (c == "x" || c == "X") {
            orchestrator->dismiss();
            return true;
        }
        return false;
    }

    Component main_component() {
        auto body = Renderer([this] {
            std::string changelog;
            std::string status;
            if (orchestrator) {
                auto release = orchestrator->release();
                if (orchestrator->state() != UpdateState::Idle) {
                    changelog = release.changelog;
                }
                status = orchestrator->status_message();
            }

            Elements lines;
            lines.push_back(text("selfupdate " + std::string(APP_VERSION)) | bold);
            lines.push_back(text(context.current_executable_path) | dim);
            lines.push_back(separator());
            lines.push_back(text(status));
            if (!changelog.empty()) {
                lines.push_back(separator());
                lines.push_back(paragraph(changelog));
            }
            return vbox(std::move(lines)) | flex;
        });

        auto layout = Renderer(body, [this, body] {
            return vbox({
                body->Render() | border | flex,
                banner.component()->Render(),
            });
        });

        return CatchEvent(layout, [this](Event event) { return handle_key(event); });
    }
};

App::App(const Config& config, const std::string& notice) : impl_(std::make_unique<Impl>()) {
    impl_->config = config.data();
    impl_->context = InstallContext::resolve();
    impl_->banner.set_notice(notice);
    impl_->init_orchestrator();
}

App::~App() {
    if (impl_->orchestrator) {
        impl_->orchestrator->shutdown();
    }
}

void App::run() {
    if (impl_->config.update.check_on_startup) {
        impl_->orchestrator->start_periodic_checks();
    }

    // Run the TUI
    impl_->screen.Loop(impl_->main_component());

    // Cleanup
    UpdateState final_state = impl_->orchestrator->state();
    impl_->orchestrator->shutdown();
    if (final_state == UpdateState::HandingOff) {
        spdlog::info("[App] Exiting for update hand-off");
    }
}
