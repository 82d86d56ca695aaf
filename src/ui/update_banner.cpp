#include "ui/update_banner.hpp"

#include <ftxui/dom/elements.hpp>
#include <iomanip>
#include <sstream>

using namespace ftxui;

UpdateBanner::UpdateBanner() = default;
UpdateBanner::~UpdateBanner() = default;

void UpdateBanner::set_supported(bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    supported_ = supported;
}

void UpdateBanner::set_versions(const std::string& current, const std::string& latest) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_version_ = current;
    latest_version_ = latest;
}

void UpdateBanner::set_state(UpdateState state, ErrorKind error) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    error_ = error;
    if (state == UpdateState::Downloading) {
        progress_ = DownloadSnapshot{};
    }
}

void UpdateBanner::set_progress(const DownloadSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = snapshot;
}

void UpdateBanner::set_notice(const std::string& notice) {
    std::lock_guard<std::mutex> lock(mutex_);
    notice_ = notice;
}

UpdateState UpdateBanner::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string UpdateBanner::format_bytes(int64_t bytes) {
    std::ostringstream oss;
    if (bytes < 1024) {
        oss << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / 1024.0 << " KB";
    } else {
        oss << std::fixed << std::setprecision(1)
            << (double)bytes / (1024.0 * 1024.0) << " MB";
    }
    return oss.str();
}

std::string UpdateBanner::text_line() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_line_locked();
}

std::string UpdateBanner::text_line_locked() const {
    if (!supported_) {
        return error_user_message(ErrorKind::NotSupported);
    }

    switch (state_) {
        case UpdateState::Idle:
            if (!notice_.empty()) return notice_;
            return "selfupdate " + current_version_ + "  [U] Check for updates";
        case UpdateState::Checking:
            return "Checking for updates...";
        case UpdateState::Available:
            return "Update available: " + current_version_ + " -> " + latest_version_ +
                   "  [D] Download  [N] Not now";
        case UpdateState::Downloading: {
            if (progress_.phase == DownloadPhase::Extracting) {
                return "Unpacking " + latest_version_ + "...";
            }
            std::string line = "Downloading " + latest_version_ + ": ";
            int pct = progress_.percent();
            if (pct >= 0) {
                line += std::to_string(pct) + "% (" + format_bytes(progress_.bytes_received) +
                        " / " + format_bytes(progress_.total_bytes) + ")";
            } else {
                line += format_bytes(progress_.bytes_received);
            }
            return line + "  [C] Cancel";
        }
        case UpdateState::ReadyToInstall:
            return "Update " + latest_version_ + " ready  [I] Install and restart";
        case UpdateState::HandingOff:
            return "Installing update " + latest_version_ + "...";
        case UpdateState::Failed:
            return error_user_message(error_) + "  [R] Retry  [X] Dismiss";
    }
    return "";
}

Component UpdateBanner::component() {
    return Renderer([this] {
        std::string line;
        UpdateState state;
        bool supported;
        int pct;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            line = text_line_locked();
            state = state_;
            supported = supported_;
            pct = progress_.percent();
        }

        auto label = text(" " + line + " ");
        if (!supported) {
            return hbox({label | dim, filler()}) | inverted;
        }

        switch (state) {
            case UpdateState::Available:
            case UpdateState::ReadyToInstall:
                label = label | color(Color::Yellow) | bold;
                break;
            case UpdateState::Failed:
                label = label | color(Color::Red);
                break;
            case UpdateState::Downloading:
                if (pct >= 0) {
                    return hbox({
                        label,
                        gauge(pct / 100.0f) | flex,
                        text(" "),
                    }) | inverted;
                }
                break;
            default:
                break;
        }
        return hbox({label, filler()}) | inverted;
    });
}
