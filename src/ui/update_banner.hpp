#pragma once

#include "core/archive_fetcher.hpp"
#include "core/errors.hpp"
#include "core/orchestrator.hpp"

#include <ftxui/component/component.hpp>
#include <cstdint>
#include <mutex>
#include <string>

/// One-line update status shown under the main view.
/// Setters are called from orchestrator threads; the renderer reads under the lock.
class UpdateBanner {
public:
    UpdateBanner();
    ~UpdateBanner();

    ftxui::Component component();

    // Thread-safe setters for background updates
    void set_supported(bool supported);
    void set_versions(const std::string& current, const std::string& latest);
    void set_state(UpdateState state, ErrorKind error);
    void set_progress(const DownloadSnapshot& snapshot);
    void set_notice(const std::string& notice);

    /// Plain text of what the banner currently shows, key hints included
    std::string text_line() const;

    UpdateState state() const;

    static std::string format_bytes(int64_t bytes);

private:
    mutable std::mutex mutex_;
    bool supported_ = true;
    std::string current_version_;
    std::string latest_version_;
    UpdateState state_ = UpdateState::Idle;
    ErrorKind error_ = ErrorKind::None;
    DownloadSnapshot progress_;
    std::string notice_;

    std::string text_line_locked() const;
};
