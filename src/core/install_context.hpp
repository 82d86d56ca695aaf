#pragma once

#include <string>

/// Where the running executable lives and where an update may touch the disk.
/// Computed once at process start and never mutated; shared by the host
/// process and the updater process.
struct InstallContext {
    std::string current_executable_path;
    std::string backup_executable_path;   // current + ".bak"
    std::string backup_record_path;       // current + ".update-record.json"
    std::string staging_directory;        // ephemeral, re-created per attempt
    std::string updater_executable_path;  // selfupdate-updater next to current
    bool is_packaged = false;

    static constexpr const char* kBackupSuffix = ".bak";
    static constexpr const char* kRecordSuffix = ".update-record.json";
    static constexpr const char* kPackagedMarker = ".selfupdate-packaged";
    static constexpr const char* kUpdaterName = "selfupdate-updater";

    /// Resolve the context of the currently running binary
    static InstallContext resolve();

    /// Build the context for a given executable path (no /proc lookup)
    static InstallContext for_executable(const std::string& exe_path);

    /// A packaged install carries the marker file written by the packaging step
    static bool is_packaged_install(const std::string& exe_dir);

    /// Absolute path of the currently running binary, empty on failure
    static std::string self_executable_path();

    std::string executable_directory() const;
    std::string executable_name() const;
};
