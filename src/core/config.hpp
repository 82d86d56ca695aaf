#pragma once

#include <string>
#include <vector>

struct UpdateSettings {
    std::string endpoint = "https://api.github.com/repos/selfupdate/selfupdate/releases/latest";
    std::string asset_suffix;          // empty = platform default
    bool check_on_startup = true;
    int check_interval_hours = 24;     // 0 = startup check only
    int lookup_timeout_ms = 2000;
    int connect_timeout_ms = 10000;
    int read_timeout_ms = 30000;
    int handoff_grace_ms = 1000;       // clamped to [0, 2000]
    bool verify_checksum = true;
    /// Exact contents of a release archive; empty = just the executable
    std::vector<std::string> expected_files = {"selfupdate", "selfupdate-updater"};
};

struct UpdaterSettings {
    int wait_timeout_ms = 10000;
    int poll_interval_ms = 200;
};

struct LoggingSettings {
    std::string level = "info";
    std::string file;                  // empty = <config_dir>/selfupdate.log
};

struct AppConfig {
    UpdateSettings update;
    UpdaterSettings updater;
    LoggingSettings logging;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    /// Load from / save to an explicit path instead of config_path()
    bool load_from(const std::string& path);
    bool save_to(const std::string& path) const;

    AppConfig& data();
    const AppConfig& data() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string default_log_path();
    static std::string expand_home(const std::string& path);

    /// "-linux-<arch>.tar.gz" for the machine we are running on
    static std::string default_asset_suffix();

    static constexpr int kMaxHandoffGraceMs = 2000;

private:
    AppConfig config_;

    void normalize();
};
