#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <sys/utsname.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() {
    config_.update.asset_suffix = default_asset_suffix();
}

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/selfupdate";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/selfupdate";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::default_log_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/selfupdate.log";
}

std::string Config::default_asset_suffix() {
    std::string arch = "x86_64";
    struct utsname uts;
    if (uname(&uts) == 0) {
        std::string machine(uts.machine);
        if (machine == "x86_64" || machine == "amd64") {
            arch = "x86_64";
        } else if (machine == "aarch64" || machine == "arm64") {
            arch = "aarch64";
        } else {
            arch = machine;
        }
    }
#if defined(__APPLE__)
    return "-darwin-" + arch + ".tar.gz";
#else
    return "-linux-" + arch + ".tar.gz";
#endif
}

void Config::normalize() {
    auto& u = config_.update;
    if (u.asset_suffix.empty()) u.asset_suffix = default_asset_suffix();
    u.check_interval_hours = std::max(0, u.check_interval_hours);
    u.lookup_timeout_ms = std::max(1, u.lookup_timeout_ms);
    u.connect_timeout_ms = std::max(1, u.connect_timeout_ms);
    u.read_timeout_ms = std::max(1, u.read_timeout_ms);
    u.handoff_grace_ms = std::clamp(u.handoff_grace_ms, 0, kMaxHandoffGraceMs);
    u.expected_files.erase(std::remove_if(u.expected_files.begin(), u.expected_files.end(),
                                          [](const std::string& f) { return f.empty(); }),
                           u.expected_files.end());

    auto& p = config_.updater;
    p.wait_timeout_ms = std::max(0, p.wait_timeout_ms);
    p.poll_interval_ms = std::max(1, p.poll_interval_ms);
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }
    return load_from(path);
}

bool Config::load_from(const std::string& path) {
    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto update = root["update"]) {
            auto& u = config_.update;
            u.endpoint = update["endpoint"].as<std::string>(u.endpoint);
            u.asset_suffix = update["asset_suffix"].as<std::string>(u.asset_suffix);
            u.check_on_startup = update["check_on_startup"].as<bool>(u.check_on_startup);
            u.check_interval_hours = update["check_interval_hours"].as<int>(u.check_interval_hours);
            u.lookup_timeout_ms = update["lookup_timeout_ms"].as<int>(u.lookup_timeout_ms);
            u.connect_timeout_ms = update["connect_timeout_ms"].as<int>(u.connect_timeout_ms);
            u.read_timeout_ms = update["read_timeout_ms"].as<int>(u.read_timeout_ms);
            u.handoff_grace_ms = update["handoff_grace_ms"].as<int>(u.handoff_grace_ms);
            u.verify_checksum = update["verify_checksum"].as<bool>(u.verify_checksum);
            if (update["expected_files"]) {
                u.expected_files = update["expected_files"].as<std::vector<std::string>>();
            }
        }

        if (auto updater = root["updater"]) {
            auto& p = config_.updater;
            p.wait_timeout_ms = updater["wait_timeout_ms"].as<int>(p.wait_timeout_ms);
            p.poll_interval_ms = updater["poll_interval_ms"].as<int>(p.poll_interval_ms);
        }

        if (auto logging = root["logging"]) {
            auto& l = config_.logging;
            l.level = logging["level"].as<std::string>(l.level);
            l.file = logging["file"].as<std::string>(l.file);
        }

        normalize();
        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        spdlog::warn("[Config] Failed to load {}: {}", path, e.what());
        normalize();
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;
    return save_to(path);
}

bool Config::save_to(const std::string& path) const {
    try {
        auto parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        const auto& u = config_.update;
        out << YAML::Key << "update" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "endpoint" << YAML::Value << u.endpoint;
        out << YAML::Key << "asset_suffix" << YAML::Value << u.asset_suffix;
        out << YAML::Key << "check_on_startup" << YAML::Value << u.check_on_startup;
        out << YAML::Key << "check_interval_hours" << YAML::Value << u.check_interval_hours;
        out << YAML::Key << "lookup_timeout_ms" << YAML::Value << u.lookup_timeout_ms;
        out << YAML::Key << "connect_timeout_ms" << YAML::Value << u.connect_timeout_ms;
        out << YAML::Key << "read_timeout_ms" << YAML::Value << u.read_timeout_ms;
        out << YAML::Key << "handoff_grace_ms" << YAML::Value << u.handoff_grace_ms;
        out << YAML::Key << "verify_checksum" << YAML::Value << u.verify_checksum;
        out << YAML::Key << "expected_files" << YAML::Value << YAML::BeginSeq;
        for (const auto& f : u.expected_files) out << f;
        out << YAML::EndSeq;
        out << YAML::EndMap;

        const auto& p = config_.updater;
        out << YAML::Key << "updater" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "wait_timeout_ms" << YAML::Value << p.wait_timeout_ms;
        out << YAML::Key << "poll_interval_ms" << YAML::Value << p.poll_interval_ms;
        out << YAML::EndMap;

        const auto& l = config_.logging;
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << l.level;
        out << YAML::Key << "file" << YAML::Value << l.file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return fout.good();
    } catch (const std::exception& e) {
        spdlog::warn("[Config] Failed to save {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
