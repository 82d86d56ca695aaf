#include "updater/backup_record.hpp"
#include "updater/durable_io.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string BackupRecord::to_json() const {
    json j;
    j["original_path"] = original_path;
    j["backup_path"] = backup_path;
    j["timestamp_utc"] = timestamp_utc;
    return j.dump(2);
}

bool BackupRecord::from_json(const std::string& text, BackupRecord& out, std::string& error) {
    try {
        auto j = json::parse(text);
        if (!j.is_object()) {
            error = "backup record is not a JSON object";
            return false;
        }
        if (!j.contains("original_path") || !j["original_path"].is_string() ||
            !j.contains("backup_path") || !j["backup_path"].is_string()) {
            error = "backup record is missing a path";
            return false;
        }
        out.original_path = j["original_path"].get<std::string>();
        out.backup_path = j["backup_path"].get<std::string>();
        out.timestamp_utc = j.value("timestamp_utc", "");
        if (out.original_path.empty() || out.backup_path.empty()) {
            error = "backup record has an empty path";
            return false;
        }
        return true;
    } catch (const json::exception& e) {
        error = std::string("malformed backup record: ") + e.what();
        return false;
    }
}

bool BackupRecord::write(const std::string& record_path, std::string& error) const {
    return durable_write(record_path, to_json() + "\n", error);
}

bool BackupRecord::exists(const std::string& record_path) {
    std::error_code ec;
    return fs::exists(record_path, ec);
}

bool BackupRecord::load(const std::string& record_path, BackupRecord& out, std::string& error) {
    std::ifstream in(record_path);
    if (!in.is_open()) {
        error = "cannot open " + record_path;
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return from_json(ss.str(), out, error);
}

bool BackupRecord::remove(const std::string& record_path, std::string& error) {
    std::error_code ec;
    fs::remove(record_path, ec);
    if (ec) {
        error = "remove " + record_path + ": " + ec.message();
        return false;
    }
    if (!fsync_directory(fs::path(record_path).parent_path().string())) {
        spdlog::warn("[Updater] Removed {} but could not fsync its directory", record_path);
    }
    return true;
}

std::string BackupRecord::now_utc() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}
