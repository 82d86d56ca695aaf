#pragma once

#include <string>

/// On-disk proof that a swap was in progress.
/// Present => the next updater run restores backup_path over original_path.
struct BackupRecord {
    std::string original_path;
    std::string backup_path;
    std::string timestamp_utc;   // ISO 8601, e.g. 2026-10-19T08:30:00Z

    std::string to_json() const;
    static bool from_json(const std::string& text, BackupRecord& out, std::string& error);

    /// Durable write (temp file + fsync + rename)
    bool write(const std::string& record_path, std::string& error) const;

    static bool exists(const std::string& record_path);
    static bool load(const std::string& record_path, BackupRecord& out, std::string& error);
    static bool remove(const std::string& record_path, std::string& error);

    static std::string now_utc();
};
