#pragma once

#include "core/errors.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

enum class DownloadPhase {
    Idle,
    Downloading,
    Extracting,
    Done,
    Error
};

/// Plain copy of DownloadProgress handed to UI callbacks
struct DownloadSnapshot {
    int64_t bytes_received = 0;
    int64_t total_bytes = -1;   // -1 = server sent no length
    DownloadPhase phase = DownloadPhase::Idle;

    /// 0-100, or -1 when the total is unknown
    int percent() const;
};

/// Written by the fetcher while it streams, read by anyone at any cadence.
/// Every field is an independent atomic; readers never block the download.
struct DownloadProgress {
    std::atomic<int64_t> bytes_received{0};
    std::atomic<int64_t> total_bytes{-1};
    std::atomic<DownloadPhase> phase{DownloadPhase::Idle};

    void reset();
    DownloadSnapshot snapshot() const;
};

enum class ArchiveKind {
    TarGz,
    Tar,
    Zip,
    Unknown
};

struct FetcherOptions {
    /// Relative paths the archive must contain, no more and no fewer
    std::vector<std::string> expected_files;
    /// Which of expected_files is the new executable
    std::string executable_name;
    int connect_timeout_ms = 10000;
    int read_timeout_ms = 30000;
    std::string user_agent = "selfupdate";
};

struct FetchResult {
    bool success = false;
    std::string extracted_path;   // the new executable inside the staging directory
    std::string payload_dir;
    ErrorKind error = ErrorKind::None;
    std::string message;
};

class ArchiveFetcher {
public:
    explicit ArchiveFetcher(FetcherOptions options);

    /// Stream url into destination_dir, verify, extract, check contents.
    /// destination_dir is wiped first, and removed entirely on any failure,
    /// so a failed or cancelled attempt leaves nothing behind.
    /// progress and cancel_flag may be null.
    FetchResult download(const std::string& url,
                         const std::string& destination_dir,
                         DownloadProgress* progress = nullptr,
                         std::atomic<bool>* cancel_flag = nullptr,
                         const std::string& expected_sha256 = "") const;

    /// Extract archive_path into dest_dir with the system tar/unzip
    static bool extract_archive(const std::string& archive_path,
                                const std::string& dest_dir,
                                std::string& error);

    /// SHA256 of a file on disk against a hex digest (either case).
    /// Downloads hash while streaming and never re-read the archive.
    static bool verify_sha256(const std::string& file_path, const std::string& expected_hash);

    /// Download a small text resource (checksum sidecar); empty on any failure
    std::string fetch_text(const std::string& url) const;

    /// Pull the first hex token out of a "<hash>  <file>" sidecar
    static std::string parse_checksum(const std::string& sidecar_text);

    static ArchiveKind archive_kind_for(const std::string& name_or_url);

    /// Regular files below dir as sorted relative generic paths.
    /// Symlinks and other special files are reported with a "!" prefix.
    static std::vector<std::string> list_files(const std::string& dir);

    const FetcherOptions& options() const { return options_; }

private:
    FetcherOptions options_;
};
