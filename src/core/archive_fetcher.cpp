#include "core/archive_fetcher.hpp"
#include "core/http.hpp"

#include <httplib.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

// ════════════════════════════════════════════════════════════════
// DownloadProgress
// ════════════════════════════════════════════════════════════════

int DownloadSnapshot::percent() const {
    if (total_bytes <= 0) {
        return total_bytes == 0 && phase == DownloadPhase::Done ? 100 : -1;
    }
    int64_t pct = bytes_received * 100 / total_bytes;
    return static_cast<int>(std::clamp<int64_t>(pct, 0, 100));
}

void DownloadProgress::reset() {
    bytes_received.store(0);
    total_bytes.store(-1);
    phase.store(DownloadPhase::Idle);
}

DownloadSnapshot DownloadProgress::snapshot() const {
    DownloadSnapshot s;
    s.bytes_received = bytes_received.load();
    s.total_bytes = total_bytes.load();
    s.phase = phase.load();
    return s;
}

// ════════════════════════════════════════════════════════════════
// Helpers (local to this TU)
// ════════════════════════════════════════════════════════════════

/// Shell-escape a string by wrapping in single quotes and escaping embedded quotes
static std::string shell_quote(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/// Incremental SHA256 over OpenSSL EVP, fed chunk by chunk as bytes arrive
class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1;
    }

    void update(const char* data, size_t length) {
        if (ok_ && EVP_DigestUpdate(ctx_.get(), data, length) != 1) ok_ = false;
    }

    /// Lower-case hex digest; empty if OpenSSL failed at any point.
    /// Finalizes the stream, so call it once.
    std::string hex_digest() {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (!ok_ || EVP_DigestFinal_ex(ctx_.get(), hash, &hash_len) != 1) return "";
        ok_ = false;

        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(hash_len * 2);
        for (unsigned int i = 0; i < hash_len; ++i) {
            hex += digits[hash[i] >> 4];
            hex += digits[hash[i] & 0x0f];
        }
        return hex;
    }

    bool matches(const std::string& expected_hex) {
        std::string actual = hex_digest();
        if (actual.empty() || actual.size() != expected_hex.size()) return false;
        return std::equal(actual.begin(), actual.end(), expected_hex.begin(),
                          [](char a, char b) {
                              return a == std::tolower(static_cast<unsigned char>(b));
                          });
    }

private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)> ctx_;
    bool ok_ = false;
};

static void remove_quietly(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::warn("[ArchiveFetcher] Could not remove {}: {}", path, ec.message());
    }
}

// ════════════════════════════════════════════════════════════════
// ArchiveFetcher
// ════════════════════════════════════════════════════════════════

ArchiveFetcher::ArchiveFetcher(FetcherOptions options) : options_(std::move(options)) {}

ArchiveKind ArchiveFetcher::archive_kind_for(const std::string& name_or_url) {
    std::string name = name_or_url;
    auto query = name.find_first_of("?#");
    if (query != std::string::npos) {
        name = name.substr(0, query);
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ends_with(name, ".tar.gz") || ends_with(name, ".tgz")) return ArchiveKind::TarGz;
    if (ends_with(name, ".tar")) return ArchiveKind::Tar;
    if (ends_with(name, ".zip")) return ArchiveKind::Zip;
    return ArchiveKind::Unknown;
}

bool ArchiveFetcher::extract_archive(const std::string& archive_path,
                                     const std::string& dest_dir,
                                     std::string& error) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        error = "Cannot create " + dest_dir + ": " + ec.message();
        return false;
    }

    std::string cmd;
    switch (archive_kind_for(archive_path)) {
        case ArchiveKind::TarGz:
            cmd = "tar -xzf " + shell_quote(archive_path) + " -C " + shell_quote(dest_dir);
            break;
        case ArchiveKind::Tar:
            cmd = "tar -xf " + shell_quote(archive_path) + " -C " + shell_quote(dest_dir);
            break;
        case ArchiveKind::Zip:
            cmd = "unzip -q -o " + shell_quote(archive_path) + " -d " + shell_quote(dest_dir);
            break;
        case ArchiveKind::Unknown:
            error = "Unsupported archive type: " + archive_path;
            return false;
    }
    cmd += " >/dev/null 2>&1";

    int rc = std::system(cmd.c_str());
    if (rc != 0) {
        error = "Extraction of " + fs::path(archive_path).filename().string() +
                " failed (status " + std::to_string(rc) + ")";
        return false;
    }
    return true;
}

bool ArchiveFetcher::verify_sha256(const std::string& file_path, const std::string& expected_hash) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) return false;

    Sha256Stream digest;
    char buffer[8192];
    while (file) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) digest.update(buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) return false;
    return digest.matches(expected_hash);
}

std::string ArchiveFetcher::parse_checksum(const std::string& sidecar_text) {
    std::istringstream stream(sidecar_text);
    std::string token;
    stream >> token;
    if (token.size() != 64) return "";
    for (char c : token) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return "";
    }
    return token;
}

std::string ArchiveFetcher::fetch_text(const std::string& url) const {
    auto parts = parse_url(url);
    if (!parts.valid()) return "";

    try {
        httplib::Client cli(parts.origin());
        cli.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
        cli.set_read_timeout(std::chrono::milliseconds(options_.read_timeout_ms));
        cli.set_follow_location(true);

        httplib::Headers headers = {{"User-Agent", options_.user_agent}};
        auto res = cli.Get(parts.path, headers);
        if (res && res->status == 200 && res->body.size() < 64 * 1024) {
            return res->body;
        }
    } catch (const std::exception& e) {
        spdlog::debug("[ArchiveFetcher] fetch_text {} failed: {}", url, e.what());
    }
    return "";
}

std::vector<std::string> ArchiveFetcher::list_files(const std::string& dir) {
    std::vector<std::string> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::string rel = fs::relative(entry.path(), dir).generic_string();
        if (entry.is_symlink()) {
            files.push_back("!" + rel);
        } else if (entry.is_regular_file()) {
            files.push_back(rel);
        } else if (!entry.is_directory()) {
            files.push_back("!" + rel);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

FetchResult ArchiveFetcher::download(const std::string& url,
                                     const std::string& destination_dir,
                                     DownloadProgress* progress,
                                     std::atomic<bool>* cancel_flag,
                                     const std::string& expected_sha256) const {
    FetchResult result;

    auto fail = [&](ErrorKind kind, const std::string& message) {
        remove_quietly(destination_dir);
        if (progress) progress->phase.store(DownloadPhase::Error);
        result.success = false;
        result.error = kind;
        result.message = message;
        spdlog::warn("[ArchiveFetcher] {} ({})", message, error_kind_name(kind));
        return result;
    };

    auto cancelled = [&]() { return cancel_flag && cancel_flag->load(); };

    if (progress) {
        progress->reset();
        progress->phase.store(DownloadPhase::Downloading);
    }

    auto parts = parse_url(url);
    if (!parts.valid()) {
        return fail(ErrorKind::NetworkError, "Invalid download URL: " + url);
    }

    ArchiveKind kind = archive_kind_for(parts.path);
    if (kind == ArchiveKind::Unknown) {
        return fail(ErrorKind::ParseError, "Unsupported archive type: " + parts.path);
    }

    // Fresh staging directory for every attempt
    std::error_code ec;
    fs::remove_all(destination_dir, ec);
    fs::create_directories(destination_dir, ec);
    if (ec) {
        return fail(ErrorKind::NetworkError, "Cannot create staging directory " + destination_dir +
                                             ": " + ec.message());
    }

    const char* archive_name = kind == ArchiveKind::Zip ? "archive.zip"
                             : kind == ArchiveKind::Tar ? "archive.tar"
                             : "archive.tar.gz";
    std::string archive_path = (fs::path(destination_dir) / archive_name).string();

    if (cancelled()) {
        return fail(ErrorKind::Cancelled, "Download cancelled");
    }

    spdlog::info("[ArchiveFetcher] Downloading {}", url);

    int64_t total_bytes = -1;
    int64_t received_bytes = 0;
    int status = 0;
    bool write_failed = false;
    httplib::Error http_error = httplib::Error::Success;

    Sha256Stream digest;
    {
        std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return fail(ErrorKind::NetworkError, "Cannot write " + archive_path);
        }

        httplib::Headers headers = {
            {"User-Agent", options_.user_agent},
            {"Accept", "application/octet-stream"},
        };

        auto response_handler = [&](const httplib::Response& response) -> bool {
            if (cancelled()) return false;
            status = response.status;
            if (response.has_header("Content-Length")) {
                try {
                    total_bytes = std::stoll(response.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    total_bytes = -1;
                }
            }
            if (progress) progress->total_bytes.store(total_bytes);
            return response.status == 200;
        };

        auto content_receiver = [&](const char* data, size_t data_length) -> bool {
            if (cancelled()) return false;

            out.write(data, static_cast<std::streamsize>(data_length));
            if (!out.good()) {
                write_failed = true;
                return false;
            }
            if (!expected_sha256.empty()) digest.update(data, data_length);
            received_bytes += static_cast<int64_t>(data_length);
            if (progress) progress->bytes_received.store(received_bytes);
            return true;
        };

        try {
            httplib::Client cli(parts.origin());
            cli.set_connection_timeout(std::chrono::milliseconds(options_.connect_timeout_ms));
            cli.set_read_timeout(std::chrono::milliseconds(options_.read_timeout_ms));
            cli.set_follow_location(true);

            auto res = cli.Get(parts.path, headers, response_handler, content_receiver);
            if (!res) {
                http_error = res.error();
            } else {
                status = res->status;
            }
        } catch (const std::exception& e) {
            return fail(ErrorKind::NetworkError, std::string("Download failed: ") + e.what());
        }

        out.flush();
        if (!out.good()) write_failed = true;
    }

    if (cancelled()) {
        return fail(ErrorKind::Cancelled, "Download cancelled");
    }
    if (write_failed) {
        return fail(ErrorKind::NetworkError, "Failed writing " + archive_path);
    }
    if (status == 404) {
        return fail(ErrorKind::NotFound, "Release asset not found (HTTP 404)");
    }
    if (status != 0 && status != 200) {
        return fail(ErrorKind::NetworkError, "Download returned HTTP " + std::to_string(status));
    }
    if (http_error != httplib::Error::Success) {
        return fail(ErrorKind::NetworkError, "Download interrupted: " + httplib::to_string(http_error));
    }
    if (total_bytes >= 0 && received_bytes != total_bytes) {
        return fail(ErrorKind::NetworkError,
                    "Download truncated at " + std::to_string(received_bytes) + " of " +
                    std::to_string(total_bytes) + " bytes");
    }

    if (!expected_sha256.empty() && !digest.matches(expected_sha256)) {
        return fail(ErrorKind::VerifyFailure, "SHA256 checksum verification failed");
    }

    // Extraction
    if (progress) progress->phase.store(DownloadPhase::Extracting);
    if (cancelled()) {
        return fail(ErrorKind::Cancelled, "Download cancelled");
    }

    std::string payload_dir = (fs::path(destination_dir) / "payload").string();
    std::string extract_error;
    if (!extract_archive(archive_path, payload_dir, extract_error)) {
        return fail(ErrorKind::ParseError, extract_error);
    }
    fs::remove(archive_path, ec);

    // The archive must hold exactly the files we expect
    auto found = list_files(payload_dir);
    auto expected = options_.expected_files;
    std::sort(expected.begin(), expected.end());
    if (found != expected) {
        std::string listing;
        for (const auto& f : found) {
            if (!listing.empty()) listing += ", ";
            listing += f;
        }
        return fail(ErrorKind::VerifyFailure, "Unexpected archive contents: [" + listing + "]");
    }

    fs::path exe = fs::path(payload_dir) / options_.executable_name;
    fs::permissions(exe,
                    fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                    fs::perm_options::add, ec);
    if (ec) {
        return fail(ErrorKind::VerifyFailure, "Cannot mark " + exe.string() + " executable: " + ec.message());
    }

    if (progress) progress->phase.store(DownloadPhase::Done);

    spdlog::info("[ArchiveFetcher] Staged {} ({} bytes downloaded)", exe.string(), received_bytes);

    result.success = true;
    result.extracted_path = exe.string();
    result.payload_dir = payload_dir;
    return result;
}
