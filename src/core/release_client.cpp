#include "core/release_client.hpp"
#include "core/http.hpp"
#include "core/version.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

using json = nlohmann::json;

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static LookupResult lookup_failure(ErrorKind kind, const std::string& message) {
    LookupResult result;
    result.error = kind;
    result.message = message;
    return result;
}

/// Runs on_expire from a helper thread once the deadline passes, and again
/// every 50 ms until finish() is called. A socket that did not exist yet at
/// the first call is caught by a later one. The destructor always joins.
class DeadlineWatchdog {
public:
    DeadlineWatchdog(std::chrono::steady_clock::time_point deadline, std::function<void()> on_expire)
        : on_expire_(std::move(on_expire)) {
        thread_ = std::thread([this, deadline]() {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_until(lock, deadline, [this]() { return finished_; })) return;
            expired_ = true;
            do {
                lock.unlock();
                on_expire_();
                lock.lock();
            } while (!cv_.wait_for(lock, std::chrono::milliseconds(50), [this]() { return finished_; }));
        });
    }

    ~DeadlineWatchdog() { finish(); }

    DeadlineWatchdog(const DeadlineWatchdog&) = delete;
    DeadlineWatchdog& operator=(const DeadlineWatchdog&) = delete;

    /// Stop watching; true if the deadline had already fired
    bool finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
        std::lock_guard<std::mutex> lock(mutex_);
        return expired_;
    }

private:
    std::function<void()> on_expire_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_ = false;
    bool expired_ = false;
    std::thread thread_;
};

ReleaseClient::ReleaseClient(const std::string& endpoint_url,
                             const std::string& asset_suffix,
                             const std::string& user_agent)
    : endpoint_(endpoint_url), asset_suffix_(asset_suffix), user_agent_(user_agent) {}

LookupResult ReleaseClient::fetch_latest_release(std::chrono::milliseconds timeout) const {
    auto parts = parse_url(endpoint_);
    if (!parts.valid()) {
        return lookup_failure(ErrorKind::NetworkError, "Invalid release endpoint: " + endpoint_);
    }

    std::string body;
    int status = 0;

    auto deadline = std::chrono::steady_clock::now() + timeout;

    try {
        httplib::Client cli(parts.origin());
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);
        cli.set_follow_location(true);

        httplib::Headers headers = {
            {"User-Agent", user_agent_},
            {"Accept", "application/vnd.github+json"},
        };

        // Per-recv timeouts alone let a trickling server stretch the lookup
        // forever; one overall deadline covers headers and body.
        DeadlineWatchdog watchdog(deadline, [&cli]() { cli.stop(); });
        auto res = cli.Get(parts.path, headers,
            [&](const char* data, size_t len) {
                if (std::chrono::steady_clock::now() > deadline) return false;
                body.append(data, len);
                return true;
            });
        bool timed_out = watchdog.finish() || std::chrono::steady_clock::now() > deadline;
        if (timed_out) {
            return lookup_failure(ErrorKind::NetworkError,
                                  "Release lookup exceeded " + std::to_string(timeout.count()) + " ms");
        }
        if (!res) {
            return lookup_failure(ErrorKind::NetworkError,
                                  "Release lookup failed: " + httplib::to_string(res.error()));
        }
        status = res->status;
    } catch (const std::exception& e) {
        return lookup_failure(ErrorKind::NetworkError, std::string("Release lookup failed: ") + e.what());
    }

    if (status == 404) {
        return lookup_failure(ErrorKind::NotFound, "Release endpoint returned 404");
    }
    if (status < 200 || status >= 300) {
        return lookup_failure(ErrorKind::NetworkError,
                              "Release endpoint returned HTTP " + std::to_string(status));
    }

    return parse_release(body, asset_suffix_);
}

LookupResult ReleaseClient::parse_release(const std::string& body, const std::string& asset_suffix) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::parse_error& e) {
        return lookup_failure(ErrorKind::ParseError, std::string("Malformed release JSON: ") + e.what());
    }

    if (!j.is_object()) {
        return lookup_failure(ErrorKind::ParseError, "Release JSON is not an object");
    }
    if (!j.contains("tag_name") || !j["tag_name"].is_string()) {
        return lookup_failure(ErrorKind::ParseError, "Release JSON has no tag_name");
    }
    if (!j.contains("published_at") || !j["published_at"].is_string()) {
        return lookup_failure(ErrorKind::ParseError, "Release JSON has no published_at");
    }
    if (!j.contains("assets") || !j["assets"].is_array()) {
        return lookup_failure(ErrorKind::ParseError, "Release JSON has no assets array");
    }

    ReleaseInfo info;
    info.tag = j["tag_name"].get<std::string>();
    info.published_at = j["published_at"].get<std::string>();
    if (j.contains("body") && j["body"].is_string()) {
        info.changelog = j["body"].get<std::string>();
    }

    SemanticVersion parsed;
    if (!parse_version(info.tag, parsed)) {
        return lookup_failure(ErrorKind::InvalidVersion, "Release tag is not a version: " + info.tag);
    }
    info.version = strip_version_prefix(info.tag);

    const json* selected = nullptr;
    for (const auto& asset : j["assets"]) {
        if (!asset.is_object() || !asset.contains("name") || !asset["name"].is_string()) {
            continue;
        }
        if (ends_with(asset["name"].get<std::string>(), asset_suffix)) {
            selected = &asset;
            break;
        }
    }

    if (!selected) {
        return lookup_failure(ErrorKind::NotFound,
                              "No asset matching '" + asset_suffix + "' in release " + info.tag);
    }

    const json& asset = *selected;
    if (!asset.contains("browser_download_url") || !asset["browser_download_url"].is_string()) {
        return lookup_failure(ErrorKind::ParseError, "Selected asset has no browser_download_url");
    }
    if (!asset.contains("size") || !asset["size"].is_number_integer()) {
        return lookup_failure(ErrorKind::ParseError, "Selected asset has no size");
    }
    int64_t size = asset["size"].get<int64_t>();
    if (size < 0) {
        return lookup_failure(ErrorKind::ParseError, "Selected asset has a negative size");
    }

    info.asset_name = asset["name"].get<std::string>();
    info.asset_url = asset["browser_download_url"].get<std::string>();
    info.asset_size_bytes = size;

    // Optional checksum sidecar published next to the archive
    std::string sidecar = info.asset_name + ".sha256";
    for (const auto& other : j["assets"]) {
        if (other.is_object() && other.contains("name") && other["name"].is_string() &&
            other["name"].get<std::string>() == sidecar &&
            other.contains("browser_download_url") && other["browser_download_url"].is_string()) {
            info.checksum_url = other["browser_download_url"].get<std::string>();
            break;
        }
    }

    spdlog::debug("[ReleaseClient] Latest release {} asset {} ({} bytes)",
                  info.tag, info.asset_name, info.asset_size_bytes);

    LookupResult result;
    result.success = true;
    result.release = std::move(info);
    return result;
}
