#pragma once

#include "core/errors.hpp"

#include <chrono>
#include <cstdint>
#include <string>

struct ReleaseInfo {
    std::string version;        // tag with its prefix stripped, e.g. "2.6.0"
    std::string tag;            // raw tag_name, e.g. "v2.6.0"
    std::string published_at;   // ISO 8601 as published
    std::string asset_name;
    std::string asset_url;      // direct download URL for this platform
    int64_t asset_size_bytes = 0;
    std::string changelog;      // may be empty
    std::string checksum_url;   // "<asset>.sha256" sidecar, empty when not published
};

struct LookupResult {
    bool success = false;
    ReleaseInfo release;        // only meaningful when success
    ErrorKind error = ErrorKind::None;
    std::string message;
};

class ReleaseClient {
public:
    ReleaseClient(const std::string& endpoint_url,
                  const std::string& asset_suffix,
                  const std::string& user_agent);

    /// Single GET against the "latest release" resource.
    /// Blocks the calling thread for at most about 2x timeout; call it from a
    /// background thread.
    LookupResult fetch_latest_release(std::chrono::milliseconds timeout) const;

    /// Parse a release JSON body and pick the asset whose name ends with asset_suffix.
    /// All-or-nothing: a missing required field fails the whole lookup.
    static LookupResult parse_release(const std::string& body, const std::string& asset_suffix);

    const std::string& endpoint() const { return endpoint_; }
    const std::string& asset_suffix() const { return asset_suffix_; }

private:
    std::string endpoint_;
    std::string asset_suffix_;
    std::string user_agent_;
};
