#pragma once

#include <string>

struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 443;
    std::string path;

    bool valid() const { return !host.empty() && (scheme == "http" || scheme == "https"); }

    /// "scheme://host:port", the form httplib::Client accepts
    std::string origin() const;
};

/// Split an absolute http(s) URL. Returns an invalid UrlParts on anything else.
UrlParts parse_url(const std::string& url);
