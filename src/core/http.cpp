#include "core/http.hpp"

#include <cctype>

std::string UrlParts::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

UrlParts parse_url(const std::string& url) {
    UrlParts parts;
    auto pos = url.find("://");
    if (pos == std::string::npos) {
        return parts;
    }

    parts.scheme = url.substr(0, pos);
    auto rest = url.substr(pos + 3);
    auto path_pos = rest.find('/');
    if (path_pos != std::string::npos) {
        parts.host = rest.substr(0, path_pos);
        parts.path = rest.substr(path_pos);
    } else {
        parts.host = rest;
        parts.path = "/";
    }

    auto colon = parts.host.find(':');
    if (colon != std::string::npos) {
        std::string port_str = parts.host.substr(colon + 1);
        parts.host = parts.host.substr(0, colon);
        int port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c)) || port > 65535) {
                parts.host.clear();
                return parts;
            }
            port = port * 10 + (c - '0');
        }
        if (port <= 0 || port > 65535) {
            parts.host.clear();
            return parts;
        }
        parts.port = port;
    } else {
        parts.port = (parts.scheme == "https") ? 443 : 80;
    }
    return parts;
}
