#pragma once

#include "core/errors.hpp"

#include <string>

struct SemanticVersion {
    long major = 0;
    long minor = 0;
    long patch = 0;
    std::string suffix;  // pre-release / build metadata, ignored for ordering
};

enum class VersionOrder {
    Less,
    Equal,
    Greater
};

struct VersionCompareResult {
    bool valid = false;
    VersionOrder order = VersionOrder::Equal;
    ErrorKind error = ErrorKind::InvalidVersion;
};

/// Drop any leading non-digit prefix ("v2.6.0" -> "2.6.0", "release-1.0.0" -> "1.0.0")
std::string strip_version_prefix(const std::string& ver);

/// Parse "[prefix]MAJOR.MINOR.PATCH[-pre][+build]". Returns false on anything else.
bool parse_version(const std::string& ver, SemanticVersion& out);

/// Compare a against b numerically, component by component.
/// Never throws; an unparsable side yields {valid=false, error=InvalidVersion}.
VersionCompareResult compare_versions(const std::string& a, const std::string& b);

/// True only when both parse and remote is strictly greater than local
bool is_newer_version(const std::string& local_version, const std::string& remote_version);

std::string to_string(const SemanticVersion& v);
