#include "core/version.hpp"

#include <cctype>
#include <climits>
#include <tuple>

// ════════════════════════════════════════════════════════════════
// Helpers
// ════════════════════════════════════════════════════════════════

/// Read one non-negative decimal component starting at pos.
/// Advances pos past the digits. Fails on empty input or overflow.
static bool read_component(const std::string& s, size_t& pos, long& out) {
    size_t start = pos;
    long value = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        int digit = s[pos] - '0';
        if (value > (LONG_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == start) return false;
    out = value;
    return true;
}

// ════════════════════════════════════════════════════════════════
// Public API
// ════════════════════════════════════════════════════════════════

std::string strip_version_prefix(const std::string& ver) {
    size_t pos = 0;
    while (pos < ver.size() && !std::isdigit(static_cast<unsigned char>(ver[pos]))) {
        ++pos;
    }
    return ver.substr(pos);
}

/// "-1.0.0" or "v-1.0.0": the dash is a sign, not a separator like in "release-1.0.0"
static bool has_sign_prefix(const std::string& prefix) {
    return prefix == "-" || prefix == "v-" || prefix == "V-";
}

bool parse_version(const std::string& ver, SemanticVersion& out) {
    std::string s = strip_version_prefix(ver);
    if (s.empty()) return false;
    if (has_sign_prefix(ver.substr(0, ver.size() - s.size()))) return false;

    SemanticVersion v;
    size_t pos = 0;

    if (!read_component(s, pos, v.major)) return false;
    if (pos >= s.size() || s[pos] != '.') return false;
    ++pos;
    if (!read_component(s, pos, v.minor)) return false;
    if (pos >= s.size() || s[pos] != '.') return false;
    ++pos;
    if (!read_component(s, pos, v.patch)) return false;

    if (pos < s.size()) {
        // Only a pre-release or build suffix may follow the patch number
        if (s[pos] != '-' && s[pos] != '+') return false;
        if (pos + 1 >= s.size()) return false;
        v.suffix = s.substr(pos);
    }

    out = v;
    return true;
}

VersionCompareResult compare_versions(const std::string& a, const std::string& b) {
    VersionCompareResult result;

    SemanticVersion va, vb;
    if (!parse_version(a, va) || !parse_version(b, vb)) {
        return result;
    }

    auto ta = std::make_tuple(va.major, va.minor, va.patch);
    auto tb = std::make_tuple(vb.major, vb.minor, vb.patch);

    result.valid = true;
    result.error = ErrorKind::None;
    if (ta < tb) {
        result.order = VersionOrder::Less;
    } else if (tb < ta) {
        result.order = VersionOrder::Greater;
    } else {
        result.order = VersionOrder::Equal;
    }
    return result;
}

bool is_newer_version(const std::string& local_version, const std::string& remote_version) {
    auto cmp = compare_versions(remote_version, local_version);
    return cmp.valid && cmp.order == VersionOrder::Greater;
}

std::string to_string(const SemanticVersion& v) {
    return std::to_string(v.major) + "." + std::to_string(v.minor) + "." +
           std::to_string(v.patch) + v.suffix;
}
