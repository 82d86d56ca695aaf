#include <gtest/gtest.h>
#include "core/version.hpp"

#include <string>
#include <vector>

static VersionOrder reverse(VersionOrder o) {
    if (o == VersionOrder::Less) return VersionOrder::Greater;
    if (o == VersionOrder::Greater) return VersionOrder::Less;
    return VersionOrder::Equal;
}

TEST(VersionTest, StripPrefix) {
    EXPECT_EQ(strip_version_prefix("v2.6.0"), "2.6.0");
    EXPECT_EQ(strip_version_prefix("release-1.0.0"), "1.0.0");
    EXPECT_EQ(strip_version_prefix("1.0.0"), "1.0.0");
    EXPECT_EQ(strip_version_prefix("vvv"), "");
}

TEST(VersionTest, ParseValid) {
    SemanticVersion v;
    ASSERT_TRUE(parse_version("v1.12.3", v));
    EXPECT_EQ(v.major, 1);
    EXPECT_EQ(v.minor, 12);
    EXPECT_EQ(v.patch, 3);
    EXPECT_TRUE(v.suffix.empty());

    ASSERT_TRUE(parse_version("2.0.0-rc.1", v));
    EXPECT_EQ(v.suffix, "-rc.1");
    ASSERT_TRUE(parse_version("2.0.0+build.7", v));
    EXPECT_EQ(v.suffix, "+build.7");
    EXPECT_EQ(to_string(v), "2.0.0+build.7");
}

TEST(VersionTest, ParseRejectsMalformed) {
    SemanticVersion v;
    for (const char* bad : {"", "v", "1", "1.2", "1.2.", "1..3", "1.2.3.4", "1.2.x",
                            "a.b.c", "1.2.3-", "1.2.3 ", "99999999999999999999999.0.0"}) {
        EXPECT_FALSE(parse_version(bad, v)) << "accepted: '" << bad << "'";
    }
}

TEST(VersionTest, NumericNotLexicographic) {
    auto r = compare_versions("1.9.0", "1.10.0");
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.order, VersionOrder::Less);
    EXPECT_TRUE(is_newer_version("1.9.0", "1.10.0"));
    EXPECT_FALSE(is_newer_version("1.10.0", "1.9.0"));
}

TEST(VersionTest, PrefixDoesNotAffectOrder) {
    auto r = compare_versions("v1.2.0", "1.2.0");
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.order, VersionOrder::Equal);
    EXPECT_EQ(r.error, ErrorKind::None);
}

TEST(VersionTest, SuffixIgnoredForOrdering) {
    auto r = compare_versions("2.0.0-beta", "2.0.0");
    ASSERT_TRUE(r.valid);
    EXPECT_EQ(r.order, VersionOrder::Equal);
    EXPECT_FALSE(is_newer_version("2.0.0-beta", "2.0.0"));
}

TEST(VersionTest, AntisymmetryAndReflexivity) {
    std::vector<std::string> versions = {
        "0.0.0", "0.0.1", "0.1.0", "1.0.0", "1.2.0", "v1.2.3", "1.10.0", "2.0.0", "10.0.0",
    };
    for (const auto& a : versions) {
        auto self = compare_versions(a, a);
        ASSERT_TRUE(self.valid);
        EXPECT_EQ(self.order, VersionOrder::Equal) << a;

        for (const auto& b : versions) {
            auto ab = compare_versions(a, b);
            auto ba = compare_versions(b, a);
            ASSERT_TRUE(ab.valid && ba.valid);
            EXPECT_EQ(ab.order, reverse(ba.order)) << a << " vs " << b;
        }
    }
}

TEST(VersionTest, InvalidInputReportsInvalidVersion) {
    auto r = compare_versions("1.2", "1.2.0");
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.error, ErrorKind::InvalidVersion);

    r = compare_versions("1.2.0", "latest");
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.error, ErrorKind::InvalidVersion);

    EXPECT_FALSE(is_newer_version("garbage", "9.9.9"));
}

TEST(VersionTest, NegativeMajorIsInvalid) {
    SemanticVersion v;
    EXPECT_FALSE(parse_version("-1.0.0", v));
    EXPECT_FALSE(parse_version("v-1.0.0", v));
    EXPECT_TRUE(parse_version("release-1.0.0", v));

    auto r = compare_versions("-1.0.0", "0.9.0");
    EXPECT_FALSE(r.valid);
    EXPECT_EQ(r.error, ErrorKind::InvalidVersion);
    EXPECT_FALSE(is_newer_version("0.9.0", "-1.0.0"));
}
