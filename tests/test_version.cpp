#include <gtest/gtest.h>
#include "../src/version.hpp"

TEST(VersionTest, Comparisons) {
    EXPECT_TRUE(version_compare("1.0", "2.0"));
    EXPECT_FALSE(version_compare("2.0", "1.0"));
    EXPECT_FALSE(version_compare("1.0", "1.0")); // strictly less

    EXPECT_TRUE(version_compare("1.0", "1.0.1"));
    EXPECT_TRUE(version_compare("1.0a1", "1.0"));
    EXPECT_TRUE(version_compare("1.0a1", "1.0b1"));
    EXPECT_TRUE(version_compare("1.0b1", "1.0rc1"));
    EXPECT_TRUE(version_compare("1.0.dev1", "1.0a1"));
    EXPECT_TRUE(version_compare("1.0", "1.0.post1"));
    EXPECT_TRUE(version_compare("1.9", "1.10"));
    EXPECT_TRUE(version_compare("2.0", "1!0.1"));
}

TEST(VersionTest, Normalization) {
    EXPECT_TRUE(versions_equal("1.0", "1.0.0"));
    EXPECT_TRUE(versions_equal("1.0-alpha1", "1.0a1"));
    EXPECT_TRUE(versions_equal("v2.1", "2.1"));
    EXPECT_TRUE(versions_equal("1.0-1", "1.0.post1"));

    auto v = Version::parse("1.0RC2.post3.dev4+Ubuntu-1");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->str(), "1.0rc2.post3.dev4+ubuntu.1");
    EXPECT_EQ(v->public_str(), "1.0rc2.post3.dev4");
    EXPECT_TRUE(v->is_prerelease());
}

TEST(VersionTest, LocalLabelBreaksTies) {
    EXPECT_TRUE(version_compare("1.0", "1.0+local"));
    EXPECT_TRUE(version_compare("1.0+abc", "1.0+1"));
    EXPECT_FALSE(versions_equal("1.0+a", "1.0+b"));
}

TEST(VersionTest, LongNumericLocalSegments) {
    EXPECT_TRUE(version_compare("1.0+99999999999999999999", "1.0+100000000000000000000"));
    EXPECT_TRUE(versions_equal("1.0+00012345678901234567890", "1.0+12345678901234567890"));
    EXPECT_FALSE(version_compare("1.0+123456789012345678901234", "1.0+9"));
    EXPECT_TRUE(version_compare("1.0+2", "1.0+10"));
}

TEST(VersionTest, InvalidVersions) {
    EXPECT_FALSE(Version::parse("not a version").has_value());
    EXPECT_TRUE(version_compare("garbage", "0.1"));
    EXPECT_TRUE(version_compare("aaa", "bbb"));
    EXPECT_FALSE(version_satisfies("garbage", ">=", "0"));
}

TEST(VersionTest, Satisfaction) {
    EXPECT_TRUE(version_satisfies("1.0", ">=", "1.0"));
    EXPECT_TRUE(version_satisfies("2.0", ">=", "1.0"));
    EXPECT_FALSE(version_satisfies("1.0", ">=", "2.0"));
    EXPECT_TRUE(version_satisfies("1.0", "<", "2.0"));
    EXPECT_FALSE(version_satisfies("2.0", "<", "1.0"));
    EXPECT_TRUE(version_satisfies("1.0", "==", "1.0.0"));
    EXPECT_FALSE(version_satisfies("1.0", "!=", "1.0"));
    EXPECT_TRUE(version_satisfies("1.0+local", "==", "1.0"));
    EXPECT_FALSE(version_satisfies("1.0+local", "==", "1.0+other"));
    EXPECT_TRUE(version_satisfies("1.0.post1", "===", "1.0.POST1"));
}

TEST(VersionTest, Wildcards) {
    EXPECT_TRUE(version_satisfies("1.2.5", "==", "1.2.*"));
    EXPECT_FALSE(version_satisfies("1.3", "==", "1.2.*"));
    EXPECT_TRUE(version_satisfies("1.3", "!=", "1.2.*"));
    EXPECT_FALSE(version_satisfies("1.3", ">=", "1.2.*"));
}

TEST(VersionTest, CompatibleRelease) {
    EXPECT_TRUE(version_satisfies("1.4.5", "~=", "1.4"));
    EXPECT_TRUE(version_satisfies("1.9", "~=", "1.4"));
    EXPECT_FALSE(version_satisfies("2.0", "~=", "1.4"));
    EXPECT_FALSE(version_satisfies("1.3", "~=", "1.4"));
    EXPECT_TRUE(version_satisfies("1.4.9", "~=", "1.4.2"));
    EXPECT_FALSE(version_satisfies("1.5.0", "~=", "1.4.2"));
    EXPECT_FALSE(version_satisfies("1.0", "~=", "1"));
}

TEST(VersionTest, ExclusiveComparisonsAndPreReleases) {
    EXPECT_FALSE(version_satisfies("2.0a1", "<", "2.0"));
    EXPECT_TRUE(version_satisfies("2.0a1", "<", "2.0b1"));
    EXPECT_FALSE(version_satisfies("1.0.post1", ">", "1.0"));
    EXPECT_TRUE(version_satisfies("1.0.1", ">", "1.0"));
}
