// =============================================================================
// Unit tests for the update check version helpers
// =============================================================================
#include <gtest/gtest.h>

#include "LauncherCore.h"
#include "versioncheck.h"

using namespace slc;

TEST(VersionCheckTest, ParseVersion) {
    EXPECT_EQ(parseVersion("2.1.0"), QVector<int>({ 2, 1, 0 }));
    EXPECT_EQ(parseVersion("10.0"), QVector<int>({ 10, 0 }));
    EXPECT_EQ(parseVersion(" 3 "), QVector<int>({ 3 }));
}

TEST(VersionCheckTest, UnparsableVersionIsZero) {
    EXPECT_EQ(parseVersion("abc"), QVector<int>({ 0, 0, 0 }));
    EXPECT_EQ(parseVersion(""), QVector<int>({ 0, 0, 0 }));
    EXPECT_EQ(parseVersion("2.x.1"), QVector<int>({ 0, 0, 0 }));
    EXPECT_EQ(parseVersion("2..1"), QVector<int>({ 0, 0, 0 }));
}

TEST(VersionCheckTest, CompareVersions) {
    EXPECT_LT(compareVersions("1.9.0", "2.0.0"), 0);
    EXPECT_GT(compareVersions("2.1.0", "2.0.0"), 0);
    EXPECT_EQ(compareVersions("2.0.0", "2.0.0"), 0);
    EXPECT_GT(compareVersions("2.0.10", "2.0.9"), 0);
}

TEST(VersionCheckTest, ShorterVersionIsZeroPadded) {
    EXPECT_EQ(compareVersions("2.0", "2.0.0"), 0);
    EXPECT_LT(compareVersions("2", "2.0.1"), 0);
    EXPECT_LT(compareVersions("abc", "0.0.1"), 0);
}

TEST(VersionCheckTest, NewerVersionIsReported) {
    UpdateMetadata meta;
    ASSERT_TRUE(parseUpdateResponse(R"({"latest": "2.1.0", "note": "Faster polling", "url": "https://example.com/dl"})",
                                    SLC_VERSION, &meta));
    EXPECT_EQ(meta.latest, QString("2.1.0"));
    EXPECT_EQ(meta.note, QString("Faster polling"));
    EXPECT_EQ(meta.url, QString("https://example.com/dl"));
}

TEST(VersionCheckTest, SameOrOlderVersionIsNotReported) {
    UpdateMetadata meta;
    EXPECT_FALSE(parseUpdateResponse(R"({"latest": "1.9.0"})", "2.0.0", &meta));
    EXPECT_FALSE(parseUpdateResponse(R"({"latest": "2.0.0"})", "2.0.0", &meta));
    EXPECT_TRUE(meta.latest.isEmpty());
}

TEST(VersionCheckTest, MissingLatestDefaultsToZero) {
    EXPECT_FALSE(parseUpdateResponse(R"({"note": "nothing"})", "2.0.0", nullptr));
    EXPECT_FALSE(parseUpdateResponse(R"({"latest": "abc"})", "2.0.0", nullptr));
}

TEST(VersionCheckTest, MalformedPayloadIsRejected) {
    EXPECT_FALSE(parseUpdateResponse("not json", "2.0.0", nullptr));
    EXPECT_FALSE(parseUpdateResponse("[1, 2, 3]", "2.0.0", nullptr));
    EXPECT_FALSE(parseUpdateResponse("", "2.0.0", nullptr));
}
