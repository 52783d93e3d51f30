// =============================================================================
// Unit tests for AppContext tool location and tool environment
// =============================================================================
#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>

#include "appcontext.h"
#include "faketools.h"

using namespace slc;

class AppContextTest : public ShellToolsTest {};

TEST_F(AppContextTest, NothingFoundWithoutTools) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());

    AppContext context(tools.config());
    EXPECT_FALSE(context.hasAdb());
    EXPECT_FALSE(context.hasScrcpy());
    EXPECT_TRUE(context.adbPath().isEmpty());
    EXPECT_FALSE(context.toolEnvironment().contains("ADB"));
}

TEST_F(AppContextTest, FindsBundledTools) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb(""));
    ASSERT_TRUE(tools.installScrcpy("exit 0"));

    AppContext context(tools.config());
    EXPECT_EQ(context.adbPath(), QFileInfo(tools.adbPath()).absoluteFilePath());
    EXPECT_EQ(context.scrcpyPath(), QFileInfo(tools.scrcpyPath()).absoluteFilePath());
}

TEST_F(AppContextTest, ExplicitPathWins) {
    FakeTools bundled;
    FakeTools custom;
    ASSERT_TRUE(bundled.isValid());
    ASSERT_TRUE(custom.isValid());
    ASSERT_TRUE(bundled.installAdb(""));
    ASSERT_TRUE(custom.installAdb(""));

    LauncherConfig config = bundled.config();
    config.adbPath = custom.adbPath();

    AppContext context(config);
    EXPECT_EQ(context.adbPath(), QFileInfo(custom.adbPath()).absoluteFilePath());
}

TEST_F(AppContextTest, MissingExplicitPathFallsBackToBundled) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb(""));

    LauncherConfig config = tools.config();
    config.adbPath = tools.filePath("does/not/exist/adb");

    AppContext context(config);
    EXPECT_EQ(context.adbPath(), QFileInfo(tools.adbPath()).absoluteFilePath());
}

TEST_F(AppContextTest, BundledToolGetsExecutableBit) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb(""));
    ASSERT_TRUE(QFile::setPermissions(tools.adbPath(), QFile::ReadOwner | QFile::WriteOwner));
    ASSERT_FALSE(QFileInfo(tools.adbPath()).isExecutable());

    AppContext context(tools.config());
    EXPECT_TRUE(context.hasAdb());
    EXPECT_TRUE(QFileInfo(tools.adbPath()).isExecutable());
}

TEST_F(AppContextTest, EnvironmentNeedsBothTools) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb(""));

    AppContext context(tools.config());
    ASSERT_TRUE(context.hasAdb());
    ASSERT_FALSE(context.hasScrcpy());
    EXPECT_FALSE(context.toolEnvironment().contains("ADB"));

    // scrcpy appears later, the next locateTools() picks it up
    ASSERT_TRUE(tools.installScrcpy("exit 0"));
    EXPECT_TRUE(context.locateTools());
    EXPECT_FALSE(context.locateTools());

    QProcessEnvironment env = context.toolEnvironment();
    EXPECT_EQ(env.value("ADB"), context.adbPath());

    const QString scrcpyDir = QDir::toNativeSeparators(QFileInfo(context.scrcpyPath()).absolutePath());
    const QString adbDir = QDir::toNativeSeparators(QFileInfo(context.adbPath()).absolutePath());
    const QString path = env.value("PATH");
    EXPECT_TRUE(path.startsWith(scrcpyDir + QDir::listSeparator() + adbDir + QDir::listSeparator()));
}

TEST_F(AppContextTest, ExpectedLocationsNameTheToolsDir) {
    EXPECT_TRUE(AppContext::expectedAdbLocation().startsWith("tools"));
    EXPECT_TRUE(AppContext::expectedScrcpyLocation().contains("scrcpy"));
}
