// =============================================================================
// Unit tests for ConfigLoader and Logger helpers
// Tests: defaults, ini parsing, invalid values, command-line overrides,
// log level names
// =============================================================================
#include <gtest/gtest.h>

#include <QCommandLineParser>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "config.h"
#include "logger.h"

using namespace slc;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static QString writeIni(const QTemporaryDir& dir, const QByteArray& content)
{
    const QString path = dir.filePath("ScrcpyLauncher.ini");
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return QString();
    }
    file.write(content);
    return path;
}

static bool parseArgs(QCommandLineParser& parser, const QStringList& args)
{
    ConfigLoader::addOptions(parser);
    return parser.parse(QStringList() << "ScrcpyLauncher" << args);
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    LauncherConfig config;
    EXPECT_EQ(config.pollIntervalMs, 2000);
    EXPECT_EQ(config.listTimeoutMs, 5000);
    EXPECT_EQ(config.queryTimeoutMs, 3000);
    EXPECT_EQ(config.statusResetDelayMs, 3000);
    EXPECT_FALSE(config.compareDeviceProperties);
    EXPECT_TRUE(config.searchSystemPath);
    EXPECT_EQ(config.logLevel, QString("info"));
    EXPECT_EQ(config.changePolicy(), ChangePolicy::SerialSet);
}

TEST(ConfigLoaderTest, MissingFileReturnsDefaults) {
    LauncherConfig config = ConfigLoader::load("__nonexistent_launcher_config.ini");
    EXPECT_EQ(config.pollIntervalMs, LauncherConfig::DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(config.toolsDir, ConfigLoader::defaultToolsDir());
    EXPECT_TRUE(config.toolsDir.endsWith("tools"));
    EXPECT_TRUE(config.adbPath.isEmpty());
}

// ---------------------------------------------------------------------------
// Ini file
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ReadsAllSections) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeIni(dir,
        "[polling]\n"
        "intervalMs=1500\n"
        "listTimeoutMs=4000\n"
        "queryTimeoutMs=2500\n"
        "compareDeviceProperties=true\n"
        "[session]\n"
        "statusResetDelayMs=1000\n"
        "[tools]\n"
        "dir=bundle\n"
        "scrcpy=bin/scrcpy\n"
        "searchSystemPath=false\n"
        "[log]\n"
        "level=debug\n"
        "file=launcher.log\n");
    ASSERT_FALSE(path.isEmpty());

    LauncherConfig config = ConfigLoader::load(path);
    EXPECT_EQ(config.pollIntervalMs, 1500);
    EXPECT_EQ(config.listTimeoutMs, 4000);
    EXPECT_EQ(config.queryTimeoutMs, 2500);
    EXPECT_EQ(config.statusResetDelayMs, 1000);
    EXPECT_EQ(config.changePolicy(), ChangePolicy::FullProperties);
    EXPECT_FALSE(config.searchSystemPath);
    EXPECT_EQ(config.logLevel, QString("debug"));

    // relative paths resolve against the ini file's directory
    const QDir base(dir.path());
    EXPECT_EQ(config.toolsDir, QDir::cleanPath(base.filePath("bundle")));
    EXPECT_EQ(config.scrcpyPath, QDir::cleanPath(base.filePath("bin/scrcpy")));
    EXPECT_EQ(config.logFile, QDir::cleanPath(base.filePath("launcher.log")));
    EXPECT_TRUE(config.adbPath.isEmpty());
}

TEST(ConfigLoaderTest, InvalidValuesFallBackToDefaults) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeIni(dir,
        "[polling]\n"
        "intervalMs=fast\n"
        "listTimeoutMs=-5\n"
        "queryTimeoutMs=10\n"
        "[log]\n"
        "level=loud\n");
    ASSERT_FALSE(path.isEmpty());

    LauncherConfig config = ConfigLoader::load(path);
    EXPECT_EQ(config.pollIntervalMs, LauncherConfig::DEFAULT_POLL_INTERVAL_MS);
    EXPECT_EQ(config.listTimeoutMs, LauncherConfig::DEFAULT_LIST_TIMEOUT_MS);
    EXPECT_EQ(config.queryTimeoutMs, LauncherConfig::DEFAULT_QUERY_TIMEOUT_MS);
    EXPECT_EQ(config.logLevel, QString("info"));
}

// ---------------------------------------------------------------------------
// Command line
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, CommandLineOverridesFile) {
    QCommandLineParser parser;
    ASSERT_TRUE(parseArgs(parser, QStringList() << "--interval" << "750" << "--verbose"
                                                << "--adb" << QDir::rootPath() + "sdk/adb"
                                                << "--tools-dir" << QDir::rootPath() + "opt/tools"));

    LauncherConfig config;
    ConfigLoader::applyOverrides(config, parser);
    EXPECT_EQ(config.pollIntervalMs, 750);
    EXPECT_EQ(config.logLevel, QString("debug"));
    EXPECT_EQ(config.adbPath, QDir::cleanPath(QDir::rootPath() + "sdk/adb"));
    EXPECT_EQ(config.toolsDir, QDir::cleanPath(QDir::rootPath() + "opt/tools"));
    EXPECT_TRUE(config.scrcpyPath.isEmpty());
}

TEST(ConfigLoaderTest, InvalidIntervalIsIgnored) {
    QCommandLineParser parser;
    ASSERT_TRUE(parseArgs(parser, QStringList() << "--interval" << "soon"));

    LauncherConfig config;
    ConfigLoader::applyOverrides(config, parser);
    EXPECT_EQ(config.pollIntervalMs, LauncherConfig::DEFAULT_POLL_INTERVAL_MS);
}

TEST(ConfigLoaderTest, ConfigPathFromArguments) {
    QCommandLineParser withConfig;
    ASSERT_TRUE(parseArgs(withConfig, QStringList() << "--config" << "custom.ini"));
    EXPECT_EQ(ConfigLoader::configPathFromArguments(withConfig), QDir::current().absoluteFilePath("custom.ini"));

    QCommandLineParser withoutConfig;
    ASSERT_TRUE(parseArgs(withoutConfig, QStringList()));
    EXPECT_EQ(ConfigLoader::configPathFromArguments(withoutConfig), ConfigLoader::defaultConfigPath());
    EXPECT_TRUE(ConfigLoader::defaultConfigPath().endsWith("ScrcpyLauncher.ini"));
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
TEST(LoggerTest, LevelNames) {
    bool ok = false;
    EXPECT_EQ(Logger::levelFromString("debug", &ok), Logger::Debug);
    EXPECT_TRUE(ok);
    EXPECT_EQ(Logger::levelFromString("WARN", &ok), Logger::Warn);
    EXPECT_EQ(Logger::levelFromString("error", &ok), Logger::Error);
    EXPECT_EQ(Logger::levelFromString("loud", &ok), Logger::Info);
    EXPECT_FALSE(ok);

    EXPECT_TRUE(ConfigLoader::isValidLogLevel("warn"));
    EXPECT_FALSE(ConfigLoader::isValidLogLevel("verbose"));
}

TEST(LoggerTest, MessageTypesMapToLevels) {
    EXPECT_EQ(Logger::levelOf(QtDebugMsg), Logger::Debug);
    EXPECT_EQ(Logger::levelOf(QtInfoMsg), Logger::Info);
    EXPECT_EQ(Logger::levelOf(QtWarningMsg), Logger::Warn);
    EXPECT_EQ(Logger::levelOf(QtCriticalMsg), Logger::Error);
}

TEST(LoggerTest, FormatCarriesLevelTagAndMessage) {
    const QString line = Logger::formatMessage(QtWarningMsg, "PollingLoop: adb missing");
    EXPECT_TRUE(line.contains("[WARN ]"));
    EXPECT_TRUE(line.endsWith("PollingLoop: adb missing"));
}

TEST(LoggerTest, WritesToLogFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString logPath = dir.filePath("launcher.log");

    ASSERT_TRUE(Logger::install(Logger::Info, logPath));
    qDebug() << "filtered out";
    qInfo() << "Logger: hello";
    Logger::uninstall();

    QFile file(logPath);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    const QString content = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(content.contains("Logger: hello"));
    EXPECT_FALSE(content.contains("filtered out"));
}

TEST(LoggerTest, ReinstallSwitchesLevelAndFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString bootstrapLog = dir.filePath("bootstrap.log");
    const QString configuredLog = dir.filePath("configured.log");

    ASSERT_TRUE(Logger::install(Logger::Info, bootstrapLog));
    qDebug() << "Logger: early debug";
    qInfo() << "Logger: early info";
    ASSERT_TRUE(Logger::install(Logger::Debug, configuredLog));
    qDebug() << "Logger: late debug";
    Logger::uninstall();

    QFile bootstrap(bootstrapLog);
    ASSERT_TRUE(bootstrap.open(QIODevice::ReadOnly));
    const QString early = QString::fromUtf8(bootstrap.readAll());
    EXPECT_TRUE(early.contains("Logger: early info"));
    EXPECT_FALSE(early.contains("early debug"));
    EXPECT_FALSE(early.contains("late debug"));

    QFile configured(configuredLog);
    ASSERT_TRUE(configured.open(QIODevice::ReadOnly));
    EXPECT_TRUE(QString::fromUtf8(configured.readAll()).contains("Logger: late debug"));
}

TEST(LoggerTest, UnopenableLogFileFallsBackToStderr) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_FALSE(Logger::install(Logger::Info, dir.filePath("missing/dir/launcher.log")));
    Logger::uninstall();
}
