#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSettings>

#include "config.h"

#define CONFIG_FILE_NAME "ScrcpyLauncher.ini"
#define TOOLS_DIR_NAME "tools"

namespace {
const char* OPT_CONFIG = "config";
const char* OPT_TOOLS_DIR = "tools-dir";
const char* OPT_ADB = "adb";
const char* OPT_SCRCPY = "scrcpy";
const char* OPT_INTERVAL = "interval";
const char* OPT_LOG_FILE = "log-file";
const char* OPT_VERBOSE = "verbose";
}

QString ConfigLoader::defaultConfigPath()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(CONFIG_FILE_NAME);
}

QString ConfigLoader::defaultToolsDir()
{
    return QDir(QCoreApplication::applicationDirPath()).filePath(TOOLS_DIR_NAME);
}

slc::LauncherConfig ConfigLoader::load(const QString& iniPath)
{
    slc::LauncherConfig config;
    config.toolsDir = defaultToolsDir();

    if (iniPath.isEmpty() || !QFileInfo::exists(iniPath)) {
        qInfo() << "Config: No config file at" << iniPath << "- using defaults";
        return config;
    }

    QSettings settings(iniPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "Config: Cannot read" << iniPath << "- using defaults";
        return config;
    }
    qInfo() << "Config: Loading" << iniPath;

    // relative paths in the file are relative to the file itself
    const QString baseDir = QFileInfo(iniPath).absolutePath();

    settings.beginGroup("polling");
    config.pollIntervalMs = readInt(settings, "intervalMs", slc::LauncherConfig::DEFAULT_POLL_INTERVAL_MS, 100);
    config.listTimeoutMs = readInt(settings, "listTimeoutMs", slc::LauncherConfig::DEFAULT_LIST_TIMEOUT_MS, 100);
    config.queryTimeoutMs = readInt(settings, "queryTimeoutMs", slc::LauncherConfig::DEFAULT_QUERY_TIMEOUT_MS, 100);
    config.compareDeviceProperties = settings.value("compareDeviceProperties", false).toBool();
    settings.endGroup();

    settings.beginGroup("session");
    config.statusResetDelayMs = readInt(settings, "statusResetDelayMs", slc::LauncherConfig::DEFAULT_STATUS_RESET_MS, 0);
    settings.endGroup();

    settings.beginGroup("tools");
    QString toolsDir = settings.value("dir").toString().trimmed();
    if (!toolsDir.isEmpty()) {
        config.toolsDir = resolvePath(toolsDir, baseDir);
    }
    QString adb = settings.value("adb").toString().trimmed();
    if (!adb.isEmpty()) {
        config.adbPath = resolvePath(adb, baseDir);
    }
    QString scrcpy = settings.value("scrcpy").toString().trimmed();
    if (!scrcpy.isEmpty()) {
        config.scrcpyPath = resolvePath(scrcpy, baseDir);
    }
    config.searchSystemPath = settings.value("searchSystemPath", true).toBool();
    settings.endGroup();

    settings.beginGroup("log");
    QString level = settings.value("level", config.logLevel).toString().trimmed().toLower();
    if (isValidLogLevel(level)) {
        config.logLevel = level;
    } else {
        qWarning() << "Config: Invalid log level" << level << "- using" << config.logLevel;
    }
    QString logFile = settings.value("file").toString().trimmed();
    if (!logFile.isEmpty()) {
        config.logFile = resolvePath(logFile, baseDir);
    }
    settings.endGroup();

    return config;
}

void ConfigLoader::addOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(OPT_CONFIG, "Read settings from <ini>.", "ini"));
    parser.addOption(QCommandLineOption(OPT_TOOLS_DIR, "Bundled tools directory.", "dir"));
    parser.addOption(QCommandLineOption(OPT_ADB, "Path to the adb executable.", "path"));
    parser.addOption(QCommandLineOption(OPT_SCRCPY, "Path to the scrcpy executable.", "path"));
    parser.addOption(QCommandLineOption(OPT_INTERVAL, "Device poll interval in milliseconds.", "ms"));
    parser.addOption(QCommandLineOption(OPT_LOG_FILE, "Append log output to <path>.", "path"));
    parser.addOption(QCommandLineOption(OPT_VERBOSE, "Enable debug logging."));
}

QString ConfigLoader::configPathFromArguments(const QCommandLineParser& parser)
{
    if (parser.isSet(OPT_CONFIG)) {
        return QFileInfo(parser.value(OPT_CONFIG)).absoluteFilePath();
    }
    return defaultConfigPath();
}

void ConfigLoader::applyOverrides(slc::LauncherConfig& config, const QCommandLineParser& parser)
{
    const QString cwd = QDir::currentPath();

    if (parser.isSet(OPT_TOOLS_DIR)) {
        config.toolsDir = resolvePath(parser.value(OPT_TOOLS_DIR), cwd);
    }
    if (parser.isSet(OPT_ADB)) {
        config.adbPath = resolvePath(parser.value(OPT_ADB), cwd);
    }
    if (parser.isSet(OPT_SCRCPY)) {
        config.scrcpyPath = resolvePath(parser.value(OPT_SCRCPY), cwd);
    }
    if (parser.isSet(OPT_INTERVAL)) {
        bool ok = false;
        int interval = parser.value(OPT_INTERVAL).toInt(&ok);
        if (ok && interval >= 100) {
            config.pollIntervalMs = interval;
        } else {
            qWarning() << "Config: Ignoring invalid --interval" << parser.value(OPT_INTERVAL);
        }
    }
    if (parser.isSet(OPT_LOG_FILE)) {
        config.logFile = resolvePath(parser.value(OPT_LOG_FILE), cwd);
    }
    if (parser.isSet(OPT_VERBOSE)) {
        config.logLevel = "debug";
    }
}

bool ConfigLoader::isValidLogLevel(const QString& level)
{
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

int ConfigLoader::readInt(QSettings& settings, const QString& key, int defaultValue, int minimum)
{
    if (!settings.contains(key)) {
        return defaultValue;
    }
    bool ok = false;
    int value = settings.value(key).toInt(&ok);
    if (!ok || value < minimum) {
        qWarning() << "Config: Invalid value for" << settings.group() + "/" + key
                   << settings.value(key).toString() << "- using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

QString ConfigLoader::resolvePath(const QString& path, const QString& baseDir)
{
    if (QDir::isAbsolutePath(path)) {
        return QDir::cleanPath(path);
    }
    return QDir::cleanPath(QDir(baseDir).filePath(path));
}
