#ifndef CONFIG_H
#define CONFIG_H

#include <QString>

#include "launcherconfig.h"

class QCommandLineParser;
class QSettings;

/**
 * @brief ConfigLoader - builds slc::LauncherConfig from ini file and command line
 *
 * The ini file is ScrcpyLauncher.ini next to the executable unless --config
 * names another one. A missing file is not an error; every key is optional.
 *
 *   [polling]  intervalMs, listTimeoutMs, queryTimeoutMs, compareDeviceProperties
 *   [session]  statusResetDelayMs
 *   [tools]    dir, adb, scrcpy, searchSystemPath
 *   [log]      level, file
 */
class ConfigLoader
{
public:
    static QString defaultConfigPath();
    static QString defaultToolsDir();

    static slc::LauncherConfig load(const QString& iniPath);

    // Registers --config, --tools-dir, --adb, --scrcpy, --interval, --log-file, --verbose
    static void addOptions(QCommandLineParser& parser);
    static QString configPathFromArguments(const QCommandLineParser& parser);
    static void applyOverrides(slc::LauncherConfig& config, const QCommandLineParser& parser);

    static bool isValidLogLevel(const QString& level);

private:
    static int readInt(QSettings& settings, const QString& key, int defaultValue, int minimum);
    static QString resolvePath(const QString& path, const QString& baseDir);
};

#endif // CONFIG_H
