#ifndef APPCONTEXT_H
#define APPCONTEXT_H

#include <QProcessEnvironment>
#include <QString>

#include "launcherconfig.h"

namespace slc {

/**
 * @brief AppContext - application-wide state constructed once at startup
 *
 * Holds the loaded configuration, the located adb / scrcpy executables and
 * the environment the mirroring tool is started with. Owned by main() and
 * handed to every component that needs tool paths. Not thread safe: only
 * touched from the UI thread, workers get copies of what they need.
 */
class AppContext
{
public:
    explicit AppContext(const LauncherConfig& config);

    const LauncherConfig& config() const { return m_config; }

    // Fills in whichever tool is still missing; returns true if anything changed
    bool locateTools();

    bool hasAdb() const { return !m_adbPath.isEmpty(); }
    bool hasScrcpy() const { return !m_scrcpyPath.isEmpty(); }
    const QString& adbPath() const { return m_adbPath; }
    const QString& scrcpyPath() const { return m_scrcpyPath; }

    QProcessEnvironment toolEnvironment() const { return m_toolEnvironment; }

    // Relative locations shown to the user when a bundled tool is missing
    static QString expectedAdbLocation();
    static QString expectedScrcpyLocation();

private:
    QString findTool(const QString& explicitPath, const QStringList& bundledPaths,
                     const QString& executableName) const;
    void rebuildEnvironment();

    static QStringList bundledAdbPaths();
    static QStringList bundledScrcpyPaths();
    static bool ensureExecutable(const QString& path);

    LauncherConfig m_config;
    QString m_adbPath;
    QString m_scrcpyPath;
    QProcessEnvironment m_toolEnvironment;
};

} // namespace slc

#endif // APPCONTEXT_H
