#ifndef LAUNCHERCONFIG_H
#define LAUNCHERCONFIG_H

#include <QString>

#include "devicesnapshot.h"

namespace slc {

/**
 * Runtime settings shared by the core components.
 *
 * Defaults match the shipped behaviour; the application overrides them from
 * ScrcpyLauncher.ini and the command line.
 */
struct LauncherConfig {
    static constexpr int DEFAULT_POLL_INTERVAL_MS = 2000;
    static constexpr int DEFAULT_LIST_TIMEOUT_MS = 5000;
    static constexpr int DEFAULT_QUERY_TIMEOUT_MS = 3000;
    static constexpr int DEFAULT_STATUS_RESET_MS = 3000;

    int pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
    int listTimeoutMs = DEFAULT_LIST_TIMEOUT_MS;
    int queryTimeoutMs = DEFAULT_QUERY_TIMEOUT_MS;
    int statusResetDelayMs = DEFAULT_STATUS_RESET_MS;

    // Widen change detection to every device property (more UI rebuilds)
    bool compareDeviceProperties = false;

    QString toolsDir;       // bundled tools root, usually <app dir>/tools
    QString adbPath;        // explicit override, empty = locate
    QString scrcpyPath;     // explicit override, empty = locate
    bool searchSystemPath = true;

    QString logLevel = "info";
    QString logFile;

    ChangePolicy changePolicy() const
    {
        return compareDeviceProperties ? ChangePolicy::FullProperties : ChangePolicy::SerialSet;
    }
};

} // namespace slc

#endif // LAUNCHERCONFIG_H
