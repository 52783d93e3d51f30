#ifndef BRIDGECLIENT_H
#define BRIDGECLIENT_H

#include <QString>
#include <QStringList>
#include <QVector>

#include "LauncherCore.h"
#include "device.h"

namespace slc {

/**
 * @brief BridgeClient - synchronous request/response wrapper around the adb executable
 *
 * Every call blocks until the tool exits or its timeout expires, so it must
 * only be used from a worker thread. Failures never propagate: a missing
 * executable, a timeout or a crash all come back as "no data".
 */
class BridgeClient
{
public:
    static constexpr int DEFAULT_LIST_TIMEOUT_MS = 5000;
    static constexpr int DEFAULT_QUERY_TIMEOUT_MS = 3000;
    // getprop x4, wm size, dumpsys battery
    static constexpr int PROPERTY_QUERIES_PER_DEVICE = 6;

    explicit BridgeClient(const QString& adbPath,
                          int listTimeoutMs = DEFAULT_LIST_TIMEOUT_MS,
                          int queryTimeoutMs = DEFAULT_QUERY_TIMEOUT_MS);

    const QString& adbPath() const { return m_adbPath; }

    // `adb devices -l` followed by property queries for authorized devices
    QVector<Device> listDevices() const;

    QString getProp(const QString& serial, const QString& prop) const;
    QString queryResolution(const QString& serial) const;
    int queryBatteryLevel(const QString& serial) const;

    ToolResult run(const QStringList& args, int timeoutMs, QString& output) const;

    // Upper bound of listDevices() when every query runs into its timeout
    static int maxListDurationMs(int listTimeoutMs, int queryTimeoutMs, int authorizedDevices);

    // Pure parsers, exposed for reuse and tests
    static QVector<Device> parseDeviceList(const QString& output);
    static QString parseResolution(const QString& output);
    static int parseBatteryLevel(const QString& output);

private:
    void fillProperties(Device& device) const;

    QString m_adbPath;
    int m_listTimeoutMs;
    int m_queryTimeoutMs;
};

} // namespace slc

#endif // BRIDGECLIENT_H
