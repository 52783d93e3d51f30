#include <QDebug>
#include <QElapsedTimer>
#include <QProcess>
#include <QRegularExpression>

#ifdef Q_OS_WIN
#include <Windows.h>
#endif

#include "bridgeclient.h"

namespace slc {

BridgeClient::BridgeClient(const QString& adbPath, int listTimeoutMs, int queryTimeoutMs)
    : m_adbPath(adbPath)
    , m_listTimeoutMs(listTimeoutMs)
    , m_queryTimeoutMs(queryTimeoutMs)
{
}

QVector<Device> BridgeClient::listDevices() const
{
    QString output;
    ToolResult result = run(QStringList() << "devices" << "-l", m_listTimeoutMs, output);
    if (result != ToolResult::Success) {
        qDebug() << "BridgeClient: device listing unavailable, result:" << static_cast<int>(result);
        return QVector<Device>();
    }

    QVector<Device> devices = parseDeviceList(output);
    for (Device& device : devices) {
        if (device.isAuthorized()) {
            fillProperties(device);
        }
    }
    return devices;
}

int BridgeClient::maxListDurationMs(int listTimeoutMs, int queryTimeoutMs, int authorizedDevices)
{
    return listTimeoutMs + qMax(0, authorizedDevices) * PROPERTY_QUERIES_PER_DEVICE * queryTimeoutMs;
}

QString BridgeClient::getProp(const QString& serial, const QString& prop) const
{
    QString output;
    ToolResult result = run(QStringList() << "-s" << serial << "shell" << "getprop" << prop,
                            m_queryTimeoutMs, output);
    if (result != ToolResult::Success) {
        return QString();
    }
    return output.trimmed();
}

QString BridgeClient::queryResolution(const QString& serial) const
{
    QString output;
    ToolResult result = run(QStringList() << "-s" << serial << "shell" << "wm" << "size",
                            m_queryTimeoutMs, output);
    if (result != ToolResult::Success) {
        return QString();
    }
    return parseResolution(output);
}

int BridgeClient::queryBatteryLevel(const QString& serial) const
{
    QString output;
    ToolResult result = run(QStringList() << "-s" << serial << "shell" << "dumpsys" << "battery",
                            m_queryTimeoutMs, output);
    if (result != ToolResult::Success) {
        return -1;
    }
    return parseBatteryLevel(output);
}

ToolResult BridgeClient::run(const QStringList& args, int timeoutMs, QString& output) const
{
    output.clear();
    if (m_adbPath.isEmpty()) {
        return ToolResult::NotFound;
    }

    QProcess process;
    process.setProgram(m_adbPath);
    process.setArguments(args);
#ifdef Q_OS_WIN
    // no console window flashing up for every poll
    process.setCreateProcessArgumentsModifier([](QProcess::CreateProcessArguments* cpa) {
        cpa->flags |= CREATE_NO_WINDOW;
    });
#endif

    QElapsedTimer elapsed;
    elapsed.start();
    process.start();
    if (!process.waitForStarted(timeoutMs)) {
        if (process.error() == QProcess::FailedToStart) {
            qDebug() << "BridgeClient: failed to start" << m_adbPath << ":" << process.errorString();
            return ToolResult::NotFound;
        }
        qWarning() << "BridgeClient: start timed out for" << args;
        process.kill();
        process.waitForFinished(1000);
        return ToolResult::Timeout;
    }

    int remaining = qMax(0, timeoutMs - static_cast<int>(elapsed.elapsed()));
    if (!process.waitForFinished(remaining)) {
        qWarning() << "BridgeClient: command timed out after" << timeoutMs << "ms:" << args;
        process.kill();
        process.waitForFinished(1000);
        return ToolResult::Timeout;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        qWarning() << "BridgeClient: command crashed:" << args;
        return ToolResult::Failed;
    }
    if (process.exitCode() != 0) {
        qDebug() << "BridgeClient: command" << args << "exited with code" << process.exitCode();
    }

    output = QString::fromUtf8(process.readAllStandardOutput());
    return ToolResult::Success;
}

QVector<Device> BridgeClient::parseDeviceList(const QString& output)
{
    QVector<Device> devices;
    QStringList lines = output.trimmed().split('\n');
    // first line is the "List of devices attached" header
    for (int i = 1; i < lines.size(); ++i) {
        const QString line = lines.at(i).trimmed();
        if (line.isEmpty() || line.contains("offline")) {
            continue;
        }

        const QStringList tokens = line.split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        const QString serial = tokens.at(0);
        const QString status = tokens.size() > 1 ? tokens.at(1) : QString("unknown");

        Device device;
        device.serial = serial;
        if (status == "device") {
            device.state = DeviceState::Device;
        } else if (status == "unauthorized") {
            device.state = DeviceState::Unauthorized;
        } else {
            continue;
        }

        for (int t = 2; t < tokens.size(); ++t) {
            const QString& token = tokens.at(t);
            int colon = token.indexOf(':');
            if (colon < 0) {
                continue;
            }
            device.properties.insert(token.left(colon), token.mid(colon + 1));
        }
        devices.append(device);
    }
    return devices;
}

QString BridgeClient::parseResolution(const QString& output)
{
    static const QRegularExpression re("(\\d+x\\d+)");
    QRegularExpressionMatch match = re.match(output);
    return match.hasMatch() ? match.captured(1) : QString();
}

int BridgeClient::parseBatteryLevel(const QString& output)
{
    static const QRegularExpression re("level:\\s*(\\d+)");
    QRegularExpressionMatch match = re.match(output);
    if (!match.hasMatch()) {
        return -1;
    }
    bool ok = false;
    int level = match.captured(1).toInt(&ok);
    if (!ok || level < 0 || level > 100) {
        return -1;
    }
    return level;
}

void BridgeClient::fillProperties(Device& device) const
{
    const QString& serial = device.serial;

    device.model = getProp(serial, "ro.product.model");
    if (device.model.isEmpty()) {
        device.model = device.properties.value("model", serial);
    }
    device.manufacturer = getProp(serial, "ro.product.manufacturer");
    device.androidVersion = getProp(serial, "ro.build.version.release");
    device.sdk = getProp(serial, "ro.build.version.sdk");
    device.resolution = queryResolution(serial);
    device.batteryPercent = queryBatteryLevel(serial);

    qDebug() << "BridgeClient:" << serial << device.manufacturer << device.model
             << "Android" << device.androidVersion << device.resolution
             << "battery" << device.batteryPercent;
}

} // namespace slc
