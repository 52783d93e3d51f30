#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QOperatingSystemVersion>
#include <QProcess>

#ifdef Q_OS_WIN
#include <windows.h>
#include <shellapi.h>
#endif

#include "usbdriverhelper.h"

namespace UsbDriverHelper {

QString findZadig(const QString& toolsDir)
{
#ifdef Q_OS_WIN
    const QDir windowsDir(QDir(toolsDir).filePath("windows"));
    const QStringList candidates = { "zadig-2.9.exe", "zadig.exe" };
    for (const QString& name : candidates) {
        const QString path = windowsDir.filePath(name);
        if (QFileInfo(path).isFile()) {
            return QDir::toNativeSeparators(path);
        }
    }
    return QString();
#else
    Q_UNUSED(toolsDir);
    return QString();
#endif
}

bool isWindows11()
{
    const QOperatingSystemVersion current = QOperatingSystemVersion::current();
    if (current.type() != QOperatingSystemVersion::Windows) {
        return false;
    }
    // Windows 11 still reports major version 10; the build number tells them apart
    return current.microVersion() >= 22000;
}

bool launchZadig(const QString& path)
{
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        qWarning() << "UsbDriverHelper: Zadig not found at" << path;
        return false;
    }

#ifdef Q_OS_WIN
    HINSTANCE result = ShellExecuteW(nullptr, L"runas", reinterpret_cast<LPCWSTR>(path.utf16()),
                                     nullptr, nullptr, SW_SHOWNORMAL);
    // values <= 32 are error codes
    if (reinterpret_cast<INT_PTR>(result) <= 32) {
        qWarning() << "UsbDriverHelper: ShellExecute failed with code" << reinterpret_cast<INT_PTR>(result);
        return false;
    }
    qInfo() << "UsbDriverHelper: Zadig launched elevated:" << path;
    return true;
#else
    if (!QProcess::startDetached(path, QStringList())) {
        qWarning() << "UsbDriverHelper: Failed to start" << path;
        return false;
    }
    qInfo() << "UsbDriverHelper: Zadig launched:" << path;
    return true;
#endif
}

QString installInstructions()
{
    return QString(
        "Zadig will open. Follow these steps:\n\n"
        "1. Select your Android device from the dropdown\n"
        "   (Look for 'Android' or your phone model)\n"
        "2. Select 'WinUSB' as the target driver\n"
        "3. Click 'Replace Driver' or 'Install Driver'\n"
        "4. Wait for installation to complete\n"
        "5. Reconnect your device");
}

QString restoreInstructions()
{
    return QString(
        "To restore the original Windows driver:\n\n"
        "1. In Zadig, go to Options > List All Devices\n"
        "2. Select your Android device\n"
        "3. Select 'USB Serial (CDC)' or original driver\n"
        "4. Click 'Reinstall Driver'\n"
        "5. Reconnect your device");
}

} // namespace UsbDriverHelper
