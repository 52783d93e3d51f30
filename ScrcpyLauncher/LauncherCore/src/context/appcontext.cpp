#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>

#include "appcontext.h"

namespace slc {

AppContext::AppContext(const LauncherConfig& config)
    : m_config(config)
    , m_toolEnvironment(QProcessEnvironment::systemEnvironment())
{
    locateTools();
    qInfo() << "AppContext: adb:" << (hasAdb() ? m_adbPath : QString("<not found>"));
    qInfo() << "AppContext: scrcpy:" << (hasScrcpy() ? m_scrcpyPath : QString("<not found>"));
}

bool AppContext::locateTools()
{
    bool changed = false;

    if (m_adbPath.isEmpty()) {
        m_adbPath = findTool(m_config.adbPath, bundledAdbPaths(), "adb");
        if (!m_adbPath.isEmpty()) {
            qInfo() << "AppContext: Located adb at" << m_adbPath;
            changed = true;
        }
    }
    if (m_scrcpyPath.isEmpty()) {
        m_scrcpyPath = findTool(m_config.scrcpyPath, bundledScrcpyPaths(), "scrcpy");
        if (!m_scrcpyPath.isEmpty()) {
            qInfo() << "AppContext: Located scrcpy at" << m_scrcpyPath;
            changed = true;
        }
    }

    if (changed) {
        rebuildEnvironment();
    }
    return changed;
}

QString AppContext::findTool(const QString& explicitPath, const QStringList& bundledPaths,
                             const QString& executableName) const
{
    if (!explicitPath.isEmpty()) {
        QFileInfo info(explicitPath);
        if (info.isFile() && ensureExecutable(info.absoluteFilePath())) {
            return info.absoluteFilePath();
        }
        qDebug() << "AppContext: Configured path does not exist:" << explicitPath;
    }

    if (!m_config.toolsDir.isEmpty()) {
        QDir toolsDir(m_config.toolsDir);
        for (const QString& relative : bundledPaths) {
            QFileInfo info(toolsDir.filePath(relative));
            if (info.isFile() && ensureExecutable(info.absoluteFilePath())) {
                return info.absoluteFilePath();
            }
        }
    }

    if (m_config.searchSystemPath) {
        return QStandardPaths::findExecutable(executableName);
    }
    return QString();
}

void AppContext::rebuildEnvironment()
{
    m_toolEnvironment = QProcessEnvironment::systemEnvironment();
    if (!hasAdb() || !hasScrcpy()) {
        return;
    }

    const QString adbDir = QDir::toNativeSeparators(QFileInfo(m_adbPath).absolutePath());
    const QString scrcpyDir = QDir::toNativeSeparators(QFileInfo(m_scrcpyPath).absolutePath());
    const QChar sep = QDir::listSeparator();

    m_toolEnvironment.insert("ADB", m_adbPath);
    m_toolEnvironment.insert("PATH", scrcpyDir + sep + adbDir + sep + m_toolEnvironment.value("PATH"));
}

QString AppContext::expectedAdbLocation()
{
#if defined(Q_OS_WIN)
    return QDir::toNativeSeparators("tools/windows/scrcpy/adb.exe");
#elif defined(Q_OS_MACOS)
    return "tools/macos/platform-tools/adb";
#else
    return "tools/linux/platform-tools/adb";
#endif
}

QString AppContext::expectedScrcpyLocation()
{
#if defined(Q_OS_WIN)
    return QDir::toNativeSeparators("tools/windows/scrcpy/scrcpy.exe");
#elif defined(Q_OS_MACOS)
    return "tools/macos/scrcpy/scrcpy";
#else
    return "tools/linux/scrcpy/scrcpy";
#endif
}

QStringList AppContext::bundledAdbPaths()
{
#if defined(Q_OS_WIN)
    // the scrcpy Windows zip ships adb.exe next to scrcpy.exe
    return QStringList() << "windows/scrcpy/adb.exe";
#elif defined(Q_OS_MACOS)
    return QStringList() << "macos/platform-tools/adb" << "macos/scrcpy/adb";
#else
    return QStringList() << "linux/platform-tools/adb" << "linux/scrcpy/adb";
#endif
}

QStringList AppContext::bundledScrcpyPaths()
{
#if defined(Q_OS_WIN)
    return QStringList() << "windows/scrcpy/scrcpy.exe";
#elif defined(Q_OS_MACOS)
    return QStringList() << "macos/scrcpy/scrcpy";
#else
    return QStringList() << "linux/scrcpy/scrcpy";
#endif
}

bool AppContext::ensureExecutable(const QString& path)
{
#ifdef Q_OS_WIN
    Q_UNUSED(path);
    return true;
#else
    QFileInfo info(path);
    if (info.isExecutable()) {
        return true;
    }
    QFile::Permissions perms = QFile::permissions(path);
    perms |= QFile::ExeOwner | QFile::ExeUser | QFile::ExeGroup | QFile::ExeOther;
    if (!QFile::setPermissions(path, perms)) {
        qWarning() << "AppContext: Could not mark" << path << "executable";
        return false;
    }
    return true;
#endif
}

} // namespace slc
