#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <cstdio>

#include "logger.h"

namespace {
QMutex s_mutex;
QFile* s_logFile = nullptr;
Logger::Level s_minimumLevel = Logger::Info;
QtMessageHandler s_previousHandler = nullptr;
}

bool Logger::install(Level minimumLevel, const QString& logFile)
{
    bool fileOk = true;
    {
        QMutexLocker locker(&s_mutex);
        s_minimumLevel = minimumLevel;

        if (s_logFile) {
            s_logFile->close();
            delete s_logFile;
            s_logFile = nullptr;
        }
        if (!logFile.isEmpty()) {
            s_logFile = new QFile(logFile);
            if (!s_logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                fileOk = false;
                delete s_logFile;
                s_logFile = nullptr;
            }
        }
    }

    QtMessageHandler previous = qInstallMessageHandler(Logger::messageHandler);
    if (previous != Logger::messageHandler) {
        s_previousHandler = previous;
    }

    if (!fileOk) {
        qWarning() << "Logger: Cannot open log file" << logFile << "- logging to stderr only";
    }
    return fileOk;
}

void Logger::uninstall()
{
    qInstallMessageHandler(s_previousHandler);
    s_previousHandler = nullptr;

    QMutexLocker locker(&s_mutex);
    if (s_logFile) {
        s_logFile->close();
        delete s_logFile;
        s_logFile = nullptr;
    }
}

Logger::Level Logger::levelFromString(const QString& name, bool* ok)
{
    const QString lower = name.trimmed().toLower();
    if (ok) {
        *ok = true;
    }
    if (lower == "debug") {
        return Debug;
    }
    if (lower == "info") {
        return Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Warn;
    }
    if (lower == "error") {
        return Error;
    }
    if (ok) {
        *ok = false;
    }
    return Info;
}

Logger::Level Logger::levelOf(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return Debug;
    case QtInfoMsg:
        return Info;
    case QtWarningMsg:
        return Warn;
    case QtCriticalMsg:
    case QtFatalMsg:
        return Error;
    }
    return Info;
}

QString Logger::formatMessage(QtMsgType type, const QString& message)
{
    const char* tag = "INFO ";
    switch (type) {
    case QtDebugMsg:
        tag = "DEBUG";
        break;
    case QtInfoMsg:
        tag = "INFO ";
        break;
    case QtWarningMsg:
        tag = "WARN ";
        break;
    case QtCriticalMsg:
        tag = "ERROR";
        break;
    case QtFatalMsg:
        tag = "FATAL";
        break;
    }
    return QString("%1 [%2] %3")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"))
        .arg(tag)
        .arg(message);
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    Q_UNUSED(context);

    QMutexLocker locker(&s_mutex);

    // fatal messages always get through, Qt aborts right after
    if (type != QtFatalMsg && levelOf(type) < s_minimumLevel) {
        return;
    }

    const QByteArray line = formatMessage(type, message).toUtf8();
    fprintf(stderr, "%s\n", line.constData());
    fflush(stderr);

    if (s_logFile) {
        s_logFile->write(line);
        s_logFile->write("\n");
        s_logFile->flush();
    }
}
