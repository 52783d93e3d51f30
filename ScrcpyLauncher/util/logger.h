#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QtGlobal>

/**
 * @brief Logger - Qt message handler with timestamps, level filter and log file
 *
 * Installed once from main(). Messages go to stderr and, when a log file is
 * configured, are appended there too. Safe to call from worker threads.
 */
class Logger
{
public:
    enum Level {
        Debug = 0,
        Info,
        Warn,
        Error
    };

    static bool install(Level minimumLevel, const QString& logFile);
    static void uninstall();

    static Level levelFromString(const QString& name, bool* ok = nullptr);
    static Level levelOf(QtMsgType type);
    static QString formatMessage(QtMsgType type, const QString& message);

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message);
};

#endif // LOGGER_H
