#ifndef MIRRORSESSION_H
#define MIRRORSESSION_H

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QVector>

#include "LauncherCore.h"
#include "device.h"

namespace slc {

/**
 * @brief MirrorSession - one scrcpy process for one device serial
 *
 * Owns its QProcess. Both output channels are read as they arrive and split
 * into lines independently, so line order is preserved per channel but not
 * across channels. finished() is emitted exactly once, whether the process
 * exits, crashes or never starts.
 *
 * Destroying a session whose process still runs terminates it and blocks up
 * to EXIT_GRACE_MS for it to exit; only then is it killed.
 */
class MirrorSession : public QObject
{
    Q_OBJECT

public:
    // Install outcome as seen in the output; the exit code never changes it
    enum class State {
        Starting,
        Running,
        Completed,   // success marker seen
        Failed       // failure marker seen
    };

    // Time a terminated process gets to exit before the destructor kills it
    static constexpr int EXIT_GRACE_MS = 3000;

    explicit MirrorSession(const Device& device, QObject* parent = nullptr);
    ~MirrorSession() override;

    void start(const QString& program, const QStringList& arguments, const QProcessEnvironment& environment);
    void terminate();

    const QString& serial() const { return m_serial; }
    State state() const { return m_state; }
    bool isAlive() const { return !m_finished; }

    static QVector<SessionStatus> classifyLine(const QString& line);
    static QString windowTitle(const Device& device);

signals:
    void statusChanged(const QString& serial, slc::SessionStatus status);
    void errorOccurred(const QString& serial, slc::ToolError error, const QString& message);
    void finished(const QString& serial);

private slots:
    void onStarted();
    void onReadyReadStandardOutput();
    void onReadyReadStandardError();
    void onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onProcessError(QProcess::ProcessError error);

private:
    void consume(QByteArray& buffer, const QByteArray& chunk);
    void flush(QByteArray& buffer);
    void handleLine(const QByteArray& raw);
    void finish();

    QString m_serial;
    QProcess* m_process;
    State m_state;
    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
    bool m_finished;
    bool m_terminateRequested;
};

} // namespace slc

#endif // MIRRORSESSION_H
