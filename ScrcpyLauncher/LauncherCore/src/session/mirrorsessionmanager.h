#ifndef MIRRORSESSIONMANAGER_H
#define MIRRORSESSIONMANAGER_H

#include <QMap>
#include <QObject>
#include <QPointer>
#include <QStringList>

#include "LauncherCore.h"
#include "appcontext.h"
#include "device.h"
#include "mirrorsession.h"

namespace slc {

/**
 * @brief MirrorSessionManager - at most one live scrcpy process per serial
 *
 * All methods run on the UI thread; processes are driven by QProcess
 * signals so nothing here blocks. sessionEnded() fires exactly once for
 * every accepted launch, including launches that never managed to start.
 */
class MirrorSessionManager : public QObject
{
    Q_OBJECT

public:
    explicit MirrorSessionManager(AppContext* context, QObject* parent = nullptr);
    ~MirrorSessionManager() override;

    void launch(const Device& device);

    // Terminates every running process; does not wait for them to exit.
    // Sessions still running when the manager is destroyed get
    // MirrorSession::EXIT_GRACE_MS each before being killed.
    void shutdown();

    bool isActive(const QString& serial) const;
    QStringList activeSerials() const;
    int activeCount() const;

    // False when no session is tracked for serial
    bool sessionState(const QString& serial, MirrorSession::State* state) const;

    void setStatusResetDelay(int msecs) { m_statusResetDelayMs = msecs; }
    int statusResetDelay() const { return m_statusResetDelayMs; }

signals:
    void sessionStarted(const QString& serial);
    void sessionStatus(const QString& serial, slc::SessionStatus status);
    void sessionBusy(const QString& serial);
    void sessionError(const QString& serial, slc::ToolError error, const QString& message);
    void sessionEnded(const QString& serial);

private slots:
    void onSessionStatus(const QString& serial, slc::SessionStatus status);
    void onSessionFinished(const QString& serial);

private:
    AppContext* m_context;
    QMap<QString, QPointer<MirrorSession>> m_sessions;
    int m_statusResetDelayMs;
    bool m_shuttingDown;
};

} // namespace slc

#endif // MIRRORSESSIONMANAGER_H
