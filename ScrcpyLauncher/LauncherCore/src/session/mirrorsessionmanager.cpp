#include <QDebug>
#include <QTimer>

#include "mirrorsession.h"
#include "mirrorsessionmanager.h"

namespace slc {

MirrorSessionManager::MirrorSessionManager(AppContext* context, QObject* parent)
    : QObject(parent)
    , m_context(context)
    , m_statusResetDelayMs(context->config().statusResetDelayMs)
    , m_shuttingDown(false)
{
    qRegisterMetaType<slc::SessionStatus>("slc::SessionStatus");
    qRegisterMetaType<slc::ToolError>("slc::ToolError");
}

MirrorSessionManager::~MirrorSessionManager()
{
    shutdown();
    for (auto it = m_sessions.begin(); it != m_sessions.end(); ++it) {
        if (!it.value().isNull()) {
            it.value()->disconnect(this);
        }
    }
}

void MirrorSessionManager::launch(const Device& device)
{
    const QString& serial = device.serial;

    if (m_shuttingDown) {
        qWarning() << "MirrorSessionManager: Shutting down, launch refused for" << serial;
        return;
    }
    if (serial.trimmed().isEmpty()) {
        qWarning() << "MirrorSessionManager: Serial is empty, aborting";
        return;
    }
    if (!device.isAuthorized()) {
        qWarning() << "MirrorSessionManager: Device not authorized, launch refused for" << serial;
        return;
    }

    if (!m_context->hasScrcpy()) {
        m_context->locateTools();
    }
    if (!m_context->hasScrcpy()) {
        qWarning() << "MirrorSessionManager: scrcpy not found, cannot mirror" << serial;
        emit sessionError(serial, ToolError::ToolNotFound, QString("scrcpy not found - see README for setup."));
        emit sessionEnded(serial);
        return;
    }

    auto it = m_sessions.find(serial);
    if (it != m_sessions.end()) {
        QPointer<MirrorSession> existing = it.value();
        if (existing && existing->isAlive()) {
            qInfo() << "MirrorSessionManager: Already mirroring" << serial;
            emit sessionBusy(serial);
            return;
        }
        qDebug() << "MirrorSessionManager: Evicting stale session for" << serial;
        m_sessions.erase(it);
        if (existing) {
            existing->disconnect(this);
            existing->deleteLater();
        }
    }

    qInfo() << "MirrorSessionManager: Launching mirror for" << device.modelOrSerial() << "(" << serial << ")";

    MirrorSession* session = new MirrorSession(device, this);
    connect(session, &MirrorSession::statusChanged, this, &MirrorSessionManager::onSessionStatus);
    connect(session, &MirrorSession::errorOccurred, this, &MirrorSessionManager::sessionError);
    connect(session, &MirrorSession::finished, this, &MirrorSessionManager::onSessionFinished);
    m_sessions.insert(serial, session);

    emit sessionStarted(serial);

    QStringList args;
    args << "-s" << serial;
    args << "--window-title" << MirrorSession::windowTitle(device);
    session->start(m_context->scrcpyPath(), args, m_context->toolEnvironment());
}

void MirrorSessionManager::shutdown()
{
    if (m_shuttingDown) {
        return;
    }
    m_shuttingDown = true;

    qInfo() << "MirrorSessionManager: Shutting down" << activeCount() << "sessions";
    for (auto it = m_sessions.begin(); it != m_sessions.end(); ++it) {
        if (!it.value().isNull() && it.value()->isAlive()) {
            it.value()->terminate();
        }
    }
}

bool MirrorSessionManager::isActive(const QString& serial) const
{
    QPointer<MirrorSession> session = m_sessions.value(serial);
    return session && session->isAlive();
}

QStringList MirrorSessionManager::activeSerials() const
{
    QStringList serials;
    for (auto it = m_sessions.constBegin(); it != m_sessions.constEnd(); ++it) {
        if (!it.value().isNull() && it.value()->isAlive()) {
            serials.append(it.key());
        }
    }
    return serials;
}

int MirrorSessionManager::activeCount() const
{
    return activeSerials().size();
}

bool MirrorSessionManager::sessionState(const QString& serial, MirrorSession::State* state) const
{
    QPointer<MirrorSession> session = m_sessions.value(serial);
    if (!session) {
        return false;
    }
    if (state) {
        *state = session->state();
    }
    return true;
}

void MirrorSessionManager::onSessionStatus(const QString& serial, SessionStatus status)
{
    qInfo() << "MirrorSessionManager:" << serial << "status" << sessionStatusName(status);
    emit sessionStatus(serial, status);

    if (status == SessionStatus::InstallSuccess || status == SessionStatus::InstallFailure) {
        QTimer::singleShot(m_statusResetDelayMs, this, [this, serial]() {
            emit sessionStatus(serial, SessionStatus::Idle);
        });
    }
}

void MirrorSessionManager::onSessionFinished(const QString& serial)
{
    MirrorSession* session = qobject_cast<MirrorSession*>(sender());

    auto it = m_sessions.find(serial);
    if (it != m_sessions.end() && it.value() == session) {
        m_sessions.erase(it);
    }

    qInfo() << "MirrorSessionManager: Session ended for" << serial
            << "remaining:" << m_sessions.size();
    emit sessionEnded(serial);

    if (session) {
        session->deleteLater();
    }
}

} // namespace slc
