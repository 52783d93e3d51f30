#include <QDebug>

#include "mirrorsession.h"

namespace slc {

MirrorSession::MirrorSession(const Device& device, QObject* parent)
    : QObject(parent)
    , m_serial(device.serial)
    , m_process(new QProcess(this))
    , m_state(State::Starting)
    , m_finished(false)
    , m_terminateRequested(false)
{
    connect(m_process, &QProcess::started, this, &MirrorSession::onStarted);
    connect(m_process, &QProcess::readyReadStandardOutput, this, &MirrorSession::onReadyReadStandardOutput);
    connect(m_process, &QProcess::readyReadStandardError, this, &MirrorSession::onReadyReadStandardError);
    connect(m_process, QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
            this, &MirrorSession::onProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &MirrorSession::onProcessError);
}

MirrorSession::~MirrorSession()
{
    m_process->disconnect(this);
    if (m_process->state() == QProcess::NotRunning) {
        return;
    }

    // ~QProcess kills a running child outright
    if (!m_terminateRequested) {
        terminate();
    }
    if (!m_process->waitForFinished(EXIT_GRACE_MS)) {
        qWarning() << "MirrorSession: scrcpy for" << m_serial << "did not exit within"
                   << EXIT_GRACE_MS << "ms, killing";
    }
}

void MirrorSession::start(const QString& program, const QStringList& arguments,
                          const QProcessEnvironment& environment)
{
    qInfo() << "MirrorSession: Starting" << program << arguments;
    m_process->setProgram(program);
    m_process->setArguments(arguments);
    m_process->setProcessEnvironment(environment);
    m_process->start();
}

void MirrorSession::terminate()
{
    if (m_finished || m_process->state() == QProcess::NotRunning) {
        return;
    }
    qInfo() << "MirrorSession: Terminating mirror for" << m_serial;
    m_terminateRequested = true;
#ifdef Q_OS_WIN
    // console programs ignore WM_CLOSE
    m_process->kill();
#else
    m_process->terminate();
#endif
}

QVector<SessionStatus> MirrorSession::classifyLine(const QString& line)
{
    QVector<SessionStatus> result;
    const QString lower = line.toLower();

    if (lower.contains("installing") || lower.contains("install ")) {
        result.append(SessionStatus::Installing);
    }
    if (lower.contains("success")) {
        result.append(SessionStatus::InstallSuccess);
    }
    if (lower.contains("failure") || lower.contains("failed") || lower.contains("error")) {
        result.append(SessionStatus::InstallFailure);
    }
    return result;
}

QString MirrorSession::windowTitle(const Device& device)
{
    return QString("Mirror: %1").arg(device.displayName());
}

void MirrorSession::onStarted()
{
    qInfo() << "MirrorSession: scrcpy running for" << m_serial << "pid" << m_process->processId();
    m_state = State::Running;
}

void MirrorSession::onReadyReadStandardOutput()
{
    consume(m_stdoutBuffer, m_process->readAllStandardOutput());
}

void MirrorSession::onReadyReadStandardError()
{
    consume(m_stderrBuffer, m_process->readAllStandardError());
}

void MirrorSession::onProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    // drain whatever arrived together with the exit notification
    consume(m_stdoutBuffer, m_process->readAllStandardOutput());
    consume(m_stderrBuffer, m_process->readAllStandardError());
    flush(m_stdoutBuffer);
    flush(m_stderrBuffer);

    if (exitStatus == QProcess::CrashExit) {
        qWarning() << "MirrorSession: scrcpy crashed for" << m_serial;
        emit errorOccurred(m_serial, ToolError::ToolCrash, QString("scrcpy crashed"));
    } else if (exitCode != 0) {
        qWarning() << "MirrorSession: scrcpy exited with code" << exitCode << "for" << m_serial;
        emit errorOccurred(m_serial, ToolError::ToolCrash,
                           QString("scrcpy exited with code %1").arg(exitCode));
    } else {
        qInfo() << "MirrorSession: scrcpy exited normally for" << m_serial;
    }
    finish();
}

void MirrorSession::onProcessError(QProcess::ProcessError error)
{
    if (error == QProcess::FailedToStart) {
        qWarning() << "MirrorSession: Failed to start scrcpy for" << m_serial << ":" << m_process->errorString();
        emit errorOccurred(m_serial, ToolError::ToolNotFound, m_process->errorString());
        // no finished() follows a failed start
        finish();
        return;
    }
    // Crashed is reported again through finished()
    qWarning() << "MirrorSession: Process error" << static_cast<int>(error) << "for" << m_serial << ":" << m_process->errorString();
}

void MirrorSession::consume(QByteArray& buffer, const QByteArray& chunk)
{
    buffer.append(chunk);
    int newline = buffer.indexOf('\n');
    while (newline >= 0) {
        handleLine(buffer.left(newline));
        buffer.remove(0, newline + 1);
        newline = buffer.indexOf('\n');
    }
}

void MirrorSession::flush(QByteArray& buffer)
{
    if (!buffer.isEmpty()) {
        handleLine(buffer);
        buffer.clear();
    }
}

void MirrorSession::handleLine(const QByteArray& raw)
{
    // invalid UTF-8 becomes U+FFFD instead of failing
    const QString line = QString::fromUtf8(raw).trimmed();
    if (line.isEmpty()) {
        return;
    }
    qDebug().noquote() << "[scrcpy]" << line;

    const QVector<SessionStatus> statuses = classifyLine(line);
    for (SessionStatus status : statuses) {
        switch (status) {
        case SessionStatus::Installing:
            m_state = State::Running;
            break;
        case SessionStatus::InstallSuccess:
            m_state = State::Completed;
            break;
        case SessionStatus::InstallFailure:
            m_state = State::Failed;
            break;
        case SessionStatus::Idle:
            break;
        }
        emit statusChanged(m_serial, status);
    }
}

void MirrorSession::finish()
{
    if (m_finished) {
        return;
    }
    m_finished = true;
    emit finished(m_serial);
}

} // namespace slc
