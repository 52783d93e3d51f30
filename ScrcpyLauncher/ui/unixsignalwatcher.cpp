#include <QDebug>
#include <QSocketNotifier>

#ifdef Q_OS_UNIX
#include <errno.h>
#include <signal.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include "unixsignalwatcher.h"

int UnixSignalWatcher::s_signalFd[2] = {-1, -1};

UnixSignalWatcher::UnixSignalWatcher(QObject* parent)
    : QObject(parent)
    , m_notifier(nullptr)
{
}

UnixSignalWatcher::~UnixSignalWatcher()
{
#ifdef Q_OS_UNIX
    if (m_notifier) {
        delete m_notifier;
        m_notifier = nullptr;
    }

    // handlers stay installed but write() to -1 just fails
    for (int i = 0; i < 2; ++i) {
        if (s_signalFd[i] != -1) {
            int fd = s_signalFd[i];
            s_signalFd[i] = -1;
            ::close(fd);
        }
    }
#endif
}

bool UnixSignalWatcher::install()
{
#ifdef Q_OS_UNIX
    if (m_notifier) {
        return true;
    }

    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, s_signalFd) != 0) {
        qCritical() << "UnixSignalWatcher: Failed to create signal socket pair:" << strerror(errno);
        return false;
    }

    m_notifier = new QSocketNotifier(s_signalFd[1], QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &UnixSignalWatcher::handleSignal);

    struct sigaction action;
    action.sa_handler = UnixSignalWatcher::signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    bool ok = true;
    if (sigaction(SIGINT, &action, nullptr) != 0) {
        qCritical() << "UnixSignalWatcher: Failed to install SIGINT handler:" << strerror(errno);
        ok = false;
    }
    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        qCritical() << "UnixSignalWatcher: Failed to install SIGTERM handler:" << strerror(errno);
        ok = false;
    }
    if (ok) {
        qInfo() << "UnixSignalWatcher: SIGINT / SIGTERM handlers installed";
    }
    return ok;
#else
    return true;
#endif
}

void UnixSignalWatcher::signalHandler(int signalNumber)
{
#ifdef Q_OS_UNIX
    // signal context: write() only
    if (s_signalFd[0] != -1) {
        ssize_t result = ::write(s_signalFd[0], &signalNumber, sizeof(signalNumber));
        (void)result;
    }
#else
    Q_UNUSED(signalNumber);
#endif
}

void UnixSignalWatcher::handleSignal()
{
#ifdef Q_OS_UNIX
    m_notifier->setEnabled(false);

    int signalNumber = 0;
    ssize_t bytesRead = ::read(s_signalFd[1], &signalNumber, sizeof(signalNumber));
    if (bytesRead == sizeof(signalNumber)) {
        const char* signalName = signalNumber == SIGINT ? "SIGINT" : (signalNumber == SIGTERM ? "SIGTERM" : "UNKNOWN");
        qInfo() << "UnixSignalWatcher: Received" << signalName << "- initiating graceful shutdown";
        emit terminationRequested(signalNumber);
    } else {
        qWarning() << "UnixSignalWatcher: Failed to read signal from socket, bytes read:" << bytesRead;
    }

    m_notifier->setEnabled(true);
#endif
}
