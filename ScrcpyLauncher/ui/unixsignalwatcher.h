#ifndef UNIXSIGNALWATCHER_H
#define UNIXSIGNALWATCHER_H

#include <QObject>

class QSocketNotifier;

/**
 * @brief UnixSignalWatcher - turns SIGINT / SIGTERM into a Qt signal
 *
 * Socket-pair pattern: the C signal handler only write()s the signal number,
 * a QSocketNotifier on the other end wakes the event loop. install() must be
 * called before the event loop starts. No-op on Windows.
 */
class UnixSignalWatcher : public QObject
{
    Q_OBJECT

public:
    explicit UnixSignalWatcher(QObject* parent = nullptr);
    ~UnixSignalWatcher() override;

    bool install();

signals:
    void terminationRequested(int signalNumber);

private slots:
    void handleSignal();

private:
    static void signalHandler(int signalNumber);

    static int s_signalFd[2];
    QSocketNotifier* m_notifier;
};

#endif // UNIXSIGNALWATCHER_H
