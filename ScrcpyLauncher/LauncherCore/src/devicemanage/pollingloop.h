#ifndef POLLINGLOOP_H
#define POLLINGLOOP_H

#include <QObject>
#include <QThreadPool>
#include <QTimer>

#include "appcontext.h"
#include "devicesnapshot.h"

namespace slc {

/**
 * @brief PollingLoop - periodic device discovery
 *
 * Idle -> (timer) -> Polling -> (result dispatched) -> Idle. The next cycle
 * is only scheduled once the previous result has been handled, so cycles
 * never overlap. The adb query itself runs on a private QThreadPool.
 *
 * Change detection follows LauncherConfig::changePolicy(). With the default
 * ChangePolicy::SerialSet an unchanged set of serials only refreshes the
 * device count; battery and resolution of known devices are not refreshed.
 */
class PollingLoop : public QObject
{
    Q_OBJECT

public:
    explicit PollingLoop(AppContext* context, QObject* parent = nullptr);
    ~PollingLoop() override;

    void start();
    void stop();
    void pollNow();

    // Blocks until the worker pool has drained, used at shutdown
    bool waitForDone(int msecs = -1);

    // Worst-case length of a device query, assuming the last known devices
    // plus one newly attached one; the drain budget for waitForDone()
    int maxCycleDurationMs() const;

    bool isRunning() const { return m_running; }
    bool isPolling() const { return m_inFlight; }
    const DeviceSnapshot& snapshot() const { return m_snapshot; }

signals:
    void deviceListChanged(const slc::DeviceSnapshot& snapshot, const slc::SnapshotDiff& diff);
    void deviceCountChanged(int count);
    void bridgeUnavailable();
    void toolStatusChanged(bool adbFound, bool scrcpyFound);

private slots:
    void onPollFinished(quint64 cycle, const slc::DeviceSnapshot& snapshot);

private:
    void runCycle();
    void scheduleNext();

    AppContext* m_context;
    QThreadPool m_pool;
    QTimer* m_timer;

    DeviceSnapshot m_snapshot;
    bool m_hasSnapshot;
    bool m_running;
    bool m_inFlight;
    quint64 m_cycle;
};

} // namespace slc

#endif // POLLINGLOOP_H
