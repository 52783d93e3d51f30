#include <QDebug>

#include "bridgeclient.h"
#include "devicepolltask.h"
#include "pollingloop.h"

namespace slc {

PollingLoop::PollingLoop(AppContext* context, QObject* parent)
    : QObject(parent)
    , m_context(context)
    , m_timer(new QTimer(this))
    , m_hasSnapshot(false)
    , m_running(false)
    , m_inFlight(false)
    , m_cycle(0)
{
    qRegisterMetaType<slc::DeviceSnapshot>("slc::DeviceSnapshot");
    qRegisterMetaType<slc::SnapshotDiff>("slc::SnapshotDiff");

    // a stopped loop restarted right away may still have one stale query running
    m_pool.setMaxThreadCount(2);

    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &PollingLoop::runCycle);
}

PollingLoop::~PollingLoop()
{
    stop();
    // a query outliving the shutdown budget still has to finish before the pool goes away
    m_pool.waitForDone();
}

void PollingLoop::start()
{
    if (m_running) {
        return;
    }
    qInfo() << "PollingLoop: Starting, interval" << m_context->config().pollIntervalMs << "ms";
    m_running = true;
    runCycle();
}

void PollingLoop::stop()
{
    if (!m_running) {
        return;
    }
    qInfo() << "PollingLoop: Stopping";
    m_running = false;
    m_timer->stop();

    // results of the in-flight cycle, if any, are dropped in onPollFinished()
    ++m_cycle;
    m_inFlight = false;
}

void PollingLoop::pollNow()
{
    if (!m_running) {
        qDebug() << "PollingLoop: pollNow() ignored, loop not running";
        return;
    }
    if (m_inFlight) {
        qDebug() << "PollingLoop: Device query already running, skipping";
        return;
    }
    m_timer->stop();
    runCycle();
}

bool PollingLoop::waitForDone(int msecs)
{
    return m_pool.waitForDone(msecs);
}

int PollingLoop::maxCycleDurationMs() const
{
    const LauncherConfig& config = m_context->config();
    return BridgeClient::maxListDurationMs(config.listTimeoutMs, config.queryTimeoutMs, m_snapshot.count() + 1);
}

void PollingLoop::runCycle()
{
    if (!m_running || m_inFlight) {
        return;
    }

    m_context->locateTools();
    emit toolStatusChanged(m_context->hasAdb(), m_context->hasScrcpy());

    if (!m_context->hasAdb()) {
        qDebug() << "PollingLoop: adb not available, skipping device query";
        // forces a deviceListChanged once adb shows up, even with no devices
        m_snapshot = DeviceSnapshot();
        m_hasSnapshot = false;
        emit deviceCountChanged(0);
        emit bridgeUnavailable();
        scheduleNext();
        return;
    }

    const LauncherConfig& config = m_context->config();
    BridgeClient client(m_context->adbPath(), config.listTimeoutMs, config.queryTimeoutMs);

    m_inFlight = true;
    ++m_cycle;
    DevicePollTask* task = new DevicePollTask(client, m_cycle);
    connect(task, &DevicePollTask::pollFinished, this, &PollingLoop::onPollFinished,
            Qt::QueuedConnection);
    m_pool.start(task);
}

void PollingLoop::onPollFinished(quint64 cycle, const DeviceSnapshot& snapshot)
{
    if (!m_running || cycle != m_cycle) {
        qDebug() << "PollingLoop: Dropping stale result of cycle" << cycle;
        return;
    }
    m_inFlight = false;

    emit deviceCountChanged(snapshot.count());

    if (m_hasSnapshot && snapshot.isEquivalent(m_snapshot, m_context->config().changePolicy())) {
        scheduleNext();
        return;
    }

    SnapshotDiff diff = snapshot.diff(m_snapshot);
    qInfo() << "PollingLoop: Device list changed, now" << snapshot.count() << "devices"
            << "added:" << diff.added << "removed:" << diff.removed;

    m_snapshot = snapshot;
    m_hasSnapshot = true;
    emit deviceListChanged(m_snapshot, diff);

    // a handler may have stopped the loop
    scheduleNext();
}

void PollingLoop::scheduleNext()
{
    if (!m_running) {
        return;
    }
    m_timer->start(m_context->config().pollIntervalMs);
}

} // namespace slc
